#pragma once

#include <string>

namespace kindle2md
{

struct HighlightMetadata
{
    std::string color;
    std::string page;
    std::string location;
};

// All three take a normalized heading and return an empty string on no match.
std::string extractLocation(const std::string &heading);
std::string extractPage(const std::string &heading);
std::string extractColor(const std::string &heading);

HighlightMetadata extractMetadata(const std::string &heading);

// True when the heading opens with the word "note", e.g. "Note - Location 12".
bool isNoteHeading(const std::string &heading);

} // namespace kindle2md
