#include "kindle2md/highlight_metadata.h"

#include "kindle2md/text_utils.h"

#include <array>
#include <cctype>
#include <regex>

namespace kindle2md
{
namespace detail
{

static std::string firstCapture(const std::string &text, const std::regex &pattern)
{
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return {};
    return match[1].str();
}

} // namespace detail

std::string extractLocation(const std::string &heading)
{
    static const std::regex pattern("Location\\s+([\\d-]+)", std::regex::icase | std::regex::optimize);
    return detail::firstCapture(heading, pattern);
}

std::string extractPage(const std::string &heading)
{
    static const std::regex pattern("Page\\s+([\\d-]+)", std::regex::icase | std::regex::optimize);
    return detail::firstCapture(heading, pattern);
}

std::string extractColor(const std::string &heading)
{
    static const std::array<const char *, 5> colors = {"Yellow", "Blue", "Pink", "Orange", "Green"};
    static const std::regex pattern("\\(\\s*(Yellow|Blue|Pink|Orange|Green)\\s*\\)", std::regex::icase | std::regex::optimize);
    const std::string matched = detail::firstCapture(heading, pattern);
    if (matched.empty()) return {};
    for (const char *color : colors)
    {
        if (detail::equalsIgnoreCase(matched, color)) return color;
    }
    return {};
}

HighlightMetadata extractMetadata(const std::string &heading)
{
    HighlightMetadata metadata;
    metadata.color = extractColor(heading);
    metadata.page = extractPage(heading);
    metadata.location = extractLocation(heading);
    return metadata;
}

bool isNoteHeading(const std::string &heading)
{
    static const std::string keyword = "note";
    if (heading.size() < keyword.size()) return false;
    if (!detail::equalsIgnoreCase(heading.substr(0, keyword.size()), keyword)) return false;
    if (heading.size() == keyword.size()) return true;
    const unsigned char next = static_cast<unsigned char>(heading[keyword.size()]);
    return !(std::isalnum(next) || next == '_');
}

} // namespace kindle2md
