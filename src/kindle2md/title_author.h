#pragma once

#include <functional>
#include <string>
#include <vector>

namespace kindle2md
{

// One way an export template marks up a field. `match` captures raw markup
// from the document, `extract` turns it into the stored value.
struct FieldCandidate
{
    std::string description;
    std::function<bool(const std::string &html, std::string &captured)> match;
    std::function<std::string(const std::string &captured)> extract;
};

const std::vector<FieldCandidate> &titleCandidates();
const std::vector<FieldCandidate> &authorCandidates();

// First candidate producing a non-empty value wins; empty when none does.
std::string extractField(const std::string &html, const std::vector<FieldCandidate> &candidates);

// Falls back to DefaultNotebookTitle.
std::string extractTitle(const std::string &html);
std::string extractAuthor(const std::string &html);

} // namespace kindle2md
