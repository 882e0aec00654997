#pragma once

#include <string>
#include <vector>

namespace kindle2md
{

constexpr const char *DefaultNotebookTitle = "Kindle Notebook";

// Optional fields are empty when absent.
struct Highlight
{
    std::string text;
    std::string note;
    std::string color;
    std::string page;
    std::string location;
};

struct Notebook
{
    std::string title = DefaultNotebookTitle;
    std::string author;
    std::vector<Highlight> highlights;
};

} // namespace kindle2md
