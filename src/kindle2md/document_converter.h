#pragma once

#include "kindle2md/notebook.h"

#include <string>
#include <vector>

namespace kindle2md
{

enum class OutputFormat
{
    Markdown,
    Xml
};

struct ConversionOptions
{
    OutputFormat format = OutputFormat::Markdown;
};

struct ConversionResult
{
    bool success = false;
    std::string output;
    std::vector<Notebook> notebooks;
    std::vector<std::string> warnings;
};

// Parses one export document held in memory. `sourceName` only labels warnings.
ConversionResult convertHtml(const std::string &html, const ConversionOptions &options = ConversionOptions(), const std::string &sourceName = "notebook.html");

// Accepts .html/.htm files and .zip archives of them.
ConversionResult convertFile(const std::string &path, const ConversionOptions &options = ConversionOptions());

// Converts every path and renders the notebooks of those that succeeded as one
// report or one XML document. `success` is false if any path failed.
ConversionResult convertFiles(const std::vector<std::string> &paths, const ConversionOptions &options = ConversionOptions());

} // namespace kindle2md
