#include "kindle2md/document_converter.h"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    kindle2md::ConversionOptions options;
    std::vector<std::string> paths;
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--xml") == 0)
            options.format = kindle2md::OutputFormat::Xml;
        else
            paths.push_back(argv[i]);
    }
    if (paths.empty())
    {
        std::cerr << "Usage: kindle2md [--xml] <file.html|file.zip>...\n";
        return 1;
    }

    const kindle2md::ConversionResult result = kindle2md::convertFiles(paths, options);
    for (const std::string &warning : result.warnings)
        std::cerr << "warning: " << warning << "\n";
    if (!result.output.empty()) std::cout << result.output << "\n";
    return result.success ? 0 : 2;
}
