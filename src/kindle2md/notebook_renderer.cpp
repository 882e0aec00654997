#include "kindle2md/notebook_renderer.h"

#include "kindle2md/text_utils.h"

#include "tinyxml2.h"

namespace kindle2md
{
namespace detail
{

static std::string metadataLabel(const Highlight &highlight)
{
    std::vector<std::string> parts;
    if (!highlight.color.empty()) parts.push_back(highlight.color);
    if (!highlight.page.empty()) parts.push_back("Page " + highlight.page);
    if (!highlight.location.empty()) parts.push_back("Loc " + highlight.location);
    return join(parts, " · ");
}

static void writeNotebook(tinyxml2::XMLPrinter &printer, const Notebook &notebook)
{
    printer.OpenElement("notebook");
    printer.PushAttribute("title", notebook.title.empty() ? DefaultNotebookTitle : notebook.title.c_str());
    if (!notebook.author.empty()) printer.PushAttribute("author", notebook.author.c_str());
    for (const Highlight &highlight : notebook.highlights)
    {
        printer.OpenElement("highlight");
        if (!highlight.color.empty()) printer.PushAttribute("color", highlight.color.c_str());
        if (!highlight.page.empty()) printer.PushAttribute("page", highlight.page.c_str());
        if (!highlight.location.empty()) printer.PushAttribute("location", highlight.location.c_str());

        printer.OpenElement("text", true);
        printer.PushText(highlight.text.c_str());
        printer.CloseElement(true);
        if (!highlight.note.empty())
        {
            printer.OpenElement("note", true);
            printer.PushText(highlight.note.c_str());
            printer.CloseElement(true);
        }
        printer.CloseElement();
    }
    printer.CloseElement();
}

} // namespace detail

std::string renderMarkdown(const Notebook &notebook)
{
    std::vector<std::string> lines;
    lines.push_back("# " + (notebook.title.empty() ? std::string(DefaultNotebookTitle) : notebook.title));
    if (!notebook.author.empty()) lines.push_back("_by " + notebook.author + "_");
    lines.push_back(std::string());

    int index = 1;
    for (const Highlight &highlight : notebook.highlights)
    {
        std::string line = std::to_string(index++) + ". " + highlight.text;
        const std::string label = detail::metadataLabel(highlight);
        if (!label.empty()) line += " — (" + label + ")";
        lines.push_back(line);
        if (!highlight.note.empty()) lines.push_back("   > " + highlight.note);
    }
    return detail::join(lines, "\n");
}

std::string renderXml(const Notebook &notebook)
{
    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);
    detail::writeNotebook(printer, notebook);
    return printer.CStr();
}

std::string renderXml(const std::vector<Notebook> &notebooks)
{
    tinyxml2::XMLPrinter printer;
    printer.PushHeader(false, true);
    printer.OpenElement("notebooks");
    for (const Notebook &notebook : notebooks)
        detail::writeNotebook(printer, notebook);
    printer.CloseElement();
    return printer.CStr();
}

} // namespace kindle2md
