#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace kindle2md
{
namespace detail
{

// One tag read from raw markup. The tag ends at the first '>' after its '<',
// quoted or not.
struct MarkupTag
{
    std::string name; // lower-cased
    std::vector<std::pair<std::string, std::string>> attributes; // names lower-cased
    bool closing = false;
    std::string::size_type begin = std::string::npos;
    std::string::size_type end = std::string::npos; // one past '>'

    bool hasAttribute(const std::string &attributeName) const;
    std::string attribute(const std::string &attributeName) const;
    bool classIsOneOf(const std::vector<std::string> &markers) const;
};

bool readTag(const std::string &html, std::string::size_type pos, MarkupTag &tag);

// Next opening tag at or after `from`; an empty name accepts any element.
bool findOpeningTag(const std::string &html, std::string::size_type from, const std::string &name, MarkupTag &tag);

// Position of the '<' of the next "</name>" at or after `from`, and one past
// its '>' in `closeEnd`.
std::string::size_type findClosingTag(const std::string &html, std::string::size_type from, const std::string &name, std::string::size_type &closeEnd);

// Repeated closing-tag lookups for one element name over the same document.
// A lookup starting before the last match reuses it instead of rescanning.
class ClosingTagFinder
{
public:
    ClosingTagFinder(const std::string &html, const std::string &name) : m_html(html), m_name(name) {}

    std::string::size_type find(std::string::size_type from, std::string::size_type &closeEnd);

private:
    const std::string &m_html;
    std::string m_name;
    bool m_searched = false;
    std::string::size_type m_from = 0;
    std::string::size_type m_close = std::string::npos;
    std::string::size_type m_closeEnd = 0;
};

// Inner content of the first element accepted by `accept`, up to the first
// closing tag with the element's own name.
template <typename Predicate>
bool findElementContent(const std::string &html, const std::string &name, Predicate accept, std::string &content)
{
    std::vector<std::string> unclosed;
    MarkupTag tag;
    std::string::size_type pos = 0;
    while (findOpeningTag(html, pos, name, tag))
    {
        pos = tag.end;
        if (!accept(tag)) continue;
        if (std::find(unclosed.begin(), unclosed.end(), tag.name) != unclosed.end()) continue;
        std::string::size_type closeEnd = 0;
        const std::string::size_type close = findClosingTag(html, tag.end, tag.name, closeEnd);
        if (close == std::string::npos)
        {
            unclosed.push_back(tag.name);
            continue;
        }
        content = html.substr(tag.end, close - tag.end);
        return true;
    }
    return false;
}

} // namespace detail

struct NoteBlock
{
    std::string heading; // raw markup
    std::string body;    // raw markup
};

// Heading/body pairs of the export's noteHeading/noteText divs, in document
// order. A heading not directly followed by a body block is skipped.
std::vector<NoteBlock> scanNoteBlocks(const std::string &html);

} // namespace kindle2md
