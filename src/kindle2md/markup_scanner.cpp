#include "kindle2md/markup_scanner.h"

#include "kindle2md/text_utils.h"

#include <cctype>

namespace kindle2md
{
namespace detail
{

static bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

static bool isTagNameChar(char ch)
{
    const unsigned char c = static_cast<unsigned char>(ch);
    return std::isalnum(c) || c == '-' || c == '_' || c == ':';
}

static bool matchesAtIgnoreCase(const std::string &text, std::string::size_type pos, const std::string &word)
{
    if (pos + word.size() > text.size()) return false;
    for (size_t i = 0; i < word.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != std::tolower(static_cast<unsigned char>(word[i]))) return false;
    }
    return true;
}

bool MarkupTag::hasAttribute(const std::string &attributeName) const
{
    for (const auto &entry : attributes)
    {
        if (entry.first == attributeName) return true;
    }
    return false;
}

std::string MarkupTag::attribute(const std::string &attributeName) const
{
    for (const auto &entry : attributes)
    {
        if (entry.first == attributeName) return entry.second;
    }
    return {};
}

bool MarkupTag::classIsOneOf(const std::vector<std::string> &markers) const
{
    if (!hasAttribute("class")) return false;
    const std::string value = trim(attribute("class"));
    for (const std::string &marker : markers)
    {
        if (equalsIgnoreCase(value, marker)) return true;
    }
    return false;
}

bool readTag(const std::string &html, std::string::size_type pos, MarkupTag &tag)
{
    if (pos >= html.size() || html[pos] != '<') return false;

    std::string::size_type cursor = pos + 1;
    MarkupTag result;
    if (cursor < html.size() && html[cursor] == '/')
    {
        result.closing = true;
        ++cursor;
    }
    const std::string::size_type nameStart = cursor;
    if (cursor >= html.size() || !std::isalpha(static_cast<unsigned char>(html[cursor]))) return false;
    while (cursor < html.size() && isTagNameChar(html[cursor]))
        ++cursor;
    const std::string::size_type close = html.find('>', cursor);
    if (close == std::string::npos) return false;
    result.name = toLower(html.substr(nameStart, cursor - nameStart));

    while (cursor < close)
    {
        while (cursor < close && (isSpace(html[cursor]) || html[cursor] == '/'))
            ++cursor;
        if (cursor >= close) break;

        const std::string::size_type attributeStart = cursor;
        while (cursor < close && !isSpace(html[cursor]) && html[cursor] != '=' && html[cursor] != '/')
            ++cursor;
        if (cursor == attributeStart)
        {
            ++cursor;
            continue;
        }
        std::string attributeName = toLower(html.substr(attributeStart, cursor - attributeStart));

        while (cursor < close && isSpace(html[cursor]))
            ++cursor;
        std::string value;
        if (cursor < close && html[cursor] == '=')
        {
            ++cursor;
            while (cursor < close && isSpace(html[cursor]))
                ++cursor;
            if (cursor < close && (html[cursor] == '"' || html[cursor] == '\''))
            {
                const char quote = html[cursor++];
                std::string::size_type valueEnd = html.find(quote, cursor);
                if (valueEnd == std::string::npos || valueEnd > close) valueEnd = close;
                value = html.substr(cursor, valueEnd - cursor);
                cursor = valueEnd < close ? valueEnd + 1 : close;
            }
            else
            {
                const std::string::size_type valueStart = cursor;
                while (cursor < close && !isSpace(html[cursor]))
                    ++cursor;
                value = html.substr(valueStart, cursor - valueStart);
            }
        }
        result.attributes.emplace_back(std::move(attributeName), std::move(value));
    }

    result.begin = pos;
    result.end = close + 1;
    tag = std::move(result);
    return true;
}

bool findOpeningTag(const std::string &html, std::string::size_type from, const std::string &name, MarkupTag &tag)
{
    std::string::size_type pos = from;
    std::string::size_type nextClose = 0;
    bool closeKnown = false;
    while ((pos = html.find('<', pos)) != std::string::npos)
    {
        if (!closeKnown || nextClose < pos)
        {
            nextClose = html.find('>', pos);
            closeKnown = true;
            // No '>' left, so no '<' from here on can open a tag.
            if (nextClose == std::string::npos) return false;
        }
        MarkupTag candidate;
        if (!readTag(html, pos, candidate))
        {
            ++pos;
            continue;
        }
        if (!candidate.closing && (name.empty() || candidate.name == name))
        {
            tag = std::move(candidate);
            return true;
        }
        pos = candidate.end;
    }
    return false;
}

std::string::size_type ClosingTagFinder::find(std::string::size_type from, std::string::size_type &closeEnd)
{
    if (m_searched && from >= m_from && (m_close == std::string::npos || from <= m_close))
    {
        closeEnd = m_closeEnd;
        return m_close;
    }
    m_searched = true;
    m_from = from;
    m_close = findClosingTag(m_html, from, m_name, m_closeEnd);
    closeEnd = m_closeEnd;
    return m_close;
}

std::string::size_type findClosingTag(const std::string &html, std::string::size_type from, const std::string &name, std::string::size_type &closeEnd)
{
    std::string::size_type pos = from;
    while ((pos = html.find("</", pos)) != std::string::npos)
    {
        const std::string::size_type nameEnd = pos + 2 + name.size();
        if (nameEnd < html.size() && matchesAtIgnoreCase(html, pos + 2, name) && (html[nameEnd] == '>' || isSpace(html[nameEnd])))
        {
            const std::string::size_type gt = html.find('>', nameEnd);
            if (gt == std::string::npos) return std::string::npos;
            closeEnd = gt + 1;
            return pos;
        }
        pos += 2;
    }
    return std::string::npos;
}

static std::string::size_type skipWhitespace(const std::string &html, std::string::size_type pos)
{
    while (pos < html.size() && isSpace(html[pos]))
        ++pos;
    return pos;
}

} // namespace detail

std::vector<NoteBlock> scanNoteBlocks(const std::string &html)
{
    static const std::vector<std::string> headingMarkers = {"noteHeading"};
    static const std::vector<std::string> bodyMarkers = {"noteText"};

    std::vector<NoteBlock> blocks;
    detail::ClosingTagFinder divClose(html, "div");
    detail::MarkupTag heading;
    std::string::size_type pos = 0;
    while (detail::findOpeningTag(html, pos, "div", heading))
    {
        pos = heading.end;
        if (!heading.classIsOneOf(headingMarkers)) continue;

        std::string::size_type headingCloseEnd = 0;
        const std::string::size_type headingClose = divClose.find(heading.end, headingCloseEnd);
        if (headingClose == std::string::npos) break;

        const std::string::size_type next = detail::skipWhitespace(html, headingCloseEnd);
        detail::MarkupTag body;
        if (!detail::readTag(html, next, body) || body.closing || body.name != "div" || !body.classIsOneOf(bodyMarkers))
            continue;

        std::string::size_type bodyCloseEnd = 0;
        const std::string::size_type bodyClose = divClose.find(body.end, bodyCloseEnd);
        if (bodyClose == std::string::npos) break;

        NoteBlock block;
        block.heading = html.substr(heading.end, headingClose - heading.end);
        block.body = html.substr(body.end, bodyClose - body.end);
        blocks.push_back(std::move(block));
        pos = bodyCloseEnd;
    }
    return blocks;
}

} // namespace kindle2md
