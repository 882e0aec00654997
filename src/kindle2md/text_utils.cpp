#include "kindle2md/text_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kindle2md
{
namespace detail
{

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string &value)
{
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

bool endsWithIgnoreCase(const std::string &value, const std::string &suffix)
{
    if (suffix.size() > value.size()) return false;
    return equalsIgnoreCase(value.substr(value.size() - suffix.size()), suffix);
}

void replaceAll(std::string &text, const std::string &from, const std::string &to)
{
    if (from.empty()) return;
    std::string::size_type pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string join(const std::vector<std::string> &items, const std::string &separator)
{
    if (items.empty()) return {};
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) oss << separator;
        oss << items[i];
    }
    return oss.str();
}

static std::string stripTags(const std::string &fragment)
{
    std::string out;
    out.reserve(fragment.size());
    std::string::size_type pos = 0;
    while (pos < fragment.size())
    {
        const std::string::size_type open = fragment.find('<', pos);
        if (open == std::string::npos) break;
        const std::string::size_type close = fragment.find('>', open + 1);
        if (close == std::string::npos) break;
        out.append(fragment, pos, open - pos);
        out.push_back(' ');
        pos = close + 1;
    }
    if (pos < fragment.size()) out.append(fragment, pos, std::string::npos);
    return out;
}

static std::string decodeEntities(std::string text)
{
    replaceAll(text, "&nbsp;", " ");
    replaceAll(text, "&lt;", "<");
    replaceAll(text, "&gt;", ">");
    replaceAll(text, "&quot;", "\"");
    replaceAll(text, "&#39;", "'");
    replaceAll(text, "&amp;", "&");
    return text;
}

// U+00A0 counts as whitespace alongside the ASCII set.
static size_t whitespaceLength(const std::string &text, size_t pos)
{
    const unsigned char ch = static_cast<unsigned char>(text[pos]);
    if (std::isspace(ch)) return 1;
    if (ch == 0xC2 && pos + 1 < text.size() && static_cast<unsigned char>(text[pos + 1]) == 0xA0) return 2;
    return 0;
}

static std::string collapseWhitespace(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    size_t pos = 0;
    while (pos < text.size())
    {
        const size_t spaceLength = whitespaceLength(text, pos);
        if (spaceLength)
        {
            pendingSpace = true;
            pos += spaceLength;
            continue;
        }
        if (pendingSpace && !out.empty()) out.push_back(' ');
        pendingSpace = false;
        out.push_back(text[pos++]);
    }
    return out;
}

std::string normalizeText(const std::string &fragment)
{
    return collapseWhitespace(decodeEntities(stripTags(fragment)));
}

} // namespace detail
} // namespace kindle2md
