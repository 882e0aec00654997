#pragma once

#include <string>
#include <vector>

namespace kindle2md
{
namespace detail
{

std::string toLower(std::string value);
std::string trim(const std::string &value);
bool equalsIgnoreCase(const std::string &a, const std::string &b);
bool endsWithIgnoreCase(const std::string &value, const std::string &suffix);
void replaceAll(std::string &text, const std::string &from, const std::string &to);
std::string join(const std::vector<std::string> &items, const std::string &separator);

// Strips tags, decodes &nbsp; &lt; &gt; &quot; &#39; and &amp; (in that
// order), then collapses whitespace and trims.
std::string normalizeText(const std::string &fragment);

} // namespace detail
} // namespace kindle2md
