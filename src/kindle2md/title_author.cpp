#include "kindle2md/title_author.h"

#include "kindle2md/markup_scanner.h"
#include "kindle2md/notebook.h"
#include "kindle2md/text_utils.h"

namespace kindle2md
{
namespace detail
{

static FieldCandidate elementWithClass(const std::vector<std::string> &markers)
{
    FieldCandidate candidate;
    candidate.description = "class=" + join(markers, "|");
    candidate.match = [markers](const std::string &html, std::string &captured) {
        return findElementContent(html, std::string(), [&markers](const MarkupTag &tag) { return tag.classIsOneOf(markers); }, captured);
    };
    candidate.extract = normalizeText;
    return candidate;
}

static FieldCandidate elementContent(const std::string &name)
{
    FieldCandidate candidate;
    candidate.description = "<" + name + ">";
    candidate.match = [name](const std::string &html, std::string &captured) {
        return findElementContent(html, name, [](const MarkupTag &) { return true; }, captured);
    };
    candidate.extract = normalizeText;
    return candidate;
}

static FieldCandidate metaContent(const std::string &metaName)
{
    FieldCandidate candidate;
    candidate.description = "<meta name=" + metaName + ">";
    candidate.match = [metaName](const std::string &html, std::string &captured) {
        MarkupTag tag;
        std::string::size_type pos = 0;
        while (findOpeningTag(html, pos, "meta", tag))
        {
            pos = tag.end;
            if (!equalsIgnoreCase(tag.attribute("name"), metaName) || !tag.hasAttribute("content")) continue;
            captured = tag.attribute("content");
            return true;
        }
        return false;
    };
    candidate.extract = normalizeText;
    return candidate;
}

} // namespace detail

const std::vector<FieldCandidate> &titleCandidates()
{
    static const std::vector<FieldCandidate> candidates = {
        detail::elementWithClass({"kp-notebook-title", "bookTitle"}),
        detail::elementContent("title")};
    return candidates;
}

const std::vector<FieldCandidate> &authorCandidates()
{
    static const std::vector<FieldCandidate> candidates = {
        detail::elementWithClass({"authors", "kp-notebook-subtitle"}),
        detail::metaContent("author")};
    return candidates;
}

std::string extractField(const std::string &html, const std::vector<FieldCandidate> &candidates)
{
    for (const FieldCandidate &candidate : candidates)
    {
        std::string captured;
        if (!candidate.match(html, captured)) continue;
        const std::string value = candidate.extract(captured);
        if (!value.empty()) return value;
    }
    return {};
}

std::string extractTitle(const std::string &html)
{
    const std::string title = extractField(html, titleCandidates());
    return title.empty() ? DefaultNotebookTitle : title;
}

std::string extractAuthor(const std::string &html)
{
    return extractField(html, authorCandidates());
}

} // namespace kindle2md
