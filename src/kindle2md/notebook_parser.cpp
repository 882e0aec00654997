#include "kindle2md/notebook_parser.h"

#include "kindle2md/highlight_metadata.h"
#include "kindle2md/markup_scanner.h"
#include "kindle2md/text_utils.h"
#include "kindle2md/title_author.h"

#include <utility>

namespace kindle2md
{

void HighlightMerger::addBlock(const std::string &headingMarkup, const std::string &bodyMarkup)
{
    const std::string heading = detail::normalizeText(headingMarkup);
    const std::string body = detail::normalizeText(bodyMarkup);
    const HighlightMetadata metadata = extractMetadata(heading);

    if (isNoteHeading(heading))
    {
        if (Highlight *target = findNoteTarget(metadata.location))
        {
            target->note = body;
            if (target->page.empty() && !metadata.page.empty()) target->page = metadata.page;
            ++m_notesAttached;
            return;
        }
        ++m_orphanNotes;
    }

    Highlight highlight;
    highlight.text = body;
    highlight.color = metadata.color;
    highlight.page = metadata.page;
    highlight.location = metadata.location;
    m_highlights.push_back(std::move(highlight));
}

std::vector<Highlight> HighlightMerger::takeHighlights()
{
    std::vector<Highlight> highlights;
    highlights.swap(m_highlights);
    return highlights;
}

Highlight *HighlightMerger::findNoteTarget(const std::string &location)
{
    if (m_highlights.empty()) return nullptr;
    if (!location.empty())
    {
        for (auto it = m_highlights.rbegin(); it != m_highlights.rend(); ++it)
        {
            if (it->location == location) return &*it;
        }
    }
    return &m_highlights.back();
}

Notebook parseNotebookHtml(const std::string &html, ParseStats &stats)
{
    stats = ParseStats();
    Notebook notebook;
    notebook.title = extractTitle(html);
    notebook.author = extractAuthor(html);

    const std::vector<NoteBlock> blocks = scanNoteBlocks(html);
    stats.blockCount = blocks.size();

    HighlightMerger merger;
    for (const NoteBlock &block : blocks)
        merger.addBlock(block.heading, block.body);
    stats.notesAttached = merger.notesAttached();
    stats.orphanNotes = merger.orphanNotes();
    notebook.highlights = merger.takeHighlights();

    if (blocks.empty())
    {
        stats.wholeDocumentFallback = true;
        const std::string text = detail::normalizeText(html);
        if (!text.empty())
        {
            Highlight highlight;
            highlight.text = text;
            notebook.highlights.push_back(std::move(highlight));
        }
    }
    return notebook;
}

Notebook parseNotebookHtml(const std::string &html)
{
    ParseStats stats;
    return parseNotebookHtml(html, stats);
}

} // namespace kindle2md
