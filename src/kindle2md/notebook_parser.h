#pragma once

#include "kindle2md/notebook.h"

#include <string>
#include <vector>

namespace kindle2md
{

struct ParseStats
{
    size_t blockCount = 0;
    size_t notesAttached = 0;
    size_t orphanNotes = 0;
    bool wholeDocumentFallback = false;
};

// Folds heading/body blocks into the ordered highlight list. A note block
// attaches to the most recent highlight with the same location, else to the
// last highlight; with no highlight yet it becomes a standalone entry.
class HighlightMerger
{
public:
    void addBlock(const std::string &headingMarkup, const std::string &bodyMarkup);

    bool empty() const { return m_highlights.empty(); }
    const std::vector<Highlight> &highlights() const { return m_highlights; }
    std::vector<Highlight> takeHighlights();

    size_t notesAttached() const { return m_notesAttached; }
    size_t orphanNotes() const { return m_orphanNotes; }

private:
    Highlight *findNoteTarget(const std::string &location);

    std::vector<Highlight> m_highlights;
    size_t m_notesAttached = 0;
    size_t m_orphanNotes = 0;
};

Notebook parseNotebookHtml(const std::string &html);
Notebook parseNotebookHtml(const std::string &html, ParseStats &stats);

} // namespace kindle2md
