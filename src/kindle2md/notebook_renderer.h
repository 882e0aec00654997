#pragma once

#include "kindle2md/notebook.h"

#include <string>
#include <vector>

namespace kindle2md
{

std::string renderMarkdown(const Notebook &notebook);

// XML form of the model itself: <notebook> with one <highlight> per entry.
std::string renderXml(const Notebook &notebook);
// Several notebooks under a <notebooks> root.
std::string renderXml(const std::vector<Notebook> &notebooks);

} // namespace kindle2md
