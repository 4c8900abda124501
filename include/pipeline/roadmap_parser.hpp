#pragma once

#include "graph/entities.hpp"
#include <string>
#include <vector>

namespace cg {

/**
 * @brief Stable roadmap item id: "ri_" + lowercased name with spaces
 *        replaced by underscores, cut to 50 code points
 */
std::string roadmap_item_id(const std::string& name);

/**
 * @brief Extract roadmap items from roadmap markdown
 *
 * - "## Now|Next|Later|Future" (case-insensitive) opens a horizon section;
 *   any other "#"/"##" header closes it and items get horizon "unknown"
 * - "### " and "#### " lines start an item named by the header text
 * - following non-blank lines form the item description, except
 *   "Dependencies:" / "Depends on:" lines which list dependencies
 *
 * Invalid UTF-8 bytes are replaced with U+FFFD. Items are returned in
 * document order with ids filled in; a repeated item name keeps its
 * first occurrence.
 */
std::vector<RoadmapItem> parse_roadmap(const std::string& roadmap_text);

} // namespace cg
