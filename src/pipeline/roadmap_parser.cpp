#include "pipeline/roadmap_parser.hpp"
#include "util/text_utils.hpp"
#include <algorithm>
#include <optional>
#include <regex>
#include <set>
#include <sstream>

namespace cg {

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// "Dependencies: A, B" -> {"A", "B"}
std::optional<std::vector<std::string>> parse_dependency_line(const std::string& line) {
    static const std::regex dependency_regex(
        R"(^\s*[-*]?\s*\**\s*(dependencies|depends on)\s*\**\s*:\s*\**\s*(.*)$)",
        std::regex::icase
    );

    std::smatch match;
    if (!std::regex_match(line, match, dependency_regex)) {
        return std::nullopt;
    }

    std::vector<std::string> dependencies;
    for (const auto& entry : split_list(match[2].str())) {
        if (to_lower(entry) != "none") {
            dependencies.push_back(entry);
        }
    }
    return dependencies;
}

} // anonymous namespace

std::string roadmap_item_id(const std::string& name) {
    std::string id = to_lower(name);
    std::replace(id.begin(), id.end(), ' ', '_');
    return "ri_" + utf8_prefix(id, 50);
}

std::vector<RoadmapItem> parse_roadmap(const std::string& roadmap_text) {
    static const std::regex horizon_regex(
        R"(^##\s+(Now|Next|Later|Future))",
        std::regex::icase
    );

    std::vector<RoadmapItem> items;
    std::set<std::string> seen_ids;
    std::optional<RoadmapItem> current;
    std::string horizon = "unknown";

    auto flush = [&]() {
        if (!current) return;
        current->description = trim(current->description);
        current->id = roadmap_item_id(current->name);
        if (!current->name.empty() && seen_ids.insert(current->id).second) {
            items.push_back(std::move(*current));
        }
        current.reset();
    };

    std::stringstream ss(sanitize_utf8(roadmap_text));
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::smatch match;
        if (std::regex_search(line, match, horizon_regex)) {
            flush();
            horizon = to_lower(match[1].str());
            continue;
        }

        if (starts_with(line, "### ") || starts_with(line, "#### ")) {
            flush();
            RoadmapItem item;
            size_t start = line.find_first_not_of('#');
            item.name = trim(line.substr(start));
            item.horizon = horizon;
            current = std::move(item);
            continue;
        }

        if (starts_with(line, "# ") || starts_with(line, "## ")) {
            flush();
            horizon = "unknown";
            continue;
        }

        if (!current || trim(line).empty()) {
            continue;
        }

        if (auto dependencies = parse_dependency_line(line)) {
            current->dependencies.insert(
                current->dependencies.end(), dependencies->begin(), dependencies->end()
            );
            continue;
        }

        current->description += line + " ";
    }
    flush();

    return items;
}

} // namespace cg
