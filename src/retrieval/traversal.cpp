#include "retrieval/traversal.hpp"
#include "util/text_utils.hpp"
#include <set>
#include <stdexcept>

namespace cg {

namespace {

bool matches_topic(const GraphNode& node, const std::vector<std::string>& terms_lower) {
    if (terms_lower.empty()) return true;
    std::string text = to_lower(record_text(node.record));
    for (const auto& term : terms_lower) {
        if (text.find(term) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

size_t TraversalResult::total() const {
    size_t count = 0;
    for (const auto& [type, nodes] : by_type) {
        count += nodes.size();
    }
    return count;
}

nlohmann::json TraversalResult::to_json() const {
    nlohmann::json j;
    j["nodes_visited"] = nodes_visited;
    j["hops_completed"] = hops_completed;
    j["nodes"] = nlohmann::json::object();
    for (const auto& [type, nodes] : by_type) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& node : nodes) {
            entries.push_back({{"id", node.id}, {"hop", node.hop}, {"data", node.data}});
        }
        j["nodes"][node_type_name(type)] = std::move(entries);
    }
    return j;
}

TraversalResult traverse(
    const ContextGraph& graph,
    const std::vector<std::string>& seeds,
    const std::vector<std::string>& topic_terms,
    int max_hops
) {
    if (max_hops < 0) {
        throw std::invalid_argument("max_hops must not be negative");
    }

    std::vector<std::string> terms_lower;
    for (const auto& term : topic_terms) {
        std::string t = to_lower(trim(term));
        if (!t.empty()) terms_lower.push_back(t);
    }

    TraversalResult result;
    std::set<std::string> visited;
    std::set<std::string> frontier;

    auto record = [&](const std::string& id, int hop) {
        const GraphNode* node = graph.get_node(id);
        result.nodes_visited++;
        if (!matches_topic(*node, terms_lower)) return;

        TraversedNode entry;
        entry.id = id;
        entry.type = node->type();
        entry.hop = hop;
        entry.data = record_to_json(node->record);
        result.by_type[entry.type].push_back(std::move(entry));
    };

    for (const auto& seed : seeds) {
        if (!graph.has_node(seed) || !visited.insert(seed).second) continue;
        frontier.insert(seed);
        record(seed, 0);
    }

    for (int hop = 1; hop <= max_hops && !frontier.empty(); ++hop) {
        std::set<std::string> next;
        for (const auto& id : frontier) {
            for (const auto& neighbor : graph.successors(id)) {
                if (!visited.count(neighbor)) next.insert(neighbor);
            }
            for (const auto& neighbor : graph.predecessors(id)) {
                if (!visited.count(neighbor)) next.insert(neighbor);
            }
        }

        for (const auto& id : next) {
            visited.insert(id);
            record(id, hop);
        }

        if (!next.empty()) {
            result.hops_completed = hop;
        }
        frontier = std::move(next);
    }

    return result;
}

} // namespace cg
