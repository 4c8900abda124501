#pragma once

#include "graph/context_graph.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief A node reached by traversal
 */
struct TraversedNode {
    std::string id;
    NodeType type = NodeType::Chunk;
    int hop = 0;                        ///< Distance from the nearest seed
    nlohmann::json data;                ///< Serialized record
};

/**
 * @brief Nodes discovered by a multi-hop traversal, grouped by type
 */
struct TraversalResult {
    std::map<NodeType, std::vector<TraversedNode>> by_type;   ///< Hop order within a type
    size_t nodes_visited = 0;           ///< Includes nodes dropped by the topic filter
    int hops_completed = 0;

    size_t total() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Breadth-first traversal along edges in both directions
 *
 * Seeds sit at hop 0; unknown seed ids are ignored. Each node is visited once,
 * so cycles terminate. Expansion stops when @p max_hops is spent or the
 * frontier is empty.
 *
 * With topic terms given, only nodes whose serialized record contains at
 * least one term (case-insensitive) are reported. Filtered nodes are still
 * expanded.
 *
 * @throws std::invalid_argument if max_hops is negative
 */
TraversalResult traverse(
    const ContextGraph& graph,
    const std::vector<std::string>& seeds,
    const std::vector<std::string>& topic_terms = {},
    int max_hops = 2
);

} // namespace cg
