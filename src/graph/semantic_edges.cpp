#include "graph/semantic_edges.hpp"
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace cg {

bool EdgeThresholds::validate(std::string& error_message) const {
    auto in_range = [](double value) { return value >= -1.0 && value <= 1.0; };

    if (!in_range(supported_by) || !in_range(mentioned_in) || !in_range(overrides)) {
        error_message = "Edge thresholds must be between -1.0 and 1.0";
        return false;
    }

    if (mentioned_in > supported_by) {
        error_message = "MENTIONED_IN threshold must not exceed SUPPORTED_BY threshold";
        return false;
    }

    return true;
}

nlohmann::json InferenceStatistics::to_json() const {
    nlohmann::json j;
    j["chunks_scanned"] = chunks_scanned;
    j["chunks_skipped"] = chunks_skipped;
    j["roadmap_items_cached"] = roadmap_items_cached;
    j["decisions_cached"] = decisions_cached;
    j["edges_removed"] = edges_removed;
    j["supported_by_edges"] = supported_by_edges;
    j["mentioned_in_edges"] = mentioned_in_edges;
    j["overrides_edges"] = overrides_edges;
    j["total_edges"] = total_edges();
    j["elapsed_seconds"] = elapsed_seconds;
    return j;
}

SemanticEdgeInferencer::SemanticEdgeInferencer(const EdgeThresholds& thresholds)
    : thresholds_(thresholds) {}

std::optional<EdgeType> SemanticEdgeInferencer::classify_roadmap_similarity(double similarity) const {
    if (similarity >= thresholds_.supported_by) {
        return EdgeType::SupportedBy;
    }
    if (similarity >= thresholds_.mentioned_in) {
        return EdgeType::MentionedIn;
    }
    return std::nullopt;
}

bool SemanticEdgeInferencer::qualifies_as_override(double similarity) const {
    return similarity >= thresholds_.overrides;
}

InferenceStatistics SemanticEdgeInferencer::infer(ContextGraph& graph) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    InferenceStatistics stats;

    stats.edges_removed = graph.remove_edges_of_type(
        {EdgeType::SupportedBy, EdgeType::MentionedIn, EdgeType::Overrides}
    );

    // Cache target embeddings once per pass
    std::vector<std::pair<std::string, const std::vector<float>*>> roadmap_embeddings;
    for (const auto& id : graph.ids_of_type(NodeType::RoadmapItem)) {
        const GraphNode* node = graph.get_node(id);
        if (node && node->has_embedding()) {
            roadmap_embeddings.emplace_back(id, &node->embedding);
        }
    }

    std::vector<std::pair<std::string, const std::vector<float>*>> decision_embeddings;
    for (const auto& id : graph.ids_of_type(NodeType::Decision)) {
        const GraphNode* node = graph.get_node(id);
        if (node && node->has_embedding()) {
            decision_embeddings.emplace_back(id, &node->embedding);
        }
    }

    stats.roadmap_items_cached = roadmap_embeddings.size();
    stats.decisions_cached = decision_embeddings.size();

    if (verbose_) {
        std::cout << "Using semantic similarity with " << roadmap_embeddings.size()
                  << " roadmap items, " << decision_embeddings.size() << " decisions\n";
    }

    for (const auto& chunk_id : graph.ids_of_type(NodeType::Chunk)) {
        const GraphNode* chunk = graph.get_node(chunk_id);
        if (!chunk || !chunk->has_embedding()) {
            stats.chunks_skipped++;
            continue;
        }
        stats.chunks_scanned++;

        for (const auto& [item_id, item_embedding] : roadmap_embeddings) {
            if (item_embedding->size() != chunk->embedding.size()) continue;
            double similarity = ContextGraph::cosine_similarity(chunk->embedding, *item_embedding);
            auto edge_type = classify_roadmap_similarity(similarity);
            if (!edge_type) continue;

            graph.add_edge(item_id, chunk_id, *edge_type, similarity);
            if (*edge_type == EdgeType::SupportedBy) {
                stats.supported_by_edges++;
            } else {
                stats.mentioned_in_edges++;
            }
        }

        for (const auto& [decision_id, decision_embedding] : decision_embeddings) {
            if (decision_embedding->size() != chunk->embedding.size()) continue;
            double similarity = ContextGraph::cosine_similarity(chunk->embedding, *decision_embedding);
            if (qualifies_as_override(similarity)) {
                graph.add_edge(decision_id, chunk_id, EdgeType::Overrides, similarity);
                stats.overrides_edges++;
            }
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();

    if (verbose_) {
        std::cout << "Created " << stats.total_edges() << " semantic edges across "
                  << stats.chunks_scanned << " chunks ("
                  << stats.chunks_skipped << " without embeddings)\n";
        std::cout << "Edge thresholds: SUPPORTED_BY>=" << thresholds_.supported_by
                  << ", MENTIONED_IN>=" << thresholds_.mentioned_in
                  << ", OVERRIDES>=" << thresholds_.overrides << "\n";
    }

    return stats;
}

} // namespace cg
