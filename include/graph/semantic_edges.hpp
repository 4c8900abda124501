#pragma once

#include "graph/context_graph.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief Cosine similarity thresholds for inferred edges
 */
struct EdgeThresholds {
    double supported_by = 0.75;     ///< roadmap item -> chunk, high relevance
    double mentioned_in = 0.65;     ///< roadmap item -> chunk, moderate relevance
    double overrides = 0.70;        ///< decision -> chunk

    /**
     * @brief Check thresholds are in [-1, 1] and mentioned_in <= supported_by
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Counters from one inference pass
 */
struct InferenceStatistics {
    size_t chunks_scanned = 0;
    size_t chunks_skipped = 0;          ///< Chunks without an embedding
    size_t roadmap_items_cached = 0;
    size_t decisions_cached = 0;
    size_t edges_removed = 0;           ///< Semantic edges dropped before recomputing
    size_t supported_by_edges = 0;
    size_t mentioned_in_edges = 0;
    size_t overrides_edges = 0;
    double elapsed_seconds = 0.0;

    size_t total_edges() const {
        return supported_by_edges + mentioned_in_edges + overrides_edges;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Materializes similarity edges between chunks and roadmap items / decisions
 *
 * Every pass recomputes the full edge set: existing SUPPORTED_BY, MENTIONED_IN
 * and OVERRIDES edges are removed, roadmap item and decision embeddings are
 * cached once, and every chunk holding an embedding is compared against each
 * cached vector. Cost is O(R*C + D*C).
 */
class SemanticEdgeInferencer {
public:
    explicit SemanticEdgeInferencer(const EdgeThresholds& thresholds = EdgeThresholds());

    InferenceStatistics infer(ContextGraph& graph) const;

    /**
     * @brief Edge type for a roadmap item / chunk similarity, if any
     *
     * Thresholds are checked in order; the first one met wins.
     */
    std::optional<EdgeType> classify_roadmap_similarity(double similarity) const;

    bool qualifies_as_override(double similarity) const;

    const EdgeThresholds& thresholds() const { return thresholds_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    EdgeThresholds thresholds_;
    bool verbose_ = false;
};

} // namespace cg
