#pragma once

#include "graph/semantic_edges.hpp"
#include <string>

namespace cg {

// ============================================================================
// Sync Configuration
// ============================================================================

/**
 * @brief Configuration for syncing sources into the context graph
 */
struct SyncConfig {
    // Source Paths
    std::string roadmap_path = "output/master_roadmap.md";
    std::string questions_path = "data/questions/questions.json";
    std::string decisions_path = "data/questions/decisions.json";
    std::string architecture_assessment_path = "output/architecture-alignment.json";
    std::string competitive_assessments_path = "output/competitive/assessments.json";
    std::string chunks_path = "data/chunks.json";      ///< Vector store export

    // Graph Storage
    std::string graph_directory = "data/unified_graph";

    // Embedding Configuration
    std::string embedding_provider = "voyage";  ///< "voyage" or "openai"
    std::string embedding_api_key;              ///< API key (empty = no embeddings)
    std::string embedding_model;                ///< Empty = provider default
    int embedding_batch_size = 128;             ///< Texts per embedding request
    int embedding_timeout_seconds = 60;         ///< Request timeout
    int embedding_max_retries = 3;              ///< Retry attempts

    // Edge Inference
    EdgeThresholds thresholds;

    // Retrieval Configuration
    std::string retrieval_mode = "keyword";     ///< "keyword" or "embedding"
    int top_k = 20;                             ///< Results kept per category
    double min_embedding_similarity = 0.5;      ///< Embedding matcher cutoff

    // Behaviour
    bool full_rebuild = false;                  ///< Start from an empty graph
    bool verbose = true;                        ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     *
     * Keys match the field names; thresholds may be given flat
     * (supported_by_threshold, ...) or as a "thresholds" object.
     *
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static SyncConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API key redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     */
    static SyncConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Load configuration with fallback chain
 *
 * An explicit @p config_path must exist and parse. Without one, tries in order:
 * 1. .cg_config.json in current directory
 * 2. ../.cg_config.json
 * 3. Environment variables
 *
 * A broken implicit file is reported on stderr and skipped.
 * @throws std::runtime_error if @p config_path is missing or malformed
 */
SyncConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace cg
