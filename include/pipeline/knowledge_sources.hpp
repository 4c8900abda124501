#pragma once

#include "graph/entities.hpp"
#include "pipeline/sync_config.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief A chunk exported from the vector store, with its stored vector
 */
struct ChunkRow {
    Chunk chunk;
    std::vector<float> vector;          ///< Empty if the store had none
};

/**
 * @brief Read-only access to the stores the sync orchestrator draws from
 *
 * Absent stores are empty, not errors. Implementations throw
 * std::runtime_error when a store exists but cannot be read or parsed.
 */
class KnowledgeSources {
public:
    virtual ~KnowledgeSources() = default;

    /**
     * @brief Roadmap markdown, std::nullopt if no roadmap exists
     */
    virtual std::optional<std::string> load_roadmap_text() = 0;

    virtual std::vector<Question> load_questions() = 0;

    virtual std::vector<Decision> load_decisions() = 0;

    /**
     * @brief Architecture alignment payload, std::nullopt if none
     */
    virtual std::optional<nlohmann::json> load_architecture_assessment() = 0;

    /**
     * @brief Competitive assessment payloads (one per competitor)
     */
    virtual std::vector<nlohmann::json> load_competitive_assessments() = 0;

    virtual std::vector<ChunkRow> load_chunks() = 0;
};

/**
 * @brief Sources backed by the JSON and markdown files named in SyncConfig
 *
 * File formats:
 * - questions:  {"questions": [ ... ]}  (a bare array is accepted)
 * - decisions:  {"decisions": [ ... ]}  (a bare array is accepted)
 * - competitive assessments: [ ... ]
 * - chunks: [ {"id", "content", ..., "vector": [...]} ]
 */
class FileKnowledgeSources : public KnowledgeSources {
public:
    explicit FileKnowledgeSources(const SyncConfig& config);

    std::optional<std::string> load_roadmap_text() override;
    std::vector<Question> load_questions() override;
    std::vector<Decision> load_decisions() override;
    std::optional<nlohmann::json> load_architecture_assessment() override;
    std::vector<nlohmann::json> load_competitive_assessments() override;
    std::vector<ChunkRow> load_chunks() override;

private:
    SyncConfig config_;
};

} // namespace cg
