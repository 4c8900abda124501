#pragma once

#include "graph/context_graph.hpp"
#include "graph/semantic_edges.hpp"
#include "llm/embedding_provider.hpp"
#include "pipeline/knowledge_sources.hpp"
#include "pipeline/sync_config.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cg {

// ============================================================================
// Sync Report
// ============================================================================

/**
 * @brief Outcome of one sync pass
 */
struct SyncReport {
    // Nodes added this pass
    int roadmap_items_added = 0;
    int questions_added = 0;
    int decisions_added = 0;
    int assessments_added = 0;
    int gaps_added = 0;
    int chunks_added = 0;

    // Structural edges and status changes
    int resolves_edges = 0;
    int impacts_edges = 0;
    int about_item_edges = 0;
    int identifies_gap_edges = 0;
    int questions_answered = 0;

    // Embeddings
    int texts_embedded = 0;
    int nodes_without_embeddings = 0;

    InferenceStatistics inference;

    // Final graph
    int final_nodes = 0;
    int final_edges = 0;
    bool persisted = false;

    double total_time_seconds = 0.0;

    /// (stage, message) for every stage that failed
    std::vector<std::pair<std::string, std::string>> stage_errors;

    bool succeeded() const { return stage_errors.empty(); }

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Sync Orchestrator
// ============================================================================

/**
 * @brief Pulls every source into the context graph
 *
 * Stages run in a fixed order so that edges always find their endpoints:
 * roadmap items -> questions -> decisions -> assessments -> chunks ->
 * semantic edges -> persist. Only artifacts whose id is not yet in the graph
 * are added. Each stage is isolated: a failure is logged and recorded in the
 * report, and the remaining stages still run.
 */
class SyncOrchestrator {
public:
    /**
     * @brief Constructor
     *
     * @param config Sync configuration
     * @param sources Source stores (must outlive the orchestrator)
     * @param embedder Embedding service, or nullptr to add nodes without embeddings
     * @throws std::invalid_argument if the configuration is invalid
     */
    SyncOrchestrator(
        const SyncConfig& config,
        KnowledgeSources& sources,
        EmbeddingProvider* embedder = nullptr
    );

    /**
     * @brief Run the five source stages and semantic edge inference on @p graph
     *
     * Does not persist.
     */
    SyncReport sync(ContextGraph& graph);

    /**
     * @brief Load the persisted graph, sync it and save it back
     *
     * With full_rebuild set the pass starts from an empty graph.
     *
     * @return The synced graph; the report is available from last_report()
     * @throws std::runtime_error if the persisted graph is malformed
     */
    ContextGraph run();

    const SyncReport& last_report() const { return report_; }

    void set_progress_callback(ProgressCallback callback);

    const SyncConfig& get_config() const { return config_; }

private:
    SyncConfig config_;
    KnowledgeSources& sources_;
    EmbeddingProvider* embedder_;
    ProgressCallback progress_callback_;
    SyncReport report_;
    bool warned_no_embedder_ = false;

    // Stages
    void sync_roadmap(ContextGraph& graph);
    void sync_questions(ContextGraph& graph);
    void sync_decisions(ContextGraph& graph);
    void sync_architecture_assessment(ContextGraph& graph);
    void sync_competitive_assessments(ContextGraph& graph);
    void sync_chunks(ContextGraph& graph);
    void infer_semantic_edges(ContextGraph& graph);

    void run_stage(const std::string& stage, const std::function<void()>& body);

    /**
     * @brief Add an assessment node and its gap nodes
     */
    void integrate_assessment(
        ContextGraph& graph,
        const std::string& id,
        const std::string& type,
        const std::string& summary,
        const nlohmann::json& payload
    );

    /**
     * @brief Embed texts in batches
     *
     * @return One vector per text, or an empty list when no embedder is set
     * @throws std::runtime_error if the embedding service fails
     */
    std::vector<std::vector<float>> embed_texts(
        const std::vector<std::string>& texts,
        const std::string& stage
    );

    /**
     * @brief Skip ids already present; warn when held by another type
     */
    bool is_new_node(const ContextGraph& graph, const std::string& id, NodeType type) const;

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

} // namespace cg
