#pragma once

#include "pipeline/sync_config.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cg {

// ============================================================================
// Sync Status
// ============================================================================

/**
 * @brief Whether the persisted graph is older than its sources
 */
struct SyncStatus {
    std::string graph_file;                     ///< <graph_directory>/graph.json
    bool graph_exists = false;
    std::vector<std::string> stale_sources;     ///< Sources modified after graph_file

    bool needs_sync() const { return !graph_exists || !stale_sources.empty(); }

    void print_summary() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Compare source modification times against the persisted graph
 *
 * Checks every configured source file. For competitive assessments, every
 * *.json file beside the configured one counts as a source too. Missing
 * sources are never stale. A missing graph always needs a sync.
 */
SyncStatus check_sync_status(const SyncConfig& config);

/**
 * @brief Shorthand for check_sync_status(config).needs_sync()
 */
bool needs_graph_sync(const SyncConfig& config);

} // namespace cg
