#include "pipeline/sync_status.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace cg {

namespace {

// Regular files only; a directory or an unreadable path yields false
bool modified_time(const fs::path& path, fs::file_time_type& time) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    time = fs::last_write_time(path, ec);
    return !ec;
}

std::vector<fs::path> source_files(const SyncConfig& config) {
    std::vector<fs::path> files;
    for (const std::string* path : {
            &config.roadmap_path,
            &config.questions_path,
            &config.decisions_path,
            &config.architecture_assessment_path,
            &config.competitive_assessments_path,
            &config.chunks_path}) {
        if (!path->empty()) files.emplace_back(*path);
    }

    // Per-competitor assessments sit next to the aggregate file
    if (!config.competitive_assessments_path.empty()) {
        fs::path competitive(config.competitive_assessments_path);
        fs::path dir = competitive.has_parent_path() ? competitive.parent_path() : fs::path(".");

        std::error_code ec;
        std::vector<fs::path> siblings;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::path& entry = it->path();
            if (entry.extension() == ".json" && entry.filename() != competitive.filename()) {
                siblings.push_back(entry);
            }
        }
        std::sort(siblings.begin(), siblings.end());
        files.insert(files.end(), siblings.begin(), siblings.end());
    }

    return files;
}

} // anonymous namespace

void SyncStatus::print_summary() const {
    std::cout << "Graph: " << graph_file;
    if (!graph_exists) {
        std::cout << " (missing)\n";
    } else {
        std::cout << "\n";
    }

    if (!stale_sources.empty()) {
        std::cout << "Sources changed since last sync:\n";
        for (const auto& source : stale_sources) {
            std::cout << "  " << source << "\n";
        }
    }

    std::cout << (needs_sync() ? "Sync needed. Run 'cg sync'.\n" : "Graph is up to date.\n");
}

nlohmann::json SyncStatus::to_json() const {
    return {
        {"graph_file", graph_file},
        {"graph_exists", graph_exists},
        {"stale_sources", stale_sources},
        {"needs_sync", needs_sync()}
    };
}

SyncStatus check_sync_status(const SyncConfig& config) {
    SyncStatus status;
    fs::path graph_file = fs::path(config.graph_directory) / "graph.json";
    status.graph_file = graph_file.string();

    fs::file_time_type graph_time;
    status.graph_exists = modified_time(graph_file, graph_time);
    if (!status.graph_exists) {
        return status;
    }

    for (const auto& source : source_files(config)) {
        fs::file_time_type source_time;
        if (modified_time(source, source_time) && source_time > graph_time) {
            status.stale_sources.push_back(source.string());
        }
    }

    return status;
}

bool needs_graph_sync(const SyncConfig& config) {
    return check_sync_status(config).needs_sync();
}

} // namespace cg
