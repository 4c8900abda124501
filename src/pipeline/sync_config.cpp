#include "pipeline/sync_config.hpp"
#include "llm/embedding_provider.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <sys/stat.h>

using json = nlohmann::json;

namespace cg {

namespace {

template<typename T>
void read_field(const json& j, const std::string& key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // anonymous namespace

// ============================================================================
// SyncConfig
// ============================================================================

SyncConfig SyncConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    SyncConfig config;

    try {
        read_field(j, "roadmap_path", config.roadmap_path);
        read_field(j, "questions_path", config.questions_path);
        read_field(j, "decisions_path", config.decisions_path);
        read_field(j, "architecture_assessment_path", config.architecture_assessment_path);
        read_field(j, "competitive_assessments_path", config.competitive_assessments_path);
        read_field(j, "chunks_path", config.chunks_path);
        read_field(j, "graph_directory", config.graph_directory);

        // Embedding config - accept the short provider/api_key/model form too
        if (j.contains("embedding_provider")) {
            read_field(j, "embedding_provider", config.embedding_provider);
        } else {
            read_field(j, "provider", config.embedding_provider);
        }
        if (j.contains("embedding_api_key")) {
            read_field(j, "embedding_api_key", config.embedding_api_key);
        } else {
            read_field(j, "api_key", config.embedding_api_key);
        }
        if (j.contains("embedding_model")) {
            read_field(j, "embedding_model", config.embedding_model);
        } else {
            read_field(j, "model", config.embedding_model);
        }
        read_field(j, "embedding_batch_size", config.embedding_batch_size);
        read_field(j, "embedding_timeout_seconds", config.embedding_timeout_seconds);
        read_field(j, "embedding_max_retries", config.embedding_max_retries);

        if (j.contains("thresholds") && j["thresholds"].is_object()) {
            const auto& t = j["thresholds"];
            read_field(t, "supported_by", config.thresholds.supported_by);
            read_field(t, "mentioned_in", config.thresholds.mentioned_in);
            read_field(t, "overrides", config.thresholds.overrides);
        }
        read_field(j, "supported_by_threshold", config.thresholds.supported_by);
        read_field(j, "mentioned_in_threshold", config.thresholds.mentioned_in);
        read_field(j, "overrides_threshold", config.thresholds.overrides);

        read_field(j, "retrieval_mode", config.retrieval_mode);
        read_field(j, "top_k", config.top_k);
        read_field(j, "min_embedding_similarity", config.min_embedding_similarity);

        read_field(j, "full_rebuild", config.full_rebuild);
        read_field(j, "verbose", config.verbose);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    return config;
}

void SyncConfig::to_json_file(const std::string& path) const {
    json j;

    // Source paths
    j["roadmap_path"] = roadmap_path;
    j["questions_path"] = questions_path;
    j["decisions_path"] = decisions_path;
    j["architecture_assessment_path"] = architecture_assessment_path;
    j["competitive_assessments_path"] = competitive_assessments_path;
    j["chunks_path"] = chunks_path;
    j["graph_directory"] = graph_directory;

    // Embedding config
    j["embedding_provider"] = embedding_provider;
    j["embedding_api_key"] = embedding_api_key.empty() ? "" : "***REDACTED***";
    j["embedding_model"] = embedding_model;
    j["embedding_batch_size"] = embedding_batch_size;
    j["embedding_timeout_seconds"] = embedding_timeout_seconds;
    j["embedding_max_retries"] = embedding_max_retries;

    // Edge thresholds
    j["thresholds"] = {
        {"supported_by", thresholds.supported_by},
        {"mentioned_in", thresholds.mentioned_in},
        {"overrides", thresholds.overrides}
    };

    // Retrieval config
    j["retrieval_mode"] = retrieval_mode;
    j["top_k"] = top_k;
    j["min_embedding_similarity"] = min_embedding_similarity;

    j["full_rebuild"] = full_rebuild;
    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

SyncConfig SyncConfig::from_environment() {
    SyncConfig config;

    std::string graph_dir = get_env_value("CG_GRAPH_DIR");
    if (!graph_dir.empty()) config.graph_directory = graph_dir;

    std::string provider = get_env_value("CG_EMBEDDING_PROVIDER");
    if (!provider.empty()) config.embedding_provider = provider;

    if (config.embedding_provider == "voyage") {
        config.embedding_api_key = get_env_value("VOYAGE_API_KEY");
        if (config.embedding_api_key.empty()) {
            config.embedding_api_key = get_env_value("CG_VOYAGE_API_KEY");
        }
    } else if (config.embedding_provider == "openai") {
        config.embedding_api_key = get_env_value("OPENAI_API_KEY");
        if (config.embedding_api_key.empty()) {
            config.embedding_api_key = get_env_value("CG_OPENAI_API_KEY");
        }
    }

    std::string model = get_env_value("CG_EMBEDDING_MODEL");
    if (!model.empty()) config.embedding_model = model;

    std::string mode = get_env_value("CG_RETRIEVAL_MODE");
    if (!mode.empty()) config.retrieval_mode = mode;

    return config;
}

bool SyncConfig::validate(std::string& error_message) const {
    if (graph_directory.empty()) {
        error_message = "Graph directory is required";
        return false;
    }

    if (embedding_provider != "voyage" && embedding_provider != "openai") {
        error_message = "Embedding provider must be 'voyage' or 'openai'";
        return false;
    }

    if (embedding_batch_size <= 0) {
        error_message = "Embedding batch size must be positive";
        return false;
    }

    if (embedding_timeout_seconds <= 0) {
        error_message = "Embedding timeout must be positive";
        return false;
    }

    if (embedding_max_retries <= 0) {
        error_message = "Embedding retries must be at least 1";
        return false;
    }

    if (!thresholds.validate(error_message)) {
        return false;
    }

    if (retrieval_mode != "keyword" && retrieval_mode != "embedding") {
        error_message = "Retrieval mode must be 'keyword' or 'embedding'";
        return false;
    }

    if (top_k <= 0) {
        error_message = "top_k must be positive";
        return false;
    }

    if (min_embedding_similarity < -1.0 || min_embedding_similarity > 1.0) {
        error_message = "Minimum embedding similarity must be between -1.0 and 1.0";
        return false;
    }

    return true;
}

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

// Keys from the environment fill in a file that omits them
SyncConfig with_environment_key(SyncConfig config) {
    if (config.embedding_api_key.empty()) {
        SyncConfig env = SyncConfig::from_environment();
        if (env.embedding_provider == config.embedding_provider) {
            config.embedding_api_key = env.embedding_api_key;
        }
    }
    return config;
}

} // anonymous namespace

SyncConfig load_config_with_fallback(const std::string& config_path) {
    // A file named by the caller must load
    if (!config_path.empty()) {
        if (!file_exists(config_path)) {
            throw std::runtime_error("Config file not found: " + config_path);
        }
        return with_environment_key(SyncConfig::from_json_file(config_path));
    }

    for (const char* path : {".cg_config.json", "../.cg_config.json"}) {
        if (!file_exists(path)) continue;

        try {
            return with_environment_key(SyncConfig::from_json_file(path));
        } catch (const std::exception& e) {
            std::cerr << "Warning: ignoring config file " << path << ": " << e.what() << "\n";
        }
    }

    // Fallback to environment
    return SyncConfig::from_environment();
}

} // namespace cg
