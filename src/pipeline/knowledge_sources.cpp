#include "pipeline/knowledge_sources.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;

namespace cg {

namespace {

bool file_exists(const std::string& path) {
    struct stat st;
    return !path.empty() && stat(path.c_str(), &st) == 0;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json read_json_file(const std::string& path) {
    try {
        return json::parse(read_file(path));
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
}

// Entries of {"<key>": [...]} or of a bare array
const json& list_entries(const json& j, const std::string& key, const std::string& path) {
    if (j.is_array()) {
        return j;
    }
    if (j.is_object() && j.contains(key) && j[key].is_array()) {
        return j[key];
    }
    throw std::runtime_error(path + ": expected an array under \"" + key + "\"");
}

template<typename T>
std::vector<T> load_records(const std::string& path, const std::string& key) {
    std::vector<T> records;
    if (!file_exists(path)) {
        return records;
    }

    json j = read_json_file(path);
    try {
        for (const auto& entry : list_entries(j, key, path)) {
            records.push_back(T::from_json(entry));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed record in " + path + ": " + e.what());
    }
    return records;
}

} // anonymous namespace

FileKnowledgeSources::FileKnowledgeSources(const SyncConfig& config)
    : config_(config) {}

std::optional<std::string> FileKnowledgeSources::load_roadmap_text() {
    if (!file_exists(config_.roadmap_path)) {
        return std::nullopt;
    }
    return read_file(config_.roadmap_path);
}

std::vector<Question> FileKnowledgeSources::load_questions() {
    return load_records<Question>(config_.questions_path, "questions");
}

std::vector<Decision> FileKnowledgeSources::load_decisions() {
    return load_records<Decision>(config_.decisions_path, "decisions");
}

std::optional<json> FileKnowledgeSources::load_architecture_assessment() {
    if (!file_exists(config_.architecture_assessment_path)) {
        return std::nullopt;
    }
    json j = read_json_file(config_.architecture_assessment_path);
    if (!j.is_object()) {
        throw std::runtime_error(config_.architecture_assessment_path + ": expected a JSON object");
    }
    return j;
}

std::vector<json> FileKnowledgeSources::load_competitive_assessments() {
    std::vector<json> assessments;
    if (!file_exists(config_.competitive_assessments_path)) {
        return assessments;
    }

    json j = read_json_file(config_.competitive_assessments_path);
    for (const auto& entry : list_entries(j, "assessments", config_.competitive_assessments_path)) {
        if (entry.is_object()) {
            assessments.push_back(entry);
        }
    }
    return assessments;
}

std::vector<ChunkRow> FileKnowledgeSources::load_chunks() {
    std::vector<ChunkRow> rows;
    if (!file_exists(config_.chunks_path)) {
        return rows;
    }

    json j = read_json_file(config_.chunks_path);
    try {
        for (const auto& entry : list_entries(j, "chunks", config_.chunks_path)) {
            ChunkRow row;
            row.chunk = Chunk::from_json(entry);
            if (entry.contains("vector") && entry["vector"].is_array()) {
                row.vector = entry["vector"].get<std::vector<float>>();
            }
            rows.push_back(std::move(row));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed chunk in " + config_.chunks_path + ": " + e.what());
    }
    return rows;
}

} // namespace cg
