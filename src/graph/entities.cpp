#include "graph/entities.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace cg {

namespace {

// Stores written by other tools use null for absent values; treat it as missing.
std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

// Integers outside the int range, and non-integral numbers, read as the fallback
int int_field(const nlohmann::json& j, const char* key, int fallback = 0) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        return value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            ? fallback : static_cast<int>(value);
    }
    auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return fallback;
    }
    return static_cast<int>(value);
}

std::vector<std::string> string_list_field(const nlohmann::json& j, const char* key) {
    std::vector<std::string> result;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return result;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        } else if (!item.is_null()) {
            result.push_back(item.dump());
        }
    }
    return result;
}

} // anonymous namespace

// ==========================================
// NodeType
// ==========================================

std::string node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Chunk: return "chunk";
        case NodeType::Decision: return "decision";
        case NodeType::Question: return "question";
        case NodeType::Assessment: return "assessment";
        case NodeType::RoadmapItem: return "roadmap_item";
        case NodeType::Gap: return "gap";
    }
    return "unknown";
}

std::optional<NodeType> node_type_from_name(const std::string& name) {
    for (NodeType type : all_node_types()) {
        if (node_type_name(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<NodeType>& all_node_types() {
    static const std::vector<NodeType> types = {
        NodeType::Chunk,
        NodeType::Decision,
        NodeType::Question,
        NodeType::Assessment,
        NodeType::RoadmapItem,
        NodeType::Gap
    };
    return types;
}

// ==========================================
// Chunk
// ==========================================

nlohmann::json Chunk::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["content"] = content;
    j["lens"] = lens;
    j["source_name"] = source_name;
    j["source_file"] = source_file;
    j["chunk_index"] = chunk_index;
    j["token_count"] = token_count;
    return j;
}

Chunk Chunk::from_json(const nlohmann::json& j) {
    Chunk chunk;
    chunk.id = string_field(j, "id");
    chunk.content = string_field(j, "content");
    chunk.lens = string_field(j, "lens", "unknown");
    chunk.source_name = string_field(j, "source_name");
    chunk.source_file = string_field(j, "source_file");
    chunk.chunk_index = int_field(j, "chunk_index");
    chunk.token_count = int_field(j, "token_count");
    return chunk;
}

// ==========================================
// Decision
// ==========================================

nlohmann::json Decision::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["decision"] = decision;
    j["rationale"] = rationale;
    j["implications"] = implications;
    j["owner"] = owner;
    j["status"] = status;
    j["related_roadmap_items"] = related_roadmap_items;

    if (!question_id.empty()) {
        j["question_id"] = question_id;
    }
    if (!created_at.empty()) {
        j["created_at"] = created_at;
    }
    if (!updated_at.empty()) {
        j["updated_at"] = updated_at;
    }

    return j;
}

Decision Decision::from_json(const nlohmann::json& j) {
    Decision d;
    d.id = string_field(j, "id");
    d.decision = string_field(j, "decision");
    d.rationale = string_field(j, "rationale");
    d.implications = string_list_field(j, "implications");
    d.owner = string_field(j, "owner");
    d.status = string_field(j, "status", "active");
    d.question_id = string_field(j, "question_id");
    d.related_roadmap_items = string_list_field(j, "related_roadmap_items");
    d.created_at = string_field(j, "created_at");
    d.updated_at = string_field(j, "updated_at");
    return d;
}

// ==========================================
// Question
// ==========================================

nlohmann::json Question::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["question"] = question;
    j["audience"] = audience;
    j["category"] = category;
    j["priority"] = priority;
    j["status"] = status;
    j["related_roadmap_items"] = related_roadmap_items;

    if (!context.empty()) {
        j["context"] = context;
    }
    if (!answered_by_decision.empty()) {
        j["answered_by_decision"] = answered_by_decision;
    }

    return j;
}

Question Question::from_json(const nlohmann::json& j) {
    Question q;
    q.id = string_field(j, "id");
    q.question = string_field(j, "question");
    q.audience = string_field(j, "audience");
    q.category = string_field(j, "category");
    q.priority = string_field(j, "priority", "medium");
    q.status = string_field(j, "status", "pending");
    q.context = string_field(j, "context");
    q.related_roadmap_items = string_list_field(j, "related_roadmap_items");
    q.answered_by_decision = string_field(j, "answered_by_decision");
    return q;
}

// ==========================================
// Assessment
// ==========================================

nlohmann::json Assessment::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = type;
    j["summary"] = summary;
    j["data"] = data;
    return j;
}

Assessment Assessment::from_json(const nlohmann::json& j) {
    Assessment a;
    a.id = string_field(j, "id");
    a.type = string_field(j, "type");
    a.summary = string_field(j, "summary");
    if (j.contains("data")) {
        a.data = j["data"];
    }
    return a;
}

// ==========================================
// RoadmapItem
// ==========================================

nlohmann::json RoadmapItem::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;
    j["horizon"] = horizon;
    j["dependencies"] = dependencies;
    return j;
}

RoadmapItem RoadmapItem::from_json(const nlohmann::json& j) {
    RoadmapItem item;
    item.id = string_field(j, "id");
    item.name = string_field(j, "name");
    item.description = string_field(j, "description");
    item.horizon = string_field(j, "horizon", "future");
    item.dependencies = string_list_field(j, "dependencies");
    return item;
}

// ==========================================
// Gap
// ==========================================

nlohmann::json Gap::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["description"] = description;
    j["severity"] = severity;
    j["type"] = type;
    j["identified_by"] = identified_by;
    return j;
}

Gap Gap::from_json(const nlohmann::json& j) {
    Gap gap;
    gap.id = string_field(j, "id");
    gap.description = string_field(j, "description");
    gap.severity = string_field(j, "severity", "medium");
    gap.type = string_field(j, "type");
    gap.identified_by = string_field(j, "identified_by");
    return gap;
}

// ==========================================
// EntityRecord accessors
// ==========================================

NodeType node_type_of(const EntityRecord& record) {
    return static_cast<NodeType>(record.index());
}

const std::string& record_id(const EntityRecord& record) {
    return std::visit([](const auto& r) -> const std::string& { return r.id; }, record);
}

void set_record_id(EntityRecord& record, const std::string& id) {
    std::visit([&id](auto& r) { r.id = id; }, record);
}

nlohmann::json record_to_json(const EntityRecord& record) {
    return std::visit([](const auto& r) { return r.to_json(); }, record);
}

EntityRecord record_from_json(NodeType type, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(
            "Expected an object for " + node_type_name(type) + " record"
        );
    }

    switch (type) {
        case NodeType::Chunk: return Chunk::from_json(j);
        case NodeType::Decision: return Decision::from_json(j);
        case NodeType::Question: return Question::from_json(j);
        case NodeType::Assessment: return Assessment::from_json(j);
        case NodeType::RoadmapItem: return RoadmapItem::from_json(j);
        case NodeType::Gap: return Gap::from_json(j);
    }
    throw std::invalid_argument("Unknown node type");
}

std::string record_text(const EntityRecord& record) {
    return record_to_json(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cg
