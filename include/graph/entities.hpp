#ifndef ENTITIES_HPP
#define ENTITIES_HPP

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief The six artifact types held by the unified context graph
 *
 * The declaration order matches the alternative order of EntityRecord.
 */
enum class NodeType {
    Chunk,
    Decision,
    Question,
    Assessment,
    RoadmapItem,
    Gap
};

/**
 * @brief Persisted name of a node type ("chunk", "roadmap_item", ...)
 */
std::string node_type_name(NodeType type);

/**
 * @brief Parse a persisted node type name
 */
std::optional<NodeType> node_type_from_name(const std::string& name);

/**
 * @brief All node types in declaration order
 */
const std::vector<NodeType>& all_node_types();

/**
 * @brief Source excerpt produced by the chunking collaborator
 */
struct Chunk {
    std::string id;
    std::string content;
    std::string lens = "unknown";                      // Origin/authority tag
    std::string source_name;
    std::string source_file;
    int chunk_index = 0;
    int token_count = 0;

    nlohmann::json to_json() const;
    static Chunk from_json(const nlohmann::json& j);
};

/**
 * @brief Recorded stakeholder decision, the highest-authority artifact
 */
struct Decision {
    std::string id;
    std::string decision;                              // The statement itself
    std::string rationale;
    std::vector<std::string> implications;
    std::string owner;
    std::string status = "active";                     // active / superseded / revisiting
    std::string question_id;                           // Question this decision resolves
    std::vector<std::string> related_roadmap_items;    // Roadmap item names
    std::string created_at;
    std::string updated_at;

    nlohmann::json to_json() const;
    static Decision from_json(const nlohmann::json& j);
};

/**
 * @brief Open or answered question from the question store
 */
struct Question {
    std::string id;
    std::string question;
    std::string audience;
    std::string category;
    std::string priority = "medium";
    std::string status = "pending";                    // pending / answered / obsolete / deferred
    std::string context;
    std::vector<std::string> related_roadmap_items;
    std::string answered_by_decision;

    bool is_answered() const { return status == "answered"; }

    nlohmann::json to_json() const;
    static Question from_json(const nlohmann::json& j);
};

/**
 * @brief Architecture or competitive assessment envelope
 */
struct Assessment {
    std::string id;
    std::string type;                                  // architecture / competitive
    std::string summary;
    nlohmann::json data;                               // Raw payload as received

    nlohmann::json to_json() const;
    static Assessment from_json(const nlohmann::json& j);
};

/**
 * @brief Item parsed from the roadmap text
 */
struct RoadmapItem {
    std::string id;
    std::string name;
    std::string description;
    std::string horizon = "future";                    // now / next / later / future
    std::vector<std::string> dependencies;

    nlohmann::json to_json() const;
    static RoadmapItem from_json(const nlohmann::json& j);
};

/**
 * @brief Gap identified by an assessment
 */
struct Gap {
    std::string id;
    std::string description;
    std::string severity = "medium";
    std::string type;                                  // Type of the originating assessment
    std::string identified_by;                         // Assessment id

    nlohmann::json to_json() const;
    static Gap from_json(const nlohmann::json& j);
};

/**
 * @brief Tagged record of any node type
 */
using EntityRecord = std::variant<Chunk, Decision, Question, Assessment, RoadmapItem, Gap>;

NodeType node_type_of(const EntityRecord& record);

const std::string& record_id(const EntityRecord& record);

void set_record_id(EntityRecord& record, const std::string& id);

nlohmann::json record_to_json(const EntityRecord& record);

/**
 * @brief Decode a record of the given type
 * @throws nlohmann::json::exception if a present field has the wrong JSON type
 */
EntityRecord record_from_json(NodeType type, const nlohmann::json& j);

/**
 * @brief Serialized form of a record, used for text matching
 */
std::string record_text(const EntityRecord& record);

/**
 * @brief Typed view of a record, nullptr if it holds another type
 */
template<typename T>
const T* record_as(const EntityRecord& record) {
    return std::get_if<T>(&record);
}

template<typename T>
T* record_as(EntityRecord& record) {
    return std::get_if<T>(&record);
}

} // namespace cg

#endif // ENTITIES_HPP
