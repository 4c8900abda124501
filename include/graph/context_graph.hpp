#ifndef CONTEXT_GRAPH_HPP
#define CONTEXT_GRAPH_HPP

#include "graph/entities.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace cg {

/**
 * @brief Relationship types between artifacts
 */
enum class EdgeType {
    Resolves,          // decision -> question
    Impacts,           // decision -> roadmap item
    IdentifiesGap,     // assessment -> gap
    AboutItem,         // question -> roadmap item
    SupportedBy,       // roadmap item -> chunk (similarity-weighted)
    MentionedIn,       // roadmap item -> chunk (similarity-weighted)
    Overrides          // decision -> chunk (similarity-weighted)
};

/**
 * @brief Persisted name of an edge type ("RESOLVES", "OVERRIDES", ...)
 */
std::string edge_type_name(EdgeType type);

std::optional<EdgeType> edge_type_from_name(const std::string& name);

/**
 * @brief True for the edge types produced by embedding similarity
 */
bool is_semantic_edge(EdgeType type);

/**
 * @brief A node of the unified graph: one artifact plus its optional embedding
 */
struct GraphNode {
    std::string id;
    EntityRecord record;
    std::vector<float> embedding;                      // Empty when the artifact has none

    NodeType type() const { return node_type_of(record); }
    bool has_embedding() const { return !embedding.empty(); }

    /**
     * @brief Node-link entry: id, node_type and embedding (if any)
     */
    nlohmann::json to_json() const;
};

/**
 * @brief A directed, typed, weighted edge between two node ids
 */
struct GraphEdge {
    std::string source;
    std::string target;
    EdgeType edge_type = EdgeType::Resolves;
    double weight = 1.0;
    std::map<std::string, std::string> metadata;

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Node/edge counts and authority coverage of a graph
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;

    std::map<std::string, size_t> nodes_by_type;
    std::map<std::string, size_t> edges_by_type;

    size_t active_decisions = 0;
    size_t answered_questions = 0;
    size_t pending_questions = 0;

    nlohmann::json to_json() const;

    void print_summary() const;
};

/**
 * @brief Unified context graph with per-type entity indices
 *
 * The graph is the sole owner of node and edge storage. Everything else
 * refers to artifacts by id, so cyclic relationships (a decision overriding
 * a chunk that supports an item the decision impacts) are stored and
 * traversed without ownership cycles.
 *
 * Nodes are upserted idempotently: adding an id that is already present is a
 * no-op and never merges fields. There is at most one edge per ordered pair
 * of nodes; adding another overwrites it.
 */
class ContextGraph {
public:
    ContextGraph() = default;

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Add a node to the graph and its typed index
     * @param id Stable external id
     * @param record Artifact record; its id is set to @p id
     * @param embedding Optional embedding vector
     * @return true if the node was created, false if the id already existed
     * @throws std::invalid_argument if id is empty or exists under another type
     */
    bool add_node(
        const std::string& id,
        EntityRecord record,
        std::vector<float> embedding = {}
    );

    /**
     * @brief Create or overwrite the directed edge from -> to
     * @throws std::invalid_argument if an endpoint is missing, or if an
     *         OVERRIDES edge does not run from a decision to a chunk
     */
    void add_edge(
        const std::string& from_id,
        const std::string& to_id,
        EdgeType edge_type,
        double weight = 1.0,
        const std::map<std::string, std::string>& metadata = {}
    );

    /**
     * @brief Remove every edge whose type is in @p types
     * @return Number of edges removed
     */
    size_t remove_edges_of_type(const std::set<EdgeType>& types);

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& from_id, const std::string& to_id) const;

    const GraphNode* get_node(const std::string& node_id) const;
    const GraphEdge* get_edge(const std::string& from_id, const std::string& to_id) const;

    /**
     * @brief Typed index: id -> record for every node of @p type
     */
    std::map<std::string, EntityRecord> get_nodes_by_type(NodeType type) const;

    /**
     * @brief Ids of every node of @p type, in id order
     */
    const std::set<std::string>& ids_of_type(NodeType type) const;

    /**
     * @brief Targets of edges leaving @p node_id
     */
    std::vector<std::string> successors(const std::string& node_id) const;

    /**
     * @brief Sources of edges entering @p node_id
     */
    std::vector<std::string> predecessors(const std::string& node_id) const;

    std::vector<GraphNode> get_all_nodes() const;
    std::vector<GraphEdge> get_all_edges() const;

    /**
     * @brief Flip a question to answered, recording the resolving decision
     * @return false if @p question_id is not a question node
     */
    bool mark_question_answered(const std::string& question_id, const std::string& decision_id);

    // ==========================================
    // Authority Queries
    // ==========================================

    /**
     * @brief Decision superseding a chunk through an OVERRIDES edge
     *
     * When several decisions override the chunk, the one with the highest
     * edge weight wins.
     */
    std::optional<Decision> get_superseding_decision(const std::string& chunk_id) const;

    /**
     * @brief Chunks a decision overrides, strongest first
     */
    std::vector<Chunk> get_decision_overrides(const std::string& decision_id) const;

    // ==========================================
    // Statistics
    // ==========================================

    GraphStatistics compute_statistics() const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edge_count_; }
    bool empty() const { return nodes_.empty(); }

    void clear();

    // ==========================================
    // Persistence
    // ==========================================

    /**
     * @brief Node-link representation (nodes + links)
     */
    nlohmann::json to_node_link_json() const;

    /**
     * @brief Id -> record map for one type, as written to <type>_nodes.json
     */
    nlohmann::json index_to_json(NodeType type) const;

    /**
     * @brief Write graph.json and the six <type>_nodes.json files
     * @throws std::runtime_error if a file cannot be written
     */
    void save(const std::string& directory) const;

    /**
     * @brief Load a graph persisted by save()
     *
     * A directory without graph.json yields an empty graph.
     *
     * @throws std::runtime_error on malformed or inconsistent data
     */
    static ContextGraph load(const std::string& directory);

    /**
     * @brief Rebuild a graph from node-link JSON and per-type indices
     * @throws std::runtime_error on malformed or inconsistent data
     */
    static ContextGraph from_json(
        const nlohmann::json& node_link,
        const std::map<NodeType, nlohmann::json>& indices
    );

    /**
     * @brief Cosine similarity, 0 for empty, mismatched or zero vectors
     */
    static double cosine_similarity(
        const std::vector<float>& vec1,
        const std::vector<float>& vec2
    );

private:
    std::map<std::string, GraphNode> nodes_;                                   // id -> node
    std::map<std::string, std::map<std::string, GraphEdge>> out_edges_;        // source -> target -> edge
    std::map<std::string, std::set<std::string>> in_edges_;                    // target -> sources
    std::map<NodeType, std::set<std::string>> type_index_;                     // type -> ids
    size_t edge_count_ = 0;
};

} // namespace cg

#endif // CONTEXT_GRAPH_HPP
