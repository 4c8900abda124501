#include "graph/context_graph.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace cg {

// ==========================================
// EdgeType
// ==========================================

std::string edge_type_name(EdgeType type) {
    switch (type) {
        case EdgeType::Resolves: return "RESOLVES";
        case EdgeType::Impacts: return "IMPACTS";
        case EdgeType::IdentifiesGap: return "IDENTIFIES_GAP";
        case EdgeType::AboutItem: return "ABOUT_ITEM";
        case EdgeType::SupportedBy: return "SUPPORTED_BY";
        case EdgeType::MentionedIn: return "MENTIONED_IN";
        case EdgeType::Overrides: return "OVERRIDES";
    }
    return "UNKNOWN";
}

std::optional<EdgeType> edge_type_from_name(const std::string& name) {
    static const EdgeType all_types[] = {
        EdgeType::Resolves, EdgeType::Impacts, EdgeType::IdentifiesGap,
        EdgeType::AboutItem, EdgeType::SupportedBy, EdgeType::MentionedIn,
        EdgeType::Overrides
    };
    for (EdgeType type : all_types) {
        if (edge_type_name(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

bool is_semantic_edge(EdgeType type) {
    return type == EdgeType::SupportedBy ||
           type == EdgeType::MentionedIn ||
           type == EdgeType::Overrides;
}

// ==========================================
// GraphNode / GraphEdge
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["node_type"] = node_type_name(type());
    if (!embedding.empty()) {
        j["embedding"] = embedding;
    }
    return j;
}

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["edge_type"] = edge_type_name(edge_type);
    j["weight"] = weight;
    j["metadata"] = metadata;
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();

    std::string type_name = j.at("edge_type").get<std::string>();
    auto type = edge_type_from_name(type_name);
    if (!type) {
        throw std::invalid_argument("Unknown edge type: " + type_name);
    }
    edge.edge_type = *type;
    edge.weight = j.value("weight", 1.0);

    if (j.contains("metadata") && j["metadata"].is_object()) {
        for (const auto& [key, value] : j["metadata"].items()) {
            edge.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    return edge;
}

// ==========================================
// GraphStatistics
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["nodes_by_type"] = nodes_by_type;
    j["edges_by_type"] = edges_by_type;
    j["active_decisions"] = active_decisions;
    j["answered_questions"] = answered_questions;
    j["pending_questions"] = pending_questions;
    return j;
}

void GraphStatistics::print_summary() const {
    std::cout << "Unified Context Graph Statistics\n\n";
    std::cout << "Total nodes: " << num_nodes << "\n";
    std::cout << "Total edges: " << num_edges << "\n";

    std::cout << "\nNodes by Type:\n";
    for (const auto& [type, count] : nodes_by_type) {
        std::cout << "  " << type << ": " << count << "\n";
    }

    std::cout << "\nEdges by Type:\n";
    if (edges_by_type.empty()) {
        std::cout << "  (no edges)\n";
    }
    for (const auto& [type, count] : edges_by_type) {
        std::cout << "  " << type << ": " << count << "\n";
    }

    auto count_of = [this](const std::string& type) -> size_t {
        auto it = nodes_by_type.find(type);
        return it != nodes_by_type.end() ? it->second : 0;
    };

    std::cout << "\nAuthority Coverage:\n";
    std::cout << "  Active decisions (L1): " << active_decisions << "\n";
    std::cout << "  Answered questions (L2): " << answered_questions << "\n";
    std::cout << "  Assessments (L3): " << count_of("assessment") << "\n";
    std::cout << "  Roadmap items (L4): " << count_of("roadmap_item") << "\n";
    std::cout << "  Gaps (L5): " << count_of("gap") << "\n";
    std::cout << "  Chunks (L6): " << count_of("chunk") << "\n";
    std::cout << "  Pending questions (L7): " << pending_questions << "\n";
}

// ==========================================
// ContextGraph: Node and Edge Management
// ==========================================

bool ContextGraph::add_node(
    const std::string& id,
    EntityRecord record,
    std::vector<float> embedding
) {
    if (id.empty()) {
        throw std::invalid_argument("Node id must not be empty");
    }

    NodeType type = node_type_of(record);

    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        if (it->second.type() != type) {
            throw std::invalid_argument(
                "Node " + id + " already exists as " + node_type_name(it->second.type()) +
                ", cannot add it as " + node_type_name(type)
            );
        }
        return false;
    }

    set_record_id(record, id);

    GraphNode node;
    node.id = id;
    node.record = std::move(record);
    node.embedding = std::move(embedding);

    nodes_.emplace(id, std::move(node));
    type_index_[type].insert(id);

    return true;
}

void ContextGraph::add_edge(
    const std::string& from_id,
    const std::string& to_id,
    EdgeType edge_type,
    double weight,
    const std::map<std::string, std::string>& metadata
) {
    const GraphNode* from = get_node(from_id);
    const GraphNode* to = get_node(to_id);

    if (!from) {
        throw std::invalid_argument("Edge source does not exist: " + from_id);
    }
    if (!to) {
        throw std::invalid_argument("Edge target does not exist: " + to_id);
    }

    if (edge_type == EdgeType::Overrides &&
        (from->type() != NodeType::Decision || to->type() != NodeType::Chunk)) {
        throw std::invalid_argument(
            "OVERRIDES must run from a decision to a chunk, got " +
            node_type_name(from->type()) + " -> " + node_type_name(to->type())
        );
    }

    GraphEdge edge;
    edge.source = from_id;
    edge.target = to_id;
    edge.edge_type = edge_type;
    edge.weight = weight;
    edge.metadata = metadata;

    auto& targets = out_edges_[from_id];
    if (targets.find(to_id) == targets.end()) {
        ++edge_count_;
    }
    targets[to_id] = std::move(edge);
    in_edges_[to_id].insert(from_id);
}

size_t ContextGraph::remove_edges_of_type(const std::set<EdgeType>& types) {
    size_t removed = 0;

    for (auto& [source, targets] : out_edges_) {
        for (auto it = targets.begin(); it != targets.end();) {
            if (types.count(it->second.edge_type) > 0) {
                in_edges_[it->first].erase(source);
                it = targets.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    edge_count_ -= removed;
    return removed;
}

bool ContextGraph::has_node(const std::string& node_id) const {
    return nodes_.find(node_id) != nodes_.end();
}

bool ContextGraph::has_edge(const std::string& from_id, const std::string& to_id) const {
    return get_edge(from_id, to_id) != nullptr;
}

const GraphNode* ContextGraph::get_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const GraphEdge* ContextGraph::get_edge(const std::string& from_id, const std::string& to_id) const {
    auto it = out_edges_.find(from_id);
    if (it == out_edges_.end()) {
        return nullptr;
    }
    auto edge_it = it->second.find(to_id);
    return edge_it != it->second.end() ? &edge_it->second : nullptr;
}

std::map<std::string, EntityRecord> ContextGraph::get_nodes_by_type(NodeType type) const {
    std::map<std::string, EntityRecord> result;
    for (const auto& id : ids_of_type(type)) {
        result.emplace(id, nodes_.at(id).record);
    }
    return result;
}

const std::set<std::string>& ContextGraph::ids_of_type(NodeType type) const {
    static const std::set<std::string> no_ids;
    auto it = type_index_.find(type);
    return it != type_index_.end() ? it->second : no_ids;
}

std::vector<std::string> ContextGraph::successors(const std::string& node_id) const {
    std::vector<std::string> result;
    auto it = out_edges_.find(node_id);
    if (it != out_edges_.end()) {
        for (const auto& [target, edge] : it->second) {
            result.push_back(target);
        }
    }
    return result;
}

std::vector<std::string> ContextGraph::predecessors(const std::string& node_id) const {
    auto it = in_edges_.find(node_id);
    if (it == in_edges_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<GraphNode> ContextGraph::get_all_nodes() const {
    std::vector<GraphNode> result;
    result.reserve(nodes_.size());

    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }

    return result;
}

std::vector<GraphEdge> ContextGraph::get_all_edges() const {
    std::vector<GraphEdge> result;
    result.reserve(edge_count_);

    for (const auto& [source, targets] : out_edges_) {
        for (const auto& [target, edge] : targets) {
            result.push_back(edge);
        }
    }

    return result;
}

bool ContextGraph::mark_question_answered(const std::string& question_id, const std::string& decision_id) {
    auto it = nodes_.find(question_id);
    if (it == nodes_.end()) {
        return false;
    }

    Question* question = record_as<Question>(it->second.record);
    if (!question) {
        return false;
    }

    question->status = "answered";
    question->answered_by_decision = decision_id;
    return true;
}

// ==========================================
// Authority Queries
// ==========================================

std::optional<Decision> ContextGraph::get_superseding_decision(const std::string& chunk_id) const {
    const GraphEdge* strongest = nullptr;

    for (const auto& source : predecessors(chunk_id)) {
        const GraphEdge* edge = get_edge(source, chunk_id);
        if (edge && edge->edge_type == EdgeType::Overrides) {
            if (!strongest || edge->weight > strongest->weight) {
                strongest = edge;
            }
        }
    }

    if (!strongest) {
        return std::nullopt;
    }

    const Decision* decision = record_as<Decision>(nodes_.at(strongest->source).record);
    if (!decision) {
        return std::nullopt;
    }
    return *decision;
}

std::vector<Chunk> ContextGraph::get_decision_overrides(const std::string& decision_id) const {
    std::vector<const GraphEdge*> overrides;

    auto it = out_edges_.find(decision_id);
    if (it != out_edges_.end()) {
        for (const auto& [target, edge] : it->second) {
            if (edge.edge_type == EdgeType::Overrides) {
                overrides.push_back(&edge);
            }
        }
    }

    std::stable_sort(overrides.begin(), overrides.end(),
        [](const GraphEdge* a, const GraphEdge* b) { return a->weight > b->weight; });

    std::vector<Chunk> chunks;
    for (const auto* edge : overrides) {
        if (const Chunk* chunk = record_as<Chunk>(nodes_.at(edge->target).record)) {
            chunks.push_back(*chunk);
        }
    }

    return chunks;
}

// ==========================================
// Statistics
// ==========================================

GraphStatistics ContextGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_edges = edge_count_;

    for (NodeType type : all_node_types()) {
        stats.nodes_by_type[node_type_name(type)] = ids_of_type(type).size();
    }

    for (const auto& [source, targets] : out_edges_) {
        for (const auto& [target, edge] : targets) {
            stats.edges_by_type[edge_type_name(edge.edge_type)]++;
        }
    }

    for (const auto& id : ids_of_type(NodeType::Decision)) {
        const Decision* decision = record_as<Decision>(nodes_.at(id).record);
        if (decision && decision->status == "active") {
            stats.active_decisions++;
        }
    }

    for (const auto& id : ids_of_type(NodeType::Question)) {
        const Question* question = record_as<Question>(nodes_.at(id).record);
        if (!question) continue;
        if (question->is_answered()) {
            stats.answered_questions++;
        } else if (question->status == "pending") {
            stats.pending_questions++;
        }
    }

    return stats;
}

void ContextGraph::clear() {
    nodes_.clear();
    out_edges_.clear();
    in_edges_.clear();
    type_index_.clear();
    edge_count_ = 0;
}

double ContextGraph::cosine_similarity(
    const std::vector<float>& vec1,
    const std::vector<float>& vec2
) {
    if (vec1.size() != vec2.size() || vec1.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm1 = 0.0;
    double norm2 = 0.0;

    for (size_t i = 0; i < vec1.size(); ++i) {
        dot_product += static_cast<double>(vec1[i]) * vec2[i];
        norm1 += static_cast<double>(vec1[i]) * vec1[i];
        norm2 += static_cast<double>(vec2[i]) * vec2[i];
    }

    if (norm1 == 0.0 || norm2 == 0.0) {
        return 0.0;
    }

    return dot_product / (std::sqrt(norm1) * std::sqrt(norm2));
}

} // namespace cg
