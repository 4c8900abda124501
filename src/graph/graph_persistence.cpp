#include "graph/context_graph.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cg {

namespace {

const char* GRAPH_FILE = "graph.json";

std::string index_file_name(NodeType type) {
    return node_type_name(type) + "_nodes.json";
}

// Invalid UTF-8 in a record is written as U+FFFD instead of failing the save
std::string serialize(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Write to a sibling temp file, then rename over the target
void write_file_atomically(const fs::path& path, const std::string& content) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + tmp_path.string());
        }
        file << content;
        file.close();
        if (!file) {
            throw std::runtime_error("Failed to write file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + reason);
    }
}

nlohmann::json read_json_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

} // anonymous namespace

nlohmann::json ContextGraph::to_node_link_json() const {
    nlohmann::json j;
    j["directed"] = true;
    j["multigraph"] = false;
    j["graph"] = nlohmann::json::object();

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json links_json = nlohmann::json::array();
    for (const auto& [source, targets] : out_edges_) {
        for (const auto& [target, edge] : targets) {
            links_json.push_back(edge.to_json());
        }
    }
    j["links"] = links_json;

    return j;
}

nlohmann::json ContextGraph::index_to_json(NodeType type) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& id : ids_of_type(type)) {
        j[id] = record_to_json(nodes_.at(id).record);
    }
    return j;
}

void ContextGraph::save(const std::string& directory) const {
    fs::path dir(directory);
    fs::create_directories(dir);

    // Serialize everything before touching any file
    std::vector<std::pair<fs::path, std::string>> files;
    files.emplace_back(dir / GRAPH_FILE, serialize(to_node_link_json()));
    for (NodeType type : all_node_types()) {
        files.emplace_back(dir / index_file_name(type), serialize(index_to_json(type)));
    }

    for (const auto& [path, content] : files) {
        write_file_atomically(path, content);
    }
}

ContextGraph ContextGraph::load(const std::string& directory) {
    fs::path dir(directory);
    fs::path graph_path = dir / GRAPH_FILE;

    // No persisted graph yet: normal first start
    if (!fs::exists(graph_path)) {
        return ContextGraph();
    }

    nlohmann::json node_link = read_json_file(graph_path);

    std::map<NodeType, nlohmann::json> indices;
    for (NodeType type : all_node_types()) {
        fs::path index_path = dir / index_file_name(type);
        if (fs::exists(index_path)) {
            indices[type] = read_json_file(index_path);
        }
    }

    return from_json(node_link, indices);
}

ContextGraph ContextGraph::from_json(
    const nlohmann::json& node_link,
    const std::map<NodeType, nlohmann::json>& indices
) {
    ContextGraph graph;

    if (!node_link.is_object() || !node_link.contains("nodes") || !node_link["nodes"].is_array()) {
        throw std::runtime_error("Malformed graph: missing node list");
    }

    for (const auto& [type, index] : indices) {
        if (!index.is_object()) {
            throw std::runtime_error(
                "Malformed index for " + node_type_name(type) + ": expected an object"
            );
        }
    }

    try {
        for (const auto& node_json : node_link["nodes"]) {
            std::string id = node_json.at("id").get<std::string>();
            std::string type_name = node_json.at("node_type").get<std::string>();

            auto type = node_type_from_name(type_name);
            if (!type) {
                throw std::runtime_error("Node " + id + " has unknown type " + type_name);
            }

            auto index_it = indices.find(*type);
            if (index_it == indices.end() || !index_it->second.contains(id)) {
                throw std::runtime_error(
                    "Node " + id + " has no record in the " + type_name + " index"
                );
            }

            std::vector<float> embedding;
            if (node_json.contains("embedding") && !node_json["embedding"].is_null()) {
                embedding = node_json["embedding"].get<std::vector<float>>();
            }

            EntityRecord record = record_from_json(*type, index_it->second.at(id));
            if (!graph.add_node(id, std::move(record), std::move(embedding))) {
                throw std::runtime_error("Duplicate node id: " + id);
            }
        }

        for (const auto& [type, index] : indices) {
            for (const auto& [id, record] : index.items()) {
                const GraphNode* node = graph.get_node(id);
                if (!node || node->type() != type) {
                    throw std::runtime_error(
                        "Index record " + id + " (" + node_type_name(type) + ") has no graph node"
                    );
                }
            }
        }

        const char* links_key = node_link.contains("links") ? "links" : "edges";
        if (node_link.contains(links_key)) {
            for (const auto& edge_json : node_link[links_key]) {
                GraphEdge edge = GraphEdge::from_json(edge_json);
                graph.add_edge(edge.source, edge.target, edge.edge_type, edge.weight, edge.metadata);
            }
        }
    } catch (const std::runtime_error&) {
        throw;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Malformed graph: ") + e.what());
    }

    return graph;
}

} // namespace cg
