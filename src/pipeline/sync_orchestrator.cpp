#include "pipeline/sync_orchestrator.hpp"
#include "pipeline/roadmap_parser.hpp"
#include "util/text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace cg {

namespace {

std::string json_string(const json& j, const std::string& key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

// Lowercased roadmap item name -> ids
std::map<std::string, std::vector<std::string>> roadmap_names(const ContextGraph& graph) {
    std::map<std::string, std::vector<std::string>> names;
    for (const auto& id : graph.ids_of_type(NodeType::RoadmapItem)) {
        const GraphNode* node = graph.get_node(id);
        if (!node) continue;
        if (const auto* item = record_as<RoadmapItem>(node->record)) {
            names[to_lower(item->name)].push_back(id);
        }
    }
    return names;
}

std::vector<std::string> matching_items(
    const std::map<std::string, std::vector<std::string>>& names,
    const std::vector<std::string>& wanted
) {
    std::vector<std::string> ids;
    for (const auto& name : wanted) {
        auto it = names.find(to_lower(name));
        if (it == names.end()) continue;
        for (const auto& id : it->second) {
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
                ids.push_back(id);
            }
        }
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// SyncReport
// ============================================================================

void SyncReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Context Graph Sync Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Nodes Added:\n";
    std::cout << "  Roadmap items: " << roadmap_items_added << "\n";
    std::cout << "  Questions: " << questions_added << "\n";
    std::cout << "  Decisions: " << decisions_added << "\n";
    std::cout << "  Assessments: " << assessments_added << "\n";
    std::cout << "  Gaps: " << gaps_added << "\n";
    std::cout << "  Chunks: " << chunks_added << "\n\n";

    std::cout << "Structural Edges:\n";
    std::cout << "  RESOLVES: " << resolves_edges << "\n";
    std::cout << "  IMPACTS: " << impacts_edges << "\n";
    std::cout << "  ABOUT_ITEM: " << about_item_edges << "\n";
    std::cout << "  IDENTIFIES_GAP: " << identifies_gap_edges << "\n";
    std::cout << "  Questions answered: " << questions_answered << "\n\n";

    std::cout << "Semantic Edges:\n";
    std::cout << "  Chunks scanned: " << inference.chunks_scanned << "\n";
    std::cout << "  Chunks without embeddings: " << inference.chunks_skipped << "\n";
    std::cout << "  SUPPORTED_BY: " << inference.supported_by_edges << "\n";
    std::cout << "  MENTIONED_IN: " << inference.mentioned_in_edges << "\n";
    std::cout << "  OVERRIDES: " << inference.overrides_edges << "\n\n";

    std::cout << "Embeddings:\n";
    std::cout << "  Texts embedded: " << texts_embedded << "\n";
    std::cout << "  Nodes without embeddings: " << nodes_without_embeddings << "\n\n";

    std::cout << "Final Graph:\n";
    std::cout << "  Nodes: " << final_nodes << "\n";
    std::cout << "  Edges: " << final_edges << "\n";
    std::cout << "  Persisted: " << (persisted ? "yes" : "no") << "\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";

    if (!stage_errors.empty()) {
        std::cout << "\nFailed Stages:\n";
        for (const auto& [stage, message] : stage_errors) {
            std::cout << "  " << stage << ": " << message << "\n";
        }
    }

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json SyncReport::to_json() const {
    json j;

    j["roadmap_items_added"] = roadmap_items_added;
    j["questions_added"] = questions_added;
    j["decisions_added"] = decisions_added;
    j["assessments_added"] = assessments_added;
    j["gaps_added"] = gaps_added;
    j["chunks_added"] = chunks_added;

    j["resolves_edges"] = resolves_edges;
    j["impacts_edges"] = impacts_edges;
    j["about_item_edges"] = about_item_edges;
    j["identifies_gap_edges"] = identifies_gap_edges;
    j["questions_answered"] = questions_answered;

    j["texts_embedded"] = texts_embedded;
    j["nodes_without_embeddings"] = nodes_without_embeddings;
    j["inference"] = inference.to_json();

    j["final_nodes"] = final_nodes;
    j["final_edges"] = final_edges;
    j["persisted"] = persisted;
    j["total_time_seconds"] = total_time_seconds;

    j["stage_errors"] = json::array();
    for (const auto& [stage, message] : stage_errors) {
        j["stage_errors"].push_back({{"stage", stage}, {"error", message}});
    }

    return j;
}

// ============================================================================
// SyncOrchestrator
// ============================================================================

SyncOrchestrator::SyncOrchestrator(
    const SyncConfig& config,
    KnowledgeSources& sources,
    EmbeddingProvider* embedder
) : config_(config), sources_(sources), embedder_(embedder) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

void SyncOrchestrator::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

SyncReport SyncOrchestrator::sync(ContextGraph& graph) {
    auto start_time = std::chrono::high_resolution_clock::now();
    report_ = SyncReport();
    warned_no_embedder_ = false;

    if (config_.verbose) {
        std::cout << "Syncing unified context graph...\n";
    }

    run_stage("roadmap", [&]() { sync_roadmap(graph); });
    run_stage("questions", [&]() { sync_questions(graph); });
    run_stage("decisions", [&]() { sync_decisions(graph); });
    run_stage("architecture_assessment", [&]() { sync_architecture_assessment(graph); });
    run_stage("competitive_assessments", [&]() { sync_competitive_assessments(graph); });
    run_stage("chunks", [&]() { sync_chunks(graph); });
    run_stage("semantic_edges", [&]() { infer_semantic_edges(graph); });

    report_.final_nodes = static_cast<int>(graph.num_nodes());
    report_.final_edges = static_cast<int>(graph.num_edges());

    auto end_time = std::chrono::high_resolution_clock::now();
    report_.total_time_seconds = std::chrono::duration<double>(end_time - start_time).count();

    return report_;
}

ContextGraph SyncOrchestrator::run() {
    auto start_time = std::chrono::high_resolution_clock::now();

    ContextGraph graph;
    if (config_.full_rebuild) {
        if (config_.verbose) {
            std::cout << "Full rebuild: starting from an empty graph\n";
        }
    } else {
        graph = ContextGraph::load(config_.graph_directory);
        if (config_.verbose) {
            std::cout << "Loaded graph from " << config_.graph_directory << ": "
                      << graph.num_nodes() << " nodes, " << graph.num_edges() << " edges\n";
        }
    }

    sync(graph);

    run_stage("persist", [&]() {
        graph.save(config_.graph_directory);
        report_.persisted = true;
        if (config_.verbose) {
            std::cout << "Saved graph to " << config_.graph_directory << "\n";
        }
    });

    auto end_time = std::chrono::high_resolution_clock::now();
    report_.total_time_seconds = std::chrono::duration<double>(end_time - start_time).count();

    return graph;
}

void SyncOrchestrator::run_stage(const std::string& stage, const std::function<void()>& body) {
    try {
        body();
    } catch (const std::exception& e) {
        std::cerr << "Warning: sync stage '" << stage << "' failed: " << e.what() << "\n";
        report_.stage_errors.emplace_back(stage, e.what());
    }
}

bool SyncOrchestrator::is_new_node(const ContextGraph& graph, const std::string& id, NodeType type) const {
    if (id.empty()) {
        if (config_.verbose) {
            std::cerr << "Warning: skipping " << node_type_name(type) << " without an id\n";
        }
        return false;
    }
    const GraphNode* existing = graph.get_node(id);
    if (!existing) {
        return true;
    }
    if (existing->type() != type) {
        std::cerr << "Warning: id '" << id << "' already used by a "
                  << node_type_name(existing->type()) << " node, skipping "
                  << node_type_name(type) << "\n";
    }
    return false;
}

std::vector<std::vector<float>> SyncOrchestrator::embed_texts(
    const std::vector<std::string>& texts,
    const std::string& stage
) {
    if (texts.empty()) {
        return {};
    }

    if (!embedder_) {
        if (!warned_no_embedder_) {
            std::cerr << "Warning: no embedding provider configured; "
                      << "nodes are added without embeddings and get no semantic edges\n";
            warned_no_embedder_ = true;
        }
        report_.nodes_without_embeddings += static_cast<int>(texts.size());
        return {};
    }

    if (config_.verbose) {
        std::cout << "Generating embeddings for " << texts.size() << " " << stage << "...\n";
    }

    EmbeddingResponse response = embed_in_batches(
        *embedder_, texts, static_cast<size_t>(config_.embedding_batch_size)
    );
    if (!response.success) {
        throw std::runtime_error("Embedding failed: " + response.error_message);
    }
    if (response.vectors.size() != texts.size()) {
        throw std::runtime_error(
            "Embedding returned " + std::to_string(response.vectors.size()) +
            " vectors for " + std::to_string(texts.size()) + " texts"
        );
    }

    report_.texts_embedded += static_cast<int>(texts.size());
    return std::move(response.vectors);
}

// ==========================================
// Stage 1: Roadmap Items
// ==========================================

void SyncOrchestrator::sync_roadmap(ContextGraph& graph) {
    auto roadmap_text = sources_.load_roadmap_text();
    if (!roadmap_text) {
        if (config_.verbose) {
            std::cout << "No roadmap found, skipping roadmap items\n";
        }
        return;
    }

    std::vector<RoadmapItem> new_items;
    std::vector<std::string> texts;
    for (auto& item : parse_roadmap(*roadmap_text)) {
        if (!is_new_node(graph, item.id, NodeType::RoadmapItem)) continue;
        texts.push_back(item.name + ". " + item.description);
        new_items.push_back(std::move(item));
    }

    auto vectors = embed_texts(texts, "roadmap items");

    for (size_t i = 0; i < new_items.size(); ++i) {
        std::string id = new_items[i].id;
        std::vector<float> embedding = vectors.empty() ? std::vector<float>() : std::move(vectors[i]);
        if (graph.add_node(id, std::move(new_items[i]), std::move(embedding))) {
            report_.roadmap_items_added++;
        }
        report_progress("roadmap", static_cast<int>(i + 1), static_cast<int>(new_items.size()), id);
    }

    if (config_.verbose) {
        std::cout << "Synced " << report_.roadmap_items_added << " roadmap items\n";
    }
}

// ==========================================
// Stage 2: Questions
// ==========================================

void SyncOrchestrator::sync_questions(ContextGraph& graph) {
    auto questions = sources_.load_questions();
    auto names = roadmap_names(graph);

    // Decisions already in the graph, by the question they resolve
    std::map<std::string, std::string> resolving_decisions;
    for (const auto& id : graph.ids_of_type(NodeType::Decision)) {
        const GraphNode* node = graph.get_node(id);
        const Decision* decision = node ? record_as<Decision>(node->record) : nullptr;
        if (decision && !decision->question_id.empty()) {
            resolving_decisions.emplace(decision->question_id, id);
        }
    }

    int current = 0;
    for (auto& question : questions) {
        ++current;
        if (!is_new_node(graph, question.id, NodeType::Question)) continue;

        std::string id = question.id;
        std::vector<std::string> related = question.related_roadmap_items;
        graph.add_node(id, std::move(question));
        report_.questions_added++;

        for (const auto& item_id : matching_items(names, related)) {
            graph.add_edge(id, item_id, EdgeType::AboutItem, 0.8);
            report_.about_item_edges++;
        }

        // A decision synced earlier may already resolve this question
        auto resolver = resolving_decisions.find(id);
        if (resolver != resolving_decisions.end()) {
            graph.add_edge(resolver->second, id, EdgeType::Resolves, 1.0);
            report_.resolves_edges++;
            if (graph.mark_question_answered(id, resolver->second)) {
                report_.questions_answered++;
            }
        }

        report_progress("questions", current, static_cast<int>(questions.size()), id);
    }

    if (config_.verbose) {
        std::cout << "Synced " << report_.questions_added << " questions\n";
    }
}

// ==========================================
// Stage 3: Decisions
// ==========================================

void SyncOrchestrator::sync_decisions(ContextGraph& graph) {
    std::vector<Decision> new_decisions;
    std::vector<std::string> texts;
    for (auto& decision : sources_.load_decisions()) {
        if (!is_new_node(graph, decision.id, NodeType::Decision)) continue;
        // Two entries with the same id in one store: first wins
        bool duplicate = std::any_of(new_decisions.begin(), new_decisions.end(),
            [&](const Decision& d) { return d.id == decision.id; });
        if (duplicate) continue;
        texts.push_back(decision.decision + ". " + decision.rationale);
        new_decisions.push_back(std::move(decision));
    }

    auto vectors = embed_texts(texts, "decisions");
    auto names = roadmap_names(graph);

    for (size_t i = 0; i < new_decisions.size(); ++i) {
        Decision& decision = new_decisions[i];
        std::string id = decision.id;
        std::string question_id = decision.question_id;
        std::vector<std::string> related = decision.related_roadmap_items;
        std::vector<float> embedding = vectors.empty() ? std::vector<float>() : std::move(vectors[i]);

        graph.add_node(id, std::move(decision), std::move(embedding));
        report_.decisions_added++;

        if (!question_id.empty()) {
            const GraphNode* question = graph.get_node(question_id);
            if (question && question->type() == NodeType::Question) {
                graph.add_edge(id, question_id, EdgeType::Resolves, 1.0);
                report_.resolves_edges++;
                if (graph.mark_question_answered(question_id, id)) {
                    report_.questions_answered++;
                }
            } else if (config_.verbose) {
                std::cerr << "Warning: decision " << id << " resolves unknown question "
                          << question_id << "\n";
            }
        }

        for (const auto& item_id : matching_items(names, related)) {
            graph.add_edge(id, item_id, EdgeType::Impacts, 1.0);
            report_.impacts_edges++;
        }

        report_progress("decisions", static_cast<int>(i + 1), static_cast<int>(new_decisions.size()), id);
    }

    if (config_.verbose) {
        std::cout << "Synced " << report_.decisions_added << " decisions\n";
    }
}

// ==========================================
// Stage 4: Assessments
// ==========================================

void SyncOrchestrator::integrate_assessment(
    ContextGraph& graph,
    const std::string& id,
    const std::string& type,
    const std::string& summary,
    const json& payload
) {
    Assessment assessment;
    assessment.id = id;
    assessment.type = type;
    assessment.summary = summary;
    assessment.data = payload;

    graph.add_node(id, std::move(assessment));
    report_.assessments_added++;

    const json* gaps = nullptr;
    if (payload.contains("analysis") && payload["analysis"].is_object()) {
        const json& analysis = payload["analysis"];
        if (analysis.contains("roadmap_gaps") && analysis["roadmap_gaps"].is_array()) {
            gaps = &analysis["roadmap_gaps"];
        }
    }
    if (!gaps) return;

    for (size_t i = 0; i < gaps->size(); ++i) {
        const json& gap_data = (*gaps)[i];

        Gap gap;
        gap.id = "gap_" + id + "_" + std::to_string(i);
        gap.type = type;
        gap.identified_by = id;
        if (gap_data.is_object()) {
            if (gap_data.contains("gap_description")) {
                gap.description = json_string(gap_data, "gap_description");
            } else if (gap_data.contains("gap")) {
                gap.description = json_string(gap_data, "gap");
            } else {
                gap.description = json_string(gap_data, "description");
            }
            std::string severity = json_string(gap_data, "severity");
            if (!severity.empty()) gap.severity = severity;
        } else if (gap_data.is_string()) {
            gap.description = gap_data.get<std::string>();
        }

        std::string gap_id = gap.id;
        if (!is_new_node(graph, gap_id, NodeType::Gap)) continue;
        graph.add_node(gap_id, std::move(gap));
        graph.add_edge(id, gap_id, EdgeType::IdentifiesGap, 0.9);
        report_.gaps_added++;
        report_.identifies_gap_edges++;
    }
}

void SyncOrchestrator::sync_architecture_assessment(ContextGraph& graph) {
    auto payload = sources_.load_architecture_assessment();
    if (!payload || payload->empty()) {
        return;
    }

    std::string id = json_string(*payload, "id");
    if (id.empty()) {
        id = "arch_alignment_001";
        (*payload)["id"] = id;
    }

    if (!is_new_node(graph, id, NodeType::Assessment)) return;

    integrate_assessment(graph, id, "architecture", utf8_prefix(payload->dump(), 200), *payload);
    report_progress("assessments", 1, 1, id);
}

void SyncOrchestrator::sync_competitive_assessments(ContextGraph& graph) {
    auto assessments = sources_.load_competitive_assessments();

    int current = 0;
    for (const auto& payload : assessments) {
        ++current;
        std::string id = json_string(payload, "id");
        if (id.empty()) continue;
        if (!is_new_node(graph, id, NodeType::Assessment)) continue;

        std::string summary;
        if (payload.contains("analysis") && payload["analysis"].is_object()) {
            summary = utf8_prefix(json_string(payload["analysis"], "executive_summary"), 200);
        }

        integrate_assessment(graph, id, "competitive", summary, payload);
        report_progress("assessments", current, static_cast<int>(assessments.size()), id);
    }

    if (config_.verbose) {
        std::cout << "Synced " << report_.assessments_added << " assessments with "
                  << report_.gaps_added << " gaps\n";
    }
}

// ==========================================
// Stage 5: Chunks
// ==========================================

void SyncOrchestrator::sync_chunks(ContextGraph& graph) {
    if (config_.verbose) {
        std::cout << "Syncing chunks from vector store...\n";
    }

    auto rows = sources_.load_chunks();

    int current = 0;
    for (auto& row : rows) {
        ++current;
        std::string id = row.chunk.id;
        if (!is_new_node(graph, id, NodeType::Chunk)) continue;

        if (row.vector.empty()) {
            report_.nodes_without_embeddings++;
        }
        graph.add_node(id, std::move(row.chunk), std::move(row.vector));
        report_.chunks_added++;

        if (current % 100 == 0 || current == static_cast<int>(rows.size())) {
            report_progress("chunks", current, static_cast<int>(rows.size()));
        }
    }

    if (config_.verbose) {
        std::cout << "Synced " << report_.chunks_added << " chunks\n";
    }
}

// ==========================================
// Stage 6: Semantic Edges
// ==========================================

void SyncOrchestrator::infer_semantic_edges(ContextGraph& graph) {
    if (config_.verbose) {
        std::cout << "Creating semantic edges for "
                  << graph.ids_of_type(NodeType::Chunk).size() << " chunks...\n";
    }

    SemanticEdgeInferencer inferencer(config_.thresholds);
    inferencer.set_verbose(config_.verbose);
    report_.inference = inferencer.infer(graph);
}

void SyncOrchestrator::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

} // namespace cg
