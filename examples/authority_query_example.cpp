#include "graph/context_graph.hpp"
#include "graph/semantic_edges.hpp"
#include "retrieval/authority_retrieval.hpp"
#include "retrieval/traversal.hpp"
#include <iostream>

using namespace cg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

int main() {
    print_separator("Unified Context Graph - Authority Query Example");

    ContextGraph graph;

    // Toy 3-dimensional embeddings: axis 0 = storage, axis 1 = search, axis 2 = UI
    RoadmapItem audit;
    audit.id = "ri_audit_log";
    audit.name = "Audit Log";
    audit.description = "Record every storage change for compliance";
    audit.horizon = "now";
    graph.add_node(audit.id, audit, {0.9f, 0.1f, 0.0f});

    RoadmapItem search;
    search.id = "ri_search";
    search.name = "Search";
    search.description = "Full text search across documents";
    search.horizon = "next";
    graph.add_node(search.id, search, {0.0f, 1.0f, 0.0f});

    Question question;
    question.id = "q_001";
    question.question = "Which storage engine backs the audit log?";
    question.related_roadmap_items = {"Audit Log"};
    graph.add_node(question.id, question);

    Decision decision;
    decision.id = "dec_001";
    decision.decision = "Use Postgres for all storage";
    decision.rationale = "The team already operates it";
    decision.question_id = question.id;
    graph.add_node(decision.id, decision, {1.0f, 0.0f, 0.0f});

    graph.add_edge(decision.id, question.id, EdgeType::Resolves, 1.0);
    graph.add_edge(decision.id, audit.id, EdgeType::Impacts, 1.0);
    graph.add_edge(question.id, audit.id, EdgeType::AboutItem, 0.8);
    graph.mark_question_answered(question.id, decision.id);

    Chunk mysql;
    mysql.id = "chunk_001";
    mysql.content = "Early design notes proposed MySQL as the storage layer";
    mysql.lens = "engineering";
    mysql.source_name = "design-notes.md";
    graph.add_node(mysql.id, mysql, {0.85f, 0.3f, 0.0f});

    Chunk facets;
    facets.id = "chunk_002";
    facets.content = "Customers asked for search facets";
    facets.lens = "customer";
    facets.source_name = "interviews.md";
    graph.add_node(facets.id, facets, {0.1f, 0.95f, 0.1f});

    std::cout << "Built graph with " << graph.num_nodes() << " nodes and "
              << graph.num_edges() << " structural edges\n";

    // Semantic edges
    print_separator("Semantic Edge Inference");

    SemanticEdgeInferencer inferencer;
    InferenceStatistics stats = inferencer.infer(graph);
    std::cout << "SUPPORTED_BY: " << stats.supported_by_edges << "\n";
    std::cout << "MENTIONED_IN: " << stats.mentioned_in_edges << "\n";
    std::cout << "OVERRIDES: " << stats.overrides_edges << "\n";

    if (auto superseding = graph.get_superseding_decision(mysql.id)) {
        std::cout << mysql.id << " is superseded by " << superseding->id
                  << ": " << superseding->decision << "\n";
    }

    // Retrieval
    print_separator("Authority-Ordered Brief for 'storage'");

    AuthorityResults results = retrieve_with_authority("storage", graph);
    std::cout << format_context_with_authority(results) << "\n";

    // Traversal
    print_separator("Two-Hop Traversal from " + decision.id);

    TraversalResult traversal = traverse(graph, {decision.id});
    for (const auto& [type, nodes] : traversal.by_type) {
        for (const auto& node : nodes) {
            std::cout << "  [hop " << node.hop << "] " << node_type_name(type) << " " << node.id << "\n";
        }
    }

    graph.compute_statistics().print_summary();

    return 0;
}
