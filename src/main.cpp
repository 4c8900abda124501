#include "cli/cli.hpp"
#include "graph/authority.hpp"
#include "graph/context_graph.hpp"
#include "llm/embedding_provider.hpp"
#include "pipeline/knowledge_sources.hpp"
#include "pipeline/sync_config.hpp"
#include "pipeline/sync_orchestrator.hpp"
#include "pipeline/sync_status.hpp"
#include "retrieval/authority_retrieval.hpp"
#include "retrieval/traversal.hpp"
#include "util/text_utils.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace cg;

// ============== Helper Functions ==============

// Config from --config (or the fallback chain), with command-line overrides
SyncConfig load_cli_config(const Args& args) {
    SyncConfig config = load_config_with_fallback(args.get("config").value);
    if (args.has("graph-dir")) {
        config.graph_directory = args.get("graph-dir").value;
    }
    return config;
}

// Embedding provider for the configured service, nullptr without an API key
std::unique_ptr<EmbeddingProvider> create_embedder(const SyncConfig& config) {
    if (config.embedding_api_key.empty()) {
        return nullptr;
    }

    EmbeddingConfig embedding_config;
    embedding_config.api_key = config.embedding_api_key;
    embedding_config.model = config.embedding_model;
    embedding_config.timeout_seconds = config.embedding_timeout_seconds;
    embedding_config.max_retries = config.embedding_max_retries;
    embedding_config.verbose = config.verbose;

    return EmbeddingProviderFactory::create(config.embedding_provider, embedding_config);
}

// Load the persisted graph; false (with a hint) when there is nothing to query
bool load_graph(const SyncConfig& config, ContextGraph& graph) {
    graph = ContextGraph::load(config.graph_directory);
    if (graph.empty()) {
        std::cerr << "Graph at " << config.graph_directory << " is empty. "
                  << "Run 'cg sync' first.\n";
        return false;
    }
    return true;
}

std::string short_text(const nlohmann::json& data, AuthorityCategory category) {
    std::string key;
    switch (category) {
        case AuthorityCategory::Decisions: key = "decision"; break;
        case AuthorityCategory::AnsweredQuestions:
        case AuthorityCategory::PendingQuestions: key = "question"; break;
        case AuthorityCategory::Assessments: key = "summary"; break;
        case AuthorityCategory::RoadmapItems: key = "name"; break;
        case AuthorityCategory::Gaps: key = "description"; break;
        case AuthorityCategory::Chunks: key = "content"; break;
    }
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) return "";
    return utf8_prefix(it->get<std::string>(), 100);
}

AuthorityResults run_query(const Args& args, const SyncConfig& config, const ContextGraph& graph) {
    std::string query = args.require("query");
    int top_k = args.get("top-k").as_int(config.top_k);
    if (top_k <= 0) {
        throw std::invalid_argument("--top-k must be positive");
    }
    std::string mode = args.get("mode", config.retrieval_mode).value;

    std::unique_ptr<EmbeddingProvider> embedder;
    if (mode_uses_embeddings(mode)) {
        embedder = create_embedder(config);
    }
    auto matcher = create_matcher(mode, embedder.get(), config.min_embedding_similarity);

    return retrieve_with_authority(query, graph, *matcher, static_cast<size_t>(top_k));
}

// ============== cg sync ==============
int cmd_sync(const Args& args) {
    SyncConfig config = load_cli_config(args);
    if (args.has("rebuild")) config.full_rebuild = true;
    if (args.has("quiet")) config.verbose = false;

    if (args.has("if-stale") && !config.full_rebuild && !needs_graph_sync(config)) {
        std::cout << "Graph is up to date; nothing to sync.\n";
        return 0;
    }

    auto embedder = create_embedder(config);
    FileKnowledgeSources sources(config);
    SyncOrchestrator orchestrator(config, sources, embedder.get());

    orchestrator.run();
    const SyncReport& report = orchestrator.last_report();

    if (args.has("json")) {
        std::cout << report.to_json().dump(2) << "\n";
    } else {
        report.print_summary();
    }

    return report.succeeded() ? 0 : 1;
}

// ============== cg status ==============
int cmd_status(const Args& args) {
    SyncConfig config = load_cli_config(args);
    SyncStatus status = check_sync_status(config);

    if (args.has("json")) {
        std::cout << status.to_json().dump(2) << "\n";
    } else {
        status.print_summary();
    }

    // Exit code 2 lets scripts tell "stale" from an error
    return status.needs_sync() ? 2 : 0;
}

// ============== cg query ==============
int cmd_query(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    AuthorityResults results = run_query(args, config, graph);

    if (args.has("json")) {
        std::cout << results.to_json().dump(2) << "\n";
        return 0;
    }

    std::cout << "\nFound " << results.total() << " matches for: " << args.require("query") << "\n";
    for (AuthorityCategory category : all_categories()) {
        const auto& matches = results.get(category);
        if (matches.empty()) continue;

        std::cout << "\n[" << authority_rank(category) << "] " << category_title(category)
                  << " (" << matches.size() << ")\n";
        for (const auto& match : matches) {
            std::cout << "  " << match.id << " (" << std::fixed << std::setprecision(2)
                      << match.similarity << ")";
            std::string text = short_text(match.data, category);
            if (!text.empty()) std::cout << ": " << text;
            if (match.is_superseded()) std::cout << " [superseded by " << match.superseded_by << "]";
            std::cout << "\n";
        }
    }

    return 0;
}

// ============== cg brief ==============
int cmd_brief(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    std::string brief = format_context_with_authority(run_query(args, config, graph));

    if (args.has("output")) {
        std::string path = args.get("output").value;
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to write brief: " + path);
        }
        file << brief << "\n";
        std::cout << "Brief written to: " << path << "\n";
    } else {
        std::cout << brief << "\n";
    }

    return 0;
}

// ============== cg stats ==============
int cmd_stats(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    auto stats = graph.compute_statistics();
    if (args.has("json")) {
        std::cout << stats.to_json().dump(2) << "\n";
    } else {
        std::cout << "Graph directory: " << config.graph_directory << "\n";
        stats.print_summary();
    }

    return 0;
}

// ============== cg traverse ==============
int cmd_traverse(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    auto seeds = args.get("seeds").as_list();
    auto topics = args.get("topic").as_list();
    int hops = args.get("hops").as_int(2);

    TraversalResult result = traverse(graph, seeds, topics, hops);

    if (args.has("json")) {
        std::cout << result.to_json().dump(2) << "\n";
        return 0;
    }

    std::cout << "\nVisited " << result.nodes_visited << " nodes in "
              << result.hops_completed << " hops, " << result.total() << " reported\n";
    for (const auto& [type, nodes] : result.by_type) {
        std::cout << "\n" << node_type_name(type) << " (" << nodes.size() << "):\n";
        for (const auto& node : nodes) {
            std::cout << "  [hop " << node.hop << "] " << node.id << "\n";
        }
    }

    return 0;
}

// ============== cg superseded ==============
int cmd_superseded(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    std::string chunk_id = args.require("chunk");
    const GraphNode* node = graph.get_node(chunk_id);
    if (!node || node->type() != NodeType::Chunk) {
        std::cerr << "Unknown chunk: " << chunk_id << "\n";
        return 1;
    }

    auto decision = graph.get_superseding_decision(chunk_id);
    if (!decision) {
        std::cout << "Chunk " << chunk_id << " is not superseded by any decision.\n";
        return 0;
    }

    const GraphEdge* edge = graph.get_edge(decision->id, chunk_id);
    std::cout << "Chunk " << chunk_id << " is superseded by " << decision->id;
    if (edge) std::cout << " (similarity " << std::fixed << std::setprecision(2) << edge->weight << ")";
    std::cout << "\n  Decision: " << decision->decision << "\n";
    if (!decision->rationale.empty()) {
        std::cout << "  Rationale: " << decision->rationale << "\n";
    }

    return 0;
}

// ============== cg overrides ==============
int cmd_overrides(const Args& args) {
    SyncConfig config = load_cli_config(args);
    ContextGraph graph;
    if (!load_graph(config, graph)) return 1;

    std::string decision_id = args.require("decision");
    const GraphNode* node = graph.get_node(decision_id);
    if (!node || node->type() != NodeType::Decision) {
        std::cerr << "Unknown decision: " << decision_id << "\n";
        return 1;
    }

    auto chunks = graph.get_decision_overrides(decision_id);
    std::cout << "Decision " << decision_id << " overrides " << chunks.size() << " chunks\n";
    for (const auto& chunk : chunks) {
        const GraphEdge* edge = graph.get_edge(decision_id, chunk.id);
        std::cout << "  " << chunk.id;
        if (edge) std::cout << " (" << std::fixed << std::setprecision(2) << edge->weight << ")";
        std::cout << " [" << chunk.lens << "] " << chunk.source_name << "\n";
    }

    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("cg", "1.0.0");

    const ArgDef config_arg{"config", "c", "Path to config file (optional)", "", false, false};
    const ArgDef graph_dir_arg{"graph-dir", "g", "Graph directory (overrides config)", "", false, false};
    const ArgDef json_arg{"json", "j", "Print JSON instead of text", "", false, true};

    // cg sync
    cli.register_command({
        "sync",
        "Sync roadmap, questions, decisions, assessments and chunks into the graph",
        {
            config_arg,
            graph_dir_arg,
            {"rebuild", "r", "Rebuild from an empty graph instead of appending", "", false, true},
            {"quiet", "q", "Only print the final report", "", false, true},
            {"if-stale", "s", "Skip the sync when no source changed since the last one", "", false, true},
            json_arg
        },
        cmd_sync
    });

    // cg status
    cli.register_command({
        "status",
        "Report whether any source changed since the graph was last saved",
        {
            config_arg,
            graph_dir_arg,
            json_arg
        },
        cmd_status
    });

    // cg query
    cli.register_command({
        "query",
        "Retrieve matching artifacts grouped by authority",
        {
            {"query", "Q", "Query text", "", true, false},
            {"top-k", "k", "Results per authority category (default: from config)", "", false, false},
            {"mode", "m", "Retrieval mode: keyword or embedding (default: from config)", "", false, false},
            config_arg,
            graph_dir_arg,
            json_arg
        },
        cmd_query
    });

    // cg brief
    cli.register_command({
        "brief",
        "Print the authority-ordered context brief for a query",
        {
            {"query", "Q", "Query text", "", true, false},
            {"top-k", "k", "Results per authority category (default: from config)", "", false, false},
            {"mode", "m", "Retrieval mode: keyword or embedding (default: from config)", "", false, false},
            {"output", "o", "Write the brief to this file", "", false, false},
            config_arg,
            graph_dir_arg
        },
        cmd_brief
    });

    // cg stats
    cli.register_command({
        "stats",
        "Print node and edge counts and authority coverage",
        {
            config_arg,
            graph_dir_arg,
            json_arg
        },
        cmd_stats
    });

    // cg traverse
    cli.register_command({
        "traverse",
        "Multi-hop traversal from seed nodes",
        {
            {"seeds", "s", "Comma-separated seed node ids", "", true, false},
            {"topic", "t", "Comma-separated topic terms to filter results", "", false, false},
            {"hops", "n", "Maximum hops", "2", false, false},
            config_arg,
            graph_dir_arg,
            json_arg
        },
        cmd_traverse
    });

    // cg superseded
    cli.register_command({
        "superseded",
        "Show the decision superseding a chunk",
        {
            {"chunk", "k", "Chunk id", "", true, false},
            config_arg,
            graph_dir_arg
        },
        cmd_superseded
    });

    // cg overrides
    cli.register_command({
        "overrides",
        "List the chunks a decision overrides",
        {
            {"decision", "d", "Decision id", "", true, false},
            config_arg,
            graph_dir_arg
        },
        cmd_overrides
    });

    return cli.run(argc, argv);
}
