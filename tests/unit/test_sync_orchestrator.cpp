#include <gtest/gtest.h>
#include "pipeline/sync_orchestrator.hpp"
#include "test_fakes.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>

using namespace cg;
using cg::testing::FakeEmbeddingProvider;
using cg::testing::FakeKnowledgeSources;
using cg::testing::vector_with_similarity;
namespace fs = std::filesystem;

namespace {

const std::vector<float> DECISION_AXIS = {1.0f, 0.0f, 0.0f};

Question make_question(const std::string& id, const std::string& text,
                       std::vector<std::string> items = {}) {
    Question q;
    q.id = id;
    q.question = text;
    q.related_roadmap_items = std::move(items);
    return q;
}

Decision make_decision(const std::string& id, const std::string& text, const std::string& rationale,
                       const std::string& question_id = "", std::vector<std::string> items = {}) {
    Decision d;
    d.id = id;
    d.decision = text;
    d.rationale = rationale;
    d.question_id = question_id;
    d.related_roadmap_items = std::move(items);
    return d;
}

ChunkRow make_chunk(const std::string& id, const std::string& content, std::vector<float> vector) {
    ChunkRow row;
    row.chunk.id = id;
    row.chunk.content = content;
    row.chunk.lens = "engineering";
    row.vector = std::move(vector);
    return row;
}

} // anonymous namespace

class SyncOrchestratorTest : public ::testing::Test {
protected:
    SyncConfig config;
    FakeKnowledgeSources sources;
    FakeEmbeddingProvider embedder;
    ContextGraph graph;

    void SetUp() override {
        config.verbose = false;
    }

    void populate() {
        sources.roadmap_text =
            "## Now\n"
            "### Audit Log\n"
            "Record every change.\n"
            "### Search\n"
            "Full text search.\n";

        sources.questions = {
            make_question("q_001", "Which database?", {"audit log"}),
            make_question("q_002", "Do we need search facets?", {"Search"})
        };

        sources.decisions = {
            make_decision("D1", "Use Postgres", "Team knows it", "q_001", {"Audit Log"})
        };

        sources.architecture = nlohmann::json{
            {"analysis", {{"roadmap_gaps", {
                {{"gap_description", "No retention policy"}, {"severity", "high"}},
                {{"gap", "No backups"}}
            }}}}
        };

        sources.competitive = {
            {{"id", "comp_acme"}, {"analysis", {
                {"executive_summary", "Acme ships faster"},
                {"roadmap_gaps", {{{"description", "No mobile app"}}}}
            }}},
            {{"analysis", {{"executive_summary", "No id, skipped"}}}}
        };

        // C1 at 0.82 to D1; roadmap items land on the last axis
        sources.chunks = {
            make_chunk("C1", "We will use MySQL", vector_with_similarity(0.82)),
            make_chunk("C2", "Unrelated", {0.0f, 1.0f, 0.0f})
        };

        embedder.vectors["Use Postgres. Team knows it"] = DECISION_AXIS;
    }
};

// ==========================================
// Empty Sources
// ==========================================

TEST_F(SyncOrchestratorTest, EmptySourcesYieldEmptyGraph) {
    SyncOrchestrator orchestrator(config, sources, &embedder);

    SyncReport report;
    ASSERT_NO_THROW(report = orchestrator.sync(graph));

    EXPECT_EQ(graph.num_nodes(), 0);
    EXPECT_EQ(graph.num_edges(), 0);
    EXPECT_TRUE(report.succeeded());
    EXPECT_TRUE(embedder.calls.empty());
}

// ==========================================
// Full Sync
// ==========================================

TEST_F(SyncOrchestratorTest, SyncsEverySource) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.roadmap_items_added, 2);
    EXPECT_EQ(report.questions_added, 2);
    EXPECT_EQ(report.decisions_added, 1);
    EXPECT_EQ(report.assessments_added, 2);
    EXPECT_EQ(report.gaps_added, 3);
    EXPECT_EQ(report.chunks_added, 2);

    EXPECT_TRUE(graph.has_node("ri_audit_log"));
    EXPECT_TRUE(graph.has_node("ri_search"));
    EXPECT_TRUE(graph.has_node("arch_alignment_001"));
    EXPECT_TRUE(graph.has_node("gap_arch_alignment_001_0"));
    EXPECT_TRUE(graph.has_node("gap_arch_alignment_001_1"));
    EXPECT_TRUE(graph.has_node("gap_comp_acme_0"));
    EXPECT_EQ(graph.ids_of_type(NodeType::Assessment).size(), 2);
}

TEST_F(SyncOrchestratorTest, StructuralEdges) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    ASSERT_TRUE(graph.has_edge("D1", "q_001"));
    EXPECT_EQ(graph.get_edge("D1", "q_001")->edge_type, EdgeType::Resolves);
    EXPECT_DOUBLE_EQ(graph.get_edge("D1", "q_001")->weight, 1.0);

    ASSERT_TRUE(graph.has_edge("D1", "ri_audit_log"));
    EXPECT_EQ(graph.get_edge("D1", "ri_audit_log")->edge_type, EdgeType::Impacts);

    ASSERT_TRUE(graph.has_edge("q_001", "ri_audit_log"));
    EXPECT_EQ(graph.get_edge("q_001", "ri_audit_log")->edge_type, EdgeType::AboutItem);
    EXPECT_DOUBLE_EQ(graph.get_edge("q_001", "ri_audit_log")->weight, 0.8);
    EXPECT_TRUE(graph.has_edge("q_002", "ri_search"));

    ASSERT_TRUE(graph.has_edge("arch_alignment_001", "gap_arch_alignment_001_0"));
    EXPECT_DOUBLE_EQ(graph.get_edge("arch_alignment_001", "gap_arch_alignment_001_0")->weight, 0.9);

    EXPECT_EQ(report.resolves_edges, 1);
    EXPECT_EQ(report.impacts_edges, 1);
    EXPECT_EQ(report.about_item_edges, 2);
    EXPECT_EQ(report.identifies_gap_edges, 3);
}

TEST_F(SyncOrchestratorTest, DecisionAnswersQuestion) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    const auto* question = record_as<Question>(graph.get_node("q_001")->record);
    ASSERT_NE(question, nullptr);
    EXPECT_EQ(question->status, "answered");
    EXPECT_EQ(question->answered_by_decision, "D1");
    EXPECT_EQ(report.questions_answered, 1);

    const auto* other = record_as<Question>(graph.get_node("q_002")->record);
    EXPECT_EQ(other->status, "pending");
}

TEST_F(SyncOrchestratorTest, GapRecords) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);

    const auto* first = record_as<Gap>(graph.get_node("gap_arch_alignment_001_0")->record);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->description, "No retention policy");
    EXPECT_EQ(first->severity, "high");
    EXPECT_EQ(first->type, "architecture");
    EXPECT_EQ(first->identified_by, "arch_alignment_001");

    const auto* second = record_as<Gap>(graph.get_node("gap_arch_alignment_001_1")->record);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->description, "No backups");
    EXPECT_EQ(second->severity, "medium");

    const auto* competitive = record_as<Assessment>(graph.get_node("comp_acme")->record);
    ASSERT_NE(competitive, nullptr);
    EXPECT_EQ(competitive->summary, "Acme ships faster");
    EXPECT_EQ(competitive->type, "competitive");
}

TEST_F(SyncOrchestratorTest, EmbedsDecisionAndRoadmapTexts) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    ASSERT_EQ(embedder.calls.size(), 2);
    ASSERT_EQ(embedder.calls[0].size(), 2);
    EXPECT_EQ(embedder.calls[0][0], "Audit Log. Record every change.");
    EXPECT_EQ(embedder.calls[0][1], "Search. Full text search.");
    ASSERT_EQ(embedder.calls[1].size(), 1);
    EXPECT_EQ(embedder.calls[1][0], "Use Postgres. Team knows it");
    EXPECT_EQ(report.texts_embedded, 3);

    EXPECT_EQ(graph.get_node("D1")->embedding, DECISION_AXIS);
    EXPECT_TRUE(graph.get_node("ri_search")->has_embedding());
    EXPECT_FALSE(graph.get_node("q_001")->has_embedding());
}

TEST_F(SyncOrchestratorTest, RespectsBatchSize) {
    populate();
    config.embedding_batch_size = 1;
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);

    // Two roadmap items one at a time, then the decision
    EXPECT_EQ(embedder.calls.size(), 3);
}

// ==========================================
// Scenarios
// ==========================================

TEST_F(SyncOrchestratorTest, DecisionSupersedesSimilarChunk) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);

    auto decision = graph.get_superseding_decision("C1");
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->id, "D1");
    EXPECT_NEAR(graph.get_edge("D1", "C1")->weight, 0.82, 1e-6);

    EXPECT_FALSE(graph.get_superseding_decision("C2").has_value());
}

TEST_F(SyncOrchestratorTest, RoadmapItemWithoutCloseChunksHasNoSemanticEdges) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);

    for (const auto& target : graph.successors("ri_search")) {
        auto type = graph.get_edge("ri_search", target)->edge_type;
        EXPECT_NE(type, EdgeType::SupportedBy);
        EXPECT_NE(type, EdgeType::MentionedIn);
    }
    EXPECT_TRUE(graph.successors("ri_search").empty());
}

TEST_F(SyncOrchestratorTest, SecondSyncIsIdempotent) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);
    size_t nodes = graph.num_nodes();
    size_t edges = graph.num_edges();

    auto report = orchestrator.sync(graph);
    EXPECT_EQ(graph.num_nodes(), nodes);
    EXPECT_EQ(graph.num_edges(), edges);
    EXPECT_EQ(report.roadmap_items_added, 0);
    EXPECT_EQ(report.decisions_added, 0);
    EXPECT_EQ(report.chunks_added, 0);
    EXPECT_EQ(report.texts_embedded, 0);
}

TEST_F(SyncOrchestratorTest, ExistingNodesAreNotMerged) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.sync(graph);

    sources.decisions[0].decision = "Use SQLite";
    orchestrator.sync(graph);

    const auto* decision = record_as<Decision>(graph.get_node("D1")->record);
    EXPECT_EQ(decision->decision, "Use Postgres");
}

TEST_F(SyncOrchestratorTest, LateQuestionIsLinkedToExistingDecision) {
    populate();
    auto late_question = sources.questions[0];
    sources.questions.erase(sources.questions.begin());

    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto first = orchestrator.sync(graph);
    EXPECT_FALSE(graph.has_node("q_001"));
    EXPECT_EQ(first.resolves_edges, 0);

    sources.questions.push_back(late_question);
    orchestrator.sync(graph);

    EXPECT_TRUE(graph.has_edge("D1", "q_001"));
    const auto* question = record_as<Question>(graph.get_node("q_001")->record);
    EXPECT_EQ(question->status, "answered");
}

// ==========================================
// Failure Isolation
// ==========================================

TEST_F(SyncOrchestratorTest, FailedStageDoesNotStopLaterStages) {
    populate();
    sources.fail_questions = true;
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    ASSERT_EQ(report.stage_errors.size(), 1);
    EXPECT_EQ(report.stage_errors[0].first, "questions");
    EXPECT_FALSE(report.succeeded());

    EXPECT_EQ(report.questions_added, 0);
    EXPECT_EQ(report.decisions_added, 1);
    EXPECT_EQ(report.chunks_added, 2);
    EXPECT_TRUE(graph.get_superseding_decision("C1").has_value());
}

TEST_F(SyncOrchestratorTest, EmbeddingFailureLeavesNodesForNextSync) {
    populate();
    embedder.fail = true;
    SyncOrchestrator orchestrator(config, sources, &embedder);
    auto report = orchestrator.sync(graph);

    EXPECT_EQ(report.stage_errors.size(), 2);
    EXPECT_EQ(graph.ids_of_type(NodeType::RoadmapItem).size(), 0);
    EXPECT_EQ(graph.ids_of_type(NodeType::Decision).size(), 0);
    EXPECT_EQ(report.chunks_added, 2);

    embedder.fail = false;
    auto retry = orchestrator.sync(graph);
    EXPECT_TRUE(retry.succeeded());
    EXPECT_EQ(retry.roadmap_items_added, 2);
    EXPECT_EQ(retry.decisions_added, 1);
    EXPECT_TRUE(graph.get_superseding_decision("C1").has_value());
}

TEST_F(SyncOrchestratorTest, WithoutEmbedderNodesHaveNoEmbeddings) {
    populate();
    SyncOrchestrator orchestrator(config, sources, nullptr);
    auto report = orchestrator.sync(graph);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.decisions_added, 1);
    EXPECT_FALSE(graph.get_node("D1")->has_embedding());
    EXPECT_EQ(report.nodes_without_embeddings, 3);
    EXPECT_EQ(report.inference.overrides_edges, 0);
}

TEST_F(SyncOrchestratorTest, InvalidConfigThrows) {
    config.embedding_batch_size = 0;
    EXPECT_THROW((SyncOrchestrator{config, sources, &embedder}), std::invalid_argument);
}

TEST_F(SyncOrchestratorTest, ProgressCallbackReceivesStages) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    std::vector<std::string> stages;
    orchestrator.set_progress_callback(
        [&](const std::string& stage, int, int, const std::string&) { stages.push_back(stage); }
    );
    orchestrator.sync(graph);

    EXPECT_NE(std::find(stages.begin(), stages.end(), "roadmap"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "decisions"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "chunks"), stages.end());
}

// ==========================================
// Run (load, sync, persist)
// ==========================================

class SyncRunTest : public SyncOrchestratorTest {
protected:
    fs::path dir;

    void SetUp() override {
        SyncOrchestratorTest::SetUp();
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("cg_sync_run_" + std::to_string(stamp));
        config.graph_directory = dir.string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TEST_F(SyncRunTest, RunPersistsAndReloads) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    ContextGraph synced = orchestrator.run();

    EXPECT_TRUE(orchestrator.last_report().persisted);
    EXPECT_TRUE(fs::exists(dir / "graph.json"));

    ContextGraph loaded = ContextGraph::load(dir.string());
    EXPECT_EQ(loaded.num_nodes(), synced.num_nodes());
    EXPECT_EQ(loaded.num_edges(), synced.num_edges());
}

TEST_F(SyncRunTest, RunTwiceIsIdempotent) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    ContextGraph first = orchestrator.run();
    ContextGraph second = orchestrator.run();

    EXPECT_EQ(second.num_nodes(), first.num_nodes());
    EXPECT_EQ(second.num_edges(), first.num_edges());
    EXPECT_EQ(orchestrator.last_report().decisions_added, 0);
}

TEST_F(SyncRunTest, EmptySourcesPersistEmptyGraph) {
    SyncOrchestrator orchestrator(config, sources, &embedder);
    ContextGraph result = orchestrator.run();

    EXPECT_EQ(result.num_nodes(), 0);
    EXPECT_EQ(result.num_edges(), 0);
    EXPECT_TRUE(orchestrator.last_report().persisted);
}

TEST_F(SyncRunTest, RebuildStartsFromEmptyGraph) {
    populate();
    SyncOrchestrator orchestrator(config, sources, &embedder);
    orchestrator.run();

    sources.decisions.clear();
    config.full_rebuild = true;
    SyncOrchestrator rebuild(config, sources, &embedder);
    ContextGraph rebuilt = rebuild.run();

    EXPECT_FALSE(rebuilt.has_node("D1"));
    EXPECT_FALSE(ContextGraph::load(dir.string()).has_node("D1"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
