#include <gtest/gtest.h>
#include "retrieval/traversal.hpp"

using namespace cg;

namespace {

Decision make_decision(const std::string& id, const std::string& text) {
    Decision d;
    d.id = id;
    d.decision = text;
    return d;
}

Chunk make_chunk(const std::string& id, const std::string& content) {
    Chunk c;
    c.id = id;
    c.content = content;
    return c;
}

Question make_question(const std::string& id, const std::string& text) {
    Question q;
    q.id = id;
    q.question = text;
    return q;
}

RoadmapItem make_item(const std::string& id, const std::string& name) {
    RoadmapItem item;
    item.id = id;
    item.name = name;
    return item;
}

std::vector<std::string> ids_of(const TraversalResult& result, NodeType type) {
    std::vector<std::string> ids;
    auto it = result.by_type.find(type);
    if (it == result.by_type.end()) return ids;
    for (const auto& node : it->second) ids.push_back(node.id);
    return ids;
}

} // anonymous namespace

/*
 * Q1 <-RESOLVES- D1 -IMPACTS-> R1 -SUPPORTED_BY-> C1
 *                 |
 *                 +-OVERRIDES-> C2
 * Q2 -ABOUT_ITEM-> R1
 */
class TraversalTest : public ::testing::Test {
protected:
    ContextGraph graph;

    void SetUp() override {
        graph.add_node("D1", make_decision("D1", "Use Postgres"));
        graph.add_node("Q1", make_question("Q1", "Which database?"));
        graph.add_node("Q2", make_question("Q2", "When do we ship search?"));
        graph.add_node("R1", make_item("R1", "Audit Log"));
        graph.add_node("C1", make_chunk("C1", "Audit events are stored in Postgres"));
        graph.add_node("C2", make_chunk("C2", "We will use MySQL"));

        graph.add_edge("D1", "Q1", EdgeType::Resolves, 1.0);
        graph.add_edge("D1", "R1", EdgeType::Impacts, 1.0);
        graph.add_edge("D1", "C2", EdgeType::Overrides, 0.8);
        graph.add_edge("R1", "C1", EdgeType::SupportedBy, 0.8);
        graph.add_edge("Q2", "R1", EdgeType::AboutItem, 0.8);
    }
};

TEST_F(TraversalTest, SeedOnlyAtZeroHops) {
    auto result = traverse(graph, {"D1"}, {}, 0);

    EXPECT_EQ(result.total(), 1);
    EXPECT_EQ(result.nodes_visited, 1);
    EXPECT_EQ(result.hops_completed, 0);
    EXPECT_EQ(result.by_type.at(NodeType::Decision)[0].hop, 0);
}

TEST_F(TraversalTest, OneHopFollowsOutgoingEdges) {
    auto result = traverse(graph, {"D1"}, {}, 1);

    EXPECT_EQ(result.total(), 4);
    EXPECT_EQ(ids_of(result, NodeType::Question), std::vector<std::string>({"Q1"}));
    EXPECT_EQ(ids_of(result, NodeType::RoadmapItem), std::vector<std::string>({"R1"}));
    EXPECT_EQ(ids_of(result, NodeType::Chunk), std::vector<std::string>({"C2"}));
    EXPECT_EQ(result.hops_completed, 1);
}

TEST_F(TraversalTest, FollowsIncomingEdges) {
    auto result = traverse(graph, {"C1"}, {}, 1);

    EXPECT_EQ(ids_of(result, NodeType::RoadmapItem), std::vector<std::string>({"R1"}));
    EXPECT_EQ(result.total(), 2);
}

TEST_F(TraversalTest, HopDistances) {
    auto result = traverse(graph, {"D1"}, {}, 2);

    EXPECT_EQ(result.total(), 6);
    for (const auto& node : result.by_type.at(NodeType::Chunk)) {
        if (node.id == "C2") EXPECT_EQ(node.hop, 1);
        if (node.id == "C1") EXPECT_EQ(node.hop, 2);
    }
    EXPECT_EQ(ids_of(result, NodeType::Question), std::vector<std::string>({"Q1", "Q2"}));
    EXPECT_EQ(result.hops_completed, 2);
}

TEST_F(TraversalTest, StopsWhenFrontierIsEmpty) {
    auto result = traverse(graph, {"D1"}, {}, 10);

    EXPECT_EQ(result.total(), 6);
    EXPECT_EQ(result.hops_completed, 2);
}

TEST_F(TraversalTest, CyclesTerminate) {
    graph.add_edge("D1", "C1", EdgeType::Overrides, 0.7);
    auto result = traverse(graph, {"C1", "C2"}, {}, 5);

    EXPECT_EQ(result.total(), 6);
    EXPECT_EQ(result.nodes_visited, 6);
}

TEST_F(TraversalTest, UnknownSeedsAreIgnored) {
    auto result = traverse(graph, {"missing", "Q1"}, {}, 1);

    EXPECT_EQ(ids_of(result, NodeType::Decision), std::vector<std::string>({"D1"}));
    EXPECT_EQ(result.total(), 2);

    auto none = traverse(graph, {"missing"}, {}, 2);
    EXPECT_EQ(none.total(), 0);
    EXPECT_EQ(none.nodes_visited, 0);
}

TEST_F(TraversalTest, DuplicateSeedsVisitedOnce) {
    auto result = traverse(graph, {"D1", "D1"}, {}, 0);
    EXPECT_EQ(result.total(), 1);
}

TEST_F(TraversalTest, TopicFilterStillExpandsFilteredNodes) {
    // R1 ("Audit Log") is filtered out by "postgres" but C1 is reached through it
    auto result = traverse(graph, {"Q2"}, {"postgres"}, 3);

    EXPECT_TRUE(ids_of(result, NodeType::RoadmapItem).empty());
    EXPECT_TRUE(ids_of(result, NodeType::Question).empty());
    EXPECT_EQ(ids_of(result, NodeType::Chunk), std::vector<std::string>({"C1"}));
    EXPECT_EQ(ids_of(result, NodeType::Decision), std::vector<std::string>({"D1"}));
    EXPECT_GT(result.nodes_visited, result.total());
}

TEST_F(TraversalTest, TopicFilterMatchesAnyTerm) {
    auto result = traverse(graph, {"D1"}, {"MYSQL", " database "}, 1);

    EXPECT_EQ(ids_of(result, NodeType::Chunk), std::vector<std::string>({"C2"}));
    EXPECT_EQ(ids_of(result, NodeType::Question), std::vector<std::string>({"Q1"}));
    EXPECT_TRUE(ids_of(result, NodeType::Decision).empty());
}

TEST_F(TraversalTest, NegativeHopsThrow) {
    EXPECT_THROW(traverse(graph, {"D1"}, {}, -1), std::invalid_argument);
}

TEST_F(TraversalTest, ToJson) {
    auto j = traverse(graph, {"D1"}, {}, 1).to_json();

    EXPECT_EQ(j["nodes_visited"], 4);
    EXPECT_EQ(j["hops_completed"], 1);
    ASSERT_TRUE(j["nodes"].contains("decision"));
    EXPECT_EQ(j["nodes"]["decision"][0]["id"], "D1");
    EXPECT_EQ(j["nodes"]["decision"][0]["hop"], 0);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
