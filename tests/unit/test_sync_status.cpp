#include <gtest/gtest.h>
#include "pipeline/sync_status.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace cg;
namespace fs = std::filesystem;

class SyncStatusTest : public ::testing::Test {
protected:
    fs::path dir;
    SyncConfig config;
    fs::file_time_type graph_time;

    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("cg_sync_status_test_" + std::to_string(stamp));
        fs::create_directories(dir / "graph");
        fs::create_directories(dir / "competitive");

        config.roadmap_path = (dir / "roadmap.md").string();
        config.questions_path = (dir / "questions.json").string();
        config.decisions_path = (dir / "decisions.json").string();
        config.architecture_assessment_path = (dir / "architecture.json").string();
        config.competitive_assessments_path = (dir / "competitive" / "assessments.json").string();
        config.chunks_path = (dir / "chunks.json").string();
        config.graph_directory = (dir / "graph").string();

        graph_time = fs::file_time_type::clock::now() - std::chrono::hours(1);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const fs::path& path, fs::file_time_type time) {
        {
            std::ofstream out(path);
            out << "{}";
        }
        fs::last_write_time(path, time);
    }

    void write_graph() {
        write(dir / "graph" / "graph.json", graph_time);
    }
};

TEST_F(SyncStatusTest, MissingGraphNeedsSync) {
    SyncStatus status = check_sync_status(config);
    EXPECT_FALSE(status.graph_exists);
    EXPECT_TRUE(status.needs_sync());
    EXPECT_TRUE(needs_graph_sync(config));
}

TEST_F(SyncStatusTest, GraphWithoutSourcesIsFresh) {
    write_graph();
    EXPECT_FALSE(needs_graph_sync(config));
}

TEST_F(SyncStatusTest, OlderSourcesAreFresh) {
    write_graph();
    write(config.decisions_path, graph_time - std::chrono::minutes(10));
    write(config.roadmap_path, graph_time - std::chrono::minutes(5));

    SyncStatus status = check_sync_status(config);
    EXPECT_TRUE(status.graph_exists);
    EXPECT_TRUE(status.stale_sources.empty());
    EXPECT_FALSE(status.needs_sync());
}

TEST_F(SyncStatusTest, NewerDecisionsNeedSync) {
    write_graph();
    write(config.decisions_path, graph_time + std::chrono::minutes(10));

    SyncStatus status = check_sync_status(config);
    ASSERT_EQ(status.stale_sources.size(), 1);
    EXPECT_EQ(status.stale_sources[0], config.decisions_path);
    EXPECT_TRUE(status.needs_sync());
}

TEST_F(SyncStatusTest, NewerCompetitorFileNeedsSync) {
    write_graph();
    write(config.competitive_assessments_path, graph_time - std::chrono::minutes(10));
    write(dir / "competitive" / "acme.json", graph_time + std::chrono::minutes(10));
    write(dir / "competitive" / "notes.md", graph_time + std::chrono::minutes(10));

    SyncStatus status = check_sync_status(config);
    ASSERT_EQ(status.stale_sources.size(), 1);
    EXPECT_EQ(fs::path(status.stale_sources[0]).filename().string(), "acme.json");
}

TEST_F(SyncStatusTest, StatusJson) {
    write_graph();
    write(config.chunks_path, graph_time + std::chrono::minutes(1));

    auto j = check_sync_status(config).to_json();
    EXPECT_TRUE(j["graph_exists"].get<bool>());
    EXPECT_TRUE(j["needs_sync"].get<bool>());
    ASSERT_EQ(j["stale_sources"].size(), 1);
    EXPECT_EQ(j["stale_sources"][0], config.chunks_path);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
