#include <gtest/gtest.h>
#include "pipeline/sync_config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace cg;
namespace fs = std::filesystem;

class SyncConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("cg_config_test_" + std::to_string(stamp));
        fs::create_directories(dir);

        for (const char* name : {"CG_GRAPH_DIR", "CG_EMBEDDING_PROVIDER", "VOYAGE_API_KEY",
                                 "CG_VOYAGE_API_KEY", "OPENAI_API_KEY", "CG_OPENAI_API_KEY",
                                 "CG_EMBEDDING_MODEL", "CG_RETRIEVAL_MODE"}) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        fs::path path = dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

// ==========================================
// Defaults and Validation
// ==========================================

TEST_F(SyncConfigTest, DefaultsAreValid) {
    SyncConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;

    EXPECT_EQ(config.graph_directory, "data/unified_graph");
    EXPECT_EQ(config.embedding_provider, "voyage");
    EXPECT_EQ(config.retrieval_mode, "keyword");
    EXPECT_EQ(config.top_k, 20);
    EXPECT_DOUBLE_EQ(config.thresholds.supported_by, 0.75);
    EXPECT_DOUBLE_EQ(config.thresholds.mentioned_in, 0.65);
    EXPECT_DOUBLE_EQ(config.thresholds.overrides, 0.70);
}

TEST_F(SyncConfigTest, ValidationFailures) {
    std::string error;

    SyncConfig provider;
    provider.embedding_provider = "cohere";
    EXPECT_FALSE(provider.validate(error));
    EXPECT_NE(error.find("provider"), std::string::npos);

    SyncConfig batch;
    batch.embedding_batch_size = 0;
    EXPECT_FALSE(batch.validate(error));

    SyncConfig retries;
    retries.embedding_max_retries = 0;
    EXPECT_FALSE(retries.validate(error));

    SyncConfig thresholds;
    thresholds.thresholds.mentioned_in = 0.9;
    EXPECT_FALSE(thresholds.validate(error));

    SyncConfig mode;
    mode.retrieval_mode = "fuzzy";
    EXPECT_FALSE(mode.validate(error));

    SyncConfig top_k;
    top_k.top_k = 0;
    EXPECT_FALSE(top_k.validate(error));

    SyncConfig similarity;
    similarity.min_embedding_similarity = 1.5;
    EXPECT_FALSE(similarity.validate(error));

    SyncConfig graph_dir;
    graph_dir.graph_directory = "";
    EXPECT_FALSE(graph_dir.validate(error));
}

// ==========================================
// JSON Files
// ==========================================

TEST_F(SyncConfigTest, LoadFromJsonFile) {
    std::string path = write_file("config.json", R"({
        "graph_directory": "/tmp/graph",
        "roadmap_path": "docs/roadmap.md",
        "provider": "openai",
        "api_key": "sk-test",
        "model": "text-embedding-3-large",
        "embedding_batch_size": 16,
        "thresholds": {"supported_by": 0.8, "mentioned_in": 0.6},
        "retrieval_mode": "embedding",
        "top_k": 5,
        "verbose": false
    })");

    SyncConfig config = SyncConfig::from_json_file(path);
    EXPECT_EQ(config.graph_directory, "/tmp/graph");
    EXPECT_EQ(config.roadmap_path, "docs/roadmap.md");
    EXPECT_EQ(config.embedding_provider, "openai");
    EXPECT_EQ(config.embedding_api_key, "sk-test");
    EXPECT_EQ(config.embedding_model, "text-embedding-3-large");
    EXPECT_EQ(config.embedding_batch_size, 16);
    EXPECT_DOUBLE_EQ(config.thresholds.supported_by, 0.8);
    EXPECT_DOUBLE_EQ(config.thresholds.mentioned_in, 0.6);
    EXPECT_DOUBLE_EQ(config.thresholds.overrides, 0.70);
    EXPECT_EQ(config.retrieval_mode, "embedding");
    EXPECT_EQ(config.top_k, 5);
    EXPECT_FALSE(config.verbose);

    // Unset fields keep their defaults
    EXPECT_EQ(config.questions_path, "data/questions/questions.json");
}

TEST_F(SyncConfigTest, FlatThresholdKeys) {
    std::string path = write_file("flat.json", R"({"overrides_threshold": 0.9, "supported_by_threshold": 0.85})");

    SyncConfig config = SyncConfig::from_json_file(path);
    EXPECT_DOUBLE_EQ(config.thresholds.overrides, 0.9);
    EXPECT_DOUBLE_EQ(config.thresholds.supported_by, 0.85);
}

TEST_F(SyncConfigTest, LoadErrors) {
    EXPECT_THROW(SyncConfig::from_json_file((dir / "missing.json").string()), std::runtime_error);
    EXPECT_THROW(SyncConfig::from_json_file(write_file("bad.json", "{not json")), std::runtime_error);
    EXPECT_THROW(SyncConfig::from_json_file(write_file("typed.json", R"({"top_k": "many"})")),
                 std::runtime_error);
}

TEST_F(SyncConfigTest, SaveRedactsApiKey) {
    SyncConfig config;
    config.embedding_api_key = "secret-key";
    config.top_k = 7;

    std::string path = (dir / "saved.json").string();
    config.to_json_file(path);

    std::ifstream in(path);
    nlohmann::json j = nlohmann::json::parse(in);
    EXPECT_EQ(j["embedding_api_key"], "***REDACTED***");
    EXPECT_EQ(j["top_k"], 7);

    SyncConfig reloaded = SyncConfig::from_json_file(path);
    EXPECT_EQ(reloaded.top_k, 7);
    EXPECT_DOUBLE_EQ(reloaded.thresholds.supported_by, 0.75);
}

// ==========================================
// Environment and Fallback
// ==========================================

TEST_F(SyncConfigTest, FromEnvironment) {
    setenv("CG_GRAPH_DIR", "/var/graph", 1);
    setenv("CG_EMBEDDING_PROVIDER", "openai", 1);
    setenv("CG_OPENAI_API_KEY", "sk-env", 1);
    setenv("CG_RETRIEVAL_MODE", "embedding", 1);

    SyncConfig config = SyncConfig::from_environment();
    EXPECT_EQ(config.graph_directory, "/var/graph");
    EXPECT_EQ(config.embedding_provider, "openai");
    EXPECT_EQ(config.embedding_api_key, "sk-env");
    EXPECT_EQ(config.retrieval_mode, "embedding");
}

TEST_F(SyncConfigTest, PlainKeyPreferredOverPrefixed) {
    setenv("VOYAGE_API_KEY", "plain", 1);
    setenv("CG_VOYAGE_API_KEY", "prefixed", 1);

    EXPECT_EQ(SyncConfig::from_environment().embedding_api_key, "plain");
}

TEST_F(SyncConfigTest, FallbackFillsKeyFromEnvironment) {
    setenv("VOYAGE_API_KEY", "from-env", 1);
    std::string path = write_file("nokey.json", R"({"graph_directory": "/tmp/g"})");

    SyncConfig config = load_config_with_fallback(path);
    EXPECT_EQ(config.graph_directory, "/tmp/g");
    EXPECT_EQ(config.embedding_api_key, "from-env");
}

TEST_F(SyncConfigTest, ExplicitBrokenFileThrows) {
    setenv("CG_GRAPH_DIR", "/from/env", 1);
    std::string path = write_file("broken.json", "{broken");

    EXPECT_THROW(load_config_with_fallback(path), std::runtime_error);
}

TEST_F(SyncConfigTest, ExplicitMissingFileThrows) {
    setenv("CG_GRAPH_DIR", "/from/env", 1);

    EXPECT_THROW(load_config_with_fallback((dir / "absent.json").string()), std::runtime_error);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
