#include <gtest/gtest.h>
#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <filesystem>

class PocoConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Initialize logger for tests
        Logger::init("ERROR");

        // Create a temporary test config file
        test_config_path_ = "test_config.json";
        createTestConfig();

        // Load the test configuration into the PocoConfigManager instance
        auto &config = PocoConfigManager::getInstance();
        ASSERT_TRUE(config.load(test_config_path_));
    }

    void TearDown() override
    {
        // Clean up test files
        for (const auto &path : {test_config_path_, std::string("saved_config.json"), std::string("broken_config.json")})
        {
            if (std::filesystem::exists(path))
            {
                std::filesystem::remove(path);
            }
        }
        PocoConfigManager::getInstance().initializeDefaultConfig();
    }

    void createTestConfig()
    {
        std::ofstream config_file(test_config_path_);
        config_file << R"({
            "log_level": "DEBUG",
            "database": {
                "path": "/tmp/verifier-test.db"
            },
            "image": {
                "max_edge": 768
            },
            "chunking": {
                "rows": 3,
                "cols": 5
            },
            "embedding": {
                "backend": "stub",
                "timeout_ms": 2500,
                "max_attempts": 3
            },
            "manipulation": {
                "backend": "none",
                "ela_weight": 0.5,
                "classifier_weight": 0.5,
                "threshold": 0.7
            },
            "vlm": {
                "backend": "http",
                "url": "http://vlm.internal:9000",
                "model": "llava-1.6",
                "api_key": "secret",
                "timeout_ms": 45000
            },
            "scoring": {
                "approve_threshold": 0.8
            },
            "recycled": {
                "max_distance": 4
            },
            "location": {
                "max_distance_m": 100
            },
            "threading": {
                "max_analysis_threads": 4
            }
        })";
        config_file.close();
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigManagerTest, BasicConfiguration)
{
    auto &config = PocoConfigManager::getInstance();

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getDatabasePath(), "/tmp/verifier-test.db");
    EXPECT_EQ(config.getMaxAnalysisThreads(), 4);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, FileValuesMergeOverDefaults)
{
    auto &config = PocoConfigManager::getInstance();

    ImageCodecLimits limits = config.getImageCodecLimits();
    EXPECT_EQ(limits.max_edge, 768);
    EXPECT_EQ(limits.min_dimension, 16);
    EXPECT_EQ(limits.max_bytes, 20u * 1024u * 1024u);

    GridShape grid = config.getGridShape();
    EXPECT_EQ(grid.rows, 3);
    EXPECT_EQ(grid.cols, 5);

    // Untouched sections keep their defaults
    ScoringPolicy scoring = config.getScoringPolicy();
    EXPECT_DOUBLE_EQ(scoring.approve_threshold, 0.8);
    EXPECT_DOUBLE_EQ(scoring.reject_threshold, 0.45);
    EXPECT_DOUBLE_EQ(scoring.semantic_weight, 0.40);
}

TEST_F(PocoConfigManagerTest, ComponentPolicies)
{
    auto &config = PocoConfigManager::getInstance();

    EmbeddingPolicy embedding = config.getEmbeddingPolicy();
    EXPECT_EQ(embedding.timeout_ms, 2500);
    EXPECT_EQ(embedding.max_attempts, 3);

    ManipulationPolicy manipulation = config.getManipulationPolicy();
    EXPECT_DOUBLE_EQ(manipulation.ela_weight, 0.5);
    EXPECT_DOUBLE_EQ(manipulation.threshold, 0.7);

    SemanticPolicy semantic = config.getSemanticPolicy();
    EXPECT_EQ(semantic.timeout_ms, 45000);
    EXPECT_EQ(semantic.max_attempts, 2);

    PipelinePolicy pipeline = config.getPipelinePolicy();
    EXPECT_EQ(pipeline.recycled_max_distance, 4);
    EXPECT_DOUBLE_EQ(pipeline.max_location_distance_m, 100.0);
    EXPECT_EQ(pipeline.grid.cols, 5);
}

TEST_F(PocoConfigManagerTest, CapabilityBackends)
{
    auto &config = PocoConfigManager::getInstance();

    EXPECT_EQ(config.getBackend("embedding"), "stub");
    EXPECT_EQ(config.getBackend("manipulation"), "none");
    EXPECT_EQ(config.getBackend("vlm"), "http");

    HttpEndpoint endpoint = config.getEndpoint("vlm");
    EXPECT_EQ(endpoint.url, "http://vlm.internal:9000");
    EXPECT_EQ(endpoint.path, "/v1/chat/completions");
    EXPECT_EQ(endpoint.model, "llava-1.6");
    EXPECT_EQ(endpoint.api_key, "secret");
}

TEST_F(PocoConfigManagerTest, UpdateAppliesNestedValues)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"database", {{"path", "override.db"}}}, {"log_level", "WARN"}});

    EXPECT_EQ(config.getDatabasePath(), "override.db");
    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_EQ(config.getGridShape().rows, 3);
}

TEST_F(PocoConfigManagerTest, ConfigValidation)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_TRUE(config.validateConfig());

    config.update({{"log_level", "LOUD"}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"log_level", "INFO"}});
    EXPECT_TRUE(config.validateConfig());

    config.update({{"embedding", {{"backend", "none"}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"embedding", {{"backend", "grpc"}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"embedding", {{"backend", "stub"}}}});
    EXPECT_TRUE(config.validateConfig());

    config.update({{"manipulation", {{"ela_weight", 0.7}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"manipulation", {{"ela_weight", 0.5}}}});

    config.update({{"scoring", {{"semantic_weight", 0.5}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"scoring", {{"semantic_weight", 0.4}}}});

    config.update({{"chunking", {{"rows", 32}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"chunking", {{"rows", 3}}}});

    config.update({{"threading", {{"max_analysis_threads", 0}}}});
    EXPECT_FALSE(config.validateConfig());
    config.update({{"threading", {{"max_analysis_threads", 4}}}});

    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, HttpBackendNeedsUrl)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"vlm", {{"url", ""}}}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, MissingOrMalformedFileIsRejected)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load("does_not_exist.json"));

    std::ofstream("broken_config.json") << "[1, 2, 3]";
    EXPECT_FALSE(config.load("broken_config.json"));

    // A failed load leaves the previous configuration in place
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(PocoConfigManagerTest, ReloadStartsFromDefaults)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"recycled", {{"max_distance", 10}}}});

    std::ofstream("saved_config.json") << R"({"log_level": "WARN"})";
    ASSERT_TRUE(config.load("saved_config.json"));

    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_EQ(config.getPipelinePolicy().recycled_max_distance, 6);
    EXPECT_EQ(config.getBackend("embedding"), "http");
}

TEST_F(PocoConfigManagerTest, SaveWritesCurrentValues)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.save("saved_config.json"));

    std::ifstream in("saved_config.json");
    nlohmann::json saved = nlohmann::json::parse(in);
    EXPECT_EQ(saved["log_level"], "DEBUG");
    EXPECT_TRUE(saved.contains("chunking"));

    nlohmann::json all = config.getAll();
    EXPECT_EQ(all["database"]["path"], "/tmp/verifier-test.db");
}

TEST_F(PocoConfigManagerTest, LargeUnsignedValuesAreNotNarrowed)
{
    auto &config = PocoConfigManager::getInstance();
    config.update(nlohmann::json::parse(R"({"image": {"max_bytes": 3000000000}})"));

    EXPECT_EQ(config.getUInt32("image.max_bytes"), 3000000000u);
    EXPECT_EQ(config.getImageCodecLimits().max_bytes, 3000000000u);
}

TEST_F(PocoConfigManagerTest, OutOfRangeValuesFallBackToDefaults)
{
    auto &config = PocoConfigManager::getInstance();
    config.update(nlohmann::json::parse(
        R"({"embedding": {"cache_capacity": 5000000000}, "chunking": {"rows": 4294967296}})"));

    EXPECT_EQ(config.getUInt32("embedding.cache_capacity", 17), 17u);
    EXPECT_EQ(config.getInt("chunking.rows", 4), 4);
    EXPECT_EQ(config.getGridShape().rows, GridShape().rows);

    config.update({{"chunking", {{"rows", -3}}}});
    EXPECT_EQ(config.getInt("chunking.rows"), -3);
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, DecodedImageCacheCapacityIsConfigurable)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_EQ(config.getPipelinePolicy().normalized_cache_capacity, 32u);

    config.update({{"image", {{"normalized_cache_capacity", 8}}}});
    EXPECT_EQ(config.getPipelinePolicy().normalized_cache_capacity, 8u);
}
