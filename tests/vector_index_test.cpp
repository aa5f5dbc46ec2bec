#include "database/vector_index.hpp"
#include "logging/logger.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace
{
    EmbeddingVector vec(std::vector<float> values, const std::string &model = "model-a")
    {
        EmbeddingVector v;
        v.values = std::move(values);
        v.model_version = model;
        return v;
    }
}

class VectorIndexTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "north", vec({1.0f, 0.0f, 0.0f}), {{"issue_type", "road"}}).success);
        ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "north-east", vec({1.0f, 1.0f, 0.0f})).success);
        ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "east", vec({0.0f, 1.0f, 0.0f})).success);
    }

    InMemoryVectorIndex index_;
};

TEST_F(VectorIndexTest, QueryOrdersByDescendingSimilarity)
{
    auto matches = index_.query(VectorNamespace::COMPLAINTS, vec({1.0f, 0.1f, 0.0f}), 10);

    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].id, "north");
    EXPECT_EQ(matches[1].id, "north-east");
    EXPECT_EQ(matches[2].id, "east");
    EXPECT_GT(matches[0].score, matches[1].score);
    EXPECT_GT(matches[1].score, matches[2].score);
    EXPECT_EQ(matches[0].metadata["issue_type"], "road");
}

TEST_F(VectorIndexTest, QueryRespectsTopK)
{
    auto matches = index_.query(VectorNamespace::COMPLAINTS, vec({0.0f, 1.0f, 0.0f}), 1);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].id, "east");
    EXPECT_NEAR(matches[0].score, 1.0, 1e-6);

    EXPECT_TRUE(index_.query(VectorNamespace::COMPLAINTS, vec({0.0f, 1.0f, 0.0f}), 0).empty());
}

TEST_F(VectorIndexTest, NamespacesAreIsolated)
{
    EXPECT_EQ(index_.size(VectorNamespace::COMPLAINTS), 3u);
    EXPECT_EQ(index_.size(VectorNamespace::PROOFS), 0u);
    EXPECT_TRUE(index_.query(VectorNamespace::PROOFS, vec({1.0f, 0.0f, 0.0f}), 5).empty());
}

TEST_F(VectorIndexTest, UpsertReplacesExistingEntry)
{
    ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "north", vec({0.0f, 0.0f, 1.0f})).success);
    EXPECT_EQ(index_.size(VectorNamespace::COMPLAINTS), 3u);

    auto matches = index_.query(VectorNamespace::COMPLAINTS, vec({0.0f, 0.0f, 1.0f}), 1);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].id, "north");
}

TEST_F(VectorIndexTest, IncompatibleVectorsAreSkipped)
{
    ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "other-model", vec({1.0f, 0.0f, 0.0f}, "model-b")).success);
    ASSERT_TRUE(index_.upsert(VectorNamespace::COMPLAINTS, "longer", vec({1.0f, 0.0f, 0.0f, 0.0f})).success);

    auto matches = index_.query(VectorNamespace::COMPLAINTS, vec({1.0f, 0.0f, 0.0f}), 10);
    EXPECT_EQ(matches.size(), 3u);
    for (const auto &match : matches)
    {
        EXPECT_NE(match.id, "other-model");
        EXPECT_NE(match.id, "longer");
    }
}

TEST_F(VectorIndexTest, RejectsInvalidUpserts)
{
    EXPECT_FALSE(index_.upsert("", "id", vec({1.0f})).success);
    EXPECT_FALSE(index_.upsert(VectorNamespace::CHUNKS, "", vec({1.0f})).success);
    EXPECT_FALSE(index_.upsert(VectorNamespace::CHUNKS, "id", vec({})).success);
    EXPECT_EQ(index_.size(VectorNamespace::CHUNKS), 0u);
}

TEST_F(VectorIndexTest, NonFiniteVectorsAreRejected)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    EXPECT_FALSE(index_.upsert(VectorNamespace::COMPLAINTS, "nan", vec({nan, 0.0f, 0.0f})).success);
    EXPECT_FALSE(index_.upsert(VectorNamespace::COMPLAINTS, "inf", vec({inf, 1.0f, 0.0f})).success);
    EXPECT_EQ(index_.size(VectorNamespace::COMPLAINTS), 3u);

    EXPECT_TRUE(index_.query(VectorNamespace::COMPLAINTS, vec({nan, 1.0f, 0.0f}), 10).empty());
    EXPECT_TRUE(index_.query(VectorNamespace::COMPLAINTS, vec({0.0f, -inf, 0.0f}), 10).empty());

    auto matches = index_.query(VectorNamespace::COMPLAINTS, vec({1.0f, 0.1f, 0.0f}), 10);
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].id, "north");
}
