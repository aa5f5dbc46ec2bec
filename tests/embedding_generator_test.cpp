#include "core/embedding_generator.hpp"
#include "core/image_processor.hpp"
#include "core/stub_capabilities.hpp"
#include "core/verification_errors.hpp"
#include "test_base.hpp"
#include <gtest/gtest.h>
#include <thread>

class EmbeddingGeneratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        stub_ = std::make_shared<StubEmbeddingCapability>();
        policy_.backoff_base_ms = 1;
        image_ = ImageProcessor::decodeAndNormalize(TestImages::scenePng(11));
    }

    std::shared_ptr<StubEmbeddingCapability> stub_;
    EmbeddingPolicy policy_;
    NormalizedImage image_;
};

TEST_F(EmbeddingGeneratorTest, EmbedsWholeImage)
{
    EmbeddingGenerator generator(stub_, policy_);
    EmbeddingVector vector = generator.embed(image_);

    EXPECT_EQ(vector.dimension(), 48u);
    EXPECT_EQ(vector.model_version, "stub-color-grid-v1");
    EXPECT_EQ(vector.metric, "cosine");
    EXPECT_EQ(generator.modelVersion(), "stub-color-grid-v1");
}

TEST_F(EmbeddingGeneratorTest, CachesByContentHash)
{
    EmbeddingGenerator generator(stub_, policy_);
    EmbeddingVector first = generator.embed(image_);
    EmbeddingVector second = generator.embed(image_);

    EXPECT_EQ(first.values, second.values);
    EXPECT_EQ(stub_->calls(), 1u);
    EXPECT_EQ(generator.capabilityCalls(), 1u);
}

TEST_F(EmbeddingGeneratorTest, ConcurrentRequestsShareOneCall)
{
    stub_->setLatencyMs(100);
    EmbeddingGenerator generator(stub_, policy_);

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; i++)
    {
        threads.emplace_back([&]()
                             { generator.embed(image_); });
    }
    for (auto &t : threads)
    {
        t.join();
    }
    EXPECT_EQ(stub_->calls(), 1u);
}

TEST_F(EmbeddingGeneratorTest, EmbedsChunksInOrder)
{
    EmbeddingGenerator generator(stub_, policy_);
    GridShape grid{2, 3};
    std::vector<Chunk> chunks = ImageProcessor::chunk(image_, grid);
    std::vector<EmbeddingVector> vectors = generator.embedChunks(image_, chunks, grid);

    ASSERT_EQ(vectors.size(), 6u);
    for (size_t i = 0; i < chunks.size(); i++)
    {
        EmbeddingVector single = generator.embed(image_, chunks[i], grid);
        EXPECT_EQ(single.values, vectors[i].values);
    }
    EXPECT_EQ(stub_->calls(), 6u);
}

TEST_F(EmbeddingGeneratorTest, RetriesTransientFailure)
{
    stub_->setTransientFailures(1);
    EmbeddingGenerator generator(stub_, policy_);

    EXPECT_NO_THROW(generator.embed(image_));
    EXPECT_EQ(stub_->calls(), 2u);
}

TEST_F(EmbeddingGeneratorTest, UnavailableAfterMaxAttempts)
{
    stub_->setMode(StubEmbeddingCapability::Mode::UNAVAILABLE);
    EmbeddingGenerator generator(stub_, policy_);

    EXPECT_THROW(generator.embed(image_), EmbeddingUnavailableError);
    EXPECT_EQ(stub_->calls(), static_cast<size_t>(policy_.max_attempts));
}

TEST_F(EmbeddingGeneratorTest, FailureIsNotCached)
{
    stub_->setMode(StubEmbeddingCapability::Mode::UNAVAILABLE);
    EmbeddingGenerator generator(stub_, policy_);
    EXPECT_THROW(generator.embed(image_), EmbeddingUnavailableError);

    stub_->setMode(StubEmbeddingCapability::Mode::NORMAL);
    EXPECT_EQ(generator.embed(image_).dimension(), 48u);
}

TEST_F(EmbeddingGeneratorTest, TimeoutIsNotRetried)
{
    stub_->setMode(StubEmbeddingCapability::Mode::TIMEOUT);
    EmbeddingGenerator generator(stub_, policy_);

    EXPECT_THROW(generator.embed(image_), EmbeddingTimeoutError);
    EXPECT_EQ(stub_->calls(), 1u);
}

TEST_F(EmbeddingGeneratorTest, DeadlineBoundsSlowCapability)
{
    stub_->setLatencyMs(2000);
    policy_.timeout_ms = 30;
    EmbeddingGenerator generator(stub_, policy_);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(generator.embed(image_), EmbeddingTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000));
}

TEST_F(EmbeddingGeneratorTest, CancellationPropagates)
{
    EmbeddingGenerator generator(stub_, policy_);
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(generator.embed(image_, token), OperationCancelledError);
}

TEST_F(EmbeddingGeneratorTest, MissingCapabilityIsUnavailable)
{
    EmbeddingGenerator generator(nullptr, policy_);
    EXPECT_EQ(generator.modelVersion(), "none");
    EXPECT_THROW(generator.embed(image_), EmbeddingUnavailableError);
}

TEST_F(EmbeddingGeneratorTest, CosineSimilarity)
{
    EmbeddingVector a{{1.0f, 0.0f, 0.0f}, "m"};
    EmbeddingVector b{{0.0f, 2.0f, 0.0f}, "m"};
    EmbeddingVector c{{3.0f, 0.0f, 0.0f}, "m"};
    EmbeddingVector d{{-1.0f, 0.0f, 0.0f}, "m"};
    EmbeddingVector zero{{0.0f, 0.0f, 0.0f}, "m"};

    EXPECT_NEAR(EmbeddingGenerator::cosineSimilarity(a, b), 0.0, 1e-9);
    EXPECT_NEAR(EmbeddingGenerator::cosineSimilarity(a, c), 1.0, 1e-9);
    EXPECT_NEAR(EmbeddingGenerator::cosineSimilarity(a, d), -1.0, 1e-9);
    EXPECT_DOUBLE_EQ(EmbeddingGenerator::cosineSimilarity(a, zero), 0.0);
}

TEST_F(EmbeddingGeneratorTest, CosineRejectsIncompatibleVectors)
{
    EmbeddingVector a{{1.0f, 0.0f, 0.0f}, "model-a"};
    EmbeddingVector shorter{{1.0f, 0.0f}, "model-a"};
    EmbeddingVector other_model{{1.0f, 0.0f, 0.0f}, "model-b"};

    EXPECT_THROW(EmbeddingGenerator::cosineSimilarity(a, shorter), DimensionMismatchError);
    EXPECT_THROW(EmbeddingGenerator::cosineSimilarity(a, other_model), DimensionMismatchError);
}

TEST_F(EmbeddingGeneratorTest, IdenticalImagesHaveUnitSimilarity)
{
    EmbeddingGenerator generator(stub_, policy_);
    NormalizedImage copy = ImageProcessor::decodeAndNormalize(TestImages::scenePng(11));
    EXPECT_NEAR(EmbeddingGenerator::cosineSimilarity(generator.embed(image_), generator.embed(copy)), 1.0, 1e-6);
}

TEST_F(EmbeddingGeneratorTest, CosineIsSymmetric)
{
    EmbeddingGenerator generator(stub_, policy_);
    NormalizedImage other = ImageProcessor::decodeAndNormalize(TestImages::scenePng(12));
    EmbeddingVector a = generator.embed(image_);
    EmbeddingVector b = generator.embed(other);

    EXPECT_EQ(EmbeddingGenerator::cosineSimilarity(a, b), EmbeddingGenerator::cosineSimilarity(b, a));

    EmbeddingVector u{{0.3f, -1.2f, 4.5f}, "m"};
    EmbeddingVector v{{2.0f, 0.7f, -0.1f}, "m"};
    EXPECT_EQ(EmbeddingGenerator::cosineSimilarity(u, v), EmbeddingGenerator::cosineSimilarity(v, u));
}
