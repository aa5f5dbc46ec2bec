#include "core/embedding_generator.hpp"
#include "core/error_recovery.hpp"
#include "core/image_processor.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<EmbeddingCapability> capability, const EmbeddingPolicy &policy)
    : capability_(std::move(capability)), policy_(policy), cache_(policy.cache_capacity)
{
}

std::string EmbeddingGenerator::modelVersion() const
{
    return capability_ ? capability_->modelVersion() : std::string("none");
}

EmbeddingVector EmbeddingGenerator::embed(const NormalizedImage &image, const CancellationToken &token)
{
    const std::string key = image.content_hash + "|" + modelVersion() + "|full";
    return cache_.getOrCompute(key, token, [&]()
                               { return embedWithRetry(image.pixels, "embed " + image.content_hash.substr(0, 12), token); });
}

EmbeddingVector EmbeddingGenerator::embed(const NormalizedImage &image, const Chunk &chunk, const GridShape &grid,
                                          const CancellationToken &token)
{
    const std::string key = image.content_hash + "|" + modelVersion() + "|" + std::to_string(grid.rows) + "x" +
                            std::to_string(grid.cols) + "#" + std::to_string(chunk.index);
    return cache_.getOrCompute(key, token, [&]()
                               { return embedWithRetry(ImageProcessor::chunkPixels(image, chunk),
                                                       "embed chunk " + std::to_string(chunk.index) + " of " +
                                                           image.content_hash.substr(0, 12),
                                                       token); });
}

std::vector<EmbeddingVector> EmbeddingGenerator::embedChunks(const NormalizedImage &image, const std::vector<Chunk> &chunks,
                                                             const GridShape &grid, const CancellationToken &token)
{
    std::vector<EmbeddingVector> vectors;
    vectors.reserve(chunks.size());
    for (const auto &c : chunks)
    {
        token.throwIfCancelled("chunk embedding");
        vectors.push_back(embed(image, c, grid, token));
    }
    return vectors;
}

EmbeddingVector EmbeddingGenerator::embedWithRetry(const cv::Mat &pixels, const std::string &label,
                                                   const CancellationToken &token)
{
    if (!capability_)
    {
        throw EmbeddingUnavailableError("No embedding capability configured");
    }

    // Timeouts are not retried: the signal is already late
    auto retryable = [](const std::exception &e)
    {
        return dynamic_cast<const EmbeddingTimeoutError *>(&e) == nullptr;
    };

    EmbeddingVector vector = ErrorRecovery::retryWithBackoff(
        [&](int attempt)
        {
            capability_calls_.fetch_add(1);
            Logger::trace(label + " (attempt " + std::to_string(attempt + 1) + ")");
            CallContext ctx = CallContext::withTimeout(policy_.timeout_ms, token);
            try
            {
                return capability_->embed(pixels, ctx);
            }
            catch (const VerificationError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw EmbeddingUnavailableError(std::string("Embedding capability error: ") + e.what());
            }
        },
        policy_.max_attempts, label, retryable, token, policy_.backoff_base_ms);

    if (vector.values.empty())
    {
        throw EmbeddingUnavailableError("Embedding capability returned an empty vector for " + label);
    }
    if (vector.model_version.empty())
    {
        vector.model_version = capability_->modelVersion();
    }
    return vector;
}

double EmbeddingGenerator::cosineSimilarity(const EmbeddingVector &a, const EmbeddingVector &b)
{
    if (a.dimension() != b.dimension())
    {
        throw DimensionMismatchError("Cannot compare embeddings of dimension " + std::to_string(a.dimension()) +
                                     " and " + std::to_string(b.dimension()));
    }
    if (a.model_version != b.model_version)
    {
        throw DimensionMismatchError("Cannot compare embeddings from model versions '" + a.model_version +
                                     "' and '" + b.model_version + "'");
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.values.size(); i++)
    {
        dot += static_cast<double>(a.values[i]) * b.values[i];
        norm_a += static_cast<double>(a.values[i]) * a.values[i];
        norm_b += static_cast<double>(b.values[i]) * b.values[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0)
    {
        return 0.0;
    }
    double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return std::max(-1.0, std::min(1.0, similarity));
}
