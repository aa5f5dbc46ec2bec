#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/call_context.hpp"
#include "core/image_types.hpp"
#include "core/result_cache.hpp"

/**
 * @brief Dense embedding with its declared metric and producing model version
 */
struct EmbeddingVector
{
    std::vector<float> values;
    std::string model_version;
    std::string metric = "cosine";

    size_t dimension() const { return values.size(); }
};

/**
 * @brief Pretrained visual-embedding capability
 *
 * Implementations throw EmbeddingUnavailableError on transport/auth failure and EmbeddingTimeoutError when
 * ctx.deadline passes, and must honour ctx.cancel_token while waiting.
 */
class EmbeddingCapability
{
public:
    virtual ~EmbeddingCapability() = default;
    virtual EmbeddingVector embed(const cv::Mat &bgr, const CallContext &ctx) = 0;
    virtual std::string modelVersion() const = 0;
};

struct EmbeddingPolicy
{
    int timeout_ms = 10000;
    int max_attempts = 2;
    int backoff_base_ms = 100;
    size_t cache_capacity = 4096;
};

/**
 * @brief Embeds whole images and chunks through an EmbeddingCapability with bounded retries and a
 * content-addressed single-flight cache
 */
class EmbeddingGenerator
{
public:
    EmbeddingGenerator(std::shared_ptr<EmbeddingCapability> capability, const EmbeddingPolicy &policy = EmbeddingPolicy());

    EmbeddingVector embed(const NormalizedImage &image, const CancellationToken &token = CancellationToken());
    EmbeddingVector embed(const NormalizedImage &image, const Chunk &chunk, const GridShape &grid,
                          const CancellationToken &token = CancellationToken());

    /// Chunk embeddings in chunk order. Fails as a whole if any chunk fails.
    std::vector<EmbeddingVector> embedChunks(const NormalizedImage &image, const std::vector<Chunk> &chunks,
                                             const GridShape &grid, const CancellationToken &token = CancellationToken());

    /**
     * @brief Cosine similarity in [-1, 1]; 0 when either vector has zero norm
     * @throws DimensionMismatchError when dimensionality or model version differ
     */
    static double cosineSimilarity(const EmbeddingVector &a, const EmbeddingVector &b);

    std::string modelVersion() const;
    size_t capabilityCalls() const { return capability_calls_.load(); }
    const ResultCache<EmbeddingVector> &cache() const { return cache_; }

private:
    EmbeddingVector embedWithRetry(const cv::Mat &pixels, const std::string &label, const CancellationToken &token);

    std::shared_ptr<EmbeddingCapability> capability_;
    EmbeddingPolicy policy_;
    ResultCache<EmbeddingVector> cache_;
    std::atomic<size_t> capability_calls_{0};
};
