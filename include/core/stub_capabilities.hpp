#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include "core/embedding_generator.hpp"
#include "core/manipulation_detector.hpp"
#include "core/semantic_verifier.hpp"

/**
 * @brief Deterministic offline embedding: 4x4 area-averaged BGR grid, 48 dimensions
 */
class StubEmbeddingCapability : public EmbeddingCapability
{
public:
    enum class Mode
    {
        NORMAL,
        UNAVAILABLE,
        TIMEOUT
    };

    explicit StubEmbeddingCapability(const std::string &model_version = "stub-color-grid-v1");

    EmbeddingVector embed(const cv::Mat &bgr, const CallContext &ctx) override;
    std::string modelVersion() const override { return model_version_; }

    void setMode(Mode mode) { mode_.store(mode); }
    void setLatencyMs(int latency_ms) { latency_ms_.store(latency_ms); }
    /// The next n calls fail with EmbeddingUnavailableError.
    void setTransientFailures(int n) { transient_failures_.store(n); }
    size_t calls() const { return calls_.load(); }

private:
    std::string model_version_;
    std::atomic<Mode> mode_{Mode::NORMAL};
    std::atomic<int> latency_ms_{0};
    std::atomic<int> transient_failures_{0};
    std::atomic<size_t> calls_{0};
};

/**
 * @brief Classifier returning a fixed probability
 */
class StubManipulationClassifier : public ManipulationClassifier
{
public:
    explicit StubManipulationClassifier(double score = 0.0, const std::string &model_version = "stub-classifier-v1");

    double score(const cv::Mat &bgr, const cv::Mat &ela_residual, const CallContext &ctx) override;
    std::string modelVersion() const override { return model_version_; }

    void setScore(double score) { score_.store(score); }
    void setFailing(bool failing) { failing_.store(failing); }
    size_t calls() const { return calls_.load(); }

private:
    std::string model_version_;
    std::atomic<double> score_;
    std::atomic<bool> failing_{false};
    std::atomic<size_t> calls_{0};
};

/**
 * @brief VLM returning a scripted response
 */
class StubVlmCapability : public VlmCapability
{
public:
    explicit StubVlmCapability(const std::string &response = resolvedResponse(0.9),
                               const std::string &model_version = "stub-vlm-v1");

    std::string complete(const VlmRequest &request, const CallContext &ctx) override;
    std::string modelVersion() const override { return model_version_; }

    void setResponse(const std::string &response);
    void setFailing(bool failing) { failing_.store(failing); }
    /// Simulated service latency; calls whose deadline passes first throw SemanticVerifierTimeout.
    void setLatencyMs(int latency_ms) { latency_ms_.store(latency_ms); }
    size_t calls() const { return calls_.load(); }
    VlmRequest lastRequest() const;

    static std::string resolvedResponse(double confidence);

private:
    std::string model_version_;
    mutable std::mutex mutex_;
    std::string response_;
    VlmRequest last_request_;
    std::atomic<bool> failing_{false};
    std::atomic<int> latency_ms_{0};
    std::atomic<size_t> calls_{0};
};
