#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/embedding_generator.hpp"
#include "core/error_recovery.hpp"
#include "core/manipulation_detector.hpp"
#include "core/semantic_verifier.hpp"

/**
 * @brief Location and credentials of a remote model service
 */
struct HttpEndpoint
{
    std::string url;  // scheme://host[:port]
    std::string path; // request path on that host
    std::string model;
    std::string api_key; // Sent as a bearer token when non-empty
};

struct HttpCallResult
{
    bool ok = false;
    bool timed_out = false;
    int status = 0;
    std::string error;
    nlohmann::json body;
};

/**
 * @brief JSON-over-HTTP POST bounded by the caller's deadline
 */
class HttpJsonClient
{
public:
    explicit HttpJsonClient(const HttpEndpoint &endpoint);

    /// Never throws for transport errors; inspect the result. Throws OperationCancelledError when cancelled.
    HttpCallResult post(const nlohmann::json &request, const CallContext &ctx) const;

    const HttpEndpoint &endpoint() const { return endpoint_; }

private:
    HttpEndpoint endpoint_;
};

/**
 * @brief Embedding service: {"model", "image", "mime_type"} -> {"embedding": [...], "model_version"}
 */
class HttpEmbeddingCapability : public EmbeddingCapability
{
public:
    explicit HttpEmbeddingCapability(const HttpEndpoint &endpoint);

    EmbeddingVector embed(const cv::Mat &bgr, const CallContext &ctx) override;
    std::string modelVersion() const override { return client_.endpoint().model; }

private:
    HttpJsonClient client_;
    ErrorRecovery::CircuitBreaker breaker_;
};

/**
 * @brief Tamper classifier service: {"model", "image", "ela_residual"} -> {"probability"}
 */
class HttpManipulationClassifier : public ManipulationClassifier
{
public:
    explicit HttpManipulationClassifier(const HttpEndpoint &endpoint);

    double score(const cv::Mat &bgr, const cv::Mat &ela_residual, const CallContext &ctx) override;
    std::string modelVersion() const override { return client_.endpoint().model; }

private:
    HttpJsonClient client_;
    ErrorRecovery::CircuitBreaker breaker_;
};

/**
 * @brief Vision-language model behind an OpenAI-compatible chat completions endpoint
 */
class HttpVlmCapability : public VlmCapability
{
public:
    explicit HttpVlmCapability(const HttpEndpoint &endpoint);

    std::string complete(const VlmRequest &request, const CallContext &ctx) override;
    std::string modelVersion() const override { return client_.endpoint().model; }

    static nlohmann::json buildChatRequest(const std::string &model, const VlmRequest &request);

private:
    HttpJsonClient client_;
    ErrorRecovery::CircuitBreaker breaker_;
};
