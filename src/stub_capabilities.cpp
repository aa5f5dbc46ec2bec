#include "core/stub_capabilities.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/imgproc.hpp>

StubEmbeddingCapability::StubEmbeddingCapability(const std::string &model_version)
    : model_version_(model_version)
{
}

EmbeddingVector StubEmbeddingCapability::embed(const cv::Mat &bgr, const CallContext &ctx)
{
    calls_.fetch_add(1);
    ctx.cancel_token.throwIfCancelled("stub embedding");

    int latency = latency_ms_.load();
    if (latency > 0 && !ctx.waitFor(latency, "stub embedding"))
    {
        throw EmbeddingTimeoutError("Stub embedding exceeded its deadline");
    }

    switch (mode_.load())
    {
    case Mode::UNAVAILABLE:
        throw EmbeddingUnavailableError("Stub embedding service unavailable");
    case Mode::TIMEOUT:
        throw EmbeddingTimeoutError("Stub embedding timed out");
    case Mode::NORMAL:
        break;
    }
    if (transient_failures_.load() > 0 && transient_failures_.fetch_sub(1) > 0)
    {
        throw EmbeddingUnavailableError("Stub embedding transient failure");
    }

    if (bgr.empty())
    {
        throw EmbeddingUnavailableError("Cannot embed an empty image");
    }

    cv::Mat grid;
    cv::resize(bgr, grid, cv::Size(4, 4), 0, 0, cv::INTER_AREA);

    EmbeddingVector vector;
    vector.model_version = model_version_;
    vector.values.reserve(48);
    for (int y = 0; y < grid.rows; y++)
    {
        for (int x = 0; x < grid.cols; x++)
        {
            const cv::Vec3b &px = grid.at<cv::Vec3b>(y, x);
            for (int c = 0; c < 3; c++)
            {
                // Offset keeps black regions away from the zero vector
                vector.values.push_back(0.05f + static_cast<float>(px[c]) / 255.0f);
            }
        }
    }
    return vector;
}

StubManipulationClassifier::StubManipulationClassifier(double score, const std::string &model_version)
    : model_version_(model_version), score_(score)
{
}

double StubManipulationClassifier::score(const cv::Mat &, const cv::Mat &, const CallContext &ctx)
{
    calls_.fetch_add(1);
    ctx.cancel_token.throwIfCancelled("stub classifier");
    if (failing_.load())
    {
        throw ManipulationDetectorUnavailable("Stub classifier unavailable");
    }
    return score_.load();
}

StubVlmCapability::StubVlmCapability(const std::string &response, const std::string &model_version)
    : model_version_(model_version), response_(response)
{
}

std::string StubVlmCapability::resolvedResponse(double confidence)
{
    nlohmann::json body = {
        {"outcome", "RESOLVED"},
        {"confidence", confidence},
        {"rationale", "The reported problem is no longer visible at the same location."}};
    return body.dump();
}

void StubVlmCapability::setResponse(const std::string &response)
{
    std::lock_guard<std::mutex> lock(mutex_);
    response_ = response;
}

VlmRequest StubVlmCapability::lastRequest() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
}

std::string StubVlmCapability::complete(const VlmRequest &request, const CallContext &ctx)
{
    calls_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_request_ = request;
    }

    int latency = latency_ms_.load();
    if (latency > 0 && !ctx.waitFor(latency, "stub vlm"))
    {
        throw SemanticVerifierTimeout("Stub VLM exceeded its deadline");
    }
    ctx.cancel_token.throwIfCancelled("stub vlm");
    if (failing_.load())
    {
        throw SemanticVerifierFailure("Stub VLM unavailable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Logger::trace("Stub VLM returning scripted response");
    return response_;
}
