#include "core/http_capabilities.hpp"
#include "core/image_processor.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <chrono>

using json = nlohmann::json;

HttpJsonClient::HttpJsonClient(const HttpEndpoint &endpoint) : endpoint_(endpoint)
{
}

HttpCallResult HttpJsonClient::post(const json &request, const CallContext &ctx) const
{
    HttpCallResult result;
    ctx.cancel_token.throwIfCancelled("POST " + endpoint_.path);

    int remaining_ms = ctx.remainingMs();
    if (remaining_ms <= 0)
    {
        result.timed_out = true;
        result.error = "deadline passed before request was sent";
        return result;
    }

    httplib::Client client(endpoint_.url);
    client.set_connection_timeout(std::chrono::milliseconds(remaining_ms));
    client.set_read_timeout(std::chrono::milliseconds(remaining_ms));
    client.set_write_timeout(std::chrono::milliseconds(remaining_ms));
    if (!endpoint_.api_key.empty())
    {
        client.set_bearer_token_auth(endpoint_.api_key);
    }

    auto response = client.Post(endpoint_.path, request.dump(), "application/json");
    ctx.cancel_token.throwIfCancelled("POST " + endpoint_.path);
    if (!response)
    {
        result.error = httplib::to_string(response.error());
        result.timed_out = ctx.expired();
        return result;
    }

    result.status = response->status;
    if (response->status < 200 || response->status >= 300)
    {
        result.error = "HTTP " + std::to_string(response->status);
        return result;
    }

    result.body = json::parse(response->body, nullptr, false);
    if (result.body.is_discarded())
    {
        result.error = "response body is not JSON";
        return result;
    }
    if (!result.body.is_object())
    {
        result.error = "response body is not a JSON object";
        return result;
    }
    result.ok = true;
    return result;
}

HttpEmbeddingCapability::HttpEmbeddingCapability(const HttpEndpoint &endpoint)
    : client_(endpoint), breaker_("embedding " + endpoint.url)
{
}

EmbeddingVector HttpEmbeddingCapability::embed(const cv::Mat &bgr, const CallContext &ctx)
{
    return breaker_.call<EmbeddingUnavailableError>([&]()
                                                    {
        json request = {
            {"model", client_.endpoint().model},
            {"image", ImageProcessor::toBase64(ImageProcessor::encodeJpeg(bgr, 90))},
            {"mime_type", "image/jpeg"}};

        HttpCallResult response = client_.post(request, ctx);
        if (response.timed_out)
        {
            throw EmbeddingTimeoutError("Embedding request timed out: " + response.error);
        }
        if (!response.ok)
        {
            throw EmbeddingUnavailableError("Embedding request failed: " + response.error);
        }

        const json &values = response.body.value("embedding", json());
        if (!values.is_array() || values.empty())
        {
            throw EmbeddingUnavailableError("Embedding response has no 'embedding' array");
        }
        EmbeddingVector vector;
        vector.values.reserve(values.size());
        for (const auto &v : values)
        {
            if (!v.is_number())
            {
                throw EmbeddingUnavailableError("Embedding response contains a non-numeric value");
            }
            vector.values.push_back(v.get<float>());
        }
        vector.model_version = response.body.value("model_version", client_.endpoint().model);
        return vector; });
}

HttpManipulationClassifier::HttpManipulationClassifier(const HttpEndpoint &endpoint)
    : client_(endpoint), breaker_("manipulation classifier " + endpoint.url)
{
}

double HttpManipulationClassifier::score(const cv::Mat &bgr, const cv::Mat &ela_residual, const CallContext &ctx)
{
    return breaker_.call<ManipulationDetectorUnavailable>([&]()
                                                          {
        json request = {
            {"model", client_.endpoint().model},
            {"image", ImageProcessor::toBase64(ImageProcessor::encodeJpeg(bgr, 95))},
            {"ela_residual", ImageProcessor::toBase64(ImageProcessor::encodePng(ela_residual))}};

        HttpCallResult response = client_.post(request, ctx);
        if (!response.ok)
        {
            throw ManipulationDetectorUnavailable(std::string(response.timed_out ? "Classifier request timed out: "
                                                                                 : "Classifier request failed: ") +
                                                  response.error);
        }
        auto probability = response.body.find("probability");
        if (probability == response.body.end() || !probability->is_number())
        {
            throw ManipulationDetectorUnavailable("Classifier response has no numeric 'probability'");
        }
        return probability->get<double>(); });
}

HttpVlmCapability::HttpVlmCapability(const HttpEndpoint &endpoint)
    : client_(endpoint), breaker_("vlm " + endpoint.url)
{
}

json HttpVlmCapability::buildChatRequest(const std::string &model, const VlmRequest &request)
{
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", request.prompt}});
    for (const auto &image : request.images_base64)
    {
        content.push_back({{"type", "image_url"},
                           {"image_url", {{"url", "data:" + request.mime_type + ";base64," + image}}}});
    }
    return json{
        {"model", model},
        {"temperature", 0},
        {"response_format", {{"type", "json_object"}}},
        {"messages", json::array({json{{"role", "user"}, {"content", content}}})}};
}

std::string HttpVlmCapability::complete(const VlmRequest &request, const CallContext &ctx)
{
    return breaker_.call<SemanticVerifierFailure>([&]()
                                                  {
        HttpCallResult response = client_.post(buildChatRequest(client_.endpoint().model, request), ctx);
        if (response.timed_out)
        {
            throw SemanticVerifierTimeout("VLM request timed out: " + response.error);
        }
        if (!response.ok)
        {
            throw SemanticVerifierFailure("VLM request failed: " + response.error);
        }

        const json &choices = response.body.value("choices", json());
        if (!choices.is_array() || choices.empty() || !choices[0].contains("message") ||
            !choices[0]["message"].contains("content") || !choices[0]["message"]["content"].is_string())
        {
            throw SemanticVerifierFailure("VLM response has no message content");
        }
        return choices[0]["message"]["content"].get<std::string>(); });
}
