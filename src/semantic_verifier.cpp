#include "core/semantic_verifier.hpp"
#include "core/error_recovery.hpp"
#include "core/image_processor.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

using json = nlohmann::json;

namespace
{
    SemanticJudgment malformed(const std::string &reason)
    {
        SemanticJudgment judgment;
        judgment.outcome = SemanticOutcome::AMBIGUOUS;
        judgment.confidence = 0.0;
        judgment.rationale = "Unparseable model response: " + reason;
        judgment.parse_failed = true;
        return judgment;
    }
}

SemanticVerifier::SemanticVerifier(std::shared_ptr<VlmCapability> vlm, const SemanticPolicy &policy)
    : vlm_(std::move(vlm)), policy_(policy)
{
}

std::string SemanticVerifier::outcomeName(SemanticOutcome outcome)
{
    switch (outcome)
    {
    case SemanticOutcome::RESOLVED:
        return "RESOLVED";
    case SemanticOutcome::NOT_RESOLVED:
        return "NOT_RESOLVED";
    case SemanticOutcome::AMBIGUOUS:
        return "AMBIGUOUS";
    case SemanticOutcome::FAILED:
        return "FAILED";
    }
    return "FAILED";
}

std::optional<SemanticOutcome> SemanticVerifier::outcomeFromString(const std::string &name)
{
    std::string normalized;
    for (char c : name)
    {
        if (c == ' ' || c == '-')
            normalized.push_back('_');
        else
            normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (normalized == "RESOLVED")
        return SemanticOutcome::RESOLVED;
    if (normalized == "NOT_RESOLVED")
        return SemanticOutcome::NOT_RESOLVED;
    if (normalized == "AMBIGUOUS")
        return SemanticOutcome::AMBIGUOUS;
    if (normalized == "FAILED")
        return SemanticOutcome::FAILED;
    return std::nullopt;
}

std::string SemanticVerifier::buildPrompt(const std::string &complaint_text)
{
    std::string description = complaint_text.empty() ? std::string("(no description provided)") : complaint_text;
    return "You are verifying whether a civic complaint has been resolved.\n"
           "The first image was taken when the complaint was filed (BEFORE).\n"
           "The second image was submitted as proof that the work is done (AFTER).\n"
           "Complaint description: " +
           description + "\n\n"
                         "Decide whether the AFTER image shows the same location with the reported problem fixed.\n"
                         "Respond with ONLY a JSON object, no markdown, in exactly this form:\n"
                         "{\"outcome\": \"RESOLVED\" | \"NOT_RESOLVED\" | \"AMBIGUOUS\", "
                         "\"confidence\": <number between 0 and 1>, "
                         "\"rationale\": \"<one or two sentences>\"}\n"
                         "Use AMBIGUOUS when the images do not allow a confident decision.";
}

std::string SemanticVerifier::extractJson(const std::string &raw)
{
    std::string text = raw;

    auto fence = text.find("```");
    if (fence != std::string::npos)
    {
        auto body_start = text.find('\n', fence);
        auto closing = body_start == std::string::npos ? std::string::npos : text.find("```", body_start);
        if (body_start != std::string::npos && closing != std::string::npos)
        {
            text = text.substr(body_start + 1, closing - body_start - 1);
        }
    }

    auto open = text.find('{');
    auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open)
    {
        return text;
    }
    return text.substr(open, close - open + 1);
}

SemanticJudgment SemanticVerifier::parseResponse(const std::string &raw)
{
    json parsed = json::parse(extractJson(raw), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return malformed("not a JSON object");
    }

    if (!parsed.contains("outcome") || !parsed["outcome"].is_string())
    {
        return malformed("missing string field 'outcome'");
    }
    auto outcome = outcomeFromString(parsed["outcome"].get<std::string>());
    if (!outcome)
    {
        return malformed("unknown outcome '" + parsed["outcome"].get<std::string>() + "'");
    }

    if (!parsed.contains("confidence") || !parsed["confidence"].is_number())
    {
        return malformed("missing numeric field 'confidence'");
    }
    double confidence = parsed["confidence"].get<double>();
    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0)
    {
        return malformed("confidence " + std::to_string(confidence) + " outside [0, 1]");
    }

    SemanticJudgment judgment;
    judgment.outcome = *outcome;
    judgment.confidence = confidence;
    if (parsed.contains("rationale") && parsed["rationale"].is_string())
    {
        judgment.rationale = parsed["rationale"].get<std::string>();
    }
    return judgment;
}

SemanticJudgment SemanticVerifier::judge(const NormalizedImage &before, const NormalizedImage &after,
                                         const std::string &complaint_text, const CancellationToken &token)
{
    token.throwIfCancelled("semantic judgment");

    SemanticJudgment judgment;
    if (!vlm_)
    {
        judgment.outcome = SemanticOutcome::FAILED;
        judgment.rationale = "No vision-language capability configured";
        return judgment;
    }
    judgment.model_version = vlm_->modelVersion();

    VlmRequest request;
    request.prompt = buildPrompt(complaint_text);
    try
    {
        request.images_base64.push_back(ImageProcessor::toBase64(ImageProcessor::encodeJpeg(before.pixels, policy_.image_jpeg_quality)));
        request.images_base64.push_back(ImageProcessor::toBase64(ImageProcessor::encodeJpeg(after.pixels, policy_.image_jpeg_quality)));
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to encode images for semantic judgment: " + std::string(e.what()));
        judgment.outcome = SemanticOutcome::FAILED;
        judgment.rationale = std::string("Could not encode images: ") + e.what();
        return judgment;
    }

    int attempts = 0;
    std::string raw;
    try
    {
        raw = ErrorRecovery::retryWithBackoff(
            [&](int attempt)
            {
                attempts = attempt + 1;
                CallContext ctx = CallContext::withTimeout(policy_.timeout_ms, token);
                try
                {
                    return vlm_->complete(request, ctx);
                }
                catch (const VerificationError &)
                {
                    throw;
                }
                catch (const std::exception &e)
                {
                    throw SemanticVerifierFailure(std::string("VLM capability error: ") + e.what());
                }
            },
            policy_.max_attempts, "semantic judgment", [](const std::exception &)
            { return true; },
            token, policy_.backoff_base_ms);
    }
    catch (const OperationCancelledError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        Logger::warn("Semantic judgment unavailable after " + std::to_string(attempts) + " attempt(s): " + e.what());
        judgment.outcome = SemanticOutcome::FAILED;
        judgment.confidence = 0.0;
        judgment.rationale = std::string("Vision-language capability unavailable: ") + e.what();
        judgment.attempts = attempts;
        return judgment;
    }

    SemanticJudgment parsed = parseResponse(raw);
    parsed.attempts = attempts;
    parsed.model_version = judgment.model_version;
    if (parsed.parse_failed)
    {
        Logger::warn("Malformed VLM response treated as AMBIGUOUS: " + raw.substr(0, 200));
    }
    else
    {
        Logger::debug("Semantic judgment: " + outcomeName(parsed.outcome) + " (confidence " +
                      std::to_string(parsed.confidence) + ")");
    }
    return parsed;
}
