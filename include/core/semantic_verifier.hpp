#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/call_context.hpp"
#include "core/image_types.hpp"

enum class SemanticOutcome
{
    RESOLVED,
    NOT_RESOLVED,
    AMBIGUOUS,
    FAILED
};

/**
 * @brief Structured before/after judgment from the vision-language capability
 */
struct SemanticJudgment
{
    SemanticOutcome outcome = SemanticOutcome::FAILED;
    double confidence = 0.0;
    std::string rationale;
    int attempts = 0;
    bool parse_failed = false;
    std::string model_version;
};

/**
 * @brief Request sent to a vision-language capability
 */
struct VlmRequest
{
    std::string prompt;
    std::vector<std::string> images_base64; // before, after
    std::string mime_type = "image/jpeg";
};

/**
 * @brief Vision-language capability returning the raw model text
 *
 * Implementations throw SemanticVerifierFailure on transport failure and SemanticVerifierTimeout when the
 * deadline passes.
 */
class VlmCapability
{
public:
    virtual ~VlmCapability() = default;
    virtual std::string complete(const VlmRequest &request, const CallContext &ctx) = 0;
    virtual std::string modelVersion() const = 0;
};

struct SemanticPolicy
{
    int timeout_ms = 30000;
    int max_attempts = 2;
    int backoff_base_ms = 100;
    int image_jpeg_quality = 85;
};

/**
 * @brief VLM judge. Never throws for capability failures: malformed output becomes AMBIGUOUS with confidence 0,
 * transport failure or timeout becomes FAILED. Cancellation is rethrown.
 */
class SemanticVerifier
{
public:
    SemanticVerifier(std::shared_ptr<VlmCapability> vlm, const SemanticPolicy &policy = SemanticPolicy());

    SemanticJudgment judge(const NormalizedImage &before, const NormalizedImage &after,
                           const std::string &complaint_text, const CancellationToken &token = CancellationToken());

    static std::string buildPrompt(const std::string &complaint_text);

    /// Validate raw model text against the judgment schema.
    static SemanticJudgment parseResponse(const std::string &raw);

    /// Remove markdown code fences and any prose around the outermost JSON object.
    static std::string extractJson(const std::string &raw);

    static std::string outcomeName(SemanticOutcome outcome);
    static std::optional<SemanticOutcome> outcomeFromString(const std::string &name);

private:
    std::shared_ptr<VlmCapability> vlm_;
    SemanticPolicy policy_;
};
