#include "core/verification_result.hpp"
#include "database/persistent_store.hpp"

using json = nlohmann::json;

namespace
{
    template <typename T>
    json optionalToJson(const std::optional<T> &value)
    {
        return value ? json(*value) : json(nullptr);
    }
}

std::string reviewStatusFor(Recommendation recommendation)
{
    switch (recommendation)
    {
    case Recommendation::APPROVE:
        return ReviewStatus::AUTO_APPROVED;
    case Recommendation::REJECT:
        return ReviewStatus::AUTO_REJECTED;
    case Recommendation::NEEDS_REVIEW:
        return ReviewStatus::PENDING_REVIEW;
    }
    return ReviewStatus::PENDING_REVIEW;
}

std::string manipulationStatusName(ManipulationStatus status)
{
    switch (status)
    {
    case ManipulationStatus::FUSED:
        return "FUSED";
    case ManipulationStatus::ELA_ONLY:
        return "ELA_ONLY";
    case ManipulationStatus::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

json toJson(const ManipulationVerdict &verdict)
{
    return json{
        {"status", manipulationStatusName(verdict.status)},
        {"likelihood", verdict.likelihood},
        {"is_manipulated", verdict.is_manipulated},
        {"reduced_confidence", verdict.reduced_confidence},
        {"ela_energy", verdict.ela_energy},
        {"ela_score", verdict.ela_score},
        {"classifier_score", optionalToJson(verdict.classifier_score)},
        {"classifier_version", verdict.classifier_version},
        {"chunk_ela", verdict.chunk_ela},
        {"ela_peak_ratio", verdict.ela_peak_ratio},
        {"heatmap_ref", verdict.heatmap_ref.empty() ? json(nullptr) : json(verdict.heatmap_ref)},
        {"caveat", verdict.caveat}};
}

json toJson(const SemanticJudgment &judgment)
{
    return json{
        {"outcome", SemanticVerifier::outcomeName(judgment.outcome)},
        {"confidence", judgment.confidence},
        {"rationale", judgment.rationale},
        {"attempts", judgment.attempts},
        {"parse_failed", judgment.parse_failed},
        {"model_version", judgment.model_version}};
}

json toJson(const CompositeVerificationResult &result)
{
    json signals = json::array();
    for (const auto &signal : result.score.signals)
    {
        signals.push_back(json{
            {"name", signal.name},
            {"raw_value", signal.raw_value},
            {"base_weight", signal.base_weight},
            {"weight", signal.weight},
            {"available", signal.available},
            {"contribution", signal.contribution},
            {"note", signal.note}});
    }

    json history = json::array();
    for (const auto &transition : result.state_history)
    {
        history.push_back(json{
            {"state", VerificationRun::stateName(transition.state)},
            {"at", transition.at},
            {"note", transition.note}});
    }

    const auto &stats = result.score.chunk_stats;
    json doc;
    doc["run_id"] = result.run_id;
    doc["complaint_id"] = result.complaint_id;
    doc["proof_id"] = result.proof_id;
    doc["created_at"] = result.created_at;
    doc["perceptual_hash"] = {
        {"before", result.before_phash},
        {"after", result.after_phash},
        {"distance", optionalToJson(result.perceptual_distance)},
        {"similarity", optionalToJson(result.perceptual_similarity)}};
    doc["chunk_similarity"] = {
        {"available", stats.available},
        {"count", stats.count},
        {"median", stats.median},
        {"mean", stats.mean},
        {"worst", stats.worst},
        {"values", result.chunk_similarities}};
    doc["embedding_similarity"] = optionalToJson(result.embedding_similarity);
    doc["embedding_model_version"] = result.embedding_model_version;
    doc["manipulation"] = {
        {"before", toJson(result.before_manipulation)},
        {"after", toJson(result.after_manipulation)}};
    doc["semantic_judgment"] = toJson(result.semantic);
    doc["recycled"] = {
        {"is_recycled", result.recycled},
        {"matched_proof_id", result.recycled_match_proof_id.empty() ? json(nullptr) : json(result.recycled_match_proof_id)},
        {"distance", optionalToJson(result.recycled_distance)}};
    doc["location"] = {
        {"distance_m", optionalToJson(result.location_distance_m)},
        {"mismatch", result.location_mismatch}};
    doc["composite_score"] = result.score.composite_score;
    doc["recommendation"] = ScoringEngine::recommendationName(result.score.recommendation);
    doc["review_status"] = result.review_status;
    doc["signals"] = signals;
    doc["weighted_sum"] = result.score.weighted_sum;
    doc["manipulation_penalty"] = result.score.manipulation_penalty;
    doc["ceiling_applied"] = optionalToJson(result.score.ceiling_applied);
    doc["review_floor_applied"] = result.score.review_floor_applied;
    doc["flags"] = result.score.flags;
    doc["caveats"] = result.caveats;
    doc["explanation"] = result.score.explanation;
    doc["state"] = VerificationRun::stateName(result.final_state);
    doc["state_history"] = history;
    doc["durability_warning"] = result.durability_warning;
    doc["durability_message"] = result.durability_message;
    return doc;
}
