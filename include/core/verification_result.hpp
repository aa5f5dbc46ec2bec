#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/manipulation_detector.hpp"
#include "core/scoring_engine.hpp"
#include "core/semantic_verifier.hpp"
#include "core/verification_run.hpp"

/**
 * @brief Reference to an ingested image asset
 */
struct AssetRef
{
    std::string id;
    std::string content_hash;
    std::string kind;    // "complaint" or "proof"
    bool durable = true; // false when the store rejected the write
};

/**
 * @brief Everything one verification run produced. Raw signals are kept next to the fused score.
 */
struct CompositeVerificationResult
{
    std::string run_id;
    std::string complaint_id;
    std::string proof_id;
    std::string created_at;

    std::string before_phash;
    std::string after_phash;
    std::optional<int> perceptual_distance;
    std::optional<double> perceptual_similarity;

    std::vector<double> chunk_similarities; // Raw per-chunk cosine, index-aligned
    std::optional<double> embedding_similarity;
    std::string embedding_model_version;

    ManipulationVerdict before_manipulation;
    ManipulationVerdict after_manipulation;
    SemanticJudgment semantic;

    bool recycled = false;
    std::string recycled_match_proof_id;
    std::optional<int> recycled_distance;

    std::optional<double> location_distance_m;
    bool location_mismatch = false;

    ScoreBreakdown score;
    std::string review_status;
    std::vector<std::string> caveats;

    RunState final_state = RunState::RECEIVED;
    std::vector<RunTransition> state_history;
    bool durability_warning = false;
    std::string durability_message;

    double compositeScore() const { return score.composite_score; }
    Recommendation recommendation() const { return score.recommendation; }
};

/// Review queue status a fresh result starts in.
std::string reviewStatusFor(Recommendation recommendation);

nlohmann::json toJson(const ManipulationVerdict &verdict);
nlohmann::json toJson(const SemanticJudgment &judgment);
nlohmann::json toJson(const CompositeVerificationResult &result);

std::string manipulationStatusName(ManipulationStatus status);
