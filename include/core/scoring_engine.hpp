#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/manipulation_detector.hpp"
#include "core/semantic_verifier.hpp"

enum class Recommendation
{
    APPROVE,
    REJECT,
    NEEDS_REVIEW
};

/**
 * @brief Policy constants for signal fusion. Defaults are a starting configuration.
 */
struct ScoringPolicy
{
    double perceptual_weight = 0.25;
    double chunk_weight = 0.35;
    double semantic_weight = 0.40;
    double manipulation_penalty_weight = 0.2;
    double manipulation_ceiling = 0.4;
    double recycled_ceiling = 0.2;
    double approve_threshold = 0.70;
    double reject_threshold = 0.45;

    /// Empty string when valid, otherwise a description of the first violation.
    std::string validate() const;
};

/**
 * @brief One fused signal as it entered the weighted sum
 */
struct SignalContribution
{
    std::string name;
    double raw_value = 0.0;    // Signal value in [0, 1] before weighting
    double base_weight = 0.0;  // Configured weight
    double weight = 0.0;       // Weight actually used after renormalization
    bool available = false;
    double contribution = 0.0; // weight * raw_value
    std::string note;
};

struct ChunkSimilarityStats
{
    bool available = false;
    size_t count = 0;
    double median = 0.0;
    double mean = 0.0;
    double worst = 0.0;
};

struct ScoringInputs
{
    std::optional<double> perceptual_similarity;
    std::vector<double> chunk_similarities; // Index-aligned; empty when unavailable
    ManipulationVerdict before_manipulation;
    ManipulationVerdict after_manipulation;
    SemanticJudgment semantic;
    bool recycled = false;
    bool location_mismatch = false;
    std::vector<std::string> caveats; // Upstream partial failures to carry into the explanation
};

struct ScoreBreakdown
{
    double composite_score = 0.0;
    Recommendation recommendation = Recommendation::NEEDS_REVIEW;
    std::vector<SignalContribution> signals;
    ChunkSimilarityStats chunk_stats;
    double weighted_sum = 0.0;
    double manipulation_penalty = 0.0;
    std::optional<double> ceiling_applied;
    bool review_floor_applied = false;
    std::vector<std::string> flags;
    std::string explanation;
};

/**
 * @brief Deterministic fusion of all upstream signals into a composite score and recommendation
 *
 * 1. Chunk statistic is the median of chunk similarities clamped to [0, 1].
 * 2. Semantic value: RESOLVED 0.5+0.5c, NOT_RESOLVED 0.5-0.5c, AMBIGUOUS 0.5 with weight scaled by c,
 *    FAILED excluded.
 * 3. Weighted sum over available signals, weights renormalized to sum to 1.
 * 4. Minus penalty_weight * max(known manipulation likelihoods), clamped to [0, 1].
 * 5. Ceilings: any flagged image caps at manipulation_ceiling, a recycled proof at recycled_ceiling.
 * 6. Thresholds map the score to a recommendation; uncertainty downgrades APPROVE to NEEDS_REVIEW.
 */
class ScoringEngine
{
public:
    /// @throws std::invalid_argument if the policy is inconsistent
    explicit ScoringEngine(const ScoringPolicy &policy = ScoringPolicy());

    ScoreBreakdown score(const ScoringInputs &inputs) const;

    Recommendation recommend(double score) const;

    static ChunkSimilarityStats aggregateChunkSimilarities(const std::vector<double> &similarities);
    static std::string recommendationName(Recommendation recommendation);

    const ScoringPolicy &policy() const { return policy_; }

private:
    std::string explain(const ScoreBreakdown &breakdown, const ScoringInputs &inputs) const;

    ScoringPolicy policy_;
};
