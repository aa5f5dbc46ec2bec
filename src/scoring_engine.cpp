#include "core/scoring_engine.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace
{
    double clamp01(double value)
    {
        if (!std::isfinite(value))
            return 0.0;
        return std::max(0.0, std::min(1.0, value));
    }

    std::string fixed3(double value)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3) << value;
        return ss.str();
    }
}

std::string ScoringPolicy::validate() const
{
    const double weights[] = {perceptual_weight, chunk_weight, semantic_weight};
    for (double w : weights)
    {
        if (w < 0.0 || !std::isfinite(w))
            return "signal weights must be non-negative";
    }
    if (std::fabs(perceptual_weight + chunk_weight + semantic_weight - 1.0) > 1e-6)
        return "signal weights must sum to 1";
    if (manipulation_penalty_weight < 0.0 || manipulation_penalty_weight > 1.0)
        return "manipulation penalty weight must be in [0, 1]";
    if (manipulation_ceiling < 0.0 || manipulation_ceiling > 1.0 || recycled_ceiling < 0.0 || recycled_ceiling > 1.0)
        return "ceilings must be in [0, 1]";
    if (reject_threshold < 0.0 || approve_threshold > 1.0 || reject_threshold >= approve_threshold)
        return "thresholds must satisfy 0 <= reject < approve <= 1";
    return "";
}

ScoringEngine::ScoringEngine(const ScoringPolicy &policy) : policy_(policy)
{
    std::string error = policy_.validate();
    if (!error.empty())
    {
        throw std::invalid_argument("Invalid scoring policy: " + error);
    }
}

std::string ScoringEngine::recommendationName(Recommendation recommendation)
{
    switch (recommendation)
    {
    case Recommendation::APPROVE:
        return "APPROVE";
    case Recommendation::REJECT:
        return "REJECT";
    case Recommendation::NEEDS_REVIEW:
        return "NEEDS_REVIEW";
    }
    return "NEEDS_REVIEW";
}

Recommendation ScoringEngine::recommend(double score) const
{
    if (score >= policy_.approve_threshold)
        return Recommendation::APPROVE;
    if (score <= policy_.reject_threshold)
        return Recommendation::REJECT;
    return Recommendation::NEEDS_REVIEW;
}

ChunkSimilarityStats ScoringEngine::aggregateChunkSimilarities(const std::vector<double> &similarities)
{
    ChunkSimilarityStats stats;
    if (similarities.empty())
    {
        return stats;
    }

    std::vector<double> clamped;
    clamped.reserve(similarities.size());
    for (double s : similarities)
    {
        clamped.push_back(clamp01(s));
    }
    std::sort(clamped.begin(), clamped.end());

    const size_t n = clamped.size();
    stats.available = true;
    stats.count = n;
    stats.median = (n % 2 == 1) ? clamped[n / 2] : (clamped[n / 2 - 1] + clamped[n / 2]) / 2.0;
    double total = 0.0;
    for (double s : clamped)
    {
        total += s;
    }
    stats.mean = total / static_cast<double>(n);
    stats.worst = clamped.front();
    return stats;
}

ScoreBreakdown ScoringEngine::score(const ScoringInputs &inputs) const
{
    ScoreBreakdown breakdown;
    breakdown.chunk_stats = aggregateChunkSimilarities(inputs.chunk_similarities);

    SignalContribution perceptual;
    perceptual.name = "perceptual_similarity";
    perceptual.base_weight = policy_.perceptual_weight;
    perceptual.available = inputs.perceptual_similarity.has_value();
    perceptual.raw_value = perceptual.available ? clamp01(*inputs.perceptual_similarity) : 0.0;
    if (!perceptual.available)
        perceptual.note = "perceptual hash unavailable";

    SignalContribution chunk;
    chunk.name = "chunk_similarity";
    chunk.base_weight = policy_.chunk_weight;
    chunk.available = breakdown.chunk_stats.available;
    chunk.raw_value = breakdown.chunk_stats.median;
    if (!chunk.available)
        chunk.note = "chunk embeddings unavailable";

    SignalContribution semantic;
    semantic.name = "semantic_judgment";
    semantic.base_weight = policy_.semantic_weight;
    double semantic_effective_weight = policy_.semantic_weight;
    const double confidence = clamp01(inputs.semantic.confidence);
    switch (inputs.semantic.outcome)
    {
    case SemanticOutcome::RESOLVED:
        semantic.available = true;
        semantic.raw_value = 0.5 + 0.5 * confidence;
        break;
    case SemanticOutcome::NOT_RESOLVED:
        semantic.available = true;
        semantic.raw_value = 0.5 - 0.5 * confidence;
        break;
    case SemanticOutcome::AMBIGUOUS:
        semantic.available = true;
        semantic.raw_value = 0.5;
        semantic_effective_weight = policy_.semantic_weight * confidence;
        semantic.note = "ambiguous judgment, weight scaled by confidence " + fixed3(confidence);
        breakdown.flags.push_back("semantic_ambiguous");
        break;
    case SemanticOutcome::FAILED:
        semantic.available = false;
        semantic.raw_value = 0.5;
        semantic.note = "semantic signal unavailable";
        breakdown.flags.push_back("semantic_unavailable");
        break;
    }

    double effective[3] = {
        perceptual.available ? policy_.perceptual_weight : 0.0,
        chunk.available ? policy_.chunk_weight : 0.0,
        semantic.available ? semantic_effective_weight : 0.0};
    SignalContribution *signals[3] = {&perceptual, &chunk, &semantic};

    double total_weight = effective[0] + effective[1] + effective[2];
    if (total_weight > 0.0)
    {
        for (int i = 0; i < 3; i++)
        {
            signals[i]->weight = effective[i] / total_weight;
            signals[i]->contribution = signals[i]->weight * signals[i]->raw_value;
            breakdown.weighted_sum += signals[i]->contribution;
        }
    }
    else
    {
        breakdown.weighted_sum = 0.5;
        breakdown.flags.push_back("no_similarity_signals");
    }

    double max_likelihood = 0.0;
    for (const ManipulationVerdict *verdict : {&inputs.before_manipulation, &inputs.after_manipulation})
    {
        if (verdict->isKnown())
        {
            max_likelihood = std::max(max_likelihood, clamp01(verdict->likelihood));
        }
    }
    breakdown.manipulation_penalty = policy_.manipulation_penalty_weight * max_likelihood;
    double composite = clamp01(breakdown.weighted_sum - breakdown.manipulation_penalty);

    std::optional<double> ceiling;
    if (inputs.after_manipulation.isKnown() && inputs.after_manipulation.is_manipulated)
    {
        ceiling = policy_.manipulation_ceiling;
        breakdown.flags.push_back("after_image_manipulated");
    }
    if (inputs.before_manipulation.isKnown() && inputs.before_manipulation.is_manipulated)
    {
        ceiling = policy_.manipulation_ceiling;
        breakdown.flags.push_back("before_image_manipulated");
    }
    if (inputs.recycled)
    {
        ceiling = ceiling ? std::min(*ceiling, policy_.recycled_ceiling) : policy_.recycled_ceiling;
        breakdown.flags.push_back("recycled_photo");
    }
    if (ceiling)
    {
        breakdown.ceiling_applied = ceiling;
        composite = std::min(composite, *ceiling);
    }

    for (const auto &entry : {std::make_pair(&inputs.before_manipulation, std::string("before")),
                              std::make_pair(&inputs.after_manipulation, std::string("after"))})
    {
        if (entry.first->status == ManipulationStatus::UNKNOWN)
            breakdown.flags.push_back("manipulation_unknown:" + entry.second);
        else if (entry.first->status == ManipulationStatus::ELA_ONLY)
            breakdown.flags.push_back("manipulation_ela_only:" + entry.second);
    }
    if (inputs.location_mismatch)
    {
        breakdown.flags.push_back("location_mismatch");
    }

    breakdown.composite_score = composite;
    breakdown.recommendation = recommend(composite);

    const bool uncertain = inputs.semantic.outcome == SemanticOutcome::FAILED ||
                           inputs.semantic.outcome == SemanticOutcome::AMBIGUOUS ||
                           !inputs.before_manipulation.isKnown() ||
                           !inputs.after_manipulation.isKnown() ||
                           inputs.location_mismatch ||
                           total_weight <= 0.0;
    if (uncertain && breakdown.recommendation == Recommendation::APPROVE)
    {
        breakdown.recommendation = Recommendation::NEEDS_REVIEW;
        breakdown.review_floor_applied = true;
    }

    breakdown.signals = {perceptual, chunk, semantic};
    breakdown.explanation = explain(breakdown, inputs);

    Logger::debug("Composite score " + fixed3(composite) + " -> " + recommendationName(breakdown.recommendation));
    return breakdown;
}

std::string ScoringEngine::explain(const ScoreBreakdown &breakdown, const ScoringInputs &inputs) const
{
    std::ostringstream out;
    out << "Recommendation: " << recommendationName(breakdown.recommendation)
        << " (composite score " << fixed3(breakdown.composite_score) << ")\n";
    out << "Score breakdown:\n";
    for (const auto &signal : breakdown.signals)
    {
        out << "- " << signal.name << ": ";
        if (signal.available)
        {
            out << "raw " << fixed3(signal.raw_value) << ", weight " << fixed3(signal.weight)
                << " (base " << fixed3(signal.base_weight) << "), contribution " << fixed3(signal.contribution);
        }
        else
        {
            out << "unavailable";
        }
        if (!signal.note.empty())
        {
            out << " [" << signal.note << "]";
        }
        out << "\n";
    }
    if (breakdown.chunk_stats.available)
    {
        out << "Chunk similarity over " << breakdown.chunk_stats.count << " chunks: median "
            << fixed3(breakdown.chunk_stats.median) << ", mean " << fixed3(breakdown.chunk_stats.mean)
            << ", worst " << fixed3(breakdown.chunk_stats.worst) << "\n";
    }
    out << "Weighted sum: " << fixed3(breakdown.weighted_sum) << "\n";
    out << "Manipulation penalty: -" << fixed3(breakdown.manipulation_penalty) << "\n";
    if (breakdown.ceiling_applied)
    {
        out << "Score ceiling " << fixed3(*breakdown.ceiling_applied) << " applied ("
            << (inputs.recycled ? "recycled photo" : "image flagged as manipulated") << ")\n";
    }
    if (breakdown.review_floor_applied)
    {
        out << "Automatic approval withheld: one or more signals were unavailable or uncertain\n";
    }
    if (!breakdown.flags.empty() || !inputs.caveats.empty())
    {
        out << "Caveats:\n";
        for (const auto &flag : breakdown.flags)
        {
            out << "- " << flag << "\n";
        }
        for (const auto &caveat : inputs.caveats)
        {
            out << "- " << caveat << "\n";
        }
    }
    return out.str();
}
