#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/call_context.hpp"
#include "core/image_types.hpp"
#include "core/result_cache.hpp"

enum class ManipulationStatus
{
    FUSED,    // ELA and classifier both contributed
    ELA_ONLY, // Classifier unavailable; reduced confidence
    UNKNOWN   // ELA failed; likelihood must not be trusted
};

/**
 * @brief Error-level analysis output for one image
 */
struct ElaResult
{
    double energy = 0.0;     // 95th percentile of the max-channel residual over non-background pixels
    double score = 0.0;      // energy normalized into [0, 1]
    double mean = 0.0;       // Mean residual over the same pixels
    double peak_ratio = 0.0; // Highest chunk mean divided by the image mean
    std::vector<double> chunk_means;
    cv::Mat residual;        // CV_8UC1 max-channel residual
};

/**
 * @brief Per-image tamper verdict
 */
struct ManipulationVerdict
{
    ManipulationStatus status = ManipulationStatus::UNKNOWN;
    double likelihood = 0.0;
    bool is_manipulated = false;
    bool reduced_confidence = true;
    double ela_energy = 0.0;
    double ela_score = 0.0;
    std::optional<double> classifier_score;
    std::string classifier_version;
    std::vector<double> chunk_ela;
    double ela_peak_ratio = 0.0;
    std::vector<uint8_t> heatmap_png;
    std::string heatmap_ref;
    std::string caveat;

    bool isKnown() const { return status != ManipulationStatus::UNKNOWN; }
};

/**
 * @brief Learned tamper classifier returning a manipulation probability in [0, 1]
 *
 * Implementations throw ManipulationDetectorUnavailable on transport failure or deadline expiry.
 */
class ManipulationClassifier
{
public:
    virtual ~ManipulationClassifier() = default;
    virtual double score(const cv::Mat &bgr, const cv::Mat &ela_residual, const CallContext &ctx) = 0;
    virtual std::string modelVersion() const = 0;
};

struct ManipulationPolicy
{
    int ela_jpeg_quality = 90;
    double ela_percentile = 0.95;
    double ela_energy_scale = 32.0;
    double ela_weight = 0.4;
    double classifier_weight = 0.6;
    double threshold = 0.6;
    int timeout_ms = 10000;
    int max_attempts = 2;
    int backoff_base_ms = 100;
    size_t cache_capacity = 1024;
};

class ManipulationDetector
{
public:
    /**
     * @param classifier May be null; verdicts are then ELA-only
     * @throws std::invalid_argument if fusion weights do not sum to 1 or the threshold is outside [0, 1]
     */
    ManipulationDetector(std::shared_ptr<ManipulationClassifier> classifier,
                         const ManipulationPolicy &policy = ManipulationPolicy());

    /**
     * @brief Analyze one image. Never throws for analysis failures; they surface as ELA_ONLY or UNKNOWN.
     * @throws OperationCancelledError when the token is cancelled
     */
    ManipulationVerdict analyze(const NormalizedImage &image, const GridShape &grid,
                                const CancellationToken &token = CancellationToken());

    static ElaResult errorLevelAnalysis(const cv::Mat &bgr, int jpeg_quality, double percentile,
                                        double energy_scale, const GridShape &grid);

    static std::vector<uint8_t> renderHeatmap(const cv::Mat &residual);

    double fuse(double ela_score, double classifier_score) const;
    bool isManipulated(double likelihood) const { return likelihood >= policy_.threshold; }
    const ManipulationPolicy &policy() const { return policy_; }
    size_t classifierCalls() const { return classifier_calls_.load(); }

private:
    ManipulationVerdict computeVerdict(const NormalizedImage &image, const GridShape &grid, const CancellationToken &token);
    double classify(const cv::Mat &bgr, const cv::Mat &residual, const CancellationToken &token);

    std::shared_ptr<ManipulationClassifier> classifier_;
    ManipulationPolicy policy_;
    ResultCache<ManipulationVerdict> cache_;
    std::atomic<size_t> classifier_calls_{0};
};
