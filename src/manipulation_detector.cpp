#include "core/manipulation_detector.hpp"
#include "core/error_recovery.hpp"
#include "core/image_processor.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace
{
    // Gray levels outside this band carry little recompression signal
    constexpr int kBackgroundLow = 8;
    constexpr int kBackgroundHigh = 247;
}

ManipulationDetector::ManipulationDetector(std::shared_ptr<ManipulationClassifier> classifier,
                                           const ManipulationPolicy &policy)
    : classifier_(std::move(classifier)), policy_(policy), cache_(policy.cache_capacity)
{
    if (std::fabs(policy_.ela_weight + policy_.classifier_weight - 1.0) > 1e-6)
    {
        throw std::invalid_argument("Manipulation fusion weights must sum to 1 (ela=" +
                                    std::to_string(policy_.ela_weight) + ", classifier=" +
                                    std::to_string(policy_.classifier_weight) + ")");
    }
    if (policy_.threshold < 0.0 || policy_.threshold > 1.0)
    {
        throw std::invalid_argument("Manipulation threshold must be in [0, 1]");
    }
    if (policy_.ela_jpeg_quality < 1 || policy_.ela_jpeg_quality > 100 || policy_.ela_energy_scale <= 0.0)
    {
        throw std::invalid_argument("Invalid ELA parameters");
    }
}

double ManipulationDetector::fuse(double ela_score, double classifier_score) const
{
    double fused = policy_.ela_weight * ela_score + policy_.classifier_weight * classifier_score;
    return std::max(0.0, std::min(1.0, fused));
}

ManipulationVerdict ManipulationDetector::analyze(const NormalizedImage &image, const GridShape &grid,
                                                  const CancellationToken &token)
{
    token.throwIfCancelled("manipulation analysis");

    const bool has_classifier = static_cast<bool>(classifier_);
    const std::string key = image.content_hash + "|" + (has_classifier ? classifier_->modelVersion() : "ela") + "|" +
                            std::to_string(grid.rows) + "x" + std::to_string(grid.cols);

    return cache_.getOrCompute(
        key, token, [&]()
        { return computeVerdict(image, grid, token); },
        [has_classifier](const ManipulationVerdict &verdict)
        {
            // Degraded verdicts are recomputed on the next request
            return verdict.status == ManipulationStatus::FUSED ||
                   (!has_classifier && verdict.status == ManipulationStatus::ELA_ONLY);
        });
}

ManipulationVerdict ManipulationDetector::computeVerdict(const NormalizedImage &image, const GridShape &grid,
                                                         const CancellationToken &token)
{
    const std::string label = image.content_hash.substr(0, 12);
    ManipulationVerdict base;

    ElaResult ela;
    try
    {
        ela = errorLevelAnalysis(image.pixels, policy_.ela_jpeg_quality, policy_.ela_percentile,
                                 policy_.ela_energy_scale, grid);
    }
    catch (const std::exception &e)
    {
        Logger::error("Error-level analysis failed for " + label + ": " + e.what());
        base.status = ManipulationStatus::UNKNOWN;
        base.caveat = std::string("error-level analysis failed: ") + e.what();
        return base;
    }

    base.ela_energy = ela.energy;
    base.ela_score = ela.score;
    base.chunk_ela = ela.chunk_means;
    base.ela_peak_ratio = ela.peak_ratio;
    try
    {
        base.heatmap_png = renderHeatmap(ela.residual);
    }
    catch (const std::exception &e)
    {
        Logger::warn("ELA heatmap rendering failed for " + label + ": " + e.what());
    }

    auto ela_only = [&](const std::string &reason)
    {
        ManipulationVerdict verdict = base;
        verdict.status = ManipulationStatus::ELA_ONLY;
        verdict.reduced_confidence = true;
        verdict.likelihood = std::max(0.0, std::min(1.0, ela.score));
        verdict.is_manipulated = isManipulated(verdict.likelihood);
        verdict.caveat = "classifier unavailable, ELA-only verdict: " + reason;
        return verdict;
    };

    if (!classifier_)
    {
        Logger::debug("No manipulation classifier configured; ELA-only verdict for " + label);
        return ela_only("no classifier configured");
    }

    ManipulationVerdict verdict = ErrorRecovery::callWithFallback(
        [&]()
        {
            double classifier_score = classify(image.pixels, ela.residual, token);
            ManipulationVerdict fused = base;
            fused.status = ManipulationStatus::FUSED;
            fused.reduced_confidence = false;
            fused.classifier_score = classifier_score;
            fused.classifier_version = classifier_->modelVersion();
            fused.likelihood = fuse(ela.score, classifier_score);
            fused.is_manipulated = isManipulated(fused.likelihood);
            return fused;
        },
        [&](const std::exception &e)
        { return ela_only(e.what()); },
        "manipulation classifier for " + label);

    Logger::debug("Manipulation verdict for " + label + ": likelihood=" + std::to_string(verdict.likelihood) +
                  " ela_energy=" + std::to_string(verdict.ela_energy) +
                  (verdict.is_manipulated ? " (flagged)" : ""));
    return verdict;
}

double ManipulationDetector::classify(const cv::Mat &bgr, const cv::Mat &residual, const CancellationToken &token)
{
    auto retryable = [](const std::exception &e)
    {
        return dynamic_cast<const OperationCancelledError *>(&e) == nullptr;
    };

    return ErrorRecovery::retryWithBackoff(
        [&](int)
        {
            classifier_calls_.fetch_add(1);
            CallContext ctx = CallContext::withTimeout(policy_.timeout_ms, token);
            double score = 0.0;
            try
            {
                score = classifier_->score(bgr, residual, ctx);
            }
            catch (const VerificationError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw ManipulationDetectorUnavailable(std::string("Classifier error: ") + e.what());
            }
            if (!std::isfinite(score) || score < 0.0 || score > 1.0)
            {
                throw ManipulationDetectorUnavailable("Classifier returned out-of-range score " + std::to_string(score));
            }
            return score;
        },
        policy_.max_attempts, "manipulation classifier", retryable, token, policy_.backoff_base_ms);
}

ElaResult ManipulationDetector::errorLevelAnalysis(const cv::Mat &bgr, int jpeg_quality, double percentile,
                                                   double energy_scale, const GridShape &grid)
{
    if (bgr.empty() || bgr.type() != CV_8UC3)
    {
        throw std::invalid_argument("Error-level analysis requires a non-empty 8-bit BGR image");
    }

    std::vector<uint8_t> recompressed_bytes = ImageProcessor::encodeJpeg(bgr, jpeg_quality);
    cv::Mat recompressed = cv::imdecode(recompressed_bytes, cv::IMREAD_COLOR);
    if (recompressed.empty() || recompressed.size() != bgr.size())
    {
        throw std::runtime_error("JPEG round trip produced an unusable image");
    }

    cv::Mat diff;
    cv::absdiff(bgr, recompressed, diff);
    std::vector<cv::Mat> channels;
    cv::split(diff, channels);

    ElaResult result;
    cv::Mat residual = cv::max(channels[0], channels[1]);
    result.residual = cv::max(residual, channels[2]);

    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    cv::Mat mask;
    cv::inRange(gray, cv::Scalar(kBackgroundLow), cv::Scalar(kBackgroundHigh), mask);

    const int total = bgr.rows * bgr.cols;
    int counted = cv::countNonZero(mask);
    if (counted < std::max(1, total / 100))
    {
        mask = cv::Mat(gray.size(), CV_8UC1, cv::Scalar(255));
        counted = total;
    }

    std::vector<int> histogram(256, 0);
    for (int y = 0; y < result.residual.rows; y++)
    {
        const uint8_t *res_row = result.residual.ptr<uint8_t>(y);
        const uint8_t *mask_row = mask.ptr<uint8_t>(y);
        for (int x = 0; x < result.residual.cols; x++)
        {
            if (mask_row[x])
            {
                histogram[res_row[x]]++;
            }
        }
    }

    const long long target = std::max<long long>(1, static_cast<long long>(std::ceil(percentile * counted)));
    long long cumulative = 0;
    int level = 255;
    for (int value = 0; value < 256; value++)
    {
        cumulative += histogram[value];
        if (cumulative >= target)
        {
            level = value;
            break;
        }
    }

    result.energy = static_cast<double>(level);
    result.score = std::min(1.0, result.energy / energy_scale);
    result.mean = cv::mean(result.residual, mask)[0];

    double overall_mean = cv::mean(result.residual)[0];
    double peak = 0.0;
    for (const auto &c : ImageProcessor::chunk(bgr.cols, bgr.rows, grid))
    {
        double chunk_mean = cv::mean(result.residual(c.bounds))[0];
        result.chunk_means.push_back(chunk_mean);
        peak = std::max(peak, chunk_mean);
    }
    result.peak_ratio = overall_mean > 1e-6 ? peak / overall_mean : 0.0;
    return result;
}

std::vector<uint8_t> ManipulationDetector::renderHeatmap(const cv::Mat &residual)
{
    double max_value = 0.0;
    cv::minMaxLoc(residual, nullptr, &max_value);
    cv::Mat scaled;
    residual.convertTo(scaled, CV_8U, max_value > 0.0 ? 255.0 / max_value : 1.0);
    cv::Mat colored;
    cv::applyColorMap(scaled, colored, cv::COLORMAP_JET);
    return ImageProcessor::encodePng(colored);
}
