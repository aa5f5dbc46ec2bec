#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <opencv2/core.hpp>
#include "core/image_types.hpp"
#include "logging/logger.hpp"

/**
 * @brief Bounds enforced while decoding untrusted image bytes
 */
struct ImageCodecLimits
{
    size_t max_bytes = 20 * 1024 * 1024;
    int max_input_dimension = 12000; // Per side, after decode
    int max_edge = 1024;             // Canonical long edge after normalization
    int min_dimension = 16;          // Short edge after normalization
};

/**
 * @brief Image codec and chunker
 *
 * Decodes and normalizes raw bytes, computes the perceptual hash and partitions normalized images into
 * a deterministic grid. All operations are pure functions of their input.
 */
class ImageProcessor
{
public:
    /**
     * @brief Decode, orient and downscale raw image bytes
     * @param bytes Encoded image (any format OpenCV imgcodecs reads)
     * @param limits Size bounds
     * @return Normalized BGR image whose long edge is at most limits.max_edge
     * @throws DecodeError on empty, oversized, corrupt or undersized input
     */
    static NormalizedImage decodeAndNormalize(const std::vector<uint8_t> &bytes,
                                              const ImageCodecLimits &limits = ImageCodecLimits());

    /**
     * @brief 64-bit DCT hash: 32x32 grayscale, 2-D DCT, top-left 8x8 block compared to its median
     */
    static PerceptualHash perceptualHash(const NormalizedImage &image);
    static PerceptualHash perceptualHash(const cv::Mat &bgr);

    /**
     * @brief Partition an image into a row-major grid; the last row and column absorb remainder pixels
     * @throws std::invalid_argument if the grid is empty or finer than the image
     */
    static std::vector<Chunk> chunk(const NormalizedImage &image, const GridShape &grid);
    static std::vector<Chunk> chunk(int width, int height, const GridShape &grid);

    /// View into the image pixels covered by a chunk (no copy).
    static cv::Mat chunkPixels(const NormalizedImage &image, const Chunk &chunk);

    /// 1 - hamming/64. Identical hashes give 1.0, complementary hashes 0.0.
    static double computeImageSimilarity(const PerceptualHash &a, const PerceptualHash &b);

    static std::string generateHash(const std::vector<uint8_t> &data);
    static std::string generateHash(const std::string &data);

    static std::vector<uint8_t> encodeJpeg(const cv::Mat &image, int quality);
    static std::vector<uint8_t> encodePng(const cv::Mat &image);
    static std::string toBase64(const std::vector<uint8_t> &data);
};
