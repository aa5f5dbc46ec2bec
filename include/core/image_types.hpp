#pragma once

#include <bitset>
#include <cstdint>
#include <cstddef>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Decoded, oriented and size-bounded image in 8-bit BGR
 */
struct NormalizedImage
{
    cv::Mat pixels;           // CV_8UC3, continuous
    int original_width = 0;   // Dimensions after decode, before downscaling
    int original_height = 0;
    std::string content_hash; // SHA-256 hex of the raw input bytes

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
};

/**
 * @brief 64-bit DCT perceptual hash, compared by Hamming distance
 */
struct PerceptualHash
{
    static constexpr int kBitLength = 64;

    uint64_t bits = 0;

    int distance(const PerceptualHash &other) const
    {
        return static_cast<int>(std::bitset<kBitLength>(bits ^ other.bits).count());
    }

    bool operator==(const PerceptualHash &other) const { return bits == other.bits; }
    bool operator!=(const PerceptualHash &other) const { return bits != other.bits; }

    std::string toHex() const;

    /**
     * @brief Parse 16 hex digits
     * @throws std::invalid_argument on malformed input
     */
    static PerceptualHash fromHex(const std::string &hex);
};

/**
 * @brief Grid used to partition a normalized image
 */
struct GridShape
{
    int rows = 4;
    int cols = 4;

    int cellCount() const { return rows * cols; }
};

/**
 * @brief Sub-region of a normalized image. Bounds are in normalized pixel coordinates.
 */
struct Chunk
{
    int index = 0;
    int grid_row = 0;
    int grid_col = 0;
    cv::Rect bounds;
};
