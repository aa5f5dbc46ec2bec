#include "core/image_processor.hpp"
#include "core/verification_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

std::string PerceptualHash::toHex() const
{
    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << bits;
    return ss.str();
}

PerceptualHash PerceptualHash::fromHex(const std::string &hex)
{
    if (hex.size() != 16 || !std::all_of(hex.begin(), hex.end(), [](unsigned char c)
                                         { return std::isxdigit(c) != 0; }))
    {
        throw std::invalid_argument("Invalid perceptual hash: '" + hex + "'");
    }
    PerceptualHash hash;
    hash.bits = std::stoull(hex, nullptr, 16);
    return hash;
}

NormalizedImage ImageProcessor::decodeAndNormalize(const std::vector<uint8_t> &bytes, const ImageCodecLimits &limits)
{
    if (bytes.empty())
    {
        throw DecodeError("Empty image payload");
    }
    if (bytes.size() > limits.max_bytes)
    {
        throw DecodeError("Image payload of " + std::to_string(bytes.size()) + " bytes exceeds limit of " +
                          std::to_string(limits.max_bytes));
    }

    cv::Mat decoded;
    try
    {
        // IMREAD_COLOR applies the EXIF orientation tag and always yields 8-bit BGR
        decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV rejected image payload: " + std::string(e.what()));
        throw DecodeError("Corrupt or unsupported image: " + std::string(e.what()));
    }
    if (decoded.empty())
    {
        throw DecodeError("Corrupt or unsupported image (" + std::to_string(bytes.size()) + " bytes)");
    }

    if (decoded.cols > limits.max_input_dimension || decoded.rows > limits.max_input_dimension)
    {
        throw DecodeError("Image dimensions " + std::to_string(decoded.cols) + "x" + std::to_string(decoded.rows) +
                          " exceed limit of " + std::to_string(limits.max_input_dimension));
    }

    NormalizedImage image;
    image.original_width = decoded.cols;
    image.original_height = decoded.rows;
    image.content_hash = generateHash(bytes);

    int long_edge = std::max(decoded.cols, decoded.rows);
    if (long_edge > limits.max_edge)
    {
        double scale = static_cast<double>(limits.max_edge) / long_edge;
        int width = std::max(1, static_cast<int>(std::lround(decoded.cols * scale)));
        int height = std::max(1, static_cast<int>(std::lround(decoded.rows * scale)));
        cv::resize(decoded, image.pixels, cv::Size(width, height), 0, 0, cv::INTER_AREA);
        Logger::debug("Normalized image " + std::to_string(decoded.cols) + "x" + std::to_string(decoded.rows) +
                      " -> " + std::to_string(width) + "x" + std::to_string(height));
    }
    else
    {
        image.pixels = decoded;
    }

    if (std::min(image.width(), image.height()) < limits.min_dimension)
    {
        throw DecodeError("Normalized image " + std::to_string(image.width()) + "x" + std::to_string(image.height()) +
                          " is below the minimum dimension of " + std::to_string(limits.min_dimension));
    }

    if (!image.pixels.isContinuous())
    {
        image.pixels = image.pixels.clone();
    }
    return image;
}

PerceptualHash ImageProcessor::perceptualHash(const NormalizedImage &image)
{
    return perceptualHash(image.pixels);
}

PerceptualHash ImageProcessor::perceptualHash(const cv::Mat &bgr)
{
    cv::Mat gray_image;
    if (bgr.channels() == 3)
    {
        cv::cvtColor(bgr, gray_image, cv::COLOR_BGR2GRAY);
    }
    else
    {
        gray_image = bgr;
    }

    cv::Mat resized_image;
    cv::resize(gray_image, resized_image, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized_image.convertTo(float_image, CV_32F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    // Low-frequency block, DC term included
    cv::Mat dct_8x8 = dct_image(cv::Rect(0, 0, 8, 8));

    std::vector<float> dct_values;
    dct_values.reserve(64);
    for (int y = 0; y < 8; y++)
    {
        for (int x = 0; x < 8; x++)
        {
            dct_values.push_back(dct_8x8.at<float>(y, x));
        }
    }

    std::vector<float> sorted_values = dct_values;
    std::sort(sorted_values.begin(), sorted_values.end());
    double median = (static_cast<double>(sorted_values[31]) + sorted_values[32]) / 2.0;

    PerceptualHash hash;
    for (int i = 0; i < 64; i++)
    {
        if (dct_values[i] > median)
        {
            hash.bits |= (uint64_t(1) << (63 - i));
        }
    }
    return hash;
}

std::vector<Chunk> ImageProcessor::chunk(const NormalizedImage &image, const GridShape &grid)
{
    return chunk(image.width(), image.height(), grid);
}

std::vector<Chunk> ImageProcessor::chunk(int width, int height, const GridShape &grid)
{
    if (grid.rows < 1 || grid.cols < 1)
    {
        throw std::invalid_argument("Grid shape must be at least 1x1, got " + std::to_string(grid.rows) + "x" +
                                    std::to_string(grid.cols));
    }
    if (grid.rows > height || grid.cols > width)
    {
        throw std::invalid_argument("Grid " + std::to_string(grid.rows) + "x" + std::to_string(grid.cols) +
                                    " is finer than image " + std::to_string(width) + "x" + std::to_string(height));
    }

    int cell_height = height / grid.rows;
    int cell_width = width / grid.cols;

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<size_t>(grid.cellCount()));
    for (int row = 0; row < grid.rows; row++)
    {
        int y = row * cell_height;
        int h = (row == grid.rows - 1) ? height - y : cell_height;
        for (int col = 0; col < grid.cols; col++)
        {
            int x = col * cell_width;
            int w = (col == grid.cols - 1) ? width - x : cell_width;

            Chunk c;
            c.index = row * grid.cols + col;
            c.grid_row = row;
            c.grid_col = col;
            c.bounds = cv::Rect(x, y, w, h);
            chunks.push_back(c);
        }
    }
    return chunks;
}

cv::Mat ImageProcessor::chunkPixels(const NormalizedImage &image, const Chunk &chunk)
{
    return image.pixels(chunk.bounds);
}

double ImageProcessor::computeImageSimilarity(const PerceptualHash &a, const PerceptualHash &b)
{
    return 1.0 - static_cast<double>(a.distance(b)) / PerceptualHash::kBitLength;
}

std::string ImageProcessor::generateHash(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string ImageProcessor::generateHash(const std::string &data)
{
    return generateHash(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> ImageProcessor::encodeJpeg(const cv::Mat &image, int quality)
{
    std::vector<uint8_t> buffer;
    if (!cv::imencode(".jpg", image, buffer, {cv::IMWRITE_JPEG_QUALITY, quality}))
    {
        throw std::runtime_error("JPEG encoding failed");
    }
    return buffer;
}

std::vector<uint8_t> ImageProcessor::encodePng(const cv::Mat &image)
{
    std::vector<uint8_t> buffer;
    if (!cv::imencode(".png", image, buffer))
    {
        throw std::runtime_error("PNG encoding failed");
    }
    return buffer;
}

std::string ImageProcessor::toBase64(const std::vector<uint8_t> &data)
{
    if (data.empty())
    {
        return "";
    }
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]), data.data(),
                                  static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}
