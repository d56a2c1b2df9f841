#include "../include/perceptual_hash.hpp"
#include "../include/image_loader.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <bit>
#include <stdexcept>

namespace phashcache {

namespace {

cv::Mat toGray8(const cv::Mat& pixels)
{
    cv::Mat gray;
    switch (pixels.channels()) {
        case 1: gray = pixels; break;
        case 3: cv::cvtColor(pixels, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(pixels, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw std::invalid_argument("unsupported channel count " + std::to_string(pixels.channels()));
    }

    if (gray.depth() == CV_8U) return gray;

    cv::Mat gray8;
    switch (gray.depth()) {
        case CV_16U: gray.convertTo(gray8, CV_8U, 1.0 / 257.0); break;
        case CV_32F:
        case CV_64F: gray.convertTo(gray8, CV_8U, 255.0); break;
        default: gray.convertTo(gray8, CV_8U); break;
    }
    return gray8;
}

} // namespace

CoefficientBlock extractCoefficients(const cv::Mat& dct)
{
    if (dct.type() != CV_32F || dct.rows < HASH_BLOCK + 1 || dct.cols < HASH_BLOCK + 1) {
        throw std::invalid_argument("DCT matrix too small for an 8x8 coefficient block");
    }

    // Skip the DC term together with the first row and column
    const cv::Mat block = dct(cv::Rect(1, 1, HASH_BLOCK, HASH_BLOCK));

    CoefficientBlock coefficients{};
    for (int col = 0; col < HASH_BLOCK; ++col) {
        for (int row = 0; row < HASH_BLOCK; ++row) {
            coefficients[static_cast<size_t>(col * HASH_BLOCK + row)] = block.at<float>(row, col);
        }
    }
    return coefficients;
}

float medianOf(const CoefficientBlock& coefficients)
{
    CoefficientBlock sorted = coefficients;
    std::sort(sorted.begin(), sorted.end());
    return (sorted[HASH_BITS / 2 - 1] + sorted[HASH_BITS / 2]) / 2.0f;
}

std::uint64_t thresholdBits(const CoefficientBlock& coefficients, float median)
{
    std::uint64_t hash = 0;
    for (size_t i = 0; i < coefficients.size(); ++i) {
        if (coefficients[i] >= median) {
            hash |= std::uint64_t{ 1 } << i;
        }
    }
    return hash;
}

int hammingDistance(std::uint64_t a, std::uint64_t b)
{
    return std::popcount(a ^ b);
}

PerceptualHasher::PerceptualHasher(std::shared_ptr<const DctBasis> basis)
    : m_basis(std::move(basis))
{
    if (!m_basis) {
        throw std::invalid_argument("PerceptualHasher requires a DCT basis");
    }
}

cv::Mat PerceptualHasher::prepare(const cv::Mat& pixels) const
{
    if (pixels.empty()) {
        throw std::invalid_argument("cannot hash an empty image");
    }

    const int size = m_basis->size();

    cv::Mat resized;
    cv::resize(toGray8(pixels), resized, cv::Size(size, size), 0.0, 0.0, cv::INTER_LANCZOS4);

    cv::Mat samples;
    resized.convertTo(samples, CV_32F);
    return samples;
}

std::uint64_t PerceptualHasher::hash(const cv::Mat& pixels) const
{
    const cv::Mat dct = m_basis->transform(prepare(pixels));
    const CoefficientBlock coefficients = extractCoefficients(dct);
    return thresholdBits(coefficients, medianOf(coefficients));
}

std::uint64_t PerceptualHasher::hashFile(const std::string& path) const
{
    const cv::Mat gray = loadGrayscale(path);

    try {
        return hash(gray);
    }
    catch (const cv::Exception& e) {
        throw HashError(HashError::Kind::Decode, path, std::string(toString(HashError::Kind::Decode)) + ": " + e.what());
    }
}

} // namespace phashcache
