#pragma once

#include "hasher_base.h"
#include "dct_basis.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace phashcache {

constexpr int HASH_BLOCK = 8;
constexpr int HASH_BITS = HASH_BLOCK * HASH_BLOCK;

// Coefficients of the 8x8 block at (1, 1), flattened column-major:
// index i = col * 8 + row. Bit i of the hash corresponds to element i.
using CoefficientBlock = std::array<float, HASH_BITS>;

CoefficientBlock extractCoefficients(const cv::Mat& dct);

// Mean of the two middle values (sorted indices 31 and 32).
float medianOf(const CoefficientBlock& coefficients);

std::uint64_t thresholdBits(const CoefficientBlock& coefficients, float median);

int hammingDistance(std::uint64_t a, std::uint64_t b);

class PerceptualHasher : public HasherBase {
public:
    explicit PerceptualHasher(std::shared_ptr<const DctBasis> basis);

    // Any 8/16-bit or float image with 1, 3 or 4 channels.
    std::uint64_t hash(const cv::Mat& pixels) const;

    std::uint64_t hashFile(const std::string& path) const override;

    // Grayscale, Lanczos-resized to the basis size, as CV_32F.
    cv::Mat prepare(const cv::Mat& pixels) const;

private:
    std::shared_ptr<const DctBasis> m_basis;
};

} // namespace phashcache
