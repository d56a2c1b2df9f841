#pragma once

#include <opencv2/core.hpp>

#include <memory>

namespace phashcache {

constexpr int DCT_SIZE = 32;

// Orthonormal DCT-II basis. Row 0 is 1/sqrt(N); row y > 0 is
// sqrt(2/N) * cos(pi / (2N) * y * (2x + 1)).
class DctBasis {
public:
    explicit DctBasis(int size = DCT_SIZE);

    int size() const { return m_size; }

    const cv::Mat& matrix() const { return m_matrix; }
    const cv::Mat& transposed() const { return m_transposed; }

    // DCT * pixels * DCT^T. `pixels` must be size x size CV_32F.
    cv::Mat transform(const cv::Mat& pixels) const;

private:
    int m_size;
    cv::Mat m_matrix;
    cv::Mat m_transposed;
};

// Built once at startup and shared read-only by every worker.
std::shared_ptr<const DctBasis> makeDctBasis(int size = DCT_SIZE);

} // namespace phashcache
