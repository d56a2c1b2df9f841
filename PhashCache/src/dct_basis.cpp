#include "../include/dct_basis.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace phashcache {

namespace {
constexpr float PI = 3.14159265358979323846f;
}

DctBasis::DctBasis(int size)
    : m_size(size)
{
    if (size <= 0) {
        throw std::invalid_argument("DCT basis size must be positive (received " + std::to_string(size) + ")");
    }

    const float n = static_cast<float>(size);
    const float c0 = 1.0f / std::sqrt(n);
    const float c1 = std::sqrt(2.0f / n);

    m_matrix.create(size, size, CV_32F);
    for (int y = 0; y < size; ++y) {
        float* row = m_matrix.ptr<float>(y);
        for (int x = 0; x < size; ++x) {
            row[x] = (y == 0) ? c0 : c1 * std::cos((PI / 2.0f / n) * static_cast<float>(y) * static_cast<float>(2 * x + 1));
        }
    }

    m_transposed = m_matrix.t();
}

cv::Mat DctBasis::transform(const cv::Mat& pixels) const
{
    if (pixels.rows != m_size || pixels.cols != m_size || pixels.type() != CV_32F) {
        throw std::invalid_argument("DCT input must be a " + std::to_string(m_size) + "x" + std::to_string(m_size) + " CV_32F matrix");
    }

    cv::Mat result = m_matrix * pixels * m_transposed;
    return result;
}

std::shared_ptr<const DctBasis> makeDctBasis(int size)
{
    return std::make_shared<const DctBasis>(size);
}

} // namespace phashcache
