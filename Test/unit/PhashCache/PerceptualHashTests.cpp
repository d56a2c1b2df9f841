// Perceptual hash unit tests using Google Test
// These tests check the DCT basis, the coefficient block layout, the median
// threshold rule, determinism of the full hash, and per-image error reporting.

#include <gtest/gtest.h>

#include "dct_basis.hpp"
#include "image_loader.hpp"
#include "perceptual_hash.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace phashcache;

namespace {

cv::Mat randomImage(int rows, int cols, std::uint64_t seed) {
    cv::Mat img(rows, cols, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);
    return img;
}

// White top-left and bottom-right quadrants, black elsewhere
cv::Mat quadrantChecker(int size) {
    cv::Mat img(size, size, CV_8UC1, cv::Scalar(0));
    const int half = size / 2;
    img(cv::Rect(0, 0, half, half)).setTo(cv::Scalar(255));
    img(cv::Rect(half, half, size - half, size - half)).setTo(cv::Scalar(255));
    return img;
}

} // namespace

// ========== DCT Basis ==========

TEST(DctBasisTests, FirstRowIsConstant) {
    DctBasis basis;
    ASSERT_EQ(basis.size(), DCT_SIZE);

    const float expected = 1.0f / std::sqrt(static_cast<float>(DCT_SIZE));
    for (int x = 0; x < DCT_SIZE; ++x) {
        EXPECT_FLOAT_EQ(basis.matrix().at<float>(0, x), expected);
    }
}

TEST(DctBasisTests, MatchesClosedForm) {
    DctBasis basis;
    const double n = DCT_SIZE;
    const double pi = 3.14159265358979323846;

    for (int y = 1; y < DCT_SIZE; y += 5) {
        for (int x = 0; x < DCT_SIZE; x += 3) {
            const double expected = std::sqrt(2.0 / n) * std::cos(pi / (2.0 * n) * y * (2 * x + 1));
            EXPECT_NEAR(basis.matrix().at<float>(y, x), expected, 1e-5) << "at (" << y << ", " << x << ")";
        }
    }
}

TEST(DctBasisTests, IsOrthonormal) {
    DctBasis basis;
    const cv::Mat product = basis.matrix() * basis.transposed();

    for (int y = 0; y < DCT_SIZE; ++y) {
        for (int x = 0; x < DCT_SIZE; ++x) {
            EXPECT_NEAR(product.at<float>(y, x), y == x ? 1.0f : 0.0f, 1e-4f);
        }
    }
}

TEST(DctBasisTests, TransformRejectsWrongShape) {
    DctBasis basis;
    EXPECT_THROW(basis.transform(cv::Mat::zeros(16, 16, CV_32F)), std::invalid_argument);
    EXPECT_THROW(basis.transform(cv::Mat::zeros(DCT_SIZE, DCT_SIZE, CV_8U)), std::invalid_argument);
}

TEST(DctBasisTests, InvalidSizeThrows) {
    EXPECT_THROW(DctBasis(0), std::invalid_argument);
}

TEST(DctBasisTests, SharedBasisIsReadOnly) {
    std::shared_ptr<const DctBasis> basis = makeDctBasis();
    ASSERT_NE(basis, nullptr);
    EXPECT_EQ(basis->size(), DCT_SIZE);
}

// ========== Coefficient Block ==========

TEST(CoefficientTests, ExtractsColumnMajorBlockAtOneOne) {
    cv::Mat dct(DCT_SIZE, DCT_SIZE, CV_32F);
    for (int r = 0; r < DCT_SIZE; ++r)
        for (int c = 0; c < DCT_SIZE; ++c)
            dct.at<float>(r, c) = static_cast<float>(r * 100 + c);

    const CoefficientBlock block = extractCoefficients(dct);

    for (int col = 0; col < HASH_BLOCK; ++col) {
        for (int row = 0; row < HASH_BLOCK; ++row) {
            EXPECT_FLOAT_EQ(block[static_cast<size_t>(col * HASH_BLOCK + row)],
                            static_cast<float>((row + 1) * 100 + (col + 1)));
        }
    }
}

TEST(CoefficientTests, MedianAveragesMiddlePair) {
    CoefficientBlock values{};
    std::iota(values.begin(), values.end(), 0.0f);
    std::reverse(values.begin(), values.end());

    EXPECT_FLOAT_EQ(medianOf(values), 31.5f);
}

TEST(CoefficientTests, ThresholdSetsBitsAtOrAboveMedian) {
    CoefficientBlock values{};
    std::iota(values.begin(), values.end(), 0.0f);

    EXPECT_EQ(thresholdBits(values, medianOf(values)), 0xFFFFFFFF00000000ull);
    EXPECT_EQ(thresholdBits(values, 5.0f), ~std::uint64_t{ 0 } << 5);
}

TEST(CoefficientTests, EqualCoefficientsSetEveryBit) {
    CoefficientBlock values{};
    values.fill(2.5f);

    EXPECT_EQ(thresholdBits(values, medianOf(values)), std::numeric_limits<std::uint64_t>::max());
}

TEST(CoefficientTests, HammingDistanceCountsDifferingBits) {
    EXPECT_EQ(hammingDistance(0, 0), 0);
    EXPECT_EQ(hammingDistance(0, ~std::uint64_t{ 0 }), 64);
    EXPECT_EQ(hammingDistance(0b1011, 0b0001), 2);
}

// ========== Hash ==========

TEST(PerceptualHasherTests, RequiresBasis) {
    EXPECT_THROW(PerceptualHasher(nullptr), std::invalid_argument);
}

TEST(PerceptualHasherTests, IsDeterministic) {
    const cv::Mat img = randomImage(97, 61, 1234);

    PerceptualHasher hasher(makeDctBasis());
    PerceptualHasher other(makeDctBasis());

    const auto first = hasher.hash(img);
    EXPECT_EQ(hasher.hash(img), first);
    EXPECT_EQ(hasher.hash(img.clone()), first);
    EXPECT_EQ(other.hash(img), first);
}

TEST(PerceptualHasherTests, SolidBlackSetsEveryBit) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat black(64, 64, CV_8UC1, cv::Scalar(0));

    EXPECT_EQ(hasher.hash(black), std::numeric_limits<std::uint64_t>::max());
}

TEST(PerceptualHasherTests, SolidBlackAndWhiteDiffer) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat black(64, 64, CV_8UC1, cv::Scalar(0));
    const cv::Mat white(64, 64, CV_8UC1, cv::Scalar(255));

    EXPECT_NE(hasher.hash(black), hasher.hash(white));
    EXPECT_GT(hammingDistance(hasher.hash(black), hasher.hash(white)), 0);
}

TEST(PerceptualHasherTests, DifferentImagesDiffer) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat black(64, 64, CV_8UC1, cv::Scalar(0));

    EXPECT_GT(hammingDistance(hasher.hash(black), hasher.hash(quadrantChecker(64))), 0);
    EXPECT_GT(hammingDistance(hasher.hash(randomImage(64, 64, 1)), hasher.hash(quadrantChecker(64))), 0);
}

TEST(PerceptualHasherTests, ColorWithEqualChannelsMatchesGray) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat gray = randomImage(48, 48, 99);

    cv::Mat bgr;
    cv::merge(std::vector<cv::Mat>{ gray, gray, gray }, bgr);

    cv::Mat bgra;
    cv::merge(std::vector<cv::Mat>{ gray, gray, gray, cv::Mat(gray.size(), CV_8UC1, cv::Scalar(255)) }, bgra);

    EXPECT_EQ(hasher.hash(bgr), hasher.hash(gray));
    EXPECT_EQ(hasher.hash(bgra), hasher.hash(gray));
}

TEST(PerceptualHasherTests, SixteenBitInputIsScaledDown) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat gray = randomImage(40, 40, 7);

    cv::Mat gray16;
    gray.convertTo(gray16, CV_16U, 257.0);

    EXPECT_EQ(hasher.hash(gray16), hasher.hash(gray));
}

TEST(PerceptualHasherTests, PrepareProducesFloatGrid) {
    PerceptualHasher hasher(makeDctBasis());
    const cv::Mat samples = hasher.prepare(randomImage(300, 200, 5));

    EXPECT_EQ(samples.rows, DCT_SIZE);
    EXPECT_EQ(samples.cols, DCT_SIZE);
    EXPECT_EQ(samples.type(), CV_32F);
}

TEST(PerceptualHasherTests, EmptyImageThrows) {
    PerceptualHasher hasher(makeDctBasis());
    EXPECT_THROW(hasher.hash(cv::Mat()), std::invalid_argument);
}

// ========== Files ==========

class HashFileTest : public ::testing::Test {
protected:
    fs::path tempDir;
    PerceptualHasher hasher{ makeDctBasis() };

    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("phashcache_hash_" + std::to_string(std::random_device{}()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path writeBytes(const std::string& name, const std::string& bytes) {
        const auto path = tempDir / name;
        std::ofstream out(path, std::ios::binary);
        out << bytes;
        return path;
    }
};

TEST_F(HashFileTest, HashFileMatchesDecodedPixels) {
    const cv::Mat img = randomImage(50, 70, 42);
    const auto path = tempDir / "img.png";
    ASSERT_TRUE(cv::imwrite(path.string(), img));

    EXPECT_EQ(hasher.hashFile(path.string()), hasher.hash(img));
}

TEST_F(HashFileTest, MissingFileIsReadError) {
    const auto path = (tempDir / "missing.jpg").string();
    try {
        hasher.hashFile(path);
        FAIL() << "expected HashError";
    }
    catch (const HashError& e) {
        EXPECT_EQ(e.kind(), HashError::Kind::Read);
        EXPECT_EQ(e.path(), path);
    }
}

TEST_F(HashFileTest, UnknownSignatureIsFormatError) {
    const auto path = writeBytes("notes.jpg", "this is plain text, not an image").string();
    try {
        hasher.hashFile(path);
        FAIL() << "expected HashError";
    }
    catch (const HashError& e) {
        EXPECT_EQ(e.kind(), HashError::Kind::Format);
        EXPECT_EQ(e.path(), path);
    }
}

TEST_F(HashFileTest, CorruptImageIsDecodeError) {
    const std::string pngSignature("\x89PNG\r\n\x1a\n", 8);
    const auto path = writeBytes("broken.png", pngSignature + "truncated before any chunk").string();
    try {
        hasher.hashFile(path);
        FAIL() << "expected HashError";
    }
    catch (const HashError& e) {
        EXPECT_EQ(e.kind(), HashError::Kind::Decode);
        EXPECT_EQ(e.path(), path);
    }
}

TEST(ImageFormatTests, DetectsCommonSignatures) {
    auto bytes = [](std::initializer_list<int> values) {
        std::vector<std::uint8_t> out;
        for (int v : values) out.push_back(static_cast<std::uint8_t>(v));
        return out;
    };

    EXPECT_EQ(detectFormat(bytes({ 0xFF, 0xD8, 0xFF, 0xE0 })), ImageFormat::Jpeg);
    EXPECT_EQ(detectFormat(bytes({ 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' })), ImageFormat::Png);
    EXPECT_EQ(detectFormat(bytes({ 'G', 'I', 'F', '8', '9', 'a' })), ImageFormat::Gif);
    EXPECT_EQ(detectFormat(bytes({ 'B', 'M', 0, 0 })), ImageFormat::Bmp);
    EXPECT_EQ(detectFormat(bytes({ 'I', 'I', 0x2A, 0x00 })), ImageFormat::Tiff);
    EXPECT_EQ(detectFormat(bytes({ 'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P' })), ImageFormat::WebP);
    EXPECT_EQ(detectFormat(bytes({ 'P', '5', '\n' })), ImageFormat::Pnm);
    EXPECT_EQ(detectFormat(bytes({ 'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E' })), ImageFormat::Unknown);
    EXPECT_EQ(detectFormat({}), ImageFormat::Unknown);
}
