#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace phashcache {

// Per-image failure. Never fatal for a run; the pipeline logs it against the path and moves on.
class HashError : public std::runtime_error {
public:
    enum class Kind { Read, Format, Decode };

    HashError(Kind kind, std::string path, const std::string& message);

    Kind kind() const { return m_kind; }
    const std::string& path() const { return m_path; }

private:
    Kind m_kind;
    std::string m_path;
};

const char* toString(HashError::Kind kind);

enum class ImageFormat {
    Unknown,
    Jpeg,
    Png,
    Gif,
    Bmp,
    Tiff,
    WebP,
    Pnm,
    Jpeg2000,
    OpenExr,
    Hdr
};

const char* toString(ImageFormat format);

// Sniffs the container format from the leading magic bytes.
ImageFormat detectFormat(const std::vector<std::uint8_t>& bytes);

std::vector<std::uint8_t> readFileBytes(const std::string& path);

// Decodes an in-memory image into a single-channel 8-bit matrix.
// Throws HashError{Format} or HashError{Decode}; `path` is only used for error attribution.
cv::Mat decodeGrayscale(const std::vector<std::uint8_t>& bytes, const std::string& path);

// readFileBytes + decodeGrayscale.
cv::Mat loadGrayscale(const std::string& path);

} // namespace phashcache
