#include "../include/image_loader.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iterator>

namespace phashcache {

namespace {

bool startsWith(const std::vector<std::uint8_t>& bytes, std::initializer_list<std::uint8_t> magic, size_t offset = 0)
{
    if (bytes.size() < offset + magic.size()) return false;
    return std::equal(magic.begin(), magic.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace

HashError::HashError(Kind kind, std::string path, const std::string& message)
    : std::runtime_error(message), m_kind(kind), m_path(std::move(path))
{
}

const char* toString(HashError::Kind kind)
{
    switch (kind) {
        case HashError::Kind::Read: return "Error reading image";
        case HashError::Kind::Format: return "Error guessing image format";
        case HashError::Kind::Decode: return "Error decoding image";
    }
    return "Error hashing image";
}

const char* toString(ImageFormat format)
{
    switch (format) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Gif: return "GIF";
        case ImageFormat::Bmp: return "BMP";
        case ImageFormat::Tiff: return "TIFF";
        case ImageFormat::WebP: return "WebP";
        case ImageFormat::Pnm: return "PNM";
        case ImageFormat::Jpeg2000: return "JPEG 2000";
        case ImageFormat::OpenExr: return "OpenEXR";
        case ImageFormat::Hdr: return "Radiance HDR";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

ImageFormat detectFormat(const std::vector<std::uint8_t>& bytes)
{
    if (startsWith(bytes, { 0xFF, 0xD8, 0xFF })) return ImageFormat::Jpeg;
    if (startsWith(bytes, { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' })) return ImageFormat::Png;
    if (startsWith(bytes, { 'G', 'I', 'F', '8', '7', 'a' }) || startsWith(bytes, { 'G', 'I', 'F', '8', '9', 'a' })) return ImageFormat::Gif;
    if (startsWith(bytes, { 'B', 'M' })) return ImageFormat::Bmp;
    if (startsWith(bytes, { 'I', 'I', 0x2A, 0x00 }) || startsWith(bytes, { 'M', 'M', 0x00, 0x2A })) return ImageFormat::Tiff;
    if (startsWith(bytes, { 'R', 'I', 'F', 'F' }) && startsWith(bytes, { 'W', 'E', 'B', 'P' }, 8)) return ImageFormat::WebP;
    if (startsWith(bytes, { 0x00, 0x00, 0x00, 0x0C, 'j', 'P', ' ', ' ' }) || startsWith(bytes, { 0xFF, 0x4F, 0xFF, 0x51 })) return ImageFormat::Jpeg2000;
    if (startsWith(bytes, { 0x76, 0x2F, 0x31, 0x01 })) return ImageFormat::OpenExr;
    if (startsWith(bytes, { '#', '?', 'R', 'A', 'D', 'I', 'A', 'N', 'C', 'E' }) || startsWith(bytes, { '#', '?', 'R', 'G', 'B', 'E' })) return ImageFormat::Hdr;

    // P1..P7 (netpbm); P7 is PAM
    if (bytes.size() >= 3 && bytes[0] == 'P' && bytes[1] >= '1' && bytes[1] <= '7'
        && std::isspace(static_cast<unsigned char>(bytes[2]))) {
        return ImageFormat::Pnm;
    }

    return ImageFormat::Unknown;
}

std::vector<std::uint8_t> readFileBytes(const std::string& path)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int err = errno;
        throw HashError(HashError::Kind::Read, path,
            std::string(toString(HashError::Kind::Read)) + ": " + (err ? std::strerror(err) : "cannot open file"));
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw HashError(HashError::Kind::Read, path, std::string(toString(HashError::Kind::Read)) + ": read failed");
    }
    return bytes;
}

cv::Mat decodeGrayscale(const std::vector<std::uint8_t>& bytes, const std::string& path)
{
    const ImageFormat format = detectFormat(bytes);
    if (format == ImageFormat::Unknown) {
        throw HashError(HashError::Kind::Format, path,
            std::string(toString(HashError::Kind::Format)) + ": unrecognised file signature");
    }

    cv::Mat gray;
    try {
        gray = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
    }
    catch (const cv::Exception& e) {
        throw HashError(HashError::Kind::Decode, path,
            std::string(toString(HashError::Kind::Decode)) + " (" + toString(format) + "): " + e.what());
    }

    if (gray.empty()) {
        throw HashError(HashError::Kind::Decode, path,
            std::string(toString(HashError::Kind::Decode)) + " (" + toString(format) + "): no pixel data");
    }
    return gray;
}

cv::Mat loadGrayscale(const std::string& path)
{
    return decodeGrayscale(readFileBytes(path), path);
}

} // namespace phashcache
