#include "../include/cache_store.hpp"
#include "../include/logger.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace phashcache {

namespace {

constexpr char FIELD_DELIMITER = '\t';
constexpr char RECORD_DELIMITER = '\n';
constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

std::string_view trimView(std::string_view value)
{
    const auto start = value.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(WHITESPACE);
    return value.substr(start, end - start + 1);
}

// Buffer owned by getline(3)
struct LineBuffer {
    char* data = nullptr;
    size_t capacity = 0;

    ~LineBuffer() { std::free(data); }
};

} // namespace

std::optional<CacheEntry> parseCacheLine(std::string_view line)
{
    // An unterminated line is what a crash in the middle of a write leaves behind
    if (line.empty() || line.back() != RECORD_DELIMITER) return std::nullopt;
    line.remove_suffix(1);

    const auto tab = line.find(FIELD_DELIMITER);
    if (tab == std::string_view::npos) return std::nullopt;
    if (line.find(FIELD_DELIMITER, tab + 1) != std::string_view::npos) return std::nullopt;

    const auto pathField = trimView(line.substr(0, tab));
    auto hashField = trimView(line.substr(tab + 1));
    // A single leading '+' is accepted on the hash
    if (!hashField.empty() && hashField.front() == '+') hashField.remove_prefix(1);
    if (hashField.empty()) return std::nullopt;

    std::uint64_t hash = 0;
    const auto [ptr, ec] = std::from_chars(hashField.data(), hashField.data() + hashField.size(), hash);
    if (ec != std::errc{} || ptr != hashField.data() + hashField.size()) return std::nullopt;

    return CacheEntry{ std::string(pathField), hash };
}

std::string formatCacheLine(const CacheEntry& entry)
{
    std::string line;
    line.reserve(entry.path.size() + 22);
    line += entry.path;
    line += FIELD_DELIMITER;
    line += std::to_string(entry.hash);
    line += RECORD_DELIMITER;
    return line;
}

bool isStorablePath(std::string_view path)
{
    return path.find(FIELD_DELIMITER) == std::string_view::npos
        && path.find(RECORD_DELIMITER) == std::string_view::npos;
}

void CacheStore::FileCloser::operator()(std::FILE* f) const noexcept
{
    if (f) std::fclose(f);
}

CacheStore::CacheStore(std::string path)
    : m_path(std::move(path))
{
    const int fd = ::open(m_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        fail("cannot open checkpoint file");
    }

    std::FILE* file = ::fdopen(fd, "r+");
    if (!file) {
        const int err = errno;
        ::close(fd);
        errno = err;
        fail("cannot open checkpoint file");
    }
    m_file.reset(file);

    // Until load() has validated the content, appends go after everything already there
    if (::fseeko(m_file.get(), 0, SEEK_END) != 0) {
        fail("cannot seek checkpoint file");
    }
    m_writeOffset = static_cast<std::uint64_t>(::ftello(m_file.get()));
}

CacheStore::~CacheStore() = default;

CacheMap CacheStore::load()
{
    std::FILE* file = m_file.get();
    if (::fseeko(file, 0, SEEK_SET) != 0) {
        fail("cannot rewind checkpoint file");
    }

    CacheMap cache;
    std::uint64_t validLength = 0;

    LineBuffer line;
    ssize_t length = 0;

    while ((length = ::getline(&line.data, &line.capacity, file)) > 0) {
        auto entry = parseCacheLine(std::string_view(line.data, static_cast<size_t>(length)));
        if (!entry) break;

        cache.insert_or_assign(std::move(entry->path), entry->hash);
        validLength += static_cast<std::uint64_t>(length);
    }

    if (std::ferror(file)) {
        fail("error reading checkpoint file");
    }

    if (::fseeko(file, 0, SEEK_END) != 0) {
        fail("cannot seek checkpoint file");
    }
    const auto fileLength = static_cast<std::uint64_t>(::ftello(file));

    if (fileLength > validLength) {
        PHASHCACHE_DEBUG("CacheStore", "discarding ", fileLength - validLength,
            " trailing byte(s) after the last complete record in ", m_path);

        if (std::fflush(file) != 0 || ::ftruncate(::fileno(file), static_cast<off_t>(validLength)) != 0) {
            fail("cannot truncate checkpoint file");
        }
    }

    if (::fseeko(file, static_cast<off_t>(validLength), SEEK_SET) != 0) {
        fail("cannot seek checkpoint file");
    }
    m_writeOffset = validLength;

    PHASHCACHE_DEBUG("CacheStore", "recovered ", cache.size(), " entries from ", m_path);
    return cache;
}

bool CacheStore::append(const CacheEntry& entry)
{
    if (!isStorablePath(entry.path)) {
        PHASHCACHE_WARN("CacheStore", "path contains tab or newline, it will be skipped: ", entry.path);
        return false;
    }

    const std::string line = formatCacheLine(entry);
    std::FILE* file = m_file.get();

    if (std::fwrite(line.data(), 1, line.size(), file) != line.size()) {
        fail("error writing checkpoint file");
    }
    if (std::fflush(file) != 0) {
        fail("error flushing checkpoint file");
    }
    if (::fsync(::fileno(file)) != 0) {
        fail("error syncing checkpoint file");
    }

    m_writeOffset += line.size();
    return true;
}

void CacheStore::fail(const std::string& what) const
{
    const int err = errno;
    throw std::runtime_error(what + " '" + m_path + "': " + std::strerror(err));
}

} // namespace phashcache
