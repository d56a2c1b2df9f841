#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace phashcache {

struct CacheEntry {
    std::string path;
    std::uint64_t hash = 0;

    bool operator==(const CacheEntry&) const = default;
};

using CacheMap = std::unordered_map<std::string, std::uint64_t>;

// Parses one checkpoint line, including its trailing '\n'. Returns std::nullopt for
// anything that is not a complete `<path>\t<hash>\n` record.
std::optional<CacheEntry> parseCacheLine(std::string_view line);

std::string formatCacheLine(const CacheEntry& entry);

// Paths containing the field or record delimiter cannot be stored.
bool isStorablePath(std::string_view path);

/**
 * Append-only checkpoint file of `<path>\t<hash>\n` records.
 *
 * load() recovers the longest well-formed prefix and discards whatever follows it
 * (the unfinished tail of a crashed run). append() writes a single record and
 * flushes it to disk before returning. The store is not thread-safe: a single
 * writer owns it for the duration of a run.
 */
class CacheStore {
public:
    // Opens (creating if absent) the checkpoint file for reading and writing.
    // Throws std::runtime_error when the file cannot be opened.
    explicit CacheStore(std::string path);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    CacheMap load();

    // Returns false (and logs a warning) when the path is not storable.
    // Throws std::runtime_error on write or sync failure.
    bool append(const CacheEntry& entry);

    const std::string& path() const { return m_path; }

    // Byte offset where the next record will be written.
    std::uint64_t writeOffset() const { return m_writeOffset; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept;
    };

    [[noreturn]] void fail(const std::string& what) const;

    std::string m_path;
    std::unique_ptr<std::FILE, FileCloser> m_file;
    std::uint64_t m_writeOffset = 0;
};

} // namespace phashcache
