// hasher_base.h
#pragma once
#include <cstdint>
#include <string>

namespace phashcache {

class HasherBase {
public:
    virtual ~HasherBase() = default;

    // Hashes the image stored at `path`. Throws HashError for failures that only
    // concern this one image.
    virtual std::uint64_t hashFile(const std::string& path) const = 0;
};

} // namespace phashcache
