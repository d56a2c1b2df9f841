#pragma once

#include "cache_store.hpp"
#include "hasher_base.h"
#include "progress_tracker.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace phashcache {

constexpr size_t DEFAULT_QUEUE_CAPACITY = 256;

struct PipelineOptions {
    // <= 0 selects one worker per logical core
    int threads = -1;
    size_t queueCapacity = DEFAULT_QUEUE_CAPACITY;
};

struct PipelineStats {
    size_t scheduled = 0;
    size_t hashed = 0;
    size_t written = 0;
    size_t failed = 0;
    size_t rejected = 0;
};

// Candidates minus the paths already cached, deduplicated. Blank entries are dropped.
// Order follows first appearance in `candidates`.
std::vector<std::string> computeWorkSet(const std::vector<std::string>& candidates, const CacheMap& cache);

size_t resolveThreadCount(int requested);

/**
 * Hashes a work set on a pool of workers and funnels the results through a bounded
 * queue to a single writer thread, which is the only code touching the CacheStore.
 *
 * Per-image failures are logged and counted. A failure of the store itself stops
 * further writes; the remaining results are drained so no worker stays blocked, and
 * the error is rethrown from run() once every thread has been joined.
 */
class HashPipeline {
public:
    HashPipeline(const HasherBase& hasher, CacheStore& store, PipelineOptions options = {});

    PipelineStats run(const std::vector<std::string>& work, ProgressTracker* progress = nullptr);

    size_t threadCount() const { return m_threads; }
    size_t queueCapacity() const { return m_options.queueCapacity; }

private:
    const HasherBase& m_hasher;
    CacheStore& m_store;
    PipelineOptions m_options;
    size_t m_threads;
};

} // namespace phashcache
