#include "../include/pipeline.hpp"
#include "../include/logger.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace phashcache {

std::vector<std::string> computeWorkSet(const std::vector<std::string>& candidates, const CacheMap& cache)
{
    std::vector<std::string> work;
    std::unordered_set<std::string> seen;

    for (const auto& path : candidates) {
        if (path.empty() || cache.contains(path)) continue;
        if (seen.insert(path).second) {
            work.push_back(path);
        }
    }

    return work;
}

size_t resolveThreadCount(int requested)
{
    if (requested > 0) return static_cast<size_t>(requested);

    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<size_t>(hw);
}

HashPipeline::HashPipeline(const HasherBase& hasher, CacheStore& store, PipelineOptions options)
    : m_hasher(hasher), m_store(store), m_options(options), m_threads(resolveThreadCount(options.threads))
{
    if (m_options.queueCapacity == 0) {
        throw std::invalid_argument("queue capacity must be greater than zero");
    }
}

PipelineStats HashPipeline::run(const std::vector<std::string>& work, ProgressTracker* progress)
{
    PipelineStats stats;
    stats.scheduled = work.size();
    if (work.empty()) return stats;

    WorkQueue<CacheEntry> results(m_options.queueCapacity, "results");

    std::atomic<size_t> next{ 0 };
    std::atomic<size_t> hashed{ 0 };
    std::atomic<size_t> failed{ 0 };
    size_t written = 0;
    size_t rejected = 0;
    std::exception_ptr writerError;

    // Sole owner of the checkpoint file for the duration of the run
    std::thread writer([&] {
        while (auto entry = results.pop()) {
            if (writerError) continue;

            try {
                if (m_store.append(*entry)) {
                    ++written;
                    if (progress) progress->update(PipelineStage::Write, 1);
                }
                else {
                    ++rejected;
                    if (progress) progress->updateRejected(1);
                }
            }
            catch (const std::exception& e) {
                PHASHCACHE_ERROR("Writer", e.what());
                writerError = std::current_exception();
            }
        }
    });

    auto worker = [&] {
        for (;;) {
            const size_t index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= work.size()) break;

            const std::string& path = work[index];
            try {
                const std::uint64_t hash = m_hasher.hashFile(path);
                hashed.fetch_add(1, std::memory_order_relaxed);
                if (progress) progress->update(PipelineStage::Hash, 1);

                results.push(CacheEntry{ path, hash });
            }
            // HashError, or an OpenCV/allocation failure confined to this image
            catch (const std::exception& e) {
                PHASHCACHE_ERROR("Worker", "Error computing phash for ", path, ": ", e.what());
                failed.fetch_add(1, std::memory_order_relaxed);
                if (progress) progress->updateFailed(1);
            }
            catch (...) {
                PHASHCACHE_ERROR("Worker", "Error computing phash for ", path, ": unknown exception");
                failed.fetch_add(1, std::memory_order_relaxed);
                if (progress) progress->updateFailed(1);
            }
        }
    };

    const size_t workerCount = std::min(m_threads, work.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);

    try {
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
    }
    catch (const std::system_error& e) {
        PHASHCACHE_ERROR("Pipeline", "cannot start worker thread: ", e.what());
        next.store(work.size(), std::memory_order_relaxed);
        for (auto& t : workers) t.join();
        results.setSentinel();
        writer.join();
        throw;
    }

    PHASHCACHE_DEBUG("Pipeline", "started ", workerCount, " worker(s), queue '", results.name(),
        "' capacity ", results.capacity());

    for (auto& t : workers) t.join();
    results.setSentinel();
    writer.join();

    if (writerError) std::rethrow_exception(writerError);

    stats.hashed = hashed.load();
    stats.failed = failed.load();
    stats.written = written;
    stats.rejected = rejected;
    return stats;
}

} // namespace phashcache
