#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace phashcache {

enum class PipelineStage {
    Hash,
    Write
};

struct ProgressInfo {
    size_t totalImages = 0;
    size_t hashedCompleted = 0;
    size_t writtenCompleted = 0;
    size_t failedImages = 0;
    size_t rejectedImages = 0;

    // Images that reached a final state: written, failed or rejected.
    size_t finished() const {
        return writtenCompleted + failedImages + rejectedImages;
    }
};

// Thread-safe progress tracker with rate-limited callbacks
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    ProgressTracker(size_t totalImages, ProgressCallback callback = nullptr,
                    std::chrono::milliseconds minCallbackInterval = std::chrono::milliseconds(100));

    void update(PipelineStage stage, size_t count);
    void updateFailed(size_t count);
    void updateRejected(size_t count);
    void forceUpdate();

    ProgressInfo getProgress() const;

private:
    std::atomic<size_t> m_totalImages;
    std::atomic<size_t> m_hashedCompleted;
    std::atomic<size_t> m_writtenCompleted;
    std::atomic<size_t> m_failedImages;
    std::atomic<size_t> m_rejectedImages;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
    std::chrono::steady_clock::time_point m_lastCallbackTime;
    const std::chrono::milliseconds m_minCallbackInterval;

    void tryInvokeCallback();
};

} // namespace phashcache
