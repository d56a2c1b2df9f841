#include "../include/progress_tracker.hpp"

namespace phashcache {

ProgressTracker::ProgressTracker(size_t totalImages, ProgressCallback callback,
                                 std::chrono::milliseconds minCallbackInterval)
    : m_totalImages(totalImages),
      m_hashedCompleted(0),
      m_writtenCompleted(0),
      m_failedImages(0),
      m_rejectedImages(0),
      m_callback(std::move(callback)),
      m_lastCallbackTime(std::chrono::steady_clock::now()),
      m_minCallbackInterval(minCallbackInterval)
{
}

void ProgressTracker::update(PipelineStage stage, size_t count) {
    switch (stage) {
        case PipelineStage::Hash:
            m_hashedCompleted.fetch_add(count, std::memory_order_relaxed);
            break;
        case PipelineStage::Write:
            m_writtenCompleted.fetch_add(count, std::memory_order_relaxed);
            break;
    }

    tryInvokeCallback();
}

void ProgressTracker::updateFailed(size_t count) {
    m_failedImages.fetch_add(count, std::memory_order_relaxed);
    tryInvokeCallback();
}

void ProgressTracker::updateRejected(size_t count) {
    m_rejectedImages.fetch_add(count, std::memory_order_relaxed);
    tryInvokeCallback();
}

void ProgressTracker::forceUpdate() {
    if (!m_callback) return;

    std::lock_guard<std::mutex> lock(m_callbackMutex);

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = std::chrono::steady_clock::now();
}

ProgressInfo ProgressTracker::getProgress() const {
    ProgressInfo info;

    info.totalImages = m_totalImages.load(std::memory_order_relaxed);
    info.hashedCompleted = m_hashedCompleted.load(std::memory_order_relaxed);
    info.writtenCompleted = m_writtenCompleted.load(std::memory_order_relaxed);
    info.failedImages = m_failedImages.load(std::memory_order_relaxed);
    info.rejectedImages = m_rejectedImages.load(std::memory_order_relaxed);

    return info;
}

void ProgressTracker::tryInvokeCallback() {
    if (!m_callback) return;

    std::unique_lock<std::mutex> lock(m_callbackMutex, std::try_to_lock);
    if (!lock.owns_lock()) return;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastCallbackTime);
    if (elapsed < m_minCallbackInterval) return;

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = now;
}

} // namespace phashcache
