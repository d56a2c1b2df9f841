#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

#define PHASHCACHE_TRACE(...) ::phashcache::logger::trace(__VA_ARGS__)
#define PHASHCACHE_DEBUG(...) ::phashcache::logger::debug(__VA_ARGS__)
#define PHASHCACHE_INFO(...) ::phashcache::logger::info(__VA_ARGS__)
#define PHASHCACHE_WARN(...) ::phashcache::logger::warn(__VA_ARGS__)
#define PHASHCACHE_ERROR(...) ::phashcache::logger::error(__VA_ARGS__)

/**
 * -------------
 * USAGE OVERVIEW
 * -------------
 *
 * // Initialize once, specifying log level and ring size (power-of-two):
 * phashcache::logger::init(phashcache::logger::Level::INFO, 4096);
 *
 * // Log from any thread with:
 * PHASHCACHE_WARN("CacheStore", "skipping ", path);
 *
 * // On shutdown (drains everything still queued):
 * phashcache::logger::shutdown();
 *
 * Messages logged before init() or after shutdown() are written synchronously.
*/

namespace phashcache::logger
{
    enum Level : uint8_t
    {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR_L
    };

    constexpr const char* levelToStr(Level lv) noexcept
    {
        switch (lv)
        {
        case TRACE: return "TRACE";
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR_L: return "ERROR";
        }
        return "UNKNOWN";
    }

    //-----------------------------------
    // Internal Helper to Build Strings
    //-----------------------------------
    namespace detail
    {
        inline void appendOne(std::string& dest, const char* str)
        {
            if (str) {
                dest += str;
            }
        }

        inline void appendOne(std::string& dest, const std::string& s)
        {
            dest += s;
        }

        inline void appendOne(std::string& dest, char c)
        {
            dest += c;
        }

        inline void appendOne(std::string& dest, bool b)
        {
            dest += b ? "true" : "false";
        }

        // Integers via std::to_chars; floating point goes through the stream fallback
        template <typename T,
            typename std::enable_if_t<std::is_integral_v<T> &&
            !std::is_same_v<T, bool> && !std::is_same_v<T, char>, int> = 0>
        inline void appendOne(std::string& dest, T val)
        {
            char buf[32];
            auto end = std::to_chars(buf, buf + sizeof(buf), val).ptr;
            dest.append(buf, static_cast<size_t>(end - buf));
        }

        // Fallback for any other type that implements operator<<
        template <typename T,
            typename std::enable_if_t<!std::is_integral_v<std::decay_t<T>> &&
            !std::is_same_v<std::decay_t<T>, std::string> &&
            !std::is_same_v<std::decay_t<T>, const char*> &&
            !std::is_same_v<std::decay_t<T>, char*>, int> = 0>
        inline void appendOne(std::string& dest, const T& val)
        {
            thread_local std::ostringstream oss;
            oss.str(std::string{});
            oss.clear();
            oss << val;
            dest += oss.str();
        }

        template <typename... Ts>
        inline void buildString(std::string& dest, Ts&&... args)
        {
            (appendOne(dest, std::forward<Ts>(args)), ...);
        }
    } // namespace detail

    //-----------------------------------
    // Internal Ring Buffer
    //-----------------------------------
    struct LogMessage
    {
        Level level;
        char padding[7]; // Padding for 8-byte alignment
        int64_t microsSinceEpoch;
        std::string id;
        std::string text;
    };

    // Bounded MPSC ring. Producers reserve a slot under a short lock; the single
    // consumer pops without contention with other consumers.
    class LogRing
    {
    public:
        explicit LogRing(size_t size) : m_size(size), m_buffer(new LogMessage[size]) {}

        ~LogRing() { delete[] m_buffer; }

        LogRing(const LogRing&) = delete;
        LogRing& operator=(const LogRing&) = delete;

        // Returns true if stored, false if the ring was full.
        bool tryPush(LogMessage& msg)
        {
            std::lock_guard<std::mutex> lock(m_pushMutex);
            const auto tail = m_tail.load(std::memory_order_relaxed);
            if (tail - m_head.load(std::memory_order_acquire) >= m_size) return false;

            m_buffer[tail % m_size] = std::move(msg);
            m_tail.store(tail + 1, std::memory_order_release);
            return true;
        }

        // Single-consumer pop
        bool tryPop(LogMessage& out)
        {
            const auto currentHead = m_head.load(std::memory_order_relaxed);
            if (currentHead >= m_tail.load(std::memory_order_acquire)) return false;

            out = std::move(m_buffer[currentHead % m_size]);
            m_head.store(currentHead + 1, std::memory_order_release);
            return true;
        }

    private:
        size_t m_size;
        LogMessage* m_buffer;
        std::mutex m_pushMutex;
        alignas(64) std::atomic<uint64_t> m_head{ 0 };
        alignas(64) std::atomic<uint64_t> m_tail{ 0 };
    };

    //-----------------------------------
    // The Logger Singleton
    //-----------------------------------
    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance()
        {
            static Logger s;
            return s;
        }

        // Called once at startup
        void init(Level level, size_t ringSize)
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            m_currentLevel.store(level, std::memory_order_relaxed);
            if (!m_ring)
            {
                m_ring = new LogRing(ringSize);
                m_running.store(true, std::memory_order_release);
                m_consumerThread = std::thread(&Logger::consumerLoop, this);
            }
        }

        template<typename IdType, typename... Args>
        void log(Level lv, IdType&& id, Args&&... args)
        {
            if (lv < m_currentLevel.load(std::memory_order_relaxed)) return;

            std::string text;
            text.reserve(128);
            detail::buildString(text, std::forward<Args>(args)...);

            LogMessage msg;
            msg.level = lv;
            msg.microsSinceEpoch = nowMicrosSinceEpoch();
            msg.id = std::forward<IdType>(id);
            msg.text = std::move(text);

            // Full ring: wait for the consumer instead of dropping the message
            while (m_running.load(std::memory_order_acquire)) {
                if (m_ring->tryPush(msg)) return;
                std::this_thread::yield();
            }

            printMessage(msg);
        }

        void shutdown()
        {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (m_running.exchange(false, std::memory_order_acq_rel))
            {
                if (m_consumerThread.joinable()) {
                    m_consumerThread.join();
                }

                delete m_ring;
                m_ring = nullptr;
            }
        }

    private:
        Logger() = default;
        ~Logger() { shutdown(); }

        static int64_t nowMicrosSinceEpoch()
        {
            using namespace std::chrono;
            return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        }

        void consumerLoop()
        {
            while (m_running.load(std::memory_order_acquire))
            {
                LogMessage msg;
                while (m_ring->tryPop(msg)) { printMessage(msg); }

                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            // Drain any remaining
            LogMessage leftover;
            while (m_ring->tryPop(leftover)) { printMessage(leftover); }
        }

        static void printMessage(const LogMessage& lm)
        {
            using namespace std::chrono;
            auto tp = system_clock::time_point(microseconds(lm.microsSinceEpoch));

            std::time_t t = system_clock::to_time_t(tp);
            std::tm tmBuf{};
            gmtime_r(&t, &tmBuf);

            auto msPart = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

            char timeBuf[32];
            std::snprintf(timeBuf, sizeof(timeBuf),
                "%02d:%02d:%02d.%03d",
                tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                static_cast<int>(msPart));

            // One write per line so concurrent synchronous messages do not interleave
            std::string line;
            line.reserve(lm.text.size() + lm.id.size() + 32);
            line += "[";
            line += timeBuf;
            line += "] [";
            line += levelToStr(lm.level);
            line += "] ";
            if (!lm.id.empty()) {
                line += "[" + lm.id + "] ";
            }
            line += lm.text;
            line += '\n';

            static std::mutex writeMutex;
            std::lock_guard<std::mutex> lock(writeMutex);
            std::cerr << line << std::flush;
        }

        LogRing* m_ring = nullptr;
        std::atomic<Level> m_currentLevel{ INFO };
        std::atomic<bool> m_running{ false };
        std::thread m_consumerThread;
        std::mutex m_lifecycleMutex;
    };

    //-----------------------------------
    // Public API
    //-----------------------------------
    inline void init(Level lv, size_t ringSize = 4096)
    {
        Logger::instance().init(lv, ringSize);
    }

    inline void shutdown()
    {
        Logger::instance().shutdown();
    }

    template<typename IdType, typename... Args>
    inline void log(Level lv, IdType&& id, Args&&... args)
    {
        Logger::instance().log(lv, std::forward<IdType>(id), std::forward<Args>(args)...);
    }

    template<typename IdType, typename... Args>
    inline void trace(IdType&& id, Args&&... args) { log(TRACE, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void debug(IdType&& id, Args&&... args) { log(DEBUG, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void info(IdType&& id, Args&&... args) { log(INFO, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void warn(IdType&& id, Args&&... args) { log(WARN, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void error(IdType&& id, Args&&... args) { log(ERROR_L, std::forward<IdType>(id), std::forward<Args>(args)...); }

} // namespace phashcache::logger
