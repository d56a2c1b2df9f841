#pragma once

#include <cstddef>
#include <string>

namespace phashcache_app {

namespace defaults {
    constexpr const char* INPUT = "-";
    constexpr const char* STDIN_MARKER = "-";

    constexpr int THREADS = -1;
    constexpr int QUEUE_CAPACITY = 256;
    constexpr int LOG_LEVEL = 2;
    constexpr bool NO_PROGRESS = false;
}

struct RawArguments {
    std::string input = defaults::INPUT;
    std::string output;
    int threads = defaults::THREADS;
    int queueCapacity = defaults::QUEUE_CAPACITY;
    int logLevel = defaults::LOG_LEVEL;
    bool noProgress = defaults::NO_PROGRESS;
};

class Arguments {
public:
    explicit Arguments(const RawArguments& raw);

    const std::string input;
    const std::string output;
    const int threads;
    const size_t queueCapacity;
    const int logLevel;
    const bool showProgress;

    bool readsStdin() const { return input == defaults::STDIN_MARKER; }
};

} // namespace phashcache_app
