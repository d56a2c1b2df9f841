#include "arguments.hpp"

#include <stdexcept>
#include <string_view>

namespace phashcache_app {

namespace {

std::string trimCopy(std::string_view value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

int validateInRange(std::string_view flag, int value, int min, int max)
{
    if (value < min || value > max) {
        throw std::invalid_argument(std::string(flag) + " must be between " + std::to_string(min) + " and "
            + std::to_string(max) + " (received " + std::to_string(value) + ").");
    }
    return value;
}

int validatePositive(std::string_view flag, int value)
{
    if (value <= 0) {
        throw std::invalid_argument(
            std::string(flag) + " must be greater than zero (received " + std::to_string(value) + ").");
    }
    return value;
}

int validateThreads(int value)
{
    if (value == -1 || value > 0) return value;

    throw std::invalid_argument(
        "--threads must be -1 (auto) or greater than zero (received " + std::to_string(value) + ").");
}

std::string validateInput(const std::string& input)
{
    auto cleaned = trimCopy(input);
    if (cleaned.empty()) {
        throw std::invalid_argument("An input list must be provided (--input), use '-' for standard input.");
    }
    return cleaned;
}

std::string validateOutput(const std::string& output)
{
    if (trimCopy(output).empty()) {
        throw std::invalid_argument("An output file must be provided (--output).");
    }
    return output;
}

} // namespace

Arguments::Arguments(const RawArguments& raw)
    : input(validateInput(raw.input)),
      output(validateOutput(raw.output)),
      threads(validateThreads(raw.threads)),
      queueCapacity(static_cast<size_t>(validatePositive("--queue-capacity", raw.queueCapacity))),
      logLevel(validateInRange("--log-level", raw.logLevel, 0, 4)),
      showProgress(!raw.noProgress)
{
}

} // namespace phashcache_app
