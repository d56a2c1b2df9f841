//
// helpers.cpp
// General utility and helper functions for the phashcache CLI application
//

#include "helpers.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace phashcache_app {

indicators::ProgressBar bar(std::string_view prefix, std::size_t maxProgress) {
    return indicators::ProgressBar{
        indicators::option::BarWidth{40},
        indicators::option::PrefixText{std::string(prefix)},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::MaxProgress{maxProgress},
        indicators::option::ShowPercentage{true},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowRemainingTime{true},
        indicators::option::Stream{std::cerr}
    };
}

std::string withCommas(std::size_t number) {
    std::string digits = std::to_string(number);
    for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<std::size_t>(pos), 1, ',');
    }
    return digits;
}

std::string trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string_view::npos) return {};

    const auto end = s.find_last_not_of(" \t\r\n\v\f");
    return std::string(s.substr(start, end - start + 1));
}

std::vector<std::string> readPathList(std::istream& in) {
    std::vector<std::string> paths;
    std::string line;

    while (std::getline(in, line)) {
        auto path = trim(line);
        if (!path.empty()) paths.emplace_back(std::move(path));
    }

    return paths;
}

std::vector<std::string> readInputList(const std::string& source) {
    if (source == "-") {
        return readPathList(std::cin);
    }

    errno = 0;
    std::ifstream in(source);
    if (!in) {
        const int err = errno;
        throw std::runtime_error("Cannot open input list '" + source + "': " + (err ? std::strerror(err) : "unknown error"));
    }

    return readPathList(in);
}

} // namespace phashcache_app
