//
// helpers.hpp
// General utility and helper functions for the phashcache CLI application
//

#pragma once

#include <indicators/progress_bar.hpp>

#include <cstddef>
#include <iosfwd>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace phashcache_app {

// Cursor visibility control; the progress bar is drawn on stderr
inline void hideCursor() { std::cerr << "\033[?25l" << std::flush; }
inline void showCursor() { std::cerr << "\033[?25h" << std::flush; }

// Progress bar creation
indicators::ProgressBar bar(std::string_view prefix, std::size_t maxProgress);

// Number formatting
std::string withCommas(std::size_t number);

// String manipulation
std::string trim(std::string_view s);

// Candidate path list: one path per line, surrounding whitespace removed.
// Reading stops at the first stream error, as at end of input.
std::vector<std::string> readPathList(std::istream& in);

// Reads the candidate list from a file, or from stdin when `source` is "-".
// Throws std::runtime_error when the file cannot be opened.
std::vector<std::string> readInputList(const std::string& source);

} // namespace phashcache_app
