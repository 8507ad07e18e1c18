#pragma once

// some common utils for the interactive examples

#include <limits>
#include <string>
#include <utility>
#include <iostream>
#include <string_view>

#include "fmt/core.h"
#include "fmt/ranges.h"

#include "thompson/regex.hpp"

template <typename... Args>
void println(fmt::format_string<Args...> format, Args&&... args) {
	fmt::print(format, std::forward<Args>(args)...);
	fmt::print("\n");
}

// read a whole line, false on end of input
inline bool read_line(std::string_view prompt, std::string& line) {
	println("{}", prompt);
	return static_cast<bool>(std::getline(std::cin, line));
}

inline void print_span(std::string_view target, const thompson::regex::span& m) {
	fmt::print("\"{}\"[{},{})", m.view(target), m.start, m.end);
}
