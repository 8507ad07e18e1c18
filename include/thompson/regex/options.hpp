#pragma once

#include <cstddef>

#include "thompson/regex/log.hpp"

namespace thompson {

namespace regex {

struct compile_options {
	// the largest complexity a single counted repetition may unroll into.
	// every char, class or anchor costs 1, R{m,n} costs n times R, see unroll_complexity()
	static constexpr std::size_t default_unroll_complexity = 2000;
	std::size_t max_unroll_complexity = default_unroll_complexity;

	// groups nested deeper than this are refused, parsing and compiling recurse once per level
	static constexpr std::size_t default_nesting_depth = 256;
	std::size_t max_nesting_depth = default_nesting_depth;

	// '.' excludes '\n' unless this is set
	bool dot_matches_newline = false;

	log_config log;
};

} // namespace regex

} // namespace thompson
