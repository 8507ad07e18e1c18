#pragma once

#include <string>
#include <cstddef>
#include <string_view>

#include "fmt/core.h"

namespace thompson {

namespace regex {

enum class error_category {
	success = 0,
	empty_operand,                     // quantifier with nothing to repeat: "*a", "(+)", "a|?"
	repeated_quantifier,               // quantifier after quantifier: "a**", "a{2}?"
	quantified_assertion,              // quantifier after an anchor: "^*", "$+"
	bad_escape,                        // unknown escape or trailing backslash
	missing_paren,                     // unmatched '(' or ')'
	bad_bracket_expression,            // unterminated [...]
	bad_bracket_range,                 // [z-a], [\d-z]
	bad_brace_expression,              // {x}, {3,1}, {2
	expensive_brace_expression_unroll, // counted repetition too large to unroll
	unsupported_features,              // (?=...), (?!...), (?<name>...)
	too_deep_nesting                   // more nested groups than compile_options allows
};

constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                return "successed";
	case error_category::empty_operand:          return "empty operand";
	case error_category::repeated_quantifier:    return "multiple repeat";
	case error_category::quantified_assertion:   return "nothing to repeat before assertion";
	case error_category::bad_escape:             return "bad escape";
	case error_category::missing_paren:          return "missing parentheses";
	case error_category::bad_bracket_expression: return "bad bracket expression";
	case error_category::bad_bracket_range:      return "bad character range";
	case error_category::bad_brace_expression:   return "bad brace expression";
	case error_category::expensive_brace_expression_unroll: return "brace expression is too complex to unroll";
	case error_category::unsupported_features:   return "unsupported features";
	case error_category::too_deep_nesting:       return "parentheses nested too deeply";
	}
	return "";
}

// result of compiling a pattern: what went wrong and where.
// offset is in code units from the beginning of the pattern.
struct syntax_error {
	error_category category = error_category::success;
	std::size_t offset = 0;

	constexpr bool failed() const noexcept{
		return category != error_category::success;
	}

	constexpr std::string_view message() const noexcept{
		return error_message(category);
	}

	std::string describe() const{
		if(!failed()) return std::string{message()};
		return fmt::format("{} at offset {}", message(), offset);
	}

	friend constexpr bool operator==(const syntax_error&, const syntax_error&) noexcept = default;
};

} // namespace regex

} // namespace thompson
