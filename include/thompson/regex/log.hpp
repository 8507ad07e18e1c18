#pragma once

#include <cstdio>
#include <string>
#include <utility>
#include <iterator>
#include <string_view>
#include <type_traits>

#include "fmt/core.h"
#include "fmt/format.h"

namespace thompson {

namespace regex {

enum class log_level {
	trace = 0,
	debug,
	info,
	warning,
	error,
	off
};

constexpr std::string_view level_name(log_level level) noexcept{
	switch(level) {
	case log_level::trace:   return "trace";
	case log_level::debug:   return "debug";
	case log_level::info:    return "info";
	case log_level::warning: return "warning";
	case log_level::error:   return "error";
	case log_level::off:     return "off";
	}
	return "";
}

struct log_config {
	log_level level = log_level::warning;
	std::FILE* sink = stderr;

	constexpr bool enabled(log_level l) const noexcept{
		return sink != nullptr && level != log_level::off && l >= level;
	}
};

// "[thompson.regex] warning: ..." on the configured sink
template <typename... Args>
void log(const log_config& config, log_level level, fmt::format_string<Args...> format, Args&&... args) {
	if(!config.enabled(level)) return;
	fmt::print(config.sink, "[thompson.regex] {}: ", level_name(level));
	fmt::print(config.sink, format, std::forward<Args>(args)...);
	fmt::print(config.sink, "\n");
}

// render a code unit sequence as printable ascii, escaping everything else
template <typename CharT>
std::string display(std::basic_string_view<CharT> s) {
	using unsigned_t = std::make_unsigned_t<CharT>;
	std::string out;
	out.reserve(s.size());
	for(CharT c: s) {
		auto u = static_cast<unsigned_t>(c);
		switch(u) {
		case '\n': out += "\\n"; continue;
		case '\r': out += "\\r"; continue;
		case '\t': out += "\\t"; continue;
		case '\f': out += "\\f"; continue;
		case '\v': out += "\\v"; continue;
		}
		if(0x20 <= u && u < 0x7f) out.push_back(static_cast<char>(u));
		else if(u <= 0xff)        fmt::format_to(std::back_inserter(out), "\\x{:02x}", static_cast<unsigned>(u));
		else                      fmt::format_to(std::back_inserter(out), "\\u{{{:x}}}", static_cast<unsigned long>(u));
	}
	return out;
}

template <typename CharT>
std::string display(CharT c) {
	return display(std::basic_string_view<CharT>{&c, 1});
}

} // namespace regex

} // namespace thompson
