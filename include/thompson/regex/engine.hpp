#pragma once

#include <tuple>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <concepts>
#include <iterator>
#include <optional>
#include <string_view>

#include "thompson/regex/log.hpp"
#include "thompson/regex/nfa.hpp"
#include "thompson/regex/error.hpp"
#include "thompson/regex/parser.hpp"
#include "thompson/regex/options.hpp"
#include "thompson/regex/compiler.hpp"
#include "thompson/regex/simulator.hpp"

namespace thompson {

namespace regex {

// a match, [start, end) in code units of the searched text
struct span {
	std::size_t start = 0;
	std::size_t end = 0;

	constexpr std::size_t length() const noexcept{ return end - start; }
	constexpr bool empty() const noexcept{ return start == end; }

	// the matched text
	template <typename CharT>
	std::basic_string_view<CharT> view(std::basic_string_view<CharT> text) const{
		return text.substr(start, length());
	}

	friend constexpr bool operator==(const span&, const span&) noexcept = default;
};

namespace impl {

using std::pair;
using std::string;
using std::basic_string;
using std::same_as;

template <typename CharT>
class regular_expression_engine {
public:

	using char_t = CharT;
	using string_t = basic_string<char_t>;
	using string_view_t = basic_string_view<char_t>;

	using nfa_t = non_deterministic_finite_automaton<char_t>;
	using simulator_t = nfa_simulator<char_t>;

	// lazy sequence of non-overlapping matches, leftmost first.
	// borrows both the engine and the text, neither may go away while iterating.
	class match_iterator {
	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = span;
		using difference_type = std::ptrdiff_t;
		using pointer = const span*;
		using reference = const span&;

		match_iterator() noexcept = default;
		match_iterator(const regular_expression_engine* engine, string_view_t text):
			engine{engine}, text{text} {
			advance();
		}

		reference operator*() const noexcept{ return *current; }
		pointer operator->() const noexcept{ return &*current; }

		match_iterator& operator++() {
			advance();
			return *this;
		}
		match_iterator operator++(int) {
			auto old = *this;
			advance();
			return old;
		}

		friend bool operator==(const match_iterator& lhs, const match_iterator& rhs) noexcept{
			return lhs.current == rhs.current;
		}

	private:
		const regular_expression_engine* engine = nullptr;
		string_view_t text;
		size_t next_start = 0;
		optional<span> current;

		void advance() {
			if(engine == nullptr || next_start > text.size()) {
				current.reset();
				return;
			}
			current = engine->search(text, next_start);
			if(!current.has_value()) return;
			// an empty match must not be found again at the same place
			next_start = current->empty() ? current->end + 1 : current->end;
		}
	};

	class match_range {
	public:
		match_range(const regular_expression_engine* engine, string_view_t text) noexcept:
			engine{engine}, text{text} {}

		// every call starts over from the beginning of the text
		match_iterator begin() const{ return {engine, text}; }
		match_iterator end() const noexcept{ return {}; }

		vector<span> to_vector() const{
			return {begin(), end()};
		}

	private:
		const regular_expression_engine* engine;
		string_view_t text;
	};

	regular_expression_engine(string_view_t pattern, nfa_t nfa, const compile_options& options = {}):
		source{pattern}, nfa{std::move(nfa)}, opts{options} {}

	const string_t& pattern() const noexcept{ return source; }
	const nfa_t& automaton() const noexcept{ return nfa; }
	const compile_options& options() const noexcept{ return opts; }

	// the longest match starting at offset 0, text after it is ignored unless the pattern ends with $
	optional<span> match(string_view_t text) const{
		simulator_t sim{nfa};
		if(auto end = sim.run(text, 0); end.has_value()) return span{0, *end};
		return std::nullopt;
	}

	// a match covering the whole text
	optional<span> full_match(string_view_t text) const{
		auto m = match(text);
		if(m.has_value() && m->end == text.size()) return m;
		return std::nullopt;
	}

	// leftmost match at or after 'from', longest among those starting there
	optional<span> search(string_view_t text, size_t from = 0) const{
		simulator_t sim{nfa};
		for(size_t start = from; start <= text.size(); ++start) {
			if(auto end = sim.run(text, start); end.has_value()) return span{start, *end};
		}
		return std::nullopt;
	}

	match_range find_all(string_view_t text) const{
		return {this, text};
	}

	// the range would outlive a temporary string
	template <typename StringT>
	requires same_as<StringT, string_t>
	match_range find_all(StringT&& text) const = delete;

	// replace at most 'count' matches (0 for all), returns the new text and the number of replacements
	pair<string_t, size_t> subn(string_view_t text, string_view_t replacement, size_t count = 0) const{
		string_t result;
		result.reserve(text.size());
		size_t copied = 0, replaced = 0;
		for(const auto& m: find_all(text)) {
			if(count != 0 && replaced == count) break;
			result.append(text.substr(copied, m.start - copied));
			result.append(replacement);
			copied = m.end;
			++replaced;
		}
		result.append(text.substr(copied));
		return {std::move(result), replaced};
	}

	string_t sub(string_view_t text, string_view_t replacement, size_t count = 0) const{
		return subn(text, replacement, count).first;
	}

	// pieces of text between matches, at most 'maxsplit' splits (0 for no limit)
	vector<string_t> split(string_view_t text, size_t maxsplit = 0) const{
		vector<string_t> pieces;
		size_t copied = 0;
		for(const auto& m: find_all(text)) {
			if(maxsplit != 0 && pieces.size() == maxsplit) break;
			pieces.emplace_back(text.substr(copied, m.start - copied));
			copied = m.end;
		}
		pieces.emplace_back(text.substr(copied));
		return pieces;
	}

private:
	string_t source;
	nfa_t nfa;
	compile_options opts;

}; // class regular_expression_engine

} // namespace impl

template <typename CharT>
using regular_expression_engine = impl::regular_expression_engine<CharT>;

using regex = regular_expression_engine<char>;

// compile a pattern once, run it many times.
// the engine is present exactly when the error is not.
template <typename CharT>
std::tuple<syntax_error, std::optional<regular_expression_engine<CharT>>> compile(std::basic_string_view<CharT> pattern, const compile_options& options = {}) {
	auto [error, tree] = impl::pattern_parser<CharT>{pattern, options}.parse();
	if(error.failed()) {
		thompson::regex::log(options.log, log_level::warning, "invalid pattern \"{}\": {}", display(pattern), error.describe());
		return {error, std::nullopt};
	}

	auto nfa = impl::compile_tree(*tree);
	thompson::regex::log(options.log, log_level::debug, "compiled \"{}\" into {} states", display(pattern), nfa.size());
	return {error, regular_expression_engine<CharT>{pattern, std::move(nfa), options}};
}

inline std::tuple<syntax_error, std::optional<regex>> compile(std::string_view pattern, const compile_options& options = {}) {
	return compile<char>(pattern, options);
}

// free functions, compile and run in one go

template <typename CharT>
std::tuple<syntax_error, std::optional<span>> match(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target) {
	auto [error, re] = compile<CharT>(pattern);
	if(error.failed()) return {error, std::nullopt};
	return {error, re->match(target)};
}

template <typename CharT>
std::tuple<syntax_error, std::optional<span>> search(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target) {
	auto [error, re] = compile<CharT>(pattern);
	if(error.failed()) return {error, std::nullopt};
	return {error, re->search(target)};
}

template <typename CharT>
std::tuple<syntax_error, std::vector<span>> find_all(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target) {
	auto [error, re] = compile<CharT>(pattern);
	if(error.failed()) return {error, {}};
	return {error, re->find_all(target).to_vector()};
}

template <typename CharT>
std::tuple<syntax_error, std::basic_string<CharT>> sub(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, std::basic_string_view<CharT> replacement, std::size_t count = 0) {
	auto [error, re] = compile<CharT>(pattern);
	if(error.failed()) return {error, std::basic_string<CharT>{target}};
	return {error, re->sub(target, replacement, count)};
}

template <typename CharT>
std::tuple<syntax_error, std::vector<std::basic_string<CharT>>> split(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target, std::size_t maxsplit = 0) {
	auto [error, re] = compile<CharT>(pattern);
	if(error.failed()) return {error, {}};
	return {error, re->split(target, maxsplit)};
}

} // namespace regex

} // namespace thompson
