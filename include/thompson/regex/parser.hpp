#pragma once

/*
	Recursive descent parser, from pattern string to component tree.

	Grammar:
	alternation   ::= concatenation ('|' concatenation)*
	concatenation ::= quantified*
	quantified    ::= atom quantifier?
	quantifier    ::= '*' | '+' | '?' | '{' m '}' | '{' m ',' '}' | '{' m ',' n '}'
	atom          ::= literal | '.' | brackets | '(' alternation ')' | '(?:' alternation ')'
	                | '^' | '$' | '\' escape

	Every error is detected here, the compiler never sees an invalid tree.
	Group nesting is bounded by compile_options::max_nesting_depth and alternations are
	balanced, so the depth of the tree, and of every recursion over it, stays small.
*/

#include <tuple>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <variant>
#include <optional>
#include <string_view>

#include "thompson/regex/error.hpp"
#include "thompson/regex/options.hpp"
#include "thompson/regex/component.hpp"

namespace thompson {

namespace regex {

namespace impl {

using std::tuple;
using std::optional;
using std::basic_string_view;

template <typename CharT>
struct pattern_parser {

	using char_t = CharT;
	using pattern_view_t = basic_string_view<char_t>;

	using component_t = component<char_t>;
	using char_class_t = char_class<char_t>;
	using quantifier_t = quantifier<char_t>;

	// a resolved escape: either a single char or a whole class
	using escape_t = std::variant<char_t, char_class_t>;

	struct bounds {
		size_t min, max;
	};

	pattern_parser(pattern_view_t pattern, const compile_options& options = {}):
		pattern{pattern}, options{options} {}

	tuple<syntax_error, optional<component_t>> parse() {
		pos = 0;
		depth = 0;
		error = {};

		auto tree = parse_alternation();
		if(tree.has_value() && pos != pattern.size()) {
			// the only thing that stops the top level alternation early is a ')'
			tree.reset();
			fail(error_category::missing_paren, pos);
		}
		if(!tree.has_value()) return {error, std::nullopt};
		return {error, std::move(tree)};
	}

protected:

	pattern_view_t pattern;
	compile_options options;

	size_t pos = 0;
	size_t depth = 0; // open groups around pos
	syntax_error error;

	bool at_end() const noexcept{
		return pos >= pattern.size();
	}

	char_t peek() const noexcept{
		return pattern[pos];
	}

	// next char is c, and there is one
	bool peek_is(char_t c) const noexcept{
		return !at_end() && peek() == c;
	}

	std::nullopt_t fail(error_category category, size_t offset) noexcept{
		// keep the first error
		if(!error.failed()) error = {category, offset};
		return std::nullopt;
	}

	static constexpr bool is_quantifier(char_t c) noexcept{
		return c == '*' || c == '+' || c == '?' || c == '{';
	}

	static constexpr bool is_digit(char_t c) noexcept{
		return in_range<char_t>('0', '9', c);
	}

	optional<component_t> parse_alternation() {
		vector<component_t> alternatives;
		do {
			if(!alternatives.empty()) ++pos; // '|'
			auto branch = parse_concatenation();
			if(!branch.has_value()) return std::nullopt;
			alternatives.push_back(std::move(*branch));
		}while(peek_is('|'));

		return join_alternatives(alternatives, 0, alternatives.size());
	}

	// a|b|c|d -> (a|b)|(c|d), the tree is log(n) deep however many branches there are
	static component_t join_alternatives(vector<component_t>& alternatives, size_t first, size_t last) {
		if(last - first == 1) return std::move(alternatives[first]);
		size_t middle = first + (last - first + 1) / 2;
		return component_t{alternation<char_t>{
			make_child<char_t>(join_alternatives(alternatives, first, middle)),
			make_child<char_t>(join_alternatives(alternatives, middle, last))
		}};
	}

	optional<component_t> parse_concatenation() {
		sequence<char_t> seq;
		while(!at_end() && peek() != '|' && peek() != ')') {
			auto item = parse_quantified();
			if(!item.has_value()) return std::nullopt;
			seq.items.push_back(std::move(*item));
		}
		// a sequence of one is just that one
		if(seq.items.size() == 1) return std::move(seq.items.front());
		return component_t{std::move(seq)};
	}

	optional<component_t> parse_quantified() {
		if(is_quantifier(peek())) return fail(error_category::empty_operand, pos);

		auto atom = parse_atom();
		if(!atom.has_value()) return std::nullopt;
		if(at_end() || !is_quantifier(peek())) return atom;

		if(atom->is_assertion()) return fail(error_category::quantified_assertion, pos);

		size_t quantifier_pos = pos;
		bool is_braces = peek() == '{';
		auto b = parse_quantifier();
		if(!b.has_value()) return std::nullopt;

		component_t result{quantifier_t{make_child<char_t>(std::move(*atom)), b->min, b->max}};
		if(is_braces && unroll_complexity(result) > options.max_unroll_complexity)
			return fail(error_category::expensive_brace_expression_unroll, quantifier_pos);

		// R** and R{2}? are rejected, there is no lazy or possessive form
		if(!at_end() && is_quantifier(peek())) return fail(error_category::repeated_quantifier, pos);

		return result;
	}

	optional<bounds> parse_quantifier() {
		switch(peek()) {
		case '*': ++pos; return bounds{0, quantifier_t::unbounded};
		case '+': ++pos; return bounds{1, quantifier_t::unbounded};
		case '?': ++pos; return bounds{0, 1};
		}
		return parse_braces();
	}

	optional<component_t> parse_atom() {
		switch(peek()) {
		case '(':
			return parse_group();
		case '[': {
			auto cls = parse_brackets();
			if(!cls.has_value()) return std::nullopt;
			return component_t{std::move(*cls)};
		}
		case '^':
			++pos;
			return component_t{anchor_start{}};
		case '$':
			++pos;
			return component_t{anchor_end{}};
		case '.':
			++pos;
			return component_t{char_class_t::wildcard(options.dot_matches_newline)};
		case '\\': {
			auto e = lex_escape();
			if(!e.has_value()) return std::nullopt;
			if(auto* c = std::get_if<char_t>(&*e)) return component_t{literal<char_t>{*c}};
			return component_t{std::get<char_class_t>(std::move(*e))};
		}
		default:
			return component_t{literal<char_t>{pattern[pos++]}};
		}
	}

	optional<component_t> parse_group() {
		// assert peek() == '('
		size_t open = pos++;
		if(depth == options.max_nesting_depth) return fail(error_category::too_deep_nesting, open);
		if(peek_is('?')) {
			// (?: is the only extension we know, (?=, (?!, (?<... are not supported
			if(pos + 1 < pattern.size() && pattern[pos + 1] == ':') pos += 2;
			else return fail(error_category::unsupported_features, open);
		}

		++depth;
		auto inner = parse_alternation();
		--depth;
		if(!inner.has_value()) return std::nullopt;
		if(!peek_is(')')) return fail(error_category::missing_paren, open);
		++pos;
		return component_t{group<char_t>{make_child<char_t>(std::move(*inner))}};
	}

	/*
		control escapes:
			f: U+000C, page-feed
			n: U+000A, line-feed
			r: U+000D, return
			t: U+0009, tab
			v: U+000B, vertical-tab

		class escapes:
			d: digit                 D: non-digit
			s: space                 S: non-space
			w: letter, digit or '_'  W: anything else

		identity escapes, for the metacharacters only:
			\ ^ $ . | ? * + ( ) [ ] { } - /
	*/
	optional<escape_t> lex_escape() {
		// assert peek() == '\\'
		size_t backslash = pos++;
		if(at_end()) return fail(error_category::bad_escape, backslash);

		char_t c = pattern[pos++];
		switch(c) {
		case 'f': return escape_t{char_t('\f')};
		case 'n': return escape_t{char_t('\n')};
		case 'r': return escape_t{char_t('\r')};
		case 't': return escape_t{char_t('\t')};
		case 'v': return escape_t{char_t('\v')};

		case 'd': return escape_t{char_class_t::digits()};
		case 'D': return escape_t{char_class_t::digits(true)};
		case 's': return escape_t{char_class_t::spaces()};
		case 'S': return escape_t{char_class_t::spaces(true)};
		case 'w': return escape_t{char_class_t::words()};
		case 'W': return escape_t{char_class_t::words(true)};

		case '\\': case '^': case '$': case '.': case '|':
		case '?':  case '*': case '+': case '(': case ')':
		case '[':  case ']': case '{': case '}': case '-':
		case '/':
			return escape_t{c};
		}
		return fail(error_category::bad_escape, backslash);
	}

	optional<char_class_t> parse_brackets() {
		// assert peek() == '['
		size_t open = pos++;
		char_class_t cls;
		if(peek_is('^')) {
			cls.negated = true;
			++pos;
		}

		// a ']' right after '[' or '[^' is literal
		bool first = true;
		while(true) {
			if(at_end()) return fail(error_category::bad_bracket_expression, open);
			if(peek() == ']' && !first) {
				++pos;
				break;
			}
			first = false;

			size_t item_pos = pos;
			auto lo = lex_bracket_item();
			if(!lo.has_value()) return std::nullopt;

			// '-' is a range only between two items: [a-z], but not [a-] or [-a]
			bool is_range = peek_is('-') && pos + 1 < pattern.size() && pattern[pos + 1] != ']';
			if(!is_range) {
				if(auto* c = std::get_if<char_t>(&*lo)) cls.add(*c);
				else cls.merge(std::get<char_class_t>(*lo));
				continue;
			}

			++pos; // skip '-'
			auto hi = lex_bracket_item();
			if(!hi.has_value()) return std::nullopt;

			auto* from = std::get_if<char_t>(&*lo);
			auto* to = std::get_if<char_t>(&*hi);
			// [\d-z], [a-\w] or [z-a]
			if(from == nullptr || to == nullptr || *to < *from)
				return fail(error_category::bad_bracket_range, item_pos);
			cls.add(*from, *to);
		}
		return cls;
	}

	optional<escape_t> lex_bracket_item() {
		if(peek() == '\\') return lex_escape();
		return escape_t{pattern[pos++]};
	}

	optional<bounds> parse_braces() {
		// assert peek() == '{'
		size_t open = pos++;

		auto lex_number = [this]() -> optional<size_t> {
			if(at_end() || !is_digit(peek())) return std::nullopt;
			// values beyond this cap are unrollable anyway, and must not collide with 'unbounded'
			constexpr size_t cap = quantifier_t::unbounded - 1;
			size_t n = 0;
			do {
				n = saturating_add(saturating_mul(n, 10), static_cast<size_t>(peek() - char_t('0')));
				if(n > cap) n = cap;
				++pos;
			}while(!at_end() && is_digit(peek()));
			return n;
		};

		auto m = lex_number();
		if(!m.has_value()) return fail(error_category::bad_brace_expression, open);

		if(peek_is('}')) {
			++pos;
			return bounds{*m, *m}; // {m}
		}
		if(!peek_is(',')) return fail(error_category::bad_brace_expression, open);
		++pos;

		if(peek_is('}')) {
			++pos;
			return bounds{*m, quantifier_t::unbounded}; // {m,}
		}

		auto n = lex_number();
		if(!n.has_value() || !peek_is('}') || *m > *n) return fail(error_category::bad_brace_expression, open);
		++pos;
		return bounds{*m, *n}; // {m,n}
	}

}; // pattern_parser

} // namespace impl

} // namespace regex

} // namespace thompson
