#pragma once

/*
	Parse tree of a pattern.

	component =
		literal       c
		char_class    [...], [^...], \d, \w, \s, \D, \W, \S, .
		quantifier    R*, R+, R?, R{m}, R{m,}, R{m,n}
		anchor_start  ^
		anchor_end    $
		alternation   R1|R2
		group         (R), (?:R)
		sequence      R1 R2 ... Rn

	escapes are resolved by the parser into a literal or a char_class,
	they never appear in the tree.
*/

#include <memory>
#include <vector>
#include <limits>
#include <cstddef>
#include <utility>
#include <variant>
#include <algorithm>
#include <concepts>
#include <type_traits>

namespace thompson {

namespace regex {

namespace impl {

using std::size_t;
using std::vector;
using std::variant;
using std::unique_ptr;
using std::numeric_limits;
using std::remove_cvref_t;

// concepts
using std::same_as;

template <typename CharT>
struct char_range {
	using char_t = CharT;
	char_t from, to;

	constexpr bool is_member(char_t c) const noexcept{
		return from <= c && c <= to;
	}
};

template <typename CharT>
constexpr bool in_range(CharT a, CharT b, CharT x) noexcept{ return a <= x && x <= b; }

template <typename CharT>
struct char_class {
	using char_t = CharT;
	using range_t = char_range<char_t>;

	vector<range_t> ranges;
	// negated members of a bracket expression, like the \D in [\Da-f]
	vector<char_class> excluded;
	bool negated = false;

	char_class& add(char_t c) {
		ranges.push_back({c, c});
		return *this;
	}
	char_class& add(char_t from, char_t to) {
		ranges.push_back({from, to});
		return *this;
	}
	// union with another class
	char_class& merge(const char_class& other) {
		if(other.negated) {
			excluded.push_back(other);
		}else {
			ranges.insert(ranges.end(), other.ranges.begin(), other.ranges.end());
			excluded.insert(excluded.end(), other.excluded.begin(), other.excluded.end());
		}
		return *this;
	}

	bool is_member(char_t c) const noexcept{
		bool found = std::any_of(ranges.cbegin(), ranges.cend(), [c](const range_t& r) { return r.is_member(c); })
		          || std::any_of(excluded.cbegin(), excluded.cend(), [c](const char_class& e) { return e.is_member(c); });
		return found != negated;
	}

	// predefined classes

	static char_class digits(bool invert = false) {
		char_class cls;
		cls.add('0', '9');
		cls.negated = invert;
		return cls;
	}
	static char_class words(bool invert = false) {
		char_class cls;
		cls.add('0', '9').add('a', 'z').add('A', 'Z').add('_');
		cls.negated = invert;
		return cls;
	}
	static char_class spaces(bool invert = false) {
		// [\t\n\v\f\r ] == [\x09-\x0d ]
		char_class cls;
		cls.add('\x09', '\x0d').add(' ');
		cls.negated = invert;
		return cls;
	}
	static char_class wildcard(bool dot_matches_newline) {
		char_class cls;
		if(!dot_matches_newline) cls.add('\n');
		cls.negated = true;
		return cls;
	}
};

template <typename CharT>
struct component;

template <typename CharT>
struct literal {
	CharT c;
};

// max == unbounded means no upper limit
template <typename CharT>
struct quantifier {
	static constexpr size_t unbounded = numeric_limits<size_t>::max();

	unique_ptr<component<CharT>> child;
	size_t min = 0;
	size_t max = unbounded;

	constexpr bool is_unbounded() const noexcept{
		return max == unbounded;
	}
};

struct anchor_start {};
struct anchor_end {};

template <typename CharT>
struct alternation {
	unique_ptr<component<CharT>> left, right;
};

template <typename CharT>
struct group {
	unique_ptr<component<CharT>> child;
};

template <typename CharT>
struct sequence {
	vector<component<CharT>> items;
};

template <typename CharT>
struct component {
	using char_t = CharT;
	using node_t = variant<
		literal<char_t>,
		char_class<char_t>,
		quantifier<char_t>,
		anchor_start,
		anchor_end,
		alternation<char_t>,
		group<char_t>,
		sequence<char_t>
	>;

	node_t node;

	template <typename NodeT>
	requires (!same_as<remove_cvref_t<NodeT>, component>)
	component(NodeT&& n): node{std::forward<NodeT>(n)} {}

	component(component&&) noexcept = default;
	component& operator=(component&&) noexcept = default;

	template <typename NodeT>
	bool holds() const noexcept{
		return std::holds_alternative<NodeT>(node);
	}

	template <typename NodeT>
	const NodeT& as() const{
		return std::get<NodeT>(node);
	}

	// zero-width assertions can not be repeated
	bool is_assertion() const noexcept{
		return holds<anchor_start>() || holds<anchor_end>();
	}
};

template <typename CharT, typename NodeT>
unique_ptr<component<CharT>> make_child(NodeT&& n) {
	return std::make_unique<component<CharT>>(std::forward<NodeT>(n));
}

// saturating arithmetic, so that a{4000000000} does not wrap around
constexpr size_t saturating_add(size_t a, size_t b) noexcept{
	return a > numeric_limits<size_t>::max() - b ? numeric_limits<size_t>::max() : a + b;
}
constexpr size_t saturating_mul(size_t a, size_t b) noexcept{
	if(a == 0 || b == 0) return 0;
	return a > numeric_limits<size_t>::max() / b ? numeric_limits<size_t>::max() : a * b;
}

// number of automaton states the compiler emits for a tree, see compiler.hpp
template <typename CharT>
size_t count_states(const component<CharT>& c) {
	struct counter {
		size_t operator()(const literal<CharT>&) const noexcept{ return 2; }
		size_t operator()(const char_class<CharT>&) const noexcept{ return 2; }
		size_t operator()(const anchor_start&) const noexcept{ return 2; }
		size_t operator()(const anchor_end&) const noexcept{ return 2; }
		size_t operator()(const group<CharT>& g) const{ return count_states(*g.child); }
		size_t operator()(const alternation<CharT>& a) const{
			return saturating_add(saturating_add(count_states(*a.left), count_states(*a.right)), 2);
		}
		size_t operator()(const sequence<CharT>& s) const{
			if(s.items.empty()) return 1;
			size_t n = 0;
			for(const auto& item: s.items) n = saturating_add(n, count_states(item));
			return n;
		}
		size_t operator()(const quantifier<CharT>& q) const{
			// R{0} and R{0,0} are ε
			if(q.max == 0) return 1;
			size_t child = count_states(*q.child);
			// R{m,}: entry + hub + accept, the last mandatory copy doubles as the loop body
			if(q.is_unbounded()) return saturating_add(3, saturating_mul(q.min == 0 ? 1 : q.min, child));
			// R{m,n}: entry + accept + n copies
			return saturating_add(2, saturating_mul(q.max, child));
		}
	};
	return std::visit(counter{}, c.node);
}

/*	unroll complexity ψ, the number of consuming or checking edges once every repetition is unrolled:

		c, [...], ^, $  : ψ = 1
		ε, R{0}         : ψ = 0
		R1 R2, R1 | R2  : ψ = ψ(R1) + ψ(R2)
		(R)             : ψ = ψ(R)
		R*, R+          : ψ = ψ'(R)         (one copy, looped)
		R{m,}           : ψ = max(m, 1)ψ'(R)
		R{m,n}          : ψ = nψ'(R)

	where ψ'(R) = max(ψ(R), 1), so that copies of an empty R are paid for too.
*/
template <typename CharT>
size_t unroll_complexity(const component<CharT>& c) {
	struct measure {
		size_t operator()(const literal<CharT>&) const noexcept{ return 1; }
		size_t operator()(const char_class<CharT>&) const noexcept{ return 1; }
		size_t operator()(const anchor_start&) const noexcept{ return 1; }
		size_t operator()(const anchor_end&) const noexcept{ return 1; }
		size_t operator()(const group<CharT>& g) const{ return unroll_complexity(*g.child); }
		size_t operator()(const alternation<CharT>& a) const{
			return saturating_add(unroll_complexity(*a.left), unroll_complexity(*a.right));
		}
		size_t operator()(const sequence<CharT>& s) const{
			size_t n = 0;
			for(const auto& item: s.items) n = saturating_add(n, unroll_complexity(item));
			return n;
		}
		size_t operator()(const quantifier<CharT>& q) const{
			size_t copies = q.is_unbounded() ? (q.min == 0 ? 1 : q.min) : q.max;
			return saturating_mul(copies, std::max<size_t>(unroll_complexity(*q.child), 1));
		}
	};
	return std::visit(measure{}, c.node);
}

} // namespace impl

} // namespace regex

} // namespace thompson
