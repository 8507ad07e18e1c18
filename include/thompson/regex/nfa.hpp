#pragma once

#include <bitset>
#include <vector>
#include <cstddef>
#include <utility>
#include <type_traits>
#include <unordered_map>

#include "thompson/regex/component.hpp"

namespace thompson {

namespace regex {

namespace impl {

using std::bitset;
using std::unordered_map;
using std::make_unsigned_t;

using state_id_t = size_t;
using class_id_t = size_t;

// zero-width position checks
enum class assertion: unsigned char {
	at_start, // ^
	at_end    // $
};

constexpr bool assertion_holds(assertion a, size_t pos, size_t size) noexcept{
	switch(a) {
	case assertion::at_start: return pos == 0;
	case assertion::at_end:   return pos == size;
	}
	return false;
}

// membership test of a char_class, with the answers for the first 256 code units
// computed once when the automaton is built
template <typename CharT>
struct class_predicate {
	using char_t = CharT;
	using unsigned_t = make_unsigned_t<char_t>;

	static constexpr size_t table_size = 256;

	char_class<char_t> cls;
	bitset<table_size> table;

	explicit class_predicate(char_class<char_t> c): cls{std::move(c)} {
		for(size_t u = 0; u < table_size; ++u) {
			if(u > static_cast<size_t>(static_cast<unsigned_t>(-1))) break;
			table[u] = cls.is_member(static_cast<char_t>(u));
		}
	}

	bool accept(char_t c) const noexcept{
		auto u = static_cast<size_t>(static_cast<unsigned_t>(c));
		return u < table_size ? table[u] : cls.is_member(c);
	}
};

struct class_edge {
	class_id_t class_id;
	state_id_t target;
};

struct assertion_edge {
	assertion check;
	state_id_t target;
};

template <typename CharT>
struct state {
	using char_t = CharT;

	state_id_t id;

	// consuming transitions
	unordered_map<char_t, vector<state_id_t>> on_char;
	vector<class_edge> on_class;

	// ε transitions, with and without a position check
	vector<state_id_t> epsilon;
	vector<assertion_edge> on_assertion;

	explicit state(state_id_t id): id{id} {}

	state& add_char(char_t c, state_id_t target) {
		on_char[c].push_back(target);
		return *this;
	}
	state& add_class(class_id_t cls, state_id_t target) {
		on_class.push_back({cls, target});
		return *this;
	}
	state& add_epsilon(state_id_t target) {
		epsilon.push_back(target);
		return *this;
	}
	state& add_assertion(assertion a, state_id_t target) {
		on_assertion.push_back({a, target});
		return *this;
	}

	size_t edge_count() const noexcept{
		size_t n = on_class.size() + epsilon.size() + on_assertion.size();
		for(const auto& [c, targets]: on_char) n += targets.size();
		return n;
	}
};

// a sub-automaton: exactly one way in and one way out
struct fragment {
	state_id_t start;
	state_id_t accept;

	friend constexpr bool operator==(const fragment&, const fragment&) noexcept = default;
};

// NFA M = (Q, Σ, δ, q0, f)
// states are append-only, a state's id is its index in 'states'
template <typename CharT>
struct non_deterministic_finite_automaton {
	using char_t = CharT;
	using state_t = state<char_t>;
	using predicate_t = class_predicate<char_t>;

	vector<state_t> states;
	vector<predicate_t> classes;
	fragment entry{0, 0};

	state_id_t new_state() {
		state_id_t id = states.size();
		states.emplace_back(id);
		return id;
	}

	class_id_t new_class(char_class<char_t> cls) {
		classes.emplace_back(std::move(cls));
		return classes.size() - 1;
	}

	state_t& operator[](state_id_t id) {
		return states[id];
	}
	const state_t& operator[](state_id_t id) const{
		return states[id];
	}

	size_t size() const noexcept{
		return states.size();
	}

	state_id_t start() const noexcept{ return entry.start; }
	state_id_t accept() const noexcept{ return entry.accept; }
};

} // namespace impl

} // namespace regex

} // namespace thompson
