#pragma once

/*
	Thompson construction, one fragment per component.

	literal c        start -c-> accept
	char_class C     start -C-> accept
	^, $             start -(position check)-> accept
	R1 R2 ... Rn     R1 -ε-> R2 -ε-> ... -ε-> Rn                  (ε: a single state)
	R1 | R2          start -ε-> R1, R2 -ε-> accept
	(R)              R
	R{m,n}           entry -ε-> R ... R (m copies) -ε-> R? ... R? (n - m copies) -ε-> accept
	R{m,}            entry -ε-> R ... R (m - 1 copies) -ε-> R <-ε-> hub -ε-> accept
	R*               entry -ε-> hub <-ε-> R, hub -ε-> accept

	counted repetitions are unrolled, the parser already refused the ones that are too large.
	count_states() in component.hpp must stay in sync with this file.
*/

#include <variant>
#include <utility>

#include "thompson/regex/nfa.hpp"
#include "thompson/regex/component.hpp"

namespace thompson {

namespace regex {

namespace impl {

template <typename CharT>
struct nfa_compiler {

	using char_t = CharT;
	using nfa_t = non_deterministic_finite_automaton<char_t>;
	using component_t = component<char_t>;

	// consumes the tree, produces the automaton
	nfa_t compile(const component_t& tree) {
		nfa = {};
		nfa.states.reserve(count_states(tree));
		nfa.entry = emit(tree);
		return std::move(nfa);
	}

protected:

	nfa_t nfa;

	fragment emit(const component_t& c) {
		return std::visit([this](const auto& node) { return emit(node); }, c.node);
	}

	fragment emit_empty() {
		auto s = nfa.new_state();
		return {s, s};
	}

	fragment emit(const literal<char_t>& lit) {
		auto start = nfa.new_state();
		auto accept = nfa.new_state();
		nfa[start].add_char(lit.c, accept);
		return {start, accept};
	}

	fragment emit(const char_class<char_t>& cls) {
		auto start = nfa.new_state();
		auto accept = nfa.new_state();
		nfa[start].add_class(nfa.new_class(cls), accept);
		return {start, accept};
	}

	fragment emit_assertion(assertion a) {
		auto start = nfa.new_state();
		auto accept = nfa.new_state();
		nfa[start].add_assertion(a, accept);
		return {start, accept};
	}

	fragment emit(const anchor_start&) {
		return emit_assertion(assertion::at_start);
	}

	fragment emit(const anchor_end&) {
		return emit_assertion(assertion::at_end);
	}

	fragment emit(const group<char_t>& g) {
		// no captures, so no extra states
		return emit(*g.child);
	}

	fragment emit(const sequence<char_t>& seq) {
		if(seq.items.empty()) return emit_empty();

		auto it = seq.items.cbegin();
		fragment result = emit(*it);
		for(++it; it != seq.items.cend(); ++it) {
			auto next = emit(*it);
			nfa[result.accept].add_epsilon(next.start);
			result.accept = next.accept;
		}
		return result;
	}

	fragment emit(const alternation<char_t>& alt) {
		auto start = nfa.new_state();
		auto left = emit(*alt.left);
		auto right = emit(*alt.right);
		auto accept = nfa.new_state();

		nfa[start].add_epsilon(left.start)
		          .add_epsilon(right.start);
		nfa[left.accept].add_epsilon(accept);
		nfa[right.accept].add_epsilon(accept);
		return {start, accept};
	}

	fragment emit(const quantifier<char_t>& q) {
		// R{0}, R{0,0}
		if(q.max == 0) return emit_empty();

		auto entry = nfa.new_state();
		auto cursor = entry;

		// mandatory copies, R{m,} keeps the last one for the loop body
		size_t mandatory = q.is_unbounded() && q.min != 0 ? q.min - 1 : q.min;
		for(size_t i = 0; i < mandatory; ++i) {
			auto copy = emit(*q.child);
			nfa[cursor].add_epsilon(copy.start);
			cursor = copy.accept;
		}

		if(q.is_unbounded()) {
			// the loop is left through the hub. R* enters it at the hub, R+ at the body,
			// the ε cycle hub -> body -> hub is what the simulator's visited set is for
			auto hub = nfa.new_state();
			auto body = emit(*q.child);
			auto accept = nfa.new_state();

			nfa[cursor].add_epsilon(q.min == 0 ? hub : body.start);
			nfa[hub].add_epsilon(body.start)
			        .add_epsilon(accept);
			nfa[body.accept].add_epsilon(hub);
			return {entry, accept};
		}

		// optional copies, each one may be skipped straight to the accept state
		auto accept_id = emit_optional_copies(q, cursor);
		return {entry, accept_id};
	}

	state_id_t emit_optional_copies(const quantifier<char_t>& q, state_id_t cursor) {
		vector<state_id_t> exits;
		exits.reserve(q.max - q.min + 1);
		for(size_t i = q.min; i < q.max; ++i) {
			auto copy = emit(*q.child);
			exits.push_back(cursor);
			nfa[cursor].add_epsilon(copy.start);
			cursor = copy.accept;
		}
		exits.push_back(cursor);

		auto accept = nfa.new_state();
		for(auto s: exits) nfa[s].add_epsilon(accept);
		return accept;
	}

}; // nfa_compiler

template <typename CharT>
non_deterministic_finite_automaton<CharT> compile_tree(const component<CharT>& tree) {
	return nfa_compiler<CharT>{}.compile(tree);
}

} // namespace impl

} // namespace regex

} // namespace thompson
