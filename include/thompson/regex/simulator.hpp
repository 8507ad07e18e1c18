#pragma once

#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>

#include "thompson/regex/nfa.hpp"

namespace thompson {

namespace regex {

namespace impl {

using std::optional;
using std::basic_string_view;

// runs an automaton over an input in lockstep, all threads at once (no backtracking).
// the automaton is borrowed read-only, the active sets belong to the simulator,
// so one nfa can be shared by any number of simulators.
template <typename CharT>
class nfa_simulator {
public:
	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using nfa_t = non_deterministic_finite_automaton<char_t>;

	explicit nfa_simulator(const nfa_t& nfa):
		nfa{nfa}, current_marks(nfa.size(), false), next_marks(nfa.size(), false) {
		current.reserve(nfa.size());
		next.reserve(nfa.size());
		worklist.reserve(nfa.size());
	}

	// longest match of the automaton starting at 'start', returns its end
	optional<size_t> run(string_view_t input, size_t start) {
		if(start > input.size()) return std::nullopt;

		clear(current, current_marks);
		add_closure(nfa.start(), start, input.size(), current, current_marks);

		optional<size_t> last_accept;
		if(current_marks[nfa.accept()]) last_accept = start;

		for(size_t pos = start; pos < input.size() && !current.empty(); ++pos) {
			step(input[pos], pos + 1, input.size());
			if(current_marks[nfa.accept()]) last_accept = pos + 1;
		}
		return last_accept;
	}

	// the set of states alive after the last run(), in no particular order
	const vector<state_id_t>& active() const noexcept{
		return current;
	}

protected:

	const nfa_t& nfa;

	vector<state_id_t> current, next;
	vector<bool> current_marks, next_marks;
	vector<state_id_t> worklist;

	static void clear(vector<state_id_t>& set, vector<bool>& marks) noexcept{
		for(auto s: set) marks[s] = false;
		set.clear();
	}

	// ε-closure(q) = {q} ∪ δ(q, ε) ∪ δ(δ(q, ε), ε) ∪ ...
	// position checks are evaluated at 'pos'. the marks double as the visited set,
	// which is what keeps the ε cycles of R* from looping forever.
	void add_closure(state_id_t s, size_t pos, size_t size, vector<state_id_t>& set, vector<bool>& marks) {
		if(marks[s]) return;
		marks[s] = true;
		set.push_back(s);
		worklist.push_back(s);

		while(!worklist.empty()) {
			const auto& st = nfa[worklist.back()];
			worklist.pop_back();

			auto visit = [&](state_id_t target) {
				if(marks[target]) return;
				marks[target] = true;
				set.push_back(target);
				worklist.push_back(target);
			};

			for(auto target: st.epsilon) visit(target);
			for(const auto& e: st.on_assertion) {
				if(assertion_holds(e.check, pos, size)) visit(e.target);
			}
		}
	}

	// current --c--> next, then next becomes current.
	// 'pos' is the position right after c.
	void step(char_t c, size_t pos, size_t size) {
		clear(next, next_marks);

		for(auto s: current) {
			const auto& st = nfa[s];
			if(auto it = st.on_char.find(c); it != st.on_char.cend()) {
				for(auto target: it->second) add_closure(target, pos, size, next, next_marks);
			}
			for(const auto& e: st.on_class) {
				if(nfa.classes[e.class_id].accept(c)) add_closure(e.target, pos, size, next, next_marks);
			}
		}

		std::swap(current, next);
		std::swap(current_marks, next_marks);
	}

}; // nfa_simulator

} // namespace impl

} // namespace regex

} // namespace thompson
