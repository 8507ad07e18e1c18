#pragma once

#include <string>
#include <iterator>

#include "fmt/core.h"
#include "fmt/format.h"

#include "thompson/regex/log.hpp"
#include "thompson/regex/nfa.hpp"
#include "thompson/regex/engine.hpp"

namespace thompson {

namespace regex {

namespace impl {

template <typename CharT>
std::string describe(const char_class<CharT>& cls) {
	std::string out = cls.negated ? "[^" : "[";
	for(const auto& r: cls.ranges) {
		out += display(r.from);
		if(r.from != r.to) {
			out += '-';
			out += display(r.to);
		}
	}
	for(const auto& e: cls.excluded) out += describe(e);
	out += ']';
	return out;
}

constexpr const char* describe(assertion a) noexcept{
	switch(a) {
	case assertion::at_start: return "^";
	case assertion::at_end:   return "$";
	}
	return "?";
}

// DOT string literals only need quotes and backslashes escaped
inline std::string dot_escape(const std::string& s) {
	std::string out;
	out.reserve(s.size());
	for(char c: s) {
		if(c == '"' || c == '\\') out.push_back('\\');
		out.push_back(c);
	}
	return out;
}

} // namespace impl

// render the automaton as a graphviz digraph, reads the state table only
template <typename CharT>
std::string to_dot(const impl::non_deterministic_finite_automaton<CharT>& nfa, std::string_view name = "nfa") {
	std::string out;
	auto it = std::back_inserter(out);

	fmt::format_to(it, "digraph \"{}\" {{\n", impl::dot_escape(std::string{name}));
	fmt::format_to(it, "\trankdir=LR;\n");
	fmt::format_to(it, "\tnode [shape=circle];\n");
	fmt::format_to(it, "\t__start [shape=point];\n");
	fmt::format_to(it, "\t__start -> {};\n", nfa.start());
	fmt::format_to(it, "\t{} [shape=doublecircle];\n", nfa.accept());

	for(const auto& s: nfa.states) {
		for(const auto& [c, targets]: s.on_char) {
			for(auto t: targets)
				fmt::format_to(it, "\t{} -> {} [label=\"{}\"];\n", s.id, t, impl::dot_escape(display(c)));
		}
		for(const auto& e: s.on_class) {
			fmt::format_to(it, "\t{} -> {} [label=\"{}\"];\n", s.id, e.target, impl::dot_escape(impl::describe(nfa.classes[e.class_id].cls)));
		}
		for(const auto& e: s.on_assertion) {
			fmt::format_to(it, "\t{} -> {} [label=\"{}\", style=dashed];\n", s.id, e.target, impl::dot_escape(impl::describe(e.check)));
		}
		for(auto t: s.epsilon) {
			fmt::format_to(it, "\t{} -> {} [label=\"ε\", style=dashed];\n", s.id, t);
		}
	}
	fmt::format_to(it, "}}\n");
	return out;
}

template <typename CharT>
std::string to_dot(const regular_expression_engine<CharT>& re) {
	return to_dot(re.automaton(), display(std::basic_string_view<CharT>{re.pattern()}));
}

} // namespace regex

} // namespace thompson
