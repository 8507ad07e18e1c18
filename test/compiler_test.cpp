#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <string_view>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "thompson/regex/nfa.hpp"
#include "thompson/regex/parser.hpp"
#include "thompson/regex/compiler.hpp"
#include "thompson/regex/component.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::TestWithParam;
using ::testing::Values;

using ::thompson::regex::impl::assertion;
using ::thompson::regex::impl::compile_tree;
using ::thompson::regex::impl::count_states;
using ::thompson::regex::impl::state_id_t;

using component_t = ::thompson::regex::impl::component<char>;
using nfa_t = ::thompson::regex::impl::non_deterministic_finite_automaton<char>;
using parser_t = ::thompson::regex::impl::pattern_parser<char>;

component_t parse(std::string_view pattern) {
	auto [error, tree] = parser_t{pattern}.parse();
	EXPECT_FALSE(error.failed()) << pattern << ": " << error.describe();
	return std::move(*tree);
}

nfa_t compile(std::string_view pattern) {
	return compile_tree(parse(pattern));
}

TEST(CompilerTest, Literal) {
	auto nfa = compile("a");
	ASSERT_EQ(nfa.size(), 2);
	EXPECT_NE(nfa.start(), nfa.accept());
	EXPECT_THAT(nfa[nfa.start()].on_char.at('a'), ElementsAre(nfa.accept()));
	EXPECT_EQ(nfa[nfa.start()].edge_count(), 1);
}

TEST(CompilerTest, AcceptStateHasNoOutgoingEdges) {
	for(auto pattern: {"a", "ab", "a|b", "a*", "a{2,4}", "(ab)+c?", "^x$"}) {
		auto nfa = compile(pattern);
		EXPECT_EQ(nfa[nfa.accept()].edge_count(), 0) << pattern;
	}
}

TEST(CompilerTest, EmptyPatternIsOneState) {
	auto nfa = compile("");
	ASSERT_EQ(nfa.size(), 1);
	EXPECT_EQ(nfa.start(), nfa.accept());
}

TEST(CompilerTest, ZeroRepetitionIsOneState) {
	auto nfa = compile("a{0}");
	ASSERT_EQ(nfa.size(), 1);
	EXPECT_EQ(nfa.start(), nfa.accept());
}

TEST(CompilerTest, GroupAddsNoStates) {
	EXPECT_EQ(compile("(a)").size(), compile("a").size());
	EXPECT_EQ(compile("((ab))").size(), compile("ab").size());
	EXPECT_EQ(compile("(?:ab)").size(), compile("ab").size());
}

TEST(CompilerTest, SequenceChainsWithEpsilon) {
	auto nfa = compile("ab");
	ASSERT_EQ(nfa.size(), 4);
	const auto& first = nfa[nfa.start()];
	ASSERT_THAT(first.on_char.at('a'), SizeIs(1));
	auto a_accept = first.on_char.at('a').front();
	ASSERT_THAT(nfa[a_accept].epsilon, SizeIs(1));
	auto b_start = nfa[a_accept].epsilon.front();
	EXPECT_THAT(nfa[b_start].on_char.at('b'), ElementsAre(nfa.accept()));
}

TEST(CompilerTest, Alternation) {
	auto nfa = compile("a|b");
	ASSERT_EQ(nfa.size(), 6);
	const auto& start = nfa[nfa.start()];
	ASSERT_THAT(start.epsilon, SizeIs(2));
	EXPECT_EQ(nfa[start.epsilon[0]].on_char.count('a'), 1);
	EXPECT_EQ(nfa[start.epsilon[1]].on_char.count('b'), 1);
}

TEST(CompilerTest, StarLoopsThroughHub) {
	auto nfa = compile("a*");
	// entry, hub, body start, body accept, accept
	ASSERT_EQ(nfa.size(), 5);
	const auto& entry = nfa[nfa.start()];
	ASSERT_THAT(entry.epsilon, SizeIs(1));
	auto hub = entry.epsilon.front();
	ASSERT_THAT(nfa[hub].epsilon, SizeIs(2));
	auto body_start = nfa[hub].epsilon[0];
	EXPECT_EQ(nfa[hub].epsilon[1], nfa.accept());
	auto body_accept = nfa[body_start].on_char.at('a').front();
	EXPECT_THAT(nfa[body_accept].epsilon, ElementsAre(hub));
}

TEST(CompilerTest, PlusLoopsOnItsOnlyCopy) {
	auto nfa = compile("a+");
	// entry, hub, body start, body accept, accept
	ASSERT_EQ(nfa.size(), 5);
	const auto& entry = nfa[nfa.start()];
	ASSERT_THAT(entry.epsilon, SizeIs(1));
	auto body_start = entry.epsilon.front();
	ASSERT_EQ(nfa[body_start].on_char.count('a'), 1);
	auto body_accept = nfa[body_start].on_char.at('a').front();
	ASSERT_THAT(nfa[body_accept].epsilon, SizeIs(1));
	auto hub = nfa[body_accept].epsilon.front();
	EXPECT_THAT(nfa[hub].epsilon, ElementsAre(body_start, nfa.accept()));
}

TEST(CompilerTest, NestedPlusGrowsLinearly) {
	std::string tower = "a";
	std::size_t previous = compile(tower).size();
	for(int level = 0; level < 30; ++level) {
		tower = "(" + tower + ")+";
		auto size = compile(tower).size();
		// one entry, one hub and one accept per level
		EXPECT_EQ(size, previous + 3) << tower;
		previous = size;
	}
}

TEST(CompilerTest, Anchors) {
	auto nfa = compile("^");
	ASSERT_EQ(nfa.size(), 2);
	const auto& start = nfa[nfa.start()];
	ASSERT_THAT(start.on_assertion, SizeIs(1));
	EXPECT_EQ(start.on_assertion.front().check, assertion::at_start);
	EXPECT_EQ(start.on_assertion.front().target, nfa.accept());
	EXPECT_THAT(start.epsilon, IsEmpty());

	auto end = compile("$");
	EXPECT_EQ(end[end.start()].on_assertion.front().check, assertion::at_end);
}

TEST(CompilerTest, ClassPredicate) {
	auto nfa = compile("[a-c]");
	ASSERT_THAT(nfa.classes, SizeIs(1));
	const auto& predicate = nfa.classes.front();
	EXPECT_TRUE(predicate.accept('a'));
	EXPECT_TRUE(predicate.accept('b'));
	EXPECT_FALSE(predicate.accept('d'));

	auto negated = compile("[^a-c]");
	EXPECT_FALSE(negated.classes.front().accept('b'));
	EXPECT_TRUE(negated.classes.front().accept('z'));
	EXPECT_TRUE(negated.classes.front().accept('\xff'));
}

TEST(CompilerTest, ClassPredicateBeyondTable) {
	auto [error, tree] = ::thompson::regex::impl::pattern_parser<char32_t>{U"[^é]"}.parse();
	ASSERT_FALSE(error.failed());
	auto nfa = compile_tree(*tree);
	ASSERT_THAT(nfa.classes, SizeIs(1));
	EXPECT_FALSE(nfa.classes.front().accept(U'é'));
	EXPECT_TRUE(nfa.classes.front().accept(U'中'));
}

TEST(CompilerTest, CompilationIsDeterministic) {
	auto first = compile("(a|bc)*d{1,3}[^x]");
	auto second = compile("(a|bc)*d{1,3}[^x]");
	ASSERT_EQ(first.size(), second.size());
	EXPECT_EQ(first.entry, second.entry);
	for(state_id_t s = 0; s < first.size(); ++s) {
		EXPECT_EQ(first[s].edge_count(), second[s].edge_count()) << s;
		EXPECT_EQ(first[s].epsilon, second[s].epsilon) << s;
	}
}

class StateCountTest: public TestWithParam<std::string> {};

TEST_P(StateCountTest, MatchesEstimate) {
	auto tree = parse(GetParam());
	auto nfa = compile_tree(tree);
	EXPECT_EQ(nfa.size(), count_states(tree));
	// every state id is its own index
	for(state_id_t s = 0; s < nfa.size(); ++s) EXPECT_EQ(nfa[s].id, s);
}

INSTANTIATE_TEST_SUITE_P(Patterns, StateCountTest, Values(
	"", "a", "ab", "a|b", "a|", "()", "(a|b)*c",
	"a{2,5}", "a{3,}", "x{0}", "x{0,2}", "(ab){2}|c?",
	"^a+$", "[^0-9]+\\d{1,3}", "((a*)*)*", "(?:a|b|c){2,}",
	"(ab){2,}", "((a)+)+", "a|b|c|d|e", "(){3}"
));

} // namespace
