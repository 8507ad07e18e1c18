#pragma once

/*
	Regular expressions on Thompson NFAs: no backtracking, O(nm) per start offset.

	Supported Grammar:
	concat
	alternative          |
	grouping             (), (?:)
	kleene closure       *
	positive closure     +
	optional             ?
	braces               {m} {m,} {m,n}
	wildcard             .
	brackets             [...], [^...], ranges a-z
	class escapes        \d \D \w \W \s \S
	control escapes      \f \n \r \t \v
	anchors              ^ $ (offset 0 / end of input)

	Not supported: captures, backreferences, lookaround, lazy quantifiers.

	auto [error, re] = thompson::regex::compile("cat|dog");
	if(!error.failed()) re->search("I have a dog"); // span{9, 12}
*/

#include "thompson/regex/error.hpp"
#include "thompson/regex/log.hpp"
#include "thompson/regex/options.hpp"
#include "thompson/regex/component.hpp"
#include "thompson/regex/parser.hpp"
#include "thompson/regex/nfa.hpp"
#include "thompson/regex/compiler.hpp"
#include "thompson/regex/simulator.hpp"
#include "thompson/regex/engine.hpp"
#include "thompson/regex/dump.hpp"
