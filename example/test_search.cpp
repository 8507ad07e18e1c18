#include "./common.hpp"

int main(int argc, const char** argv) {
	using std::string;
	using namespace thompson::regex;

	string pattern, target;
	while(read_line("input a pattern:", pattern) && read_line("input a target string:", target)) {
		println("pattern: {}", pattern);
		println("target: {}", target);

		auto [error, re] = compile(pattern);
		if(error.failed()) {
			println("error: {}", error.describe());
			continue;
		}

		std::size_t i = 0;
		for(const auto& m: re->find_all(target)) {
			if(i++ != 0) fmt::print(", ");
			print_span(target, m);
		}
		println("");
	}
}
