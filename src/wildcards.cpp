#include "wildcards.hpp"

#include <string_view>

bool wildcard_matches(const std::string_view pattern, const std::string_view text) {
	std::size_t pattern_pos = 0, text_pos = 0;

	// position right after the last '*' seen, and the text position it was tried at
	std::size_t star_pos = std::string_view::npos;
	std::size_t star_text_pos = 0;

	while (text_pos < text.size()) {
		if (pattern_pos < pattern.size() && pattern[pattern_pos] == '*') {
			star_pos = ++pattern_pos;
			star_text_pos = text_pos;
			continue;
		}

		if (pattern_pos < pattern.size() && pattern[pattern_pos] == text[text_pos]) {
			++pattern_pos;
			++text_pos;
			continue;
		}

		if (star_pos == std::string_view::npos)
			return false;

		// let the last wildcard swallow one more character and retry
		pattern_pos = star_pos;
		text_pos = ++star_text_pos;
	}

	// trailing wildcards match the empty rest
	while (pattern_pos < pattern.size() && pattern[pattern_pos] == '*') ++pattern_pos;

	return pattern_pos == pattern.size();
}
