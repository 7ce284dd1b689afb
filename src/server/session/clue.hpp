/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

clue.hpp - Round payload types.*/

#pragma once

#include <optional>
#include <string>

namespace mmq {

// Full payload for one round. `answer` is the title players must guess.
struct Clue {
	std::string title;
	std::string answer;
	std::string audioUrl;
	std::string imageUrl;
};

/*
Phase-dependent projection of the current clue. While guessing is open only
the audio reference is set; during the reveal every field is populated.
*/
struct ClueSnapshot {
	std::string audioUrl;
	std::optional<std::string> title;
	std::optional<std::string> answer;
	std::optional<std::string> imageUrl;
};

} // namespace mmq
