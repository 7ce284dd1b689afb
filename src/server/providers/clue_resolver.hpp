/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

clue_resolver.hpp - Produces the payload for each round.*/

#pragma once

#include "providers.hpp"
#include "../config/server_config.hpp"
#include "../session/clue.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace mmq {

class ClueSource {
public:
	virtual ~ClueSource() = default;

	virtual Clue NextClue() = 0;
};

/*
Draws a random title, searches the clue provider for it and turns one of the
candidates into a round payload. Provider failures, timeouts and empty results
are absorbed: the configured fallback clue is returned instead.
*/
class ClueResolver : public ClueSource {
public:
	ClueResolver(std::shared_ptr<TitleProvider> titles, std::shared_ptr<ClueProvider> clues, const ServerConfig& config);

	Clue NextClue() override;

	std::optional<Clue> BuildClue(const ClueCandidate& candidate, const std::string& title) const;

private:
	Clue Fallback(std::string_view reason) const;

	std::shared_ptr<TitleProvider> titles_;
	std::shared_ptr<ClueProvider> clues_;
	Clue fallback_;
	std::string placeholderImage_;
	std::chrono::milliseconds timeout_;
	size_t maxTextLength_;

	std::mutex randomMutex_;
	std::mt19937 random_;
};

} // namespace mmq
