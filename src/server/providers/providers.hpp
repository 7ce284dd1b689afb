/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

providers.hpp - External collaborators consulted by the round scheduler and the
autocomplete handler. Implementations may block and may throw; callers bound
every call with CallWithTimeout.*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mmq {

struct MediaLink {
	std::string quality;
	std::string url;
};

// One playable item returned by a clue search.
struct ClueCandidate {
	std::string name;
	std::vector<MediaLink> audio;
	std::vector<MediaLink> images;
};

class ClueProvider {
public:
	virtual ~ClueProvider() = default;

	virtual std::vector<ClueCandidate> Search(std::string_view title) = 0;
};

class TitleProvider {
public:
	virtual ~TitleProvider() = default;

	virtual std::optional<std::string> RandomTitle() = 0;
	virtual std::vector<std::string> Suggest(std::string_view query, size_t limit) = 0;
};

} // namespace mmq
