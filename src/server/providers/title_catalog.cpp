/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

title_catalog.cpp implementation.*/

#include "title_catalog.hpp"

#include "../security/security_gate.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace mmq {
namespace {

constexpr size_t kMaxTitleLength = 200;

std::string Lowered(std::string_view text) {
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lowered;
}

} // namespace

std::vector<std::string> DefaultTitles() {
	return {
		"3 Idiots", "Dangal", "PK", "Baahubali", "KGF",
		"Kabir Singh", "Dilwale Dulhania Le Jayenge", "Sholay",
		"Mughal-e-Azam", "Mother India", "Lagaan", "Taare Zameen Par",
		"Rang De Basanti", "Swades", "Zindagi Na Milegi Dobara"
	};
}

/*
=============
StaticTitleProvider::StaticTitleProvider

Keeps each non-empty title once, dropping entries too long to be a title.
=============
*/
StaticTitleProvider::StaticTitleProvider(std::vector<std::string> titles)
	: random_(std::random_device{}()) {
	std::set<std::string> seen;
	for (std::string& title : titles) {
		std::string trimmed = TrimWhitespace(title);
		if (trimmed.empty() || trimmed.size() > kMaxTitleLength)
			continue;
		if (seen.insert(trimmed).second)
			titles_.push_back(std::move(trimmed));
	}
}

std::optional<std::string> StaticTitleProvider::RandomTitle() {
	if (titles_.empty())
		return std::nullopt;

	std::lock_guard lock(randomMutex_);
	std::uniform_int_distribution<size_t> pick(0, titles_.size() - 1);
	return SanitizeText(titles_[pick(random_)], kMaxTitleLength);
}

/*
=============
StaticTitleProvider::Suggest

Case-insensitive substring match in catalogue order, at most `limit` results.
=============
*/
std::vector<std::string> StaticTitleProvider::Suggest(std::string_view query, size_t limit) {
	std::vector<std::string> matches;
	if (query.empty() || limit == 0)
		return matches;

	const std::string needle = Lowered(query);
	for (const std::string& title : titles_) {
		if (Lowered(title).find(needle) == std::string::npos)
			continue;

		matches.push_back(SanitizeText(title, kMaxTitleLength));
		if (matches.size() >= limit)
			break;
	}
	return matches;
}

} // namespace mmq
