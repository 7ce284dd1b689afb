/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

clue_resolver.cpp implementation.*/

#include "clue_resolver.hpp"

#include "bounded_call.hpp"
#include "../security/security_gate.hpp"
#include "../../shared/logger.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace mmq {
namespace {

constexpr std::string_view kPreferredAudioQuality = "320kbps";
constexpr std::string_view kPreferredImageQuality = "500x500";

/*
=============
PickLink

Prefers a valid link with the requested quality and otherwise takes the
first link. Only http(s) URLs are returned.
=============
*/
std::string PickLink(const std::vector<MediaLink>& links, std::string_view preferredQuality) {
	for (const MediaLink& link : links) {
		if (link.quality == preferredQuality && ValidateUrl(link.url))
			return link.url;
	}

	if (!links.empty() && ValidateUrl(links.front().url))
		return links.front().url;

	return {};
}

} // namespace

ClueResolver::ClueResolver(std::shared_ptr<TitleProvider> titles, std::shared_ptr<ClueProvider> clues, const ServerConfig& config)
	: titles_(std::move(titles)),
	  clues_(std::move(clues)),
	  fallback_(config.fallbackClue),
	  placeholderImage_(config.placeholderImageUrl),
	  timeout_(std::chrono::duration_cast<std::chrono::milliseconds>(config.providerTimeout)),
	  maxTextLength_(config.maxTextInputLength),
	  random_(std::random_device{}()) {}

/*
=============
ClueResolver::NextClue

Never throws for provider trouble; every failure path ends in the fallback.
=============
*/
Clue ClueResolver::NextClue() {
	if (!titles_ || !clues_)
		return Fallback("no providers configured");

	std::optional<std::string> title;
	std::vector<ClueCandidate> candidates;

	try {
		auto titleCall = CallWithTimeout([titles = titles_]() { return titles->RandomTitle(); }, timeout_);
		if (!titleCall)
			return Fallback("title lookup timed out");

		title = std::move(*titleCall);
		if (!title || title->empty())
			return Fallback("no title available");

		Logf(LogLevel::Debug, "{}: searching clues for '{}'", __FUNCTION__, TruncateUtf8(*title, 20));

		auto searchCall = CallWithTimeout([clues = clues_, query = *title]() { return clues->Search(query); }, timeout_);
		if (!searchCall)
			return Fallback("clue search timed out");

		candidates = std::move(*searchCall);
	}
	catch (const std::exception& e) {
		return Fallback(e.what());
	}

	if (candidates.empty())
		return Fallback("no candidates found");

	size_t index = 0;
	{
		std::lock_guard lock(randomMutex_);
		std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
		index = pick(random_);
	}

	std::optional<Clue> clue = BuildClue(candidates[index], *title);
	if (!clue)
		return Fallback("candidate has no usable audio");

	return *clue;
}

/*
=============
ClueResolver::BuildClue

Converts one candidate into a round payload. A missing or invalid image is
replaced with the placeholder; a candidate without a valid audio URL is
unusable.
=============
*/
std::optional<Clue> ClueResolver::BuildClue(const ClueCandidate& candidate, const std::string& title) const {
	const std::string audio = PickLink(candidate.audio, kPreferredAudioQuality);
	if (audio.empty())
		return std::nullopt;

	std::string image = PickLink(candidate.images, kPreferredImageQuality);
	if (image.empty())
		image = placeholderImage_;

	Clue clue;
	clue.title = SanitizeText(candidate.name.empty() ? std::string_view("Unknown") : std::string_view(candidate.name), maxTextLength_);
	clue.answer = SanitizeText(title, maxTextLength_);
	clue.audioUrl = audio;
	clue.imageUrl = std::move(image);
	return clue;
}

Clue ClueResolver::Fallback(std::string_view reason) const {
	Logf(LogLevel::Warn, "{}: using fallback clue ({})", __FUNCTION__, TruncateUtf8(reason, 100));
	return fallback_;
}

} // namespace mmq
