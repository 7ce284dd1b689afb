/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

security_gate.cpp implementation.*/

#include "security_gate.hpp"

#include "../config/server_config.hpp"
#include "../../shared/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace mmq {
namespace {

char LowerAscii(char c) {
	return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool IsWordChar(char c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool StartsWithNoCase(std::string_view text, size_t at, std::string_view prefix) {
	if (text.size() - at < prefix.size())
		return false;

	for (size_t i = 0; i < prefix.size(); ++i) {
		if (LowerAscii(text[at + i]) != prefix[i])
			return false;
	}
	return true;
}

// Drops every `<...>` run. An unterminated `<` is kept as text.
std::string StripMarkupTags(std::string_view text) {
	std::string out;
	out.reserve(text.size());

	size_t i = 0;
	while (i < text.size()) {
		const size_t open = text.find('<', i);
		if (open == std::string_view::npos) {
			out.append(text.substr(i));
			break;
		}

		const size_t close = text.find('>', open + 1);
		if (close == std::string_view::npos) {
			out.append(text.substr(i));
			break;
		}

		out.append(text.substr(i, open - i));
		i = close + 1;
	}
	return out;
}

std::string StripScriptScheme(std::string_view text) {
	static constexpr std::string_view kScheme = "javascript:";

	std::string out;
	out.reserve(text.size());

	size_t i = 0;
	while (i < text.size()) {
		if (StartsWithNoCase(text, i, kScheme)) {
			i += kScheme.size();
			continue;
		}
		out.push_back(text[i++]);
	}
	return out;
}

/*
=============
StripEventHandlers

Removes `on<word>=` attribute patterns, with optional whitespace before the
`=`. A failed candidate is copied up to the end of its word run, since any
later start inside that run ends at the same place and fails the same way.
=============
*/
std::string StripEventHandlers(std::string_view text) {
	std::string out;
	out.reserve(text.size());

	size_t i = 0;
	while (i < text.size()) {
		if (!StartsWithNoCase(text, i, "on")) {
			out.push_back(text[i++]);
			continue;
		}

		size_t wordEnd = i + 2;
		while (wordEnd < text.size() && IsWordChar(text[wordEnd]))
			++wordEnd;

		size_t cursor = wordEnd;
		while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])))
			++cursor;

		if (wordEnd > i + 2 && cursor < text.size() && text[cursor] == '=') {
			i = cursor + 1;
			continue;
		}

		out.append(text.substr(i, std::max(wordEnd, i + 1) - i));
		i = std::max(wordEnd, i + 1);
	}
	return out;
}

bool IsUtf8Continuation(unsigned char c) {
	return (c & 0xC0) == 0x80;
}

} // namespace

/*
=============
ValidateRoomId

Room ids are exactly six uppercase ASCII letters or digits.
=============
*/
bool ValidateRoomId(std::string_view roomId) {
	if (roomId.size() != kRoomIdLength)
		return false;

	return std::all_of(roomId.begin(), roomId.end(), [](char c) {
		return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
	});
}

bool ValidatePlayerId(int64_t playerId) {
	return playerId >= kMinPlayerId && playerId <= kMaxPlayerId;
}

bool ValidateUrl(std::string_view url) {
	return url.starts_with("http://") || url.starts_with("https://");
}

std::string TrimWhitespace(std::string_view text) {
	const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

	size_t begin = 0;
	while (begin < text.size() && isSpace(static_cast<unsigned char>(text[begin])))
		++begin;

	size_t end = text.size();
	while (end > begin && isSpace(static_cast<unsigned char>(text[end - 1])))
		--end;

	return std::string(text.substr(begin, end - begin));
}

/*
=============
TruncateUtf8

Cuts `text` to at most `maxBytes`, backing off so a multi-byte sequence is
never split.
=============
*/
std::string TruncateUtf8(std::string_view text, size_t maxBytes) {
	if (text.size() <= maxBytes)
		return std::string(text);

	size_t cut = maxBytes;
	while (cut > 0 && IsUtf8Continuation(static_cast<unsigned char>(text[cut])))
		--cut;

	return std::string(text.substr(0, cut));
}

std::string SanitizeText(std::string_view text, size_t maxLength) {
	if (text.empty())
		return {};

	std::string cleaned = StripMarkupTags(TrimWhitespace(text));
	cleaned = StripScriptScheme(cleaned);
	cleaned = StripEventHandlers(cleaned);

	return TruncateUtf8(cleaned, maxLength);
}

ConnectionLimiter::ConnectionLimiter(int maxPerAddress)
	: maxPerAddress_(maxPerAddress) {}

/*
=============
ConnectionLimiter::TryAcquire

Reserves a connection slot for `address`, refusing once the ceiling is reached.
=============
*/
bool ConnectionLimiter::TryAcquire(const std::string& address) {
	std::lock_guard lock(mutex_);
	int& count = counts_[address];
	if (count >= maxPerAddress_) {
		if (count == 0)
			counts_.erase(address);
		return false;
	}

	++count;
	return true;
}

void ConnectionLimiter::Release(const std::string& address) {
	std::lock_guard lock(mutex_);
	auto it = counts_.find(address);
	if (it == counts_.end())
		return;

	if (--it->second <= 0)
		counts_.erase(it);
}

int ConnectionLimiter::Count(const std::string& address) const {
	std::lock_guard lock(mutex_);
	auto it = counts_.find(address);
	return it == counts_.end() ? 0 : it->second;
}

size_t ConnectionLimiter::TrackedAddresses() const {
	std::lock_guard lock(mutex_);
	return counts_.size();
}

RequestRateLimiter::RequestRateLimiter(int maxPerMinute, ClockFn clock)
	: maxPerMinute_(maxPerMinute), clock_(std::move(clock)), lastSweep_(clock_()) {}

/*
=============
RequestRateLimiter::Allow

Drops timestamps older than one minute, then admits the request if the
address is still under its per-minute budget.
=============
*/
bool RequestRateLimiter::Allow(const std::string& address) {
	const auto now = clock_();
	const auto windowStart = now - std::chrono::minutes(1);

	std::lock_guard lock(mutex_);
	if (now - lastSweep_ >= std::chrono::minutes(1)) {
		ForgetIdleLocked(windowStart);
		lastSweep_ = now;
	}

	auto it = requests_.try_emplace(address).first;
	auto& window = it->second;
	while (!window.empty() && window.front() < windowStart)
		window.pop_front();

	if (static_cast<int>(window.size()) >= maxPerMinute_) {
		if (window.empty())
			requests_.erase(it);
		return false;
	}

	window.push_back(now);
	return true;
}

size_t RequestRateLimiter::TrackedAddresses() const {
	std::lock_guard lock(mutex_);
	return requests_.size();
}

void RequestRateLimiter::ForgetIdleLocked(SteadyClock::time_point windowStart) {
	std::erase_if(requests_, [windowStart](const auto& entry) {
		return entry.second.empty() || entry.second.back() < windowStart;
	});
}

InboundMessage ScreenInboundMessage(std::string_view raw, const ServerConfig& config) {
	InboundMessage result;

	if (raw.size() > config.maxMessageSize) {
		result.status = InboundStatus::TooLarge;
		return result;
	}

	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	std::string errs;
	if (!reader->parse(raw.data(), raw.data() + raw.size(), &result.body, &errs)) {
		Logf(LogLevel::Debug, "{}: rejected unparsable message: {}", __FUNCTION__, TruncateUtf8(errs, 100));
		result.status = InboundStatus::Malformed;
		return result;
	}

	if (!result.body.isObject()) {
		result.status = InboundStatus::Ignored;
		return result;
	}

	const Json::Value action = result.body.get("action", Json::Value());
	if (!action.isString() || action.asString().size() > config.maxActionLength) {
		result.status = InboundStatus::Ignored;
		return result;
	}

	result.action = action.asString();
	result.status = InboundStatus::Accepted;
	return result;
}

} // namespace mmq
