/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

security_gate.hpp - Perimeter validation applied before any room state is touched.*/

#pragma once

#include "../../shared/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <json/json.h>

namespace mmq {

struct ServerConfig;

inline constexpr int64_t kMinPlayerId = 10000;
inline constexpr int64_t kMaxPlayerId = 99999;
inline constexpr size_t kRoomIdLength = 6;

bool ValidateRoomId(std::string_view roomId);
bool ValidatePlayerId(int64_t playerId);
bool ValidateUrl(std::string_view url);

std::string TrimWhitespace(std::string_view text);
std::string TruncateUtf8(std::string_view text, size_t maxBytes);

/*
=============
SanitizeText

Strips markup tags, `javascript:` prefixes and inline event-handler patterns
(case-insensitive) from trimmed input, then truncates the result to
`maxLength` bytes without splitting a UTF-8 sequence.
=============
*/
std::string SanitizeText(std::string_view text, size_t maxLength);

/*
Tracks live connections per source address. An address is dropped from the
table as soon as its count returns to zero.
*/
class ConnectionLimiter {
public:
	explicit ConnectionLimiter(int maxPerAddress);

	bool TryAcquire(const std::string& address);
	void Release(const std::string& address);

	int Count(const std::string& address) const;
	size_t TrackedAddresses() const;

private:
	int maxPerAddress_;
	mutable std::mutex mutex_;
	std::unordered_map<std::string, int> counts_;
};

// Sliding one-minute request window per source address. Addresses with no
// request inside the window are forgotten at most a minute later.
class RequestRateLimiter {
public:
	RequestRateLimiter(int maxPerMinute, ClockFn clock = SteadyNow);

	bool Allow(const std::string& address);

	size_t TrackedAddresses() const;

private:
	void ForgetIdleLocked(SteadyClock::time_point windowStart);

	int maxPerMinute_;
	ClockFn clock_;
	mutable std::mutex mutex_;
	std::unordered_map<std::string, std::deque<SteadyClock::time_point>> requests_;
	SteadyClock::time_point lastSweep_;
};

enum class InboundStatus {
	Accepted,
	TooLarge,
	Malformed,
	Ignored
};

struct InboundMessage {
	InboundStatus status = InboundStatus::Ignored;
	std::string action;
	Json::Value body;
};

/*
=============
ScreenInboundMessage

Applies the message size ceiling, parses the JSON body and checks that the
action name is a string within the configured length. Oversized or unparsable
input is reported so the caller can reply with an error; a missing or invalid
action is silently ignored. Neither outcome tears the connection down.
=============
*/
InboundMessage ScreenInboundMessage(std::string_view raw, const ServerConfig& config);

} // namespace mmq
