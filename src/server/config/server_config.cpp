/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_config.cpp implementation. Reads the optional JSON configuration file
and environment overrides that size the room services. Parsing is done into a
scratch copy so a rejected file never leaves a half-applied configuration.*/

#include "server_config.hpp"

#include "../../shared/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using json = Json::Value;

namespace mmq {
namespace {

/*
=============
ReadBoundedInt

Reads an optional integer member, requiring it to lie within [minValue, maxValue].
=============
*/
bool ReadBoundedInt(const json& root, const char* key, int minValue, int maxValue, int& out, std::string& error) {
	if (!root.isMember(key))
		return true;

	const json& value = root[key];
	if (!value.isInt()) {
		error = std::format("{} must be an integer", key);
		return false;
	}

	const int parsed = value.asInt();
	if (parsed < minValue || parsed > maxValue) {
		error = std::format("{} must be between {} and {}", key, minValue, maxValue);
		return false;
	}

	out = parsed;
	return true;
}

bool ReadBoundedSize(const json& root, const char* key, size_t maxValue, size_t& out, std::string& error) {
	int parsed = static_cast<int>(out);
	if (!ReadBoundedInt(root, key, 1, static_cast<int>(maxValue), parsed, error))
		return false;
	out = static_cast<size_t>(parsed);
	return true;
}

bool ReadSeconds(const json& root, const char* key, int maxValue, std::chrono::seconds& out, std::string& error) {
	int parsed = static_cast<int>(out.count());
	if (!ReadBoundedInt(root, key, 1, maxValue, parsed, error))
		return false;
	out = std::chrono::seconds(parsed);
	return true;
}

bool ReadString(const json& root, const char* key, std::string& out, std::string& error) {
	if (!root.isMember(key))
		return true;

	const json& value = root[key];
	if (!value.isString()) {
		error = std::format("{} must be a string", key);
		return false;
	}

	out = value.asString();
	return true;
}

/*
=============
ReadEnvInt

Parses a positive integer from the named environment variable.
=============
*/
bool ReadEnvInt(const char* name, int& out) {
	const char* raw = std::getenv(name);
	if (!raw)
		return false;

	const std::string_view text(raw);
	int parsed = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
	if (ec != std::errc() || ptr != text.data() + text.size() || parsed <= 0) {
		Logf(LogLevel::Warn, "{}: ignoring malformed {}='{}'", __FUNCTION__, name, text);
		return false;
	}

	out = parsed;
	return true;
}

} // namespace

/*
=============
ParseServerConfig

Applies the members present in `root` on top of `out`. Unknown keys are
ignored; a wrongly typed or out-of-range value fails the whole parse and
leaves `out` untouched.
=============
*/
bool ParseServerConfig(const json& root, ServerConfig& out, std::string& error) {
	if (!root.isObject()) {
		error = "server config root must be an object";
		return false;
	}

	ServerConfig parsed = out;

	if (!ReadBoundedInt(root, "max_rooms", 1, 100000, parsed.maxRooms, error) ||
		!ReadBoundedInt(root, "max_players_per_room", 1, kMaxPlayersPerRoom, parsed.maxPlayersPerRoom, error) ||
		!ReadBoundedSize(root, "public_room_list_limit", 1000, parsed.publicRoomListLimit, error) ||
		!ReadSeconds(root, "cleanup_interval_seconds", 7 * 24 * 60 * 60, parsed.cleanupInterval, error) ||
		!ReadSeconds(root, "inactive_timeout_seconds", 30 * 24 * 60 * 60, parsed.inactiveTimeout, error) ||
		!ReadBoundedInt(root, "min_rounds", 1, 1000, parsed.minRounds, error) ||
		!ReadBoundedInt(root, "max_rounds", 1, 1000, parsed.maxRounds, error) ||
		!ReadBoundedInt(root, "default_rounds", 1, 1000, parsed.defaultRounds, error) ||
		!ReadBoundedInt(root, "min_music_duration", 1, 3600, parsed.minMusicDuration, error) ||
		!ReadBoundedInt(root, "max_music_duration", 1, 3600, parsed.maxMusicDuration, error) ||
		!ReadBoundedInt(root, "default_music_duration", 1, 3600, parsed.defaultMusicDuration, error) ||
		!ReadSeconds(root, "reveal_interval_seconds", 3600, parsed.revealInterval, error) ||
		!ReadSeconds(root, "provider_timeout_seconds", 600, parsed.providerTimeout, error) ||
		!ReadBoundedSize(root, "max_text_input_length", 10000, parsed.maxTextInputLength, error) ||
		!ReadBoundedSize(root, "max_name_length", 1000, parsed.maxNameLength, error) ||
		!ReadBoundedSize(root, "max_password_length", 1000, parsed.maxPasswordLength, error) ||
		!ReadBoundedSize(root, "max_message_size", 1 << 20, parsed.maxMessageSize, error) ||
		!ReadBoundedSize(root, "max_action_length", 1000, parsed.maxActionLength, error) ||
		!ReadBoundedSize(root, "max_suggestions", 1000, parsed.maxSuggestions, error) ||
		!ReadBoundedInt(root, "max_connections_per_ip", 1, 100000, parsed.maxConnectionsPerAddress, error) ||
		!ReadBoundedInt(root, "max_requests_per_minute", 1, 1000000, parsed.maxRequestsPerMinute, error))
		return false;

	if (root.isMember("fallback_clue")) {
		const json& clue = root["fallback_clue"];
		if (!clue.isObject()) {
			error = "fallback_clue must be an object";
			return false;
		}
		if (!ReadString(clue, "title", parsed.fallbackClue.title, error) ||
			!ReadString(clue, "answer", parsed.fallbackClue.answer, error) ||
			!ReadString(clue, "audio_url", parsed.fallbackClue.audioUrl, error) ||
			!ReadString(clue, "image_url", parsed.fallbackClue.imageUrl, error))
			return false;
	}

	if (!ValidateServerConfig(parsed, error))
		return false;

	out = std::move(parsed);
	return true;
}

/*
=============
LoadServerConfig

Loads a JSON config file from disk into `out`.
=============
*/
bool LoadServerConfig(const std::string& path, ServerConfig& out, std::string& error) {
	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		error = std::format("unable to open '{}'", path);
		return false;
	}

	Json::CharReaderBuilder builder;
	std::string errs;
	json root;
	if (!Json::parseFromStream(builder, file, &root, &errs)) {
		error = std::format("failed to parse '{}': {}", path, errs);
		return false;
	}

	if (!ParseServerConfig(root, out, error))
		return false;

	Logf(LogLevel::Info, "{}: loaded server config from {}", __FUNCTION__, path);
	return true;
}

/*
=============
ApplyEnvironmentOverrides

Honours MMQ_MAX_ROOMS and MMQ_MAX_CONNECTIONS_PER_IP.
=============
*/
void ApplyEnvironmentOverrides(ServerConfig& config) {
	int value = 0;
	if (ReadEnvInt("MMQ_MAX_ROOMS", value))
		config.maxRooms = value;
	if (ReadEnvInt("MMQ_MAX_CONNECTIONS_PER_IP", value))
		config.maxConnectionsPerAddress = value;
}

/*
=============
ValidateServerConfig

Rejects inconsistent bounds.
=============
*/
bool ValidateServerConfig(const ServerConfig& config, std::string& error) {
	if (config.maxRooms <= 0 || config.maxPlayersPerRoom <= 0) {
		error = "room and player caps must be positive";
		return false;
	}
	if (config.maxPlayersPerRoom > kMaxPlayersPerRoom) {
		error = std::format("max_players_per_room exceeds {}", kMaxPlayersPerRoom);
		return false;
	}
	if (config.minRounds > config.maxRounds) {
		error = "min_rounds exceeds max_rounds";
		return false;
	}
	if (config.defaultRounds < config.minRounds || config.defaultRounds > config.maxRounds) {
		error = "default_rounds outside [min_rounds, max_rounds]";
		return false;
	}
	if (config.minMusicDuration > config.maxMusicDuration) {
		error = "min_music_duration exceeds max_music_duration";
		return false;
	}
	if (config.defaultMusicDuration < config.minMusicDuration || config.defaultMusicDuration > config.maxMusicDuration) {
		error = "default_music_duration outside [min_music_duration, max_music_duration]";
		return false;
	}
	if (config.minSuggestionQueryLength > config.maxSuggestionQueryLength) {
		error = "suggestion query bounds are inverted";
		return false;
	}
	if (config.maxConnectionsPerAddress <= 0 || config.maxRequestsPerMinute <= 0) {
		error = "perimeter limits must be positive";
		return false;
	}
	return true;
}

} // namespace mmq
