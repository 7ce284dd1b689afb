/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_config.hpp - Process-wide limits and tunables for the room services.*/

#pragma once

#include "../session/clue.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include <json/json.h>

namespace mmq {

// Hard ceiling on seats per room; configuration may only lower it.
inline constexpr int kMaxPlayersPerRoom = 10;

struct ServerConfig {
	// rooms
	int maxRooms = 100;
	int maxPlayersPerRoom = kMaxPlayersPerRoom;
	size_t publicRoomListLimit = 20;
	std::chrono::seconds cleanupInterval{ 10 * 60 };
	std::chrono::seconds inactiveTimeout{ 2 * 60 * 60 };

	// game settings bounds
	int minRounds = 5;
	int maxRounds = 20;
	int defaultRounds = 10;
	int minMusicDuration = 15;
	int maxMusicDuration = 60;
	int defaultMusicDuration = 30;
	std::chrono::seconds revealInterval{ 10 };
	std::chrono::seconds providerTimeout{ 10 };

	// input limits
	size_t maxTextInputLength = 100;
	size_t maxNameLength = 50;
	size_t maxPasswordLength = 100;
	size_t maxMessageSize = 1024;
	size_t maxActionLength = 50;
	size_t minSuggestionQueryLength = 2;
	size_t maxSuggestionQueryLength = 50;
	size_t maxSuggestions = 10;

	// perimeter
	int maxConnectionsPerAddress = 5;
	int maxRequestsPerMinute = 60;

	Clue fallbackClue{
		"Demo Song",
		"Demo Movie",
		"https://www.soundhelix.com/examples/mp3/SoundHelix-Song-1.mp3",
		"https://via.placeholder.com/300x300?text=Demo+Album"
	};
	std::string placeholderImageUrl = "https://via.placeholder.com/300x300?text=No+Image";
};

bool ParseServerConfig(const Json::Value& root, ServerConfig& out, std::string& error);
bool LoadServerConfig(const std::string& path, ServerConfig& out, std::string& error);
void ApplyEnvironmentOverrides(ServerConfig& config);
bool ValidateServerConfig(const ServerConfig& config, std::string& error);

} // namespace mmq
