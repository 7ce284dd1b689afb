/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

messages.hpp - Builders for server-to-client room channel events.*/

#pragma once

#include "../session/session.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace mmq::messages {

Json::Value ScoresToJson(const std::map<int, int>& scores);
Json::Value SnapshotToJson(const SessionSnapshot& snapshot);
Json::Value SettingsToJson(const GameSettings& settings);

Json::Value UpdateState(const SessionSnapshot& snapshot);
Json::Value SettingsUpdated(const GameSettings& settings);
Json::Value RoundStart();
Json::Value RoundEnd(const Clue& clue, const std::map<int, int>& scores);
Json::Value Notification(std::string_view type, std::string_view message);
Json::Value GuessResultMessage(bool correct, int pointsEarned);
Json::Value ChatMessage(std::string_view playerName, std::string_view text);
Json::Value Suggestions(const std::vector<std::string>& suggestions);
Json::Value Error(std::string_view message);
Json::Value GameOver(const std::map<int, int>& scores);

std::string Serialize(const Json::Value& message);

} // namespace mmq::messages
