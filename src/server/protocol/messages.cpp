/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

messages.cpp implementation. Every event is a JSON object with an "action"
member naming it; score maps are keyed by the player id as a string.*/

#include "messages.hpp"

#include <string>
#include <utility>

using json = Json::Value;

namespace mmq::messages {
namespace {

json Action(const char* name) {
	json message(Json::objectValue);
	message["action"] = name;
	return message;
}

json PlayerToJson(const Player& player) {
	json result(Json::objectValue);
	result["id"] = player.id;
	result["name"] = player.name;
	result["is_ready"] = player.ready;
	return result;
}

json ClueToJson(const ClueSnapshot& clue) {
	json result(Json::objectValue);
	result["preview_url"] = clue.audioUrl;
	if (clue.imageUrl)
		result["image"] = *clue.imageUrl;
	if (clue.title)
		result["title"] = *clue.title;
	if (clue.answer)
		result["movie"] = *clue.answer;
	return result;
}

} // namespace

json ScoresToJson(const std::map<int, int>& scores) {
	json result(Json::objectValue);
	for (const auto& [id, score] : scores)
		result[std::to_string(id)] = score;
	return result;
}

json SettingsToJson(const GameSettings& settings) {
	json result(Json::objectValue);
	result["total_rounds"] = settings.totalRounds;
	result["music_duration"] = settings.musicDuration;
	result["game_type"] = GameModeName(settings.mode);
	return result;
}

/*
=============
SnapshotToJson

Externally visible room state. The legacy boolean phase flags are emitted
alongside "phase" for clients that still read them.
=============
*/
json SnapshotToJson(const SessionSnapshot& snapshot) {
	json state(Json::objectValue);
	state["room_id"] = snapshot.roomId;
	state["host_id"] = snapshot.hostId;

	json players(Json::arrayValue);
	for (const Player& player : snapshot.players)
		players.append(PlayerToJson(player));
	state["players"] = std::move(players);

	state["phase"] = GamePhaseName(snapshot.phase);
	state["is_game_active"] = snapshot.gameActive;
	state["is_round_active"] = snapshot.phase == GamePhase::RoundActive;
	state["is_reveal_phase"] = snapshot.phase == GamePhase::Reveal;
	state["current_round"] = snapshot.currentRound;
	state["total_rounds"] = snapshot.settings.totalRounds;
	state["music_duration"] = snapshot.settings.musicDuration;
	state["game_type"] = GameModeName(snapshot.settings.mode);
	state["current_song"] = snapshot.clue ? ClueToJson(*snapshot.clue) : json();
	state["scores"] = ScoresToJson(snapshot.scores);
	state["has_password"] = snapshot.hasPassword;
	return state;
}

json UpdateState(const SessionSnapshot& snapshot) {
	json message = Action("update_state");
	message["state"] = SnapshotToJson(snapshot);
	return message;
}

json SettingsUpdated(const GameSettings& settings) {
	json message = Action("settings_updated");
	message["settings"] = SettingsToJson(settings);
	return message;
}

json RoundStart() {
	return Action("round_start");
}

json RoundEnd(const Clue& clue, const std::map<int, int>& scores) {
	json message = Action("round_end");
	message["correct_answer"] = clue.answer;
	message["song_title"] = clue.title;
	message["album_image"] = clue.imageUrl;
	message["scores"] = ScoresToJson(scores);
	return message;
}

json Notification(std::string_view type, std::string_view text) {
	json message = Action("game_notification");
	message["type"] = std::string(type);
	message["message"] = std::string(text);
	return message;
}

json GuessResultMessage(bool correct, int pointsEarned) {
	json message = Action("guess_result");
	message["correct"] = correct;
	message["points_earned"] = pointsEarned;
	return message;
}

json ChatMessage(std::string_view playerName, std::string_view text) {
	json message = Action("chat_message");
	message["player_name"] = std::string(playerName);
	message["text"] = std::string(text);
	return message;
}

json Suggestions(const std::vector<std::string>& suggestions) {
	json message = Action("suggestions");
	json list(Json::arrayValue);
	for (const std::string& entry : suggestions)
		list.append(entry);
	message["suggestions"] = std::move(list);
	return message;
}

json Error(std::string_view text) {
	json message = Action("error");
	message["message"] = std::string(text);
	return message;
}

json GameOver(const std::map<int, int>& scores) {
	json message = Action("game_over");
	message["leaderboard"] = ScoresToJson(scores);
	return message;
}

std::string Serialize(const json& message) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	builder["emitUTF8"] = true;
	return Json::writeString(builder, message);
}

} // namespace mmq::messages
