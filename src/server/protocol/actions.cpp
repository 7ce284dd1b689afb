/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

actions.cpp implementation.*/

#include "actions.hpp"

#include "../security/security_gate.hpp"

#include <cstdint>
#include <string>
#include <utility>

using json = Json::Value;

namespace mmq {
namespace {

// Booleans and reals are not integers on the wire.
bool IsWireInteger(const json& value) {
	return value.type() == Json::intValue || value.type() == Json::uintValue;
}

/*
=============
ReadOptionalString

Reads `key` as a string, using an empty string when it is absent. Any other
type makes the action invalid.
=============
*/
bool ReadOptionalString(const json& body, const char* key, std::string& out) {
	if (!body.isMember(key)) {
		out.clear();
		return true;
	}

	const json& value = body[key];
	if (!value.isString())
		return false;

	out = value.asString();
	return true;
}

/*
=============
DecodeSettings

Missing members fall back to the configured defaults, matching a settings
form that only submits the fields the host touched.
=============
*/
bool DecodeSettings(const json& body, const SessionRules& rules, GameSettings& out) {
	GameSettings settings = rules.defaults;

	if (body.isMember("total_rounds")) {
		const json& value = body["total_rounds"];
		if (!IsWireInteger(value) || !value.isInt())
			return false;
		settings.totalRounds = value.asInt();
	}

	if (body.isMember("music_duration")) {
		const json& value = body["music_duration"];
		if (!IsWireInteger(value) || !value.isInt())
			return false;
		settings.musicDuration = value.asInt();
	}

	if (body.isMember("game_type")) {
		const json& value = body["game_type"];
		if (!value.isString())
			return false;
		const auto mode = ParseGameMode(value.asString());
		if (!mode)
			return false;
		settings.mode = *mode;
	}

	if (!ValidateGameSettings(settings, rules))
		return false;

	out = settings;
	return true;
}

} // namespace

/*
=============
DecodeAction

Converts a screened inbound message into a typed action. Unknown actions and
payloads of the wrong type produce no action and no error, so they are
dropped quietly; only malformed settings are reported back to the sender.
=============
*/
DecodedAction DecodeAction(std::string_view name, const json& body, const SessionRules& rules) {
	DecodedAction decoded;

	if (name == "set_ready") {
		bool ready = false;
		if (body.isMember("is_ready")) {
			if (!body["is_ready"].isBool())
				return decoded;
			ready = body["is_ready"].asBool();
		}
		decoded.action = SetReadyAction{ ready };
	}
	else if (name == "kick_player") {
		const json& value = body["player_id"];
		if (!IsWireInteger(value) || !value.isInt64() || !ValidatePlayerId(value.asInt64()))
			return decoded;
		decoded.action = KickPlayerAction{ static_cast<int>(value.asInt64()) };
	}
	else if (name == "update_settings") {
		const json settingsBody = body.isMember("settings") ? body["settings"] : json(Json::objectValue);
		if (!settingsBody.isObject())
			return decoded;

		GameSettings settings;
		if (!DecodeSettings(settingsBody, rules, settings)) {
			decoded.error = "Invalid settings format";
			return decoded;
		}
		decoded.action = UpdateSettingsAction{ settings };
	}
	else if (name == "start_game") {
		decoded.action = StartGameAction{};
	}
	else if (name == "guess") {
		GuessAction guess;
		if (!ReadOptionalString(body, "text", guess.text))
			return decoded;
		decoded.action = std::move(guess);
	}
	else if (name == "chat") {
		ChatAction chat;
		if (!ReadOptionalString(body, "text", chat.text))
			return decoded;
		decoded.action = std::move(chat);
	}
	else if (name == "get_suggestions") {
		SuggestionsAction suggestions;
		if (!ReadOptionalString(body, "query", suggestions.query))
			return decoded;
		decoded.action = std::move(suggestions);
	}

	return decoded;
}

} // namespace mmq
