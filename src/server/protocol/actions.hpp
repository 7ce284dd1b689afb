/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

actions.hpp - Validated client-to-server room channel actions. Loosely typed
JSON bodies are converted here, at the boundary, so handlers only ever see
well-formed values.*/

#pragma once

#include "../session/session.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <json/json.h>

namespace mmq {

struct SetReadyAction {
	bool ready = false;
};

struct KickPlayerAction {
	int playerId = 0;
};

struct UpdateSettingsAction {
	GameSettings settings;
};

struct StartGameAction {};

struct GuessAction {
	std::string text;
};

struct ChatAction {
	std::string text;
};

struct SuggestionsAction {
	std::string query;
};

using ClientAction = std::variant<SetReadyAction, KickPlayerAction, UpdateSettingsAction, StartGameAction,
	GuessAction, ChatAction, SuggestionsAction>;

struct DecodedAction {
	std::optional<ClientAction> action;
	// Player-facing reason when the action was recognised but its payload was not.
	std::string error;
};

DecodedAction DecodeAction(std::string_view name, const Json::Value& body, const SessionRules& rules);

} // namespace mmq
