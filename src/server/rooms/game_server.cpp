/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_server.cpp implementation. Every entry point here runs on a transport
thread. Session mutation goes through the session's own lock and fan-out
through the hub; nothing in this file holds a lock across a send.*/

#include "game_server.hpp"

#include "../protocol/messages.hpp"
#include "../providers/bounded_call.hpp"
#include "../providers/title_catalog.hpp"
#include "../../shared/logger.hpp"

#include <exception>
#include <format>
#include <utility>
#include <variant>

namespace mmq {

GameServer::GameServer(ServerConfig config, GameServerServices services)
	: config_(std::move(config)),
	  rules_(SessionRulesFromConfig(config_)),
	  services_(std::move(services)),
	  hub_(std::make_shared<BroadcastHub>()),
	  registry_(config_, services_.clock, services_.roomIds),
	  connections_(config_.maxConnectionsPerAddress),
	  requests_(config_.maxRequestsPerMinute, services_.clock),
	  hostIdRandom_(std::random_device{}()) {
	if (!services_.titles)
		services_.titles = std::make_shared<StaticTitleProvider>(DefaultTitles());
	if (!services_.clues)
		services_.clues = std::make_shared<ClueResolver>(services_.titles, services_.clueProvider, config_);
}

GameServer::~GameServer() {
	Shutdown();
}

/*
=============
GameServer::Init

Opens the server for admissions. Rooms evicted by the inactivity sweep also
lose their broadcast channel.
=============
*/
void GameServer::Init() {
	if (initialized_.exchange(true))
		return;

	std::weak_ptr<BroadcastHub> hub = hub_;
	registry_.SetEvictionListener([hub](const std::shared_ptr<Session>& session) {
		if (auto target = hub.lock())
			target->RemoveRoom(session->RoomId());
	});

	Logf(LogLevel::Info, "{}: room services ready (max {} rooms)", __FUNCTION__, config_.maxRooms);
}

/*
=============
GameServer::Shutdown

Stops admissions, then cancels and joins every round scheduler still running.
=============
*/
void GameServer::Shutdown() {
	if (!initialized_.exchange(false))
		return;

	std::vector<std::shared_ptr<RoundScheduler>> running;
	{
		std::lock_guard lock(schedulersMutex_);
		for (const auto& entry : schedulers_) {
			if (auto scheduler = entry.lock())
				running.push_back(std::move(scheduler));
		}
		schedulers_.clear();
	}

	for (const auto& scheduler : running)
		scheduler->Cancel();
	for (const auto& scheduler : running)
		scheduler->Join();

	Logf(LogLevel::Info, "{}: stopped {} schedulers", __FUNCTION__, running.size());
}

CreateRoomResult GameServer::CreateRoom(const std::string& address, std::string_view hostName, const std::optional<std::string>& password) {
	CreateRoomResult result;

	if (!IsReady()) {
		result.error = ErrorCode::ServerNotReady;
		result.message = "Room manager not initialized";
		return result;
	}

	if (!requests_.Allow(address)) {
		result.error = ErrorCode::CapacityExceeded;
		result.message = "Too many requests";
		return result;
	}

	const std::string name = SanitizeText(hostName, config_.maxTextInputLength);
	if (name.empty()) {
		result.error = ErrorCode::ValidationRejected;
		result.message = "Host name is required";
		return result;
	}
	if (name.size() > config_.maxNameLength) {
		result.error = ErrorCode::ValidationRejected;
		result.message = std::format("Host name too long (max {} characters)", config_.maxNameLength);
		return result;
	}

	std::optional<std::string> roomPassword;
	if (password) {
		std::string trimmed = TrimWhitespace(*password);
		if (trimmed.size() > config_.maxPasswordLength) {
			result.error = ErrorCode::ValidationRejected;
			result.message = std::format("Password too long (max {} characters)", config_.maxPasswordLength);
			return result;
		}
		if (!trimmed.empty())
			roomPassword = std::move(trimmed);
	}

	const int hostId = NextHostId();
	RoomCreateResult created = registry_.Create(hostId, name, roomPassword);
	if (!created.ok()) {
		result.error = created.error;
		result.message = std::move(created.message);
		return result;
	}

	result.roomId = created.session->RoomId();
	result.hostId = hostId;
	return result;
}

bool GameServer::ListPublicRooms(const std::string& address, std::vector<RoomSummary>& out, std::string& error) {
	if (!IsReady()) {
		error = "Room manager not initialized";
		return false;
	}

	if (!requests_.Allow(address)) {
		error = "Too many requests";
		return false;
	}

	out = registry_.ListPublic();
	return true;
}

Json::Value GameServer::HealthDocument() const {
	Json::Value health(Json::objectValue);
	if (!IsReady()) {
		health["status"] = "initializing";
		health["active_rooms"] = 0;
		health["total_connections"] = 0;
		return health;
	}

	health["status"] = "healthy";
	health["active_rooms"] = static_cast<Json::UInt64>(registry_.Size());
	health["total_connections"] = static_cast<Json::UInt64>(hub_->ConnectionCount());
	return health;
}

/*
=============
GameServer::Admit

Runs the admission checks in order and either registers the connection with
its room or closes it with a reason. Once the per-address slot is taken every
later refusal gives it back.
=============
*/
AdmissionResult GameServer::Admit(const ConnectRequest& request, std::shared_ptr<Connection> connection) {
	if (!IsReady())
		return Reject(request.address, false, *connection, ErrorCode::ServerNotReady, kCloseServerNotReady, "Server not ready");

	if (!ValidateRoomId(request.roomId))
		return Reject(request.address, false, *connection, ErrorCode::ValidationRejected, kClosePolicyViolation, "Invalid room ID format");

	if (!ValidatePlayerId(request.playerId))
		return Reject(request.address, false, *connection, ErrorCode::ValidationRejected, kClosePolicyViolation, "Invalid client ID");

	const std::string name = SanitizeText(request.playerName, config_.maxTextInputLength);
	if (name.empty())
		return Reject(request.address, false, *connection, ErrorCode::ValidationRejected, kClosePolicyViolation, "Invalid player name");

	if (!connections_.TryAcquire(request.address))
		return Reject(request.address, false, *connection, ErrorCode::CapacityExceeded, kClosePolicyViolation, "Too many connections from this IP");

	const std::shared_ptr<Session> session = registry_.Lookup(request.roomId);
	if (!session)
		return Reject(request.address, true, *connection, ErrorCode::NotFound, kClosePolicyViolation, "Room not found", "Room not found");

	if (!session->VerifyPassword(request.password))
		return Reject(request.address, true, *connection, ErrorCode::AuthFailed, kClosePolicyViolation, "Invalid password", "Invalid password for this room");

	const int playerId = static_cast<int>(request.playerId);
	switch (ClaimSeat(session, request.roomId, playerId, name, connection)) {
	case SeatClaim::RoomFull:
		return Reject(request.address, true, *connection, ErrorCode::CapacityExceeded, kClosePolicyViolation, "Room is full", "Room is full");
	case SeatClaim::AlreadyConnected:
		return Reject(request.address, true, *connection, ErrorCode::ValidationRejected, kClosePolicyViolation, "Player already connected", "Player already connected");
	case SeatClaim::RoomClosed:
		return Reject(request.address, true, *connection, ErrorCode::NotFound, kClosePolicyViolation, "Room not found", "Room not found");
	case SeatClaim::Claimed:
		break;
	}

	Logf(LogLevel::Info, "{}: player {} ({}) joined room {}", __FUNCTION__, playerId, TruncateUtf8(name, 20), request.roomId);
	BroadcastState(*session);

	AdmissionResult result;
	result.context = ClientContext{ request.roomId, playerId, name, request.address, session, std::move(connection) };
	return result;
}

/*
=============
GameServer::ClaimSeat

Takes the player's seat and hub slot as one step. The host's seat exists from
room creation and is claimed by the first connection presenting the host id;
any other seated id with a live connection is refused. A seat added here is
given back when the claim fails.
=============
*/
GameServer::SeatClaim GameServer::ClaimSeat(const std::shared_ptr<Session>& session, const std::string& roomId, int playerId,
	const std::string& name, const std::shared_ptr<Connection>& connection) {
	std::lock_guard seats(seatsMutex_);

	bool addedSeat = false;
	if (!session->HasPlayer(playerId)) {
		if (!session->AddPlayer(playerId, name))
			return SeatClaim::RoomFull;
		addedSeat = true;
	}

	// The room may have emptied and closed between lookup and join.
	if (registry_.Lookup(roomId) != session) {
		if (addedSeat)
			session->RemovePlayer(playerId);
		return SeatClaim::RoomClosed;
	}

	if (!hub_->TryRegister(roomId, playerId, connection)) {
		if (addedSeat)
			session->RemovePlayer(playerId);
		return SeatClaim::AlreadyConnected;
	}

	return SeatClaim::Claimed;
}

AdmissionResult GameServer::Reject(const std::string& address, bool releaseSlot, Connection& connection, ErrorCode error,
	int closeCode, std::string reason, std::string_view errorEvent) {
	if (releaseSlot)
		connections_.Release(address);

	if (!errorEvent.empty())
		hub_->Unicast(connection, messages::Error(errorEvent));

	Logf(LogLevel::Debug, "{}: connection refused [{}]: {}", __FUNCTION__, ErrorCodeName(error), reason);
	connection.Close(closeCode, reason);

	AdmissionResult result;
	result.error = error;
	result.closeCode = closeCode;
	result.reason = std::move(reason);
	return result;
}

/*
=============
GameServer::HandleMessage

Screens one raw room channel message, decodes it into a typed action and
dispatches it. Bad input is answered on the sender's connection only.
=============
*/
void GameServer::HandleMessage(const ClientContext& client, std::string_view raw) {
	const InboundMessage inbound = ScreenInboundMessage(raw, config_);

	switch (inbound.status) {
	case InboundStatus::TooLarge:
		hub_->Unicast(*client.connection, messages::Error("Message too large"));
		return;
	case InboundStatus::Malformed:
		hub_->Unicast(*client.connection, messages::Error("Invalid message format"));
		return;
	case InboundStatus::Ignored:
		return;
	case InboundStatus::Accepted:
		break;
	}

	Logf(LogLevel::Trace, "{}: action '{}' from player {}", __FUNCTION__,
		TruncateUtf8(SanitizeText(inbound.action, config_.maxActionLength), 20), client.playerId);

	const DecodedAction decoded = DecodeAction(inbound.action, inbound.body, rules_);
	if (!decoded.action) {
		// Only host-only actions carry a decode error; other senders get no reply.
		if (!decoded.error.empty() && client.playerId == client.session->HostId())
			hub_->Unicast(*client.connection, messages::Error(decoded.error));
		return;
	}

	std::visit([this, &client](const auto& action) { Handle(client, action); }, *decoded.action);
}

void GameServer::Handle(const ClientContext& client, const SetReadyAction& action) {
	if (client.session->SetReady(client.playerId, action.ready))
		BroadcastState(*client.session);
}

void GameServer::Handle(const ClientContext& client, const KickPlayerAction& action) {
	if (client.playerId != client.session->HostId())
		return;

	std::shared_ptr<Connection> target;
	{
		std::lock_guard seats(seatsMutex_);
		target = hub_->Find(client.roomId, action.playerId);
		if (target)
			hub_->Unregister(client.roomId, action.playerId, target.get());
		client.session->RemovePlayer(action.playerId);
	}

	if (target)
		target->Close(kCloseNormal, "Kicked by host");

	Logf(LogLevel::Info, "{}: player {} kicked from room {}", __FUNCTION__, action.playerId, client.roomId);
	BroadcastState(*client.session);
}

void GameServer::Handle(const ClientContext& client, const UpdateSettingsAction& action) {
	if (client.playerId != client.session->HostId())
		return;

	if (!client.session->UpdateSettings(action.settings)) {
		hub_->Unicast(*client.connection, messages::Error("Cannot change settings during game"));
		return;
	}

	hub_->BroadcastProduced(client.roomId, [&client]() { return messages::SettingsUpdated(client.session->Settings()); });
	BroadcastState(*client.session);
}

/*
=============
GameServer::Handle(StartGameAction)

Refused while a scheduler is still attached to the room, including one that
has been cancelled but has not yet wound down.
=============
*/
void GameServer::Handle(const ClientContext& client, const StartGameAction&) {
	const std::shared_ptr<Session>& session = client.session;
	if (!IsReady() || client.playerId != session->HostId() || session->IsGameActive())
		return;

	auto scheduler = std::make_shared<RoundScheduler>(session, hub_, services_.clues,
		std::chrono::duration_cast<std::chrono::milliseconds>(config_.revealInterval),
		services_.timerFactory ? services_.timerFactory() : nullptr);

	if (!session->AttachTask(scheduler)) {
		Logf(LogLevel::Debug, "{}: room {} already has a running game", __FUNCTION__, client.roomId);
		return;
	}

	session->StartGame();
	BroadcastState(*session);

	TrackScheduler(scheduler);
	scheduler->Start();
}

void GameServer::Handle(const ClientContext& client, const GuessAction& action) {
	const GuessResult result = client.session->RecordGuess(client.playerId, action.text);
	if (result.outcome == GuessOutcome::Rejected)
		return;

	hub_->Unicast(*client.connection, messages::GuessResultMessage(result.outcome == GuessOutcome::Correct, result.pointsEarned));
	BroadcastState(*client.session);
}

void GameServer::Handle(const ClientContext& client, const ChatAction& action) {
	const std::string text = SanitizeText(action.text, config_.maxTextInputLength);
	if (text.empty())
		return;

	const std::string name = client.session->PlayerName(client.playerId).value_or(client.playerName);
	hub_->Broadcast(client.roomId, messages::ChatMessage(name, text));
}

/*
=============
GameServer::Handle(SuggestionsAction)

Always answers, with an empty list when the query is out of bounds or the
title provider fails or stalls.
=============
*/
void GameServer::Handle(const ClientContext& client, const SuggestionsAction& action) {
	std::vector<std::string> suggestions;

	const std::string query = SanitizeText(action.query, config_.maxTextInputLength);
	if (query.size() >= config_.minSuggestionQueryLength && query.size() <= config_.maxSuggestionQueryLength) {
		try {
			auto found = CallWithTimeout([titles = services_.titles, query, limit = config_.maxSuggestions]() {
				return titles->Suggest(query, limit);
			}, std::chrono::duration_cast<std::chrono::milliseconds>(config_.providerTimeout));

			if (found) {
				for (std::string& entry : *found) {
					std::string clean = SanitizeText(entry, config_.maxTextInputLength);
					if (!clean.empty() && suggestions.size() < config_.maxSuggestions)
						suggestions.push_back(std::move(clean));
				}
			}
			else {
				Logf(LogLevel::Warn, "{}: [{}] title provider timed out", __FUNCTION__, ErrorCodeName(ErrorCode::TransientProviderFailure));
			}
		}
		catch (const std::exception& e) {
			Logf(LogLevel::Warn, "{}: [{}] title provider failed: {}", __FUNCTION__,
				ErrorCodeName(ErrorCode::TransientProviderFailure), TruncateUtf8(e.what(), 100));
		}
	}

	hub_->Unicast(*client.connection, messages::Suggestions(suggestions));
}

/*
=============
GameServer::Disconnect

Gives back the address slot and the player's seat. The last player out closes
the room and stops its scheduler; otherwise the rest of the room is told.
=============
*/
void GameServer::Disconnect(const ClientContext& client) {
	connections_.Release(client.address);
	{
		// A connection that was kicked or replaced no longer owns the seat.
		std::lock_guard seats(seatsMutex_);
		const bool owned = hub_->Unregister(client.roomId, client.playerId, client.connection.get())
			|| !hub_->Find(client.roomId, client.playerId);
		if (owned)
			client.session->RemovePlayer(client.playerId);
	}

	Logf(LogLevel::Info, "{}: player {} left room {}", __FUNCTION__, client.playerId, client.roomId);

	if (client.session->PlayerCount() == 0 && registry_.RemoveIfEmpty(client.roomId)) {
		hub_->RemoveRoom(client.roomId);
		return;
	}

	BroadcastState(*client.session);
}

void GameServer::BroadcastState(const Session& session) {
	hub_->BroadcastProduced(session.RoomId(), [&session]() { return messages::UpdateState(session.Snapshot()); });
}

void GameServer::TrackScheduler(const std::shared_ptr<RoundScheduler>& scheduler) {
	std::lock_guard lock(schedulersMutex_);
	std::erase_if(schedulers_, [](const std::weak_ptr<RoundScheduler>& entry) { return entry.expired(); });
	schedulers_.push_back(scheduler);
}

int GameServer::NextHostId() {
	if (services_.hostIds)
		return services_.hostIds();

	std::lock_guard lock(hostIdMutex_);
	std::uniform_int_distribution<int> pick(static_cast<int>(kMinPlayerId), static_cast<int>(kMaxPlayerId));
	return pick(hostIdRandom_);
}

Json::Value PublicRoomsDocument(const std::vector<RoomSummary>& rooms) {
	Json::Value list(Json::arrayValue);
	for (const RoomSummary& room : rooms) {
		Json::Value entry(Json::objectValue);
		entry["room_id"] = room.roomId;
		entry["host_name"] = room.hostName;
		entry["player_count"] = static_cast<Json::UInt64>(room.playerCount);
		entry["has_password"] = room.hasPassword;
		list.append(std::move(entry));
	}
	return list;
}

} // namespace mmq
