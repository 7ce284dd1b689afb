/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_server.hpp - Long-lived room services: admission, room channel actions,
disconnect cleanup and the registry-facing surface.*/

#pragma once

#include "room_registry.hpp"
#include "../config/server_config.hpp"
#include "../net/broadcast_hub.hpp"
#include "../protocol/actions.hpp"
#include "../providers/clue_resolver.hpp"
#include "../providers/providers.hpp"
#include "../security/security_gate.hpp"
#include "../server_errors.hpp"
#include "../session/round_scheduler.hpp"
#include "../../shared/clock.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace mmq {

// Collaborators and test seams. Anything left empty gets a production default.
struct GameServerServices {
	std::shared_ptr<TitleProvider> titles;
	std::shared_ptr<ClueProvider> clueProvider;
	std::shared_ptr<ClueSource> clues;
	std::function<std::unique_ptr<RoundTimer>()> timerFactory;
	ClockFn clock = SteadyNow;
	RoomRegistry::IdGenerator roomIds;
	std::function<int()> hostIds;
};

struct CreateRoomResult {
	ErrorCode error = ErrorCode::None;
	std::string message;
	std::string roomId;
	int hostId = 0;

	bool ok() const { return error == ErrorCode::None; }
};

struct ConnectRequest {
	std::string roomId;
	int64_t playerId = 0;
	std::string playerName;
	std::optional<std::string> password;
	std::string address;
};

// Per-connection state handed back to the transport after a successful admission.
struct ClientContext {
	std::string roomId;
	int playerId = 0;
	std::string playerName;
	std::string address;
	std::shared_ptr<Session> session;
	std::shared_ptr<Connection> connection;
};

struct AdmissionResult {
	std::optional<ClientContext> context;
	ErrorCode error = ErrorCode::None;
	int closeCode = kCloseNormal;
	std::string reason;

	bool ok() const { return context.has_value(); }
};

// Registry-facing list document: [{room_id, host_name, player_count, has_password}].
Json::Value PublicRoomsDocument(const std::vector<RoomSummary>& rooms);

class GameServer {
public:
	explicit GameServer(ServerConfig config, GameServerServices services = {});
	~GameServer();

	GameServer(const GameServer&) = delete;
	GameServer& operator=(const GameServer&) = delete;

	void Init();
	void Shutdown();
	bool IsReady() const { return initialized_.load(); }

	CreateRoomResult CreateRoom(const std::string& address, std::string_view hostName, const std::optional<std::string>& password);
	bool ListPublicRooms(const std::string& address, std::vector<RoomSummary>& out, std::string& error);
	Json::Value HealthDocument() const;

	AdmissionResult Admit(const ConnectRequest& request, std::shared_ptr<Connection> connection);
	void HandleMessage(const ClientContext& client, std::string_view raw);
	void Disconnect(const ClientContext& client);

	const ServerConfig& Config() const { return config_; }
	RoomRegistry& Rooms() { return registry_; }
	BroadcastHub& Hub() { return *hub_; }

private:
	enum class SeatClaim {
		Claimed,
		RoomFull,
		AlreadyConnected,
		RoomClosed
	};

	SeatClaim ClaimSeat(const std::shared_ptr<Session>& session, const std::string& roomId, int playerId,
		const std::string& name, const std::shared_ptr<Connection>& connection);
	AdmissionResult Reject(const std::string& address, bool releaseSlot, Connection& connection, ErrorCode error,
		int closeCode, std::string reason, std::string_view errorEvent = {});

	void Handle(const ClientContext& client, const SetReadyAction& action);
	void Handle(const ClientContext& client, const KickPlayerAction& action);
	void Handle(const ClientContext& client, const UpdateSettingsAction& action);
	void Handle(const ClientContext& client, const StartGameAction& action);
	void Handle(const ClientContext& client, const GuessAction& action);
	void Handle(const ClientContext& client, const ChatAction& action);
	void Handle(const ClientContext& client, const SuggestionsAction& action);

	void BroadcastState(const Session& session);
	void TrackScheduler(const std::shared_ptr<RoundScheduler>& scheduler);
	int NextHostId();

	const ServerConfig config_;
	const SessionRules rules_;
	GameServerServices services_;

	std::shared_ptr<BroadcastHub> hub_;
	RoomRegistry registry_;
	ConnectionLimiter connections_;
	RequestRateLimiter requests_;

	std::atomic<bool> initialized_{ false };

	// Guards seat claims and releases: session seat plus hub slot.
	std::mutex seatsMutex_;

	std::mutex schedulersMutex_;
	std::vector<std::weak_ptr<RoundScheduler>> schedulers_;

	std::mutex hostIdMutex_;
	std::mt19937 hostIdRandom_;
};

} // namespace mmq
