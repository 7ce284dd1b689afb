/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_game_server.cpp implementation.*/

#include "server/rooms/game_server.hpp"
#include "shared/logger.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace mmq;
using test::FakeConnection;

namespace {

constexpr int kAlice = 10001;
constexpr int kBob = 10002;
constexpr int kCara = 10003;

} // namespace

class GameServerTest : public ::testing::Test {
protected:
	void SetUp() override {
		Boot();
	}

	void TearDown() override {
		server_.reset();
	}

	void Boot(bool init = true) {
		server_.reset();

		GameServerServices services;
		services.clues = std::make_shared<test::FixedClueSource>(test::SampleClue());
		services.clock = clock_.Fn();
		services.hostIds = []() { return kAlice; };
		services.timerFactory = [this]() {
			return std::make_unique<test::ScriptedTimer>([this](std::chrono::milliseconds duration) {
				if (onWait_)
					onWait_(duration);
			});
		};

		server_ = std::make_unique<GameServer>(config_, std::move(services));
		if (init)
			server_->Init();
	}

	std::string CreateAliceRoom(const std::optional<std::string>& password = std::nullopt) {
		const CreateRoomResult created = server_->CreateRoom("10.0.0.1", "Alice", password);
		EXPECT_TRUE(created.ok()) << created.message;
		EXPECT_EQ(created.hostId, kAlice);
		return created.roomId;
	}

	AdmissionResult Connect(const std::string& roomId, int64_t playerId, const std::string& name,
		const std::string& address = "10.0.0.1", const std::optional<std::string>& password = std::nullopt) {
		auto connection = std::make_shared<FakeConnection>();
		connections_[playerId] = connection;
		return server_->Admit(ConnectRequest{ roomId, playerId, name, password, address }, connection);
	}

	ClientContext Join(const std::string& roomId, int playerId, const std::string& name, const std::string& address = "10.0.0.1") {
		AdmissionResult admitted = Connect(roomId, playerId, name, address);
		EXPECT_TRUE(admitted.ok()) << admitted.reason;
		return *admitted.context;
	}

	void Send(const ClientContext& client, const std::string& raw) {
		server_->HandleMessage(client, raw);
	}

	FakeConnection& Conn(int64_t playerId) { return *connections_.at(playerId); }

	ServerConfig config_;
	test::ManualClock clock_;
	std::function<void(std::chrono::milliseconds)> onWait_;
	std::map<int64_t, std::shared_ptr<FakeConnection>> connections_;
	std::unique_ptr<GameServer> server_;
};

TEST_F(GameServerTest, HealthReflectsLifecycle) {
	Boot(false);
	Json::Value health = server_->HealthDocument();
	EXPECT_EQ(health["status"].asString(), "initializing");
	EXPECT_EQ(health["active_rooms"].asInt(), 0);

	server_->Init();
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");

	health = server_->HealthDocument();
	EXPECT_EQ(health["status"].asString(), "healthy");
	EXPECT_EQ(health["active_rooms"].asInt(), 1);
	EXPECT_EQ(health["total_connections"].asInt(), 1);
}

TEST_F(GameServerTest, CreateRoomValidatesInput) {
	EXPECT_EQ(server_->CreateRoom("10.0.0.1", "  <b></b> ", std::nullopt).error, ErrorCode::ValidationRejected);
	EXPECT_EQ(server_->CreateRoom("10.0.0.1", std::string(60, 'n'), std::nullopt).error, ErrorCode::ValidationRejected);
	EXPECT_EQ(server_->CreateRoom("10.0.0.1", "Alice", std::string(101, 'p')).error, ErrorCode::ValidationRejected);

	const CreateRoomResult created = server_->CreateRoom("10.0.0.1", "Alice", std::string("  "));
	ASSERT_TRUE(created.ok());
	EXPECT_TRUE(ValidateRoomId(created.roomId));
	EXPECT_FALSE(server_->Rooms().Lookup(created.roomId)->HasPassword());

	Boot(false);
	EXPECT_EQ(server_->CreateRoom("10.0.0.1", "Alice", std::nullopt).error, ErrorCode::ServerNotReady);
}

TEST_F(GameServerTest, RegistryCallsAreRateLimitedPerAddress) {
	config_.maxRequestsPerMinute = 2;
	Boot();

	EXPECT_TRUE(server_->CreateRoom("10.0.0.1", "Alice", std::nullopt).ok());
	std::vector<RoomSummary> rooms;
	std::string error;
	EXPECT_TRUE(server_->ListPublicRooms("10.0.0.1", rooms, error));
	EXPECT_FALSE(server_->ListPublicRooms("10.0.0.1", rooms, error));
	EXPECT_EQ(error, "Too many requests");
	EXPECT_EQ(server_->CreateRoom("10.0.0.1", "Alice", std::nullopt).error, ErrorCode::CapacityExceeded);

	EXPECT_TRUE(server_->ListPublicRooms("10.0.0.2", rooms, error));
	clock_.Advance(std::chrono::seconds(61));
	EXPECT_TRUE(server_->ListPublicRooms("10.0.0.1", rooms, error));
}

TEST_F(GameServerTest, PublicRoomListShowsAlice) {
	const std::string room = CreateAliceRoom();
	server_->CreateRoom("10.0.0.1", "Bob", std::string("secret"));

	std::vector<RoomSummary> rooms;
	std::string error;
	ASSERT_TRUE(server_->ListPublicRooms("10.0.0.1", rooms, error)) << error;

	const Json::Value document = PublicRoomsDocument(rooms);
	ASSERT_EQ(document.size(), 1u);
	EXPECT_EQ(document[0]["room_id"].asString(), room);
	EXPECT_EQ(document[0]["host_name"].asString(), "Alice");
	EXPECT_EQ(document[0]["player_count"].asInt(), 1);
	EXPECT_FALSE(document[0]["has_password"].asBool());
}

TEST_F(GameServerTest, AdmissionRefusesInOrder) {
	config_.maxConnectionsPerAddress = 1;
	Boot();
	const std::string room = CreateAliceRoom();

	AdmissionResult result = Connect("bad", kBob, "Bob");
	EXPECT_EQ(result.error, ErrorCode::ValidationRejected);
	EXPECT_EQ(Conn(kBob).CloseCode(), kClosePolicyViolation);
	EXPECT_EQ(Conn(kBob).CloseReason(), "Invalid room ID format");

	result = Connect(room, 123, "Bob");
	EXPECT_EQ(Conn(123).CloseReason(), "Invalid client ID");

	result = Connect(room, kBob, "<b></b>");
	EXPECT_EQ(Conn(kBob).CloseReason(), "Invalid player name");

	result = Connect("ZZZZZZ", kBob, "Bob");
	EXPECT_EQ(result.error, ErrorCode::NotFound);
	EXPECT_EQ(Conn(kBob).CloseReason(), "Room not found");
	ASSERT_EQ(Conn(kBob).MessagesWithAction("error").size(), 1u);
	EXPECT_EQ(Conn(kBob).MessagesWithAction("error")[0]["message"].asString(), "Room not found");

	// every refusal gave its single address slot back
	EXPECT_TRUE(Connect(room, kBob, "Bob").ok());
}

TEST_F(GameServerTest, PasswordProtectedRoomChecksPassword) {
	const std::string room = CreateAliceRoom(std::string("hunter2"));

	AdmissionResult refused = Connect(room, kBob, "Bob", "10.0.0.2", std::string("wrong"));
	EXPECT_EQ(refused.error, ErrorCode::AuthFailed);
	EXPECT_EQ(Conn(kBob).CloseCode(), kClosePolicyViolation);
	EXPECT_EQ(Conn(kBob).MessagesWithAction("error")[0]["message"].asString(), "Invalid password for this room");

	refused = Connect(room, kBob, "Bob", "10.0.0.2");
	EXPECT_EQ(refused.error, ErrorCode::AuthFailed);

	EXPECT_TRUE(Connect(room, kBob, "Bob", "10.0.0.2", std::string("hunter2")).ok());
}

TEST_F(GameServerTest, NotReadyServerClosesWith1011) {
	Boot(false);
	const AdmissionResult result = Connect("ABC123", kBob, "Bob");
	EXPECT_EQ(result.error, ErrorCode::ServerNotReady);
	EXPECT_EQ(Conn(kBob).CloseCode(), kCloseServerNotReady);
}

TEST_F(GameServerTest, PerAddressConnectionLimit) {
	config_.maxConnectionsPerAddress = 2;
	Boot();
	const std::string room = CreateAliceRoom();

	const ClientContext alice = Join(room, kAlice, "Alice", "10.0.0.7");
	Join(room, kBob, "Bob", "10.0.0.7");

	const AdmissionResult refused = Connect(room, kCara, "Cara", "10.0.0.7");
	EXPECT_EQ(refused.error, ErrorCode::CapacityExceeded);
	EXPECT_EQ(Conn(kCara).CloseReason(), "Too many connections from this IP");

	server_->Disconnect(alice);
	EXPECT_TRUE(Connect(room, kCara, "Cara", "10.0.0.7").ok());
}

TEST_F(GameServerTest, FullRoomAndDuplicateSeatAreRefused) {
	config_.maxPlayersPerRoom = 2;
	Boot();
	const std::string room = CreateAliceRoom();

	Join(room, kAlice, "Alice");
	const AdmissionResult duplicate = Connect(room, kAlice, "Alice again", "10.0.0.2");
	EXPECT_FALSE(duplicate.ok());
	EXPECT_EQ(Conn(kAlice).CloseReason(), "Player already connected");

	Join(room, kBob, "Bob");
	const AdmissionResult full = Connect(room, kCara, "Cara");
	EXPECT_EQ(full.error, ErrorCode::CapacityExceeded);
	EXPECT_EQ(Conn(kCara).CloseReason(), "Room is full");
	EXPECT_EQ(server_->Rooms().Lookup(room)->PlayerCount(), 2u);
}

TEST_F(GameServerTest, RacingJoinsForOneSeatAdmitExactlyOne) {
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");

	for (int round = 0; round < 50; ++round) {
		const int playerId = kBob + round;
		auto first = std::make_shared<FakeConnection>();
		auto second = std::make_shared<FakeConnection>();
		AdmissionResult firstResult;
		AdmissionResult secondResult;

		std::thread racer([&]() {
			firstResult = server_->Admit(ConnectRequest{ room, playerId, "Bob", std::nullopt, std::format("10.1.{}.1", round) }, first);
		});
		secondResult = server_->Admit(ConnectRequest{ room, playerId, "Bob", std::nullopt, std::format("10.1.{}.2", round) }, second);
		racer.join();

		ASSERT_NE(firstResult.ok(), secondResult.ok()) << "round " << round;
		const AdmissionResult& winner = firstResult.ok() ? firstResult : secondResult;
		const auto& loser = firstResult.ok() ? second : first;

		EXPECT_EQ(server_->Hub().Find(room, playerId), winner.context->connection);
		EXPECT_TRUE(winner.context->session->HasPlayer(playerId));
		EXPECT_EQ(loser->CloseReason(), "Player already connected");

		server_->Disconnect(*winner.context);
		EXPECT_FALSE(winner.context->session->HasPlayer(playerId));
		EXPECT_EQ(server_->Hub().Find(room, playerId), nullptr);
	}
	EXPECT_EQ(server_->Rooms().Lookup(room)->PlayerCount(), 1u);
}

TEST_F(GameServerTest, RacingHostConnectionsClaimTheHostSeatOnce) {
	const std::string room = CreateAliceRoom();
	auto first = std::make_shared<FakeConnection>();
	auto second = std::make_shared<FakeConnection>();
	AdmissionResult firstResult;
	AdmissionResult secondResult;

	std::thread racer([&]() {
		firstResult = server_->Admit(ConnectRequest{ room, kAlice, "Alice", std::nullopt, "10.0.0.1" }, first);
	});
	secondResult = server_->Admit(ConnectRequest{ room, kAlice, "Alice", std::nullopt, "10.0.0.2" }, second);
	racer.join();

	ASSERT_NE(firstResult.ok(), secondResult.ok());
	const AdmissionResult& winner = firstResult.ok() ? firstResult : secondResult;
	EXPECT_EQ(server_->Hub().Find(room, kAlice), winner.context->connection);
	EXPECT_EQ(server_->Rooms().Lookup(room)->PlayerCount(), 1u);
	EXPECT_EQ(server_->Hub().RoomConnectionCount(room), 1u);
}

TEST_F(GameServerTest, StaleDisconnectKeepsRejoinedSeat) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext kicked = Join(room, kCara, "Cara", "10.0.0.3");

	Send(alice, R"({"action":"kick_player","player_id":10003})");
	ASSERT_FALSE(alice.session->HasPlayer(kCara));

	const ClientContext rejoined = Join(room, kCara, "Cara", "10.0.0.4");
	server_->Disconnect(kicked);

	EXPECT_TRUE(alice.session->HasPlayer(kCara));
	EXPECT_EQ(server_->Hub().Find(room, kCara), rejoined.connection);
}

TEST_F(GameServerTest, JoinBroadcastsState) {
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");
	Conn(kAlice).ClearSent();

	Join(room, kBob, "<i>Bob</i>");
	const auto states = Conn(kAlice).MessagesWithAction("update_state");
	ASSERT_EQ(states.size(), 1u);
	const Json::Value& players = states[0]["state"]["players"];
	ASSERT_EQ(players.size(), 2u);
	EXPECT_EQ(players[1]["id"].asInt(), kBob);
	EXPECT_EQ(players[1]["name"].asString(), "Bob");
	EXPECT_EQ(states[0]["state"]["host_id"].asInt(), kAlice);
	EXPECT_TRUE(states[0]["state"]["current_song"].isNull());
}

TEST_F(GameServerTest, BadMessagesAreAnsweredOnlyToSender) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Conn(kAlice).ClearSent();
	Conn(kBob).ClearSent();

	Send(bob, std::string(2000, ' '));
	Send(bob, "{oops");
	Send(bob, R"({"action":"dance"})");
	Send(bob, R"({"action":7})");

	const auto errors = Conn(kBob).MessagesWithAction("error");
	ASSERT_EQ(errors.size(), 2u);
	EXPECT_EQ(errors[0]["message"].asString(), "Message too large");
	EXPECT_EQ(errors[1]["message"].asString(), "Invalid message format");
	EXPECT_EQ(Conn(kBob).SentCount(), 2u);
	EXPECT_EQ(Conn(kAlice).SentCount(), 0u);
	EXPECT_FALSE(Conn(kBob).Closed());
}

TEST_F(GameServerTest, TraceLogShowsCleanedActionName) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");

	std::mutex linesMutex;
	std::vector<std::string> lines;
	InitLogger("rooms", [&](std::string_view line) {
		std::lock_guard lock(linesMutex);
		lines.emplace_back(line);
	}, nullptr);
	SetLogLevel(LogLevel::Trace);

	Send(alice, R"({"action":"<i>x</i>)" + std::string(40, 'z') + R"("})");

	InitLogger("mmq", nullptr, nullptr);
	SetLogLevel(LogLevel::Warn);

	std::lock_guard lock(linesMutex);
	bool found = false;
	for (const std::string& line : lines) {
		if (line.find("action '") == std::string::npos)
			continue;
		found = true;
		EXPECT_NE(line.find("action 'x" + std::string(19, 'z') + "' from player 10001"), std::string::npos) << line;
		EXPECT_EQ(line.find('<'), std::string::npos) << line;
	}
	EXPECT_TRUE(found);
}

TEST_F(GameServerTest, SetReadyAcceptsBooleansOnly) {
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Conn(kAlice).ClearSent();

	Send(bob, R"({"action":"set_ready","is_ready":"yes"})");
	EXPECT_EQ(Conn(kAlice).SentCount(), 0u);

	Send(bob, R"({"action":"set_ready","is_ready":true})");
	const auto states = Conn(kAlice).MessagesWithAction("update_state");
	ASSERT_EQ(states.size(), 1u);
	EXPECT_TRUE(states[0]["state"]["players"][1]["is_ready"].asBool());
}

TEST_F(GameServerTest, SettingsAreHostOnlyAndLobbyOnly) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Conn(kAlice).ClearSent();
	Conn(kBob).ClearSent();

	Send(bob, R"({"action":"update_settings","settings":{"total_rounds":6}})");
	EXPECT_EQ(Conn(kBob).SentCount(), 0u);
	EXPECT_EQ(alice.session->Settings().totalRounds, 10);

	Send(alice, R"({"action":"update_settings","settings":{"total_rounds":99}})");
	ASSERT_EQ(Conn(kAlice).MessagesWithAction("error").size(), 1u);
	EXPECT_EQ(Conn(kAlice).MessagesWithAction("error")[0]["message"].asString(), "Invalid settings format");
	EXPECT_EQ(Conn(kBob).SentCount(), 0u);

	Send(alice, R"({"action":"update_settings","settings":{"total_rounds":6,"music_duration":20,"game_type":"speed"}})");
	const auto updated = Conn(kBob).MessagesWithAction("settings_updated");
	ASSERT_EQ(updated.size(), 1u);
	EXPECT_EQ(updated[0]["settings"]["total_rounds"].asInt(), 6);
	EXPECT_EQ(updated[0]["settings"]["music_duration"].asInt(), 20);
	EXPECT_EQ(updated[0]["settings"]["game_type"].asString(), "speed");
	EXPECT_EQ(Conn(kBob).MessagesWithAction("update_state").size(), 1u);

	alice.session->StartGame();
	Conn(kAlice).ClearSent();
	Send(alice, R"({"action":"update_settings","settings":{"total_rounds":7}})");
	ASSERT_EQ(Conn(kAlice).MessagesWithAction("error").size(), 1u);
	EXPECT_EQ(Conn(kAlice).MessagesWithAction("error")[0]["message"].asString(), "Cannot change settings during game");
}

TEST_F(GameServerTest, HostCanKickPlayers) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Join(room, kCara, "Cara");

	Send(bob, R"({"action":"kick_player","player_id":10003})");
	EXPECT_FALSE(Conn(kCara).Closed());
	EXPECT_TRUE(alice.session->HasPlayer(kCara));

	Conn(kAlice).ClearSent();
	Send(alice, R"({"action":"kick_player","player_id":10003})");
	EXPECT_TRUE(Conn(kCara).Closed());
	EXPECT_EQ(Conn(kCara).CloseCode(), kCloseNormal);
	EXPECT_EQ(Conn(kCara).CloseReason(), "Kicked by host");
	EXPECT_FALSE(alice.session->HasPlayer(kCara));
	EXPECT_EQ(server_->Hub().Find(room, kCara), nullptr);

	const auto states = Conn(kAlice).MessagesWithAction("update_state");
	ASSERT_EQ(states.size(), 1u);
	EXPECT_EQ(states[0]["state"]["players"].size(), 2u);
}

TEST_F(GameServerTest, ChatIsSanitizedAndBroadcast) {
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Conn(kAlice).ClearSent();

	Send(bob, R"({"action":"chat","text":"<b></b>"})");
	Send(bob, R"({"action":"chat","text":42})");
	EXPECT_EQ(Conn(kAlice).SentCount(), 0u);

	Send(bob, R"({"action":"chat","text":"  <em>hello</em> onload=x "})");
	const auto chat = Conn(kAlice).MessagesWithAction("chat_message");
	ASSERT_EQ(chat.size(), 1u);
	EXPECT_EQ(chat[0]["player_name"].asString(), "Bob");
	EXPECT_EQ(chat[0]["text"].asString(), "hello x");
}

TEST_F(GameServerTest, SuggestionsAreUnicastAndBounded) {
	const std::string room = CreateAliceRoom();
	Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");
	Conn(kAlice).ClearSent();
	Conn(kBob).ClearSent();

	Send(bob, R"({"action":"get_suggestions","query":"dil"})");
	Send(bob, R"({"action":"get_suggestions","query":"d"})");
	Send(bob, R"({"action":"get_suggestions","query":")" + std::string(51, 'a') + R"("})");

	const auto replies = Conn(kBob).MessagesWithAction("suggestions");
	ASSERT_EQ(replies.size(), 3u);
	ASSERT_EQ(replies[0]["suggestions"].size(), 1u);
	EXPECT_EQ(replies[0]["suggestions"][0].asString(), "Dilwale Dulhania Le Jayenge");
	EXPECT_EQ(replies[1]["suggestions"].size(), 0u);
	EXPECT_EQ(replies[2]["suggestions"].size(), 0u);
	EXPECT_EQ(Conn(kAlice).SentCount(), 0u);
}

TEST_F(GameServerTest, FullGameThroughRoomChannel) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob");

	std::atomic<int> waits{ 0 };
	onWait_ = [&](std::chrono::milliseconds) {
		if (waits++ != 0)
			return;
		// a second start while the game runs is ignored
		Send(alice, R"({"action":"start_game"})");
		Send(bob, R"({"action":"guess","text":"Aashiqui 2"})");
		Send(bob, R"({"action":"guess","text":"Aashiqui 2"})");
		Send(alice, R"({"action":"guess","text":"Sholay"})");
	};

	Send(alice, R"({"action":"update_settings","settings":{"total_rounds":5,"music_duration":15}})");
	Send(bob, R"({"action":"start_game"})");
	EXPECT_FALSE(alice.session->IsGameActive());

	Send(alice, R"({"action":"start_game"})");
	ASSERT_TRUE(test::WaitUntil([&]() { return !alice.session->HasTask(); }));

	EXPECT_EQ(waits.load(), 10);
	EXPECT_EQ(alice.session->Phase(), GamePhase::Ended);
	EXPECT_EQ(alice.session->CurrentRound(), 5);

	const auto bobResults = Conn(kBob).MessagesWithAction("guess_result");
	ASSERT_EQ(bobResults.size(), 1u);
	EXPECT_TRUE(bobResults[0]["correct"].asBool());
	EXPECT_EQ(bobResults[0]["points_earned"].asInt(), 10);

	const auto aliceResults = Conn(kAlice).MessagesWithAction("guess_result");
	ASSERT_EQ(aliceResults.size(), 1u);
	EXPECT_FALSE(aliceResults[0]["correct"].asBool());

	EXPECT_EQ(Conn(kAlice).Notifications("round_start").size(), 5u);
	const auto winner = Conn(kAlice).Notifications("game_over");
	ASSERT_EQ(winner.size(), 1u);
	EXPECT_EQ(winner[0]["message"].asString(), "🏆 Game Over! Winner: Bob with 10 points!");

	// a finished game can be restarted from the lobby
	waits = 1;
	Send(alice, R"({"action":"start_game"})");
	ASSERT_TRUE(test::WaitUntil([&]() { return !alice.session->HasTask(); }));
	EXPECT_EQ(Conn(kAlice).Notifications("game_over").size(), 2u);
	EXPECT_EQ(alice.session->Scores().at(kBob), 0);
}

TEST_F(GameServerTest, LastPlayerOutClosesRoom) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");
	const ClientContext bob = Join(room, kBob, "Bob", "10.0.0.2");
	Conn(kAlice).ClearSent();

	server_->Disconnect(bob);
	EXPECT_FALSE(alice.session->HasPlayer(kBob));
	EXPECT_EQ(server_->Hub().Find(room, kBob), nullptr);
	const auto states = Conn(kAlice).MessagesWithAction("update_state");
	ASSERT_EQ(states.size(), 1u);
	EXPECT_EQ(states[0]["state"]["players"].size(), 1u);

	server_->Disconnect(alice);
	EXPECT_EQ(server_->Rooms().Lookup(room), nullptr);
	EXPECT_EQ(server_->Hub().RoomConnectionCount(room), 0u);
	EXPECT_EQ(server_->HealthDocument()["active_rooms"].asInt(), 0);
}

TEST_F(GameServerTest, LastPlayerOutCancelsRunningGame) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");

	std::atomic<bool> parked{ false };
	onWait_ = [&](std::chrono::milliseconds) {
		parked = true;
		test::WaitUntil([&]() { return !alice.session->IsGameActive(); });
	};

	Send(alice, R"({"action":"start_game"})");
	ASSERT_TRUE(test::WaitUntil([&]() { return parked.load(); }));

	server_->Disconnect(alice);
	EXPECT_EQ(server_->Rooms().Lookup(room), nullptr);
	ASSERT_TRUE(test::WaitUntil([&]() { return !alice.session->HasTask(); }));
	EXPECT_EQ(alice.session->CurrentRound(), 1);
}

TEST_F(GameServerTest, ShutdownStopsRunningSchedulers) {
	const std::string room = CreateAliceRoom();
	const ClientContext alice = Join(room, kAlice, "Alice");

	std::atomic<bool> parked{ false };
	onWait_ = [&](std::chrono::milliseconds) {
		parked = true;
		test::WaitUntil([&]() { return !alice.session->IsGameActive(); });
	};

	Send(alice, R"({"action":"start_game"})");
	ASSERT_TRUE(test::WaitUntil([&]() { return parked.load(); }));

	server_->Shutdown();
	EXPECT_FALSE(alice.session->HasTask());
	EXPECT_EQ(alice.session->Phase(), GamePhase::Ended);
	EXPECT_EQ(server_->HealthDocument()["status"].asString(), "initializing");
	EXPECT_EQ(Conn(kAlice).MessagesWithAction("game_over").size(), 1u);
}
