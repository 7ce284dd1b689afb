/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

session.hpp - Per-room game state machine.

Every public member locks the session's mutex, so each call is atomic with
respect to connection handlers and the room's round scheduler running on
other threads. Callers never hold the lock across a broadcast; they take a
Snapshot() and fan that out instead.*/

#pragma once

#include "clue.hpp"
#include "../../shared/clock.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mmq {

struct ServerConfig;

enum class GamePhase {
	Lobby,
	RoundActive,
	Reveal,
	Ended
};

enum class GameMode {
	Regular,
	Speed
};

enum class GuessOutcome {
	Correct,
	Incorrect,
	Rejected
};

const char* GamePhaseName(GamePhase phase);
const char* GameModeName(GameMode mode);
std::optional<GameMode> ParseGameMode(std::string_view value);

inline constexpr int kRegularCorrectPoints = 10;
inline constexpr int kSpeedMaxPoints = 20;
inline constexpr int kSpeedMinPoints = 5;

// Points for a correct guess made `elapsedSeconds` after the round opened.
int ScoreCorrectGuess(GameMode mode, double elapsedSeconds);

struct Player {
	int id = 0;
	std::string name;
	bool ready = false;
};

struct GameSettings {
	int totalRounds = 10;
	int musicDuration = 30;
	GameMode mode = GameMode::Regular;
};

// Limits a session enforces, lifted from the server configuration.
struct SessionRules {
	size_t maxPlayers = 10;
	int minRounds = 5;
	int maxRounds = 20;
	int minMusicDuration = 15;
	int maxMusicDuration = 60;
	size_t maxNameLength = 50;
	size_t maxTextInputLength = 100;
	GameSettings defaults;
};

SessionRules SessionRulesFromConfig(const ServerConfig& config);
bool ValidateGameSettings(const GameSettings& settings, const SessionRules& rules);

struct GuessResult {
	GuessOutcome outcome = GuessOutcome::Rejected;
	int pointsEarned = 0;
};

struct GuessRecord {
	bool correct = false;
	int points = 0;
	double elapsedSeconds = 0.0;
};

struct CorrectGuesser {
	int playerId = 0;
	std::string name;
	int points = 0;
	std::optional<double> elapsedSeconds;
};

struct RoundSummary {
	std::vector<CorrectGuesser> correct;
	std::vector<std::string> incorrect;
};

struct Winner {
	int playerId = 0;
	std::string name;
	int score = 0;
};

struct SessionSnapshot {
	std::string roomId;
	int hostId = 0;
	std::vector<Player> players;
	bool gameActive = false;
	GamePhase phase = GamePhase::Lobby;
	int currentRound = 0;
	GameSettings settings;
	std::optional<ClueSnapshot> clue;
	std::map<int, int> scores;
	bool hasPassword = false;
};

// A running unit of work bound to a session, such as its round scheduler.
class RoundTask {
public:
	virtual ~RoundTask() = default;
	virtual void Cancel() = 0;
};

class Session {
public:
	Session(std::string roomId, int hostId, std::string_view hostName, const std::optional<std::string>& password,
		SessionRules rules, ClockFn clock = SteadyNow);

	Session(const Session&) = delete;
	Session& operator=(const Session&) = delete;

	const std::string& RoomId() const { return roomId_; }
	int HostId() const { return hostId_; }
	bool HasPassword() const { return passwordHash_.has_value(); }
	std::string HostName() const;

	bool VerifyPassword(const std::optional<std::string>& candidate) const;

	bool AddPlayer(int playerId, std::string_view name);
	void RemovePlayer(int playerId);
	bool SetReady(int playerId, bool ready);
	bool HasPlayer(int playerId) const;
	std::optional<std::string> PlayerName(int playerId) const;
	size_t PlayerCount() const;

	bool UpdateSettings(const GameSettings& settings);
	GameSettings Settings() const;

	void StartGame();
	bool StartRound(const Clue& clue);
	bool StartReveal();
	void EndRound();
	void Deactivate();

	GuessResult RecordGuess(int playerId, std::string_view text);

	bool IsGameActive() const;
	GamePhase Phase() const;
	int CurrentRound() const;
	std::map<int, int> Scores() const;
	std::optional<Clue> CurrentClue() const;
	RoundSummary SummarizeRound() const;
	std::optional<Winner> SelectWinner() const;
	SessionSnapshot Snapshot() const;

	SteadyClock::time_point CreatedAt() const { return createdAt_; }
	SteadyClock::time_point LastActivity() const;

	bool AttachTask(std::shared_ptr<RoundTask> task);
	void DetachTask(const RoundTask* task);
	bool HasTask() const;
	void CancelTask();

private:
	void TouchLocked();

	const std::string roomId_;
	const int hostId_;
	std::string hostName_;
	std::optional<std::string> passwordHash_;
	const SessionRules rules_;
	ClockFn clock_;

	mutable std::mutex mutex_;
	std::map<int, Player> players_;
	std::map<int, int> scores_;
	GameSettings settings_;
	GamePhase phase_ = GamePhase::Lobby;
	bool gameActive_ = false;
	int currentRound_ = 0;
	std::optional<Clue> clue_;
	std::set<int> guessedThisRound_;
	std::map<int, GuessRecord> guessRecords_;
	SteadyClock::time_point roundStart_{};
	SteadyClock::time_point createdAt_;
	SteadyClock::time_point lastActivity_;
	std::shared_ptr<RoundTask> task_;
};

} // namespace mmq
