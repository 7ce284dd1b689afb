/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

session.cpp implementation. A session moves through
Lobby -> (RoundActive <-> Reveal)* -> Ended, one guess attempt per player per
round, and never lets a score drop below zero. A new game started from Ended
opens a fresh cycle back in Lobby.*/

#include "session.hpp"

#include "../config/server_config.hpp"
#include "../security/security_gate.hpp"
#include "../../shared/password_hash.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <utility>

namespace mmq {
namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
	if (a.size() != b.size())
		return false;

	for (size_t i = 0; i < a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
			return false;
	}
	return true;
}

} // namespace

const char* GamePhaseName(GamePhase phase) {
	switch (phase) {
	case GamePhase::Lobby:
		return "lobby";
	case GamePhase::RoundActive:
		return "round_active";
	case GamePhase::Reveal:
		return "reveal";
	case GamePhase::Ended:
	default:
		return "ended";
	}
}

const char* GameModeName(GameMode mode) {
	return mode == GameMode::Speed ? "speed" : "regular";
}

std::optional<GameMode> ParseGameMode(std::string_view value) {
	if (value == "regular")
		return GameMode::Regular;
	if (value == "speed")
		return GameMode::Speed;
	return std::nullopt;
}

/*
=============
ScoreCorrectGuess

Regular mode pays a flat amount. Speed mode starts at 20 points and loses one
point per half second, never dropping below 5.
=============
*/
int ScoreCorrectGuess(GameMode mode, double elapsedSeconds) {
	if (mode != GameMode::Speed)
		return kRegularCorrectPoints;

	const double elapsed = std::max(0.0, elapsedSeconds);
	const int decay = static_cast<int>(std::floor(elapsed * 2.0));
	return std::max(kSpeedMinPoints, kSpeedMaxPoints - decay);
}

SessionRules SessionRulesFromConfig(const ServerConfig& config) {
	SessionRules rules;
	rules.maxPlayers = static_cast<size_t>(config.maxPlayersPerRoom);
	rules.minRounds = config.minRounds;
	rules.maxRounds = config.maxRounds;
	rules.minMusicDuration = config.minMusicDuration;
	rules.maxMusicDuration = config.maxMusicDuration;
	rules.maxNameLength = config.maxNameLength;
	rules.maxTextInputLength = config.maxTextInputLength;
	rules.defaults.totalRounds = config.defaultRounds;
	rules.defaults.musicDuration = config.defaultMusicDuration;
	rules.defaults.mode = GameMode::Regular;
	return rules;
}

bool ValidateGameSettings(const GameSettings& settings, const SessionRules& rules) {
	if (settings.totalRounds < rules.minRounds || settings.totalRounds > rules.maxRounds)
		return false;
	if (settings.musicDuration < rules.minMusicDuration || settings.musicDuration > rules.maxMusicDuration)
		return false;
	return settings.mode == GameMode::Regular || settings.mode == GameMode::Speed;
}

Session::Session(std::string roomId, int hostId, std::string_view hostName, const std::optional<std::string>& password,
	SessionRules rules, ClockFn clock)
	: roomId_(std::move(roomId)),
	  hostId_(hostId),
	  hostName_(SanitizeText(hostName, rules.maxNameLength)),
	  rules_(std::move(rules)),
	  clock_(std::move(clock)),
	  settings_(rules_.defaults) {
	// only the digest is kept
	if (password && !password->empty())
		passwordHash_ = Sha256Hex(*password);

	createdAt_ = clock_();
	lastActivity_ = createdAt_;
	players_.emplace(hostId_, Player{ hostId_, hostName_, false });
}

std::string Session::HostName() const {
	std::lock_guard lock(mutex_);
	auto it = players_.find(hostId_);
	return it != players_.end() ? it->second.name : hostName_;
}

/*
=============
Session::VerifyPassword

Always succeeds for an open room. For a protected room the candidate is
hashed and compared against the stored digest in constant time.
=============
*/
bool Session::VerifyPassword(const std::optional<std::string>& candidate) const {
	if (!passwordHash_)
		return true;
	if (!candidate)
		return false;

	return ConstantTimeEquals(*passwordHash_, Sha256Hex(*candidate));
}

bool Session::AddPlayer(int playerId, std::string_view name) {
	std::lock_guard lock(mutex_);
	if (players_.size() >= rules_.maxPlayers || players_.contains(playerId))
		return false;

	players_.emplace(playerId, Player{ playerId, SanitizeText(name, rules_.maxNameLength), false });
	TouchLocked();
	return true;
}

void Session::RemovePlayer(int playerId) {
	std::lock_guard lock(mutex_);
	players_.erase(playerId);
	scores_.erase(playerId);
	TouchLocked();
}

bool Session::SetReady(int playerId, bool ready) {
	std::lock_guard lock(mutex_);
	auto it = players_.find(playerId);
	if (it == players_.end())
		return false;

	it->second.ready = ready;
	TouchLocked();
	return true;
}

bool Session::HasPlayer(int playerId) const {
	std::lock_guard lock(mutex_);
	return players_.contains(playerId);
}

std::optional<std::string> Session::PlayerName(int playerId) const {
	std::lock_guard lock(mutex_);
	auto it = players_.find(playerId);
	if (it == players_.end())
		return std::nullopt;
	return it->second.name;
}

size_t Session::PlayerCount() const {
	std::lock_guard lock(mutex_);
	return players_.size();
}

/*
=============
Session::UpdateSettings

Settings are only mutable in the lobby before a game has been started.
=============
*/
bool Session::UpdateSettings(const GameSettings& settings) {
	std::lock_guard lock(mutex_);
	if (phase_ != GamePhase::Lobby || gameActive_)
		return false;
	if (!ValidateGameSettings(settings, rules_))
		return false;

	settings_ = settings;
	TouchLocked();
	return true;
}

GameSettings Session::Settings() const {
	std::lock_guard lock(mutex_);
	return settings_;
}

/*
=============
Session::StartGame

Resets the round counter, zeroes every current player's score and clears the
per-round tracking. The caller is responsible for refusing a start while a
scheduler task is attached.
=============
*/
void Session::StartGame() {
	std::lock_guard lock(mutex_);
	phase_ = GamePhase::Lobby;
	gameActive_ = true;
	currentRound_ = 0;
	clue_.reset();
	scores_.clear();
	for (const auto& [id, player] : players_)
		scores_[id] = 0;
	guessedThisRound_.clear();
	guessRecords_.clear();
	TouchLocked();
}

/*
=============
Session::StartRound

Opens the next round with `clue`. Refused once the configured round count is
reached, when the game is not active, or from any phase other than Lobby or
Reveal.
=============
*/
bool Session::StartRound(const Clue& clue) {
	std::lock_guard lock(mutex_);
	if (!gameActive_)
		return false;
	if (phase_ != GamePhase::Lobby && phase_ != GamePhase::Reveal)
		return false;
	if (currentRound_ >= settings_.totalRounds)
		return false;

	++currentRound_;
	phase_ = GamePhase::RoundActive;
	clue_ = clue;
	guessedThisRound_.clear();
	guessRecords_.clear();
	roundStart_ = clock_();
	TouchLocked();
	return true;
}

bool Session::StartReveal() {
	std::lock_guard lock(mutex_);
	if (phase_ != GamePhase::RoundActive)
		return false;

	phase_ = GamePhase::Reveal;
	TouchLocked();
	return true;
}

void Session::EndRound() {
	std::lock_guard lock(mutex_);
	phase_ = GamePhase::Ended;
	TouchLocked();
}

void Session::Deactivate() {
	std::lock_guard lock(mutex_);
	gameActive_ = false;
}

/*
=============
Session::RecordGuess

Accepts the first guess a player makes in an open round. The guess is
sanitized, timed from the round start and compared case-insensitively with the
round's answer; any points are added to the player's score in the same step.
=============
*/
GuessResult Session::RecordGuess(int playerId, std::string_view text) {
	std::lock_guard lock(mutex_);
	if (!gameActive_ || phase_ != GamePhase::RoundActive)
		return {};
	if (!players_.contains(playerId) || guessedThisRound_.contains(playerId))
		return {};

	const std::string guess = SanitizeText(text, rules_.maxTextInputLength);
	const double elapsed = std::max(0.0, std::chrono::duration<double>(clock_() - roundStart_).count());

	guessedThisRound_.insert(playerId);
	TouchLocked();

	const std::string_view answer = clue_ ? std::string_view(clue_->answer) : std::string_view();
	const bool correct = !answer.empty() && EqualsIgnoreCase(guess, answer);
	const int points = correct ? ScoreCorrectGuess(settings_.mode, elapsed) : 0;

	scores_.try_emplace(playerId, 0).first->second += points;
	guessRecords_[playerId] = GuessRecord{ correct, points, elapsed };

	return GuessResult{ correct ? GuessOutcome::Correct : GuessOutcome::Incorrect, points };
}

bool Session::IsGameActive() const {
	std::lock_guard lock(mutex_);
	return gameActive_;
}

GamePhase Session::Phase() const {
	std::lock_guard lock(mutex_);
	return phase_;
}

int Session::CurrentRound() const {
	std::lock_guard lock(mutex_);
	return currentRound_;
}

std::map<int, int> Session::Scores() const {
	std::lock_guard lock(mutex_);
	return scores_;
}

std::optional<Clue> Session::CurrentClue() const {
	std::lock_guard lock(mutex_);
	return clue_;
}

/*
=============
Session::SummarizeRound

Splits this round's guessers who are still in the room into correct and
incorrect, ordered by player id. Elapsed time is only reported in speed mode.
=============
*/
RoundSummary Session::SummarizeRound() const {
	std::lock_guard lock(mutex_);
	RoundSummary summary;

	for (const auto& [id, record] : guessRecords_) {
		auto player = players_.find(id);
		if (player == players_.end())
			continue;

		if (!record.correct) {
			summary.incorrect.push_back(player->second.name);
			continue;
		}

		CorrectGuesser guesser{ id, player->second.name, record.points, std::nullopt };
		if (settings_.mode == GameMode::Speed)
			guesser.elapsedSeconds = record.elapsedSeconds;
		summary.correct.push_back(std::move(guesser));
	}

	return summary;
}

/*
=============
Session::SelectWinner

Highest score wins; equal top scores go to the lowest player id.
=============
*/
std::optional<Winner> Session::SelectWinner() const {
	std::lock_guard lock(mutex_);
	if (scores_.empty())
		return std::nullopt;

	auto best = scores_.begin();
	for (auto it = std::next(scores_.begin()); it != scores_.end(); ++it) {
		if (it->second > best->second)
			best = it;
	}

	auto player = players_.find(best->first);
	return Winner{ best->first, player != players_.end() ? player->second.name : "Unknown", best->second };
}

SessionSnapshot Session::Snapshot() const {
	std::lock_guard lock(mutex_);
	SessionSnapshot snapshot;
	snapshot.roomId = roomId_;
	snapshot.hostId = hostId_;
	snapshot.players.reserve(players_.size());
	for (const auto& [id, player] : players_)
		snapshot.players.push_back(player);
	snapshot.gameActive = gameActive_;
	snapshot.phase = phase_;
	snapshot.currentRound = currentRound_;
	snapshot.settings = settings_;
	snapshot.scores = scores_;
	snapshot.hasPassword = passwordHash_.has_value();

	if (clue_ && (phase_ == GamePhase::RoundActive || phase_ == GamePhase::Reveal)) {
		ClueSnapshot clue;
		clue.audioUrl = clue_->audioUrl;
		if (phase_ == GamePhase::Reveal) {
			clue.title = clue_->title;
			clue.answer = clue_->answer;
			clue.imageUrl = clue_->imageUrl;
		}
		snapshot.clue = std::move(clue);
	}

	return snapshot;
}

SteadyClock::time_point Session::LastActivity() const {
	std::lock_guard lock(mutex_);
	return lastActivity_;
}

bool Session::AttachTask(std::shared_ptr<RoundTask> task) {
	std::lock_guard lock(mutex_);
	if (task_ || !task)
		return false;

	task_ = std::move(task);
	return true;
}

void Session::DetachTask(const RoundTask* task) {
	std::lock_guard lock(mutex_);
	if (task_.get() == task)
		task_.reset();
}

bool Session::HasTask() const {
	std::lock_guard lock(mutex_);
	return task_ != nullptr;
}

/*
=============
Session::CancelTask

Cancels the attached task, if any. The task stays attached until it detaches
itself on exit, so a second start cannot race a scheduler that is still
winding down.
=============
*/
void Session::CancelTask() {
	std::shared_ptr<RoundTask> task;
	{
		std::lock_guard lock(mutex_);
		task = task_;
	}

	if (task)
		task->Cancel();
}

void Session::TouchLocked() {
	lastActivity_ = clock_();
}

} // namespace mmq
