/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

round_scheduler.cpp implementation. Each round runs clue lookup, guessing
window, reveal and reveal interval in that order. The loop stops early when the
session is deactivated or a round body throws; a failed round is never
retried. However the loop ends, the game is closed out and the final scores
are announced.*/

#include "round_scheduler.hpp"

#include "../net/broadcast_hub.hpp"
#include "../protocol/messages.hpp"
#include "../providers/clue_resolver.hpp"
#include "../security/security_gate.hpp"
#include "../server_errors.hpp"
#include "../../shared/logger.hpp"

#include <cmath>
#include <exception>
#include <format>
#include <utility>

namespace mmq {
namespace {

std::string JoinNames(const std::vector<std::string>& parts) {
	std::string joined;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i)
			joined += ", ";
		joined += parts[i];
	}
	return joined;
}

// Seconds rounded to two places, keeping at least one decimal: 3.0, 3.1, 3.14.
std::string FormatElapsed(double seconds) {
	std::string text = std::format("{:.2f}", std::round(seconds * 100.0) / 100.0);
	while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.')
		text.pop_back();
	return text;
}

} // namespace

bool SteadyRoundTimer::WaitFor(std::chrono::milliseconds duration) {
	std::unique_lock lock(mutex_);
	wake_.wait_for(lock, duration, [this] { return cancelled_; });
	return !cancelled_;
}

void SteadyRoundTimer::Cancel() {
	{
		std::lock_guard lock(mutex_);
		cancelled_ = true;
	}
	wake_.notify_all();
}

RoundScheduler::RoundScheduler(std::shared_ptr<Session> session, std::shared_ptr<BroadcastHub> hub,
	std::shared_ptr<ClueSource> clues, std::chrono::milliseconds revealInterval, std::unique_ptr<RoundTimer> timer)
	: session_(std::move(session)),
	  hub_(std::move(hub)),
	  clues_(std::move(clues)),
	  roomId_(session_->RoomId()),
	  revealInterval_(revealInterval),
	  timer_(timer ? std::move(timer) : std::make_unique<SteadyRoundTimer>()) {}

/*
=============
RoundScheduler::~RoundScheduler

The worker thread holds a reference to the scheduler, so the last reference
may be released on that thread; it cannot join itself and detaches instead.
=============
*/
RoundScheduler::~RoundScheduler() {
	if (!thread_.joinable())
		return;

	if (thread_.get_id() == std::this_thread::get_id())
		thread_.detach();
	else
		thread_.join();
}

void RoundScheduler::Start() {
	std::lock_guard lock(threadMutex_);
	if (thread_.joinable())
		return;

	thread_ = std::thread([self = shared_from_this()]() { self->Run(); });
}

void RoundScheduler::Join() {
	std::lock_guard lock(threadMutex_);
	if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
		thread_.join();
}

/*
=============
RoundScheduler::Cancel

Deactivates the session and wakes any pending wait. Safe to call repeatedly.
=============
*/
void RoundScheduler::Cancel() {
	if (cancelled_.exchange(true))
		return;

	Logf(LogLevel::Debug, "{}: cancelling scheduler for room {}", __FUNCTION__, roomId_);
	session_->Deactivate();
	timer_->Cancel();
}

/*
=============
RoundScheduler::Run

Plays rounds until the configured count is reached or the loop exits early,
then closes out the game. Blocks the calling thread.
=============
*/
void RoundScheduler::Run() {
	const GameSettings settings = session_->Settings();
	Logf(LogLevel::Info, "{}: room {} starting {} rounds ({})", __FUNCTION__, roomId_, settings.totalRounds, GameModeName(settings.mode));

	while (!cancelled_ && session_->IsGameActive() && session_->CurrentRound() < settings.totalRounds) {
		try {
			if (!PlayRound(settings))
				break;
		}
		catch (const std::exception& e) {
			Logf(LogLevel::Error, "{}: room {} round loop stopped [{}]: {}", __FUNCTION__, roomId_,
				ErrorCodeName(ErrorCode::FatalLoopError), TruncateUtf8(e.what(), 100));
			break;
		}
	}

	Finish();
}

/*
=============
RoundScheduler::PlayRound

Runs one full round. Returns false when the loop should stop.
=============
*/
bool RoundScheduler::PlayRound(const GameSettings& settings) {
	const Clue clue = clues_->NextClue();
	if (cancelled_ || !session_->IsGameActive())
		return false;

	if (!session_->StartRound(clue))
		return false;

	const int round = session_->CurrentRound();
	hub_->Broadcast(roomId_, messages::Notification("round_start",
		std::format("🎵 Round {}/{} starting! Listen carefully...", round, settings.totalRounds)));
	hub_->Broadcast(roomId_, messages::RoundStart());
	BroadcastState();

	if (!timer_->WaitFor(std::chrono::seconds(settings.musicDuration)) || !session_->IsGameActive())
		return false;

	session_->StartReveal();
	hub_->Broadcast(roomId_, messages::RoundEnd(clue, session_->Scores()));
	BroadcastState();
	hub_->Broadcast(roomId_, messages::Notification("round_end",
		std::format("⏰ Time's up! The correct answer was: {}", clue.answer.empty() ? "Unknown" : clue.answer)));

	AnnounceRoundResults(session_->SummarizeRound(), settings.mode);

	return timer_->WaitFor(revealInterval_);
}

/*
=============
RoundScheduler::AnnounceRoundResults

Emits the correct-guess and wrong-guess notifications for whichever classes
are non-empty, or the no-guess notification when nobody guessed.
=============
*/
void RoundScheduler::AnnounceRoundResults(const RoundSummary& summary, GameMode mode) {
	if (!summary.correct.empty()) {
		std::vector<std::string> details;
		Json::Value names(Json::arrayValue);
		for (const CorrectGuesser& guesser : summary.correct) {
			if (mode == GameMode::Speed && guesser.elapsedSeconds && *guesser.elapsedSeconds > 0.0) {
				details.push_back(std::format("{} (+{} pts, {}s)", guesser.name, guesser.points, FormatElapsed(*guesser.elapsedSeconds)));
			}
			else {
				details.push_back(std::format("{} (+{} pts)", guesser.name, guesser.points));
			}
			names.append(guesser.name);
		}

		Json::Value message = messages::Notification("correct_guesses", "✅ Correct: " + JoinNames(details));
		message["correct_players"] = std::move(names);
		hub_->Broadcast(roomId_, message);
	}

	if (!summary.incorrect.empty())
		hub_->Broadcast(roomId_, messages::Notification("wrong_guesses", "❌ Wrong: " + JoinNames(summary.incorrect)));

	if (summary.correct.empty() && summary.incorrect.empty())
		hub_->Broadcast(roomId_, messages::Notification("no_guesses", "🤷 Nobody made a guess this round!"));
}

void RoundScheduler::BroadcastState() {
	hub_->BroadcastProduced(roomId_, [this]() { return messages::UpdateState(session_->Snapshot()); });
}

/*
=============
RoundScheduler::Finish

Marks the game over, announces the winner when any score was recorded and
publishes the final leaderboard, then releases the session.
=============
*/
void RoundScheduler::Finish() {
	session_->Deactivate();
	session_->EndRound();

	if (const auto winner = session_->SelectWinner()) {
		hub_->Broadcast(roomId_, messages::Notification("game_over",
			std::format("🏆 Game Over! Winner: {} with {} points!", winner->name, winner->score)));
	}

	hub_->Broadcast(roomId_, messages::GameOver(session_->Scores()));
	BroadcastState();

	finished_ = true;
	Logf(LogLevel::Info, "{}: game in room {} has ended", __FUNCTION__, roomId_);
	session_->DetachTask(this);
}

} // namespace mmq
