/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

round_scheduler.hpp - Drives one room through its configured rounds.*/

#pragma once

#include "session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mmq {

class BroadcastHub;
class ClueSource;

// Timed suspension used between phases. WaitFor returns false once cancelled.
class RoundTimer {
public:
	virtual ~RoundTimer() = default;

	virtual bool WaitFor(std::chrono::milliseconds duration) = 0;
	virtual void Cancel() = 0;
};

class SteadyRoundTimer : public RoundTimer {
public:
	bool WaitFor(std::chrono::milliseconds duration) override;
	void Cancel() override;

private:
	std::mutex mutex_;
	std::condition_variable wake_;
	bool cancelled_ = false;
};

/*
One scheduler runs per active room, on its own thread once Start() is called.
It attaches itself to the session for the length of the game and detaches on
exit, so the session never has more than one live scheduler. Cancel() is
idempotent and may be called from any thread.
*/
class RoundScheduler : public RoundTask, public std::enable_shared_from_this<RoundScheduler> {
public:
	RoundScheduler(std::shared_ptr<Session> session, std::shared_ptr<BroadcastHub> hub, std::shared_ptr<ClueSource> clues,
		std::chrono::milliseconds revealInterval, std::unique_ptr<RoundTimer> timer = nullptr);
	~RoundScheduler() override;

	RoundScheduler(const RoundScheduler&) = delete;
	RoundScheduler& operator=(const RoundScheduler&) = delete;

	void Start();
	void Run();
	void Cancel() override;
	void Join();

	bool IsCancelled() const { return cancelled_.load(); }
	bool IsFinished() const { return finished_.load(); }

private:
	bool PlayRound(const GameSettings& settings);
	void AnnounceRoundResults(const RoundSummary& summary, GameMode mode);
	void BroadcastState();
	void Finish();

	std::shared_ptr<Session> session_;
	std::shared_ptr<BroadcastHub> hub_;
	std::shared_ptr<ClueSource> clues_;
	const std::string roomId_;
	const std::chrono::milliseconds revealInterval_;
	std::unique_ptr<RoundTimer> timer_;

	std::atomic<bool> cancelled_{ false };
	std::atomic<bool> finished_{ false };
	std::mutex threadMutex_;
	std::thread thread_;
};

} // namespace mmq
