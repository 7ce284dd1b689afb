/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

room_registry.cpp implementation. The registry is shared by every connection
handler and scheduler; all map access happens under its mutex, and removed
sessions have their scheduler cancelled only after the lock is released.*/

#include "room_registry.hpp"

#include "../security/security_gate.hpp"
#include "../../shared/logger.hpp"

#include <format>
#include <utility>

namespace mmq {
namespace {

constexpr std::string_view kRoomIdAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr int kMaxIdAttempts = 64;

} // namespace

RoomRegistry::RoomRegistry(const ServerConfig& config, ClockFn clock, IdGenerator idGenerator)
	: config_(config),
	  rules_(SessionRulesFromConfig(config)),
	  clock_(std::move(clock)),
	  idGenerator_(std::move(idGenerator)),
	  random_(std::random_device{}()) {
	lastSweep_ = clock_();
}

/*
=============
RoomRegistry::Create

Sweeps first, then refuses with CapacityExceeded when the registry is full.
The host becomes the room's first player.
=============
*/
RoomCreateResult RoomRegistry::Create(int hostId, std::string_view hostName, const std::optional<std::string>& password) {
	RoomCreateResult result;
	std::vector<std::shared_ptr<Session>> evicted;

	{
		std::lock_guard lock(mutex_);
		SweepLocked(evicted);

		if (static_cast<int>(rooms_.size()) >= config_.maxRooms) {
			result.error = ErrorCode::CapacityExceeded;
			result.message = std::format("Maximum room limit ({}) reached", config_.maxRooms);
		}
		else {
			std::string roomId;
			for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
				std::string candidate = GenerateRoomId();
				if (ValidateRoomId(candidate) && !rooms_.contains(candidate)) {
					roomId = std::move(candidate);
					break;
				}
			}

			if (roomId.empty()) {
				result.error = ErrorCode::CapacityExceeded;
				result.message = "Unable to allocate a room id";
			}
			else {
				auto session = std::make_shared<Session>(roomId, hostId, hostName, password, rules_, clock_);
				rooms_.emplace(roomId, session);
				result.session = std::move(session);
			}
		}
	}

	ReleaseEvicted(evicted);

	if (result.ok()) {
		Logf(LogLevel::Info, "{}: room {} created for host {} {}", __FUNCTION__, result.session->RoomId(),
			TruncateUtf8(result.session->HostName(), 20), result.session->HasPassword() ? "(private)" : "(public)");
	}
	else {
		Logf(LogLevel::Warn, "{}: refused [{}]: {}", __FUNCTION__, ErrorCodeName(result.error), result.message);
	}

	return result;
}

/*
=============
RoomRegistry::Lookup

Malformed ids are rejected before the room table is consulted.
=============
*/
std::shared_ptr<Session> RoomRegistry::Lookup(std::string_view roomId) const {
	if (!ValidateRoomId(roomId))
		return nullptr;

	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	return it == rooms_.end() ? nullptr : it->second;
}

/*
=============
RoomRegistry::ListPublic

Open rooms without a password and without a game in progress, in room id
order, capped at the configured list limit.
=============
*/
std::vector<RoomSummary> RoomRegistry::ListPublic() {
	std::vector<std::shared_ptr<Session>> evicted;
	std::vector<RoomSummary> summaries;

	{
		std::lock_guard lock(mutex_);
		SweepLocked(evicted);

		for (const auto& [roomId, session] : rooms_) {
			if (summaries.size() >= config_.publicRoomListLimit)
				break;
			if (session->HasPassword() || session->IsGameActive())
				continue;

			summaries.push_back(RoomSummary{ roomId, session->HostName(), session->PlayerCount(), false });
		}
	}

	ReleaseEvicted(evicted);
	return summaries;
}

size_t RoomRegistry::Sweep() {
	std::vector<std::shared_ptr<Session>> evicted;
	{
		std::lock_guard lock(mutex_);
		SweepLocked(evicted);
	}

	ReleaseEvicted(evicted);
	return evicted.size();
}

void RoomRegistry::SetEvictionListener(EvictionListener listener) {
	std::lock_guard lock(mutex_);
	evictionListener_ = std::move(listener);
}

bool RoomRegistry::Remove(const std::string& roomId) {
	std::shared_ptr<Session> removed;
	{
		std::lock_guard lock(mutex_);
		auto it = rooms_.find(roomId);
		if (it == rooms_.end())
			return false;

		removed = std::move(it->second);
		rooms_.erase(it);
	}

	removed->CancelTask();
	return true;
}

/*
=============
RoomRegistry::RemoveIfEmpty

Removes the room only if nobody is left in it, checked and erased under one
lock so a concurrent join cannot land in a room that is being destroyed.
=============
*/
bool RoomRegistry::RemoveIfEmpty(const std::string& roomId) {
	std::shared_ptr<Session> removed;
	{
		std::lock_guard lock(mutex_);
		auto it = rooms_.find(roomId);
		if (it == rooms_.end() || it->second->PlayerCount() != 0)
			return false;

		removed = std::move(it->second);
		rooms_.erase(it);
	}

	Logf(LogLevel::Info, "{}: room {} is empty, closing", __FUNCTION__, roomId);
	removed->CancelTask();
	return true;
}

size_t RoomRegistry::Size() const {
	std::lock_guard lock(mutex_);
	return rooms_.size();
}

std::vector<std::shared_ptr<Session>> RoomRegistry::Sessions() const {
	std::lock_guard lock(mutex_);
	std::vector<std::shared_ptr<Session>> sessions;
	sessions.reserve(rooms_.size());
	for (const auto& [roomId, session] : rooms_)
		sessions.push_back(session);
	return sessions;
}

std::string RoomRegistry::GenerateRoomId() {
	if (idGenerator_)
		return idGenerator_();

	std::uniform_int_distribution<size_t> pick(0, kRoomIdAlphabet.size() - 1);
	std::string id;
	id.reserve(kRoomIdLength);
	for (size_t i = 0; i < kRoomIdLength; ++i)
		id.push_back(kRoomIdAlphabet[pick(random_)]);
	return id;
}

/*
=============
RoomRegistry::SweepLocked

No-op until the cleanup interval has passed since the previous sweep. Evicts
rooms idle for longer than the inactivity timeout unless a game is running in
them.
=============
*/
void RoomRegistry::SweepLocked(std::vector<std::shared_ptr<Session>>& evicted) {
	const auto now = clock_();
	if (now - lastSweep_ < config_.cleanupInterval)
		return;

	lastSweep_ = now;
	const auto cutoff = now - config_.inactiveTimeout;

	for (auto it = rooms_.begin(); it != rooms_.end();) {
		const std::shared_ptr<Session>& session = it->second;
		const GamePhase phase = session->Phase();
		const bool playing = session->IsGameActive() || phase == GamePhase::RoundActive || phase == GamePhase::Reveal;

		if (session->LastActivity() < cutoff && !playing) {
			Logf(LogLevel::Info, "{}: cleaning up inactive room {}", __FUNCTION__, it->first);
			evicted.push_back(session);
			it = rooms_.erase(it);
		}
		else {
			++it;
		}
	}

	if (!evicted.empty())
		Logf(LogLevel::Info, "{}: cleaned up {} inactive rooms", __FUNCTION__, evicted.size());
}

void RoomRegistry::ReleaseEvicted(const std::vector<std::shared_ptr<Session>>& evicted) {
	if (evicted.empty())
		return;

	EvictionListener listener;
	{
		std::lock_guard lock(mutex_);
		listener = evictionListener_;
	}

	for (const auto& session : evicted) {
		session->CancelTask();
		if (listener)
			listener(session);
	}
}

} // namespace mmq
