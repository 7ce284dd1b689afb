/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

room_registry.hpp - Creates, resolves, lists and evicts rooms.*/

#pragma once

#include "../config/server_config.hpp"
#include "../server_errors.hpp"
#include "../session/session.hpp"
#include "../../shared/clock.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace mmq {

struct RoomSummary {
	std::string roomId;
	std::string hostName;
	size_t playerCount = 0;
	bool hasPassword = false;
};

struct RoomCreateResult {
	std::shared_ptr<Session> session;
	ErrorCode error = ErrorCode::None;
	std::string message;

	bool ok() const { return session != nullptr; }
};

class RoomRegistry {
public:
	using IdGenerator = std::function<std::string()>;
	using EvictionListener = std::function<void(const std::shared_ptr<Session>&)>;

	explicit RoomRegistry(const ServerConfig& config, ClockFn clock = SteadyNow, IdGenerator idGenerator = {});

	RoomCreateResult Create(int hostId, std::string_view hostName, const std::optional<std::string>& password);
	std::shared_ptr<Session> Lookup(std::string_view roomId) const;
	std::vector<RoomSummary> ListPublic();
	size_t Sweep();
	void SetEvictionListener(EvictionListener listener);

	bool Remove(const std::string& roomId);
	bool RemoveIfEmpty(const std::string& roomId);

	size_t Size() const;
	std::vector<std::shared_ptr<Session>> Sessions() const;

private:
	std::string GenerateRoomId();
	void SweepLocked(std::vector<std::shared_ptr<Session>>& evicted);
	void ReleaseEvicted(const std::vector<std::shared_ptr<Session>>& evicted);

	const ServerConfig config_;
	const SessionRules rules_;
	ClockFn clock_;
	IdGenerator idGenerator_;
	EvictionListener evictionListener_;

	mutable std::mutex mutex_;
	std::map<std::string, std::shared_ptr<Session>, std::less<>> rooms_;
	SteadyClock::time_point lastSweep_;
	std::mt19937 random_;
};

} // namespace mmq
