/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

broadcast_hub.cpp implementation.*/

#include "broadcast_hub.hpp"

#include "../protocol/messages.hpp"
#include "../../shared/logger.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace mmq {

void BroadcastHub::Register(const std::string& roomId, int playerId, std::shared_ptr<Connection> connection) {
	std::lock_guard lock(mutex_);
	auto& channel = rooms_[roomId];
	if (!channel)
		channel = std::make_shared<RoomChannel>();
	channel->members[playerId] = std::move(connection);
}

/*
=============
BroadcastHub::TryRegister

Registers the connection only when no other connection holds the player's
slot in the room. This is the claim on a seat.
=============
*/
bool BroadcastHub::TryRegister(const std::string& roomId, int playerId, std::shared_ptr<Connection> connection) {
	std::lock_guard lock(mutex_);
	auto& channel = rooms_[roomId];
	if (!channel)
		channel = std::make_shared<RoomChannel>();

	return channel->members.try_emplace(playerId, std::move(connection)).second;
}

void BroadcastHub::Unregister(const std::string& roomId, int playerId) {
	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		return;

	it->second->members.erase(playerId);
}

/*
=============
BroadcastHub::Unregister

Removes the player's connection only if it is still `expected`, so a stale
disconnect cannot evict a newer connection registered under the same id.
Returns true when it removed one.
=============
*/
bool BroadcastHub::Unregister(const std::string& roomId, int playerId, const Connection* expected) {
	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		return false;

	auto member = it->second->members.find(playerId);
	if (member == it->second->members.end() || member->second.get() != expected)
		return false;

	it->second->members.erase(member);
	return true;
}

void BroadcastHub::RemoveRoom(const std::string& roomId) {
	std::lock_guard lock(mutex_);
	rooms_.erase(roomId);
}

/*
=============
BroadcastHub::Broadcast

Delivers `message` to every connection registered in the room and returns the
number of successful sends. A connection whose send throws is logged and
deregistered; delivery to the remaining connections carries on.
=============
*/
size_t BroadcastHub::Broadcast(const std::string& roomId, const Json::Value& message) {
	const std::shared_ptr<RoomChannel> channel = FindChannel(roomId);
	if (!channel)
		return 0;

	const std::string payload = messages::Serialize(message);

	std::lock_guard delivery(channel->deliveryMutex);
	return DeliverLocked(*channel, roomId, payload);
}

/*
=============
BroadcastHub::BroadcastProduced

Like Broadcast, but builds the message inside the room's delivery order. State
read by `produce` is therefore never older than anything already delivered to
the room.
=============
*/
size_t BroadcastHub::BroadcastProduced(const std::string& roomId, const MessageProducer& produce) {
	const std::shared_ptr<RoomChannel> channel = FindChannel(roomId);
	if (!channel)
		return 0;

	std::lock_guard delivery(channel->deliveryMutex);
	return DeliverLocked(*channel, roomId, messages::Serialize(produce()));
}

size_t BroadcastHub::DeliverLocked(RoomChannel& channel, const std::string& roomId, const std::string& payload) {
	std::vector<std::pair<int, std::shared_ptr<Connection>>> targets;
	{
		std::lock_guard lock(mutex_);
		targets.assign(channel.members.begin(), channel.members.end());
	}

	size_t delivered = 0;
	std::vector<std::pair<int, const Connection*>> failed;
	for (const auto& [playerId, connection] : targets) {
		try {
			connection->Send(payload);
			++delivered;
		}
		catch (const std::exception& e) {
			Logf(LogLevel::Warn, "{}: send to player {} in room {} failed: {}", __FUNCTION__, playerId, roomId, e.what());
			failed.emplace_back(playerId, connection.get());
		}
	}

	if (!failed.empty()) {
		std::lock_guard lock(mutex_);
		for (const auto& [playerId, connection] : failed) {
			auto member = channel.members.find(playerId);
			if (member != channel.members.end() && member->second.get() == connection)
				channel.members.erase(member);
		}
	}

	return delivered;
}

/*
=============
BroadcastHub::Unicast

Sends a direct reply. Returns false when the send fails; the caller owns the
connection and decides whether to drop it.
=============
*/
bool BroadcastHub::Unicast(Connection& connection, const Json::Value& message) {
	try {
		connection.Send(messages::Serialize(message));
		return true;
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Warn, "{}: direct send failed: {}", __FUNCTION__, e.what());
		return false;
	}
}

std::shared_ptr<Connection> BroadcastHub::Find(const std::string& roomId, int playerId) const {
	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		return nullptr;

	auto member = it->second->members.find(playerId);
	return member == it->second->members.end() ? nullptr : member->second;
}

size_t BroadcastHub::RoomConnectionCount(const std::string& roomId) const {
	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	return it == rooms_.end() ? 0 : it->second->members.size();
}

size_t BroadcastHub::ConnectionCount() const {
	std::lock_guard lock(mutex_);
	size_t total = 0;
	for (const auto& [roomId, channel] : rooms_)
		total += channel->members.size();
	return total;
}

std::shared_ptr<BroadcastHub::RoomChannel> BroadcastHub::FindChannel(const std::string& roomId) const {
	std::lock_guard lock(mutex_);
	auto it = rooms_.find(roomId);
	return it == rooms_.end() ? nullptr : it->second;
}

} // namespace mmq
