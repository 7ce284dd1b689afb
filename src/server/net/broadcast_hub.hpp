/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

broadcast_hub.hpp - Room to connection fan-out.*/

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <json/json.h>

namespace mmq {

/*
One live client connection as seen by the room services. Implementations wrap
the transport; Send throws on failure and must tolerate being called from more
than one thread.
*/
class Connection {
public:
	virtual ~Connection() = default;

	virtual void Send(const std::string& payload) = 0;
	virtual void Close(int code, std::string_view reason) = 0;
};

class BroadcastHub {
public:
	using MessageProducer = std::function<Json::Value()>;

	void Register(const std::string& roomId, int playerId, std::shared_ptr<Connection> connection);
	bool TryRegister(const std::string& roomId, int playerId, std::shared_ptr<Connection> connection);
	void Unregister(const std::string& roomId, int playerId);
	bool Unregister(const std::string& roomId, int playerId, const Connection* expected);
	void RemoveRoom(const std::string& roomId);

	size_t Broadcast(const std::string& roomId, const Json::Value& message);
	size_t BroadcastProduced(const std::string& roomId, const MessageProducer& produce);
	bool Unicast(Connection& connection, const Json::Value& message);

	std::shared_ptr<Connection> Find(const std::string& roomId, int playerId) const;
	size_t RoomConnectionCount(const std::string& roomId) const;
	size_t ConnectionCount() const;

private:
	struct RoomChannel {
		// Serialises deliveries so a room's events reach clients in order.
		std::mutex deliveryMutex;
		std::map<int, std::shared_ptr<Connection>> members;
	};

	std::shared_ptr<RoomChannel> FindChannel(const std::string& roomId) const;
	size_t DeliverLocked(RoomChannel& channel, const std::string& roomId, const std::string& payload);

	mutable std::mutex mutex_;
	std::unordered_map<std::string, std::shared_ptr<RoomChannel>> rooms_;
};

} // namespace mmq
