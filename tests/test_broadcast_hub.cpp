/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_broadcast_hub.cpp implementation.*/

#include "server/net/broadcast_hub.hpp"
#include "server/protocol/messages.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mmq;
using test::FakeConnection;

namespace {

// Holds every Send until Open is called.
class GatedConnection : public Connection {
public:
	void Send(const std::string& payload) override {
		std::unique_lock lock(mutex_);
		++waiting_;
		changed_.notify_all();
		changed_.wait(lock, [this]() { return open_; });
		--waiting_;
		sent_.push_back(payload);
	}

	void Close(int, std::string_view) override {}

	void Open() {
		std::lock_guard lock(mutex_);
		open_ = true;
		changed_.notify_all();
	}

	bool WaitForBlockedSend() {
		std::unique_lock lock(mutex_);
		return changed_.wait_for(lock, std::chrono::seconds(5), [this]() { return waiting_ > 0; });
	}

	std::vector<std::string> Sent() const {
		std::lock_guard lock(mutex_);
		return sent_;
	}

private:
	mutable std::mutex mutex_;
	std::condition_variable changed_;
	bool open_ = false;
	int waiting_ = 0;
	std::vector<std::string> sent_;
};

} // namespace

class BroadcastHubTest : public ::testing::Test {
protected:
	BroadcastHub hub_;
};

TEST_F(BroadcastHubTest, FailingConnectionIsDroppedWithoutBlockingOthers) {
	auto first = std::make_shared<FakeConnection>();
	auto broken = std::make_shared<FakeConnection>(true);
	auto third = std::make_shared<FakeConnection>();

	hub_.Register("ROOM01", 10001, first);
	hub_.Register("ROOM01", 10002, broken);
	hub_.Register("ROOM01", 10003, third);

	EXPECT_EQ(hub_.Broadcast("ROOM01", messages::RoundStart()), 2u);

	ASSERT_EQ(first->SentCount(), 1u);
	ASSERT_EQ(third->SentCount(), 1u);
	EXPECT_EQ(first->Messages()[0]["action"].asString(), "round_start");
	EXPECT_EQ(hub_.RoomConnectionCount("ROOM01"), 2u);
	EXPECT_EQ(hub_.Find("ROOM01", 10002), nullptr);

	EXPECT_EQ(hub_.Broadcast("ROOM01", messages::RoundStart()), 2u);
	EXPECT_EQ(third->SentCount(), 2u);
}

TEST_F(BroadcastHubTest, BroadcastOnlyReachesItsRoom) {
	auto here = std::make_shared<FakeConnection>();
	auto elsewhere = std::make_shared<FakeConnection>();
	hub_.Register("ROOM01", 10001, here);
	hub_.Register("ROOM02", 10001, elsewhere);

	EXPECT_EQ(hub_.Broadcast("ROOM01", messages::Error("boom")), 1u);
	EXPECT_EQ(here->SentCount(), 1u);
	EXPECT_EQ(elsewhere->SentCount(), 0u);

	EXPECT_EQ(hub_.Broadcast("NOROOM", messages::Error("boom")), 0u);
	EXPECT_EQ(hub_.ConnectionCount(), 2u);
}

TEST_F(BroadcastHubTest, StaleUnregisterKeepsNewerConnection) {
	auto original = std::make_shared<FakeConnection>();
	auto replacement = std::make_shared<FakeConnection>();

	hub_.Register("ROOM01", 10001, original);
	hub_.Register("ROOM01", 10001, replacement);

	hub_.Unregister("ROOM01", 10001, original.get());
	EXPECT_EQ(hub_.Find("ROOM01", 10001), replacement);

	hub_.Unregister("ROOM01", 10001, replacement.get());
	EXPECT_EQ(hub_.Find("ROOM01", 10001), nullptr);
}

TEST_F(BroadcastHubTest, UnregisterAndRemoveRoom) {
	hub_.Register("ROOM01", 10001, std::make_shared<FakeConnection>());
	hub_.Register("ROOM01", 10002, std::make_shared<FakeConnection>());

	hub_.Unregister("ROOM01", 10001);
	EXPECT_EQ(hub_.RoomConnectionCount("ROOM01"), 1u);

	hub_.RemoveRoom("ROOM01");
	EXPECT_EQ(hub_.RoomConnectionCount("ROOM01"), 0u);
	EXPECT_EQ(hub_.ConnectionCount(), 0u);

	// unknown rooms are ignored
	hub_.Unregister("ROOM09", 10001);
	hub_.RemoveRoom("ROOM09");
}

TEST_F(BroadcastHubTest, UnicastReportsFailure) {
	FakeConnection healthy;
	FakeConnection broken(true);

	EXPECT_TRUE(hub_.Unicast(healthy, messages::GuessResultMessage(true, 10)));
	ASSERT_EQ(healthy.SentCount(), 1u);
	EXPECT_TRUE(healthy.Messages()[0]["correct"].asBool());
	EXPECT_EQ(healthy.Messages()[0]["points_earned"].asInt(), 10);

	EXPECT_FALSE(hub_.Unicast(broken, messages::GuessResultMessage(false, 0)));
}

TEST_F(BroadcastHubTest, ConcurrentBroadcastsArriveInOneOrderPerRoom) {
	auto first = std::make_shared<FakeConnection>();
	auto second = std::make_shared<FakeConnection>();
	hub_.Register("ROOM01", 10001, first);
	hub_.Register("ROOM01", 10002, second);

	constexpr int kPerThread = 50;
	std::vector<std::thread> senders;
	for (int sender = 0; sender < 2; ++sender) {
		senders.emplace_back([this, sender]() {
			for (int i = 0; i < kPerThread; ++i)
				hub_.Broadcast("ROOM01", messages::ChatMessage(std::to_string(sender), std::to_string(i)));
		});
	}
	for (std::thread& sender : senders)
		sender.join();

	const auto seenByFirst = first->Messages();
	const auto seenBySecond = second->Messages();
	ASSERT_EQ(seenByFirst.size(), 2u * kPerThread);
	ASSERT_EQ(seenBySecond.size(), seenByFirst.size());
	for (size_t i = 0; i < seenByFirst.size(); ++i)
		EXPECT_EQ(seenByFirst[i], seenBySecond[i]);
}

TEST_F(BroadcastHubTest, ProducedMessageIsBuiltInsideDeliveryOrder) {
	auto gated = std::make_shared<GatedConnection>();
	hub_.Register("ROOM01", 10001, gated);

	std::thread earlier([this]() { hub_.Broadcast("ROOM01", messages::ChatMessage("host", "first")); });
	ASSERT_TRUE(gated->WaitForBlockedSend());

	std::atomic<bool> produced{false};
	std::thread later([this, &produced]() {
		hub_.BroadcastProduced("ROOM01", [&produced]() {
			produced = true;
			return messages::ChatMessage("host", "second");
		});
	});

	// the producer must wait for the in-flight delivery
	std::this_thread::sleep_for(std::chrono::milliseconds(100));
	EXPECT_FALSE(produced.load());

	gated->Open();
	earlier.join();
	later.join();

	EXPECT_TRUE(produced.load());
	const auto sent = gated->Sent();
	ASSERT_EQ(sent.size(), 2u);
	EXPECT_EQ(test::ParseJson(sent[0])["text"].asString(), "first");
	EXPECT_EQ(test::ParseJson(sent[1])["text"].asString(), "second");
}

TEST_F(BroadcastHubTest, TryRegisterKeepsTheExistingConnection) {
	auto first = std::make_shared<FakeConnection>();
	auto second = std::make_shared<FakeConnection>();

	EXPECT_TRUE(hub_.TryRegister("ROOM01", 10001, first));
	EXPECT_FALSE(hub_.TryRegister("ROOM01", 10001, second));
	EXPECT_EQ(hub_.Find("ROOM01", 10001), first);

	EXPECT_FALSE(hub_.Unregister("ROOM01", 10001, second.get()));
	EXPECT_TRUE(hub_.Unregister("ROOM01", 10001, first.get()));
	EXPECT_TRUE(hub_.TryRegister("ROOM01", 10001, second));
}
