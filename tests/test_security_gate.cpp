/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_security_gate.cpp implementation.*/

#include "server/config/server_config.hpp"
#include "server/security/security_gate.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace mmq;

TEST(SecurityGateTest, RoomIdsAreSixUppercaseAlphanumerics) {
	EXPECT_TRUE(ValidateRoomId("ABC123"));
	EXPECT_TRUE(ValidateRoomId("ZZZZZZ"));
	EXPECT_TRUE(ValidateRoomId("000000"));

	EXPECT_FALSE(ValidateRoomId("abc123"));
	EXPECT_FALSE(ValidateRoomId("ABC12"));
	EXPECT_FALSE(ValidateRoomId("ABC1234"));
	EXPECT_FALSE(ValidateRoomId("ABC-12"));
	EXPECT_FALSE(ValidateRoomId(""));
}

TEST(SecurityGateTest, PlayerIdsStayWithinFiveDigitRange) {
	EXPECT_FALSE(ValidatePlayerId(9999));
	EXPECT_TRUE(ValidatePlayerId(10000));
	EXPECT_TRUE(ValidatePlayerId(54321));
	EXPECT_TRUE(ValidatePlayerId(99999));
	EXPECT_FALSE(ValidatePlayerId(100000));
	EXPECT_FALSE(ValidatePlayerId(-10000));
}

TEST(SecurityGateTest, OnlyHttpUrlsAreAccepted) {
	EXPECT_TRUE(ValidateUrl("https://cdn.example.com/a.mp3"));
	EXPECT_TRUE(ValidateUrl("http://cdn.example.com/a.mp3"));
	EXPECT_FALSE(ValidateUrl("javascript:alert(1)"));
	EXPECT_FALSE(ValidateUrl("ftp://cdn.example.com/a.mp3"));
	EXPECT_FALSE(ValidateUrl(""));
}

TEST(SecurityGateTest, SanitizeStripsMarkupAndScriptPatterns) {
	EXPECT_EQ(SanitizeText("  <b>Alice</b>  ", 50), "Alice");
	EXPECT_EQ(SanitizeText("javascript:alert(1)", 50), "alert(1)");
	EXPECT_EQ(SanitizeText("JaVaScRiPt:go", 50), "go");
	EXPECT_EQ(SanitizeText("hi onclick=run()", 50), "hi run()");
	EXPECT_EQ(SanitizeText("hi ONMOUSEOVER = run()", 50), "hi  run()");
	EXPECT_EQ(SanitizeText("<script>x</script>", 50), "x");
	EXPECT_EQ(SanitizeText("   ", 50), "");
	EXPECT_EQ(SanitizeText("", 50), "");
}

TEST(SecurityGateTest, SanitizeTruncatesWithoutSplittingUtf8) {
	EXPECT_EQ(SanitizeText(std::string(150, 'a'), 100).size(), 100u);
	EXPECT_EQ(TruncateUtf8("h\xC3\xA9llo", 2), "h");
	EXPECT_EQ(TruncateUtf8("h\xC3\xA9llo", 3), "h\xC3\xA9");
	EXPECT_EQ(TruncateUtf8("short", 100), "short");
}

TEST(SecurityGateTest, ConnectionLimiterRefusesBeyondCeilingAndForgetsIdleAddresses) {
	ConnectionLimiter limiter(2);

	EXPECT_TRUE(limiter.TryAcquire("10.0.0.1"));
	EXPECT_TRUE(limiter.TryAcquire("10.0.0.1"));
	EXPECT_FALSE(limiter.TryAcquire("10.0.0.1"));
	EXPECT_EQ(limiter.Count("10.0.0.1"), 2);

	EXPECT_TRUE(limiter.TryAcquire("10.0.0.2"));
	EXPECT_EQ(limiter.TrackedAddresses(), 2u);

	limiter.Release("10.0.0.1");
	EXPECT_EQ(limiter.Count("10.0.0.1"), 1);
	EXPECT_TRUE(limiter.TryAcquire("10.0.0.1"));

	limiter.Release("10.0.0.1");
	limiter.Release("10.0.0.1");
	limiter.Release("10.0.0.2");
	EXPECT_EQ(limiter.Count("10.0.0.1"), 0);
	EXPECT_EQ(limiter.TrackedAddresses(), 0u);

	// releasing an unknown address is harmless
	limiter.Release("10.0.0.9");
	EXPECT_EQ(limiter.TrackedAddresses(), 0u);
}

TEST(SecurityGateTest, RequestRateLimiterUsesSlidingMinute) {
	test::ManualClock clock;
	RequestRateLimiter limiter(3, clock.Fn());

	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	clock.Advance(std::chrono::seconds(20));
	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	EXPECT_FALSE(limiter.Allow("10.0.0.1"));
	EXPECT_TRUE(limiter.Allow("10.0.0.2"));

	// the first request falls out of the window
	clock.Advance(std::chrono::seconds(41));
	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	EXPECT_FALSE(limiter.Allow("10.0.0.1"));
}

TEST(SecurityGateTest, RequestRateLimiterForgetsIdleAddresses) {
	test::ManualClock clock;
	RequestRateLimiter limiter(3, clock.Fn());

	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	EXPECT_TRUE(limiter.Allow("10.0.0.2"));
	EXPECT_TRUE(limiter.Allow("10.0.0.3"));
	EXPECT_EQ(limiter.TrackedAddresses(), 3u);

	clock.Advance(std::chrono::seconds(61));
	EXPECT_TRUE(limiter.Allow("10.0.0.4"));
	EXPECT_EQ(limiter.TrackedAddresses(), 1u);

	// a returning address starts with a fresh budget
	EXPECT_TRUE(limiter.Allow("10.0.0.1"));
	EXPECT_EQ(limiter.TrackedAddresses(), 2u);
}

TEST(SecurityGateTest, SanitizeHandlesMegabyteInputs) {
	const std::string unterminated = "<" + std::string(1 << 20, 'a');
	EXPECT_EQ(SanitizeText(unterminated, 100), "<" + std::string(99, 'a'));

	std::string handlers;
	while (handlers.size() < (1u << 20))
		handlers += "on";
	EXPECT_EQ(SanitizeText(handlers, 100), std::string(handlers, 0, 100));

	std::string tags;
	while (tags.size() < (1u << 20))
		tags += "<b>";
	EXPECT_EQ(SanitizeText(tags, 100), "");

	std::string schemes;
	while (schemes.size() < (1u << 20))
		schemes += "JavaScript:";
	EXPECT_EQ(SanitizeText(schemes + "ok", 100), "ok");
}

TEST(SecurityGateTest, ScreenInboundMessageClassifiesInput) {
	const ServerConfig config;

	EXPECT_EQ(ScreenInboundMessage(std::string(config.maxMessageSize + 1, 'x'), config).status, InboundStatus::TooLarge);
	EXPECT_EQ(ScreenInboundMessage("{not json", config).status, InboundStatus::Malformed);
	EXPECT_EQ(ScreenInboundMessage("[1, 2]", config).status, InboundStatus::Ignored);
	EXPECT_EQ(ScreenInboundMessage(R"({"text":"hi"})", config).status, InboundStatus::Ignored);
	EXPECT_EQ(ScreenInboundMessage(R"({"action":42})", config).status, InboundStatus::Ignored);

	const std::string longAction = R"({"action":")" + std::string(config.maxActionLength + 1, 'a') + R"("})";
	EXPECT_EQ(ScreenInboundMessage(longAction, config).status, InboundStatus::Ignored);

	const InboundMessage accepted = ScreenInboundMessage(R"({"action":"guess","text":"Sholay"})", config);
	ASSERT_EQ(accepted.status, InboundStatus::Accepted);
	EXPECT_EQ(accepted.action, "guess");
	EXPECT_EQ(accepted.body["text"].asString(), "Sholay");
}
