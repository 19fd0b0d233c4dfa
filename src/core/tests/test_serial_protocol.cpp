/**
 * @file test_serial_protocol.cpp
 * @brief G-code frame formatting and reply parsing tests
 */

#include <gtest/gtest.h>
#include "arm/serial/SwiftProtocol.hpp"

using namespace sorting_arm::arm;
using namespace sorting_arm::arm::serial;

// ============================================================================
// Formatting
// ============================================================================

TEST(SwiftProtocol, FormatMove) {
    EXPECT_EQ(formatMove(Position(150.0, -20.5, 90.0), 1000.0), "G0 X150.00 Y-20.50 Z90.00 F1000");
}

TEST(SwiftProtocol, FormatServoAngle) {
    EXPECT_EQ(formatServoAngle(0, 90.0), "G2202 N0 V90.00");
    EXPECT_EQ(formatServoAngle(2, 45.25), "G2202 N2 V45.25");
}

TEST(SwiftProtocol, FormatEffector) {
    EXPECT_EQ(formatEffector(EndEffector::Pump, true), "M2231 V1");
    EXPECT_EQ(formatEffector(EndEffector::Pump, false), "M2231 V0");
    EXPECT_EQ(formatEffector(EndEffector::Gripper, true), "M2232 V1");
}

TEST(SwiftProtocol, TagCommand) {
    EXPECT_EQ(tagCommand(7, CMD_QUERY_POSITION), "#7 P2220");
}

TEST(SwiftProtocol, FeedRateClamped) {
    EXPECT_DOUBLE_EQ(feedRateForSpeed(50.0, 2000.0), 1000.0);
    EXPECT_DOUBLE_EQ(feedRateForSpeed(100.0, 2000.0), 2000.0);
    EXPECT_DOUBLE_EQ(feedRateForSpeed(250.0, 2000.0), 2000.0);
    EXPECT_DOUBLE_EQ(feedRateForSpeed(0.0, 2000.0), 20.0);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(SwiftProtocol, ParseOkReply) {
    auto reply = parseReply("$12 ok X150.00 Y0.00 Z90.00");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->seq, 12u);
    EXPECT_TRUE(reply->ok);
    EXPECT_EQ(reply->payload, "X150.00 Y0.00 Z90.00");

    auto bare = parseReply("$3 ok");
    ASSERT_TRUE(bare.has_value());
    EXPECT_TRUE(bare->ok);
    EXPECT_TRUE(bare->payload.empty());
}

TEST(SwiftProtocol, ParseErrorReply) {
    auto reply = parseReply("$4 E22");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->seq, 4u);
    EXPECT_FALSE(reply->ok);
    EXPECT_EQ(reply->errorCode, 22);
}

TEST(SwiftProtocol, IgnoresNonReplies) {
    EXPECT_FALSE(parseReply("@5 V1").has_value());
    EXPECT_FALSE(parseReply("").has_value());
    EXPECT_FALSE(parseReply("$").has_value());
    EXPECT_FALSE(parseReply("$x ok").has_value());
    EXPECT_FALSE(parseReply("$5 maybe").has_value());
}

TEST(SwiftProtocol, ParsePositionBothStyles) {
    auto plain = parsePosition("X150.00 Y-3.50 Z90.00");
    ASSERT_TRUE(plain.has_value());
    EXPECT_DOUBLE_EQ(plain->x, 150.0);
    EXPECT_DOUBLE_EQ(plain->y, -3.5);
    EXPECT_DOUBLE_EQ(plain->z, 90.0);

    auto colon = parsePosition("X:115.0 Y:-3.0 Z:45.0");
    ASSERT_TRUE(colon.has_value());
    EXPECT_DOUBLE_EQ(colon->x, 115.0);

    EXPECT_FALSE(parsePosition("X150.00 Y0.00").has_value());
    EXPECT_FALSE(parsePosition("garbage").has_value());
}

TEST(SwiftProtocol, ParseAngles) {
    auto angles = parseAngles("B90.00 L45.00 R30.00");
    ASSERT_TRUE(angles.has_value());
    EXPECT_DOUBLE_EQ((*angles)[0], 90.0);
    EXPECT_DOUBLE_EQ((*angles)[1], 45.0);
    EXPECT_DOUBLE_EQ((*angles)[2], 30.0);
    EXPECT_FALSE(parseAngles("B90").has_value());
}

TEST(SwiftProtocol, ParseValue) {
    EXPECT_EQ(parseValue("V2"), std::optional<int>(2));
    EXPECT_EQ(parseValue("V0"), std::optional<int>(0));
    EXPECT_FALSE(parseValue("").has_value());
}
