#include <gtest/gtest.h>

#include <array>
#include <string>
#include <thread>
#include <vector>

#include "TestUtils.hpp"
#include "protocol/errors.hpp"
#include "protocol/frame.hpp"

using testutil::SocketPair;
using testutil::to_bytes;

TEST(FrameTest, LengthPrefixIsBigEndian) {
    auto buf = protocol::serialize_length(0x01020304u);
    std::array<uint8_t, 4> expected{0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(buf, expected);
    EXPECT_EQ(protocol::deserialize_length(buf), 0x01020304u);
}

TEST(FrameTest, WireBytesArePrefixThenPayload) {
    SocketPair pair;
    protocol::write_frame(pair.client, std::string("abc"));

    std::array<char, 7> raw{};
    boost::asio::read(pair.server, boost::asio::buffer(raw));
    std::array<char, 7> expected{0, 0, 0, 3, 'a', 'b', 'c'};
    EXPECT_EQ(raw, expected);
}

TEST(FrameTest, ReadReturnsExactPayload) {
    SocketPair pair;
    protocol::write_frame(pair.client, std::string("hello"));
    EXPECT_EQ(protocol::read_frame(pair.server), to_bytes("hello"));
}

TEST(FrameTest, ZeroLengthFrameYieldsEmptyPayload) {
    SocketPair pair;
    protocol::write_frame(pair.client, std::vector<char>{});
    protocol::write_frame(pair.client, std::string("next"));

    EXPECT_TRUE(protocol::read_frame(pair.server).empty());
    EXPECT_EQ(protocol::read_frame(pair.server), to_bytes("next"));
}

TEST(FrameTest, ConsecutiveFramesKeepTheirBoundaries) {
    SocketPair pair;
    protocol::write_frame(pair.client, std::string("{\"type\":\"list_files\"}"));
    protocol::write_frame(pair.client, std::string("x"));
    protocol::write_frame(pair.client, std::string("yz"));

    EXPECT_EQ(protocol::read_frame(pair.server), to_bytes("{\"type\":\"list_files\"}"));
    EXPECT_EQ(protocol::read_frame(pair.server), to_bytes("x"));
    EXPECT_EQ(protocol::read_frame(pair.server), to_bytes("yz"));
}

TEST(FrameTest, LargePayloadIsReassembledFromSmallReads) {
    SocketPair pair;
    const auto payload = testutil::make_bytes(3 * 1024 * 1024 + 17);

    // The writer blocks until the reader drains the socket buffer.
    std::thread writer([&]() { protocol::write_frame(pair.client, payload); });
    protocol::FrameLimits limits;
    limits.buffer_size = 4096;
    auto received = protocol::read_frame(pair.server, limits);
    writer.join();

    EXPECT_EQ(received, payload);
}

TEST(FrameTest, DeclaredLengthAboveLimitIsRejected) {
    SocketPair pair;
    protocol::write_frame(pair.client, testutil::make_bytes(100));

    protocol::FrameLimits limits;
    limits.max_frame_size = 50;
    EXPECT_THROW(protocol::read_frame(pair.server, limits), protocol::FrameTooLarge);
}

TEST(FrameTest, HostilePrefixIsRejectedBeforeReadingPayload) {
    SocketPair pair;
    std::array<uint8_t, 4> prefix{0xFF, 0xFF, 0xFF, 0xFF};
    boost::asio::write(pair.client, boost::asio::buffer(prefix));

    EXPECT_THROW(protocol::read_frame(pair.server), protocol::FrameTooLarge);
}

TEST(FrameTest, LimitEqualToLengthIsAccepted) {
    SocketPair pair;
    protocol::write_frame(pair.client, testutil::make_bytes(64));

    protocol::FrameLimits limits;
    limits.max_frame_size = 64;
    EXPECT_EQ(protocol::read_frame(pair.server, limits).size(), 64u);
}

TEST(FrameTest, EofBeforePrefixIsConnectionClosed) {
    SocketPair pair;
    pair.client.close();
    EXPECT_THROW(protocol::read_frame(pair.server), protocol::ConnectionClosed);
}

TEST(FrameTest, EofInsidePrefixIsConnectionClosed) {
    SocketPair pair;
    std::array<uint8_t, 2> half{0x00, 0x00};
    boost::asio::write(pair.client, boost::asio::buffer(half));
    pair.client.close();
    EXPECT_THROW(protocol::read_frame(pair.server), protocol::ConnectionClosed);
}

TEST(FrameTest, EofInsidePayloadIsConnectionClosed) {
    SocketPair pair;
    auto prefix = protocol::serialize_length(10);
    boost::asio::write(pair.client, boost::asio::buffer(prefix));
    boost::asio::write(pair.client, boost::asio::buffer(std::string("abcd")));
    pair.client.close();
    EXPECT_THROW(protocol::read_frame(pair.server), protocol::ConnectionClosed);
}

TEST(FrameTest, WriteToClosedPeerIsConnectionClosed) {
    SocketPair pair;
    pair.server.close();

    // The first writes may still land in the kernel buffer; keep going until the reset surfaces.
    const auto chunk = testutil::make_bytes(64 * 1024);
    EXPECT_THROW({
        for (int i = 0; i < 1000; ++i) {
            protocol::write_frame(pair.client, chunk);
        }
    }, protocol::ConnectionClosed);
}
