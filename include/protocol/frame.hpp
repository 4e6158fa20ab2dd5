#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/asio.hpp>

namespace protocol {

// Every message on the wire is [u32 big-endian length][payload].
constexpr std::size_t FRAME_PREFIX_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 16 * 1024 * 1024;
constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;

struct FrameLimits {
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    std::size_t buffer_size = DEFAULT_BUFFER_SIZE;  // read granularity for payloads
};

std::array<uint8_t, FRAME_PREFIX_SIZE> serialize_length(uint32_t length);
uint32_t deserialize_length(const std::array<uint8_t, FRAME_PREFIX_SIZE>& buffer);

// Writes prefix and payload in a single gather write.
// Throws ConnectionClosed if the peer went away, FrameTooLarge if size does not fit the prefix.
void write_frame(boost::asio::ip::tcp::socket& socket, const void* data, std::size_t size);
void write_frame(boost::asio::ip::tcp::socket& socket, const std::string& payload);
void write_frame(boost::asio::ip::tcp::socket& socket, const std::vector<char>& payload);

// Blocks until one whole frame has been read.
// Throws ConnectionClosed on EOF before a full frame, FrameTooLarge if the
// declared length exceeds limits.max_frame_size.
std::vector<char> read_frame(boost::asio::ip::tcp::socket& socket, const FrameLimits& limits = FrameLimits{});

} // namespace protocol
