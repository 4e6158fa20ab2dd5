#include "protocol/frame.hpp"
#include "protocol/errors.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstring>
#include <limits>

namespace protocol {

std::array<uint8_t, FRAME_PREFIX_SIZE> serialize_length(uint32_t length) {
    std::array<uint8_t, FRAME_PREFIX_SIZE> buffer;
    uint32_t be = htonl(length);
    std::memcpy(buffer.data(), &be, FRAME_PREFIX_SIZE);
    return buffer;
}

uint32_t deserialize_length(const std::array<uint8_t, FRAME_PREFIX_SIZE>& buffer) {
    uint32_t be;
    std::memcpy(&be, buffer.data(), FRAME_PREFIX_SIZE);
    return ntohl(be);
}

void write_frame(boost::asio::ip::tcp::socket& socket, const void* data, std::size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw FrameTooLarge("frame of " + std::to_string(size) + " bytes does not fit the length prefix");
    }

    auto prefix = serialize_length(static_cast<uint32_t>(size));
    std::array<boost::asio::const_buffer, 2> buffers{
        boost::asio::buffer(prefix),
        boost::asio::buffer(data, size)
    };

    boost::system::error_code ec;
    boost::asio::write(socket, buffers, ec);
    if (ec) {
        throw ConnectionClosed("write failed: " + ec.message());
    }
}

void write_frame(boost::asio::ip::tcp::socket& socket, const std::string& payload) {
    write_frame(socket, payload.data(), payload.size());
}

void write_frame(boost::asio::ip::tcp::socket& socket, const std::vector<char>& payload) {
    write_frame(socket, payload.data(), payload.size());
}

std::vector<char> read_frame(boost::asio::ip::tcp::socket& socket, const FrameLimits& limits) {
    std::array<uint8_t, FRAME_PREFIX_SIZE> prefix;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(prefix), ec);
    if (ec) {
        throw ConnectionClosed("connection closed while reading frame header: " + ec.message());
    }

    uint32_t length = deserialize_length(prefix);
    if (length > limits.max_frame_size) {
        throw FrameTooLarge("declared frame length " + std::to_string(length) +
                            " exceeds limit of " + std::to_string(limits.max_frame_size));
    }

    std::vector<char> payload(length);
    std::size_t slice = std::max<std::size_t>(limits.buffer_size, 1);
    std::size_t received = 0;
    while (received < length) {
        std::size_t want = std::min<std::size_t>(slice, length - received);
        received += boost::asio::read(socket, boost::asio::buffer(payload.data() + received, want), ec);
        if (ec) {
            throw ConnectionClosed("connection closed after " + std::to_string(received) + " of " +
                                   std::to_string(length) + " payload bytes: " + ec.message());
        }
    }
    return payload;
}

} // namespace protocol
