#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

// Base for every failure raised by the transfer engine.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Peer closed the stream before a full prefix or payload arrived.
class ConnectionClosed : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Declared frame length exceeds the configured maximum.
class FrameTooLarge : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Payload could not be decoded into a known message, or the message
// was not the one expected at this point of the exchange.
class MalformedMessage : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Requested file does not exist in the served directory.
class NotFound : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Chunk arrived with an unexpected number, total or length.
class OutOfOrderChunk : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Local disk read or write failed.
class IOFailure : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// The server answered with an error response.
class RemoteError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

} // namespace protocol
