#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "protocol/frame.hpp"
#include "transfer.hpp"

namespace config {

constexpr unsigned short DEFAULT_PORT = 8888;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    unsigned short port = DEFAULT_PORT;  // 0 picks an ephemeral port
    std::string directory = "server_files";
    uint32_t max_chunk_size = transfer::DEFAULT_MAX_CHUNK_SIZE;
    protocol::FrameLimits limits;
    bool verbose = false;
};

enum class ClientAction {
    LIST,
    GET,
    GET_MANY
};

struct ClientConfig {
    std::string host = "127.0.0.1";
    unsigned short port = DEFAULT_PORT;
    std::string output_directory = "downloads";
    protocol::FrameLimits limits;
    bool verbose = false;

    ClientAction action = ClientAction::LIST;
    std::vector<std::string> filenames;
};

// Both return std::nullopt when --help was requested (usage already printed).
// Throws ConfigError on unknown options, malformed values or failed validation.
// Values from --config <file> are used where the command line is silent.
std::optional<ServerConfig> parse_server_args(int argc, const char* const argv[]);
std::optional<ClientConfig> parse_client_args(int argc, const char* const argv[]);

void validate(const ServerConfig& cfg);
void validate(const ClientConfig& cfg);

} // namespace config
