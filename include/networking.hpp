#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "file_store.hpp"
#include "protocol/messages.hpp"
#include "transfer.hpp"

namespace networking {

enum class SessionState {
    AWAITING_COMMAND,
    PROCESSING,
    CLOSED,
    FAILED
};

const char* to_string(SessionState state);

// Human-readable size with one decimal, e.g. 1536 -> "1.5KB".
std::string format_size(uint64_t bytes);

// Server side of one connection: reads commands and answers them until the
// peer disconnects or breaks the protocol.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, const storage::FileDirectory& directory,
            const config::ServerConfig& cfg, uint64_t id);

    // Runs the command loop on the calling thread; never throws.
    void run();

    // Forcibly ends the session from another thread (server shutdown).
    void close();

    SessionState state() const { return state_; }
    uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }

private:
    // Returns false when the session should end.
    bool dispatch(const protocol::Command& command);

    void send_file_list();
    void send_file(const std::string& filename);
    void send_multiple_files(const std::vector<std::string>& filenames);

    void close_socket();

    boost::asio::ip::tcp::socket socket_;
    std::mutex socket_mutex_;  // guards close/shutdown only; I/O happens on the session thread
    const storage::FileDirectory& directory_;
    const config::ServerConfig& cfg_;
    uint64_t id_;
    std::string peer_;
    std::atomic<SessionState> state_{SessionState::AWAITING_COMMAND};
};

// Accept loop: one thread per accepted connection.
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if the address is unavailable.
    Server(const config::ServerConfig& cfg, const storage::FileDirectory& directory);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks until stop() is called and every session thread has finished.
    void run();

    // Thread-safe. Closes the listener and every live session.
    void stop();

    unsigned short port() const { return port_; }
    std::size_t active_sessions() const;

    // Failed accepts since construction (for example EMFILE).
    uint64_t accept_errors() const { return accept_errors_; }

    // Pause before accepting again after a failed accept.
    static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

private:
    struct SessionSlot {
        std::shared_ptr<Session> session;
        std::thread thread;
        bool finished = false;
    };

    void do_accept();
    void spawn_session(boost::asio::ip::tcp::socket socket);
    void close_sessions();
    void join_finished_sessions();
    void join_all_sessions();

    const config::ServerConfig& cfg_;
    const storage::FileDirectory& directory_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer accept_retry_timer_;
    unsigned short port_ = 0;
    std::atomic<uint64_t> accept_errors_{0};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<uint64_t, SessionSlot> sessions_;
    uint64_t next_session_id_ = 1;
    std::atomic<bool> stopped_{false};
};

struct FileResult {
    std::string filename;
    bool success;
    std::string message;
    uint64_t bytes;
    std::filesystem::path path;  // set on success
};

struct BatchResult {
    std::vector<FileResult> files;
    bool success;  // true only if every file succeeded
};

// Client side: one connection, one exchange at a time.
class Client {
public:
    explicit Client(config::ClientConfig cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Throws boost::system::system_error if the server is unreachable.
    void connect();

    // Sends disconnect (best effort) and closes the socket.
    void disconnect();

    bool is_connected() const { return connected_; }

    // Throws RemoteError if the server reports an error, and ProtocolError
    // subclasses for framing/decoding failures (the connection is then closed).
    std::vector<protocol::FileListEntry> list_files();

    // Never throws for transfer problems: failures are reported in the result.
    FileResult download_file(const std::string& filename, transfer::ProgressCallback progress_cb = nullptr);
    BatchResult download_multiple(const std::vector<std::string>& filenames,
                                  transfer::ProgressCallback progress_cb = nullptr);

private:
    // Reads one file's sequence (file_info or error, chunks, file_complete).
    FileResult receive_one(const std::string& requested, const transfer::ProgressCallback& progress_cb);
    std::filesystem::path destination_for(const std::string& reported_name) const;
    void drop_connection(const std::string& reason);
    void require_connection() const;

    config::ClientConfig cfg_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    bool connected_ = false;
};

} // namespace networking
