#include "networking.hpp"
#include "log.hpp"
#include "protocol/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <sys/socket.h>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

std::string format_size(uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024 && unit + 1 < std::size(units)) {
        size /= 1024;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << size << units[unit];
    return out.str();
}

namespace {

std::string endpoint_string(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "<unknown peer>";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_COMMAND: return "awaiting-command";
        case SessionState::PROCESSING:       return "processing";
        case SessionState::CLOSED:           return "closed";
        case SessionState::FAILED:           return "failed";
    }
    return "unknown";
}

// ─── Session ────────────────────────────────────────────────────────────────

Session::Session(tcp::socket socket, const storage::FileDirectory& directory,
                 const config::ServerConfig& cfg, uint64_t id)
    : socket_(std::move(socket)), directory_(directory), cfg_(cfg), id_(id),
      peer_(endpoint_string(socket_)) {}

void Session::run() {
    logging::info("Connection established with " + peer_);
    try {
        while (true) {
            state_ = SessionState::AWAITING_COMMAND;
            protocol::Command command = transfer::MessageReceiver::receive_command(socket_, cfg_.limits);

            state_ = SessionState::PROCESSING;
            logging::debug("[" + peer_ + "] " + protocol::type_name(command));
            if (!dispatch(command)) {
                state_ = SessionState::CLOSED;
                break;
            }
        }
    } catch (const protocol::ConnectionClosed& e) {
        if (state_ == SessionState::AWAITING_COMMAND) {
            state_ = SessionState::CLOSED;
        } else {
            state_ = SessionState::FAILED;
            logging::error("Connection with " + peer_ + " lost mid-transfer: " + e.what());
        }
    } catch (const std::exception& e) {
        state_ = SessionState::FAILED;
        logging::error("Error handling client " + peer_ + ": " + e.what());
    }

    close_socket();
    logging::info("Connection with " + peer_ + " closed (" + to_string(state_) + ")");
}

void Session::close() {
    std::lock_guard<std::mutex> lk(socket_mutex_);
    if (socket_.is_open()) {
        // The session thread may be blocked in a read on this socket, and asio
        // objects are not safe for concurrent use. shutdown(2) on the raw
        // descriptor wakes that read with EOF on POSIX without touching asio state.
        if (::shutdown(socket_.native_handle(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
            logging::warn("shutdown of session " + std::to_string(id_) + " failed: " + std::strerror(errno));
        }
    }
}

void Session::close_socket() {
    std::lock_guard<std::mutex> lk(socket_mutex_);
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

bool Session::dispatch(const protocol::Command& command) {
    if (std::holds_alternative<protocol::ListFiles>(command)) {
        send_file_list();
    } else if (auto* download = std::get_if<protocol::DownloadFile>(&command)) {
        send_file(download->filename);
    } else if (auto* batch = std::get_if<protocol::DownloadMultiple>(&command)) {
        send_multiple_files(batch->filenames);
    } else {
        return false;  // disconnect
    }
    return true;
}

void Session::send_file_list() {
    std::vector<storage::FileEntry> entries;
    try {
        entries = directory_.list();
    } catch (const protocol::IOFailure& e) {
        logging::error("Error listing files for " + peer_ + ": " + e.what());
        transfer::MessageSender::send(socket_, protocol::Error{std::string("Error listing files: ") + e.what()});
        return;
    }

    protocol::FileList list;
    list.files.reserve(entries.size());
    for (const auto& entry : entries) {
        list.files.push_back({entry.name, entry.size, protocol::to_megabytes(entry.size)});
    }
    transfer::MessageSender::send(socket_, list);
    logging::info("Sent file list with " + std::to_string(list.files.size()) + " files to " + peer_);
}

void Session::send_file(const std::string& filename) {
    std::optional<storage::FileReader> reader;
    try {
        reader.emplace(directory_.open_for_read(filename));
    } catch (const protocol::NotFound& e) {
        logging::warn(peer_ + " requested missing file '" + filename + "'");
        transfer::MessageSender::send(socket_, protocol::Error{e.what()});
        return;
    } catch (const protocol::IOFailure& e) {
        logging::error(e.what());
        transfer::MessageSender::send(socket_, protocol::Error{std::string("Error sending file: ") + e.what()});
        return;
    }

    logging::info("Sending '" + filename + "' (" + format_size(reader->size()) + ") to " + peer_);
    bool sent = transfer::MessageSender::send_file(
        socket_, *reader, filename, cfg_.max_chunk_size,
        [this, &filename](uint32_t chunk_number, uint32_t total_chunks) {
            logging::debug("Sent chunk " + std::to_string(chunk_number) + "/" +
                           std::to_string(total_chunks) + " of " + filename + " to " + peer_);
        });

    if (sent) {
        logging::info("File '" + filename + "' sent successfully to " + peer_);
    } else {
        logging::error("Transfer of '" + filename + "' to " + peer_ + " aborted by a read error");
    }
}

void Session::send_multiple_files(const std::vector<std::string>& filenames) {
    const auto total = static_cast<uint32_t>(filenames.size());
    transfer::MessageSender::send(socket_, protocol::BatchStart{total, filenames});

    for (uint32_t i = 0; i < total; ++i) {
        logging::info("Sending file " + std::to_string(i + 1) + "/" + std::to_string(total) +
                      " to " + peer_ + ": " + filenames[i]);
        send_file(filenames[i]);
    }

    transfer::MessageSender::send(socket_, protocol::BatchComplete{total});
    logging::info("Multiple file transfer completed: " + std::to_string(total) + " files sent to " + peer_);
}

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(const config::ServerConfig& cfg, const storage::FileDirectory& directory)
    : cfg_(cfg), directory_(directory), acceptor_(io_context_), accept_retry_timer_(io_context_) {
    tcp::resolver resolver(io_context_);
    tcp::endpoint endpoint = resolver.resolve(cfg_.host, std::to_string(cfg_.port)).begin()->endpoint();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    logging::info("Server started on " + endpoint.address().to_string() + ":" + std::to_string(port_));
    logging::info("Server directory: " + fs::absolute(directory_.root()).string());
}

Server::~Server() {
    stop();
    close_sessions();
    join_all_sessions();
}

void Server::run() {
    do_accept();
    logging::info("Waiting for connections...");
    io_context_.run();

    close_sessions();
    join_all_sessions();
    logging::info("Server stopped");
}

void Server::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        accept_retry_timer_.cancel();
        close_sessions();
    });
}

std::size_t Server::active_sessions() const {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    return std::count_if(sessions_.begin(), sessions_.end(),
                         [](const auto& entry) { return !entry.second.finished; });
}

void Server::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted && acceptor_.is_open()) {
                ++accept_errors_;
                logging::error(std::string("accept failed: ") + ec.message());
                // Out of descriptors the listener stays readable, so retrying at once would spin.
                accept_retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
                accept_retry_timer_.async_wait([this](const boost::system::error_code& wait_ec) {
                    if (!wait_ec && acceptor_.is_open()) {
                        do_accept();
                    }
                });
            }
            return;
        }
        spawn_session(std::move(socket));
        do_accept();
    });
}

void Server::spawn_session(tcp::socket socket) {
    join_finished_sessions();

    std::lock_guard<std::mutex> lk(sessions_mutex_);
    uint64_t id = next_session_id_++;
    auto session = std::make_shared<Session>(std::move(socket), directory_, cfg_, id);

    SessionSlot& slot = sessions_[id];
    slot.session = session;
    try {
        slot.thread = std::thread([this, session]() {
            session->run();
            std::lock_guard<std::mutex> done_lk(sessions_mutex_);
            sessions_[session->id()].finished = true;
        });
    } catch (const std::system_error& e) {
        logging::error(std::string("Could not start session thread: ") + e.what());
        session->close();
        sessions_.erase(id);
    }
}

void Server::close_sessions() {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    for (auto& entry : sessions_) {
        if (!entry.second.finished) {
            entry.second.session->close();
        }
    }
}

void Server::join_finished_sessions() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lk(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.finished) {
                finished.push_back(std::move(it->second.thread));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        thread.join();
    }
}

void Server::join_all_sessions() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(sessions_mutex_);
        for (auto& entry : sessions_) {
            threads.push_back(std::move(entry.second.thread));
        }
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    sessions_.clear();
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(config::ClientConfig cfg)
    : cfg_(std::move(cfg)), socket_(io_context_) {}

Client::~Client() {
    disconnect();
}

void Client::connect() {
    tcp::resolver resolver(io_context_);
    boost::asio::connect(socket_, resolver.resolve(cfg_.host, std::to_string(cfg_.port)));
    connected_ = true;
    logging::info("Connected to server at " + cfg_.host + ":" + std::to_string(cfg_.port));
}

void Client::disconnect() {
    if (!connected_) {
        return;
    }
    try {
        transfer::MessageSender::send(socket_, protocol::Disconnect{});
    } catch (const protocol::ProtocolError& e) {
        logging::warn(std::string("Could not send disconnect: ") + e.what());
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    connected_ = false;
    logging::info("Disconnected from server");
}

void Client::require_connection() const {
    if (!connected_) {
        throw protocol::ConnectionClosed("not connected to server");
    }
}

void Client::drop_connection(const std::string& reason) {
    logging::error("Connection to server lost: " + reason);
    boost::system::error_code ec;
    socket_.close(ec);
    connected_ = false;
}

std::vector<protocol::FileListEntry> Client::list_files() {
    require_connection();
    try {
        transfer::MessageSender::send(socket_, protocol::ListFiles{});
        protocol::Response response = transfer::MessageReceiver::receive_response(socket_, cfg_.limits);
        if (auto* error = std::get_if<protocol::Error>(&response)) {
            throw protocol::RemoteError(error->message);
        }
        auto* list = std::get_if<protocol::FileList>(&response);
        if (list == nullptr) {
            throw protocol::MalformedMessage("expected file_list, got " + protocol::type_name(response));
        }
        return list->files;
    } catch (const protocol::RemoteError&) {
        throw;
    } catch (const protocol::ProtocolError& e) {
        drop_connection(e.what());
        throw;
    }
}

FileResult Client::download_file(const std::string& filename, transfer::ProgressCallback progress_cb) {
    if (!connected_) {
        return {filename, false, "not connected to server", 0, {}};
    }
    try {
        transfer::MessageSender::send(socket_, protocol::DownloadFile{filename});
        return receive_one(filename, progress_cb);
    } catch (const protocol::ProtocolError& e) {
        drop_connection(e.what());
        return {filename, false, e.what(), 0, {}};
    }
}

BatchResult Client::download_multiple(const std::vector<std::string>& filenames,
                                      transfer::ProgressCallback progress_cb) {
    BatchResult batch{{}, false};
    auto fail_remaining = [&](const std::string& reason) {
        for (std::size_t i = batch.files.size(); i < filenames.size(); ++i) {
            batch.files.push_back({filenames[i], false, reason, 0, {}});
        }
    };

    if (!connected_) {
        fail_remaining("not connected to server");
        return batch;
    }

    const auto total = static_cast<uint32_t>(filenames.size());
    try {
        transfer::MessageSender::send(socket_, protocol::DownloadMultiple{filenames});

        protocol::Response start = transfer::MessageReceiver::receive_response(socket_, cfg_.limits);
        if (auto* error = std::get_if<protocol::Error>(&start)) {
            logging::error("Error: " + error->message);
            fail_remaining(error->message);
            return batch;
        }
        auto* begin = std::get_if<protocol::BatchStart>(&start);
        if (begin == nullptr) {
            throw protocol::MalformedMessage("expected multiple_transfer_start, got " + protocol::type_name(start));
        }
        if (begin->total_files != total) {
            throw protocol::MalformedMessage("server announced " + std::to_string(begin->total_files) +
                                             " files, " + std::to_string(total) + " were requested");
        }

        logging::info("Starting download of " + std::to_string(total) + " files...");
        for (uint32_t i = 0; i < total; ++i) {
            logging::info("--- File " + std::to_string(i + 1) + "/" + std::to_string(total) + " ---");
            batch.files.push_back(receive_one(filenames[i], progress_cb));
        }

        protocol::Response end = transfer::MessageReceiver::receive_response(socket_, cfg_.limits);
        auto* complete = std::get_if<protocol::BatchComplete>(&end);
        if (complete == nullptr || complete->total_files != total) {
            throw protocol::MalformedMessage("expected multiple_transfer_complete for " +
                                             std::to_string(total) + " files, got " + protocol::type_name(end));
        }
    } catch (const protocol::ProtocolError& e) {
        drop_connection(e.what());
        fail_remaining(e.what());
        return batch;
    }

    batch.success = std::all_of(batch.files.begin(), batch.files.end(),
                                [](const FileResult& r) { return r.success; });
    std::size_t ok = std::count_if(batch.files.begin(), batch.files.end(),
                                   [](const FileResult& r) { return r.success; });
    logging::info("Multiple file download finished: " + std::to_string(ok) + "/" +
                  std::to_string(total) + " succeeded");
    return batch;
}

FileResult Client::receive_one(const std::string& requested, const transfer::ProgressCallback& progress_cb) {
    protocol::Response response = transfer::MessageReceiver::receive_response(socket_, cfg_.limits);
    if (auto* error = std::get_if<protocol::Error>(&response)) {
        logging::error("Error: " + error->message);
        return {requested, false, error->message, 0, {}};
    }
    auto* info = std::get_if<protocol::FileInfo>(&response);
    if (info == nullptr) {
        throw protocol::MalformedMessage("expected file_info, got " + protocol::type_name(response));
    }
    if (info->filename != requested) {
        throw protocol::MalformedMessage("server sent '" + info->filename + "' while '" + requested +
                                         "' was requested");
    }

    fs::path destination = destination_for(info->filename);
    logging::info("Downloading " + info->filename + " (" + std::to_string(info->file_size) + " bytes, " +
                  std::to_string(info->num_chunks) + " chunks)");

    transfer::TransferOutcome outcome =
        transfer::MessageReceiver::receive_file(socket_, *info, destination, cfg_.limits, progress_cb);
    if (outcome.state == transfer::TransferState::COMPLETED) {
        logging::info("Successfully downloaded " + info->filename + " (" + format_size(outcome.bytes_received) + ")");
        return {requested, true, "", outcome.bytes_received, destination};
    }
    logging::error("Download of " + info->filename + " failed: " + outcome.message);
    return {requested, false, outcome.message, outcome.bytes_received, {}};
}

fs::path Client::destination_for(const std::string& reported_name) const {
    fs::path name = fs::path(reported_name).filename();
    if (name.empty() || name == "." || name == "..") {
        throw protocol::MalformedMessage("unusable file name '" + reported_name + "'");
    }
    return fs::path(cfg_.output_directory) / name;
}

} // namespace networking
