#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "file_store.hpp"
#include "protocol/frame.hpp"
#include "protocol/messages.hpp"

namespace transfer {

constexpr uint32_t DEFAULT_MAX_CHUNK_SIZE = 1024 * 1024;

// Half-open byte range [offset, offset + length) of one chunk.
struct ChunkRange {
    uint64_t offset;
    uint32_t length;
};

// Deterministic split of a file into chunks of at most max_chunk_size bytes.
// An empty file is one empty chunk.
class ChunkPlan {
public:
    ChunkPlan(uint64_t file_size, uint32_t max_chunk_size);

    uint64_t file_size() const { return file_size_; }
    uint32_t max_chunk_size() const { return max_chunk_size_; }
    uint32_t num_chunks() const { return num_chunks_; }

    // index is 0-based; throws std::out_of_range past the last chunk.
    ChunkRange range(uint32_t index) const;

private:
    uint64_t file_size_;
    uint32_t max_chunk_size_;
    uint32_t num_chunks_;
};

struct ProgressEvent {
    std::string filename;
    uint32_t chunk_number;
    uint32_t total_chunks;
    uint64_t bytes_received;
    uint64_t file_size;
    double percent;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Called by the sender after each chunk has been handed to the socket.
using ChunkSentCallback = std::function<void(uint32_t chunk_number, uint32_t total_chunks)>;

// Share of file_size covered by received bytes, in percent. 100 for an empty file.
double progress_percent(uint64_t received, uint64_t file_size);

// Receiving side of the chunker: appends chunks to a sink in strictly
// increasing, contiguous order starting at 1.
class ChunkAssembler {
public:
    ChunkAssembler(const protocol::FileInfo& info, storage::DownloadSink& sink);

    // Throws OutOfOrderChunk on a wrong number, total or length, IOFailure if the sink fails.
    void append(const protocol::ChunkHeader& header, const std::vector<char>& data);

    // Commits the sink; throws OutOfOrderChunk if chunks are missing.
    void finish();

    bool complete() const { return next_chunk_ > plan_.num_chunks(); }
    uint32_t next_chunk() const { return next_chunk_; }
    uint64_t bytes_received() const { return bytes_received_; }
    const ChunkPlan& plan() const { return plan_; }

private:
    ChunkPlan plan_;
    storage::DownloadSink& sink_;
    uint32_t next_chunk_ = 1;
    uint64_t bytes_received_ = 0;
};

enum class TransferState {
    COMPLETED,
    FAILED
};

struct TransferOutcome {
    TransferState state;
    uint64_t bytes_received;
    std::string message;
};

class MessageSender {
public:
    static void send(boost::asio::ip::tcp::socket& socket, const protocol::Command& command);
    static void send(boost::asio::ip::tcp::socket& socket, const protocol::Response& response);

    // Streams file_info, every chunk header + raw frame, then file_complete.
    // If the file cannot be read mid-way an error response replaces the next
    // chunk header and false is returned. Connection failures propagate.
    static bool send_file(boost::asio::ip::tcp::socket& socket, storage::FileReader& reader,
                          const std::string& filename, uint32_t max_chunk_size,
                          ChunkSentCallback on_chunk = nullptr);
};

class MessageReceiver {
public:
    static protocol::Command receive_command(boost::asio::ip::tcp::socket& socket,
                                             const protocol::FrameLimits& limits);
    static protocol::Response receive_response(boost::asio::ip::tcp::socket& socket,
                                               const protocol::FrameLimits& limits);

    // Consumes the chunk stream announced by info and the trailing
    // file_complete, writing to destination. Per-file problems (sequence
    // violations, local write errors, a server-side error response) yield
    // FAILED with the stream left in sync; framing and decoding problems throw.
    static TransferOutcome receive_file(boost::asio::ip::tcp::socket& socket,
                                        const protocol::FileInfo& info,
                                        const std::filesystem::path& destination,
                                        const protocol::FrameLimits& limits,
                                        ProgressCallback progress_cb = nullptr);
};

} // namespace transfer
