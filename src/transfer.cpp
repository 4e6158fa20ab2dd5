#include "transfer.hpp"
#include "log.hpp"
#include "protocol/errors.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>

namespace transfer {

// ─── ChunkPlan ──────────────────────────────────────────────────────────────

ChunkPlan::ChunkPlan(uint64_t file_size, uint32_t max_chunk_size)
    : file_size_(file_size), max_chunk_size_(max_chunk_size), num_chunks_(1) {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("max_chunk_size must be greater than zero");
    }
    // Must not wrap for file sizes near 2^64.
    uint64_t chunks = file_size / max_chunk_size + (file_size % max_chunk_size != 0 ? 1 : 0);
    if (chunks > UINT32_MAX) {
        throw std::invalid_argument("file of " + std::to_string(file_size) +
                                    " bytes needs more than 2^32 chunks");
    }
    num_chunks_ = std::max<uint32_t>(1, static_cast<uint32_t>(chunks));
}

ChunkRange ChunkPlan::range(uint32_t index) const {
    if (index >= num_chunks_) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " out of " +
                                std::to_string(num_chunks_));
    }
    uint64_t begin = static_cast<uint64_t>(index) * max_chunk_size_;
    uint64_t length = std::min<uint64_t>(max_chunk_size_, file_size_ - begin);
    return {begin, static_cast<uint32_t>(length)};
}

double progress_percent(uint64_t received, uint64_t file_size) {
    if (file_size == 0) {
        return 100.0;
    }
    return static_cast<double>(received) * 100.0 / static_cast<double>(file_size);
}

// ─── ChunkAssembler ─────────────────────────────────────────────────────────

ChunkAssembler::ChunkAssembler(const protocol::FileInfo& info, storage::DownloadSink& sink)
    : plan_(info.file_size, info.chunk_size), sink_(sink) {}

void ChunkAssembler::append(const protocol::ChunkHeader& header, const std::vector<char>& data) {
    if (header.total_chunks != plan_.num_chunks()) {
        throw protocol::OutOfOrderChunk("chunk announces " + std::to_string(header.total_chunks) +
                                        " total chunks, expected " + std::to_string(plan_.num_chunks()));
    }
    if (complete()) {
        throw protocol::OutOfOrderChunk("chunk " + std::to_string(header.chunk_number) +
                                        " arrived after the final chunk");
    }
    if (header.chunk_number != next_chunk_) {
        throw protocol::OutOfOrderChunk("expected chunk " + std::to_string(next_chunk_) +
                                        ", got " + std::to_string(header.chunk_number));
    }

    ChunkRange range = plan_.range(next_chunk_ - 1);
    if (header.chunk_size != range.length || data.size() != header.chunk_size) {
        throw protocol::OutOfOrderChunk("chunk " + std::to_string(header.chunk_number) + " carries " +
                                        std::to_string(data.size()) + " bytes (header says " +
                                        std::to_string(header.chunk_size) + "), expected " +
                                        std::to_string(range.length));
    }

    sink_.append(data.data(), data.size());
    bytes_received_ += data.size();
    ++next_chunk_;
}

void ChunkAssembler::finish() {
    if (!complete()) {
        throw protocol::OutOfOrderChunk("transfer ended after " + std::to_string(next_chunk_ - 1) +
                                        " of " + std::to_string(plan_.num_chunks()) + " chunks");
    }
    if (bytes_received_ != plan_.file_size()) {
        throw protocol::OutOfOrderChunk("received " + std::to_string(bytes_received_) + " bytes, file_info announced " +
                                        std::to_string(plan_.file_size()));
    }
    sink_.commit();
}

// ─── MessageSender ──────────────────────────────────────────────────────────

void MessageSender::send(boost::asio::ip::tcp::socket& socket, const protocol::Command& command) {
    protocol::write_frame(socket, protocol::encode(command));
}

void MessageSender::send(boost::asio::ip::tcp::socket& socket, const protocol::Response& response) {
    protocol::write_frame(socket, protocol::encode(response));
}

bool MessageSender::send_file(boost::asio::ip::tcp::socket& socket, storage::FileReader& reader,
                              const std::string& filename, uint32_t max_chunk_size,
                              ChunkSentCallback on_chunk) {
    ChunkPlan plan(reader.size(), max_chunk_size);
    send(socket, protocol::FileInfo{filename, plan.file_size(), plan.num_chunks(), max_chunk_size});

    for (uint32_t index = 0; index < plan.num_chunks(); ++index) {
        ChunkRange range = plan.range(index);
        std::vector<char> data;
        try {
            data = reader.read(range.offset, range.length);
        } catch (const protocol::IOFailure& e) {
            send(socket, protocol::Error{std::string("Error sending file: ") + e.what()});
            return false;
        }

        send(socket, protocol::ChunkHeader{index + 1, plan.num_chunks(), static_cast<uint32_t>(data.size())});
        protocol::write_frame(socket, data);

        if (on_chunk) {
            on_chunk(index + 1, plan.num_chunks());
        }
    }

    send(socket, protocol::FileComplete{filename});
    return true;
}

// ─── MessageReceiver ────────────────────────────────────────────────────────

protocol::Command MessageReceiver::receive_command(boost::asio::ip::tcp::socket& socket,
                                                   const protocol::FrameLimits& limits) {
    return protocol::decode_command(protocol::read_frame(socket, limits));
}

protocol::Response MessageReceiver::receive_response(boost::asio::ip::tcp::socket& socket,
                                                     const protocol::FrameLimits& limits) {
    return protocol::decode_response(protocol::read_frame(socket, limits));
}

TransferOutcome MessageReceiver::receive_file(boost::asio::ip::tcp::socket& socket,
                                              const protocol::FileInfo& info,
                                              const std::filesystem::path& destination,
                                              const protocol::FrameLimits& limits,
                                              ProgressCallback progress_cb) {
    std::optional<ChunkPlan> expected;
    try {
        expected.emplace(info.file_size, info.chunk_size);
    } catch (const std::invalid_argument& e) {
        throw protocol::MalformedMessage("file_info for '" + info.filename + "' is unusable: " + e.what());
    }
    if (info.num_chunks != expected->num_chunks()) {
        // The chunk count drives how many frames follow, so the stream cannot be trusted.
        throw protocol::MalformedMessage("file_info for '" + info.filename + "' announces " +
                                         std::to_string(info.num_chunks) + " chunks, expected " +
                                         std::to_string(expected->num_chunks()));
    }

    std::string failure;
    std::unique_ptr<storage::DownloadSink> sink;
    std::optional<ChunkAssembler> assembler;
    try {
        sink = std::make_unique<storage::DownloadSink>(destination);
        assembler.emplace(info, *sink);
    } catch (const protocol::IOFailure& e) {
        failure = e.what();
    }

    for (uint32_t i = 0; i < info.num_chunks; ++i) {
        protocol::Response response = receive_response(socket, limits);
        if (auto* error = std::get_if<protocol::Error>(&response)) {
            // The server gave up on this file; nothing else follows for it.
            uint64_t received = assembler ? assembler->bytes_received() : 0;
            return {TransferState::FAILED, received, error->message};
        }
        auto* header = std::get_if<protocol::ChunkHeader>(&response);
        if (header == nullptr) {
            throw protocol::MalformedMessage("expected file_chunk, got " + protocol::type_name(response));
        }
        std::vector<char> data = protocol::read_frame(socket, limits);

        if (!failure.empty()) {
            continue;  // draining the rest of a failed file
        }
        try {
            assembler->append(*header, data);
        } catch (const protocol::OutOfOrderChunk& e) {
            failure = e.what();
            sink->discard();
            continue;
        } catch (const protocol::IOFailure& e) {
            failure = e.what();
            sink->discard();
            continue;
        }

        logging::debug("Received chunk " + std::to_string(header->chunk_number) + "/" +
                       std::to_string(header->total_chunks) + " of " + info.filename);
        if (progress_cb) {
            progress_cb(ProgressEvent{info.filename, header->chunk_number, header->total_chunks,
                                      assembler->bytes_received(), info.file_size,
                                      progress_percent(assembler->bytes_received(), info.file_size)});
        }
    }

    protocol::Response trailer = receive_response(socket, limits);
    auto* complete = std::get_if<protocol::FileComplete>(&trailer);
    if (complete == nullptr) {
        throw protocol::MalformedMessage("expected file_complete, got " + protocol::type_name(trailer));
    }
    if (complete->filename != info.filename) {
        throw protocol::MalformedMessage("file_complete for '" + complete->filename +
                                         "' while receiving '" + info.filename + "'");
    }

    uint64_t received = assembler ? assembler->bytes_received() : 0;
    if (!failure.empty()) {
        return {TransferState::FAILED, received, failure};
    }
    try {
        assembler->finish();
    } catch (const protocol::ProtocolError& e) {
        return {TransferState::FAILED, received, e.what()};
    }
    return {TransferState::COMPLETED, received, ""};
}

} // namespace transfer
