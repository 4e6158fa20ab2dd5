#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

// ─── Commands (client → server) ─────────────────────────────────────────────

struct ListFiles {};

struct DownloadFile {
    std::string filename;
};

struct DownloadMultiple {
    std::vector<std::string> filenames;
};

struct Disconnect {};

using Command = std::variant<ListFiles, DownloadFile, DownloadMultiple, Disconnect>;

// ─── Responses (server → client) ────────────────────────────────────────────

struct FileListEntry {
    std::string name;
    uint64_t size;
    double size_mb;
};

struct FileList {
    std::vector<FileListEntry> files;
};

struct FileInfo {
    std::string filename;
    uint64_t file_size;
    uint32_t num_chunks;
    uint32_t chunk_size;  // maximum chunk size used for this transfer
};

// Announces the raw frame that immediately follows it.
struct ChunkHeader {
    uint32_t chunk_number;  // 1-based
    uint32_t total_chunks;
    uint32_t chunk_size;    // exact length of the following raw frame
};

struct Error {
    std::string message;
};

struct FileComplete {
    std::string filename;
};

struct BatchStart {
    uint32_t total_files;
    std::vector<std::string> filenames;
};

struct BatchComplete {
    uint32_t total_files;
};

using Response = std::variant<FileList, FileInfo, ChunkHeader, Error,
                              FileComplete, BatchStart, BatchComplete>;

// Map JSON fields automatically using nlohmann; the "type" tag is handled by the codec
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DownloadFile, filename)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DownloadMultiple, filenames)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileListEntry, name, size, size_mb)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileList, files)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileInfo, filename, file_size, num_chunks, chunk_size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChunkHeader, chunk_number, total_chunks, chunk_size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Error, message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileComplete, filename)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BatchStart, total_files, filenames)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BatchComplete, total_files)

// ─── Codec ──────────────────────────────────────────────────────────────────

std::string encode(const Command& command);
std::string encode(const Response& response);

// Both throw MalformedMessage on invalid JSON, unknown "type" or a missing field.
Command decode_command(const std::vector<char>& payload);
Response decode_response(const std::vector<char>& payload);

// Wire tag of the held alternative, e.g. "download_file".
std::string type_name(const Command& command);
std::string type_name(const Response& response);

// Listing size in MiB, rounded to two decimals.
double to_megabytes(uint64_t bytes);

} // namespace protocol
