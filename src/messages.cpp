#include "protocol/messages.hpp"
#include "protocol/errors.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace protocol {

namespace {

template <typename T> struct MessageTag;
template <> struct MessageTag<ListFiles>        { static constexpr const char* value = "list_files"; };
template <> struct MessageTag<DownloadFile>     { static constexpr const char* value = "download_file"; };
template <> struct MessageTag<DownloadMultiple> { static constexpr const char* value = "download_multiple"; };
template <> struct MessageTag<Disconnect>       { static constexpr const char* value = "disconnect"; };
template <> struct MessageTag<FileList>         { static constexpr const char* value = "file_list"; };
template <> struct MessageTag<FileInfo>         { static constexpr const char* value = "file_info"; };
template <> struct MessageTag<ChunkHeader>      { static constexpr const char* value = "file_chunk"; };
template <> struct MessageTag<Error>            { static constexpr const char* value = "error"; };
template <> struct MessageTag<FileComplete>     { static constexpr const char* value = "file_complete"; };
template <> struct MessageTag<BatchStart>       { static constexpr const char* value = "multiple_transfer_start"; };
template <> struct MessageTag<BatchComplete>    { static constexpr const char* value = "multiple_transfer_complete"; };

template <typename T>
nlohmann::json to_tagged_json(const T& message) {
    nlohmann::json j = nlohmann::json::object();
    if constexpr (!std::is_empty_v<T>) {
        j = message;
    }
    j["type"] = MessageTag<T>::value;
    return j;
}

// File names are not guaranteed to be valid UTF-8.
std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// nlohmann converts -1 or 1.7 to an unsigned field without complaint, and
// truncates anything above the target width.
void require_unsigned(const nlohmann::json& j, const char* field, uint64_t max) {
    auto it = j.find(field);
    if (it == j.end()) {
        return;  // reported by get<T>() as a missing key
    }
    if (!it->is_number_unsigned() || it->get<uint64_t>() > max) {
        throw MalformedMessage(std::string("field \"") + field + "\" must be an integer in [0, " +
                               std::to_string(max) + "]");
    }
}

constexpr uint64_t MAX_U32 = std::numeric_limits<uint32_t>::max();
constexpr uint64_t MAX_U64 = std::numeric_limits<uint64_t>::max();

template <typename T>
void check_unsigned_fields(const nlohmann::json& j) {
    if constexpr (std::is_same_v<T, FileInfo>) {
        require_unsigned(j, "file_size", MAX_U64);
        require_unsigned(j, "num_chunks", MAX_U32);
        require_unsigned(j, "chunk_size", MAX_U32);
    } else if constexpr (std::is_same_v<T, ChunkHeader>) {
        require_unsigned(j, "chunk_number", MAX_U32);
        require_unsigned(j, "total_chunks", MAX_U32);
        require_unsigned(j, "chunk_size", MAX_U32);
    } else if constexpr (std::is_same_v<T, BatchStart> || std::is_same_v<T, BatchComplete>) {
        require_unsigned(j, "total_files", MAX_U32);
    } else if constexpr (std::is_same_v<T, FileList>) {
        auto files = j.find("files");
        if (files != j.end() && files->is_array()) {
            for (const auto& entry : *files) {
                if (entry.is_object()) {
                    require_unsigned(entry, "size", MAX_U64);
                }
            }
        }
    }
}

// Alternatives of the variant V are tried in order until one matches the tag.
template <typename V, std::size_t I = 0>
V from_tagged_json(const std::string& type, const nlohmann::json& j) {
    if constexpr (I == std::variant_size_v<V>) {
        throw MalformedMessage("unknown message type '" + type + "'");
    } else {
        using T = std::variant_alternative_t<I, V>;
        if (type == MessageTag<T>::value) {
            if constexpr (std::is_empty_v<T>) {
                return V{T{}};
            } else {
                check_unsigned_fields<T>(j);
                return V{j.get<T>()};
            }
        }
        return from_tagged_json<V, I + 1>(type, j);
    }
}

template <typename V>
V decode_variant(const std::vector<char>& payload) {
    try {
        nlohmann::json j = nlohmann::json::parse(payload.begin(), payload.end());
        if (!j.is_object()) {
            throw MalformedMessage("message is not a JSON object");
        }
        auto it = j.find("type");
        if (it == j.end() || !it->is_string()) {
            throw MalformedMessage("message has no \"type\" field");
        }
        return from_tagged_json<V>(it->get<std::string>(), j);
    } catch (const nlohmann::json::exception& e) {
        throw MalformedMessage(std::string("cannot decode message: ") + e.what());
    }
}

} // namespace

std::string encode(const Command& command) {
    return std::visit([](const auto& c) { return dump(to_tagged_json(c)); }, command);
}

std::string encode(const Response& response) {
    return std::visit([](const auto& r) { return dump(to_tagged_json(r)); }, response);
}

Command decode_command(const std::vector<char>& payload) {
    return decode_variant<Command>(payload);
}

Response decode_response(const std::vector<char>& payload) {
    return decode_variant<Response>(payload);
}

std::string type_name(const Command& command) {
    return std::visit([](const auto& c) -> std::string {
        return MessageTag<std::decay_t<decltype(c)>>::value;
    }, command);
}

std::string type_name(const Response& response) {
    return std::visit([](const auto& r) -> std::string {
        return MessageTag<std::decay_t<decltype(r)>>::value;
    }, response);
}

double to_megabytes(uint64_t bytes) {
    return std::round(static_cast<double>(bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
}

} // namespace protocol
