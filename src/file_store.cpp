#include "file_store.hpp"
#include "protocol/errors.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace storage {

bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

// ─── FileReader ─────────────────────────────────────────────────────────────

FileReader::FileReader(const fs::path& path)
    : path_(path), file_(path, std::ios::binary), size_(0) {
    if (!file_.is_open()) {
        throw protocol::IOFailure("Could not open file for reading: " + path.string());
    }
    std::error_code ec;
    size_ = fs::file_size(path, ec);
    if (ec) {
        throw protocol::IOFailure("Could not stat " + path.string() + ": " + ec.message());
    }
}

std::vector<char> FileReader::read(uint64_t offset, uint32_t length) {
    std::vector<char> buffer(length);
    if (length == 0) {
        return buffer;
    }
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(buffer.data(), length);
    if (static_cast<uint64_t>(file_.gcount()) != length) {
        throw protocol::IOFailure("Short read on " + path_.string() + " at offset " + std::to_string(offset) +
                                  ": got " + std::to_string(file_.gcount()) + " of " +
                                  std::to_string(length) + " bytes");
    }
    return buffer;
}

// ─── FileDirectory ──────────────────────────────────────────────────────────

FileDirectory::FileDirectory(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        fs::create_directories(root_, ec);
        if (ec) {
            throw protocol::IOFailure("Could not create directory " + root_.string() + ": " + ec.message());
        }
    }
}

std::vector<FileEntry> FileDirectory::list() const {
    std::vector<FileEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw protocol::IOFailure("Cannot read directory " + root_.string() + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        auto size = it->file_size(entry_ec);
        if (entry_ec) {
            continue;  // vanished between listing and stat
        }
        entries.push_back({it->path().filename().string(), size});
    }
    if (ec) {
        throw protocol::IOFailure("Cannot read directory " + root_.string() + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });
    return entries;
}

FileReader FileDirectory::open_for_read(const std::string& name) const {
    if (!is_plain_file_name(name)) {
        throw protocol::NotFound("File '" + name + "' not found");
    }
    fs::path path = root_ / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw protocol::NotFound("File '" + name + "' not found");
    }
    return FileReader(path);
}

// ─── DownloadSink ───────────────────────────────────────────────────────────

DownloadSink::DownloadSink(fs::path path)
    : path_(std::move(path)) {
    part_path_ = path_;
    part_path_ += ".part";

    fs::path parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw protocol::IOFailure("Could not create directory " + parent.string() + ": " + ec.message());
        }
    }

    file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw protocol::IOFailure("Could not open file for writing: " + part_path_.string());
    }
}

DownloadSink::~DownloadSink() {
    if (!committed_) {
        discard();
    }
}

void DownloadSink::append(const char* data, std::size_t size) {
    if (committed_ || !file_.is_open()) {
        throw protocol::IOFailure("Write to closed download " + path_.string());
    }
    file_.write(data, static_cast<std::streamsize>(size));
    if (!file_) {
        throw protocol::IOFailure("Write failed on " + part_path_.string());
    }
    bytes_written_ += size;
}

void DownloadSink::commit() {
    if (committed_) {
        return;
    }
    file_.close();
    if (file_.fail()) {
        throw protocol::IOFailure("Could not flush " + part_path_.string());
    }
    std::error_code ec;
    fs::rename(part_path_, path_, ec);
    if (ec) {
        throw protocol::IOFailure("Failed to rename temp file to: " + path_.string() + ": " + ec.message());
    }
    committed_ = true;
}

void DownloadSink::discard() {
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    fs::remove(part_path_, ec);
}

} // namespace storage
