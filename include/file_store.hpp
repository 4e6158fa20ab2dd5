#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace storage {

struct FileEntry {
    std::string name;
    uint64_t size;
};

// Random-access reader over one served file. The size is captured at open
// time and treated as fixed for the lifetime of the reader.
class FileReader {
public:
    explicit FileReader(const std::filesystem::path& path);

    uint64_t size() const { return size_; }
    const std::filesystem::path& path() const { return path_; }

    // Reads exactly length bytes at offset; throws IOFailure on a short read.
    std::vector<char> read(uint64_t offset, uint32_t length);

private:
    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_;
};

// The read-only directory a server exposes. Only plain file names directly
// inside the root are reachable.
class FileDirectory {
public:
    // Creates the root directory if it does not exist yet.
    explicit FileDirectory(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Regular files in the root, sorted by name. Throws IOFailure.
    std::vector<FileEntry> list() const;

    // Throws NotFound if name is absent or not a plain file name, IOFailure if it cannot be opened.
    FileReader open_for_read(const std::string& name) const;

private:
    std::filesystem::path root_;
};

// Append-only output for one download. Bytes go to "<path>.part"; commit()
// renames it to the final path. An uncommitted part file is removed on destruction.
class DownloadSink {
public:
    explicit DownloadSink(std::filesystem::path path);
    ~DownloadSink();

    DownloadSink(const DownloadSink&) = delete;
    DownloadSink& operator=(const DownloadSink&) = delete;

    void append(const char* data, std::size_t size);
    void commit();
    void discard();

    uint64_t bytes_written() const { return bytes_written_; }
    const std::filesystem::path& path() const { return path_; }
    const std::filesystem::path& part_path() const { return part_path_; }
    bool committed() const { return committed_; }

private:
    std::filesystem::path path_;
    std::filesystem::path part_path_;
    std::ofstream file_;
    uint64_t bytes_written_ = 0;
    bool committed_ = false;
};

// Accepts names like "report.pdf"; rejects empty names, "." and "..", and anything with a separator.
bool is_plain_file_name(const std::string& name);

} // namespace storage
