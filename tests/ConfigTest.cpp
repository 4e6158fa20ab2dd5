#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "TestUtils.hpp"
#include "config.hpp"

namespace {

// Keeps the strings alive for the char* view handed to the parsers.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (const auto& arg : storage_) {
            argv_.push_back(arg.c_str());
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    const char* const* argv() const { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<const char*> argv_;
};

std::optional<config::ServerConfig> parse_server(const Args& args) {
    return config::parse_server_args(args.argc(), args.argv());
}

std::optional<config::ClientConfig> parse_client(const Args& args) {
    return config::parse_client_args(args.argc(), args.argv());
}

} // namespace

// ─── Server ─────────────────────────────────────────────────────────────────

TEST(ConfigTest, ServerDefaults) {
    auto cfg = parse_server({"serve"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->host, "127.0.0.1");
    EXPECT_EQ(cfg->port, 8888);
    EXPECT_EQ(cfg->directory, "server_files");
    EXPECT_EQ(cfg->max_chunk_size, 1048576u);
    EXPECT_EQ(cfg->limits.buffer_size, 4096u);
    EXPECT_EQ(cfg->limits.max_frame_size, 16u * 1024 * 1024);
    EXPECT_FALSE(cfg->verbose);
}

TEST(ConfigTest, ServerOverrides) {
    auto cfg = parse_server({"serve", "--host", "0.0.0.0", "-p", "9000", "-d", "/srv/files",
                             "--chunk-size", "65536", "--buffer-size", "1024", "-v"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->host, "0.0.0.0");
    EXPECT_EQ(cfg->port, 9000);
    EXPECT_EQ(cfg->directory, "/srv/files");
    EXPECT_EQ(cfg->max_chunk_size, 65536u);
    EXPECT_EQ(cfg->limits.buffer_size, 1024u);
    EXPECT_TRUE(cfg->verbose);
}

TEST(ConfigTest, HelpReturnsNothing) {
    testing::internal::CaptureStdout();
    auto server = parse_server({"serve", "--help"});
    auto client = parse_client({"chunkfetch", "-h"});
    std::string usage = testing::internal::GetCapturedStdout();

    EXPECT_FALSE(server.has_value());
    EXPECT_FALSE(client.has_value());
    EXPECT_NE(usage.find("--chunk-size"), std::string::npos);
    EXPECT_NE(usage.find("--output"), std::string::npos);
}

TEST(ConfigTest, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(parse_server({"serve", "--chunk-size", "0"}), config::ConfigError);
}

TEST(ConfigTest, FrameLimitMustHoldAFullChunk) {
    EXPECT_THROW(parse_server({"serve", "--chunk-size", "2048", "--max-frame-size", "1024"}),
                 config::ConfigError);
    EXPECT_NO_THROW(parse_server({"serve", "--chunk-size", "1024", "--max-frame-size", "1024"}));
}

TEST(ConfigTest, ZeroBufferSizeIsRejected) {
    EXPECT_THROW(parse_server({"serve", "--buffer-size", "0"}), config::ConfigError);
    EXPECT_THROW(parse_client({"chunkfetch", "list", "--buffer-size", "0"}), config::ConfigError);
}

TEST(ConfigTest, PortOutOfRangeIsRejected) {
    EXPECT_THROW(parse_server({"serve", "--port", "70000"}), config::ConfigError);
}

TEST(ConfigTest, MalformedValueIsRejected) {
    EXPECT_THROW(parse_server({"serve", "--port", "eighty"}), config::ConfigError);
}

TEST(ConfigTest, UnknownOptionIsRejected) {
    EXPECT_THROW(parse_server({"serve", "--colour"}), config::ConfigError);
}

TEST(ConfigTest, UnreadableConfigFileIsRejected) {
    testutil::TempDir dir;
    EXPECT_THROW(parse_server({"serve", "--config", (dir / "missing.ini").string()}), config::ConfigError);
}

TEST(ConfigTest, CommandLineWinsOverConfigFile) {
    testutil::TempDir dir;
    auto ini = dir / "server.ini";
    {
        std::ofstream out(ini);
        out << "port = 9100\n"
            << "directory = /data/shared\n"
            << "chunk-size = 4096\n";
    }

    auto cfg = parse_server({"serve", "-c", ini.string(), "--port", "9200"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->port, 9200);
    EXPECT_EQ(cfg->directory, "/data/shared");
    EXPECT_EQ(cfg->max_chunk_size, 4096u);
}

// ─── Client ─────────────────────────────────────────────────────────────────

TEST(ConfigTest, ClientList) {
    auto cfg = parse_client({"chunkfetch", "list"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->action, config::ClientAction::LIST);
    EXPECT_TRUE(cfg->filenames.empty());
    EXPECT_EQ(cfg->host, "127.0.0.1");
    EXPECT_EQ(cfg->port, 8888);
    EXPECT_EQ(cfg->output_directory, "downloads");
}

TEST(ConfigTest, ClientGetTakesOneFile) {
    auto cfg = parse_client({"chunkfetch", "get", "report.pdf", "-o", "/tmp/out", "--port", "9001"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->action, config::ClientAction::GET);
    EXPECT_EQ(cfg->filenames, std::vector<std::string>{"report.pdf"});
    EXPECT_EQ(cfg->output_directory, "/tmp/out");
    EXPECT_EQ(cfg->port, 9001);

    EXPECT_THROW(parse_client({"chunkfetch", "get"}), config::ConfigError);
    EXPECT_THROW(parse_client({"chunkfetch", "get", "a", "b"}), config::ConfigError);
}

TEST(ConfigTest, ClientGetManyKeepsOrder) {
    auto cfg = parse_client({"chunkfetch", "get-many", "c.txt", "a.txt", "b.txt"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->action, config::ClientAction::GET_MANY);
    EXPECT_EQ(cfg->filenames, (std::vector<std::string>{"c.txt", "a.txt", "b.txt"}));

    EXPECT_THROW(parse_client({"chunkfetch", "get-many"}), config::ConfigError);
}

TEST(ConfigTest, ClientCommandIsRequired) {
    EXPECT_THROW(parse_client({"chunkfetch"}), config::ConfigError);
    EXPECT_THROW(parse_client({"chunkfetch", "delete", "a"}), config::ConfigError);
    EXPECT_THROW(parse_client({"chunkfetch", "list", "extra"}), config::ConfigError);
}

TEST(ConfigTest, ValidateRejectsEmptyDirectories) {
    config::ServerConfig server;
    server.directory.clear();
    EXPECT_THROW(config::validate(server), config::ConfigError);

    config::ClientConfig client;
    client.output_directory.clear();
    EXPECT_THROW(config::validate(client), config::ConfigError);
}
