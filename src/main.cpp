#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "file_store.hpp"
#include "log.hpp"
#include "networking.hpp"
#include "protocol/errors.hpp"

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  chunkfetch serve [options]                 serve a directory\n"
              << "  chunkfetch list [options]                  list files on a server\n"
              << "  chunkfetch get <file> [options]            download one file\n"
              << "  chunkfetch get-many <file>... [options]    download several files\n"
              << "Run 'chunkfetch serve --help' or 'chunkfetch list --help' for options.\n";
}

int run_server(const config::ServerConfig& cfg) {
    storage::FileDirectory directory(cfg.directory);
    networking::Server server(cfg, directory);

    // Shutdown is process-level only: SIGINT/SIGTERM stop the accept loop and close sessions
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logging::info("Received signal " + std::to_string(signo) + ", server shutting down...");
            server.stop();
        }
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    try {
        server.run();
    } catch (...) {
        signal_io.stop();
        signal_thread.join();
        throw;
    }
    signal_io.stop();
    signal_thread.join();
    return 0;
}

void print_file_list(const std::vector<protocol::FileListEntry>& files) {
    if (files.empty()) {
        std::cout << "No files available on the server\n";
        return;
    }
    std::cout << "\nAvailable files on server:\n" << std::string(60, '-') << "\n";
    std::cout << std::left << std::setw(4) << "#" << std::setw(30) << "Filename"
              << std::setw(11) << "Size (MB)" << "Size (bytes)\n";
    std::cout << std::string(60, '-') << "\n";
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::cout << std::left << std::setw(4) << (i + 1) << std::setw(30) << files[i].name
                  << std::setw(11) << std::fixed << std::setprecision(2) << files[i].size_mb
                  << files[i].size << "\n";
    }
    std::cout << std::string(60, '-') << std::endl;
}

void print_progress(const transfer::ProgressEvent& event) {
    std::cout << "Downloading " << event.filename << " part " << event.chunk_number
              << " .... " << std::fixed << std::setprecision(1) << event.percent << "%" << std::endl;
}

void print_batch_summary(const networking::BatchResult& batch) {
    std::cout << "\nBatch summary:\n";
    for (const auto& file : batch.files) {
        if (file.success) {
            std::cout << "  [ok]     " << file.filename << " -> " << file.path.string() << "\n";
        } else {
            std::cout << "  [failed] " << file.filename << ": " << file.message << "\n";
        }
    }
    std::cout << (batch.success ? "All files downloaded successfully." : "Some files could not be downloaded.")
              << std::endl;
}

int run_client(const config::ClientConfig& cfg) {
    networking::Client client(cfg);
    client.connect();

    switch (cfg.action) {
        case config::ClientAction::LIST:
            try {
                print_file_list(client.list_files());
            } catch (const protocol::RemoteError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
            return 0;
        case config::ClientAction::GET: {
            networking::FileResult result = client.download_file(cfg.filenames.front(), print_progress);
            if (!result.success) {
                std::cerr << "Download of " << result.filename << " failed: " << result.message << "\n";
                return 1;
            }
            std::cout << "Saved to " << result.path.string() << "\n";
            return 0;
        }
        case config::ClientAction::GET_MANY: {
            networking::BatchResult batch = client.download_multiple(cfg.filenames, print_progress);
            print_batch_summary(batch);
            return batch.success ? 0 : 1;
        }
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string mode = argv[1];
    if (mode == "-h" || mode == "--help") {
        print_usage();
        return 0;
    }

    try {
        if (mode == "serve") {
            // "serve" stands in for the program name so option parsing starts after it
            auto cfg = config::parse_server_args(argc - 1, argv + 1);
            if (!cfg) {
                return 0;
            }
            if (cfg->verbose) {
                logging::Logger::get().set_level(logging::Level::DEBUG);
            }
            return run_server(*cfg);
        }

        auto cfg = config::parse_client_args(argc, argv);
        if (!cfg) {
            return 0;
        }
        if (cfg->verbose) {
            logging::Logger::get().set_level(logging::Level::DEBUG);
        }
        return run_client(*cfg);
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
