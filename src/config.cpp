#include "config.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace config {

namespace {

struct NetworkOptions {
    std::string host;
    unsigned int port;
    uint32_t max_frame_size;
    std::size_t buffer_size;
    bool verbose = false;
};

void add_network_options(po::options_description& desc, NetworkOptions& net) {
    desc.add_options()
        ("host", po::value<std::string>(&net.host)->default_value(net.host), "server address")
        ("port,p", po::value<unsigned int>(&net.port)->default_value(net.port), "server TCP port")
        ("buffer-size", po::value<std::size_t>(&net.buffer_size)->default_value(net.buffer_size),
         "socket read granularity in bytes")
        ("max-frame-size", po::value<uint32_t>(&net.max_frame_size)->default_value(net.max_frame_size),
         "largest frame accepted from the peer, in bytes")
        ("verbose,v", po::bool_switch(&net.verbose), "log every chunk");
}

po::options_description generic_options() {
    po::options_description desc("Generic options");
    desc.add_options()
        ("help,h", "print this help")
        ("config,c", po::value<std::string>(), "read options from an INI-style file");
    return desc;
}

// Command line first, then the config file for anything left at its default.
// Returns false if --help was given.
bool parse(int argc, const char* const argv[], const po::options_description& settings,
           const po::positional_options_description& positional, const char* usage) {
    po::options_description cmdline;
    cmdline.add(generic_options()).add(settings);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(cmdline).positional(positional).run(), vm);

        if (vm.count("help")) {
            std::cout << usage << "\n" << cmdline << "\n";
            return false;
        }

        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream ifs(path);
            if (!ifs) {
                throw ConfigError("cannot open config file " + path);
            }
            po::store(po::parse_config_file(ifs, settings), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }
    return true;
}

unsigned short to_port(unsigned int port) {
    if (port > 65535) {
        throw ConfigError("port " + std::to_string(port) + " is out of range");
    }
    return static_cast<unsigned short>(port);
}

} // namespace

std::optional<ServerConfig> parse_server_args(int argc, const char* const argv[]) {
    ServerConfig cfg;
    NetworkOptions net{cfg.host, cfg.port, cfg.limits.max_frame_size, cfg.limits.buffer_size};

    po::options_description settings("Server options");
    add_network_options(settings, net);
    settings.add_options()
        ("directory,d", po::value<std::string>(&cfg.directory)->default_value(cfg.directory),
         "directory whose files are served")
        ("chunk-size", po::value<uint32_t>(&cfg.max_chunk_size)->default_value(cfg.max_chunk_size),
         "maximum chunk size in bytes");

    if (!parse(argc, argv, settings, po::positional_options_description(),
               "Usage: chunkfetch serve [options]")) {
        return std::nullopt;
    }

    cfg.host = net.host;
    cfg.port = to_port(net.port);
    cfg.limits.max_frame_size = net.max_frame_size;
    cfg.limits.buffer_size = net.buffer_size;
    cfg.verbose = net.verbose;
    validate(cfg);
    return cfg;
}

std::optional<ClientConfig> parse_client_args(int argc, const char* const argv[]) {
    ClientConfig cfg;
    NetworkOptions net{cfg.host, cfg.port, cfg.limits.max_frame_size, cfg.limits.buffer_size};
    std::string command;
    std::vector<std::string> files;

    po::options_description settings("Client options");
    add_network_options(settings, net);
    settings.add_options()
        ("output,o", po::value<std::string>(&cfg.output_directory)->default_value(cfg.output_directory),
         "directory downloads are written to");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command))
        ("files", po::value<std::vector<std::string>>(&files));
    po::options_description all;
    all.add(settings).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("files", -1);

    if (!parse(argc, argv, all, positional,
               "Usage: chunkfetch [options] list | get <file> | get-many <file>...")) {
        return std::nullopt;
    }

    if (command == "list") {
        if (!files.empty()) {
            throw ConfigError("'list' takes no file names");
        }
        cfg.action = ClientAction::LIST;
    } else if (command == "get") {
        if (files.size() != 1) {
            throw ConfigError("'get' takes exactly one file name");
        }
        cfg.action = ClientAction::GET;
    } else if (command == "get-many") {
        if (files.empty()) {
            throw ConfigError("'get-many' needs at least one file name");
        }
        cfg.action = ClientAction::GET_MANY;
    } else if (command.empty()) {
        throw ConfigError("missing command: expected list, get or get-many");
    } else {
        throw ConfigError("unknown command '" + command + "'");
    }

    cfg.host = net.host;
    cfg.port = to_port(net.port);
    cfg.limits.max_frame_size = net.max_frame_size;
    cfg.limits.buffer_size = net.buffer_size;
    cfg.verbose = net.verbose;
    cfg.filenames = std::move(files);
    validate(cfg);
    return cfg;
}

void validate(const ServerConfig& cfg) {
    if (cfg.directory.empty()) {
        throw ConfigError("directory must not be empty");
    }
    if (cfg.max_chunk_size == 0) {
        throw ConfigError("chunk-size must be greater than zero");
    }
    if (cfg.limits.buffer_size == 0) {
        throw ConfigError("buffer-size must be greater than zero");
    }
    if (cfg.limits.max_frame_size < cfg.max_chunk_size) {
        throw ConfigError("max-frame-size (" + std::to_string(cfg.limits.max_frame_size) +
                          ") must be at least chunk-size (" + std::to_string(cfg.max_chunk_size) + ")");
    }
}

void validate(const ClientConfig& cfg) {
    if (cfg.output_directory.empty()) {
        throw ConfigError("output directory must not be empty");
    }
    if (cfg.limits.buffer_size == 0) {
        throw ConfigError("buffer-size must be greater than zero");
    }
    if (cfg.limits.max_frame_size == 0) {
        throw ConfigError("max-frame-size must be greater than zero");
    }
}

} // namespace config
