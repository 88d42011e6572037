#include "lanshare/base/config.h"
#include "lanshare/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace lanshare {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Parse an unsigned integer that must fit in T; throws on negative or out of range input
template <typename T>
T parse_unsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected an unsigned integer: " + value);
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters in integer: " + value);
    }
    if (parsed > std::numeric_limits<T>::max()) {
        throw std::out_of_range("value out of range: " + value);
    }
    return static_cast<T>(parsed);
}

uint16_t parse_port(const std::string& value) {
    return parse_unsigned<uint16_t>(value);
}

// Read an optional unsigned JSON field into out, rejecting negatives and values that do not fit
template <typename T>
void read_unsigned(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    auto value = it->get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        throw std::out_of_range(fmt::format("{} out of range: {}", key, value));
    }
    out = static_cast<T>(value);
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

// Scan argv for -c/--config so the file can be applied before command line overrides
std::string find_config_argument(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        const std::string prefix = "--config=";
        if (arg.rfind(prefix, 0) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    bool loaded = false;
    if (std::filesystem::path(path).extension() == ".json") {
        loaded = load_json(path);
    } else {
        loaded = load_ini(path);
    }

    if (loaded) {
        config_file_ = path;
        Logger::instance().info("Config loaded successfully from: " + path);
    }
    return loaded;
}

bool Config::load_ini(const std::string& path) {
    std::map<std::string, std::map<std::string, std::string>> sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }

    GlobalConfig next = config_;
    try {
        if (sections.count("log")) {
            auto& s = sections["log"];
            if (s.count("level")) next.log.level = s["level"];
            if (s.count("output")) next.log.output = s["output"];
            if (s.count("file_path")) next.log.file_path = s["file_path"];
        }

        if (sections.count("node")) {
            auto& s = sections["node"];
            if (s.count("hostname") && !s["hostname"].empty()) next.node.hostname = s["hostname"];
        }

        if (sections.count("discovery")) {
            auto& s = sections["discovery"];
            auto& d = next.discovery;
            if (s.count("port")) d.port = parse_port(s["port"]);
            if (s.count("bind_address")) d.bind_address = s["bind_address"];
            if (s.count("broadcast_address")) d.broadcast_address = s["broadcast_address"];
            if (s.count("broadcast_interval_sec")) d.broadcast_interval_sec = parse_unsigned<uint32_t>(s["broadcast_interval_sec"]);
            if (s.count("cleanup_interval_sec")) d.cleanup_interval_sec = parse_unsigned<uint32_t>(s["cleanup_interval_sec"]);
            if (s.count("peer_timeout_sec")) d.peer_timeout_sec = parse_unsigned<uint32_t>(s["peer_timeout_sec"]);
            if (s.count("max_text_chars")) d.max_text_chars = parse_unsigned<size_t>(s["max_text_chars"]);
            if (s.count("max_datagram_size")) d.max_datagram_size = parse_unsigned<size_t>(s["max_datagram_size"]);
            if (s.count("receive_error_backoff_ms")) d.receive_error_backoff_ms = parse_unsigned<uint32_t>(s["receive_error_backoff_ms"]);
            if (s.count("announce_on_start")) d.announce_on_start = parse_bool(s["announce_on_start"]);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    config_ = std::move(next);
    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }

    GlobalConfig next = config_;
    try {
        json root = json::parse(file);

        if (root.contains("log")) {
            const auto& s = root["log"];
            next.log.level = s.value("level", next.log.level);
            next.log.output = s.value("output", next.log.output);
            next.log.file_path = s.value("file_path", next.log.file_path);
        }

        if (root.contains("node")) {
            const auto& s = root["node"];
            if (s.contains("hostname") && s["hostname"].is_string()) {
                next.node.hostname = s["hostname"].get<std::string>();
            }
        }

        if (root.contains("discovery")) {
            const auto& s = root["discovery"];
            auto& d = next.discovery;
            read_unsigned(s, "port", d.port);
            d.bind_address = s.value("bind_address", d.bind_address);
            d.broadcast_address = s.value("broadcast_address", d.broadcast_address);
            read_unsigned(s, "broadcast_interval_sec", d.broadcast_interval_sec);
            read_unsigned(s, "cleanup_interval_sec", d.cleanup_interval_sec);
            read_unsigned(s, "peer_timeout_sec", d.peer_timeout_sec);
            read_unsigned(s, "max_text_chars", d.max_text_chars);
            read_unsigned(s, "max_datagram_size", d.max_datagram_size);
            read_unsigned(s, "receive_error_backoff_ms", d.receive_error_backoff_ms);
            d.announce_on_start = s.value("announce_on_start", d.announce_on_start);
        }
    } catch (const json::exception& e) {
        Logger::instance().error("Failed to parse JSON config " + path + ": " + e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    config_ = std::move(next);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid environment value: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Config::override_from_env() {
    // Log config
    if (const char* val = std::getenv("LANSHARE_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("LANSHARE_LOG_FILE")) {
        config_.log.file_path = val;
        config_.log.output = "file";
    }

    // Node config
    if (const char* val = std::getenv("LANSHARE_HOSTNAME")) {
        config_.node.hostname = std::string(val);
    }

    // Discovery
    if (const char* val = std::getenv("LANSHARE_DISCOVERY_PORT")) {
        config_.discovery.port = parse_port(val);
    }
    if (const char* val = std::getenv("LANSHARE_BROADCAST_ADDRESS")) {
        config_.discovery.broadcast_address = val;
    }
    if (const char* val = std::getenv("LANSHARE_PEER_TIMEOUT")) {
        config_.discovery.peer_timeout_sec = parse_unsigned<uint32_t>(val);
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"LanShare - LAN peer discovery and messaging"};

    // Config file is applied first so command line values take precedence
    std::string config_file = find_config_argument(argc, argv);
    if (!config_file.empty() && !load_from_file(config_file)) {
        std::cerr << "Failed to load config file: " << config_file << std::endl;
        return false;
    }

    std::string ignored_config;
    app.add_option("-c,--config", ignored_config, "Path to configuration file (INI or JSON)");

    // Node options
    app.add_option("--hostname", config_.node.hostname, "Display name announced to peers");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Discovery options
    auto& d = config_.discovery;
    app.add_option("-p,--port", d.port, "Discovery UDP port");
    app.add_option("--bind-address", d.bind_address, "Listener bind address");
    app.add_option("--broadcast-address", d.broadcast_address, "Subnet broadcast address");
    app.add_option("--broadcast-interval", d.broadcast_interval_sec, "Presence broadcast interval (seconds)");
    app.add_option("--cleanup-interval", d.cleanup_interval_sec, "Stale peer sweep interval (seconds)");
    app.add_option("--peer-timeout", d.peer_timeout_sec, "Seconds without presence before a peer is evicted");
    app.add_option("--max-text-chars", d.max_text_chars, "Maximum characters per text message");
    app.add_option("--max-datagram-size", d.max_datagram_size, "Maximum datagram size (bytes)");
    app.add_flag("--announce-on-start,!--no-announce-on-start", d.announce_on_start,
                 "Send a presence announcement immediately at start");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests are reported by CLI11 itself
        app.exit(e);
        return false;
    }

    apply_log_settings();
    return true;
}

void Config::apply_log_settings() const {
    auto& logger = Logger::instance();
    if (!config_.log.level.empty()) {
        logger.set_level(parse_log_level(config_.log.level));
    }

    if (config_.log.output == "stdout") {
        logger.set_output(LogOutput::Stdout);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else {
        logger.set_output(LogOutput::Stderr);
    }
}

bool Config::validate() const {
    const auto& d = config_.discovery;
    if (d.port == 0) {
        Logger::instance().error("discovery.port must be set");
        return false;
    }
    if (d.broadcast_interval_sec == 0 || d.cleanup_interval_sec == 0) {
        Logger::instance().error("discovery intervals must be greater than zero");
        return false;
    }
    if (d.peer_timeout_sec == 0) {
        Logger::instance().error("discovery.peer_timeout_sec must be greater than zero");
        return false;
    }
    if (d.max_text_chars == 0 || d.max_datagram_size == 0) {
        Logger::instance().error("discovery message limits must be greater than zero");
        return false;
    }
    if (d.max_datagram_size > 65507) {
        Logger::instance().error("discovery.max_datagram_size exceeds the UDP payload limit (65507)");
        return false;
    }
    if (d.peer_timeout_sec <= d.broadcast_interval_sec) {
        Logger::instance().warning("peer timeout ({}s) is not larger than the broadcast interval ({}s); "
                                   "peers will be evicted between announcements",
                                   d.peer_timeout_sec, d.broadcast_interval_sec);
    }
    return true;
}

void Config::print() const {
    const auto& d = config_.discovery;
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Hostname: " + config_.node.hostname.value_or("<auto>"));
    Logger::instance().info("Discovery Port: {}", d.port);
    Logger::instance().info("Bind Address: " + d.bind_address);
    Logger::instance().info("Broadcast Address: " + d.broadcast_address);
    Logger::instance().info("Broadcast Interval: {}s, Cleanup Interval: {}s, Peer Timeout: {}s",
                            d.broadcast_interval_sec, d.cleanup_interval_sec, d.peer_timeout_sec);
    Logger::instance().info("Max Text: {} chars, Max Datagram: {} bytes", d.max_text_chars, d.max_datagram_size);
}

} // namespace lanshare
