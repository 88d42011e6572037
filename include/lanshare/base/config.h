#ifndef LANSHARE_BASE_CONFIG_H
#define LANSHARE_BASE_CONFIG_H

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace lanshare {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stderr";  // stdout, stderr, file
    std::string file_path = "";
};

// Node configuration
struct NodeConfig {
    // Display name announced to peers; resolved from the environment when unset
    std::optional<std::string> hostname;
};

// Discovery and messaging configuration
struct DiscoveryConfig {
    uint16_t port = 7878;  // Shared by broadcaster target and listener bind
    std::string bind_address = "0.0.0.0";
    std::string broadcast_address = "255.255.255.255";
    uint32_t broadcast_interval_sec = 5;
    uint32_t cleanup_interval_sec = 10;
    uint32_t peer_timeout_sec = 30;
    size_t max_text_chars = 6000;
    size_t max_datagram_size = 8192;
    uint32_t receive_error_backoff_ms = 100;
    bool announce_on_start = true;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    DiscoveryConfig discovery;
};

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON for .json files)
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false on parse errors and after --help/--version.
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check if required fields are set
    bool validate() const;

    // Apply log settings to the Logger
    void apply_log_settings() const;

    // Print configuration (for debugging)
    void print() const;

    // Restore defaults
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_CONFIG_H
