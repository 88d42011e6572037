#include <iostream>
#include <memory>
#include <string>
#include <sstream>
#include <csignal>
#include <poll.h>
#include <unistd.h>

#include "lanshare/base/logger.h"
#include "lanshare/base/config.h"
#include "lanshare/base/error_code.h"
#include "lanshare/discovery/discovery_service.h"
#include "lanshare/discovery/message.h"

using namespace lanshare;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class LanShareApplication {
public:
    LanShareApplication() = default;
    ~LanShareApplication() {
        if (discovery_) {
            discovery_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        // Environment first, then config file and command line on top
        if (!Config::instance().load_from_env()) {
            return false;
        }
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            throw LanShareError(ErrorCode::ConfigError, "invalid configuration");
        }

        auto& config = Config::instance().get();
        Config::instance().print();

        auto hostname = config.node.hostname ? config.node.hostname : local_hostname();
        discovery_ = std::make_unique<DiscoveryService>(config.discovery, hostname);

        discovery_->set_text_sink([](const std::string& peer_id, const std::string& text) {
            std::cout << "\n[" << peer_id << "] " << text << std::endl;
        });
        discovery_->registry()->set_on_peer_discovered([](const Peer& peer) {
            std::cout << "\n+ " << peer.id << " (" << peer.hostname.value_or("?") << ") at "
                      << peer.endpoint() << std::endl;
        });
        discovery_->registry()->set_on_peer_removed([](const std::string& peer_id) {
            std::cout << "\n- " << peer_id << std::endl;
        });
        return true;
    }

    bool start() {
        Logger::instance().info("Starting LanShare...");
        if (auto ec = discovery_->start()) {
            Logger::instance().error("Failed to start discovery service: " + ec.message());
            return false;
        }
        std::cout << "Peer ID: " << discovery_->own_identity().value_or("") << std::endl;
        std::cout << "Type 'help' for commands." << std::endl;
        return true;
    }

    void run() {
        while (g_running) {
            pollfd pfd{};
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, 100);
            if (ready <= 0) {
                continue;
            }

            std::string line;
            if (!std::getline(std::cin, line)) {
                break;
            }
            if (!handle_command(line)) {
                break;
            }
        }

        discovery_->stop();
    }

private:
    bool handle_command(const std::string& line) {
        std::istringstream iss(line);
        std::string command;
        iss >> command;

        if (command.empty()) {
            return true;
        }
        if (command == "quit" || command == "exit") {
            return false;
        }
        if (command == "help") {
            print_help();
        } else if (command == "id") {
            std::cout << discovery_->own_identity().value_or("<not started>") << std::endl;
        } else if (command == "count") {
            std::cout << discovery_->peer_count() << std::endl;
        } else if (command == "peers") {
            print_peers();
        } else if (command == "send") {
            std::string peer_id;
            iss >> peer_id;
            report(discovery_->send_text_to(peer_id, rest_of(iss)));
        } else if (command == "all") {
            report(discovery_->broadcast_text(rest_of(iss)));
        } else {
            std::cout << "Unknown command: " << command << std::endl;
        }
        return true;
    }

    static std::string rest_of(std::istringstream& iss) {
        std::string text;
        std::getline(iss >> std::ws, text);
        return text;
    }

    void print_peers() const {
        auto peers = discovery_->current_peers();
        if (peers.empty()) {
            std::cout << "No peers discovered" << std::endl;
            return;
        }
        for (const auto& peer : peers) {
            std::cout << peer.id << "  " << peer.endpoint() << "  "
                      << peer.hostname.value_or("-") << "  last seen "
                      << format_timestamp(peer.last_seen) << std::endl;
        }
    }

    static void report(const SendResult& result) {
        if (result.ok()) {
            std::cout << "Sent to " << result.datagrams_sent << " peer(s)" << std::endl;
        } else {
            std::cout << "Error: " << result.error_message << std::endl;
        }
    }

    static void print_help() {
        std::cout << "Commands:" << std::endl;
        std::cout << "  peers               List discovered peers" << std::endl;
        std::cout << "  count               Number of discovered peers" << std::endl;
        std::cout << "  id                  Show this node's peer ID" << std::endl;
        std::cout << "  send <peer> <text>  Send text to one peer" << std::endl;
        std::cout << "  all <text>          Send text to every peer" << std::endl;
        std::cout << "  quit                Exit" << std::endl;
    }

    std::unique_ptr<DiscoveryService> discovery_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // CLI11 prints help and version output itself; those are not failures
    bool info_requested = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
            info_requested = true;
        }
    }

    try {
        LanShareApplication app;

        if (!app.initialize(argc, argv)) {
            return info_requested ? 0 : 1;
        }

        if (!app.start()) {
            std::cerr << "Failed to start application" << std::endl;
            return 1;
        }

        app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
