#ifndef LANSHARE_DISCOVERY_DISCOVERY_SERVICE_H
#define LANSHARE_DISCOVERY_DISCOVERY_SERVICE_H

#include "lanshare/base/config.h"
#include "lanshare/base/error_code.h"
#include "lanshare/discovery/peer_registry.h"
#include "lanshare/discovery/listener.h"
#include <string>
#include <optional>
#include <memory>
#include <system_error>

namespace lanshare {

enum class ServiceState {
    Uninitialized,  // Registry exists, no identity
    Running,        // Identity set, tasks spawned
    Stopped         // Tasks joined; identity retained
};

const char* to_string(ServiceState state);

// Recipient selection for send_text
struct SendTarget {
    std::optional<std::string> peer_id;  // nullopt means every known peer

    static SendTarget all() { return SendTarget{}; }
    static SendTarget peer(std::string id) { return SendTarget{std::move(id)}; }
    bool is_all() const { return !peer_id.has_value(); }
};

struct SendResult {
    ErrorCode code = ErrorCode::Success;
    std::string error_message;
    size_t datagrams_sent = 0;
    size_t failed_sends = 0;

    bool ok() const { return code == ErrorCode::Success; }
};

// Owns the peer registry and the process identity, runs the broadcaster,
// listener and cleanup tasks, and originates text messages.
class DiscoveryService {
public:
    explicit DiscoveryService(const DiscoveryConfig& config,
                              std::optional<std::string> hostname = std::nullopt);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Generate the identity, bind sockets and spawn all background tasks.
    // Fails with AlreadyStarted when called twice, or a transport error if binding fails.
    std::error_code start();

    // Cancel every task and wait for it to finish
    void stop();

    // Individual task spawns; NotStarted before an identity exists
    std::error_code spawn_broadcaster();
    std::error_code spawn_listener();
    std::error_code spawn_sweeper();

    ServiceState state() const;

    // Host-facing queries
    PeerList current_peers() const;
    size_t peer_count() const;
    std::optional<Peer> find_peer(const std::string& peer_id) const;
    std::optional<std::string> own_identity() const;

    std::shared_ptr<PeerRegistry> registry() const;

    // Port the listener is bound to, 0 before start
    uint16_t listen_port() const;

    void set_text_sink(TextSink sink);

    // Send text to one peer or to all peers, one datagram per recipient.
    // "All" with no known peers succeeds without sending; an unknown peer id is PeerNotFound.
    SendResult send_text(const SendTarget& target, const std::string& text);
    SendResult send_text_to(const std::string& peer_id, const std::string& text);
    SendResult broadcast_text(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_DISCOVERY_SERVICE_H
