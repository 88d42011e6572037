#ifndef LANSHARE_DISCOVERY_LISTENER_H
#define LANSHARE_DISCOVERY_LISTENER_H

#include "lanshare/base/config.h"
#include "lanshare/discovery/peer_registry.h"
#include "lanshare/discovery/udp_socket.h"
#include <elio/elio.hpp>
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <stop_token>
#include <system_error>

namespace lanshare {

// Receives delivered text, keyed by sender identity. Push-only.
using TextSink = std::function<void(const std::string& peer_id, const std::string& text)>;

// Result of dispatching one inbound datagram
enum class DatagramOutcome {
    PeerUpserted,
    TextDelivered,
    IgnoredSelf,
    IgnoredEmptyText,
    DecodeFailed
};

const char* to_string(DatagramOutcome outcome);

// Receives discovery traffic on the well-known port and dispatches it
class Listener {
public:
    Listener(const DiscoveryConfig& config, std::shared_ptr<PeerRegistry> registry,
             std::string own_peer_id);

    // Bind the discovery port
    std::error_code open();

    // Actual bound port (differs from config when config.port is 0)
    uint16_t local_port() const;

    void set_text_sink(TextSink sink);

    // Decode and dispatch one datagram observed from source_address
    DatagramOutcome handle_datagram(const std::string& payload, const std::string& source_address,
                                    bool truncated = false);

    elio::coro::task<void> run(std::stop_token stop);

private:
    void deliver_text(const std::string& peer_id, const std::string& text);

    DiscoveryConfig config_;
    std::shared_ptr<PeerRegistry> registry_;
    std::string own_peer_id_;
    std::optional<UdpSocket> socket_;

    std::mutex sink_mutex_;
    TextSink sink_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_LISTENER_H
