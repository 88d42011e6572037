#ifndef LANSHARE_DISCOVERY_MESSAGE_H
#define LANSHARE_DISCOVERY_MESSAGE_H

#include "lanshare/discovery/peer.h"
#include <string>
#include <optional>
#include <cstdint>

namespace lanshare {

// Discovery envelope kinds, serialized by name
enum class MessageType {
    PeerDiscovery,
    TextMessage
};

const char* to_string(MessageType type);
std::optional<MessageType> parse_message_type(const std::string& name);

struct DiscoveryMessage {
    MessageType type = MessageType::PeerDiscovery;
    std::string peer_id;
    uint16_t port = 0;
    std::optional<std::string> hostname;
    Clock::time_point timestamp = Clock::now();
    std::optional<std::string> text;  // TextMessage only

    static DiscoveryMessage presence(const std::string& peer_id, uint16_t port,
                                     const std::optional<std::string>& hostname);
    static DiscoveryMessage text_message(const std::string& peer_id, uint16_t port,
                                         const std::optional<std::string>& hostname,
                                         const std::string& text);

    bool operator==(const DiscoveryMessage& other) const = default;
};

// JSON encoding:
// {"message_type":"PeerDiscovery","peer_id":"...","port":7878,
//  "hostname":"..."|null,"timestamp":"2024-01-01T00:00:00.000000000Z","text":"..."|null}
std::string serialize_message(const DiscoveryMessage& msg);

// Returns nullopt for malformed or foreign payloads
std::optional<DiscoveryMessage> deserialize_message(const std::string& data);

// RFC 3339 UTC timestamps with nanosecond precision
std::string format_timestamp(Clock::time_point tp);
std::optional<Clock::time_point> parse_timestamp(const std::string& text);

// Number of UTF-8 code points (bytes that are not continuation bytes)
size_t utf8_length(const std::string& text);

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_MESSAGE_H
