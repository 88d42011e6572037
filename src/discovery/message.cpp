#include "lanshare/discovery/message.h"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cmath>
#include <cstdio>
#include <cctype>
#include <ctime>

using json = nlohmann::json;

namespace lanshare {

namespace {

constexpr uint64_t kMaxPort = 65535;

// Epoch seconds representable as a nanosecond count in int64
constexpr double kMaxEpochSeconds = 9.2e9;

bool read_optional_string(const json& obj, const char* key, std::optional<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // anonymous namespace

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::PeerDiscovery: return "PeerDiscovery";
        case MessageType::TextMessage: return "TextMessage";
    }
    return "Unknown";
}

std::optional<MessageType> parse_message_type(const std::string& name) {
    if (name == "PeerDiscovery") return MessageType::PeerDiscovery;
    if (name == "TextMessage") return MessageType::TextMessage;
    return std::nullopt;
}

DiscoveryMessage DiscoveryMessage::presence(const std::string& peer_id, uint16_t port,
                                            const std::optional<std::string>& hostname) {
    DiscoveryMessage msg;
    msg.type = MessageType::PeerDiscovery;
    msg.peer_id = peer_id;
    msg.port = port;
    msg.hostname = hostname;
    msg.timestamp = Clock::now();
    return msg;
}

DiscoveryMessage DiscoveryMessage::text_message(const std::string& peer_id, uint16_t port,
                                                const std::optional<std::string>& hostname,
                                                const std::string& text) {
    DiscoveryMessage msg = presence(peer_id, port, hostname);
    msg.type = MessageType::TextMessage;
    msg.text = text;
    return msg;
}

std::string serialize_message(const DiscoveryMessage& msg) {
    json j;
    j["message_type"] = to_string(msg.type);
    j["peer_id"] = msg.peer_id;
    j["port"] = msg.port;
    j["hostname"] = msg.hostname ? json(*msg.hostname) : json(nullptr);
    j["timestamp"] = format_timestamp(msg.timestamp);
    if (msg.type == MessageType::TextMessage && msg.text) {
        j["text"] = *msg.text;
    } else {
        j["text"] = nullptr;
    }
    // Replace invalid UTF-8 instead of throwing
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<DiscoveryMessage> deserialize_message(const std::string& data) {
    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        DiscoveryMessage msg;

        auto type_it = j.find("message_type");
        if (type_it == j.end() || !type_it->is_string()) return std::nullopt;
        auto type = parse_message_type(type_it->get<std::string>());
        if (!type) return std::nullopt;
        msg.type = *type;

        auto id_it = j.find("peer_id");
        if (id_it == j.end() || !id_it->is_string()) return std::nullopt;
        msg.peer_id = id_it->get<std::string>();
        if (msg.peer_id.empty()) return std::nullopt;

        auto port_it = j.find("port");
        if (port_it == j.end() || !port_it->is_number_unsigned()) return std::nullopt;
        auto port = port_it->get<uint64_t>();
        if (port == 0 || port > kMaxPort) return std::nullopt;
        msg.port = static_cast<uint16_t>(port);

        if (!read_optional_string(j, "hostname", msg.hostname)) return std::nullopt;

        auto ts_it = j.find("timestamp");
        if (ts_it == j.end()) return std::nullopt;
        if (ts_it->is_string()) {
            auto ts = parse_timestamp(ts_it->get<std::string>());
            if (!ts) return std::nullopt;
            msg.timestamp = *ts;
        } else if (ts_it->is_number()) {
            double value = ts_it->get<double>();
            if (!std::isfinite(value) || std::fabs(value) >= kMaxEpochSeconds) return std::nullopt;
            auto seconds = std::chrono::duration<double>(value);
            msg.timestamp = Clock::time_point(std::chrono::duration_cast<Clock::duration>(seconds));
        } else {
            return std::nullopt;
        }

        if (!read_optional_string(j, "text", msg.text)) return std::nullopt;
        if (msg.type != MessageType::TextMessage) {
            msg.text.reset();
        }

        return msg;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string format_timestamp(Clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = (since_epoch - secs).count();

    std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:09d}Z", date, static_cast<long long>(nanos));
}

std::optional<Clock::time_point> parse_timestamp(const std::string& text) {
    std::tm tm_buf{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    int64_t offset_sec = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int hours = 0;
        int minutes = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
            return std::nullopt;
        }
        offset_sec = (hours * 3600 + minutes * 60) * (text[pos] == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    int64_t secs = static_cast<int64_t>(timegm(&tm_buf)) - offset_sec;
    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace lanshare
