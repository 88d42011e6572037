#ifndef LANSHARE_DISCOVERY_UDP_SOCKET_H
#define LANSHARE_DISCOVERY_UDP_SOCKET_H

#include <string>
#include <optional>
#include <system_error>
#include <chrono>
#include <cstdint>

namespace lanshare {

struct Datagram {
    std::string payload;
    std::string source_address;
    uint16_t source_port = 0;
    bool truncated = false;   // Payload was larger than the receive buffer
};

// Owning wrapper around an IPv4 datagram socket
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Create and bind; port 0 picks an ephemeral port
    static std::optional<UdpSocket> bind(const std::string& address, uint16_t port,
                                         bool reuse_address, std::error_code& ec);

    std::error_code enable_broadcast();

    std::error_code send_to(const std::string& payload, const std::string& address, uint16_t port);

    // Waits up to `timeout` for a datagram; returns nullopt with ec cleared on timeout
    std::optional<Datagram> receive(size_t max_size, std::chrono::milliseconds timeout,
                                    std::error_code& ec);

    uint16_t local_port() const;
    bool is_open() const { return fd_ >= 0; }
    void close();

private:
    explicit UdpSocket(int fd) : fd_(fd) {}

    int fd_ = -1;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_UDP_SOCKET_H
