#include "lanshare/discovery/udp_socket.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include <utility>

namespace lanshare {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

bool make_address(const std::string& address, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1;
}

} // anonymous namespace

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::optional<UdpSocket> UdpSocket::bind(const std::string& address, uint16_t port,
                                         bool reuse_address, std::error_code& ec) {
    ec.clear();

    sockaddr_in addr;
    if (!make_address(address, port, addr)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        ec = last_error();
        return std::nullopt;
    }
    UdpSocket sock(fd);

    if (reuse_address) {
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            ec = last_error();
            return std::nullopt;
        }
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ec = last_error();
        return std::nullopt;
    }

    return sock;
}

std::error_code UdpSocket::enable_broadcast() {
    int opt = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

std::error_code UdpSocket::send_to(const std::string& payload, const std::string& address, uint16_t port) {
    sockaddr_in addr;
    if (!make_address(address, port, addr)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                            reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        return last_error();
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        return std::make_error_code(std::errc::message_size);
    }
    return {};
}

std::optional<Datagram> UdpSocket::receive(size_t max_size, std::chrono::milliseconds timeout,
                                           std::error_code& ec) {
    ec.clear();

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno != EINTR) {
            ec = last_error();
        }
        return std::nullopt;
    }
    if (ready == 0) {
        return std::nullopt;
    }

    std::vector<char> buffer(max_size);
    sockaddr_in src{};
    socklen_t src_len = sizeof(src);
    // MSG_TRUNC makes recvfrom report the full datagram length
    ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), MSG_TRUNC,
                           reinterpret_cast<sockaddr*>(&src), &src_len);
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            ec = last_error();
        }
        return std::nullopt;
    }

    Datagram datagram;
    datagram.truncated = static_cast<size_t>(n) > buffer.size();
    size_t length = datagram.truncated ? buffer.size() : static_cast<size_t>(n);
    datagram.payload.assign(buffer.data(), length);

    char addr_buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &src.sin_addr, addr_buf, sizeof(addr_buf)) != nullptr) {
        datagram.source_address = addr_buf;
    }
    datagram.source_port = ntohs(src.sin_port);
    return datagram;
}

uint16_t UdpSocket::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace lanshare
