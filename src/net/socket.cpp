// CHAINSYNC - Request Transport Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/net/socket.h>
#include <chainsync/core/errors.h>
#include <chainsync/util/logging.h>

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace chainsync {
namespace net {

namespace {
constexpr int INVALID_SOCKET_VALUE = -1;
}

TcpSocket::TcpSocket() = default;

TcpSocket::~TcpSocket() {
    Close();
    if (fd_ != INVALID_SOCKET_VALUE) {
        ::close(fd_);
        fd_ = INVALID_SOCKET_VALUE;
    }
}

void TcpSocket::Connect(const std::string& host, uint16_t port) {
    if (fd_ != INVALID_SOCKET_VALUE) {
        throw ConnectionError("socket already used");
    }

    struct addrinfo hints;
    struct addrinfo* result = nullptr;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(port);

    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        throw ConnectionError("Failed to resolve host: " + host + " (" + gai_strerror(status) + ")");
    }

    std::string lastError = "no usable address";
    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd == INVALID_SOCKET_VALUE) {
            lastError = std::strerror(errno);
            continue;
        }

        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            int one = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            fd_ = fd;
            open_.store(true);
            freeaddrinfo(result);
            LOG_DEBUG(util::LogCategory::RPC) << "Connected to " << host << ":" << port;
            return;
        }

        lastError = std::strerror(errno);
        ::close(fd);
    }

    freeaddrinfo(result);
    throw ConnectionError("Failed to connect to " + host + ":" + portStr + ": " + lastError);
}

void TcpSocket::Write(const std::string& data) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!open_.load()) {
        throw ConnectionError::NotConnected();
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::optional<std::string> TcpSocket::Read() {
    if (fd_ == INVALID_SOCKET_VALUE) {
        return std::nullopt;
    }

    char buffer[READ_CHUNK];
    while (true) {
        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        if (n > 0) {
            return std::string(buffer, static_cast<size_t>(n));
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && open_.load()) {
            LOG_DEBUG(util::LogCategory::RPC) << "recv failed: " << std::strerror(errno);
        }
        open_.store(false);
        return std::nullopt;
    }
}

void TcpSocket::Close() {
    if (open_.exchange(false) && fd_ != INVALID_SOCKET_VALUE) {
        // Wakes a reader blocked in recv(); the descriptor is released on destruction
        ::shutdown(fd_, SHUT_RDWR);
    }
}

std::unique_ptr<StreamSocket> MakeTcpSocket() {
    return std::make_unique<TcpSocket>();
}

} // namespace net
} // namespace chainsync
