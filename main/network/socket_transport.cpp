#include <main/network/socket_transport.hpp>
#include <main/utils/logger.hpp>

#include <sys/socket.h>
#include <sys/select.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

static const char* TAG = "TRANSPORT";

#ifdef MSG_NOSIGNAL
static constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
static constexpr int SEND_FLAGS = 0;
#endif

namespace {
    static timeval toTimeval(uint32_t timeout_ms) {
        timeval tv;
        tv.tv_sec = static_cast<long>(timeout_ms / 1000);
        tv.tv_usec = static_cast<long>((timeout_ms % 1000) * 1000);
        return tv;
    }
}

SocketTransport::SocketTransport() : fd(-1) {}

SocketTransport::~SocketTransport() {
    close();
}

TransportStatus SocketTransport::waitFor(bool writable, uint32_t timeout_ms) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(fd, &set);
    timeval tv = toTimeval(timeout_ms);
    int rc = select(fd + 1, writable ? nullptr : &set, writable ? &set : nullptr, nullptr, &tv);
    if (rc == 0) {
        return TransportStatus::TIMEOUT;
    }
    if (rc < 0) {
        LOG_WARN(TAG, "select failed: errno %d", errno);
        return TransportStatus::ERROR;
    }
    return TransportStatus::OK;
}

TransportStatus SocketTransport::connect(const char* host, uint16_t port, uint32_t timeout_ms) {
    close();

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
        LOG_WARN(TAG, "Broker host %s is not an IPv4 address", host);
        return TransportStatus::ERROR;
    }

    fd = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        LOG_ERROR(TAG, "socket() failed: errno %d", errno);
        return TransportStatus::ERROR;
    }

    // Non-blocking connect so the timeout is ours, not the stack's
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));

    TransportStatus status = TransportStatus::OK;
    if (rc != 0) {
        if (errno != EINPROGRESS) {
            status = (errno == ECONNREFUSED) ? TransportStatus::REFUSED : TransportStatus::ERROR;
        } else {
            status = waitFor(true, timeout_ms);
            if (status == TransportStatus::OK) {
                int so_error = 0;
                socklen_t so_len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
                if (so_error == ECONNREFUSED) {
                    status = TransportStatus::REFUSED;
                } else if (so_error != 0) {
                    status = TransportStatus::ERROR;
                }
            }
        }
    }
    if (status != TransportStatus::OK) {
        LOG_WARN(TAG, "Connect to %s:%u failed: %s", host, static_cast<unsigned>(port), toString(status));
        close();
        return status;
    }

    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return TransportStatus::OK;
}

TransportStatus SocketTransport::write(const uint8_t* data, std::size_t len, uint32_t timeout_ms) {
    if (fd < 0) {
        return TransportStatus::CLOSED;
    }
    timeval tv = toTimeval(timeout_ms);
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, SEND_FLAGS);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return TransportStatus::TIMEOUT;
        }
        return (n == 0 || errno == EPIPE || errno == ECONNRESET) ? TransportStatus::CLOSED : TransportStatus::ERROR;
    }
    return TransportStatus::OK;
}

TransportStatus SocketTransport::read(uint8_t* out, std::size_t len, uint32_t timeout_ms) {
    if (fd < 0) {
        return TransportStatus::CLOSED;
    }
    timeval tv = toTimeval(timeout_ms);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::size_t got = 0;
    while (got < len) {
        ssize_t n = recv(fd, out + got, len - got, 0);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0) {
            return TransportStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return TransportStatus::TIMEOUT;
        }
        return TransportStatus::ERROR;
    }
    return TransportStatus::OK;
}

void SocketTransport::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
