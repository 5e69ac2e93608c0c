#include "action/UnixSocket.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocket::~UnixSocket() {
    close();
}

UnixSocket::UnixSocket(UnixSocket&& other) noexcept : fd(other.fd) {
    other.fd = -1;
}

UnixSocket& UnixSocket::operator=(UnixSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

void UnixSocket::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void UnixSocket::waitFor(short events, Clock::time_point deadline, const char* what) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw RpcError(std::string("timed out waiting to ") + what);
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw RpcError(std::string("poll failed while waiting to ") + what + ": " + std::strerror(errno));
        }
        if (rc == 0) {
            throw RpcError(std::string("timed out waiting to ") + what);
        }
        // POLLHUP 与 POLLIN 可能同时出现: 交给后续 recv 读取剩余数据
        if ((pfd.revents & events) != 0) {
            return;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            throw RpcError(std::string("connection error while waiting to ") + what);
        }
    }
}

UnixSocket UnixSocket::connect(const std::string& path, Clock::time_point deadline) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        throw RpcError("socket path too long: " + path);
    }

    int rawFd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (rawFd < 0) {
        throw RpcError(std::string("socket() failed: ") + std::strerror(errno));
    }
    UnixSocket sock(rawFd);

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EINPROGRESS && errno != EAGAIN) {
            throw RpcError("connect(" + path + ") failed: " + std::strerror(errno));
        }
        sock.waitFor(POLLOUT, deadline, "connect");

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            throw RpcError("connect(" + path + ") failed: " + std::strerror(soError ? soError : errno));
        }
    }
    return sock;
}

void UnixSocket::sendAll(const std::string& data, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            waitFor(POLLOUT, deadline, "send");
            continue;
        }
        throw RpcError(std::string("send failed: ") + std::strerror(errno));
    }
}

std::string UnixSocket::receiveSome(Clock::time_point deadline) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n > 0) {
            return std::string(buffer, static_cast<size_t>(n));
        }
        if (n == 0) {
            throw RpcError("connection closed by peer");
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            waitFor(POLLIN, deadline, "receive");
            continue;
        }
        throw RpcError(std::string("recv failed: ") + std::strerror(errno));
    }
}
