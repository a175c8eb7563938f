#include "TcpSocket.hpp"
#include <cstring>
#include <errno.h>
#include <poll.h>

namespace core {
namespace network {

    TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

    TcpSocket::~TcpSocket() {
        close_socket();
    }

    bool TcpSocket::set_non_blocking(bool enable) {
        if (fd_ < 0) return false;
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags == -1) return false;
        if (enable) flags |= O_NONBLOCK;
        else flags &= ~O_NONBLOCK;
        return fcntl(fd_, F_SETFL, flags) == 0;
    }

    bool TcpSocket::set_no_delay(bool enable) {
        if (fd_ < 0) return false;
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, (const char*)&flag, sizeof(flag)) == 0;
    }

    std::pair<size_t, SocketError> TcpSocket::send(const uint8_t* data, size_t size) {
        if (fd_ < 0) return {0, SocketError::Fatal};

        ssize_t sent = ::send(fd_, (const SOCK_BUF_TYPE)data, size, SEND_FLAGS);

        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return {0, SocketError::WouldBlock};
            if (errno == EPIPE || errno == ECONNRESET) return {0, SocketError::Disconnected};
            return {0, SocketError::Fatal};
        }
        return {(size_t)sent, SocketError::Ok};
    }

    std::pair<size_t, SocketError> TcpSocket::recv(uint8_t* buffer, size_t max_size) {
        if (fd_ < 0) return {0, SocketError::Fatal};

        ssize_t received = ::recv(fd_, (SOCK_BUF_TYPE)buffer, max_size, 0);

        if (received > 0) {
            return {(size_t)received, SocketError::Ok};
        } else if (received == 0) {
            return {0, SocketError::Disconnected}; // EOF
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return {0, SocketError::WouldBlock};
            if (errno == ECONNRESET) return {0, SocketError::Disconnected};
            return {0, SocketError::Fatal};
        }
    }

    WaitResult TcpSocket::wait_for(short events, int timeout_ms) {
        if (fd_ < 0) return WaitResult::Failed;

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = events;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            return errno == EINTR ? WaitResult::Timeout : WaitResult::Failed;
        }
        if (rc == 0) return WaitResult::Timeout;
        if (pfd.revents & POLLNVAL) return WaitResult::Failed;
        // POLLHUP / POLLERR are surfaced by the following recv()/send()
        return WaitResult::Ready;
    }

    WaitResult TcpSocket::wait_readable(int timeout_ms) {
        return wait_for(POLLIN, timeout_ms);
    }

    WaitResult TcpSocket::wait_writable(int timeout_ms) {
        return wait_for(POLLOUT, timeout_ms);
    }

    void TcpSocket::close_socket() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
            CLOSE_SOCKET(fd_);
            fd_ = INVALID_SOCKET;
        }
    }

    bool TcpSocket::is_valid() const {
        return IS_VALID_SOCKET(fd_);
    }

} // namespace network
} // namespace core
