#include "SocketIO.hpp"
#include <string>

namespace core {
namespace network {

    common::EmptyResult read_exact(INetworkSocket& socket, uint8_t* buffer, size_t size,
                                   const common::CancellationToken& token) {
        size_t got = 0;
        while (got < size) {
            if (token.is_cancellation_requested()) {
                return common::EmptyResult::err(common::ErrorCode::Cancelled, "Read cancelled");
            }

            WaitResult ready = socket.wait_readable(POLL_SLICE_MS);
            if (ready == WaitResult::Timeout) continue;
            if (ready == WaitResult::Failed) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "poll failed on read");
            }

            auto [n, err] = socket.recv(buffer + got, size - got);
            if (err == SocketError::Ok) {
                got += n;
            } else if (err == SocketError::WouldBlock) {
                continue;
            } else if (err == SocketError::Disconnected) {
                return common::EmptyResult::err(
                    common::ErrorCode::Disconnected,
                    "Peer closed after " + std::to_string(got) + " of " + std::to_string(size) + " bytes");
            } else {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "recv failed");
            }
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult write_all(INetworkSocket& socket, const uint8_t* data, size_t size,
                                  const common::CancellationToken& token) {
        size_t sent = 0;
        while (sent < size) {
            if (token.is_cancellation_requested()) {
                return common::EmptyResult::err(common::ErrorCode::Cancelled, "Write cancelled");
            }

            auto [n, err] = socket.send(data + sent, size - sent);
            if (err == SocketError::Ok) {
                sent += n;
                continue;
            }
            if (err == SocketError::Disconnected) {
                return common::EmptyResult::err(common::ErrorCode::Disconnected, "Peer closed during write");
            }
            if (err == SocketError::Fatal) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "send failed");
            }

            // WouldBlock: wait until the kernel buffer drains
            if (socket.wait_writable(POLL_SLICE_MS) == WaitResult::Failed) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "poll failed on write");
            }
        }
        return common::EmptyResult::success();
    }

} // namespace network
} // namespace core
