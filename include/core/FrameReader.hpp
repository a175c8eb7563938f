#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/Result.hpp"
#include "interfaces/INetworkSocket.hpp"

namespace core {

    using Payload = std::vector<uint8_t>;

    // ========================================================================
    // FrameReader - Pull-based reader of length-prefixed frames
    // ========================================================================
    // Each next() reads a u16 big-endian length L, then exactly L payload
    // bytes. The sequence ends with:
    //   - Cancelled        when the token is cancelled (clean end)
    //   - Disconnected /
    //     TransportError   when the stream fails at either step
    // Once ended, next() keeps returning the same error without touching the
    // socket. One reader per connection, never restarted.
    // ========================================================================
    class FrameReader {
    public:
        FrameReader(std::shared_ptr<network::INetworkSocket> socket, common::CancellationToken token);

        FrameReader(const FrameReader&) = delete;
        FrameReader& operator=(const FrameReader&) = delete;

        common::Result<Payload> next();

        bool is_finished() const { return finished_.has_value(); }

        uint64_t frames_read() const { return frames_read_; }

    private:
        common::Result<Payload> finish(const common::AppError& error);

        std::shared_ptr<network::INetworkSocket> socket_;
        common::CancellationToken token_;
        std::optional<common::AppError> finished_;
        uint64_t frames_read_ = 0;
    };

} // namespace core
