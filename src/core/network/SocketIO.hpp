#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "interfaces/INetworkSocket.hpp"
#include "common/Cancellation.hpp"
#include "common/Result.hpp"

namespace core {
namespace network {

    // Upper bound of a single blocking wait. Cancellation is observed at
    // least this often while a read or write is pending.
    constexpr int POLL_SLICE_MS = 100;

    // Reads exactly `size` bytes. Fails with Cancelled, Disconnected (EOF or
    // reset, including a short read) or TransportError.
    common::EmptyResult read_exact(INetworkSocket& socket, uint8_t* buffer, size_t size,
                                   const common::CancellationToken& token);

    // Writes all of `size` bytes, retrying partial sends.
    common::EmptyResult write_all(INetworkSocket& socket, const uint8_t* data, size_t size,
                                  const common::CancellationToken& token);

    inline common::EmptyResult write_all(INetworkSocket& socket, const std::vector<uint8_t>& data,
                                         const common::CancellationToken& token) {
        return write_all(socket, data.data(), data.size(), token);
    }

} // namespace network
} // namespace core
