#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/SessionState.hpp"
#include "interfaces/INetworkSocket.hpp"

namespace core {

    enum class ConnectionState {
        AwaitingHandshake,
        Serving,
        Closed
    };

    const char* to_string(ConnectionState state);

    // ========================================================================
    // ConnectionHandler - Owns one accepted connection end-to-end
    // ========================================================================
    // AwaitingHandshake: read 4 raw bytes, CONNECT -> reply "OKAY".
    // Serving:           FrameReader -> CommandDispatcher, one frame at a
    //                    time, reply written before the next read.
    // Closed:            socket released exactly once, on every exit path.
    //
    // run() blocks the calling thread until the connection is closed.
    // Errors never leave run(); they are logged and close this connection
    // only.
    // ========================================================================
    class ConnectionHandler {
    public:
        ConnectionHandler(
            uint32_t connection_id,
            std::shared_ptr<network::INetworkSocket> socket,
            std::shared_ptr<const ServerState> server_state,
            std::shared_ptr<command::CommandDispatcher> dispatcher,
            std::shared_ptr<common::ILogger> logger
        );
        ~ConnectionHandler();

        ConnectionHandler(const ConnectionHandler&) = delete;
        ConnectionHandler& operator=(const ConnectionHandler&) = delete;

        void run(common::CancellationToken token);

        ConnectionState get_state() const { return state_.load(std::memory_order_acquire); }
        uint32_t id() const { return connection_id_; }

        // Reason the connection closed (Success for a clean end)
        common::ErrorCode close_reason() const { return close_reason_.load(std::memory_order_acquire); }

    private:
        common::EmptyResult perform_handshake(const common::CancellationToken& token);
        common::EmptyResult serve(const common::CancellationToken& token);
        void close(common::ErrorCode reason);

        uint32_t connection_id_;
        std::shared_ptr<network::INetworkSocket> socket_;
        std::shared_ptr<const ServerState> server_state_;
        std::shared_ptr<command::CommandDispatcher> dispatcher_;
        std::shared_ptr<common::ILogger> logger_;

        SessionState session_;
        std::atomic<ConnectionState> state_{ConnectionState::AwaitingHandshake};
        std::atomic<common::ErrorCode> close_reason_{common::ErrorCode::Success};
    };

} // namespace core
