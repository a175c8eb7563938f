#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/ConnectionHandler.hpp"
#include "core/NetworkDefs.hpp"
#include "core/SessionState.hpp"

namespace core {

    enum class ListenerState {
        Starting,
        Ready,
        Failed,
        Cancelled
    };

    const char* to_string(ListenerState state);

    // ========================================================================
    // ControlServer - TCP listener for the control protocol
    // ========================================================================
    // start() binds and returns the bound port; the accept loop then runs on
    // its own thread and hands every connection to a ConnectionHandler on a
    // dedicated worker thread, so no connection can stall another one or
    // the accept loop. A bind failure is terminal (no retry).
    // ========================================================================
    class ControlServer {
    public:
        using StateHandler = std::function<void(ListenerState state, const std::string& detail)>;
        using WorkerLauncher = std::function<std::thread(std::function<void()> body)>;

        ControlServer(
            uint16_t port,
            std::shared_ptr<const ServerState> server_state,
            std::shared_ptr<command::CommandDispatcher> dispatcher,
            std::shared_ptr<common::ILogger> logger
        );
        ~ControlServer();

        ControlServer(const ControlServer&) = delete;
        ControlServer& operator=(const ControlServer&) = delete;

        // Must be set before start()
        void set_state_handler(StateHandler handler);

        // Starts connection worker threads; defaults to constructing a
        // std::thread. Must be set before start()
        void set_worker_launcher(WorkerLauncher launcher);

        common::Result<uint16_t> start();

        // Cancels the accept loop and every live connection, then joins them
        void stop();

        ListenerState get_state() const { return state_.load(std::memory_order_acquire); }
        uint16_t bound_port() const { return bound_port_.load(std::memory_order_acquire); }
        size_t live_connections() const;

    private:
        struct LiveConnection {
            std::shared_ptr<ConnectionHandler> handler;
            common::CancellationSource cancel;
            std::shared_ptr<std::atomic<bool>> done;
            std::thread worker;
        };

        void accept_loop(common::CancellationToken token);
        void spawn_connection(socket_t fd);
        void reap_finished();
        void set_state(ListenerState state, const std::string& detail);

    private:
        uint16_t port_;
        std::shared_ptr<const ServerState> server_state_;
        std::shared_ptr<command::CommandDispatcher> dispatcher_;
        std::shared_ptr<common::ILogger> logger_;
        StateHandler state_handler_;
        WorkerLauncher worker_launcher_;

        std::atomic<ListenerState> state_{ListenerState::Starting};
        std::atomic<uint16_t> bound_port_{0};
        std::atomic<bool> running_{false};
        socket_t listen_fd_ = INVALID_SOCKET;

        common::CancellationSource accept_cancel_;
        std::thread accept_thread_;

        mutable std::mutex connections_mutex_;
        std::list<LiveConnection> connections_;
        uint32_t next_connection_id_ = 1;
    };

} // namespace core
