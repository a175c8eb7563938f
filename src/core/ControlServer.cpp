#include "core/ControlServer.hpp"
#include "core/network/TcpSocket.hpp"
#include "core/network/SocketIO.hpp"
#include <cerrno>
#include <cstring>
#include <iterator>
#include <poll.h>
#include <system_error>

namespace core {

    const char* to_string(ListenerState state) {
        switch (state) {
            case ListenerState::Starting:  return "starting";
            case ListenerState::Ready:     return "ready";
            case ListenerState::Failed:    return "failed";
            case ListenerState::Cancelled: return "cancelled";
        }
        return "?";
    }

    ControlServer::ControlServer(
        uint16_t port,
        std::shared_ptr<const ServerState> server_state,
        std::shared_ptr<command::CommandDispatcher> dispatcher,
        std::shared_ptr<common::ILogger> logger
    ) : port_(port), server_state_(std::move(server_state)), dispatcher_(std::move(dispatcher)),
        logger_(std::move(logger)) {
        if (!logger_) logger_ = std::make_shared<common::NullLogger>();
    }

    ControlServer::~ControlServer() {
        stop();
    }

    void ControlServer::set_state_handler(StateHandler handler) {
        state_handler_ = std::move(handler);
    }

    void ControlServer::set_worker_launcher(WorkerLauncher launcher) {
        worker_launcher_ = std::move(launcher);
    }

    void ControlServer::set_state(ListenerState state, const std::string& detail) {
        state_.store(state, std::memory_order_release);
        if (state_handler_) state_handler_(state, detail);
    }

    common::Result<uint16_t> ControlServer::start() {
        if (running_) {
            return common::Result<uint16_t>::ok(bound_port_.load());
        }
        set_state(ListenerState::Starting, "");

        auto fail = [this](const std::string& what) {
            std::string msg = what + ": " + std::strerror(errno);
            if (IS_VALID_SOCKET(listen_fd_)) {
                CLOSE_SOCKET(listen_fd_);
                listen_fd_ = INVALID_SOCKET;
            }
            logger_->error("[ControlServer] Server failed to start: " + msg);
            set_state(ListenerState::Failed, msg);
            return common::Result<uint16_t>::err(common::ErrorCode::BindFailed, msg);
        };

        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (!IS_VALID_SOCKET(listen_fd_)) return fail("socket");

        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&opt, sizeof(opt));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(port_);

        if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) return fail("bind");
        if (listen(listen_fd_, 10) < 0) return fail("listen");

        struct sockaddr_in bound;
        socklen_t bound_len = sizeof(bound);
        if (getsockname(listen_fd_, (struct sockaddr*)&bound, &bound_len) < 0) return fail("getsockname");
        bound_port_ = ntohs(bound.sin_port);

        int flags = fcntl(listen_fd_, F_GETFL, 0);
        if (flags == -1 || fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK) != 0) return fail("fcntl");

        running_ = true;
        accept_cancel_.reset();
        accept_thread_ = std::thread(&ControlServer::accept_loop, this, accept_cancel_.get_token());

        logger_->info("[ControlServer] Server started and listening on port " + std::to_string(bound_port_.load()));
        set_state(ListenerState::Ready, std::to_string(bound_port_.load()));
        return common::Result<uint16_t>::ok(bound_port_.load());
    }

    void ControlServer::stop() {
        if (!running_.exchange(false)) return;

        accept_cancel_.cancel();
        if (accept_thread_.joinable()) accept_thread_.join();

        shutdown(listen_fd_, SHUT_RDWR);
        CLOSE_SOCKET(listen_fd_);
        listen_fd_ = INVALID_SOCKET;

        std::list<LiveConnection> draining;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            draining.swap(connections_);
        }
        for (auto& conn : draining) conn.cancel.cancel();
        for (auto& conn : draining) {
            if (conn.worker.joinable()) conn.worker.join();
        }

        // A failed accept loop already published its terminal state
        if (get_state() != ListenerState::Failed) {
            logger_->info("[ControlServer] Server closed");
            set_state(ListenerState::Cancelled, "");
        }
    }

    size_t ControlServer::live_connections() const {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        size_t live = 0;
        for (const auto& conn : connections_) {
            if (!conn.done->load(std::memory_order_acquire)) ++live;
        }
        return live;
    }

    void ControlServer::accept_loop(common::CancellationToken token) {
        while (!token.is_cancellation_requested()) {
            struct pollfd pfd;
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int rc = ::poll(&pfd, 1, network::POLL_SLICE_MS);
            if (rc == 0 || (rc < 0 && errno == EINTR)) {
                reap_finished();
                continue;
            }
            if (rc < 0) {
                logger_->error(std::string("[ControlServer] poll failed: ") + std::strerror(errno));
                set_state(ListenerState::Failed, "poll");
                break;
            }

            struct sockaddr_in peer;
            socklen_t len = sizeof(peer);
            socket_t fd = accept(listen_fd_, (struct sockaddr*)&peer, &len);
            if (!IS_VALID_SOCKET(fd)) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
                    continue;
                }
                logger_->error(std::string("[ControlServer] accept failed: ") + std::strerror(errno));
                set_state(ListenerState::Failed, "accept");
                break;
            }

            char peer_ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &peer.sin_addr, peer_ip, sizeof(peer_ip));
            logger_->info(std::string("[ControlServer] Client connected from ") + peer_ip + ":" +
                          std::to_string(ntohs(peer.sin_port)));

            reap_finished();
            spawn_connection(fd);
        }
    }

    void ControlServer::spawn_connection(socket_t fd) {
        auto socket = std::make_shared<network::TcpSocket>(fd);
        socket->set_non_blocking(true);
        socket->set_no_delay(true);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        const uint32_t id = next_connection_id_++;

        connections_.emplace_back();
        LiveConnection& conn = connections_.back();
        conn.handler = std::make_shared<ConnectionHandler>(id, socket, server_state_, dispatcher_, logger_);
        conn.done = std::make_shared<std::atomic<bool>>(false);

        auto handler = conn.handler;
        auto done = conn.done;
        auto token = conn.cancel.get_token();
        std::function<void()> body = [handler, done, token]() {
            handler->run(token);
            done->store(true, std::memory_order_release);
        };

        // Out of threads: drop this client and keep accepting
        try {
            conn.worker = worker_launcher_ ? worker_launcher_(std::move(body)) : std::thread(std::move(body));
        } catch (const std::system_error& ex) {
            connections_.pop_back();
            socket->close_socket();
            logger_->error(std::string("[ControlServer] Failed to spawn connection: ") + ex.what());
        }
    }

    void ControlServer::reap_finished() {
        std::list<LiveConnection> finished;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            for (auto it = connections_.begin(); it != connections_.end();) {
                if (it->done->load(std::memory_order_acquire)) {
                    auto next = std::next(it);
                    finished.splice(finished.end(), connections_, it);
                    it = next;
                } else {
                    ++it;
                }
            }
        }
        for (auto& conn : finished) {
            if (conn.worker.joinable()) conn.worker.join();
        }
    }

} // namespace core
