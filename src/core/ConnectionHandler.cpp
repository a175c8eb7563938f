#include "core/ConnectionHandler.hpp"
#include "core/FrameReader.hpp"
#include "core/Protocol.hpp"
#include "core/WireCodec.hpp"
#include "core/network/SocketIO.hpp"
#include <exception>
#include <string>

namespace core {

    const char* to_string(ConnectionState state) {
        switch (state) {
            case ConnectionState::AwaitingHandshake: return "AwaitingHandshake";
            case ConnectionState::Serving:           return "Serving";
            case ConnectionState::Closed:            return "Closed";
        }
        return "?";
    }

    ConnectionHandler::ConnectionHandler(
        uint32_t connection_id,
        std::shared_ptr<network::INetworkSocket> socket,
        std::shared_ptr<const ServerState> server_state,
        std::shared_ptr<command::CommandDispatcher> dispatcher,
        std::shared_ptr<common::ILogger> logger
    ) : connection_id_(connection_id), socket_(std::move(socket)), server_state_(std::move(server_state)),
        dispatcher_(std::move(dispatcher)), logger_(std::move(logger)) {
        if (!logger_) logger_ = std::make_shared<common::NullLogger>();
    }

    ConnectionHandler::~ConnectionHandler() {
        close(common::ErrorCode::Cancelled);
    }

    void ConnectionHandler::run(common::CancellationToken token) {
        const std::string tag = "[Connection " + std::to_string(connection_id_) + "] ";
        common::ErrorCode reason = common::ErrorCode::Success;

        try {
            auto res = perform_handshake(token);
            if (res.is_ok()) {
                res = serve(token);
            }

            if (res.is_err()) {
                reason = res.error().code;
                if (reason == common::ErrorCode::Cancelled) {
                    logger_->debug(tag + "Cancelled");
                } else if (reason == common::ErrorCode::Disconnected) {
                    logger_->info(tag + "Client disconnected: " + res.error().message);
                } else {
                    logger_->error(tag + "Receive failed: " + res.error().message +
                                   " (" + common::to_string(reason) + ")");
                }
            }
        } catch (const std::exception& ex) {
            reason = common::ErrorCode::Unknown;
            logger_->error(tag + "Unexpected exception: " + ex.what());
        }

        close(reason);
    }

    common::EmptyResult ConnectionHandler::perform_handshake(const common::CancellationToken& token) {
        uint8_t magic[protocol::MAGIC_SIZE];
        auto res = network::read_exact(*socket_, magic, sizeof(magic), token);
        if (res.is_err()) return res;

        if (!protocol::has_magic(magic, sizeof(magic), protocol::CONNECT_MAGIC)) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolError, "Invalid handshake");
        }

        res = network::write_all(*socket_, protocol::HANDSHAKE_REPLY.data(),
                                 protocol::HANDSHAKE_REPLY.size(), token);
        if (res.is_err()) return res;

        session_.handshake_completed = true;
        state_.store(ConnectionState::Serving, std::memory_order_release);
        logger_->debug("[Connection " + std::to_string(connection_id_) + "] Handshake accepted");
        return common::EmptyResult::success();
    }

    common::EmptyResult ConnectionHandler::serve(const common::CancellationToken& token) {
        if (!dispatcher_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No dispatcher");
        }
        if (!session_.handshake_completed) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolError, "Handshake not completed");
        }

        command::CommandContext ctx;
        ctx.connection_id = connection_id_;
        ctx.server = server_state_;
        ctx.session = &session_;
        ctx.write = [this, token](const std::vector<uint8_t>& bytes) {
            return network::write_all(*socket_, bytes, token);
        };

        FrameReader reader(socket_, token);
        while (true) {
            auto frame = reader.next();
            if (frame.is_err()) {
                return common::EmptyResult::err(frame.error());
            }

            auto res = dispatcher_->dispatch(frame.unwrap(), ctx);
            if (res.is_err()) return res;
        }
    }

    void ConnectionHandler::close(common::ErrorCode reason) {
        ConnectionState previous = state_.exchange(ConnectionState::Closed, std::memory_order_acq_rel);
        if (previous == ConnectionState::Closed) return;

        close_reason_.store(reason, std::memory_order_release);
        if (socket_) socket_->close_socket();
        logger_->debug("[Connection " + std::to_string(connection_id_) + "] Closed while " +
                       to_string(previous) + " (" + common::to_string(reason) + ")");
    }

} // namespace core
