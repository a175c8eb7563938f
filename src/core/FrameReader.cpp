#include "core/FrameReader.hpp"
#include "core/Protocol.hpp"
#include "core/WireCodec.hpp"
#include "core/network/SocketIO.hpp"

namespace core {

    FrameReader::FrameReader(std::shared_ptr<network::INetworkSocket> socket, common::CancellationToken token)
        : socket_(std::move(socket)), token_(std::move(token)) {}

    common::Result<Payload> FrameReader::finish(const common::AppError& error) {
        finished_ = error;
        return common::Result<Payload>::err(error);
    }

    common::Result<Payload> FrameReader::next() {
        if (finished_) {
            return common::Result<Payload>::err(*finished_);
        }
        if (!socket_) {
            return finish(common::AppError{common::ErrorCode::NotInitialized, "No socket", ""});
        }

        uint8_t header[protocol::FRAME_HEADER_SIZE];
        auto res = network::read_exact(*socket_, header, sizeof(header), token_);
        if (res.is_err()) return finish(res.error());

        const int length = protocol::decode_u16(header, sizeof(header), 0);

        Payload payload(static_cast<size_t>(length));
        if (length > 0) {
            res = network::read_exact(*socket_, payload.data(), payload.size(), token_);
            if (res.is_err()) return finish(res.error());
        }

        ++frames_read_;
        return common::Result<Payload>::ok(std::move(payload));
    }

} // namespace core
