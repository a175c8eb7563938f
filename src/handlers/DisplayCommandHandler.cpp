#include "handlers/DisplayCommandHandler.hpp"
#include "core/Protocol.hpp"
#include "core/WireCodec.hpp"

namespace handlers {

using namespace core::protocol;

bool DisplayCommandHandler::can_handle(const std::vector<uint8_t>& payload) const {
    return has_magic(payload, SCREENCAP_MAGIC) || has_magic(payload, SIZE_MAGIC);
}

std::unique_ptr<core::command::ICommand> DisplayCommandHandler::parse_command(
    const std::vector<uint8_t>& payload,
    const core::command::CommandContext& ctx
) {
    if (has_magic(payload, SCREENCAP_MAGIC)) {
        return std::make_unique<ScreencapCommand>(frame_provider_, logger_, ctx);
    }
    else if (has_magic(payload, SIZE_MAGIC)) {
        return std::make_unique<ScreenSizeCommand>(ctx);
    }

    return nullptr;
}

// ============================================================================
// ScreencapCommand
// ============================================================================

common::EmptyResult ScreencapCommand::execute() {
    std::vector<uint8_t> pixels;

    if (provider_ && ctx_.server) {
        const auto& geometry = ctx_.server->geometry;
        auto frame = provider_->capture_frame(geometry.width, geometry.height);
        if (frame.is_err()) {
            if (logger_) logger_->error("[Screencap] Failed to fetch image: " + frame.error().message);
        } else {
            pixels = frame.take().pixels;
        }
    } else if (logger_) {
        logger_->error("[Screencap] No frame provider");
    }

    std::vector<uint8_t> reply;
    reply.reserve(4 + pixels.size());
    append_u32(reply, static_cast<uint32_t>(pixels.size()));
    reply.insert(reply.end(), pixels.begin(), pixels.end());

    return ctx_.reply(reply);
}

// ============================================================================
// ScreenSizeCommand
// ============================================================================

common::EmptyResult ScreenSizeCommand::execute() {
    uint32_t width = 0;
    uint32_t height = 0;
    if (ctx_.server) {
        width = ctx_.server->geometry.width;
        height = ctx_.server->geometry.height;
    }

    std::vector<uint8_t> reply;
    append_u16(reply, width);
    append_u16(reply, height);
    return ctx_.reply(reply);
}

} // namespace handlers
