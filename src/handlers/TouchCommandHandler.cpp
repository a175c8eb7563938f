#include "handlers/TouchCommandHandler.hpp"
#include "core/Protocol.hpp"
#include "core/WireCodec.hpp"

namespace handlers {

using namespace core::protocol;

bool TouchCommandHandler::can_handle(const std::vector<uint8_t>& payload) const {
    return has_magic(payload, TOUCH_MAGIC);
}

std::unique_ptr<core::command::ICommand> TouchCommandHandler::parse_command(
    const std::vector<uint8_t>& payload,
    const core::command::CommandContext& ctx
) {
    if (payload.size() <= TOUCH_PHASE_OFFSET || !ctx.session) {
        return nullptr;
    }

    interfaces::TouchPhase phase;
    switch (static_cast<WireTouchPhase>(payload[TOUCH_PHASE_OFFSET])) {
        case WireTouchPhase::Down: phase = interfaces::TouchPhase::Began; break;
        case WireTouchPhase::Move: phase = interfaces::TouchPhase::Moved; break;
        case WireTouchPhase::Up:   phase = interfaces::TouchPhase::Ended; break;
        default:
            return nullptr;
    }

    const double scale = ctx.server ? ctx.server->geometry.scale : 1.0;
    const int x = div_round(decode_u16(payload, TOUCH_X_OFFSET), scale);
    const int y = div_round(decode_u16(payload, TOUCH_Y_OFFSET), scale);

    return std::make_unique<TouchCommand>(injector_, ctx.session, phase, x, y);
}

common::EmptyResult TouchCommand::execute() {
    if (!injector_) {
        return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "No input injector");
    }

    auto res = injector_->inject_touch(x_, y_, phase_, session_->touch_id);

    // The gesture is over even if the injector failed to deliver the up event
    if (phase_ == interfaces::TouchPhase::Ended) {
        session_->touch_id.reset();
    }

    return res;
}

} // namespace handlers
