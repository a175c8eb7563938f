#include "handlers/AppCommandHandler.hpp"
#include "core/Protocol.hpp"
#include "core/WireCodec.hpp"

namespace handlers {

using namespace core::protocol;

bool AppCommandHandler::can_handle(const std::vector<uint8_t>& payload) const {
    return has_magic(payload, TERMINATE_MAGIC) || has_magic(payload, VERSION_MAGIC);
}

std::unique_ptr<core::command::ICommand> AppCommandHandler::parse_command(
    const std::vector<uint8_t>& payload,
    const core::command::CommandContext& ctx
) {
    if (has_magic(payload, TERMINATE_MAGIC)) {
        return std::make_unique<TerminateCommand>(lifecycle_, logger_);
    }
    else if (has_magic(payload, VERSION_MAGIC)) {
        return std::make_unique<VersionCommand>(ctx);
    }

    return nullptr;
}

// ============================================================================
// Command Implementations
// ============================================================================

common::EmptyResult TerminateCommand::execute() {
    if (!lifecycle_) {
        return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No lifecycle controller");
    }
    if (logger_) logger_->info("[App] Terminating controlled application");
    return lifecycle_->terminate_application();
}

common::EmptyResult VersionCommand::execute() {
    std::vector<uint8_t> reply;
    append_u32(reply, PROTOCOL_VERSION);
    return ctx_.reply(reply);
}

} // namespace handlers
