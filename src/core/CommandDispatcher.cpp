#include "core/CommandDispatcher.hpp"
#include "common/Logger.hpp"
#include <string>

namespace core {
namespace command {

// ============================================================================
// Construction
// ============================================================================

CommandDispatcher::CommandDispatcher(std::shared_ptr<common::ILogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) logger_ = std::make_shared<common::NullLogger>();
}

CommandDispatcher::~CommandDispatcher() = default;

// ============================================================================
// Handler Registration
// ============================================================================

void CommandDispatcher::register_handler(std::shared_ptr<ICommandHandler> handler) {
    if (!handler) return;
    logger_->debug(std::string("[Dispatcher] Registered ") + handler->category() + " handler");
    handlers_.push_back(std::move(handler));
}

// ============================================================================
// Command Dispatching
// ============================================================================

common::EmptyResult CommandDispatcher::dispatch(
    const std::vector<uint8_t>& payload,
    const CommandContext& ctx
) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_dispatched++;
    }

    for (auto& handler : handlers_) {
        if (!handler->can_handle(payload)) continue;

        auto command = handler->parse_command(payload, ctx);
        if (!command) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.ignored_commands++;
            return common::EmptyResult::success();
        }

        if (!command->is_high_frequency()) {
            logger_->debug("[CMD] " + std::string(command->type()) +
                           " [CID=" + std::to_string(ctx.connection_id) + "]");
        }

        auto result = command->execute();
        if (result.is_ok()) return result;

        if (common::is_transport_error(result.error().code)) {
            return result;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.execution_errors++;
        }
        logger_->error("[CMD] " + std::string(command->type()) + " failed: " +
                       result.error().message + " [CID=" + std::to_string(ctx.connection_id) + "]");
        return common::EmptyResult::success();
    }

    // No handler found: unknown tags are skipped
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.ignored_commands++;
    }
    logger_->debug("[CMD] Ignored payload of " + std::to_string(payload.size()) +
                   " bytes [CID=" + std::to_string(ctx.connection_id) + "]");

    return common::EmptyResult::success();
}

// ============================================================================
// Statistics
// ============================================================================

CommandDispatcher::Stats CommandDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace command
} // namespace core
