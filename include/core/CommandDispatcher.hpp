#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include "core/ICommand.hpp"
#include "common/Logger.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandDispatcher - Central command routing
// ============================================================================
// Routes one framed payload to the handler that owns its leading 4-byte
// magic tag. Uses a flat handler list with O(n) lookup - acceptable since we
// have < 10 handlers.
//
// Thread Safety: dispatch() is thread-safe (handlers called without lock).
// Handlers are registered at startup only (no runtime registration needed).
// ============================================================================

class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<common::ILogger> logger);
    ~CommandDispatcher();

    // ========== Handler Registration ==========

    // Register a handler. Handlers are checked in registration order.
    void register_handler(std::shared_ptr<ICommandHandler> handler);

    // ========== Command Dispatching ==========

    // Execute the command carried by `payload`.
    //
    // Unknown tags and ignored payloads succeed without doing anything.
    // Returns an error only for transport failures (the reply could not be
    // written); collaborator failures are logged and swallowed here so a
    // single failing command never closes the connection.
    common::EmptyResult dispatch(
        const std::vector<uint8_t>& payload,
        const CommandContext& ctx
    );

    // ========== Statistics ==========

    struct Stats {
        uint64_t total_dispatched = 0;
        uint64_t ignored_commands = 0;
        uint64_t execution_errors = 0;
    };

    Stats get_stats() const;

private:
    std::shared_ptr<common::ILogger> logger_;
    std::vector<std::shared_ptr<ICommandHandler>> handlers_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace command
} // namespace core
