#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include "common/Result.hpp"
#include "core/SessionState.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandContext - Shared context for all commands
// ============================================================================
// Contains all information needed to execute a command and send responses.
// Built once per connection and passed by reference to avoid copying.
// ============================================================================

struct CommandContext {
    uint32_t connection_id = 0;

    // Immutable display geometry and window label
    std::shared_ptr<const ServerState> server;

    // Per-connection mutable state (touch identifier)
    SessionState* session = nullptr;

    // Writes raw reply bytes on the connection. Blocks until every byte is
    // written so replies keep the order of their requests.
    using WriteFn = std::function<common::EmptyResult(const std::vector<uint8_t>&)>;
    WriteFn write;

    common::EmptyResult reply(const std::vector<uint8_t>& bytes) const {
        if (!write) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No writer bound to context");
        }
        return write(bytes);
    }
};

// ============================================================================
// ICommand - Base interface for all commands (Command Pattern)
// ============================================================================
// Each command encapsulates a single action. Commands are created
// per-request and carry everything they need for execution.
// ============================================================================

class ICommand {
public:
    virtual ~ICommand() = default;

    // Execute the command
    // Returns:
    //   - Ok: Command executed successfully (reply already written)
    //   - Error: Transport errors end the connection, anything else is
    //     logged by the dispatcher
    virtual common::EmptyResult execute() = 0;

    // Command type identifier (for logging/debugging)
    virtual const char* type() const noexcept = 0;

    // Is this a high-frequency command? (affects logging)
    // Touch moves arrive many times per second and are not logged
    virtual bool is_high_frequency() const noexcept { return false; }
};

// ============================================================================
// ICommandHandler - Factory for creating commands (Strategy Pattern)
// ============================================================================
// Handlers are registered with CommandDispatcher at startup. Each handler
// owns a category of magic tags and the collaborator they drive.
// ============================================================================

class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    // Check if this handler owns the payload's leading magic tag
    virtual bool can_handle(const std::vector<uint8_t>& payload) const = 0;

    // Create a command object for the given payload.
    //
    // Returns:
    //   - unique_ptr<ICommand> to execute
    //   - nullptr when the payload is deliberately ignored (e.g. a reserved
    //     touch phase); the dispatcher counts it and moves on
    virtual std::unique_ptr<ICommand> parse_command(
        const std::vector<uint8_t>& payload,
        const CommandContext& ctx
    ) = 0;

    // Handler category name (for logging/debugging)
    virtual const char* category() const noexcept = 0;
};

} // namespace command
} // namespace core
