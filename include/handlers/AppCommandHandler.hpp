#pragma once
#include "core/ICommand.hpp"
#include "interfaces/ILifecycleController.hpp"
#include "common/Logger.hpp"
#include <memory>

namespace handlers {

// ============================================================================
// AppCommandHandler - Handles application-level commands
// ============================================================================
// Commands: TERM (terminate controlled application, no reply),
//           VERN (protocol version)
// ============================================================================

class AppCommandHandler final : public core::command::ICommandHandler {
public:
    AppCommandHandler(
        std::shared_ptr<interfaces::ILifecycleController> lifecycle,
        std::shared_ptr<common::ILogger> logger
    )   : lifecycle_(std::move(lifecycle))
        , logger_(std::move(logger))
    {}

    bool can_handle(const std::vector<uint8_t>& payload) const override;
    const char* category() const noexcept override { return "App"; }

    std::unique_ptr<core::command::ICommand> parse_command(
        const std::vector<uint8_t>& payload,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<interfaces::ILifecycleController> lifecycle_;
    std::shared_ptr<common::ILogger> logger_;
};

// ============================================================================
// App Commands
// ============================================================================

class TerminateCommand final : public core::command::ICommand {
public:
    TerminateCommand(std::shared_ptr<interfaces::ILifecycleController> lifecycle,
                     std::shared_ptr<common::ILogger> logger)
        : lifecycle_(std::move(lifecycle)), logger_(std::move(logger)) {}
    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "terminate"; }
private:
    std::shared_ptr<interfaces::ILifecycleController> lifecycle_;
    std::shared_ptr<common::ILogger> logger_;
};

class VersionCommand final : public core::command::ICommand {
public:
    explicit VersionCommand(core::command::CommandContext ctx) : ctx_(std::move(ctx)) {}
    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "version"; }
private:
    core::command::CommandContext ctx_;
};

} // namespace handlers
