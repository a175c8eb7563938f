#pragma once
#include "core/ICommand.hpp"
#include "interfaces/IInputInjector.hpp"
#include <memory>

namespace handlers {

// ============================================================================
// TouchCommandHandler - Handles TUCH commands
// ============================================================================
// Payload: magic(4) + phase(1) + x(u16) + y(u16), device pixels.
// Phases 0/1/3 map to down/move/up; any other phase is ignored.
// Coordinates are divided by the display scale before injection.
//
// Marked as high_frequency to skip logging.
// ============================================================================

class TouchCommandHandler final : public core::command::ICommandHandler {
public:
    explicit TouchCommandHandler(std::shared_ptr<interfaces::IInputInjector> injector)
        : injector_(std::move(injector)) {}

    bool can_handle(const std::vector<uint8_t>& payload) const override;
    const char* category() const noexcept override { return "Touch"; }

    std::unique_ptr<core::command::ICommand> parse_command(
        const std::vector<uint8_t>& payload,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
};

// ============================================================================
// Concrete Touch Command
// ============================================================================

class TouchCommand final : public core::command::ICommand {
public:
    TouchCommand(
        std::shared_ptr<interfaces::IInputInjector> injector,
        core::SessionState* session,
        interfaces::TouchPhase phase,
        int x, int y
    ) : injector_(std::move(injector)), session_(session), phase_(phase), x_(x), y_(y) {}

    common::EmptyResult execute() override;

    const char* type() const noexcept override { return interfaces::to_string(phase_); }
    bool is_high_frequency() const noexcept override { return true; }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    core::SessionState* session_;
    interfaces::TouchPhase phase_;
    int x_, y_;
};

} // namespace handlers
