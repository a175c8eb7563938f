#pragma once
#include "core/ICommand.hpp"
#include "interfaces/IFrameProvider.hpp"
#include "common/Logger.hpp"
#include <memory>

namespace handlers {

// ============================================================================
// DisplayCommandHandler - Handles display queries
// ============================================================================
// Commands: SCRN (screen capture), SIZE (display size)
// ============================================================================

class DisplayCommandHandler final : public core::command::ICommandHandler {
public:
    DisplayCommandHandler(
        std::shared_ptr<interfaces::IFrameProvider> frame_provider,
        std::shared_ptr<common::ILogger> logger
    )   : frame_provider_(std::move(frame_provider))
        , logger_(std::move(logger))
    {}

    bool can_handle(const std::vector<uint8_t>& payload) const override;
    const char* category() const noexcept override { return "Display"; }

    std::unique_ptr<core::command::ICommand> parse_command(
        const std::vector<uint8_t>& payload,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<interfaces::IFrameProvider> frame_provider_;
    std::shared_ptr<common::ILogger> logger_;
};

// ============================================================================
// Display Commands
// ============================================================================

// Reply: u32 length + RGBA pixels, or u32 0 when no image is available
class ScreencapCommand final : public core::command::ICommand {
public:
    ScreencapCommand(std::shared_ptr<interfaces::IFrameProvider> provider,
                     std::shared_ptr<common::ILogger> logger,
                     core::command::CommandContext ctx)
        : provider_(std::move(provider)), logger_(std::move(logger)), ctx_(std::move(ctx)) {}
    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "screencap"; }
private:
    std::shared_ptr<interfaces::IFrameProvider> provider_;
    std::shared_ptr<common::ILogger> logger_;
    core::command::CommandContext ctx_;
};

// Reply: u16 width + u16 height
class ScreenSizeCommand final : public core::command::ICommand {
public:
    explicit ScreenSizeCommand(core::command::CommandContext ctx) : ctx_(std::move(ctx)) {}
    common::EmptyResult execute() override;
    const char* type() const noexcept override { return "size"; }
private:
    core::command::CommandContext ctx_;
};

} // namespace handlers
