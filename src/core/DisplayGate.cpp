#include "core/DisplayGate.hpp"
#include <sstream>

namespace core {

    DisplayGate::DisplayGate(std::shared_ptr<interfaces::IDisplayInfo> display,
                             std::shared_ptr<common::ILogger> logger,
                             std::chrono::milliseconds poll_interval)
        : display_(std::move(display)), logger_(std::move(logger)), poll_interval_(poll_interval) {
        if (!logger_) logger_ = std::make_shared<common::NullLogger>();
    }

    common::Result<std::shared_ptr<const ServerState>> DisplayGate::wait_until_ready(
        const common::CancellationToken& token, double scale_override) {
        using ResultType = common::Result<std::shared_ptr<const ServerState>>;

        if (!display_) {
            return ResultType::err(common::ErrorCode::NotInitialized, "No display info");
        }

        attempts_ = 0;
        while (!token.is_cancellation_requested()) {
            ++attempts_;

            auto geometry = display_->get_display_geometry();
            auto label = display_->get_window_label();

            if (geometry.is_ok() && geometry.unwrap().is_known() && label.is_ok()) {
                auto state = std::make_shared<ServerState>();
                state->geometry = geometry.unwrap();
                if (scale_override > 0.0) state->geometry.scale = scale_override;
                if (!(state->geometry.scale > 0.0)) state->geometry.scale = 1.0;
                state->window_label = label.unwrap();

                std::ostringstream ss;
                ss << "[DisplayGate] Display ready: " << state->geometry.width << "x"
                   << state->geometry.height << " @" << state->geometry.scale
                   << " \"" << state->window_label << "\"";
                logger_->info(ss.str());
                return ResultType::ok(std::shared_ptr<const ServerState>(std::move(state)));
            }

            if (attempts_ == 1) {
                logger_->info("[DisplayGate] Waiting for display...");
            }

            if (token.wait_for(poll_interval_)) break;
        }

        return ResultType::err(common::ErrorCode::Cancelled, "Display wait cancelled");
    }

} // namespace core
