#pragma once
#include <chrono>
#include <memory>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/SessionState.hpp"
#include "interfaces/IDisplayInfo.hpp"

namespace core {

    // ========================================================================
    // DisplayGate - Startup readiness wait
    // ========================================================================
    // Polls the display until both a non-zero geometry and a window label
    // are known, then freezes them into the ServerState shared by every
    // connection. Geometry is never re-queried afterwards.
    // ========================================================================
    class DisplayGate {
    public:
        DisplayGate(std::shared_ptr<interfaces::IDisplayInfo> display,
                    std::shared_ptr<common::ILogger> logger,
                    std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

        // Blocks until ready. Returns Cancelled if the token fires first.
        // A positive `scale_override` replaces the scale the display reports.
        common::Result<std::shared_ptr<const ServerState>> wait_until_ready(
            const common::CancellationToken& token, double scale_override = 0.0);

        // Number of display queries made by the last wait (tests, logging)
        int attempts() const { return attempts_; }

    private:
        std::shared_ptr<interfaces::IDisplayInfo> display_;
        std::shared_ptr<common::ILogger> logger_;
        std::chrono::milliseconds poll_interval_;
        int attempts_ = 0;
    };

} // namespace core
