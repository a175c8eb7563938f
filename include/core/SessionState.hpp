#pragma once
#include <optional>
#include <string>
#include "common/PixelTypes.hpp"

namespace core {

    // Captured once before the listener starts, then shared read-only by
    // every connection through std::shared_ptr<const ServerState>.
    struct ServerState {
        common::DisplayGeometry geometry;
        std::string window_label;
    };

    // Owned by exactly one ConnectionHandler and touched only from its thread.
    struct SessionState {
        bool handshake_completed = false;

        // Correlates the down/move/up events of the gesture in progress.
        // Empty between gestures.
        std::optional<int> touch_id;
    };

} // namespace core
