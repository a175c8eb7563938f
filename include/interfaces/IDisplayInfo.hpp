#pragma once
#include <string>
#include "common/Result.hpp"
#include "common/PixelTypes.hpp"

namespace interfaces {

    class IDisplayInfo {
    public:
        virtual ~IDisplayInfo() = default;

        // Device-pixel size and scale of the controlled display.
        // Unavailable until the target window exists.
        virtual common::Result<common::DisplayGeometry> get_display_geometry() = 0;

        // Human-readable label (window title). Unavailable until known.
        virtual common::Result<std::string> get_window_label() = 0;

        virtual common::EmptyResult set_window_label(const std::string& label) = 0;
    };

} // namespace interfaces
