#pragma once
#include "interfaces/IDisplayInfo.hpp"
#include "LinuxX11Connection.hpp"
#include <memory>

namespace platform {
namespace linux_os {

    // Geometry and title of the target X11 window. The scale factor is not
    // something X11 reports per window; it comes from configuration.
    class LinuxX11DisplayInfo : public interfaces::IDisplayInfo {
    public:
        LinuxX11DisplayInfo(std::shared_ptr<LinuxX11Connection> connection, double scale);

        common::Result<common::DisplayGeometry> get_display_geometry() override;
        common::Result<std::string> get_window_label() override;
        common::EmptyResult set_window_label(const std::string& label) override;

    private:
        std::shared_ptr<LinuxX11Connection> connection_;
        double scale_;
    };

} // namespace linux_os
} // namespace platform
