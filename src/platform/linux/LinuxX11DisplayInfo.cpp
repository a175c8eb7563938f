#include "LinuxX11DisplayInfo.hpp"

#include <X11/Xlib.h>
#include <X11/Xatom.h>

namespace platform {
namespace linux_os {

    LinuxX11DisplayInfo::LinuxX11DisplayInfo(std::shared_ptr<LinuxX11Connection> connection, double scale)
        : connection_(std::move(connection)), scale_(scale > 0.0 ? scale : 1.0) {}

    common::Result<common::DisplayGeometry> LinuxX11DisplayInfo::get_display_geometry() {
        using ResultType = common::Result<common::DisplayGeometry>;
        if (!connection_ || !connection_->is_open()) {
            return ResultType::err(common::ErrorCode::NotInitialized, "X display not open");
        }

        auto lock = connection_->lock();
        auto window = connection_->target_window();
        if (window.is_err()) return ResultType::err(window.error());

        XWindowAttributes attrs;
        if (!XGetWindowAttributes(connection_->display(), window.unwrap(), &attrs)) {
            return ResultType::err(common::ErrorCode::DeviceNotFound, "XGetWindowAttributes failed");
        }
        if (attrs.width <= 0 || attrs.height <= 0 || attrs.map_state != IsViewable) {
            return ResultType::err(common::ErrorCode::Unavailable, "Window not mapped yet");
        }

        common::DisplayGeometry geometry;
        geometry.width = static_cast<uint32_t>(attrs.width);
        geometry.height = static_cast<uint32_t>(attrs.height);
        geometry.scale = scale_;
        return ResultType::ok(geometry);
    }

    common::Result<std::string> LinuxX11DisplayInfo::get_window_label() {
        using ResultType = common::Result<std::string>;
        if (!connection_ || !connection_->is_open()) {
            return ResultType::err(common::ErrorCode::NotInitialized, "X display not open");
        }

        auto lock = connection_->lock();
        auto window = connection_->target_window();
        if (window.is_err()) return ResultType::err(window.error());

        // The root window usually has no title; label it with the display name
        if (connection_->targets_root()) {
            return ResultType::ok(std::string(DisplayString(connection_->display())));
        }

        std::string title = connection_->window_title(window.unwrap());
        if (title.empty()) {
            return ResultType::err(common::ErrorCode::Unavailable, "Window has no title yet");
        }
        return ResultType::ok(title);
    }

    common::EmptyResult LinuxX11DisplayInfo::set_window_label(const std::string& label) {
        if (!connection_ || !connection_->is_open()) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "X display not open");
        }

        auto lock = connection_->lock();
        if (connection_->targets_root()) {
            // Renaming the root window is meaningless
            return common::EmptyResult::success();
        }

        auto window = connection_->target_window();
        if (window.is_err()) return common::EmptyResult::err(window.error());

        Display* display = connection_->display();
        XStoreName(display, window.unwrap(), label.c_str());

        Atom net_wm_name = XInternAtom(display, "_NET_WM_NAME", False);
        Atom utf8_string = XInternAtom(display, "UTF8_STRING", False);
        XChangeProperty(display, window.unwrap(), net_wm_name, utf8_string, 8, PropModeReplace,
                        reinterpret_cast<const unsigned char*>(label.data()),
                        static_cast<int>(label.size()));
        XFlush(display);

        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
