#include "LinuxAppController.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <sys/types.h>

#include <X11/Xlib.h>
#include <X11/Xatom.h>

namespace platform {
namespace linux_os {

    namespace {

        // 0 if the window does not advertise its pid
        pid_t window_pid(Display* display, Window window) {
            Atom net_wm_pid = XInternAtom(display, "_NET_WM_PID", True);
            if (net_wm_pid == None) return 0;

            Atom actual_type;
            int actual_format;
            unsigned long n_items, bytes_after;
            unsigned char* prop = nullptr;
            pid_t pid = 0;

            if (XGetWindowProperty(display, window, net_wm_pid, 0, 1, False, XA_CARDINAL,
                                   &actual_type, &actual_format, &n_items, &bytes_after,
                                   &prop) == Success && prop) {
                if (actual_format == 32 && n_items == 1) {
                    // Format 32 properties are returned as longs
                    pid = static_cast<pid_t>(*reinterpret_cast<unsigned long*>(prop));
                }
                XFree(prop);
            }
            return pid;
        }

    } // namespace

    LinuxAppController::LinuxAppController(std::shared_ptr<LinuxX11Connection> connection)
        : connection_(std::move(connection)) {}

    common::EmptyResult LinuxAppController::terminate_application() {
        if (!connection_ || !connection_->is_open()) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "X display not open");
        }
        if (connection_->targets_root()) {
            return common::EmptyResult::err(
                common::ErrorCode::InvalidArgument,
                "No target window configured; refusing to terminate the desktop"
            );
        }

        auto lock = connection_->lock();
        auto window = connection_->target_window();
        if (window.is_err()) return common::EmptyResult::err(window.error());

        Display* display = connection_->display();
        pid_t pid = window_pid(display, window.unwrap());

        if (pid > 0) {
            if (::kill(pid, SIGTERM) != 0) {
                return common::EmptyResult::err(
                    common::ErrorCode::SystemError,
                    "kill(" + std::to_string(pid) + ") failed: " + std::strerror(errno)
                );
            }
            return common::EmptyResult::success();
        }

        XKillClient(display, window.unwrap());
        XFlush(display);
        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
