#include "LinuxXTestInjector.hpp"
#include <iostream>

// X11 Headers - only included in the .cpp file
#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>

namespace platform {
namespace linux_os {

    LinuxXTestInjector::LinuxXTestInjector(std::shared_ptr<LinuxX11Connection> connection)
        : connection_(std::move(connection)) {

        if (!connection_ || !connection_->is_open()) {
            std::cerr << "[LinuxXTestInjector] No X display. "
                      << "Are you running in an X11 session?" << std::endl;
            return;
        }

        auto lock = connection_->lock();

        // Check if XTest extension is available
        int event_base, error_base, major, minor;
        if (!XTestQueryExtension(connection_->display(), &event_base, &error_base, &major, &minor)) {
            std::cerr << "[LinuxXTestInjector] XTest extension not available!" << std::endl;
            return;
        }

        available_ = true;
        std::cout << "[LinuxXTestInjector] Initialized. XTest v"
                  << major << "." << minor << std::endl;
    }

    common::EmptyResult LinuxXTestInjector::inject_touch(
        int x, int y, interfaces::TouchPhase phase, std::optional<int>& touch_id) {

        if (!available_) {
            return common::EmptyResult::err(
                common::ErrorCode::NotInitialized,
                "XTest injector not initialized"
            );
        }

        auto lock = connection_->lock();
        auto window = connection_->target_window();
        if (window.is_err()) return common::EmptyResult::err(window.error());

        Display* display = connection_->display();
        Window root = DefaultRootWindow(display);

        // Window-relative -> root coordinates
        int root_x = x;
        int root_y = y;
        Window child;
        if (window.unwrap() != root) {
            if (!XTranslateCoordinates(display, window.unwrap(), root, x, y, &root_x, &root_y, &child)) {
                return common::EmptyResult::err(
                    common::ErrorCode::DeviceNotFound,
                    "Target window is on another screen"
                );
            }
        }

        if (phase == interfaces::TouchPhase::Began && !touch_id) {
            touch_id = next_touch_id_++;
        }

        // Parameters: display, screen (-1 = current), x, y, delay (CurrentTime = immediate)
        Bool result = XTestFakeMotionEvent(display, -1, root_x, root_y, CurrentTime);

        if (result) {
            switch (phase) {
                case interfaces::TouchPhase::Began:
                    result = XTestFakeButtonEvent(display, Button1, True, CurrentTime);
                    break;
                case interfaces::TouchPhase::Ended:
                    result = XTestFakeButtonEvent(display, Button1, False, CurrentTime);
                    break;
                case interfaces::TouchPhase::Moved:
                    break;
            }
        }

        // Flush the display to ensure the event is sent immediately
        XFlush(display);

        if (!result) {
            return common::EmptyResult::err(
                common::ErrorCode::SystemError,
                std::string("XTest injection failed for ") + interfaces::to_string(phase)
            );
        }

        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
