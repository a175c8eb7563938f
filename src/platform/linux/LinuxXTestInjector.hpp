#pragma once
#include "interfaces/IInputInjector.hpp"
#include "LinuxX11Connection.hpp"
#include <memory>

namespace platform {
namespace linux_os {

    /**
     * Touch injection using the XTest extension (X11)
     *
     * A touch gesture is replayed as a left-button drag: Began presses
     * Button1 at the point, Moved warps the pointer, Ended releases. Window
     * coordinates are translated to root coordinates before injection.
     *
     * NOTE: This does NOT work on Wayland.
     *
     * Dependencies:
     *   - libX11-dev / libX11-devel
     *   - libXtst-dev / libXtst-devel
     */
    class LinuxXTestInjector : public interfaces::IInputInjector {
    public:
        explicit LinuxXTestInjector(std::shared_ptr<LinuxX11Connection> connection);

        common::EmptyResult inject_touch(
            int x, int y, interfaces::TouchPhase phase, std::optional<int>& touch_id) override;

        // Check if XTest is available
        bool is_available() const { return available_; }

    private:
        std::shared_ptr<LinuxX11Connection> connection_;
        bool available_ = false;
        int next_touch_id_ = 1;
    };

} // namespace linux_os
} // namespace platform
