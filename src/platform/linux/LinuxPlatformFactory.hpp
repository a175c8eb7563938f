#pragma once
#include "interfaces/IPlatformFactory.hpp"
#include <string>

#ifdef PLATFORM_LINUX

namespace platform {
namespace linux_os {

class LinuxX11Connection;

// ============================================================================
// LinuxPlatformFactory - Factory for Linux (X11) platform components
// ============================================================================
// All components share one Xlib connection and target the same window.
// ============================================================================

class LinuxPlatformFactory final : public interfaces::IPlatformFactory {
public:
    LinuxPlatformFactory(std::string window_name, double scale);
    ~LinuxPlatformFactory() override = default;

    // ========== IPlatformFactory Implementation ==========

    std::shared_ptr<interfaces::IDisplayInfo> create_display_info() override;
    std::shared_ptr<interfaces::IFrameProvider> create_frame_provider() override;
    std::shared_ptr<interfaces::IInputInjector> create_input_injector() override;
    std::shared_ptr<interfaces::ILifecycleController> create_lifecycle_controller() override;

    const char* platform_name() const noexcept override { return "Linux-X11"; }

    // False when no X display could be opened (e.g. Wayland-only session)
    bool is_fully_supported() const noexcept override;

private:
    std::shared_ptr<LinuxX11Connection> connection_;
    double scale_;
};

} // namespace linux_os
} // namespace platform

#endif // PLATFORM_LINUX
