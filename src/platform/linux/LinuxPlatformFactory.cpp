#ifdef PLATFORM_LINUX

#include "LinuxPlatformFactory.hpp"
#include "LinuxX11Connection.hpp"
#include "LinuxX11DisplayInfo.hpp"
#include "LinuxX11FrameProvider.hpp"
#include "LinuxXTestInjector.hpp"
#include "LinuxAppController.hpp"

namespace platform {
namespace linux_os {

LinuxPlatformFactory::LinuxPlatformFactory(std::string window_name, double scale)
    : connection_(std::make_shared<LinuxX11Connection>(std::move(window_name)))
    , scale_(scale)
{}

// ============================================================================
// Factory Method Implementations
// ============================================================================

std::shared_ptr<interfaces::IDisplayInfo> LinuxPlatformFactory::create_display_info() {
    return std::make_shared<LinuxX11DisplayInfo>(connection_, scale_);
}

std::shared_ptr<interfaces::IFrameProvider> LinuxPlatformFactory::create_frame_provider() {
    return std::make_shared<LinuxX11FrameProvider>(connection_);
}

std::shared_ptr<interfaces::IInputInjector> LinuxPlatformFactory::create_input_injector() {
    auto injector = std::make_shared<LinuxXTestInjector>(connection_);
    if (!injector->is_available()) return nullptr;
    return injector;
}

std::shared_ptr<interfaces::ILifecycleController> LinuxPlatformFactory::create_lifecycle_controller() {
    return std::make_shared<LinuxAppController>(connection_);
}

bool LinuxPlatformFactory::is_fully_supported() const noexcept {
    return connection_ && connection_->is_open();
}

} // namespace linux_os
} // namespace platform

#endif // PLATFORM_LINUX
