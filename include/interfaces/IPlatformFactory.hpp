#pragma once
#include <memory>
#include "interfaces/IDisplayInfo.hpp"
#include "interfaces/IFrameProvider.hpp"
#include "interfaces/IInputInjector.hpp"
#include "interfaces/ILifecycleController.hpp"

namespace interfaces {

// ============================================================================
// IPlatformFactory - Abstract Factory for platform-specific components
// ============================================================================
// Creates the four collaborators the protocol engine drives. Each platform
// (X11, in-memory mock) provides its own implementation.
//
// Usage:
//   auto display = factory->create_display_info();
//   auto frames  = factory->create_frame_provider();
// ============================================================================

class IPlatformFactory {
public:
    virtual ~IPlatformFactory() = default;

    // ========== Component Factory Methods ==========

    virtual std::shared_ptr<IDisplayInfo> create_display_info() = 0;

    virtual std::shared_ptr<IFrameProvider> create_frame_provider() = 0;

    // May return nullptr if input injection is not supported
    virtual std::shared_ptr<IInputInjector> create_input_injector() = 0;

    virtual std::shared_ptr<ILifecycleController> create_lifecycle_controller() = 0;

    // ========== Platform Info ==========

    // Platform name for logging/debugging (e.g., "Linux-X11", "Mock")
    virtual const char* platform_name() const noexcept = 0;

    // Check if all essential components are available
    virtual bool is_fully_supported() const noexcept { return true; }
};

} // namespace interfaces
