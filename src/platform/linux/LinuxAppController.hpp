#pragma once
#include "interfaces/ILifecycleController.hpp"
#include "LinuxX11Connection.hpp"
#include <memory>

namespace platform {
namespace linux_os {

    // Terminates the process owning the target window: SIGTERM to the pid
    // advertised in _NET_WM_PID, or XKillClient when the window has none.
    class LinuxAppController : public interfaces::ILifecycleController {
    public:
        explicit LinuxAppController(std::shared_ptr<LinuxX11Connection> connection);

        common::EmptyResult terminate_application() override;

    private:
        std::shared_ptr<LinuxX11Connection> connection_;
    };

} // namespace linux_os
} // namespace platform
