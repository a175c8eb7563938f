#pragma once
#include "interfaces/IFrameProvider.hpp"
#include "LinuxX11Connection.hpp"
#include <memory>

namespace platform {
namespace linux_os {

    // Grabs the target window with XGetImage and normalizes it to the
    // requested size (title bar crop + resample, RGBA).
    class LinuxX11FrameProvider : public interfaces::IFrameProvider {
    public:
        explicit LinuxX11FrameProvider(std::shared_ptr<LinuxX11Connection> connection);

        common::Result<common::RawFrame> capture_frame(uint32_t width, uint32_t height) override;

    private:
        common::Result<common::RawFrame> grab_window();

        std::shared_ptr<LinuxX11Connection> connection_;
    };

} // namespace linux_os
} // namespace platform
