#include "LinuxX11FrameProvider.hpp"
#include "core/FrameNormalizer.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace platform {
namespace linux_os {

    LinuxX11FrameProvider::LinuxX11FrameProvider(std::shared_ptr<LinuxX11Connection> connection)
        : connection_(std::move(connection)) {}

    common::Result<common::RawFrame> LinuxX11FrameProvider::grab_window() {
        using ResultType = common::Result<common::RawFrame>;
        if (!connection_ || !connection_->is_open()) {
            return ResultType::err(common::ErrorCode::NotInitialized, "X display not open");
        }

        auto lock = connection_->lock();
        auto window = connection_->target_window();
        if (window.is_err()) return ResultType::err(window.error());

        Display* display = connection_->display();
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(display, window.unwrap(), &attrs) || attrs.map_state != IsViewable) {
            return ResultType::err(common::ErrorCode::Unavailable, "Window not viewable");
        }

        XImage* image = XGetImage(display, window.unwrap(), 0, 0,
                                  static_cast<unsigned int>(attrs.width),
                                  static_cast<unsigned int>(attrs.height),
                                  AllPlanes, ZPixmap);
        if (!image) {
            return ResultType::err(common::ErrorCode::SystemError, "XGetImage failed");
        }

        common::RawFrame frame;
        frame.width = static_cast<uint32_t>(image->width);
        frame.height = static_cast<uint32_t>(image->height);

        if (image->bits_per_pixel == 32 && image->byte_order == LSBFirst &&
            image->red_mask == 0xff0000 && image->blue_mask == 0xff) {
            // Fast path: B,G,R,X bytes per pixel
            frame.stride = static_cast<uint32_t>(image->bytes_per_line);
            frame.format = common::PixelFormat::BGRA;
            const uint8_t* data = reinterpret_cast<const uint8_t*>(image->data);
            frame.pixels.assign(data, data + static_cast<size_t>(image->bytes_per_line) * image->height);
        } else {
            // Any other visual: go through XGetPixel and the visual masks
            frame.stride = frame.width * 4;
            frame.format = common::PixelFormat::RGBA;
            frame.pixels.resize(static_cast<size_t>(frame.stride) * frame.height);

            auto channel = [](unsigned long pixel, unsigned long mask) -> uint8_t {
                if (mask == 0) return 0;
                int shift = 0;
                while (((mask >> shift) & 1) == 0) ++shift;
                unsigned long max = mask >> shift;
                return static_cast<uint8_t>(((pixel & mask) >> shift) * 255 / max);
            };

            uint8_t* dst = frame.pixels.data();
            for (int y = 0; y < image->height; ++y) {
                for (int x = 0; x < image->width; ++x) {
                    unsigned long pixel = XGetPixel(image, x, y);
                    *dst++ = channel(pixel, image->red_mask);
                    *dst++ = channel(pixel, image->green_mask);
                    *dst++ = channel(pixel, image->blue_mask);
                    *dst++ = 0xFF;
                }
            }
        }

        XDestroyImage(image);
        return ResultType::ok(std::move(frame));
    }

    common::Result<common::RawFrame> LinuxX11FrameProvider::capture_frame(uint32_t width, uint32_t height) {
        auto raw = grab_window();
        if (raw.is_err()) return raw;
        return core::normalize_frame(raw.unwrap(), width, height);
    }

} // namespace linux_os
} // namespace platform
