#pragma once
#include <vector>
#include <cstdint>
#include <string>

namespace common {

    enum class PixelFormat {
        RGBA, // R,G,B,A byte order (alpha may be padding)
        BGRA  // Xlib ZPixmap order on little-endian TrueColor visuals
    };

    struct RawFrame {
        std::vector<uint8_t> pixels;
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t stride = 0; // Bytes per row, 0 = width * 4
        PixelFormat format = PixelFormat::RGBA;

        bool empty() const { return pixels.empty() || width == 0 || height == 0; }
        uint32_t row_bytes() const { return stride != 0 ? stride : width * 4; }
    };

    // Device-pixel size of the controlled display plus the factor that maps
    // device pixels to logical (injection) coordinates.
    struct DisplayGeometry {
        uint32_t width = 0;
        uint32_t height = 0;
        double scale = 1.0;

        bool is_known() const { return width != 0 && height != 0; }
    };

} // namespace common
