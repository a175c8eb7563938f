#include "core/FrameNormalizer.hpp"

namespace core {

    common::Result<common::RawFrame> normalize_frame(
        const common::RawFrame& capture, uint32_t width, uint32_t height) {
        using ResultType = common::Result<common::RawFrame>;

        if (capture.empty()) {
            return ResultType::err(common::ErrorCode::Unavailable, "Empty capture");
        }
        if (width == 0 || height == 0) {
            return ResultType::err(common::ErrorCode::InvalidArgument, "Target size is zero");
        }

        const uint64_t row_bytes = capture.row_bytes();
        if (row_bytes < static_cast<uint64_t>(capture.width) * 4 ||
            capture.pixels.size() < row_bytes * capture.height) {
            return ResultType::err(common::ErrorCode::InvalidArgument, "Capture buffer too small");
        }

        // Crop the title bar
        int64_t title_bar = static_cast<int64_t>(capture.height) -
                            static_cast<int64_t>(capture.width) * height / width;
        if (title_bar < 0) title_bar = 0;
        if (title_bar >= static_cast<int64_t>(capture.height)) {
            return ResultType::err(common::ErrorCode::InvalidArgument, "Failed to crop image");
        }

        const uint32_t src_top = static_cast<uint32_t>(title_bar);
        const uint32_t src_height = capture.height - src_top;
        const bool bgra = capture.format == common::PixelFormat::BGRA;

        common::RawFrame out;
        out.width = width;
        out.height = height;
        out.stride = width * 4;
        out.format = common::PixelFormat::RGBA;
        out.pixels.resize(static_cast<size_t>(width) * height * 4);

        for (uint32_t y = 0; y < height; ++y) {
            const uint32_t sy = src_top + static_cast<uint32_t>(static_cast<uint64_t>(y) * src_height / height);
            const uint8_t* src_row = capture.pixels.data() + row_bytes * sy;
            uint8_t* dst = out.pixels.data() + static_cast<size_t>(y) * out.stride;

            for (uint32_t x = 0; x < width; ++x) {
                const uint32_t sx = static_cast<uint32_t>(static_cast<uint64_t>(x) * capture.width / width);
                const uint8_t* px = src_row + static_cast<size_t>(sx) * 4;
                dst[0] = bgra ? px[2] : px[0];
                dst[1] = px[1];
                dst[2] = bgra ? px[0] : px[2];
                dst[3] = 0xFF;
                dst += 4;
            }
        }

        return ResultType::ok(std::move(out));
    }

} // namespace core
