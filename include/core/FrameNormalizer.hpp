#pragma once
#include <cstdint>
#include "common/PixelTypes.hpp"
#include "common/Result.hpp"

namespace core {

    // Turns a raw window capture into the SCRN payload format.
    //
    // The capture may include a title bar: its height is inferred from the
    // target aspect ratio as `image.height - image.width * height / width`
    // and cropped off the top. The remaining content is resampled
    // (nearest neighbor) to exactly width x height, RGBA byte order, with
    // the alpha byte forced to 0xFF.
    common::Result<common::RawFrame> normalize_frame(
        const common::RawFrame& capture, uint32_t width, uint32_t height);

} // namespace core
