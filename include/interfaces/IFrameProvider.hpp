#pragma once
#include <cstdint>
#include "common/Result.hpp"
#include "common/PixelTypes.hpp"

namespace interfaces {

    class IFrameProvider {
    public:
        virtual ~IFrameProvider() = default;

        // Snapshot Contract:
        // Returns one RGBA frame of exactly width x height pixels
        // (width * height * 4 bytes, title bar already cropped).
        // An error or an empty frame means "no image"; the caller replies
        // with a zero-length payload.
        virtual common::Result<common::RawFrame> capture_frame(uint32_t width, uint32_t height) = 0;
    };

} // namespace interfaces
