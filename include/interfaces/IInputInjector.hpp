#pragma once
#include <optional>
#include "common/Result.hpp"

namespace interfaces {

    enum class TouchPhase {
        Began,
        Moved,
        Ended
    };

    inline const char* to_string(TouchPhase phase) {
        switch (phase) {
            case TouchPhase::Began: return "down";
            case TouchPhase::Moved: return "move";
            case TouchPhase::Ended: return "up";
        }
        return "?";
    }

    class IInputInjector {
    public:
        virtual ~IInputInjector() = default;

        // Inject one touch event at logical coordinates.
        // `touch_id` identifies the gesture: a Began with an empty id
        // allocates one, Moved/Ended reuse it. The caller clears it after
        // Ended.
        virtual common::EmptyResult inject_touch(
            int x, int y, TouchPhase phase, std::optional<int>& touch_id) = 0;
    };

}
