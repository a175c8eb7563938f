#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace core {
namespace protocol {

    // Reported by the VERSION command
    constexpr uint32_t PROTOCOL_VERSION = 2;

    constexpr size_t MAGIC_SIZE = 4;
    constexpr size_t FRAME_HEADER_SIZE = 2; // u16 big-endian payload length

    using Magic = std::array<uint8_t, MAGIC_SIZE>;

    // ['M', 'A', 'A', 0x00]
    constexpr Magic CONNECT_MAGIC   = {0x4d, 0x41, 0x41, 0x00};
    // ['S', 'C', 'R', 'N']
    constexpr Magic SCREENCAP_MAGIC = {0x53, 0x43, 0x52, 0x4e};
    // ['S', 'I', 'Z', 'E']
    constexpr Magic SIZE_MAGIC      = {0x53, 0x49, 0x5a, 0x45};
    // ['T', 'E', 'R', 'M']
    constexpr Magic TERMINATE_MAGIC = {0x54, 0x45, 0x52, 0x4d};
    // ['T', 'U', 'C', 'H']
    constexpr Magic TOUCH_MAGIC     = {0x54, 0x55, 0x43, 0x48};
    // ['V', 'E', 'R', 'N']
    constexpr Magic VERSION_MAGIC   = {0x56, 0x45, 0x52, 0x4e};

    constexpr std::array<uint8_t, 4> HANDSHAKE_REPLY = {'O', 'K', 'A', 'Y'};

    // TUCH payload: magic(4) + phase(1) + x(u16) + y(u16)
    constexpr size_t TOUCH_PHASE_OFFSET = 4;
    constexpr size_t TOUCH_X_OFFSET = 5;
    constexpr size_t TOUCH_Y_OFFSET = 7;

    // Wire values of the phase byte. 2 is reserved and never acted on.
    enum class WireTouchPhase : uint8_t {
        Down = 0,
        Move = 1,
        Up = 3
    };

} // namespace protocol
} // namespace core
