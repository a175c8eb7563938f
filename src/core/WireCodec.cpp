#include "core/WireCodec.hpp"
#include <cmath>
#include <cstring>

namespace core {
namespace protocol {

std::array<uint8_t, 2> encode_u16(uint32_t value) {
    return {
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>(value & 0xff)
    };
}

std::array<uint8_t, 4> encode_u32(uint32_t value) {
    return {
        static_cast<uint8_t>((value >> 24) & 0xff),
        static_cast<uint8_t>((value >> 16) & 0xff),
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>(value & 0xff)
    };
}

void append_u16(std::vector<uint8_t>& out, uint32_t value) {
    auto bytes = encode_u16(value);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    auto bytes = encode_u32(value);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

int decode_u16(const uint8_t* data, size_t size, size_t offset) {
    if (data == nullptr || size < 2 || offset > size - 2) {
        return 0;
    }
    return static_cast<int>(data[offset]) * 256 + static_cast<int>(data[offset + 1]);
}

int decode_u16(const std::vector<uint8_t>& data, size_t offset) {
    return decode_u16(data.data(), data.size(), offset);
}

int div_round(int raw, double scale) {
    if (!(scale > 0.0)) scale = 1.0;
    return static_cast<int>(std::lround(static_cast<double>(raw) / scale));
}

bool has_magic(const uint8_t* data, size_t size, const Magic& magic) {
    if (data == nullptr || size < MAGIC_SIZE) return false;
    return std::memcmp(data, magic.data(), MAGIC_SIZE) == 0;
}

bool has_magic(const std::vector<uint8_t>& payload, const Magic& magic) {
    return has_magic(payload.data(), payload.size(), magic);
}

} // namespace protocol
} // namespace core
