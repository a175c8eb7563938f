#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "core/Protocol.hpp"

namespace core {
namespace protocol {

// ============================================================================
// WireCodec - Big-endian integer and magic tag helpers
// ============================================================================
// Pure functions, no state. Every multi-byte integer on the wire is
// big-endian. Values wider than the target field are truncated to it.
// ============================================================================

std::array<uint8_t, 2> encode_u16(uint32_t value);
std::array<uint8_t, 4> encode_u32(uint32_t value);

void append_u16(std::vector<uint8_t>& out, uint32_t value);
void append_u32(std::vector<uint8_t>& out, uint32_t value);

// Returns 0 when fewer than 2 bytes are available at `offset`.
int decode_u16(const std::vector<uint8_t>& data, size_t offset);
int decode_u16(const uint8_t* data, size_t size, size_t offset);

// round(raw / scale), halves away from zero. A non-positive scale counts as 1.
int div_round(int raw, double scale);

// True when the first MAGIC_SIZE bytes of `payload` equal `magic`.
bool has_magic(const std::vector<uint8_t>& payload, const Magic& magic);
bool has_magic(const uint8_t* data, size_t size, const Magic& magic);

} // namespace protocol
} // namespace core
