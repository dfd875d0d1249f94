#pragma once

#include <cstdint>

namespace bitbrush
{

// A pattern is a plain value whose significant bits are the lowest `width` bits
// of the engine that produced it.
using Pattern = std::uint64_t;

inline constexpr int kByteBits = 8;
inline constexpr int kMaxWidth = 64;

// Mask covering the lowest `width` bits; width must be in [1, kMaxWidth].
inline constexpr Pattern MaskForWidth(int width)
{
    return width >= kMaxWidth ? ~Pattern{ 0 } : ((Pattern{ 1 } << width) - 1);
}

inline constexpr Pattern Bit(int index) { return Pattern{ 1 } << index; }

} // namespace bitbrush
