#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace bitbrush
{

// Byte bit-reversal lookup table. table[b] holds the 8 bits of b in reverse order,
// so the table is an involution: Lookup(Lookup(b)) == b.
class MirrorTable
{
public:
    MirrorTable();

    std::uint8_t Lookup(std::uint8_t byte) const { return table_[byte]; }

    static constexpr std::size_t Size() { return 256; }

private:
    std::array<std::uint8_t, 256> table_{};
};

} // namespace bitbrush
