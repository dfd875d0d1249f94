#include "MirrorTable.hpp"
#include "Pattern.hpp"

namespace bitbrush
{

MirrorTable::MirrorTable()
{
    for (std::size_t i = 0; i < Size(); ++i)
    {
        unsigned value = static_cast<unsigned>(i);
        unsigned reversed = 0;
        for (int bit = 0; bit < kByteBits; ++bit)
        {
            reversed = (reversed << 1) | (value & 1u);
            value >>= 1;
        }
        table_[i] = static_cast<std::uint8_t>(reversed);
    }
}

} // namespace bitbrush
