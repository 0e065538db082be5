#include <cmath>
#include "math/position.hpp"

int Position::cx() const
{
    return static_cast<int>(std::floor(x)) >> 4;
}

int Position::cz() const
{
    return static_cast<int>(std::floor(z)) >> 4;
}

int64_t BlockPosition::pack() const
{
    uint64_t packed = (static_cast<uint64_t>(x) & 0x3ffffff) << 38 |
                      (static_cast<uint64_t>(z) & 0x3ffffff) << 12 |
                      (static_cast<uint64_t>(y) & 0xfff);
    return static_cast<int64_t>(packed);
}

BlockPosition BlockPosition::unpack(int64_t packed)
{
    BlockPosition pos;
    // arithmetic shifts sign extend each field
    pos.x = static_cast<int32_t>(packed >> 38);
    pos.y = static_cast<int32_t>(packed << 52 >> 52);
    pos.z = static_cast<int32_t>(packed << 26 >> 38);
    return pos;
}
