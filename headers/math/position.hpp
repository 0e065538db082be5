#ifndef BASALT_POSITION_HPP
#define BASALT_POSITION_HPP


#include <cstdint>

/**
 * Entity position in world space.
 */
class Position
{
public:
    double x = 0;
    double y = 0;
    double z = 0;
    float yaw = 0;
    float pitch = 0;

    [[nodiscard]] int cx() const;

    [[nodiscard]] int cz() const;
};

/**
 * Integer block coordinate sent on the wire as one packed 64-bit value:
 * x in the top 26 bits, z in the next 26, y in the low 12, all two's complement.
 */
class BlockPosition
{
public:
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    [[nodiscard]] int64_t pack() const;

    static BlockPosition unpack(int64_t packed);

    bool operator==(const BlockPosition& other) const = default;
};


#endif //BASALT_POSITION_HPP
