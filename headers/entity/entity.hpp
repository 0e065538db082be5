#ifndef BASALT_ENTITY_HPP
#define BASALT_ENTITY_HPP

#include <cstdint>
#include "math/position.hpp"
#include "math/uuid.hpp"


class Entity
{
public:
    Entity(int32_t entity_id, UUID uid);

    virtual ~Entity() = default;

    [[nodiscard]] inline const Position& position() const { return pos; }

    inline void set_position(const Position& position) { pos = position; }

    [[nodiscard]] inline const UUID& uuid() const { return uid; }

    [[nodiscard]] inline int32_t id() const { return eid; }
protected:
    Position pos;
    UUID uid;
    int32_t eid;
};


#endif //BASALT_ENTITY_HPP
