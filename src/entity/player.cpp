#include <utility>
#include "entity/player.hpp"

Entity::Entity(int32_t entity_id, UUID uid) : uid(uid), eid(entity_id)
{}

Player::Player(int32_t entity_id, UUID uuid, std::string username, std::string dimension, int view_distance)
        : Entity(entity_id, uuid), name(std::move(username)), dim(std::move(dimension)), distance(view_distance),
          center_cx(0), center_cz(0), mode(CREATIVE)
{}

std::vector<ChunkPosition> Player::chunks_in_view(int cx, int cz) const
{
    std::vector<ChunkPosition> out;
    int dist;

    out.push_back({dim, cx, cz});

    // rings of the diamond, innermost first
    for (int ring = 1; ring <= distance; ++ring)
    {
        for (int i = -ring; i <= ring; ++i)
        {
            dist = ring - (i < 0 ? -i : i);
            out.push_back({dim, cx + i, cz + dist});
            if (dist)
            {
                out.push_back({dim, cx + i, cz - dist});
            }
        }
    }
    return out;
}

bool Player::recenter(int cx, int cz, std::vector<ChunkPosition>& entering, std::vector<ChunkPosition>& leaving)
{
    if (cx == center_cx && cz == center_cz && !tracked.empty())
    {
        return false;
    }

    center_cx = cx;
    center_cz = cz;

    for (auto it = tracked.begin(); it != tracked.end();)
    {
        if (!in_view(*it))
        {
            leaving.push_back(*it);
            it = tracked.erase(it);
        } else
        {
            ++it;
        }
    }

    for (ChunkPosition& pos : chunks_in_view(cx, cz))
    {
        if (!tracked.contains(pos))
        {
            entering.push_back(std::move(pos));
        }
    }
    return true;
}
