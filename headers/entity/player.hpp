#ifndef BASALT_PLAYER_HPP
#define BASALT_PLAYER_HPP


#include <cstdlib>
#include <string>
#include <unordered_set>
#include <vector>
#include "entity.hpp"
#include "world/chunk_position.hpp"

enum GameMode
{
    SURVIVAL, CREATIVE, ADVENTURE, SPECTATOR
};

class Player : public Entity
{
public:
    Player(int32_t entity_id, UUID uuid, std::string username, std::string dimension, int view_distance);

    [[nodiscard]] inline const std::string& username() const { return name; }

    [[nodiscard]] inline const std::string& dimension() const { return dim; }

    [[nodiscard]] inline int view_distance() const { return distance; }

    [[nodiscard]] inline int center_x() const { return center_cx; }

    [[nodiscard]] inline int center_z() const { return center_cz; }

    [[nodiscard]] inline GameMode game_mode() const { return mode; }

    /**
     * Every chunk within view distance (manhattan) of the chunk (cx, cz), nearest first.
     */
    [[nodiscard]] std::vector<ChunkPosition> chunks_in_view(int cx, int cz) const;

    /**
     * Moves the view center and works out which chunks enter and leave view.
     * @param entering Chunks that are in view now but were not tracked, nearest first.
     * @param leaving Tracked chunks that are no longer in view.
     * @return false if the center did not change.
     */
    bool recenter(int cx, int cz, std::vector<ChunkPosition>& entering, std::vector<ChunkPosition>& leaving);

    /**
     * Marks the chunk as requested for the client. Chunks are unloaded once they leave view.
     */
    inline void track(const ChunkPosition& pos) { tracked.insert(pos); }

    /**
     * Forgets a requested chunk so the next recenter asks for it again.
     */
    inline void untrack(const ChunkPosition& pos) { tracked.erase(pos); }

    [[nodiscard]] inline bool tracks(const ChunkPosition& pos) const { return tracked.contains(pos); }

    [[nodiscard]] inline bool in_view(const ChunkPosition& pos) const
    {
        return pos.dimension == dim && std::abs(pos.x - center_cx) + std::abs(pos.z - center_cz) <= distance;
    }

    [[nodiscard]] inline size_t tracked_count() const { return tracked.size(); }
private:
    std::string name;
    std::string dim;
    int distance;
    int center_cx;
    int center_cz;
    GameMode mode;
    std::unordered_set<ChunkPosition, ChunkPositionHash> tracked;
};


#endif //BASALT_PLAYER_HPP
