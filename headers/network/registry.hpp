#ifndef BASALT_REGISTRY_HPP
#define BASALT_REGISTRY_HPP


#include <cstddef>
#include <cstdint>
#include <vector>
#include "network/protocol_state.hpp"
#include "network/serverbound.hpp"

typedef ServerboundPacket(*packet_decoder)(ReadBuffer&);

struct PacketEntry
{
    const char* name;
    packet_decoder decode;
};

struct DecodedPacket
{
    int32_t id;
    const char* name;
    ServerboundPacket packet;
};

/**
 * @return The serverbound entry for id in phase, or nullptr if the phase has no such packet.
 */
const PacketEntry* lookup_packet(Phase phase, int32_t id);

/**
 * @return Number of id slots in the phase's table (registered or not).
 */
size_t packet_table_size(Phase phase);

/**
 * Decodes one frame payload: the varint id, then the packet registered for it in phase.
 * No string field may be longer than max_string_length characters.
 *
 * @throws UnknownPacketException if phase has no packet with that id
 * @throws TruncatedException if the payload ends before the packet's fields do
 * @throws TrailingBytesException if bytes are left after the packet's fields
 */
DecodedPacket decode_packet(Phase phase, const std::vector<uint8_t>& payload,
                            int32_t max_string_length = MAX_STRING_LENGTH);


#endif //BASALT_REGISTRY_HPP
