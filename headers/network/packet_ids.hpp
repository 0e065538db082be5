#ifndef BASALT_PACKET_IDS_HPP
#define BASALT_PACKET_IDS_HPP

#define PROTOCOL_VERSION (770)
#define PROTOCOL_VERSION_NAME "1.21.5"

// serverbound

#define HANDSHAKE_INTENTION (0x00)

#define STATUS_REQUEST (0x00)
#define STATUS_PING_REQUEST (0x01)

#define LOGIN_START (0x00)
#define LOGIN_ENCRYPTION_RESPONSE (0x01)
#define LOGIN_PLUGIN_RESPONSE (0x02)
#define LOGIN_ACKNOWLEDGED (0x03)
#define LOGIN_COOKIE_RESPONSE (0x04)

#define CONFIG_CLIENT_INFORMATION (0x00)
#define CONFIG_COOKIE_RESPONSE (0x01)
#define CONFIG_SERVERBOUND_PLUGIN_MESSAGE (0x02)
#define CONFIG_FINISH_ACKNOWLEDGED (0x03)
#define CONFIG_SERVERBOUND_KEEP_ALIVE (0x04)
#define CONFIG_PONG (0x05)
#define CONFIG_RESOURCE_PACK_RESPONSE (0x06)
#define CONFIG_SERVERBOUND_KNOWN_PACKS (0x07)

#define PLAY_CONFIRM_TELEPORTATION (0x00)
#define PLAY_CHAT_COMMAND (0x05)
#define PLAY_CHAT_MESSAGE (0x07)
#define PLAY_CHUNK_BATCH_RECEIVED (0x09)
#define PLAY_CLIENT_STATUS (0x0A)
#define PLAY_CLIENT_TICK_END (0x0B)
#define PLAY_CLIENT_INFORMATION (0x0C)
#define PLAY_SERVERBOUND_PLUGIN_MESSAGE (0x14)
#define PLAY_SERVERBOUND_KEEP_ALIVE (0x1A)
#define PLAY_SET_PLAYER_POSITION (0x1C)
#define PLAY_SET_PLAYER_POSITION_ROTATION (0x1D)
#define PLAY_SET_PLAYER_ROTATION (0x1E)
#define PLAY_SET_PLAYER_MOVEMENT_FLAGS (0x1F)
#define PLAY_PING_REQUEST (0x24)
#define PLAY_PLAYER_ACTION (0x27)
#define PLAY_PLAYER_LOADED (0x2A)
#define PLAY_PONG (0x2B)
#define PLAY_SET_HELD_ITEM (0x33)
#define PLAY_SWING_ARM (0x3B)
#define PLAY_USE_ITEM_ON (0x3E)
#define PLAY_USE_ITEM (0x3F)

// clientbound

#define STATUS_RESPONSE (0x00)
#define STATUS_PONG_RESPONSE (0x01)

#define LOGIN_DISCONNECT (0x00)
#define LOGIN_ENCRYPTION_REQUEST (0x01)
#define LOGIN_SUCCESS (0x02)
#define LOGIN_SET_COMPRESSION (0x03)

#define CONFIG_PLUGIN_MESSAGE (0x01)
#define CONFIG_DISCONNECT (0x02)
#define CONFIG_FINISH (0x03)
#define CONFIG_KEEP_ALIVE (0x04)
#define CONFIG_FEATURE_FLAGS (0x0C)
#define CONFIG_KNOWN_PACKS (0x0E)

#define PLAY_CHUNK_BATCH_FINISHED (0x0B)
#define PLAY_CHUNK_BATCH_START (0x0C)
#define PLAY_DISCONNECT (0x1C)
#define PLAY_UNLOAD_CHUNK (0x21)
#define PLAY_GAME_EVENT (0x22)
#define PLAY_KEEP_ALIVE (0x26)
#define PLAY_CHUNK_DATA (0x27)
#define PLAY_LOGIN (0x2B)
#define PLAY_PONG_RESPONSE (0x37)
#define PLAY_SYNCHRONIZE_POSITION (0x41)
#define PLAY_SET_CENTER_CHUNK (0x57)

#endif //BASALT_PACKET_IDS_HPP
