#ifndef BASALT_CONFIG_HPP
#define BASALT_CONFIG_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include "compression/compression.hpp"
#include "loggerimpl.hpp"

/**
 * Every tunable of the server, with its default. Keys in server.properties use the
 * hyphenated form of the field name, e.g. network-compression-threshold.
 */
struct ServerConfig
{
    std::string server_ip = "0.0.0.0";
    uint16_t server_port = 25565;
    /**
     * 0 uses one worker per hardware thread.
     */
    int network_workers = 0;
    int chunk_workers = 0;
    int max_players = 20;
    std::string motd = "A Basalt server";
    std::string favicon = "server-icon.png";
    std::string version_name = "1.21.5";
    int protocol_version = 770;
    /**
     * -1 disables compression.
     */
    int compression_threshold = 256;
    bool online_mode = false;
    size_t max_frame_length = 2097151;
    size_t max_string_length = 32767;
    int nbt_max_depth = 512;
    /**
     * Seconds.
     */
    int read_timeout = 30;
    int keep_alive_interval = 15;
    int keep_alive_timeout = 30;
    size_t outbound_queue_limit = 4 * 1024 * 1024;
    int view_distance = 8;
    std::string level_dimension = "minecraft:overworld";
    std::string store_path = "world.bslt";
    CompressionScheme store_compression = COMPRESSION_DEFLATE;
    bool store_sync = false;
    size_t cache_max_entries = 4096;
    size_t cache_max_bytes = 256 * 1024 * 1024;
    /**
     * Imported into the store at startup when not empty.
     */
    std::string import_region_dir;
    LogLevel log_level = LOG_INFO;
};

/**
 * Reads a server.properties style file: key=value lines, '#' comment lines and blank lines.
 * A missing file leaves config untouched and succeeds.
 * @param error Set to a message naming the line when the load fails.
 * @return false on an unknown key or a malformed line or value. config may be partly updated.
 */
bool load_config(const std::string& path, ServerConfig& config, std::string& error);

/**
 * Applies one key=value pair.
 * @return false with error set if the key is unknown or the value does not parse.
 */
bool apply_config_value(ServerConfig& config, const std::string& key, const std::string& value, std::string& error);


#endif //BASALT_CONFIG_HPP
