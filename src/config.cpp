#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include "config.hpp"

static std::string trim(const std::string& text)
{
    size_t start = 0;
    size_t end = text.size();

    while (start < end && std::isspace(static_cast<unsigned char>(text[start])))
    {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
    {
        --end;
    }
    return text.substr(start, end - start);
}

static bool parse_long(const std::string& value, long min, long max, long& out)
{
    char* end;

    if (value.empty())
    {
        return false;
    }

    errno = 0;
    long parsed = strtol(value.c_str(), &end, 10);

    if (errno || *end || parsed < min || parsed > max)
    {
        return false;
    }
    out = parsed;
    return true;
}

static bool parse_bool(const std::string& value, bool& out)
{
    if (value == "true")
    {
        out = true;
        return true;
    }
    if (value == "false")
    {
        out = false;
        return true;
    }
    return false;
}

template<typename T>
static bool parse_number(const std::string& value, long min, long max, T& out)
{
    long parsed;

    if (!parse_long(value, min, max, parsed))
    {
        return false;
    }
    out = static_cast<T>(parsed);
    return true;
}

bool apply_config_value(ServerConfig& config, const std::string& key, const std::string& value, std::string& error)
{
    bool ok;

    if (key == "server-ip")
    {
        config.server_ip = value;
        ok = true;
    } else if (key == "server-port")
    {
        ok = parse_number(value, 0, 65535, config.server_port);
    } else if (key == "network-workers")
    {
        ok = parse_number(value, 0, 1024, config.network_workers);
    } else if (key == "chunk-workers")
    {
        ok = parse_number(value, 0, 1024, config.chunk_workers);
    } else if (key == "max-players")
    {
        ok = parse_number(value, 0, INT_MAX, config.max_players);
    } else if (key == "motd")
    {
        config.motd = value;
        ok = true;
    } else if (key == "favicon")
    {
        config.favicon = value;
        ok = true;
    } else if (key == "version-name")
    {
        config.version_name = value;
        ok = true;
    } else if (key == "protocol-version")
    {
        ok = parse_number(value, 0, INT_MAX, config.protocol_version);
    } else if (key == "network-compression-threshold")
    {
        ok = parse_number(value, -1, INT_MAX, config.compression_threshold);
    } else if (key == "online-mode")
    {
        ok = parse_bool(value, config.online_mode);
    } else if (key == "max-frame-length")
    {
        // the length prefix is at most a 3 byte varint
        ok = parse_number(value, 1, 2097151, config.max_frame_length);
    } else if (key == "max-string-length")
    {
        ok = parse_number(value, 1, 32767, config.max_string_length);
    } else if (key == "nbt-max-depth")
    {
        ok = parse_number(value, 1, 4096, config.nbt_max_depth);
    } else if (key == "read-timeout")
    {
        ok = parse_number(value, 1, INT_MAX, config.read_timeout);
    } else if (key == "keep-alive-interval")
    {
        ok = parse_number(value, 1, INT_MAX, config.keep_alive_interval);
    } else if (key == "keep-alive-timeout")
    {
        ok = parse_number(value, 1, INT_MAX, config.keep_alive_timeout);
    } else if (key == "outbound-queue-limit")
    {
        ok = parse_number(value, 1, LONG_MAX, config.outbound_queue_limit);
    } else if (key == "view-distance")
    {
        ok = parse_number(value, 2, 32, config.view_distance);
    } else if (key == "level-dimension")
    {
        config.level_dimension = value;
        ok = !value.empty() && value.size() <= UINT16_MAX;
    } else if (key == "store-path")
    {
        config.store_path = value;
        ok = !value.empty();
    } else if (key == "store-compression")
    {
        ok = parse_scheme(value, config.store_compression);
    } else if (key == "store-sync")
    {
        ok = parse_bool(value, config.store_sync);
    } else if (key == "cache-max-entries")
    {
        ok = parse_number(value, 0, LONG_MAX, config.cache_max_entries);
    } else if (key == "cache-max-bytes")
    {
        ok = parse_number(value, 0, LONG_MAX, config.cache_max_bytes);
    } else if (key == "import-region-dir")
    {
        config.import_region_dir = value;
        ok = true;
    } else if (key == "log-level")
    {
        ok = parse_log_level(value.c_str(), config.log_level);
    } else
    {
        error = "unknown key '" + key + "'";
        return false;
    }

    if (!ok)
    {
        error = "invalid value '" + value + "' for " + key;
    }
    return ok;
}

bool load_config(const std::string& path, ServerConfig& config, std::string& error)
{
    std::ifstream file(path);

    if (!file.is_open())
    {
        return true;
    }

    std::string line;
    int line_number = 0;

    while (std::getline(file, line))
    {
        ++line_number;
        line = trim(line);

        if (line.empty() || line.front() == '#')
        {
            continue;
        }

        size_t equals = line.find('=');
        if (equals == std::string::npos)
        {
            error = path + ":" + std::to_string(line_number) + ": missing '='";
            return false;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (!apply_config_value(config, key, value, error))
        {
            error = path + ":" + std::to_string(line_number) + ": " + error;
            return false;
        }
    }
    return true;
}
