#include <fstream>
#include <iterator>
#include <vector>
#include <openssl/evp.h>
#include "network/status.hpp"
#include "loggerimpl.hpp"

std::string json_escape(const std::string& text)
{
    static const char* hex = "0123456789abcdef";
    std::string out;

    out.reserve(text.size() + 2);

    for (char c : text)
    {
        auto u = static_cast<unsigned char>(c);

        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (u < 0x20)
                {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0xF];
                } else
                {
                    out += c;
                }
        }
    }
    return out;
}

std::string build_status_json(const ServerConfig& config, int protocol, int online, const std::string& favicon)
{
    std::string json = "{\"version\":{\"name\":\"" + json_escape(config.version_name) +
                       "\",\"protocol\":" + std::to_string(protocol) +
                       "},\"players\":{\"max\":" + std::to_string(config.max_players) +
                       ",\"online\":" + std::to_string(online) +
                       ",\"sample\":[]},\"description\":{\"text\":\"" + json_escape(config.motd) + "\"}";

    if (!favicon.empty())
    {
        json += ",\"favicon\":\"" + favicon + "\"";
    }
    json += "}";
    return json;
}

std::string load_favicon(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open())
    {
        return "";
    }

    std::vector<uint8_t> png((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (png.empty())
    {
        logger().warn("Favicon %s is empty", path.c_str());
        return "";
    }

    // 4 output characters per 3 input bytes, plus the terminator
    std::vector<unsigned char> encoded(4 * ((png.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(encoded.data(), png.data(), static_cast<int>(png.size()));

    return "data:image/png;base64," + std::string(reinterpret_cast<char*>(encoded.data()), length);
}
