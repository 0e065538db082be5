#ifndef BASALT_STATUS_HPP
#define BASALT_STATUS_HPP


#include <string>
#include "config.hpp"

/**
 * Escapes quotes, backslashes and control characters for a JSON string literal.
 */
std::string json_escape(const std::string& text);

/**
 * Server list ping response body.
 * @param protocol The client's protocol version, echoed back so any client shows the server as compatible.
 * @param favicon A data URL, or empty for none.
 */
std::string build_status_json(const ServerConfig& config, int protocol, int online, const std::string& favicon);

/**
 * Reads a PNG and returns it as a data:image/png;base64 URL.
 * @return Empty if the file cannot be read.
 */
std::string load_favicon(const std::string& path);


#endif //BASALT_STATUS_HPP
