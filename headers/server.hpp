#ifndef BASALT_SERVER_HPP
#define BASALT_SERVER_HPP


#include "config.hpp"

bool is_running();

/**
 * Opens the world, starts networking and runs the tick loop until server_stop() is called.
 * @return false if startup failed.
 */
bool server_start(const ServerConfig& config);

/**
 * Asks the tick loop to end. Safe to call from a signal handler.
 */
void server_stop();


#endif //BASALT_SERVER_HPP
