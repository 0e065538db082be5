#ifndef BASALT_TCPSERVER_HPP
#define BASALT_TCPSERVER_HPP


#include <cstddef>
#include "config.hpp"
#include "core/task_pool.hpp"
#include "network/handler.hpp"

/**
 * Used to initialize server resources such as the server_fd and network workers.
 * @return true if initialization was good, false if it failed
 */
bool tcp_init(const ServerConfig& config, ServerContext& ctx, TaskPool& chunk_pool);

void tcp_start();

/**
 * Stops accepting, then stops every worker and closes its connections.
 */
void tcp_stop();

/**
 * Asks every worker to run its keep-alive and timeout checks.
 */
void tcp_maintenance();

[[nodiscard]] size_t tcp_connection_count();


#endif //BASALT_TCPSERVER_HPP
