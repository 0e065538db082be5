// Basalt entry point

#include <csignal>
#include <string>
#include "config.hpp"
#include "loggerimpl.hpp"
#include "server.hpp"

#define DEFAULT_PROPERTIES "server.properties"

static void shutdown(int)
{
    server_stop();
}

int main(int argc, char** argv)
{
    ServerConfig config;
    std::string error;
    std::string path = argc > 1 ? argv[1] : DEFAULT_PROPERTIES;

    if (!load_config(path, config, error))
    {
        logger().err("%s", error.c_str());
        return 1;
    }

    signal(SIGTERM, shutdown);
    signal(SIGINT, shutdown);
    // a peer that hangs up mid-write must not kill the process
    signal(SIGPIPE, SIG_IGN);

    return server_start(config) ? 0 : 1;
}
