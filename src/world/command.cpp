#include "world/command.hpp"
#include "basaltutil.hpp"
#include "loggerimpl.hpp"
#include "network/connection.hpp"

void LoggingCommandSink::submit_decoded_command([[maybe_unused]] Connection& connection, [[maybe_unused]] const Command& command)
{
    ++count;
    debug(logger().info("Connection %llu: %s (0x%02x)",
                        static_cast<unsigned long long>(connection.id()), command.name, command.packet_id);)
}
