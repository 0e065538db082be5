#ifndef BASALT_COMMAND_HPP
#define BASALT_COMMAND_HPP


#include <atomic>
#include <cstdint>
#include "network/serverbound.hpp"

class Connection;

/**
 * A decoded play packet the protocol layer does not act on itself.
 */
struct Command
{
    int packet_id;
    const char* name;
    ServerboundPacket packet;
};

/**
 * Receives gameplay packets. Called on the connection's worker thread, in arrival order.
 */
class CommandSink
{
public:
    virtual ~CommandSink() = default;

    virtual void submit_decoded_command(Connection& connection, const Command& command) = 0;
};

/**
 * Counts commands and traces them in debug builds.
 */
class LoggingCommandSink : public CommandSink
{
public:
    void submit_decoded_command(Connection& connection, const Command& command) override;

    [[nodiscard]] inline uint64_t received() const { return count; }
private:
    std::atomic<uint64_t> count{0};
};


#endif //BASALT_COMMAND_HPP
