#include <cstdio>
#include <utility>
#include "exceptions.hpp"

BasaltException::BasaltException(std::string message) : message(std::move(message))
{}

const char* BasaltException::what() const noexcept
{
    return message.c_str();
}

static std::string unknown_packet_message(int phase, int packet_id)
{
    char buf[64];
    snprintf(buf, sizeof(buf), "unknown packet 0x%02x in phase %i", packet_id, phase);
    return buf;
}

UnknownPacketException::UnknownPacketException(int phase, int packet_id) : DecodeException(unknown_packet_message(phase, packet_id)),
                                                                           _phase(phase),
                                                                           _packet_id(packet_id)
{}
