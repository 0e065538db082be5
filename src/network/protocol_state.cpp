#include "network/protocol_state.hpp"

const char* phase_name(Phase phase)
{
    switch (phase)
    {
        case HANDSHAKE:
            return "handshake";
        case STATUS:
            return "status";
        case STATUS_COMPLETE:
            return "status_complete";
        case LOGIN:
            return "login";
        case CONFIG:
            return "configuration";
        case PLAY:
            return "play";
        case CLOSED:
            return "closed";
    }
    return "unknown";
}

Phase wire_phase(Phase phase)
{
    return phase == STATUS_COMPLETE ? STATUS : phase;
}

// transitions[from][to]
static const bool transitions[PHASE_COUNT][PHASE_COUNT] = {
        //               HANDSHAKE STATUS STATUS_COMPLETE LOGIN  CONFIG PLAY   CLOSED
        /* HANDSHAKE */ {false,    true,  false,          true,  false, false, true},
        /* STATUS */    {false,    false, true,           false, false, false, true},
        /* STATUS_C */  {false,    false, false,          false, false, false, true},
        /* LOGIN */     {false,    false, false,          false, true,  false, true},
        /* CONFIG */    {false,    false, false,          false, false, true,  true},
        /* PLAY */      {false,    false, false,          false, false, false, true},
        /* CLOSED */    {false,    false, false,          false, false, false, false},
};

bool transition_allowed(Phase from, Phase to)
{
    return transitions[from][to];
}

bool tolerates_unknown_packets(Phase phase)
{
    return phase == HANDSHAKE || phase == STATUS || phase == STATUS_COMPLETE;
}
