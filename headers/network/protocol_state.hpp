#ifndef BASALT_PROTOCOL_STATE_HPP
#define BASALT_PROTOCOL_STATE_HPP


/**
 * Connection phases. STATUS_COMPLETE and CLOSED are terminal: the first only accepts a ping,
 * the second accepts nothing.
 */
enum Phase
{
    HANDSHAKE, STATUS, STATUS_COMPLETE, LOGIN, CONFIG, PLAY, CLOSED
};

#define PHASE_COUNT (7)

/**
 * Values of the handshake's next state field.
 */
#define INTENT_STATUS (1)
#define INTENT_LOGIN (2)
#define INTENT_TRANSFER (3)

const char* phase_name(Phase phase);

/**
 * @return The phase whose packet ids are on the wire while in phase. Status-complete still
 *         speaks the status protocol.
 */
Phase wire_phase(Phase phase);

/**
 * @return True if a connection may move from one phase to the other. Every phase may close.
 */
bool transition_allowed(Phase from, Phase to);

/**
 * @return True if packets with unknown ids are skipped in this phase instead of closing the
 *         connection, which keeps server list pings from newer clients working.
 */
bool tolerates_unknown_packets(Phase phase);


#endif //BASALT_PROTOCOL_STATE_HPP
