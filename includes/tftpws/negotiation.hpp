#ifndef TFTPWS_NEGOTIATION_HPP
#define TFTPWS_NEGOTIATION_HPP

#include "tftpws/config.hpp"
#include "tftpws/packet.hpp"

#include <cstdint>

namespace tftpws {

// Parameters in effect for the rest of a session.
struct SessionParameters {
  uint16_t block_size = DEFAULT_BLOCK_SIZE;
  uint16_t window_size = DEFAULT_WINDOW_SIZE;
  bool options_acknowledged = false; // true when the server sent an OACK
};

// Resolves session parameters from an OACK. An option the server left out was
// not accepted and its RFC default applies: blksize 512 and windowsize 1, not
// the values the client requested.
// Throws ProtocolError(MalformedPacket) for a value that is not a number, is
// out of range, or exceeds what the client asked for.
SessionParameters negotiate(const OptionAckPacket &oack,
                            const ClientConfig &config);

// Resolves session parameters from the first reply to a read request.
// OACK -> negotiated values; DATA -> RFC 1350 defaults (blksize 512 even if
// a larger size was requested); ERROR -> RemoteError;
// anything else -> ProtocolError(UnexpectedOpcode).
SessionParameters negotiate(const Packet &first_reply,
                            const ClientConfig &config);

} // namespace tftpws

#endif // TFTPWS_NEGOTIATION_HPP
