#ifndef HANDSHAKE_HPP
#define HANDSHAKE_HPP

#include "udp_socket.hpp"

#include <array>

const size_t HANDSHAKE_TOKEN_SIZE = 20;

// Answers the vendor presence check: the recovery loader broadcasts a 20-byte
// magic token on HANDSHAKE_PORT and expects the exact bytes back before it
// starts the TFTP download. Stateless.
class HandshakeResponder {
public:
    explicit HandshakeResponder(DatagramSink &sink) : sink(sink) {}

    // "SWKH" padded with NULs to HANDSHAKE_TOKEN_SIZE.
    static const std::array<char, HANDSHAKE_TOKEN_SIZE> &magic_token();

    // Echoes the token back to `sender`. Returns false (and logs) for any
    // other datagram.
    bool handle_datagram(const char *data, size_t size, const sockaddr_in &sender);

private:
    DatagramSink &sink;
};

#endif // HANDSHAKE_HPP
