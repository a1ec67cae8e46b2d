/*
 * Handshake -> | Magic token (20 bytes) |                          UDP/9978, echoed back
 * TFTP      -> | RRQ / ACK  in,  OACK / DATA out |                 UDP/69
*/

#ifndef TFTP_SERVER_HPP
#define TFTP_SERVER_HPP

#include "handshake.hpp"
#include "tftp_engine.hpp"
#include "udp_socket.hpp"

#include <atomic>
#include <string>

// Both listeners on one select() loop. Sockets are released when the server
// is destroyed, whichever way run() ended.
class UnbrickServer {
public:
    UnbrickServer(const sockaddr_in &handshake_addr, const sockaddr_in &tftp_addr,
                  const std::string &filename, FirmwareImage firmware,
                  ProgressListener &progress);

    // Serves until `stop_requested` becomes true or an unexpected error ends
    // the loop. TFTPSetupError raised while serving is rethrown.
    void run(const std::atomic<bool> &stop_requested);

    sockaddr_in handshake_address() const { return handshake_sock.local_address(); }
    sockaddr_in tftp_address() const { return tftp_sock.local_address(); }

    static const int SELECT_TIMEOUT_SEC = 1;

private:
    void handle_handshake();
    void handle_tftp();

    NetworkInitializer net_init; // RAII for Winsock init/cleanup
    UdpSocket handshake_sock;
    UdpSocket tftp_sock;
    HandshakeResponder responder;
    TFTPSessionEngine engine;
    std::vector<char> buffer;
};

#endif // TFTP_SERVER_HPP
