#include "server.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

UnbrickServer::UnbrickServer(const sockaddr_in &handshake_addr, const sockaddr_in &tftp_addr,
                             const std::string &filename, FirmwareImage firmware,
                             ProgressListener &progress)
    : handshake_sock(handshake_addr),
      tftp_sock(tftp_addr),
      responder(handshake_sock),
      engine(filename, std::move(firmware), tftp_sock, progress),
      buffer(MAX_DATAGRAM_SIZE) {}

void UnbrickServer::run(const std::atomic<bool> &stop_requested) {
    std::cout << "\n=== TFTP unbrick server STARTED ===" << std::endl;
    std::cout << "Listening on " << address_to_string(tftp_sock.local_address()) << std::endl;
    std::cout << "Waiting for handshake... (Ctrl-C to stop)\n" << std::endl;

    SOCKET handshake_fd = handshake_sock.handle();
    SOCKET tftp_fd = tftp_sock.handle();
    int nfds = static_cast<int>(std::max(handshake_fd, tftp_fd)) + 1;

    while (!stop_requested) {
        fd_set readable;
        FD_ZERO(&readable);
        FD_SET(handshake_fd, &readable);
        FD_SET(tftp_fd, &readable);

        // Bounded wait so a stop request is seen within one timeout.
        timeval timeout;
        timeout.tv_sec = SELECT_TIMEOUT_SEC;
        timeout.tv_usec = 0;

        try {
            int ready = select(nfds, &readable, nullptr, nullptr, &timeout);
            if (ready == SOCKET_ERROR) {
                int error = last_socket_error();
                if (error == ERR_INTERRUPTED)
                    continue;
                throw std::runtime_error("select failed: " + socket_error_string(error));
            }
            if (FD_ISSET(handshake_fd, &readable))
                handle_handshake();
            if (FD_ISSET(tftp_fd, &readable))
                handle_tftp();
        } catch (const TFTPSetupError &) {
            throw;
        } catch (const std::exception &e) {
            std::cerr << "\nUnexpected error: " << e.what() << std::endl;
            break;
        }
    }

    if (stop_requested)
        std::cout << "\n\nInterrupted by user - shutting down." << std::endl;
    std::cout << "Server stopped." << std::endl;
}

void UnbrickServer::handle_handshake() {
    sockaddr_in client_addr{};
    int bytes_received = handshake_sock.receive_from(buffer.data(), buffer.size(), client_addr);
    if (bytes_received == SOCKET_ERROR) {
        std::cerr << "Warning: recvfrom failed on handshake socket: "
                  << socket_error_string(last_socket_error()) << std::endl;
        return;
    }
    responder.handle_datagram(buffer.data(), static_cast<size_t>(bytes_received), client_addr);
}

void UnbrickServer::handle_tftp() {
    sockaddr_in client_addr{};
    int bytes_received = tftp_sock.receive_from(buffer.data(), buffer.size(), client_addr);
    if (bytes_received == SOCKET_ERROR) {
        std::cerr << "Warning: recvfrom failed on TFTP socket: "
                  << socket_error_string(last_socket_error()) << std::endl;
        return;
    }
    engine.handle_datagram(buffer.data(), static_cast<size_t>(bytes_received), client_addr);
}
