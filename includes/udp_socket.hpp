#ifndef UDP_SOCKET_HPP
#define UDP_SOCKET_HPP

#include "tftp_common.hpp"

#include <vector>

// Anything outbound packets can be handed to. The engines only ever talk to
// this, so they can be driven without a real socket.
class DatagramSink {
public:
    virtual ~DatagramSink() = default;
    virtual void send_to(const std::vector<char> &packet, const sockaddr_in &addr) = 0;
};

// Owns one bound IPv4 UDP socket; closed on destruction.
class UdpSocket : public DatagramSink {
public:
    // Throws TFTPSetupError with a remediation hint when the bind fails.
    explicit UdpSocket(const sockaddr_in &bind_addr);
    ~UdpSocket();

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;

    SOCKET handle() const { return sock; }
    sockaddr_in local_address() const;

    // Throws std::runtime_error on failure.
    void send_to(const std::vector<char> &packet, const sockaddr_in &addr) override;

    // Returns the datagram length, or SOCKET_ERROR (see last_socket_error()).
    int receive_from(char *buffer, size_t size, sockaddr_in &from);

private:
    SOCKET sock;
};

#endif // UDP_SOCKET_HPP
