#include "udp_socket.hpp"
#include <string>
#include <stdexcept>

namespace {

std::string bind_error_message(int error, const sockaddr_in &addr) {
    const std::string ip = address_ip(addr);
    const std::string port = std::to_string(ntohs(addr.sin_port));

    if (error == ERR_ADDR_NOT_AVAIL) {
        return "IP " + ip + " is not available on this machine.\n"
               "  * Linux:   sudo ip addr add " + ip + "/32 dev lo\n"
               "  * macOS:   sudo ifconfig lo0 alias " + ip + "\n"
               "  * Windows: netsh interface ipv4 add address \"Loopback\" " + ip + " 255.255.255.255";
    }
    if (error == ERR_ADDR_IN_USE) {
        return "Port " + port + " on " + ip + " already in use.";
    }
    if (error == ERR_ACCESS) {
        return "Permission denied binding " + ip + ":" + port + " - run with sudo / Administrator.";
    }
    return "Bind to " + ip + ":" + port + " failed: " + socket_error_string(error);
}

} // namespace

UdpSocket::UdpSocket(const sockaddr_in &bind_addr) {
    sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock == INVALID_SOCKET) {
        throw TFTPSetupError("Failed to create socket: " + socket_error_string(last_socket_error()));
    }

    if (bind(sock, (const struct sockaddr*)&bind_addr, sizeof(bind_addr)) == SOCKET_ERROR) {
        int error = last_socket_error();
        closesocket(sock);
        throw TFTPSetupError(bind_error_message(error, bind_addr));
    }
}

UdpSocket::~UdpSocket() {
    closesocket(sock);
}

sockaddr_in UdpSocket::local_address() const {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (getsockname(sock, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR) {
        throw std::runtime_error("getsockname failed: " + socket_error_string(last_socket_error()));
    }
    return addr;
}

void UdpSocket::send_to(const std::vector<char> &packet, const sockaddr_in &addr) {
    int sent = sendto(sock, packet.data(), static_cast<int>(packet.size()), 0,
                      (const struct sockaddr*)&addr, sizeof(addr));
    if (sent == SOCKET_ERROR) {
        throw std::runtime_error("sendto " + address_to_string(addr) + " failed: " +
                                 socket_error_string(last_socket_error()));
    }
}

int UdpSocket::receive_from(char *buffer, size_t size, sockaddr_in &from) {
    socklen_t from_len = sizeof(from);
    return recvfrom(sock, buffer, static_cast<int>(size), 0, (struct sockaddr*)&from, &from_len);
}
