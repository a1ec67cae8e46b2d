#include "handshake.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

const std::array<char, HANDSHAKE_TOKEN_SIZE> &HandshakeResponder::magic_token() {
    static const std::array<char, HANDSHAKE_TOKEN_SIZE> token = {'S', 'W', 'K', 'H'};
    return token;
}

bool HandshakeResponder::handle_datagram(const char *data, size_t size, const sockaddr_in &sender) {
    const auto &token = magic_token();
    if (size != token.size() || !std::equal(token.begin(), token.end(), data)) {
        std::cerr << current_time_string() << " - Bad handshake from " << address_ip(sender)
                  << ": " << hex_dump(data, size) << std::endl;
        return false;
    }

    sink.send_to(std::vector<char>(data, data + size), sender);
    std::cout << current_time_string() << " - Handshake OK from " << address_ip(sender) << std::endl;
    return true;
}
