/*
 * RRQ  -> | Opcode (2 bytes) | Filename (N bytes) | NULL | Mode (N bytes) | NULL | [Option | NULL | Value | NULL]* |
 * DATA -> | Opcode (2 bytes) | Block # (2 bytes)  | Data (0..blksize bytes) |
 * ACK  -> | Opcode (2 bytes) | Block # (2 bytes)  |
 * OACK -> | Opcode (2 bytes) | Option | NULL | Value | NULL |
*/

#ifndef TFTP_COMMON_HPP
#define TFTP_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
using socklen_t = int;
const int ERR_ADDR_NOT_AVAIL = WSAEADDRNOTAVAIL;
const int ERR_ADDR_IN_USE = WSAEADDRINUSE;
const int ERR_ACCESS = WSAEACCES;
const int ERR_INTERRUPTED = WSAEINTR;
#else // Linux/macOS
#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
using SOCKET = int;
const int INVALID_SOCKET = -1;
const int SOCKET_ERROR = -1;
const int ERR_ADDR_NOT_AVAIL = EADDRNOTAVAIL;
const int ERR_ADDR_IN_USE = EADDRINUSE;
const int ERR_ACCESS = EACCES;
const int ERR_INTERRUPTED = EINTR;
#define closesocket close
#endif

// TFTP Opcodes (only the ones this server speaks)
const uint16_t TFTP_OPCODE_RRQ = 1;
const uint16_t TFTP_OPCODE_DATA = 3;
const uint16_t TFTP_OPCODE_ACK = 4;
const uint16_t TFTP_OPCODE_OACK = 6;

// Constants
const uint16_t TFTP_DEFAULT_PORT = 69;
const uint16_t HANDSHAKE_PORT = 9978;
const size_t DEFAULT_BLOCK_SIZE = 512;
const size_t MIN_BLOCK_SIZE = 8;      // RFC 2348
const size_t MAX_BLOCK_SIZE = 65464;  // RFC 2348
const size_t MAX_BLOCK_COUNT = 65535; // 16-bit block numbers, no wrap
const int DATA_HEADER_SIZE = 4;
const int ACK_PACKET_SIZE = 4;
const size_t MAX_DATAGRAM_SIZE = 65536;
const char TFTP_MODE_OCTET[] = "octet";
const char TFTP_OPTION_BLKSIZE[] = "blksize";

// Raised for problems that cannot be fixed by the client retrying: bind
// failures, unusable firmware, block-count overflow.
class TFTPSetupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Helper structure for network initialization/cleanup
struct NetworkInitializer {
  NetworkInitializer() {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
      throw std::runtime_error("WSAStartup failed");
    }
#endif
  }
  ~NetworkInitializer() {
#ifdef _WIN32
    WSACleanup();
#endif
  }
};

inline int last_socket_error() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

inline std::string socket_error_string(int error) {
#ifdef _WIN32
  return "error code " + std::to_string(error);
#else
  return std::string(strerror(error));
#endif
}

// Helper function to set socket timeout
inline bool set_socket_timeout(SOCKET sock, int seconds) {
#ifdef _WIN32
  DWORD timeout = seconds * 1000; // milliseconds
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout,
                 sizeof(timeout)) == SOCKET_ERROR) {
    return false;
  }
#else
  struct timeval timeout;
  timeout.tv_sec = seconds;
  timeout.tv_usec = 0;
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) <
      0) {
    return false;
  }
#endif
  return true;
}

// --- Address helpers ---

inline sockaddr_in make_address(const std::string &ip, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0) {
    throw std::invalid_argument("Invalid IPv4 address: " + ip);
  }
  return addr;
}

inline std::string address_ip(const sockaddr_in &addr) {
  char ip[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, INET_ADDRSTRLEN) == nullptr) {
    return "?";
  }
  return ip;
}

inline std::string address_to_string(const sockaddr_in &addr) {
  return address_ip(addr) + ":" + std::to_string(ntohs(addr.sin_port));
}

// --- Logging helpers ---

// Local time in the "%c" format, used to prefix every peer-related log line.
inline std::string current_time_string() {
  std::time_t now = std::time(nullptr);
  char buffer[64];
  std::tm *local = std::localtime(&now);
  if (local == nullptr ||
      std::strftime(buffer, sizeof(buffer), "%c", local) == 0) {
    return "";
  }
  return buffer;
}

inline std::string hex_dump(const char *data, size_t size) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    unsigned char byte = static_cast<unsigned char>(data[i]);
    out.push_back(digits[byte >> 4]);
    out.push_back(digits[byte & 0x0f]);
  }
  return out;
}

// --- Packet Creation Functions ---

// With the default "octet" mode this is exactly the prefix every valid RRQ
// for `filename` starts with.
inline std::vector<char> create_rrq_packet(const std::string &filename,
                                           const std::string &mode = TFTP_MODE_OCTET) {
  std::vector<char> packet;
  uint16_t opcode = htons(TFTP_OPCODE_RRQ);
  packet.insert(packet.end(), (char *)&opcode,
                (char *)&opcode + sizeof(opcode));
  packet.insert(packet.end(), filename.begin(), filename.end());
  packet.push_back('\0');
  packet.insert(packet.end(), mode.begin(), mode.end());
  packet.push_back('\0');
  return packet;
}

inline void append_option(std::vector<char> &packet, const std::string &name,
                          const std::string &value) {
  packet.insert(packet.end(), name.begin(), name.end());
  packet.push_back('\0');
  packet.insert(packet.end(), value.begin(), value.end());
  packet.push_back('\0');
}

inline std::vector<char>
create_data_packet(uint16_t block_num, const char *data, size_t data_size) {
  if (data_size > MAX_BLOCK_SIZE) {
    throw std::length_error("Data size exceeds maximum allowed");
  }
  std::vector<char> packet(DATA_HEADER_SIZE + data_size);
  uint16_t opcode = htons(TFTP_OPCODE_DATA);
  uint16_t net_block_num = htons(block_num);
  memcpy(packet.data(), &opcode, sizeof(opcode));
  memcpy(packet.data() + sizeof(opcode), &net_block_num, sizeof(net_block_num));
  if (data_size > 0) {
    memcpy(packet.data() + DATA_HEADER_SIZE, data, data_size);
  }
  return packet;
}

inline std::vector<char> create_ack_packet(uint16_t block_num) {
  std::vector<char> packet(ACK_PACKET_SIZE);
  uint16_t opcode = htons(TFTP_OPCODE_ACK);
  uint16_t net_block_num = htons(block_num);
  memcpy(packet.data(), &opcode, sizeof(opcode));
  memcpy(packet.data() + sizeof(opcode), &net_block_num, sizeof(net_block_num));
  return packet;
}

inline std::vector<char> create_oack_packet(size_t block_size) {
  std::vector<char> packet;
  uint16_t opcode = htons(TFTP_OPCODE_OACK);
  packet.insert(packet.end(), (char *)&opcode,
                (char *)&opcode + sizeof(opcode));
  append_option(packet, TFTP_OPTION_BLKSIZE, std::to_string(block_size));
  return packet;
}

// --- Packet Parsing Functions ---

inline uint16_t get_opcode(const char *buffer, size_t size) {
  if (size < 2)
    return 0; // Invalid packet
  uint16_t opcode;
  memcpy(&opcode, buffer, sizeof(opcode));
  return ntohs(opcode);
}

inline bool starts_with(const char *buffer, size_t size,
                        const std::vector<char> &prefix) {
  return size >= prefix.size() &&
         std::equal(prefix.begin(), prefix.end(), buffer);
}

// Trailing bytes after the block number are tolerated.
inline bool parse_ack_packet(const char *buffer, size_t size,
                             uint16_t &block_num) {
  if (size < ACK_PACKET_SIZE || get_opcode(buffer, size) != TFTP_OPCODE_ACK) {
    return false;
  }
  memcpy(&block_num, buffer + 2, sizeof(block_num));
  block_num = ntohs(block_num);
  return true;
}

inline bool parse_data_packet(const char *buffer, size_t size,
                              uint16_t &block_num, const char *&data_ptr,
                              size_t &data_size) {
  if (size < DATA_HEADER_SIZE || get_opcode(buffer, size) != TFTP_OPCODE_DATA) {
    return false;
  }
  memcpy(&block_num, buffer + 2, sizeof(block_num));
  block_num = ntohs(block_num);
  data_ptr = buffer + DATA_HEADER_SIZE;
  data_size = size - DATA_HEADER_SIZE;
  return true;
}

using ClientOptions = std::map<std::string, std::string>;

// Keeps well-formed UTF-8 sequences and drops every byte that cannot start
// or continue one (overlongs, surrogates and code points past U+10FFFF).
inline std::string drop_invalid_utf8(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    unsigned char low = 0x80, high = 0xBF;
    if (lead < 0x80) {
      length = 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0)
        low = 0xA0;
      else if (lead == 0xED)
        high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0)
        low = 0x90;
      else if (lead == 0xF4)
        high = 0x8F;
    }

    size_t valid = length == 0 ? 0 : 1;
    while (valid > 0 && valid < length && i + valid < text.size()) {
      unsigned char next = static_cast<unsigned char>(text[i + valid]);
      if (next < low || next > high)
        break;
      low = 0x80;
      high = 0xBF;
      ++valid;
    }

    if (length > 0 && valid == length) {
      result.append(text, i, length);
      i += length;
    } else {
      // The bad lead and any continuation bytes it had are dropped.
      i += valid > 0 ? valid : 1;
    }
  }
  return result;
}

// Parses the option list that follows "\0octet\0" in a request. Keys are
// lower-cased, an unpaired trailing element is dropped and so is any pair with
// an empty key. Bytes that are not valid UTF-8 are dropped from keys and values.
inline ClientOptions parse_request_options(const char *buffer, size_t size) {
  static const char marker[] = "\0octet\0";
  const size_t marker_len = sizeof(marker) - 1;

  ClientOptions options;
  const char *end = buffer + size;
  const char *ptr = std::search(buffer, end, marker, marker + marker_len);
  if (ptr == end) {
    return options;
  }
  ptr += marker_len;

  std::vector<std::string> parts;
  while (true) {
    const char *part_end = std::find(ptr, end, '\0');
    parts.emplace_back(ptr, part_end);
    if (part_end == end)
      break;
    ptr = part_end + 1;
  }

  for (size_t i = 0; i + 1 < parts.size(); i += 2) {
    std::string key = drop_invalid_utf8(parts[i]);
    for (char &c : key)
      c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (!key.empty()) {
      options[key] = drop_invalid_utf8(parts[i + 1]);
    }
  }
  return options;
}

// Accepts surrounding whitespace and a leading '+'; anything else that is not a
// digit makes the value unusable. Returns nothing when out of [8, 65464].
inline std::optional<size_t> parse_block_size(const std::string &value) {
  size_t first = 0;
  size_t last = value.size();
  while (first < last && isspace(static_cast<unsigned char>(value[first])))
    ++first;
  while (last > first && isspace(static_cast<unsigned char>(value[last - 1])))
    --last;
  if (first < last && value[first] == '+')
    ++first;
  if (first == last)
    return std::nullopt;

  unsigned long parsed = 0;
  const char *begin = value.data() + first;
  const char *stop = value.data() + last;
  auto result = std::from_chars(begin, stop, parsed);
  if (result.ec != std::errc() || result.ptr != stop) {
    return std::nullopt;
  }
  if (parsed < MIN_BLOCK_SIZE || parsed > MAX_BLOCK_SIZE) {
    return std::nullopt;
  }
  return static_cast<size_t>(parsed);
}

#endif // TFTP_COMMON_HPP
