/*
 * Read-only TFTP engine for a single in-memory image.
 *
 *   RRQ (no blksize)  -> DATA 1
 *   RRQ (blksize=N)   -> OACK blksize=N, then ACK 0 -> DATA 1
 *   ACK K             -> DATA K+1, or nothing once past the last block
 *
 * There is no per-client session: the block size and block count are shared,
 * and every reply goes to whoever sent the packet being answered. Two clients
 * downloading at the same time will disturb each other.
*/

#ifndef TFTP_ENGINE_HPP
#define TFTP_ENGINE_HPP

#include "firmware_image.hpp"
#include "udp_socket.hpp"

#include <cstdint>
#include <string>
#include <vector>

class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    // Block size changed (also reported once at startup).
    virtual void on_block_size(size_t block_size, size_t firmware_size, size_t total_blocks) = 0;
    // DATA `block` of `total_blocks` was sent.
    virtual void on_progress(uint32_t block, size_t total_blocks) = 0;
    // An ACK arrived for the last block.
    virtual void on_complete(size_t total_blocks) = 0;
};

struct TransferState {
    size_t block_size = DEFAULT_BLOCK_SIZE;
    size_t total_blocks = 0;
};

class TFTPSessionEngine {
public:
    TFTPSessionEngine(const std::string &filename, FirmwareImage firmware,
                      DatagramSink &sink, ProgressListener &progress);

    // Dispatches one datagram received on the TFTP port. Malformed or
    // unexpected packets are logged and dropped. Throws TFTPSetupError when the
    // image would need more than MAX_BLOCK_COUNT blocks.
    void handle_datagram(const char *data, size_t size, const sockaddr_in &sender);

    // Sends DATA `block_num` (1-based) to `target`. Past the end of the image
    // nothing is sent, the transfer is reported complete and the block size
    // goes back to the default.
    void send_block(uint32_t block_num, const sockaddr_in &target);

    const TransferState &state() const { return transfer; }
    const std::vector<char> &request_prefix() const { return rrq_prefix; }

private:
    void handle_read_request(const char *data, size_t size, const sockaddr_in &sender);
    void send_oack(const sockaddr_in &target);
    void set_block_size(size_t size);
    void check_limits() const;

    const FirmwareImage firmware;
    const std::vector<char> rrq_prefix;
    DatagramSink &sink;
    ProgressListener &progress;
    TransferState transfer;
};

#endif // TFTP_ENGINE_HPP
