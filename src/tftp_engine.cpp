#include "tftp_engine.hpp"
#include <iostream>
#include <string>
#include <utility>

TFTPSessionEngine::TFTPSessionEngine(const std::string &filename, FirmwareImage firmware,
                                     DatagramSink &sink, ProgressListener &progress)
    : firmware(std::move(firmware)),
      rrq_prefix(create_rrq_packet(filename, TFTP_MODE_OCTET)),
      sink(sink),
      progress(progress) {
    set_block_size(DEFAULT_BLOCK_SIZE);
}

void TFTPSessionEngine::set_block_size(size_t size) {
    transfer.block_size = size;
    transfer.total_blocks = (firmware.size() + size - 1) / size;
    progress.on_block_size(transfer.block_size, firmware.size(), transfer.total_blocks);
}

void TFTPSessionEngine::check_limits() const {
    if (transfer.total_blocks > MAX_BLOCK_COUNT) {
        throw TFTPSetupError("File too large for block size " + std::to_string(transfer.block_size) +
                             " (" + std::to_string(transfer.total_blocks) + " blocks, max " +
                             std::to_string(MAX_BLOCK_COUNT) + ")");
    }
}

void TFTPSessionEngine::handle_datagram(const char *data, size_t size, const sockaddr_in &sender) {
    uint16_t acked_block;

    if (starts_with(data, size, rrq_prefix)) {
        handle_read_request(data, size, sender);
    } else if (parse_ack_packet(data, size, acked_block)) {
        send_block(static_cast<uint32_t>(acked_block) + 1, sender);
    } else {
        std::cerr << current_time_string() << " - Unexpected packet from " << address_ip(sender) << ": "
                  << hex_dump(data, std::min<size_t>(size, 8)) << "..." << std::endl;
    }
}

void TFTPSessionEngine::handle_read_request(const char *data, size_t size, const sockaddr_in &sender) {
    ClientOptions options = parse_request_options(data, size);

    std::cout << "Client options: {";
    for (auto it = options.begin(); it != options.end(); ++it) {
        if (it != options.begin())
            std::cout << ", ";
        std::cout << it->first << ": " << it->second;
    }
    std::cout << "}" << std::endl;

    auto blksize = options.find(TFTP_OPTION_BLKSIZE);
    if (blksize != options.end()) {
        std::optional<size_t> requested = parse_block_size(blksize->second);
        if (requested) {
            set_block_size(*requested);
            // RFC 2348: DATA 1 goes out once the client ACKs the OACK with block 0.
            send_oack(sender);
            return;
        }
        std::cerr << current_time_string() << " - Ignoring unusable blksize '" << blksize->second
                  << "' from " << address_ip(sender) << std::endl;
    }

    check_limits();
    std::cout << current_time_string() << " - Starting transfer to " << address_ip(sender) << std::endl;
    send_block(1, sender);
}

void TFTPSessionEngine::send_oack(const sockaddr_in &target) {
    check_limits();
    sink.send_to(create_oack_packet(transfer.block_size), target);
}

void TFTPSessionEngine::send_block(uint32_t block_num, const sockaddr_in &target) {
    const size_t start = static_cast<size_t>(block_num - 1) * transfer.block_size;

    if (block_num == 0 || start >= firmware.size()) {
        // Transfer finished: the client ACKed the final short block (or repeated it).
        progress.on_complete(transfer.total_blocks);
        if (transfer.block_size != DEFAULT_BLOCK_SIZE) {
            set_block_size(DEFAULT_BLOCK_SIZE);
        }
        return;
    }

    check_limits();
    const size_t length = std::min(transfer.block_size, firmware.size() - start);
    sink.send_to(create_data_packet(static_cast<uint16_t>(block_num), firmware.data() + start, length),
                 target);
    progress.on_progress(block_num, transfer.total_blocks);
}
