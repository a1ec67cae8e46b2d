#include "console_progress.hpp"
#include <algorithm>
#include <iomanip>
#include <string>

void ConsoleProgress::on_block_size(size_t block_size, size_t firmware_size, size_t total_blocks) {
    out << "Block size -> " << block_size << " bytes" << std::endl;
    out << "Serving " << firmware_size << " bytes (" << total_blocks << " blocks)" << std::endl;
}

void ConsoleProgress::on_progress(uint32_t block, size_t total_blocks) {
    if (total_blocks == 0)
        return;

    size_t filled = std::min<size_t>(BAR_WIDTH, BAR_WIDTH * block / total_blocks);
    std::string bar = std::string(filled, '#') + std::string(BAR_WIDTH - filled, '-');
    size_t percent = block * 100 / total_blocks;

    out << current_time_string() << " - " << std::setw(5) << block << "/" << total_blocks
        << " [" << bar << "] " << std::setw(3) << percent << "%\r" << std::flush;
}

void ConsoleProgress::on_complete(size_t total_blocks) {
    out << "\n" << current_time_string() << " - DONE! " << total_blocks << " blocks sent." << std::endl;
}
