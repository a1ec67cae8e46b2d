#ifndef CONSOLE_PROGRESS_HPP
#define CONSOLE_PROGRESS_HPP

#include "tftp_engine.hpp"

#include <iostream>

// Prints block-size changes, a single-line progress bar and the completion
// notice.
class ConsoleProgress : public ProgressListener {
public:
    explicit ConsoleProgress(std::ostream &out = std::cout) : out(out) {}

    void on_block_size(size_t block_size, size_t firmware_size, size_t total_blocks) override;
    void on_progress(uint32_t block, size_t total_blocks) override;
    void on_complete(size_t total_blocks) override;

    static constexpr int BAR_WIDTH = 50;

private:
    std::ostream &out;
};

#endif // CONSOLE_PROGRESS_HPP
