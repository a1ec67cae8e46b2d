#include "firmware_image.hpp"
#include "tftp_common.hpp"
#include <fstream>
#include <iterator>
#include <filesystem> // Requires C++17
#include <system_error>

FirmwareImage FirmwareImage::load(const std::string &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw TFTPSetupError("File not found: " + path + "\n"
                             "   * Download " DEFAULT_FIRMWARE_FILENAME " and place it in the same folder.");
    }

    std::ifstream input_file(path, std::ios::binary);
    if (!input_file) {
        throw TFTPSetupError("Cannot read '" + path + "': open failed");
    }

    std::vector<char> bytes((std::istreambuf_iterator<char>(input_file)),
                            std::istreambuf_iterator<char>());
    if (input_file.bad()) {
        throw TFTPSetupError("Cannot read '" + path + "': read failed");
    }
    if (bytes.empty()) {
        throw TFTPSetupError("Cannot read '" + path + "': empty file");
    }
    return FirmwareImage(std::move(bytes));
}
