#ifndef FIRMWARE_IMAGE_HPP
#define FIRMWARE_IMAGE_HPP

#include <string>
#include <utility>
#include <vector>

// Default file the camera's recovery loader asks for.
#define DEFAULT_FIRMWARE_FILENAME "digicap.dav"

class FirmwareImage {
public:
    FirmwareImage() = default;
    explicit FirmwareImage(std::vector<char> bytes) : bytes(std::move(bytes)) {}

    // Reads the whole file. Throws TFTPSetupError if it is missing,
    // unreadable or empty.
    static FirmwareImage load(const std::string &path);

    const char *data() const { return bytes.data(); }
    size_t size() const { return bytes.size(); }

private:
    std::vector<char> bytes;
};

#endif // FIRMWARE_IMAGE_HPP
