#include "console_progress.hpp"
#include "firmware_image.hpp"
#include "server.hpp"
#include <atomic>
#include <csignal>
#include <filesystem> // Requires C++17
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#define DEFAULT_SERVER_IP "192.0.0.128"

namespace {

std::atomic<bool> stop_requested(false);

void handle_signal(int) {
    stop_requested = true;
}

void print_usage(const char *program) {
    std::cerr << "Usage: " << program << " [--filename <file>] [--server-ip <ip>]\n\n"
              << "Serve a firmware image to unbrick a camera stuck in its recovery loader.\n\n"
              << "  --filename <file>   Firmware file to serve (default: " DEFAULT_FIRMWARE_FILENAME ")\n"
              << "  --server-ip <ip>    IP address the server binds to (default: " DEFAULT_SERVER_IP ")\n"
              << "  -h, --help          Show this help" << std::endl;
}

// Accepts "--name value" and "--name=value".
bool take_value(const std::string &arg, const std::string &name, int &i, int argc, char *argv[],
                std::string &value) {
    if (arg == name) {
        if (i + 1 >= argc)
            throw std::invalid_argument("Missing value for " + name);
        value = argv[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

} // namespace

// --- Main Function ---
int main(int argc, char* argv[]) {
    std::string filename = DEFAULT_FIRMWARE_FILENAME;
    std::string server_ip = DEFAULT_SERVER_IP;
    sockaddr_in handshake_addr{};
    sockaddr_in tftp_addr{};

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            if (take_value(arg, "--filename", i, argc, argv, filename))
                continue;
            if (take_value(arg, "--server-ip", i, argc, argv, server_ip))
                continue;
            throw std::invalid_argument("Unknown argument '" + arg + "'");
        }
        handshake_addr = make_address(server_ip, HANDSHAKE_PORT);
        tftp_addr = make_address(server_ip, TFTP_DEFAULT_PORT);
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // --- Load firmware ---
    FirmwareImage firmware;
    try {
        firmware = FirmwareImage::load(filename);
    } catch (const TFTPSetupError &e) {
        std::cerr << "\n" << e.what() << std::endl;
        return 1;
    }

    // The loader asks for the bare file name, whatever path it was loaded from.
    std::string requested_name = std::filesystem::path(filename).filename().string();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        ConsoleProgress progress;
        UnbrickServer server(handshake_addr, tftp_addr, requested_name, std::move(firmware), progress);
        server.run(stop_requested);
    } catch (const TFTPSetupError &e) {
        std::cerr << "\nSetup error:\n   " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "\nUnexpected setup error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nGoodbye!" << std::endl;
    return 0;
}
