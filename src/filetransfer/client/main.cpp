#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <LogInit.hpp>
#include <absl/cleanup/cleanup.h>
#include <api/CoreTypes.hpp>
#include <fmt/format.h>

#include <client/FileTransferClient.hpp>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <shared/MessageCodec.hpp>
#include <string>
#include <transport/FabricTransport.hpp>

using namespace FileTransfer;

namespace {

constexpr std::string_view kDefaultHost = "127.0.0.1";
constexpr uint64_t kDefaultPort = 50100;
constexpr uint64_t kDefaultIoTimeoutSec = 30;

[[noreturn]] void usage(const char* argv, bool success) {
    std::cout << "Usage: " << argv << " [options] <file>" << std::endl
              << std::endl;
    ConfigManager::serializeHelpToOStream(std::cout);
    exit(static_cast<int>(!success));
}

void printProgress(const int percent) {
    std::cout << "\rPercent complete: " << percent << "%" << std::flush;
    if (percent == 100) {
        std::cout << std::endl;
    }
}

}  // namespace

int main(int argc, char** argv) {
    FileTransfer_LogInit();
    absl::Cleanup deinit = [] { FileTransfer_LogDeInit(); };

    const ConfigManager config(CommandLine(argc, argv));
    if (!config.loaded()) {
        usage(argv[0], false);
    }
    if (config.has(ConfigManager::Configs::HELP)) {
        usage(argv[0], true);
    }
    if (auto logfile = config.get(ConfigManager::Configs::LOG_FILE); logfile) {
        FileTransfer_AddLogFile(*logfile);
    }

    const auto source = config.get(ConfigManager::Configs::SOURCE);
    if (!source) {
        LOG(ERROR) << "No file to store given";
        usage(argv[0], false);
    }
    const auto port = config.getNumber(ConfigManager::Configs::PORT, kDefaultPort);
    const auto segment_size = config.getNumber(
        ConfigManager::Configs::MAX_SEGMENT_SIZE, Limits::DEFAULT_SEGMENT_SIZE);
    const auto io_timeout =
        config.getNumber(ConfigManager::Configs::IO_TIMEOUT, kDefaultIoTimeoutSec);
    for (const auto* status :
         {&port.status(), &segment_size.status(), &io_timeout.status()}) {
        if (!status->ok()) {
            LOG(ERROR) << status->message();
            return EXIT_FAILURE;
        }
    }
    if (*port == 0 || *port > std::numeric_limits<uint16_t>::max()) {
        LOG(ERROR) << "Invalid port: " << *port;
        return EXIT_FAILURE;
    }

    FabricTransport transport(
        TcpChannel::Endpoint{
            .address = config.get(ConfigManager::Configs::HOST)
                           .value_or(std::string(kDefaultHost)),
            .port = static_cast<uint16_t>(*port),
        },
        config.get(ConfigManager::Configs::SERVICE_ID).value_or(""),
        TcpChannel::Options{
            .io_timeout = std::chrono::seconds(*io_timeout),
        });
    FileTransferClient client(transport);

    const auto name = config.get(ConfigManager::Configs::NAME).value_or("");
    auto result = client.storeFile(*source, name, printProgress,
                                   static_cast<std::size_t>(*segment_size));
    if (!result.ok()) {
        std::cout << std::endl;
        LOG(ERROR) << "Store failed: " << result.status();
        return EXIT_FAILURE;
    }
    std::cout << "Response:" << std::endl
              << writeJson(toJson(*result), true) << std::endl;
    return EXIT_SUCCESS;
}
