#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <LogInit.hpp>
#include <absl/cleanup/cleanup.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <server/FabricServer.hpp>
#include <server/FileStoreManager.hpp>
#include <server/StoreService.hpp>
#include <string>

using namespace FileTransfer;

namespace {

constexpr uint64_t kDefaultPort = 50100;
constexpr uint64_t kDefaultIoThreads = 4;

[[noreturn]] void usage(const char* argv, bool success) {
    std::cout << "Usage: " << argv << " --storage-dir <dir> [options]"
              << std::endl
              << std::endl;
    ConfigManager::serializeHelpToOStream(std::cout);
    exit(static_cast<int>(!success));
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

    const auto storage_dir = config.get(ConfigManager::Configs::STORAGE_DIR);
    if (!storage_dir) {
        LOG(ERROR) << "Storage directory is not set";
        usage(argv[0], false);
    }
    const auto port =
        config.getNumber(ConfigManager::Configs::PORT, kDefaultPort);
    const auto io_threads =
        config.getNumber(ConfigManager::Configs::IO_THREADS, kDefaultIoThreads);
    if (!port.ok() || !io_threads.ok()) {
        LOG(ERROR) << (port.ok() ? io_threads.status() : port.status());
        return EXIT_FAILURE;
    }
    if (*port > std::numeric_limits<uint16_t>::max()) {
        LOG(ERROR) << "Invalid port: " << *port;
        return EXIT_FAILURE;
    }

    std::optional<std::filesystem::path> working_dir;
    if (auto dir = config.get(ConfigManager::Configs::WORKING_DIR); dir) {
        working_dir = *dir;
    }
    auto store = Server::FileStoreManager::create(*storage_dir, working_dir);
    if (!store.ok()) {
        LOG(ERROR) << "Cannot prepare storage: " << store.status();
        return EXIT_FAILURE;
    }
    Server::StoreService service(
        **store, config.get(ConfigManager::Configs::SERVICE_ID).value_or(""));
    Server::FabricServer server(
        service, Server::FabricServer::Options{
                     .address = config.get(ConfigManager::Configs::HOST)
                                    .value_or("0.0.0.0"),
                     .port = static_cast<uint16_t>(*port),
                     .io_threads = static_cast<std::size_t>(*io_threads),
                 });
    if (!server.start()) {
        return EXIT_FAILURE;
    }

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait(
        [](const boost::system::error_code& ec, const int signal) {
            if (!ec) {
                LOG(INFO) << "Received signal " << signal << ", exiting";
            }
        });
    signal_context.run();

    server.stop();
    return EXIT_SUCCESS;
}
