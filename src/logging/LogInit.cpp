#include "LogInit.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

static std::shared_ptr<spdlog::logger> main_logger;

void FileTransfer_LogInit() {
    if (main_logger) return;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    main_logger = std::make_shared<spdlog::logger>("filetransfer", console_sink);
#ifdef NDEBUG
    main_logger->set_level(spdlog::level::info);
#else
    main_logger->set_level(spdlog::level::trace);
#endif

    spdlog::set_default_logger(main_logger);
    spdlog::set_pattern("[%L] %v");
}

bool FileTransfer_AddLogFile(const std::filesystem::path& path) {
    if (!main_logger) {
        FileTransfer_LogInit();
    }
    try {
        auto file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
        file_sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%L] %v");
        main_logger->sinks().push_back(std::move(file_sink));
    } catch (const spdlog::spdlog_ex& e) {
        SPDLOG_ERROR("Couldn't open log file {}: {}", path.string(), e.what());
        return false;
    }
    SPDLOG_INFO("File {} added as logsink", path.string());
    return true;
}

void FileTransfer_LogDeInit() {
    if (!main_logger) {
        return;
    }
    spdlog::drop_all();
    main_logger.reset();
}
