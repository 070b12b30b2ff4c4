#pragma once

/**
 * Stream-style logging on top of spdlog.
 * LOG(INFO) << "..." builds the message in a temporary and hands it to the
 * default spdlog logger when the statement ends.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>

namespace detail {

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(spdlog::level::level_enum l) : level(l) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    // std::endl, std::boolalpha and friends
    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    LogStream& operator<<(std::ios_base& (*manip)(std::ios_base&)) {
        manip(oss);
        return *this;
    }

    ~LogStream() {
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(level, "{}", msg);
        }
    }
};

}  // namespace detail

namespace log_severity {
constexpr auto INFO = spdlog::level::info;
constexpr auto WARNING = spdlog::level::warn;
constexpr auto ERROR = spdlog::level::err;
constexpr auto FATAL = spdlog::level::critical;
}  // namespace log_severity

#define LOG(severity) ::detail::LogStream(::log_severity::severity)

#ifdef NDEBUG
#define DLOG(severity) \
    while (false) ::detail::LogStream(::log_severity::severity)
#else
#define DLOG(severity) ::detail::LogStream(::log_severity::severity)
#endif

// Prefixes the message with strerror(errno)
#define PLOG(severity) LOG(severity) << std::strerror(errno) << ": "
