#pragma once

/**
 * Abseil-style logging macros on top of spdlog.
 * Provides LOG/DLOG stream logging and the fatal CHECK family, so code
 * reads the same as with absl/log while spdlog owns the sinks.
 */

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>

namespace logcompat {

enum class Severity { INFO, WARNING, ERROR };

constexpr spdlog::level::level_enum toSpdlogLevel(const Severity severity) {
    switch (severity) {
        case Severity::INFO:
            return spdlog::level::info;
        case Severity::WARNING:
            return spdlog::level::warn;
        case Severity::ERROR:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

struct DebugOnly {};

// Collects a message with operator<< and emits it on destruction.
class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(Severity severity) : level(toSpdlogLevel(severity)) {}
    // DLOG(INFO) records go to spdlog's debug level.
    LogStream(Severity severity, DebugOnly /*tag*/)
        : level(severity == Severity::INFO ? spdlog::level::debug
                                           : toSpdlogLevel(severity)) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    // Manipulators like std::endl
    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    ~LogStream() {
        const std::string msg = oss.str();
        if (!msg.empty() && spdlog::should_log(level)) {
            spdlog::log(level, "{}", msg);
        }
    }
};

// Message sink for a failed CHECK. Logs at critical level and aborts once the
// full expression has been streamed.
class CheckFailure {
    std::ostringstream oss;

   public:
    CheckFailure(const char* file, int line, const char* condition) {
        oss << file << ':' << line << ": Check failed: " << condition << ' ';
    }

    CheckFailure(const CheckFailure&) = delete;
    CheckFailure& operator=(const CheckFailure&) = delete;

    template <typename T>
    CheckFailure& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    [[noreturn]] ~CheckFailure() {
        spdlog::critical("{}", oss.str());
        spdlog::default_logger()->flush();
        std::abort();
    }
};

}  // namespace logcompat

#define LOG(severity) ::logcompat::LogStream(::logcompat::Severity::severity)

#ifdef NDEBUG
#define DLOG(severity) \
    while (false) ::logcompat::LogStream(::logcompat::Severity::severity)
#else
#define DLOG(severity)                                         \
    ::logcompat::LogStream(::logcompat::Severity::severity, \
                           ::logcompat::DebugOnly{})
#endif

#define CHECK(condition)  \
    while (!(condition)) \
    ::logcompat::CheckFailure(__FILE__, __LINE__, #condition)

#define LOGCOMPAT_CHECK_OP(op, a, b)                                       \
    while (!((a)op(b)))                                                    \
    ::logcompat::CheckFailure(__FILE__, __LINE__, #a " " #op " " #b)       \
        << "(" << (a) << " vs. " << (b) << ") "

#define CHECK_EQ(a, b) LOGCOMPAT_CHECK_OP(==, a, b)
#define CHECK_LT(a, b) LOGCOMPAT_CHECK_OP(<, a, b)
#define CHECK_GT(a, b) LOGCOMPAT_CHECK_OP(>, a, b)
