#include "SpdlogInit.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace {
constexpr const char* kLoggerName = "hashcore";
std::shared_ptr<spdlog::logger> main_logger;
}  // namespace

void HashCore_SpdlogInit() {
    if (main_logger) return;

    // Digests go to stdout, so every log record goes to stderr.
    main_logger = spdlog::stderr_color_mt(kLoggerName);
    main_logger->set_level(spdlog::level::info);
    main_logger->flush_on(spdlog::level::err);

    spdlog::set_default_logger(main_logger);
    spdlog::set_pattern("[%L] %v");
}

void HashCore_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    main_logger->flush();
    spdlog::drop_all();
    main_logger.reset();
}
