#include "Logger.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace roster {

namespace {
// Logs go to stderr so that stdout carries only command output.
std::shared_ptr<spdlog::sinks::sink> console_sink() {
    static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
}
}

Logger logger_for(std::string name) {
    auto logger = spdlog::logger(std::move(name), console_sink());
    logger.set_level(spdlog::default_logger()->level());
    return logger;
}

void set_log_level(spdlog::level::level_enum level) { spdlog::set_level(level); }

}
