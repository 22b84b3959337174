#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace sa {

enum log_level {
    TRACE = SPDLOG_LEVEL_TRACE,
    DEBUG = SPDLOG_LEVEL_DEBUG,
    INFO = SPDLOG_LEVEL_INFO,
    WARN = SPDLOG_LEVEL_WARN,
    ERR = SPDLOG_LEVEL_ERROR,
};

using logger = std::shared_ptr<spdlog::logger>;

/**
 * Receives every formatted log line, `[<logger name>] <message>` followed by a line break
 */
using logger_cb = std::function<void(log_level level, const char *message, size_t length)>;

/**
 * Get the logger with the given name, creating it on first use.
 * New loggers start at the level set by `set_default_log_level`.
 */
logger create_logger(const std::string &name);

/**
 * Change the level of all existing loggers and of the ones created later
 */
void set_default_log_level(log_level lvl);

/**
 * Parse "trace", "debug", "info", "warn" or "error", case-insensitively
 */
std::optional<log_level> parse_log_level(std::string_view name);

/**
 * Redirect log output. `nullptr` restores the default stderr writer.
 */
void set_logger_callback(logger_cb cb);

} // namespace sa

#define errlog(l_, fmt_, ...) do { (l_)->error(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define warnlog(l_, fmt_, ...) do { (l_)->warn(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define infolog(l_, fmt_, ...) do { (l_)->info(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define dbglog(l_, fmt_, ...) do { if ((l_)->should_log(spdlog::level::debug)) (l_)->debug(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define tracelog(l_, fmt_, ...) do { if ((l_)->should_log(spdlog::level::trace)) (l_)->trace(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
