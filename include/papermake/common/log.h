// papermake/common/log.h
#ifndef PAPERMAKE_COMMON_LOG_H
#define PAPERMAKE_COMMON_LOG_H

#include <cstdint>
#include <string>
#include <string_view>

namespace papermake {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// "debug", "info", "warning" / "warn", "error", "off"; throws std::invalid_argument otherwise
LogLevel parse_log_level(std::string_view name);

// Writes "[LEVEL] message" to std::cerr when level >= current level
void log(LogLevel level, std::string_view message);

inline void log_debug(std::string_view message) { log(LogLevel::DEBUG, message); }
inline void log_info(std::string_view message) { log(LogLevel::INFO, message); }
inline void log_warning(std::string_view message) { log(LogLevel::WARNING, message); }
inline void log_error(std::string_view message) { log(LogLevel::ERROR, message); }

} // namespace papermake

#endif // PAPERMAKE_COMMON_LOG_H
