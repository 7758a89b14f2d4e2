#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending (creating parent directories)
 * and starts the background writer thread.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Emit log lines as JSON objects instead of plain text. */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files. */
void set_log_compression(bool enable);

/**
 * @brief Mirror log lines at or above @p level to stderr.
 *
 * Console mirroring works even when no log file is open.
 */
void set_console_logging(bool enable, LogLevel level = LogLevel::WARNING);

/** @brief Check whether a log file is open. */
bool logger_initialized();

/** @brief Block until every queued entry has been written. */
void flush_logger();

/**
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`).
 *
 * Matching is case-insensitive.
 *
 * @return `true` if @p name was recognized.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/** @brief Stop the writer thread and close the log file. */
void shutdown_logger();

#endif // LOGGER_HPP
