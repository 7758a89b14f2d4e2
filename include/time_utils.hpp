#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Current local time as ISO-8601 with seconds and a numeric offset,
 * e.g. `2026-01-01T10:00:00+01:00`.
 */
std::string iso8601_now();

#endif // TIME_UTILS_HPP
