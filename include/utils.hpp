#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <mutex>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Depfetch {

/**
 * @brief Serializes console output. Jobs of a batch log from their own
 *        threads, so every line is written while holding this mutex.
 */
std::mutex& logMutex();

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex());
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex());
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex());
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Percent-encodes a string so it can be used as a single path segment
 *        or URL component.
 *
 * Letters, digits and the marks - _ . ! ~ * ' ( ) are kept; every other
 * byte (including '/' and '@') becomes %XX with uppercase hex digits.
 *
 * @param input The raw string, typically a package name.
 * @return The encoded string.
 */
std::string percentEncode(const std::string& input);

/**
 * @brief Strips the scheme ("https://") from a URL, leaving host + path.
 *
 * Used to name the request target in error messages.
 */
std::string stripScheme(const std::string& url);

} // namespace Depfetch

#endif // UTILS_HPP
