/**
 * @file logger.hpp
 * @brief Leveled logging for nftables-firewall
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Process-wide logger used by every component. Messages are prefixed with a
 * millisecond timestamp and a fixed-width level tag, or with a syslog style
 * priority marker when running under systemd.
 */

#pragma once

#include <string>

namespace nftfw {

/**
 * @enum LogLevel
 * @brief Logging verbosity
 *
 * Higher values include all lower ones:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: Everything, including the generated commands
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @enum LogStyle
 * @brief Output line format
 */
enum class LogStyle {
    Default, ///< [timestamp] [LEVEL] component: message
    Systemd  ///< <priority>component: message (journald parses the prefix)
};

/**
 * @class Logger
 * @brief Static logging facade
 *
 * Every level is written to stderr, standard output carries command results.
 * The level and style are global and are normally set once at startup from
 * the daemon settings and the command line.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void debug(const std::string& component, const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    static void setStyle(LogStyle style);
    static LogStyle getStyle();

    /**
     * @brief Pick the style from the NFTFW_LOG_STYLE environment variable
     *
     * "SYSTEMD" selects the systemd style, anything else leaves the current
     * style untouched.
     */
    static void initStyleFromEnvironment();

    /**
     * @brief Convert a level name (none, error, warning, info, debug)
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);

private:
    static LogLevel current_level_;
    static LogStyle current_style_;
};

} // namespace nftfw
