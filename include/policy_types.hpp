/**
 * @file policy_types.hpp
 * @brief Small enums and scanners shared by the firewall language parsers
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace nftfw {

/**
 * @enum Direction
 * @brief Traffic direction of a rule or chain
 *
 * Forward is only used by bridge (SDN vnet) configs; rule lines accept IN
 * and OUT.
 */
enum class Direction {
    In,
    Out,
    Forward
};

/// Case-insensitive "IN" / "OUT". @throws std::invalid_argument
Direction parseDirection(const std::string& text);

/// "in", "out" or "forward", as used in chain names
std::string directionToString(Direction direction);

/**
 * @enum Verdict
 * @brief Terminal action of a rule or a chain policy
 */
enum class Verdict {
    Accept,
    Drop,
    Reject
};

/// Case-insensitive ACCEPT / DROP / REJECT. @throws std::invalid_argument
Verdict parseVerdict(const std::string& text);

/// Uppercase name, as used in log prefixes
std::string verdictToString(Verdict verdict);

/**
 * @enum RuleLogLevel
 * @brief Log level attached to rules and chain policies
 */
enum class RuleLogLevel {
    Nolog,
    Emerg,
    Alert,
    Crit,
    Err,
    Warn,
    Notice,
    Info,
    Debug,
    Audit
};

/// @throws std::invalid_argument for unknown level names
RuleLogLevel parseRuleLogLevel(const std::string& text);

/**
 * @brief Syslog severity passed to nflog
 * @return std::nullopt for Nolog, which produces no log statement
 */
std::optional<int> nflogLevel(RuleLogLevel level);

enum class RateUnit {
    Second,
    Minute,
    Hour,
    Day
};

std::string rateUnitToString(RateUnit unit);

/**
 * @struct LogRateLimit
 * @brief Cluster wide limit applied to every generated log statement
 *
 * Text form: comma separated "enable=<bool>", "rate=<n>[/unit]",
 * "burst=<n>" or a bare boolean.
 */
struct LogRateLimit {
    bool enabled = true;              ///< Whether a limit statement is emitted
    int64_t rate = 1;                 ///< Events per unit
    RateUnit per = RateUnit::Second;  ///< Rate time unit
    int64_t burst = 5;                ///< Burst size in packets

    /// @throws std::invalid_argument on unknown keys or bad values
    static LogRateLimit parse(const std::string& text);
};

/// Accepts 0/1, no/yes, off/on, false/true in any case. @throws std::invalid_argument
bool parseBool(const std::string& text);

/// Decimal integer. @throws std::invalid_argument
int64_t parseInteger(const std::string& text);

std::string trim(const std::string& text);
std::string toLower(const std::string& text);
std::string toUpper(const std::string& text);

/**
 * @brief Split off a leading identifier made of alphanumerics and '-'
 * @return identifier and the remainder, or std::nullopt if text does not
 *         start with one
 */
std::optional<std::pair<std::string, std::string>> matchName(const std::string& text);

/**
 * @brief Split off a leading whitespace-free token
 * @return token and the remainder with leading whitespace removed
 */
std::optional<std::pair<std::string, std::string>> matchNonWhitespace(const std::string& text);

} // namespace nftfw
