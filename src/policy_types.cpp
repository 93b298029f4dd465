#include "policy_types.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace nftfw {

Direction parseDirection(const std::string& text) {
    std::string upper = toUpper(text);
    if (upper == "IN") return Direction::In;
    if (upper == "OUT") return Direction::Out;
    throw std::invalid_argument("invalid direction: " + text);
}

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::In: return "in";
        case Direction::Out: return "out";
        case Direction::Forward: return "forward";
    }
    return "in";
}

Verdict parseVerdict(const std::string& text) {
    std::string upper = toUpper(text);
    if (upper == "ACCEPT") return Verdict::Accept;
    if (upper == "DROP") return Verdict::Drop;
    if (upper == "REJECT") return Verdict::Reject;
    throw std::invalid_argument("invalid verdict: " + text);
}

std::string verdictToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::Accept: return "ACCEPT";
        case Verdict::Drop: return "DROP";
        case Verdict::Reject: return "REJECT";
    }
    return "DROP";
}

RuleLogLevel parseRuleLogLevel(const std::string& text) {
    std::string lower = toLower(text);
    if (lower == "nolog") return RuleLogLevel::Nolog;
    if (lower == "emerg") return RuleLogLevel::Emerg;
    if (lower == "alert") return RuleLogLevel::Alert;
    if (lower == "crit") return RuleLogLevel::Crit;
    if (lower == "err") return RuleLogLevel::Err;
    if (lower == "warn" || lower == "warning") return RuleLogLevel::Warn;
    if (lower == "notice") return RuleLogLevel::Notice;
    if (lower == "info") return RuleLogLevel::Info;
    if (lower == "debug") return RuleLogLevel::Debug;
    if (lower == "audit") return RuleLogLevel::Audit;
    throw std::invalid_argument("invalid log level: " + text);
}

std::optional<int> nflogLevel(RuleLogLevel level) {
    switch (level) {
        case RuleLogLevel::Nolog: return std::nullopt;
        case RuleLogLevel::Emerg: return 0;
        case RuleLogLevel::Alert: return 1;
        case RuleLogLevel::Crit: return 2;
        case RuleLogLevel::Err: return 3;
        case RuleLogLevel::Warn: return 4;
        case RuleLogLevel::Notice: return 5;
        case RuleLogLevel::Info: return 6;
        case RuleLogLevel::Debug: return 7;
        case RuleLogLevel::Audit: return 7;
    }
    return std::nullopt;
}

std::string rateUnitToString(RateUnit unit) {
    switch (unit) {
        case RateUnit::Second: return "second";
        case RateUnit::Minute: return "minute";
        case RateUnit::Hour: return "hour";
        case RateUnit::Day: return "day";
    }
    return "second";
}

LogRateLimit LogRateLimit::parse(const std::string& text) {
    LogRateLimit limit;
    std::istringstream stream(text);
    std::string element;

    while (std::getline(stream, element, ',')) {
        element = trim(element);
        auto equals = element.find('=');

        if (equals == std::string::npos) {
            limit.enabled = parseBool(element);
            continue;
        }

        std::string key = trim(element.substr(0, equals));
        std::string value = trim(element.substr(equals + 1));

        if (key == "enable") {
            limit.enabled = parseBool(value);
        } else if (key == "burst") {
            limit.burst = parseInteger(value);
        } else if (key == "rate") {
            auto slash = value.find('/');
            limit.rate = parseInteger(value.substr(0, slash));
            if (slash != std::string::npos) {
                std::string unit = toLower(value.substr(slash + 1));
                if (unit == "second") limit.per = RateUnit::Second;
                else if (unit == "minute") limit.per = RateUnit::Minute;
                else if (unit == "hour") limit.per = RateUnit::Hour;
                else if (unit == "day") limit.per = RateUnit::Day;
                else throw std::invalid_argument("invalid time unit in log_ratelimit: " + unit);
            }
        } else {
            throw std::invalid_argument("invalid key '" + key + "' found in log_ratelimit");
        }
    }

    return limit;
}

bool parseBool(const std::string& text) {
    std::string lower = toLower(trim(text));
    if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") return true;
    if (lower == "0" || lower == "false" || lower == "off" || lower == "no") return false;
    throw std::invalid_argument("invalid boolean value: '" + text + "'");
}

int64_t parseInteger(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value.size() > 18 ||
        value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid number: '" + text + "'");
    }
    return std::stoll(value);
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string toLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpper(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::optional<std::pair<std::string, std::string>> matchName(const std::string& text) {
    size_t end = 0;
    while (end < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '-')) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, end), text.substr(end));
}

std::optional<std::pair<std::string, std::string>> matchNonWhitespace(const std::string& text) {
    size_t end = 0;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }

    size_t rest = end;
    while (rest < text.size() && std::isspace(static_cast<unsigned char>(text[rest]))) {
        ++rest;
    }
    return std::make_pair(text.substr(0, end), text.substr(rest));
}

} // namespace nftfw
