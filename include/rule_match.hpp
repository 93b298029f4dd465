/**
 * @file rule_match.hpp
 * @brief Match part of a firewall rule line
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Contains the option scanner for rule lines ("-p tcp --dport 22 ...") and
 * the typed match built from it: protocol with ports or ICMP selector,
 * source/destination address match, interface and log level.
 */

#pragma once

#include "address.hpp"
#include "ipset.hpp"
#include "policy_types.hpp"
#include "port.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace nftfw {

/**
 * @struct RuleOptions
 * @brief Raw "-key value" pairs of a rule line
 *
 * Each option may be written with one or two leading dashes; "p" and "i"
 * are short forms of "proto" and "iface".
 */
struct RuleOptions {
    std::optional<std::string> proto;
    std::optional<std::string> dport;
    std::optional<std::string> sport;
    std::optional<std::string> dest;
    std::optional<std::string> source;
    std::optional<std::string> iface;
    std::optional<std::string> log;
    std::optional<std::string> icmp_type;

    /// @throws std::invalid_argument on unknown, duplicate or valueless options
    static RuleOptions parse(const std::string& text);
};

/**
 * @struct IcmpValue
 * @brief ICMP type or code, either numeric or one of the well-known names
 */
struct IcmpValue {
    std::variant<uint8_t, std::string> value;

    bool isNamed() const { return std::holds_alternative<std::string>(value); }
    std::string toString() const;

    bool operator==(const IcmpValue& other) const { return value == other.value; }
};

/**
 * @struct IcmpMatch
 * @brief ICMP (family V4) or ICMPv6 (family V6) protocol match
 *
 * At most one of type and code is set. Without either, the match only
 * selects the protocol.
 */
struct IcmpMatch {
    Family family = Family::V4;
    std::optional<IcmpValue> type;
    std::optional<IcmpValue> code;

    /**
     * @brief Parse an -icmp-type value
     *
     * Numbers and type names select a type, code names select a code.
     * @throws std::invalid_argument if the text is neither
     */
    static IcmpMatch parse(Family family, const std::string& text);
};

struct Ports {
    std::optional<PortList> sport;
    std::optional<PortList> dport;
};

/// tcp, udp, sctp, dccp or udplite with optional ports
struct PortProtocol {
    std::string name;
    Ports ports;
};

/// Any other protocol name passed through to the engine
struct NamedProtocol {
    std::string name;
};

/// Protocol given as a number without a well-known mapping
struct NumericProtocol {
    uint8_t number;
};

using Protocol = std::variant<PortProtocol, IcmpMatch, NamedProtocol, NumericProtocol>;

/**
 * @brief Build the protocol match from rule options
 * @return std::nullopt when no protocol is given
 * @throws std::invalid_argument on invalid ports or ICMP selectors
 */
std::optional<Protocol> protocolFromOptions(const RuleOptions& options);

/// Family a protocol implies (ICMP -> V4, ICMPv6 -> V6), if any
std::optional<Family> protocolFamily(const Protocol& protocol);

/// Address side of a rule: literal list, set reference or alias reference
using IpAddrMatch = std::variant<IpList, IpsetName, AliasName>;

/**
 * @brief Parse an address match
 *
 * Tries a literal list first, then "+scope/name" as set, then
 * "scope/name" as alias.
 * @throws std::invalid_argument if none applies
 */
IpAddrMatch parseIpAddrMatch(const std::string& text);

/// Family of a literal list, std::nullopt for set and alias references
std::optional<Family> ipAddrMatchFamily(const IpAddrMatch& match);

/**
 * @class IpMatch
 * @brief Source and/or destination match; at least one is set
 */
class IpMatch {
public:
    /// @throws std::invalid_argument if both are empty or literal families differ
    IpMatch(std::optional<IpAddrMatch> src, std::optional<IpAddrMatch> dst);

    static std::optional<IpMatch> fromOptions(const RuleOptions& options);

    const std::optional<IpAddrMatch>& src() const { return src_; }
    const std::optional<IpAddrMatch>& dst() const { return dst_; }

private:
    std::optional<IpAddrMatch> src_;
    std::optional<IpAddrMatch> dst_;
};

/**
 * @struct RuleMatch
 * @brief "<IN|OUT> <VERDICT|MACRO(VERDICT)> [options]"
 */
struct RuleMatch {
    Direction direction = Direction::In;
    Verdict verdict = Verdict::Drop;
    std::optional<std::string> fw_macro;     ///< Macro name expanded at compile time
    std::optional<std::string> iface;        ///< Interface name or guest device key
    RuleLogLevel log = RuleLogLevel::Nolog;
    std::optional<IpMatch> ip;
    std::optional<Protocol> proto;

    static RuleMatch fromOptions(Direction direction, Verdict verdict,
                                 std::optional<std::string> fw_macro, const RuleOptions& options);

    /// @throws std::invalid_argument on malformed lines
    static RuleMatch parse(const std::string& line);
};

} // namespace nftfw
