/**
 * @file nft_expression.hpp
 * @brief Builders for nftables JSON expressions and statements
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Expressions and statements are plain Json::Value objects in the schema
 * understood by "nft -j". The builders only shape the JSON; they perform
 * no validation beyond what the typed arguments guarantee.
 */

#pragma once

#include "address.hpp"
#include "policy_types.hpp"
#include "port.hpp"
#include "rule_match.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @class Expression
 * @brief Static factory for expression objects
 */
class Expression {
public:
    /// {"payload": {"protocol": "ip", "field": "saddr"}}
    static Json::Value payload(const std::string& protocol, const std::string& field);

    /// {"meta": {"key": "iifname"}}
    static Json::Value meta(const std::string& key);

    /// {"ct": {"key": "state"}} with optional "family" ("ip" or "ip6")
    static Json::Value ct(const std::string& key, std::optional<Family> family = std::nullopt);

    /// Anonymous set {"set": [...]}
    static Json::Value set(const std::vector<Json::Value>& elements);

    /// Plain JSON array, used for flag lists such as ct state
    static Json::Value list(const std::vector<Json::Value>& elements);

    static Json::Value concat(const std::vector<Json::Value>& elements);

    static Json::Value range(const Json::Value& start, const Json::Value& end);

    /// {"prefix": {"addr": "10.0.0.0", "len": 8}}
    static Json::Value prefix(const Cidr& cidr);

    /// "@<name>"
    static Json::Value setReference(const std::string& name);

    static Json::Value fromIpRange(const IpRange& range);
    static Json::Value fromIpEntry(const IpEntry& entry);

    /// Single entry as itself, more entries as anonymous set
    static Json::Value fromIpList(const IpList& list);

    static Json::Value fromPortEntry(const PortEntry& entry);

    /// Single entry as itself, more entries as anonymous set
    static Json::Value fromPortList(const PortList& list);

    /// Named values as strings, numeric values as numbers
    static Json::Value fromIcmpValue(const IcmpValue& value);

    /// Field name prefix for a family: "ip" or "ip6"
    static std::string ipProtocol(Family family);
};

/**
 * @enum MatchOperator
 * @brief Relational operator of a match statement
 */
enum class MatchOperator {
    Eq,
    Ne
};

/**
 * @class Statement
 * @brief Static factory for statement objects
 */
class Statement {
public:
    static Json::Value match(MatchOperator op, const Json::Value& left, const Json::Value& right);
    static Json::Value matchEq(const Json::Value& left, const Json::Value& right);
    static Json::Value matchNe(const Json::Value& left, const Json::Value& right);

    static Json::Value accept();
    static Json::Value drop();
    static Json::Value jump(const std::string& target);
    static Json::Value goTo(const std::string& target);

    /// Policy verdict; Reject is emitted as drop
    static Json::Value fromVerdict(Verdict verdict);

    /// nflog statement {"log": {"prefix": ..., "group": N}}
    static Json::Value log(const std::string& prefix, int group);

    /**
     * @brief Log prefix ":<vmid|0>:<level>:<chain>: <VERDICT>: "
     */
    static std::string logPrefix(std::optional<uint32_t> vmid, int level,
                                 const std::string& chain, Verdict verdict);

    /// Anonymous limit; "inv" is only emitted when set
    static Json::Value limit(uint64_t rate, RateUnit per, std::optional<uint64_t> burst,
                             bool inverted = false);

    /// Limit statement for the log rate limit
    static Json::Value fromLogRateLimit(const LogRateLimit& limit);

    /// {"ct helper": "<name>"}
    static Json::Value ctHelper(const std::string& name);

    /// {"set": {"op": "update", "elem": ..., "set": "@name", "stmt": [...]}}
    static Json::Value setUpdate(const Json::Value& element, const std::string& setName,
                                 const std::vector<Json::Value>& statements);
};

} // namespace nftfw
