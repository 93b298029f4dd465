/**
 * @file rule_compiler.hpp
 * @brief Translation of policy rules into nftables rules
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * One policy rule becomes zero or more candidate rules. Each candidate
 * carries an optional address family: it is unpinned until a match that
 * only makes sense for one family (ICMP type, literal address, set
 * reference) is attached. Matches for a different family than an already
 * pinned one are left out of that candidate.
 *
 * After compilation every entry point runs the family fan-out: unpinned
 * candidates are emitted once per family the target table carries (with a
 * family marker match when the table carries both), pinned candidates are
 * kept only if the table carries their family.
 */

#pragma once

#include "firewall_config.hpp"
#include "ipset.hpp"
#include "macro_tables.hpp"
#include "nft_types.hpp"
#include "policy_types.hpp"
#include "rule.hpp"
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct NftRule
 * @brief Candidate rule: match statements followed by terminal statements
 */
struct NftRule {
    std::optional<Family> family;              ///< Pinned family, none while unpinned
    std::vector<Json::Value> statements;       ///< Matches, in attach order
    std::vector<Json::Value> terminal;         ///< Verdict, log or helper statements

    NftRule() = default;
    explicit NftRule(Json::Value terminal_statement) { terminal.push_back(std::move(terminal_statement)); }
    explicit NftRule(std::vector<Json::Value> terminal_statements)
        : terminal(std::move(terminal_statements)) {}

    /// Statements followed by terminal statements
    std::vector<Json::Value> allStatements() const;

    /// "add rule" command for the given chain
    Json::Value toAddRule(const ChainName& chain) const;
};

/**
 * @struct RuleEnv
 * @brief Where a rule is compiled into
 */
struct RuleEnv {
    ChainName chain;
    Direction direction;
    const FirewallConfig& config;
    std::optional<uint32_t> vmid;   ///< Guest context, none for cluster and host chains

    TableFamily tableFamily() const { return chain.table.family; }
    bool containsFamily(Family family) const { return tableSupports(tableFamily(), family); }

    const Alias* alias(const AliasName& name) const { return config.alias(name, vmid); }

    /**
     * @brief Kernel interface name for a rule's interface value
     *
     * Guest context: "net0" resolved through the guest's devices. Host
     * context: alternative names resolved through the interface mapping.
     * Unresolvable names are returned unchanged.
     */
    std::string ifaceName(const std::string& rule_iface) const;

    /// Limit for log statements, none when disabled
    std::optional<LogRateLimit> defaultLogLimit() const { return config.cluster().logRateLimit(); }
};

/**
 * @class RuleCompiler
 * @brief Entry points of the rule compilation
 */
class RuleCompiler {
public:
    /**
     * @brief Compile a policy rule, family fan-out included
     *
     * Disabled rules and rules for another direction yield nothing.
     * @throws std::runtime_error for unknown macros or aliases
     */
    static std::vector<NftRule> compileRule(const Rule& rule, const RuleEnv& env);

    /**
     * @brief Candidates of a policy rule before the family fan-out
     */
    static std::vector<NftRule> candidates(const Rule& rule, const RuleEnv& env);

    /**
     * @brief Accept rules and helper assignment for a conntrack helper
     */
    static std::vector<NftRule> compileCtHelper(const CtHelperMacro& helper, const RuleEnv& env);

    /**
     * @brief Address spoofing guard for a guest device
     * @param ipset Device filter set of the guest
     * @throws std::runtime_error outside a guest context or for Forward
     */
    static std::vector<NftRule> compileIpfilter(const IpSet& ipset, const RuleEnv& env);

    /**
     * @brief Emit candidates per family the table carries
     */
    static std::vector<NftRule> expandFamilies(std::vector<NftRule> rules, TableFamily table);

    /**
     * @brief Match restricting a rule to one family
     *
     * "meta nfproto" in inet tables, "meta protocol" in bridge and netdev
     * tables.
     */
    static Json::Value familyMarker(TableFamily table, Family family);

    /**
     * @brief Verdict statement for a policy verdict
     *
     * Reject becomes drop in inbound bridge chains and a jump to
     * "do-reject" everywhere else.
     */
    static Json::Value generateVerdict(Verdict verdict, const RuleEnv& env);
};

} // namespace nftfw
