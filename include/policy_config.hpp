/**
 * @file policy_config.hpp
 * @brief Parsers for the sectioned firewall policy files
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Every firewall policy file (cluster, host, guest, vnet bridge) shares the
 * same sectioned text format:
 *
 * @code
 * [OPTIONS]
 * enable: 1
 *
 * [ALIASES]
 * mgmt 10.0.0.0/24 # management network
 *
 * [IPSET trusted] # comment
 * 192.168.1.0/24
 * !192.168.1.7
 *
 * [RULES]
 * IN SSH(ACCEPT) -source +dc/trusted
 *
 * [group webservers]
 * IN ACCEPT -p tcp --dport 80,443
 * @endcode
 *
 * PolicyConfig parses the shared structure; the scope specific classes
 * below validate what a scope may declare and expose typed options with
 * their defaults.
 */

#pragma once

#include "guest_network.hpp"
#include "ipset.hpp"
#include "policy_types.hpp"
#include "rule.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct ParserConfig
 * @brief Scope dependent parser behaviour
 */
struct ParserConfig {
    bool guest_iface_names = false;          ///< Rule interfaces must be "net<N>"
    std::optional<ConfigScope> ipset_scope;  ///< Scope of declared ipsets, none forbids them
};

/**
 * @class PolicyConfig
 * @brief Scope independent content of a policy file
 *
 * Option values are kept as raw strings; they are validated when a scope
 * class builds its typed options. Unknown option keys are ignored there.
 */
class PolicyConfig {
public:
    /**
     * @brief Parse a complete policy file
     * @throws std::runtime_error with the offending line on any error
     */
    static PolicyConfig parse(const std::string& content, const ParserConfig& parser_config);

    const std::map<std::string, std::string>& options() const { return options_; }
    std::optional<std::string> option(const std::string& key) const;

    const std::map<std::string, Alias>& aliases() const { return aliases_; }
    const Alias* alias(const std::string& name) const;

    const std::map<std::string, IpSet>& ipsets() const { return ipsets_; }
    const std::map<std::string, Group>& groups() const { return groups_; }
    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::map<std::string, std::string> options_;
    std::map<std::string, Alias> aliases_;
    std::map<std::string, IpSet> ipsets_;
    std::map<std::string, Group> groups_;
    std::vector<Rule> rules_;
};

/**
 * @struct ClusterOptions
 * @brief [OPTIONS] of the datacenter wide cluster.fw
 */
struct ClusterOptions {
    bool enable = false;                         ///< Master switch for the whole firewall
    bool ebtables = false;
    Verdict policy_in = Verdict::Drop;
    Verdict policy_out = Verdict::Accept;
    std::optional<LogRateLimit> log_ratelimit;   ///< Absent means the default limit
};

/**
 * @class ClusterConfig
 * @brief Datacenter scope: cluster rules, security groups, aliases and ipsets
 */
class ClusterConfig {
public:
    ClusterConfig() = default;

    static ClusterConfig parse(const std::string& content);

    const ClusterOptions& options() const { return options_; }

    bool isEnabled() const { return options_.enable; }
    Verdict defaultPolicy(Direction direction) const;

    /// Limit for generated log statements, std::nullopt when disabled
    std::optional<LogRateLimit> logRateLimit() const;

    const std::map<std::string, Alias>& aliases() const { return config_.aliases(); }
    const Alias* alias(const std::string& name) const { return config_.alias(name); }
    const std::map<std::string, IpSet>& ipsets() const { return config_.ipsets(); }
    const std::map<std::string, Group>& groups() const { return config_.groups(); }
    const std::vector<Rule>& rules() const { return config_.rules(); }

private:
    PolicyConfig config_;
    ClusterOptions options_;
};

/**
 * @struct HostOptions
 * @brief [OPTIONS] of the node local host.fw
 */
struct HostOptions {
    bool enable = true;
    bool nftables = false;                       ///< Opt-in for this nftables based firewall
    RuleLogLevel log_level_in = RuleLogLevel::Nolog;
    RuleLogLevel log_level_out = RuleLogLevel::Nolog;
    bool log_nf_conntrack = false;
    bool ndp = true;
    bool nf_conntrack_allow_invalid = false;
    std::vector<std::string> nf_conntrack_helpers;
    std::optional<int64_t> nf_conntrack_max;
    std::optional<int64_t> nf_conntrack_tcp_timeout_established;
    std::optional<int64_t> nf_conntrack_tcp_timeout_syn_recv;
    bool nosmurfs = true;
    bool protection_synflood = false;
    int64_t protection_synflood_burst = 1000;
    int64_t protection_synflood_rate = 200;
    RuleLogLevel smurf_log_level = RuleLogLevel::Nolog;
    RuleLogLevel tcp_flags_log_level = RuleLogLevel::Nolog;
    bool tcpflags = false;
};

/**
 * @class HostConfig
 * @brief Host scope: node rules and hardening options
 *
 * Host files may not declare aliases, ipsets or groups.
 */
class HostConfig {
public:
    HostConfig() = default;

    static HostConfig parse(const std::string& content);

    const HostOptions& options() const { return options_; }
    const std::vector<Rule>& rules() const { return config_.rules(); }

    bool isEnabled() const { return options_.enable; }
    bool nftablesEnabled() const { return options_.nftables; }
    bool blockInvalidConntrack() const { return !options_.nf_conntrack_allow_invalid; }
    RuleLogLevel logLevel(Direction direction) const;

private:
    PolicyConfig config_;
    HostOptions options_;
};

/**
 * @struct GuestOptions
 * @brief [OPTIONS] of a guest's <vmid>.fw
 */
struct GuestOptions {
    bool enable = false;
    bool ndp = true;
    bool dhcp = true;
    bool radv = false;
    bool macfilter = true;
    bool ipfilter = false;
    Verdict policy_in = Verdict::Drop;
    Verdict policy_out = Verdict::Accept;
    RuleLogLevel log_level_in = RuleLogLevel::Nolog;
    RuleLogLevel log_level_out = RuleLogLevel::Nolog;
};

/**
 * @class GuestConfig
 * @brief Guest scope: firewall file plus the guest's network devices
 */
class GuestConfig {
public:
    /**
     * @brief Parse a guest's firewall and resource config
     * @param vmid Guest id
     * @param type Guest type, decides the interface name prefix
     * @param firewall_content Content of <vmid>.fw
     * @param resource_content Content of the qemu-server/lxc config
     * @throws std::runtime_error on invalid content or declared groups
     */
    static GuestConfig parse(uint32_t vmid, GuestType type,
                             const std::string& firewall_content,
                             const std::string& resource_content);

    uint32_t vmid() const { return vmid_; }
    GuestType type() const { return type_; }
    const GuestOptions& options() const { return options_; }

    bool isEnabled() const { return options_.enable; }
    Verdict defaultPolicy(Direction direction) const;
    RuleLogLevel logLevel(Direction direction) const;

    const std::vector<Rule>& rules() const { return config_.rules(); }
    const std::map<std::string, Alias>& aliases() const { return config_.aliases(); }
    const Alias* alias(const std::string& name) const { return config_.alias(name); }
    const std::map<std::string, IpSet>& ipsets() const { return config_.ipsets(); }
    const NetworkConfig& networkConfig() const { return network_config_; }

    /// Host side interface of device N, e.g. "tap100i0"
    std::string ifaceNameByIndex(int index) const;

    /// "net0" -> host side interface name. @throws std::invalid_argument
    std::string ifaceNameByKey(const std::string& key) const;

private:
    uint32_t vmid_ = 0;
    GuestType type_ = GuestType::Vm;
    PolicyConfig config_;
    GuestOptions options_;
    NetworkConfig network_config_;
};

/**
 * @struct BridgeOptions
 * @brief [OPTIONS] of an SDN vnet firewall file
 */
struct BridgeOptions {
    bool enable = false;
    RuleLogLevel log_level_forward = RuleLogLevel::Nolog;
    Verdict policy_forward = Verdict::Accept;
};

/**
 * @class BridgeConfig
 * @brief Forward rules of one SDN vnet bridge
 */
class BridgeConfig {
public:
    static BridgeConfig parse(const std::string& bridge_name, const std::string& content);

    const std::string& bridgeName() const { return bridge_name_; }
    const BridgeOptions& options() const { return options_; }
    const std::vector<Rule>& rules() const { return config_.rules(); }

    bool isEnabled() const { return options_.enable; }

private:
    std::string bridge_name_;
    PolicyConfig config_;
    BridgeOptions options_;
};

} // namespace nftfw
