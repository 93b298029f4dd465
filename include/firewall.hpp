/**
 * @file firewall.hpp
 * @brief Generation of the complete nftables batch for one host
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Cluster and host rules live in the inet table "proxmox-firewall", guest
 * rules in the bridge table "proxmox-firewall-guests". The fixed chains of
 * both tables come from the skeleton script; everything generated here is
 * flushed and rebuilt on every cycle.
 */

#pragma once

#include "address.hpp"
#include "firewall_config.hpp"
#include "nft_command.hpp"
#include "nft_types.hpp"
#include "policy_types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct HostAccess
 * @brief Side channels of the generation outside the nftables batch
 */
struct HostAccess {
    /// Networks of the management ipset when the cluster defines none
    std::function<std::vector<Cidr>()> management_cidrs;

    /// Best effort write of a kernel tunable or flag file, false on failure
    std::function<bool(const std::string& path, const std::string& value)> write_tunable;

    /// Flag file read by the log daemon, "1" when conntrack logging is on
    std::string conntrack_log_flag = "/var/lib/pve-firewall/log_nf_conntrack";

    /// Local network lookup and /proc writes of the running system
    static HostAccess system();
};

/**
 * @class Firewall
 * @brief Translates one configuration snapshot into engine commands
 */
class Firewall {
public:
    static const std::string kClusterTable;
    static const std::string kHostTable;
    static const std::string kGuestTable;

    static const std::string kConntrackMaxFile;
    static const std::string kConntrackTimeoutEstablishedFile;
    static const std::string kConntrackTimeoutSynRecvFile;

    Firewall(FirewallConfig config, HostAccess host_access = HostAccess::system());

    bool isEnabled() const { return config_.isEnabled(); }
    const FirewallConfig& config() const { return config_; }

    /**
     * @brief Complete batch replacing the generated part of the ruleset
     *
     * Empty when the firewall is disabled. Writes the conntrack tunables and
     * the conntrack log flag as a side effect.
     * @throws std::runtime_error for unknown macros or aliases
     */
    CommandList fullHostFw() const;

    /// Two batches deleting the host and the guest table
    static std::vector<CommandList> removeCommands();

    static TableName clusterTable();
    static TableName hostTable();
    static TableName guestTable();

    static SetName guestVmap(Direction direction);
    static ChainName clusterChain(Direction direction);
    static ChainName hostChain(Direction direction);
    static ChainName hostOptionChain(Direction direction);
    static ChainName guestChain(Direction direction, uint32_t vmid);
    static ChainName groupChain(const TableName& table, const std::string& name, Direction direction);
    static ChainName hostConntrackChain();
    static ChainName synfloodLimitChain();
    static ChainName logInvalidTcpChain();
    static ChainName logSmurfsChain();

private:
    void resetFirewall(CommandList& commands) const;
    void createManagementIpset(CommandList& commands) const;

    void createIpsets(CommandList& commands, const std::map<std::string, IpSet>& ipsets,
                      const TableName& table, const GuestConfig* guest) const;
    void createIpfilterRules(CommandList& commands, uint32_t vmid, const IpSet& ipset) const;

    void createGroupChain(CommandList& commands, const TableName& table, const Group& group,
                          const std::string& name, Direction direction) const;
    void createClusterRules(CommandList& commands, Direction direction) const;
    void createHostRules(CommandList& commands, Direction direction) const;
    void createGuestChain(CommandList& commands, uint32_t vmid, Direction direction) const;
    void createGuestRules(CommandList& commands, const GuestConfig& guest, Direction direction) const;

    void setupCtHelper(CommandList& commands) const;
    void handleHostOptions(CommandList& commands) const;
    void handleGuestOptions(CommandList& commands, const GuestConfig& guest) const;

    /// Optional limit followed by an nflog statement, nothing for nolog
    void createLogRule(CommandList& commands, RuleLogLevel level, const ChainName& chain,
                       Verdict verdict, std::optional<uint32_t> vmid) const;

    void writeTunable(const std::string& name, const std::string& path, const std::string& value) const;

    FirewallConfig config_;
    HostAccess host_access_;
};

} // namespace nftfw
