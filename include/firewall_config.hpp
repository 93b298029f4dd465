/**
 * @file firewall_config.hpp
 * @brief Snapshot of every firewall input for one synchronization cycle
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "config_loader.hpp"
#include "nft_client.hpp"
#include "nft_types.hpp"
#include "policy_config.hpp"
#include <json/json.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace nftfw {

/**
 * @class FirewallConfig
 * @brief Parsed cluster, host, guest and bridge configs plus live engine state
 *
 * Built from scratch every cycle and never modified afterwards.
 */
class FirewallConfig {
public:
    FirewallConfig() = default;

    /**
     * @brief Load and parse every input
     *
     * Only guests registered on the loader's local node that have a
     * firewall file are included.
     * @throws std::runtime_error on parse errors (prefixed with the file
     *         path), on a guest firewall file without resource config, and
     *         on loader failures
     * @throws NftError if the chain listing fails
     */
    static FirewallConfig load(const ConfigLoader& loader, NftEngine& engine);

    const ClusterConfig& cluster() const { return cluster_; }
    const HostConfig& host() const { return host_; }
    const std::map<uint32_t, GuestConfig>& guests() const { return guests_; }
    const std::map<std::string, BridgeConfig>& bridges() const { return bridges_; }

    /// Chains present in the engine when the cycle started
    const std::multimap<std::string, ListChain>& nftChains() const { return nft_chains_; }

    /// SDN running config document, null if absent
    const Json::Value& sdnRunningConfig() const { return sdn_running_config_; }

    /// IPAM state document, null if absent
    const Json::Value& ipamState() const { return ipam_state_; }

    /// Firewall is active: cluster enabled and host opted into nftables
    bool isEnabled() const;

    /**
     * @brief Resolve an alias reference
     *
     * Datacenter aliases come from the cluster config, guest aliases from
     * the config of the given guest. A guest alias without a known guest
     * logs a warning.
     * @return nullptr when not found
     */
    const Alias* alias(const AliasName& name, std::optional<uint32_t> vmid) const;

    /// Kernel name for an alternative interface name
    std::optional<std::string> interfaceMapping(const std::string& name) const;

private:
    ClusterConfig cluster_;
    HostConfig host_;
    std::map<uint32_t, GuestConfig> guests_;
    std::map<std::string, BridgeConfig> bridges_;
    std::multimap<std::string, ListChain> nft_chains_;
    std::map<std::string, std::string> interface_mapping_;
    Json::Value sdn_running_config_;
    Json::Value ipam_state_;
};

} // namespace nftfw
