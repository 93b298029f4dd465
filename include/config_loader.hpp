/**
 * @file config_loader.hpp
 * @brief Sources of the firewall policy inputs
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * A ConfigLoader hands out the raw documents one synchronization cycle is
 * computed from. A missing document is a normal outcome (std::nullopt);
 * every other failure throws.
 */

#pragma once

#include "guest_network.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct ConfigFile
 * @brief Content of one input document together with where it came from
 */
struct ConfigFile {
    std::string path;      ///< Location used in error messages
    std::string content;
};

/**
 * @struct ConfigPaths
 * @brief Filesystem locations of the policy inputs
 */
struct ConfigPaths {
    std::string cluster_config = "/etc/pve/firewall/cluster.fw";
    std::string host_config = "/etc/pve/local/host.fw";
    std::string guest_firewall_dir = "/etc/pve/firewall";
    std::string guest_config_dir = "/etc/pve/local";
    std::string vmlist = "/etc/pve/.vmlist";
    std::string sdn_firewall_dir = "/etc/pve/sdn/firewall";
    std::string sdn_running_config = "/etc/pve/sdn/.running-config";
    std::string ipam_state = "/etc/pve/priv/ipam.db";
    std::string conntrack_log_flag = "/var/lib/pve-firewall/log_nf_conntrack";
};

/**
 * @class ConfigLoader
 * @brief Interface for everything a FirewallConfig is built from
 */
class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    virtual std::optional<ConfigFile> cluster() const = 0;
    virtual std::optional<ConfigFile> host() const = 0;

    /// Registered guests of the whole cluster
    virtual GuestMap guestList() const = 0;

    /// Resource definition (qemu-server/lxc config) of a guest
    virtual std::optional<ConfigFile> guestConfig(uint32_t vmid, const GuestEntry& entry) const = 0;

    /// <vmid>.fw of a guest
    virtual std::optional<ConfigFile> guestFirewallConfig(uint32_t vmid) const = 0;

    /// Names of the SDN bridges (vnets) that carry a firewall file
    virtual std::vector<std::string> bridgeList() const = 0;
    virtual std::optional<ConfigFile> bridgeFirewallConfig(const std::string& bridge) const = 0;

    virtual std::optional<ConfigFile> sdnRunningConfig() const = 0;
    virtual std::optional<ConfigFile> ipamState() const = 0;

    /// Alternative interface name -> kernel interface name
    virtual std::map<std::string, std::string> interfaceMapping() const = 0;

    /// Node name guests are compared against to decide locality
    virtual std::string localNode() const = 0;
};

/**
 * @class FileConfigLoader
 * @brief Reads the inputs from the cluster filesystem
 */
class FileConfigLoader : public ConfigLoader {
public:
    explicit FileConfigLoader(ConfigPaths paths = ConfigPaths());

    /**
     * @brief Read a file
     * @return std::nullopt if the file does not exist
     * @throws std::runtime_error "unable to open configuration file at <path>: <reason>"
     */
    static std::optional<ConfigFile> readFile(const std::string& path);

    std::optional<ConfigFile> cluster() const override;
    std::optional<ConfigFile> host() const override;
    GuestMap guestList() const override;
    std::optional<ConfigFile> guestConfig(uint32_t vmid, const GuestEntry& entry) const override;
    std::optional<ConfigFile> guestFirewallConfig(uint32_t vmid) const override;
    std::vector<std::string> bridgeList() const override;
    std::optional<ConfigFile> bridgeFirewallConfig(const std::string& bridge) const override;
    std::optional<ConfigFile> sdnRunningConfig() const override;
    std::optional<ConfigFile> ipamState() const override;
    std::map<std::string, std::string> interfaceMapping() const override;
    std::string localNode() const override;

    const ConfigPaths& paths() const { return paths_; }

private:
    ConfigPaths paths_;
};

/**
 * @class MemoryConfigLoader
 * @brief Loader serving documents held in memory
 *
 * Every document starts out missing; the setters make it present.
 */
class MemoryConfigLoader : public ConfigLoader {
public:
    explicit MemoryConfigLoader(std::string node = "node1");

    void setCluster(const std::string& content);
    void setHost(const std::string& content);
    void addGuest(uint32_t vmid, GuestType type, const std::string& firewall_content,
                  const std::string& resource_content);
    /// Guest registered on another node
    void addRemoteGuest(uint32_t vmid, const std::string& node, GuestType type);
    /// Guest with a firewall file only
    void setGuestFirewallConfig(uint32_t vmid, GuestType type, const std::string& content);
    void addBridge(const std::string& bridge, const std::string& content);
    void setSdnRunningConfig(const std::string& content);
    void setIpamState(const std::string& content);
    void setInterfaceMapping(std::map<std::string, std::string> mapping);

    std::optional<ConfigFile> cluster() const override;
    std::optional<ConfigFile> host() const override;
    GuestMap guestList() const override;
    std::optional<ConfigFile> guestConfig(uint32_t vmid, const GuestEntry& entry) const override;
    std::optional<ConfigFile> guestFirewallConfig(uint32_t vmid) const override;
    std::vector<std::string> bridgeList() const override;
    std::optional<ConfigFile> bridgeFirewallConfig(const std::string& bridge) const override;
    std::optional<ConfigFile> sdnRunningConfig() const override;
    std::optional<ConfigFile> ipamState() const override;
    std::map<std::string, std::string> interfaceMapping() const override;
    std::string localNode() const override { return node_; }

private:
    std::string node_;
    std::optional<std::string> cluster_;
    std::optional<std::string> host_;
    std::map<uint32_t, GuestEntry> guests_;
    std::map<uint32_t, std::string> guest_firewall_;
    std::map<uint32_t, std::string> guest_resource_;
    std::map<std::string, std::string> bridges_;
    std::optional<std::string> sdn_running_config_;
    std::optional<std::string> ipam_state_;
    std::map<std::string, std::string> interface_mapping_;
};

} // namespace nftfw
