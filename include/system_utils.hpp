/**
 * @file system_utils.hpp
 * @brief Host introspection helpers for nftables-firewall
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * This file contains the SystemUtils class: privilege checks, the node's
 * hostname and addresses, the kernel interface list and best effort writes
 * to kernel tunables.
 */

#pragma once

#include "address.hpp"
#include <map>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @class SystemUtils
 * @brief System utilities helper class
 *
 * All methods are static.
 */
class SystemUtils {
public:
    /**
     * @brief Check if the current process is running with root privileges
     * @return true if the effective user id is 0
     */
    static bool isRunningAsRoot();

    /**
     * @brief Get the name of the current system user
     * @return Username, "unknown" if it cannot be resolved
     */
    static std::string getCurrentUser();

    /**
     * @brief Short hostname of this node (up to the first dot)
     * @throws std::runtime_error if gethostname() fails
     */
    static std::string getHostname();

    /**
     * @brief Addresses the local hostname resolves to
     * @throws std::runtime_error if the hostname cannot be resolved
     */
    static std::vector<IpAddress> getHostAddresses();

    /**
     * @brief Address and prefix of every configured interface address
     * @throws std::runtime_error if the interface list cannot be read
     */
    static std::vector<Cidr> getInterfaceCidrs();

    /**
     * @brief Networks of the local interfaces that contain a host address
     *
     * The returned CIDRs have their host bits cleared.
     * @throws std::runtime_error as getHostAddresses() and getInterfaceCidrs()
     */
    static std::vector<Cidr> getManagementCidrs();

    /**
     * @brief Select management networks from already collected data
     */
    static std::vector<Cidr> selectManagementCidrs(const std::vector<IpAddress>& host_addresses,
                                                   const std::vector<Cidr>& interface_cidrs);

    /**
     * @brief Map alternative interface names to kernel names
     *
     * Runs "ip -details -json link show".
     * @throws std::runtime_error if the command fails or prints invalid JSON
     */
    static std::map<std::string, std::string> getInterfaceMapping();

    /**
     * @brief Parse the JSON link list printed by iproute2
     * @return altname -> ifname for every link with alternative names
     * @throws std::runtime_error on invalid JSON
     */
    static std::map<std::string, std::string> parseInterfaceMapping(const std::string& json);

    /**
     * @brief Write a value to a file such as a /proc/sys entry
     * @return false if the file could not be written; a warning is logged
     */
    static bool writeTunable(const std::string& path, const std::string& value);
};

} // namespace nftfw
