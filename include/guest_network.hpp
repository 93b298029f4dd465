/**
 * @file guest_network.hpp
 * @brief Guest inventory and guest network device configuration
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * The guest inventory lists every VM and container of the cluster with the
 * node it runs on. The resource config of a local guest provides its
 * network devices, which the guest firewall filters on.
 */

#pragma once

#include "address.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace nftfw {

/**
 * @enum GuestType
 * @brief Kind of guest; decides interface prefix and config directory
 */
enum class GuestType {
    Vm, ///< qemu, interfaces "tap<vmid>i<N>", configs in qemu-server/
    Ct  ///< lxc, interfaces "veth<vmid>i<N>", configs in lxc/
};

std::string guestIfacePrefix(GuestType type);
std::string guestConfigFolder(GuestType type);

enum class NetworkDeviceModel {
    VirtIO,
    Veth,
    E1000,
    Vmxnet3,
    RTL8139
};

/// @throws std::invalid_argument for unknown model names
NetworkDeviceModel parseNetworkDeviceModel(const std::string& text);

/**
 * @struct NetworkDevice
 * @brief One "netN:" line of a guest resource config
 */
struct NetworkDevice {
    NetworkDeviceModel model = NetworkDeviceModel::VirtIO;
    MacAddress mac_address;
    bool firewall = true;          ///< Device participates in the guest firewall
    std::optional<Cidr> ip;        ///< Static IPv4 address, absent for dhcp
    std::optional<Cidr> ip6;       ///< Static IPv6 address, absent for dhcp/auto

    /**
     * @brief Parse the comma separated "key=value" property string
     * @throws std::invalid_argument if model or MAC address is missing or
     *         any recognized value is malformed
     */
    static NetworkDevice parse(const std::string& text);
};

/**
 * @class NetworkConfig
 * @brief Network devices of one guest, keyed by device index (0..30)
 */
class NetworkConfig {
public:
    /**
     * @brief Parse the "netN:" lines of a resource config
     *
     * Parsing stops at the first "[" section (snapshots).
     * @throws std::invalid_argument on invalid keys or duplicate devices
     */
    static NetworkConfig parse(const std::string& content);

    /// "net3" -> 3. @throws std::invalid_argument
    static int indexFromNetKey(const std::string& key);

    const std::map<int, NetworkDevice>& devices() const { return devices_; }

private:
    std::map<int, NetworkDevice> devices_;
};

/**
 * @struct GuestEntry
 * @brief Inventory record of one guest
 */
struct GuestEntry {
    std::string node;
    GuestType type = GuestType::Vm;
};

/**
 * @class GuestMap
 * @brief Guest inventory parsed from the cluster's .vmlist JSON document
 */
class GuestMap {
public:
    GuestMap() = default;
    explicit GuestMap(std::map<uint32_t, GuestEntry> guests) : guests_(std::move(guests)) {}

    /// @throws std::runtime_error on malformed JSON or unknown guest types
    static GuestMap fromJson(const std::string& content);

    const std::map<uint32_t, GuestEntry>& guests() const { return guests_; }

private:
    std::map<uint32_t, GuestEntry> guests_;
};

} // namespace nftfw
