#include "guest_network.hpp"
#include "logger.hpp"
#include "policy_types.hpp"
#include <json/json.h>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace nftfw {

std::string guestIfacePrefix(GuestType type) {
    return type == GuestType::Vm ? "tap" : "veth";
}

std::string guestConfigFolder(GuestType type) {
    return type == GuestType::Vm ? "qemu-server" : "lxc";
}

NetworkDeviceModel parseNetworkDeviceModel(const std::string& text) {
    if (text == "virtio") return NetworkDeviceModel::VirtIO;
    if (text == "e1000") return NetworkDeviceModel::E1000;
    if (text == "rtl8139") return NetworkDeviceModel::RTL8139;
    if (text == "vmxnet3") return NetworkDeviceModel::Vmxnet3;
    if (text == "veth") return NetworkDeviceModel::Veth;
    throw std::invalid_argument("invalid network device model: " + text);
}

NetworkDevice NetworkDevice::parse(const std::string& text) {
    NetworkDevice device;
    bool has_model = false;
    bool has_mac = false;

    std::istringstream stream(text);
    std::string property;

    while (std::getline(stream, property, ',')) {
        auto equals = property.find('=');
        if (equals == std::string::npos) {
            continue;
        }

        std::string key = trim(property.substr(0, equals));
        std::string value = trim(property.substr(equals + 1));

        if (key == "type" || key == "model") {
            device.model = parseNetworkDeviceModel(value);
            has_model = true;
        } else if (key == "hwaddr" || key == "macaddr") {
            device.mac_address = MacAddress::parse(value);
            has_mac = true;
        } else if (key == "firewall") {
            device.firewall = parseBool(value);
        } else if (key == "ip") {
            if (value == "dhcp") {
                continue;
            }
            Cidr ip = Cidr::parse(value);
            if (ip.family() != Family::V4) {
                throw std::invalid_argument("expected an IPv4 address for ip: " + value);
            }
            device.ip = ip;
        } else if (key == "ip6") {
            if (value == "dhcp" || value == "auto") {
                continue;
            }
            Cidr ip6 = Cidr::parse(value);
            if (ip6.family() != Family::V6) {
                throw std::invalid_argument("expected an IPv6 address for ip6: " + value);
            }
            device.ip6 = ip6;
        } else {
            // qemu writes the model as key: "virtio=AA:BB:CC:DD:EE:FF"
            try {
                device.model = parseNetworkDeviceModel(key);
            } catch (const std::invalid_argument&) {
                continue;
            }
            device.mac_address = MacAddress::parse(value);
            has_model = true;
            has_mac = true;
        }
    }

    if (!has_model || !has_mac) {
        throw std::invalid_argument("no valid network device detected in string " + text);
    }
    return device;
}

int NetworkConfig::indexFromNetKey(const std::string& key) {
    static const std::string prefix = "net";

    if (key.compare(0, prefix.size(), prefix) == 0) {
        std::string digits = key.substr(prefix.size());
        if (!digits.empty() && digits.size() <= 2 &&
            digits.find_first_not_of("0123456789") == std::string::npos) {
            int index = std::stoi(digits);
            if (index < 31) {
                return index;
            }
        }
    }

    throw std::invalid_argument("no index found in net key string: " + key);
}

NetworkConfig NetworkConfig::parse(const std::string& content) {
    NetworkConfig config;
    std::istringstream stream(content);
    std::string raw_line;

    while (std::getline(stream, raw_line)) {
        std::string line = trim(raw_line);

        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line[0] == '[') {
            break;
        }
        if (line.compare(0, 3, "net") != 0) {
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (key.empty() || value.empty()) {
            continue;
        }

        int index;
        try {
            index = indexFromNetKey(key);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument("encountered invalid net key in config: " + key);
        }

        Logger::debug("NetworkConfig", "parsing net config line: " + line);

        if (!config.devices_.emplace(index, NetworkDevice::parse(value)).second) {
            throw std::invalid_argument("Duplicated config key detected: " + key);
        }
    }

    return config;
}

GuestMap GuestMap::fromJson(const std::string& content) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors)) {
        throw std::runtime_error("failed to parse guest map: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("failed to parse guest map: expected a JSON object");
    }

    std::map<uint32_t, GuestEntry> guests;
    const Json::Value& ids = root["ids"];
    if (ids.isNull()) {
        return GuestMap(std::move(guests));
    }
    if (!ids.isObject()) {
        throw std::runtime_error("failed to parse guest map: 'ids' is not an object");
    }

    for (const auto& id : ids.getMemberNames()) {
        const Json::Value& entry = ids[id];
        if (!entry.isObject()) {
            throw std::runtime_error("failed to parse guest map: invalid entry for guest " + id);
        }

        int64_t number;
        try {
            number = parseInteger(id);
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("not a valid vmid: " + id);
        }
        if (number > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("not a valid vmid: " + id);
        }
        uint32_t vmid = static_cast<uint32_t>(number);

        GuestEntry guest;
        guest.node = entry["node"].asString();

        std::string type = entry["type"].asString();
        if (type == "qemu") {
            guest.type = GuestType::Vm;
        } else if (type == "lxc") {
            guest.type = GuestType::Ct;
        } else {
            throw std::runtime_error("unknown guest type '" + type + "' for guest " + id);
        }

        guests.emplace(vmid, guest);
    }

    return GuestMap(std::move(guests));
}

} // namespace nftfw
