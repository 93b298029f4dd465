#include "system_utils.hpp"
#include "command_executor.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ifaddrs.h>
#include <json/json.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <pwd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace nftfw {

namespace {

const std::string kComponent = "SystemUtils";

uint8_t countMaskBits(const uint8_t* bytes, size_t length) {
    uint8_t bits = 0;
    for (size_t i = 0; i < length; ++i) {
        bits += static_cast<uint8_t>(__builtin_popcount(bytes[i]));
    }
    return bits;
}

IpAddress fromSockaddr(const sockaddr* address) {
    std::array<uint8_t, 16> bytes{};
    if (address->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(address);
        std::memcpy(bytes.data(), &in->sin_addr, 4);
        return IpAddress(Family::V4, bytes);
    }

    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(address);
    std::memcpy(bytes.data(), &in6->sin6_addr, 16);
    return IpAddress(Family::V6, bytes);
}

} // anonymous namespace

bool SystemUtils::isRunningAsRoot() {
    return geteuid() == 0;
}

std::string SystemUtils::getCurrentUser() {
    struct passwd* pw = getpwuid(getuid());
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::string SystemUtils::getHostname() {
    std::array<char, 256> buffer{};
    if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
        throw std::runtime_error(std::string("unable to read hostname: ") + std::strerror(errno));
    }

    std::string hostname(buffer.data());
    return hostname.substr(0, hostname.find('.'));
}

std::vector<IpAddress> SystemUtils::getHostAddresses() {
    std::string hostname = getHostname();
    Logger::debug(kComponent, "resolving hostname " + hostname);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &raw);
    if (rc != 0) {
        throw std::runtime_error("unable to resolve local hostname " + hostname + ": " +
                                 gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> result(raw, freeaddrinfo);

    std::vector<IpAddress> addresses;
    for (const addrinfo* entry = result.get(); entry != nullptr; entry = entry->ai_next) {
        if (entry->ai_family == AF_INET || entry->ai_family == AF_INET6) {
            IpAddress address = fromSockaddr(entry->ai_addr);
            bool known = false;
            for (const auto& existing : addresses) {
                known = known || existing == address;
            }
            if (!known) {
                addresses.push_back(address);
            }
        }
    }

    return addresses;
}

std::vector<Cidr> SystemUtils::getInterfaceCidrs() {
    Logger::debug(kComponent, "reading networking interface list");

    ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) {
        throw std::runtime_error(std::string("unable to query network interfaces: ") +
                                 std::strerror(errno));
    }
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> interfaces(raw, freeifaddrs);

    std::vector<Cidr> cidrs;
    for (const ifaddrs* entry = interfaces.get(); entry != nullptr; entry = entry->ifa_next) {
        if (entry->ifa_addr == nullptr || entry->ifa_netmask == nullptr) {
            continue;
        }

        sa_family_t family = entry->ifa_addr->sa_family;
        if (family != entry->ifa_netmask->sa_family) {
            continue;
        }

        if (family == AF_INET) {
            const auto* mask = reinterpret_cast<const sockaddr_in*>(entry->ifa_netmask);
            uint8_t bits = countMaskBits(reinterpret_cast<const uint8_t*>(&mask->sin_addr), 4);
            cidrs.emplace_back(fromSockaddr(entry->ifa_addr), bits);
        } else if (family == AF_INET6) {
            const auto* mask = reinterpret_cast<const sockaddr_in6*>(entry->ifa_netmask);
            uint8_t bits = countMaskBits(reinterpret_cast<const uint8_t*>(&mask->sin6_addr), 16);
            cidrs.emplace_back(fromSockaddr(entry->ifa_addr), bits);
        }
    }

    return cidrs;
}

std::vector<Cidr> SystemUtils::getManagementCidrs() {
    return selectManagementCidrs(getHostAddresses(), getInterfaceCidrs());
}

std::vector<Cidr> SystemUtils::selectManagementCidrs(const std::vector<IpAddress>& host_addresses,
                                                     const std::vector<Cidr>& interface_cidrs) {
    std::vector<Cidr> management;

    for (const auto& address : host_addresses) {
        for (const auto& cidr : interface_cidrs) {
            if (cidr.contains(address)) {
                management.push_back(cidr.network());
            }
        }
    }

    return management;
}

std::map<std::string, std::string> SystemUtils::getInterfaceMapping() {
    CommandResult result = CommandExecutor::execute({"ip", "-details", "-json", "link", "show"});
    if (!result.isSuccess()) {
        throw std::runtime_error("unable to read interface list: " + result.getErrorMessage());
    }

    return parseInterfaceMapping(result.stdout_output);
}

std::map<std::string, std::string> SystemUtils::parseInterfaceMapping(const std::string& json) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw std::runtime_error("invalid interface list: " + errors);
    }
    if (!root.isArray()) {
        throw std::runtime_error("invalid interface list: expected an array");
    }

    std::map<std::string, std::string> mapping;
    for (const auto& link : root) {
        const Json::Value& altnames = link["altnames"];
        if (!altnames.isArray()) {
            continue;
        }

        std::string ifname = link["ifname"].asString();
        for (const auto& altname : altnames) {
            mapping[altname.asString()] = ifname;
        }
    }

    return mapping;
}

bool SystemUtils::writeTunable(const std::string& path, const std::string& value) {
    std::ofstream file(path);
    if (!file) {
        Logger::warn(kComponent, "cannot set " + path);
        return false;
    }

    file << value;
    file.flush();
    if (!file) {
        Logger::warn(kComponent, "cannot set " + path);
        return false;
    }

    return true;
}

} // namespace nftfw
