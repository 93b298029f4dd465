#include "config_loader.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nftfw {

namespace {

const std::string kComponent = "ConfigLoader";

std::optional<ConfigFile> memoryFile(const std::string& path, const std::optional<std::string>& content) {
    if (!content) {
        return std::nullopt;
    }
    return ConfigFile{path, *content};
}

} // anonymous namespace

// FileConfigLoader

FileConfigLoader::FileConfigLoader(ConfigPaths paths) : paths_(std::move(paths)) {}

std::optional<ConfigFile> FileConfigLoader::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        int error = errno;
        if (error == ENOENT) {
            Logger::info(kComponent, "config file does not exist: " + path);
            return std::nullopt;
        }
        throw std::runtime_error("unable to open configuration file at " + path + ": " +
                                 std::strerror(error));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("unable to read configuration file at " + path);
    }

    return ConfigFile{path, buffer.str()};
}

std::optional<ConfigFile> FileConfigLoader::cluster() const {
    Logger::info(kComponent, "loading cluster config");
    return readFile(paths_.cluster_config);
}

std::optional<ConfigFile> FileConfigLoader::host() const {
    Logger::info(kComponent, "loading host config");
    return readFile(paths_.host_config);
}

GuestMap FileConfigLoader::guestList() const {
    Logger::info(kComponent, "loading vmlist");

    std::optional<ConfigFile> file = readFile(paths_.vmlist);
    if (!file) {
        return GuestMap();
    }

    try {
        return GuestMap::fromJson(file->content);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(file->path + ": " + e.what());
    }
}

std::optional<ConfigFile> FileConfigLoader::guestConfig(uint32_t vmid, const GuestEntry& entry) const {
    Logger::info(kComponent, "loading guest #" + std::to_string(vmid) + " config");

    std::filesystem::path path = std::filesystem::path(paths_.guest_config_dir) /
                                 guestConfigFolder(entry.type) / (std::to_string(vmid) + ".conf");
    return readFile(path.string());
}

std::optional<ConfigFile> FileConfigLoader::guestFirewallConfig(uint32_t vmid) const {
    Logger::info(kComponent, "loading guest #" + std::to_string(vmid) + " firewall config");

    std::filesystem::path path = std::filesystem::path(paths_.guest_firewall_dir) /
                                 (std::to_string(vmid) + ".fw");
    return readFile(path.string());
}

std::vector<std::string> FileConfigLoader::bridgeList() const {
    std::vector<std::string> bridges;

    std::error_code ec;
    std::filesystem::directory_iterator it(paths_.sdn_firewall_dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return bridges;
        }
        throw std::runtime_error("unable to list " + paths_.sdn_firewall_dir + ": " + ec.message());
    }

    for (const auto& entry : it) {
        const std::filesystem::path& path = entry.path();
        if (entry.is_regular_file() && path.extension() == ".fw") {
            bridges.push_back(path.stem().string());
        }
    }

    std::sort(bridges.begin(), bridges.end());
    return bridges;
}

std::optional<ConfigFile> FileConfigLoader::bridgeFirewallConfig(const std::string& bridge) const {
    Logger::info(kComponent, "loading bridge " + bridge + " firewall config");

    std::filesystem::path path = std::filesystem::path(paths_.sdn_firewall_dir) / (bridge + ".fw");
    return readFile(path.string());
}

std::optional<ConfigFile> FileConfigLoader::sdnRunningConfig() const {
    Logger::info(kComponent, "loading SDN running config");
    return readFile(paths_.sdn_running_config);
}

std::optional<ConfigFile> FileConfigLoader::ipamState() const {
    Logger::info(kComponent, "loading IPAM config");
    return readFile(paths_.ipam_state);
}

std::map<std::string, std::string> FileConfigLoader::interfaceMapping() const {
    Logger::info(kComponent, "loading interface mapping");
    return SystemUtils::getInterfaceMapping();
}

std::string FileConfigLoader::localNode() const {
    return SystemUtils::getHostname();
}

// MemoryConfigLoader

MemoryConfigLoader::MemoryConfigLoader(std::string node) : node_(std::move(node)) {}

void MemoryConfigLoader::setCluster(const std::string& content) {
    cluster_ = content;
}

void MemoryConfigLoader::setHost(const std::string& content) {
    host_ = content;
}

void MemoryConfigLoader::addGuest(uint32_t vmid, GuestType type, const std::string& firewall_content,
                                  const std::string& resource_content) {
    guests_[vmid] = GuestEntry{node_, type};
    guest_firewall_[vmid] = firewall_content;
    guest_resource_[vmid] = resource_content;
}

void MemoryConfigLoader::addRemoteGuest(uint32_t vmid, const std::string& node, GuestType type) {
    guests_[vmid] = GuestEntry{node, type};
}

void MemoryConfigLoader::setGuestFirewallConfig(uint32_t vmid, GuestType type, const std::string& content) {
    guests_[vmid] = GuestEntry{node_, type};
    guest_firewall_[vmid] = content;
}

void MemoryConfigLoader::addBridge(const std::string& bridge, const std::string& content) {
    bridges_[bridge] = content;
}

void MemoryConfigLoader::setSdnRunningConfig(const std::string& content) {
    sdn_running_config_ = content;
}

void MemoryConfigLoader::setIpamState(const std::string& content) {
    ipam_state_ = content;
}

void MemoryConfigLoader::setInterfaceMapping(std::map<std::string, std::string> mapping) {
    interface_mapping_ = std::move(mapping);
}

std::optional<ConfigFile> MemoryConfigLoader::cluster() const {
    return memoryFile("memory:cluster.fw", cluster_);
}

std::optional<ConfigFile> MemoryConfigLoader::host() const {
    return memoryFile("memory:host.fw", host_);
}

GuestMap MemoryConfigLoader::guestList() const {
    return GuestMap(guests_);
}

std::optional<ConfigFile> MemoryConfigLoader::guestConfig(uint32_t vmid, const GuestEntry&) const {
    auto it = guest_resource_.find(vmid);
    if (it == guest_resource_.end()) {
        return std::nullopt;
    }
    return ConfigFile{"memory:" + std::to_string(vmid) + ".conf", it->second};
}

std::optional<ConfigFile> MemoryConfigLoader::guestFirewallConfig(uint32_t vmid) const {
    auto it = guest_firewall_.find(vmid);
    if (it == guest_firewall_.end()) {
        return std::nullopt;
    }
    return ConfigFile{"memory:" + std::to_string(vmid) + ".fw", it->second};
}

std::vector<std::string> MemoryConfigLoader::bridgeList() const {
    std::vector<std::string> names;
    for (const auto& [name, content] : bridges_) {
        names.push_back(name);
    }
    return names;
}

std::optional<ConfigFile> MemoryConfigLoader::bridgeFirewallConfig(const std::string& bridge) const {
    auto it = bridges_.find(bridge);
    if (it == bridges_.end()) {
        return std::nullopt;
    }
    return ConfigFile{"memory:" + bridge + ".fw", it->second};
}

std::optional<ConfigFile> MemoryConfigLoader::sdnRunningConfig() const {
    return memoryFile("memory:.running-config", sdn_running_config_);
}

std::optional<ConfigFile> MemoryConfigLoader::ipamState() const {
    return memoryFile("memory:ipam.db", ipam_state_);
}

std::map<std::string, std::string> MemoryConfigLoader::interfaceMapping() const {
    return interface_mapping_;
}

} // namespace nftfw
