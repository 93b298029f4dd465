#include "firewall_config.hpp"
#include "logger.hpp"
#include <memory>
#include <stdexcept>

namespace nftfw {

namespace {

const std::string kComponent = "FirewallConfig";

/// Run a parser and prefix any error with the document's path
template <typename Parser>
auto parseFile(const ConfigFile& file, Parser parser) -> decltype(parser(file.content)) {
    try {
        return parser(file.content);
    } catch (const std::exception& e) {
        throw std::runtime_error(file.path + ": " + e.what());
    }
}

Json::Value parseJsonDocument(const std::optional<ConfigFile>& file) {
    if (!file) {
        return Json::Value();
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const std::string& content = file->content;

    if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors)) {
        throw std::runtime_error(file->path + ": " + errors);
    }

    return root;
}

} // anonymous namespace

FirewallConfig FirewallConfig::load(const ConfigLoader& loader, NftEngine& engine) {
    FirewallConfig config;

    if (auto file = loader.cluster()) {
        config.cluster_ = parseFile(*file, [](const std::string& content) {
            return ClusterConfig::parse(content);
        });
    } else {
        Logger::info(kComponent, "no cluster config found, falling back to default");
    }

    if (auto file = loader.host()) {
        config.host_ = parseFile(*file, [](const std::string& content) {
            return HostConfig::parse(content);
        });
    } else {
        Logger::info(kComponent, "no host config found, falling back to default");
    }

    std::string node = loader.localNode();
    GuestMap guest_list = loader.guestList();
    for (const auto& [vmid, entry] : guest_list.guests()) {
        if (entry.node != node) {
            Logger::debug(kComponent, "guest #" + std::to_string(vmid) + " is not local, skipping");
            continue;
        }

        std::optional<ConfigFile> firewall_file = loader.guestFirewallConfig(vmid);
        if (!firewall_file) {
            continue;
        }

        Logger::debug(kComponent, "found firewall config for #" + std::to_string(vmid) +
                                      ", loading guest config");

        std::optional<ConfigFile> resource_file = loader.guestConfig(vmid, entry);
        if (!resource_file) {
            throw std::runtime_error("could not load guest config for #" + std::to_string(vmid));
        }

        const std::string& resource = resource_file->content;
        GuestType type = entry.type;
        uint32_t id = vmid;
        config.guests_.emplace(vmid, parseFile(*firewall_file, [&](const std::string& content) {
            return GuestConfig::parse(id, type, content, resource);
        }));
    }

    for (const auto& bridge : loader.bridgeList()) {
        if (auto file = loader.bridgeFirewallConfig(bridge)) {
            config.bridges_.emplace(bridge, parseFile(*file, [&](const std::string& content) {
                return BridgeConfig::parse(bridge, content);
            }));
        }
    }

    config.sdn_running_config_ = parseJsonDocument(loader.sdnRunningConfig());
    config.ipam_state_ = parseJsonDocument(loader.ipamState());
    config.interface_mapping_ = loader.interfaceMapping();
    config.nft_chains_ = engine.listChains();

    return config;
}

bool FirewallConfig::isEnabled() const {
    return cluster_.isEnabled() && host_.nftablesEnabled();
}

const Alias* FirewallConfig::alias(const AliasName& name, std::optional<uint32_t> vmid) const {
    if (name.scope() == ConfigScope::Datacenter) {
        return cluster_.alias(name.name());
    }

    if (vmid) {
        auto it = guests_.find(*vmid);
        if (it != guests_.end()) {
            return it->second.alias(name.name());
        }

        Logger::warn(kComponent, "trying to get alias " + name.toString() +
                                     " for non-existing guest: #" + std::to_string(*vmid));
    }

    return nullptr;
}

std::optional<std::string> FirewallConfig::interfaceMapping(const std::string& name) const {
    auto it = interface_mapping_.find(name);
    if (it == interface_mapping_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace nftfw
