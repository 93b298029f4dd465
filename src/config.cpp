#include "config.hpp"
#include "policy_types.hpp"
#include <stdexcept>

namespace nftfw {

bool DaemonConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string DaemonConfig::getErrorMessage() const {
    if (update_interval < kMinUpdateInterval || update_interval > kMaxUpdateInterval) {
        return "update_interval must be between " + std::to_string(kMinUpdateInterval) + "-" +
               std::to_string(kMaxUpdateInterval) + " seconds";
    }
    if (nft_binary.empty()) {
        return "nft_binary must not be empty";
    }
    if (force_disable_flag.empty()) {
        return "force_disable_flag must not be empty";
    }

    const std::pair<const char*, const std::string*> required[] = {
        {"cluster_config", &paths.cluster_config},
        {"host_config", &paths.host_config},
        {"guest_firewall_dir", &paths.guest_firewall_dir},
        {"guest_config_dir", &paths.guest_config_dir},
        {"vmlist", &paths.vmlist},
        {"sdn_firewall_dir", &paths.sdn_firewall_dir},
        {"sdn_running_config", &paths.sdn_running_config},
        {"ipam_state", &paths.ipam_state},
        {"conntrack_log_flag", &paths.conntrack_log_flag},
    };

    for (const auto& [key, value] : required) {
        if (value->empty()) {
            return std::string("paths.") + key + " must not be empty";
        }
    }

    return "";
}

} // namespace nftfw

// YAML conversion implementations
namespace YAML {

using namespace nftfw;

namespace {

void readString(const Node& node, const char* key, std::string& value) {
    if (node[key]) {
        value = node[key].as<std::string>();
    }
}

} // anonymous namespace

// LogLevel conversion
YAML::Node convert<LogLevel>::encode(const LogLevel& level) {
    return Node(Logger::levelToString(level));
}

bool convert<LogLevel>::decode(const Node& node, LogLevel& level) {
    if (!node.IsScalar()) return false;

    try {
        level = Logger::levelFromString(node.as<std::string>());
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

// LogStyle conversion
YAML::Node convert<LogStyle>::encode(const LogStyle& style) {
    switch (style) {
        case LogStyle::Systemd: return Node("systemd");
        case LogStyle::Default: return Node("default");
    }
    return Node("default");
}

bool convert<LogStyle>::decode(const Node& node, LogStyle& style) {
    if (!node.IsScalar()) return false;

    std::string value = toLower(node.as<std::string>());

    if (value == "default") {
        style = LogStyle::Default;
    } else if (value == "systemd") {
        style = LogStyle::Systemd;
    } else {
        return false;
    }
    return true;
}

// ConfigPaths conversion
YAML::Node convert<ConfigPaths>::encode(const ConfigPaths& paths) {
    Node node;
    node["cluster_config"] = paths.cluster_config;
    node["host_config"] = paths.host_config;
    node["guest_firewall_dir"] = paths.guest_firewall_dir;
    node["guest_config_dir"] = paths.guest_config_dir;
    node["vmlist"] = paths.vmlist;
    node["sdn_firewall_dir"] = paths.sdn_firewall_dir;
    node["sdn_running_config"] = paths.sdn_running_config;
    node["ipam_state"] = paths.ipam_state;
    node["conntrack_log_flag"] = paths.conntrack_log_flag;
    return node;
}

bool convert<ConfigPaths>::decode(const Node& node, ConfigPaths& paths) {
    if (!node.IsMap()) return false;

    readString(node, "cluster_config", paths.cluster_config);
    readString(node, "host_config", paths.host_config);
    readString(node, "guest_firewall_dir", paths.guest_firewall_dir);
    readString(node, "guest_config_dir", paths.guest_config_dir);
    readString(node, "vmlist", paths.vmlist);
    readString(node, "sdn_firewall_dir", paths.sdn_firewall_dir);
    readString(node, "sdn_running_config", paths.sdn_running_config);
    readString(node, "ipam_state", paths.ipam_state);
    readString(node, "conntrack_log_flag", paths.conntrack_log_flag);
    return true;
}

// DaemonConfig conversion
YAML::Node convert<DaemonConfig>::encode(const DaemonConfig& config) {
    Node node;
    node["log_level"] = config.log_level;
    node["log_style"] = config.log_style;
    node["update_interval"] = config.update_interval;
    node["nft_binary"] = config.nft_binary;
    node["force_disable_flag"] = config.force_disable_flag;
    node["paths"] = config.paths;
    return node;
}

bool convert<DaemonConfig>::decode(const Node& node, DaemonConfig& config) {
    if (node.IsNull()) {
        config = DaemonConfig();
        return true;
    }
    if (!node.IsMap()) return false;

    if (node["log_level"]) {
        config.log_level = node["log_level"].as<LogLevel>();
    }
    if (node["log_style"]) {
        config.log_style = node["log_style"].as<LogStyle>();
    }
    if (node["update_interval"]) {
        config.update_interval = node["update_interval"].as<int>();
    }
    readString(node, "nft_binary", config.nft_binary);
    readString(node, "force_disable_flag", config.force_disable_flag);
    if (node["paths"]) {
        config.paths = node["paths"].as<ConfigPaths>();
    }

    return true;
}

}  // namespace YAML
