#include "config_parser.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace nftfw {

namespace {

DaemonConfig validated(const YAML::Node& node) {
    // Empty documents keep every default
    if (node.IsNull()) {
        return DaemonConfig();
    }

    DaemonConfig config = node.as<DaemonConfig>();

    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }

    return config;
}

} // anonymous namespace

const std::string ConfigParser::kDefaultPath = "/etc/nftables-firewall/daemon.yaml";

DaemonConfig ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // LoadFile throws YAML::BadFile for unreadable files
        return validated(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error in " + filename + ": " + std::string(e.what()));
    }
}

DaemonConfig ConfigParser::loadOrDefault(const std::string& filename) {
    if (!filename.empty()) {
        return loadFromFile(filename);
    }

    std::error_code ec;
    if (!std::filesystem::exists(kDefaultPath, ec)) {
        return DaemonConfig();
    }

    return loadFromFile(kDefaultPath);
}

DaemonConfig ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        return validated(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

void ConfigParser::saveToFile(const DaemonConfig& config, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file for writing: " + filename);
    }

    YAML::Emitter emitter;
    emitter << YAML::convert<DaemonConfig>::encode(config);
    file << emitter.c_str() << '\n';

    if (!file) {
        throw std::runtime_error("Unable to write configuration to " + filename);
    }
}

} // namespace nftfw
