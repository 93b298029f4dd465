/**
 * @file config.hpp
 * @brief Daemon settings and their YAML serialization
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * The daemon settings decide how the firewall runs, not what it enforces:
 * log verbosity, update interval, the nft binary and the locations of the
 * policy inputs. The policy itself is read from the cluster filesystem
 * through the ConfigLoader.
 *
 * Every key is optional; an empty document yields the defaults.
 */

#pragma once

#include "config_loader.hpp"
#include "logger.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace nftfw {

/**
 * @struct DaemonConfig
 * @brief Root settings structure of nftables-firewall
 */
struct DaemonConfig {
    static constexpr int kMinUpdateInterval = 1;
    static constexpr int kMaxUpdateInterval = 3600;

    LogLevel log_level = LogLevel::Info;       ///< Verbosity, raised by --debug
    LogStyle log_style = LogStyle::Default;    ///< Line format
    int update_interval = 5;                   ///< Seconds between two synchronization cycles
    std::string nft_binary = "nft";            ///< nft executable, looked up in PATH
    std::string force_disable_flag = "/run/proxmox-nftables-firewall-force-disable";  ///< Pauses the loop while present
    ConfigPaths paths;                         ///< Locations of the policy inputs

    /**
     * @brief Validate the settings
     * @return true if the interval is in range and no name is empty
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid settings
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

}  // namespace nftfw

namespace YAML {

/**
 * @brief YAML conversion for LogLevel
 *
 * none, error, warning, info, debug
 */
template<>
struct convert<nftfw::LogLevel> {
    static Node encode(const nftfw::LogLevel& level);
    static bool decode(const Node& node, nftfw::LogLevel& level);
};

/**
 * @brief YAML conversion for LogStyle
 *
 * default, systemd
 */
template<>
struct convert<nftfw::LogStyle> {
    static Node encode(const nftfw::LogStyle& style);
    static bool decode(const Node& node, nftfw::LogStyle& style);
};

/**
 * @brief YAML conversion for the "paths" block
 *
 * Missing keys keep their default location.
 */
template<>
struct convert<nftfw::ConfigPaths> {
    static Node encode(const nftfw::ConfigPaths& paths);
    static bool decode(const Node& node, nftfw::ConfigPaths& paths);
};

template<>
struct convert<nftfw::DaemonConfig> {
    static Node encode(const nftfw::DaemonConfig& config);

    /**
     * @brief Decode the root document
     *
     * A null node (empty document) decodes to the defaults.
     */
    static bool decode(const Node& node, nftfw::DaemonConfig& config);
};

}  // namespace YAML
