/**
 * @file config_parser.hpp
 * @brief YAML parsing of the daemon settings
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "config.hpp"
#include <string>

namespace nftfw {

/**
 * @class ConfigParser
 * @brief Daemon settings loader and serializer
 *
 * Static methods over yaml-cpp; the YAML::convert specializations in
 * config.hpp do the field mapping.
 */
class ConfigParser {
public:
    /// Default settings location
    static const std::string kDefaultPath;

    /**
     * @brief Load settings from a YAML file
     * @param filename Path to the YAML settings file
     * @return Parsed and validated settings
     * @throws std::runtime_error if the file cannot be read, is not valid
     *         YAML or the settings are invalid
     */
    static DaemonConfig loadFromFile(const std::string& filename);

    /**
     * @brief Load settings from the default or given location
     *
     * A missing file at the default location yields the defaults; a
     * missing file that was named explicitly is an error.
     * @param filename Explicit path, empty for the default location
     */
    static DaemonConfig loadOrDefault(const std::string& filename);

    /**
     * @brief Load settings from a YAML string
     * @throws std::runtime_error if YAML or settings are invalid
     */
    static DaemonConfig loadFromString(const std::string& yaml_content);

    /**
     * @brief Save settings to a YAML file
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const DaemonConfig& config, const std::string& filename);
};

} // namespace nftfw
