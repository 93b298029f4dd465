/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for nftables-firewall
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nftfw {

/**
 * @class CLIParser
 * @brief Command line interface parser for nftables-firewall
 *
 * Uses getopt_long for the options; the single positional argument selects
 * the command.
 */
class CLIParser {
public:
    enum class Command {
        Help,      ///< Print usage
        Skeleton,  ///< Print the fixed part of the ruleset
        Compile,   ///< Print the generated batch as JSON
        Start,     ///< Run the synchronization loop
        Localnet   ///< Print the management networks
    };

    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        Command command = Command::Help;
        std::optional<std::filesystem::path> config_file; ///< Daemon settings YAML
        bool debug = false;         ///< Force debug logging
        bool help = false;          ///< Display help information
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @throws std::invalid_argument for unknown options, unknown commands or
     *         a missing command
     */
    static Options parse(int argc, char* argv[]);

    /// @throws std::invalid_argument for unknown command names
    static Command commandFromString(const std::string& name);

    static void printUsage(const std::string& program_name);
};

} // namespace nftfw
