#include <iostream>
#include <string>
#include <filesystem>
#include "cli_parser.hpp"
#include "command_executor.hpp"
#include "config_loader.hpp"
#include "config_parser.hpp"
#include "firewall_daemon.hpp"
#include "logger.hpp"
#include "nft_client.hpp"
#include "skeleton.hpp"
#include "system_utils.hpp"

namespace {

const std::string kComponent = "main";

void applyLogSettings(const nftfw::DaemonConfig& settings, bool debug) {
    nftfw::Logger::setLevel(debug ? nftfw::LogLevel::Debug : settings.log_level);
    nftfw::Logger::setStyle(settings.log_style);
    nftfw::Logger::initStyleFromEnvironment();
}

int compile(const nftfw::DaemonConfig& settings) {
    nftfw::FileConfigLoader loader(settings.paths);
    nftfw::NftClient client(settings.nft_binary);
    nftfw::FirewallDaemon daemon(settings, loader, client);

    daemon.compile(std::cout);
    return 0;
}

int start(const nftfw::DaemonConfig& settings) {
    if (!nftfw::SystemUtils::isRunningAsRoot()) {
        std::cerr << "Error: the firewall daemon must run as root (current user: "
                  << nftfw::SystemUtils::getCurrentUser() << ")" << std::endl;
        return 1;
    }

    if (!nftfw::CommandExecutor::isAvailable(settings.nft_binary)) {
        std::cerr << "Error: " << settings.nft_binary << " not found in PATH" << std::endl;
        return 1;
    }

    nftfw::FileConfigLoader loader(settings.paths);
    nftfw::NftClient client(settings.nft_binary);
    nftfw::FirewallDaemon daemon(settings, loader, client);

    nftfw::FirewallDaemon::installSignalHandlers();
    nftfw::Logger::info(kComponent, "starting firewall daemon, update interval " +
                                        std::to_string(settings.update_interval) + "s");

    return daemon.run(nftfw::FirewallDaemon::stopFlag());
}

int localnet() {
    for (const auto& cidr : nftfw::SystemUtils::getManagementCidrs()) {
        std::cout << cidr.toString() << '\n';
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto options = nftfw::CLIParser::parse(argc, argv);

        if (options.command == nftfw::CLIParser::Command::Help) {
            nftfw::CLIParser::printUsage(argv[0]);
            return 0;
        }

        if (options.command == nftfw::CLIParser::Command::Skeleton) {
            std::cout << nftfw::Skeleton::script();
            return 0;
        }

        std::string config_file = options.config_file ? options.config_file->string() : "";
        nftfw::DaemonConfig settings = nftfw::ConfigParser::loadOrDefault(config_file);
        applyLogSettings(settings, options.debug);

        switch (options.command) {
            case nftfw::CLIParser::Command::Compile:
                return compile(settings);
            case nftfw::CLIParser::Command::Start:
                return start(settings);
            case nftfw::CLIParser::Command::Localnet:
                return localnet();
            default:
                break;
        }

        std::cerr << "Internal error: No valid command specified." << std::endl;
        nftfw::CLIParser::printUsage(argv[0]);
        return 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
