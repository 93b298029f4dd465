#include "cli_parser.hpp"
#include <iostream>
#include <stdexcept>
#include <getopt.h>

namespace nftfw {

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"debug",  no_argument,       0, 'd'},
        {"help",   no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // Restart the scan so parse can run more than once per process
    optind = 0;
    opterr = 0;

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "c:dh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.config_file = std::filesystem::path(optarg);
                break;
            case 'd':
                options.debug = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                if (optopt == 'c') {
                    throw std::invalid_argument("Option --config requires a file");
                }
                throw std::invalid_argument("Unknown option");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (optind + 1 < argc) {
        throw std::invalid_argument("Too many positional arguments");
    }

    if (optind < argc) {
        options.command = commandFromString(argv[optind]);
    } else if (!options.help) {
        throw std::invalid_argument("No command specified");
    }

    if (options.help) {
        options.command = Command::Help;
    }

    return options;
}

CLIParser::Command CLIParser::commandFromString(const std::string& name) {
    if (name == "help") return Command::Help;
    if (name == "skeleton") return Command::Skeleton;
    if (name == "compile") return Command::Compile;
    if (name == "start") return Command::Start;
    if (name == "localnet") return Command::Localnet;

    throw std::invalid_argument("Unknown command: " + name);
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] <COMMAND>\n\n";
    std::cout << "nftables based host and guest firewall\n\n";
    std::cout << "Commands:\n";
    std::cout << "  help           Show this help message\n";
    std::cout << "  skeleton       Print the fixed ruleset skeleton\n";
    std::cout << "  compile        Print the generated ruleset as JSON\n";
    std::cout << "  start          Keep the ruleset in sync with the configuration\n";
    std::cout << "  localnet       Print the detected management networks\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE  Daemon settings (default /etc/nftables-firewall/daemon.yaml)\n";
    std::cout << "  -d, --debug        Enable debug logging\n";
    std::cout << "  -h, --help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " compile            Show what would be applied\n";
    std::cout << "  " << program_name << " -d start           Run the daemon with debug output\n";
}

} // namespace nftfw
