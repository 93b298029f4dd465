#include "cli_parser.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nftfw;

namespace {

/// Owns a mutable argv for getopt
struct Arguments {
	explicit Arguments(std::vector<std::string> args) : storage(std::move(args)) {
		for (auto& arg : storage) {
			pointers.push_back(&arg[0]);
		}
		pointers.push_back(nullptr);
	}

	int argc() const { return static_cast<int>(storage.size()); }
	char** argv() { return pointers.data(); }

	std::vector<std::string> storage;
	std::vector<char*> pointers;
};

CLIParser::Options parse(std::vector<std::string> args) {
	Arguments arguments(std::move(args));
	return CLIParser::parse(arguments.argc(), arguments.argv());
}

} // namespace

BOOST_AUTO_TEST_SUITE(cli_parser)

BOOST_AUTO_TEST_CASE(commandOnly) {
	auto options = parse({"nftables-firewall", "compile"});

	BOOST_CHECK(options.command == CLIParser::Command::Compile);
	BOOST_CHECK(!options.debug);
	BOOST_CHECK(!options.config_file);
}

BOOST_AUTO_TEST_CASE(optionsBeforeCommand) {
	auto options = parse({"nftables-firewall", "-d", "--config", "/srv/daemon.yaml", "start"});

	BOOST_CHECK(options.command == CLIParser::Command::Start);
	BOOST_CHECK(options.debug);
	BOOST_REQUIRE(options.config_file);
	BOOST_CHECK_EQUAL(options.config_file->string(), "/srv/daemon.yaml");
}

BOOST_AUTO_TEST_CASE(helpWithoutCommand) {
	auto options = parse({"nftables-firewall", "--help"});

	BOOST_CHECK(options.help);
	BOOST_CHECK(options.command == CLIParser::Command::Help);

	BOOST_CHECK(parse({"nftables-firewall", "-h", "start"}).command == CLIParser::Command::Help);
}

BOOST_AUTO_TEST_CASE(commandNames) {
	BOOST_CHECK(CLIParser::commandFromString("skeleton") == CLIParser::Command::Skeleton);
	BOOST_CHECK(CLIParser::commandFromString("localnet") == CLIParser::Command::Localnet);
	BOOST_CHECK_THROW(CLIParser::commandFromString("Start"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(invalidArguments) {
	BOOST_CHECK_THROW(parse({"nftables-firewall"}), std::invalid_argument);
	BOOST_CHECK_THROW(parse({"nftables-firewall", "frobnicate"}), std::invalid_argument);
	BOOST_CHECK_THROW(parse({"nftables-firewall", "start", "compile"}), std::invalid_argument);
	BOOST_CHECK_THROW(parse({"nftables-firewall", "--bogus", "start"}), std::invalid_argument);
	BOOST_CHECK_THROW(parse({"nftables-firewall", "start", "-c"}), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
