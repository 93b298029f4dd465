#include "command_executor.hpp"
#include "nft_client.hpp"
#include "nft_command.hpp"
#include "nft_types.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace nftfw;

namespace {

const TableName kInet{TableFamily::Inet, "proxmox-firewall"};
const TableName kBridge{TableFamily::Bridge, "proxmox-firewall-guests"};

} // namespace

BOOST_AUTO_TEST_SUITE(nft_command)

BOOST_AUTO_TEST_CASE(tableFamilies) {
	BOOST_CHECK(parseTableFamily("bridge") == TableFamily::Bridge);
	BOOST_CHECK_EQUAL(tableFamilyToString(TableFamily::Netdev), "netdev");
	BOOST_CHECK_THROW(parseTableFamily("ipx"), std::invalid_argument);

	BOOST_CHECK(tableSupports(TableFamily::Inet, Family::V6));
	BOOST_CHECK(tableSupports(TableFamily::Arp, Family::V4));
	BOOST_CHECK(!tableSupports(TableFamily::Ip, Family::V6));
	BOOST_CHECK(!tableSupports(TableFamily::Ip6, Family::V4));
}

BOOST_AUTO_TEST_CASE(tableAndChainCommands) {
	Json::Value table = Command::deleteTable(kInet);
	BOOST_CHECK_EQUAL(table["delete"]["table"]["family"].asString(), "inet");
	BOOST_CHECK_EQUAL(table["delete"]["table"]["name"].asString(), "proxmox-firewall");

	Json::Value chain = Command::flushChain(ChainName{kBridge, "guest-100-in"});
	BOOST_CHECK_EQUAL(chain["flush"]["chain"]["family"].asString(), "bridge");
	BOOST_CHECK_EQUAL(chain["flush"]["chain"]["table"].asString(), "proxmox-firewall-guests");
	BOOST_CHECK_EQUAL(chain["flush"]["chain"]["name"].asString(), "guest-100-in");

	BOOST_CHECK(Command::listChains()["list"].isMember("chains"));
}

BOOST_AUTO_TEST_CASE(mapElements) {
	Json::Value verdict;
	verdict["goto"]["target"] = "guest-100-in";

	Json::Value command = Command::addMapElements(SetName{kBridge, "vm-map-in"},
	                                              {{Json::Value("tap100i0"), verdict}});
	const Json::Value& elem = command["add"]["element"]["elem"];

	BOOST_REQUIRE_EQUAL(elem.size(), 1u);
	BOOST_CHECK_EQUAL(elem[0][0].asString(), "tap100i0");
	BOOST_CHECK_EQUAL(elem[0][1]["goto"]["target"].asString(), "guest-100-in");
	BOOST_CHECK_EQUAL(command["add"]["element"]["name"].asString(), "vm-map-in");
}

BOOST_AUTO_TEST_CASE(commandListDocument) {
	CommandList commands;
	BOOST_CHECK(commands.empty());

	commands.append(Command::flushTable(kInet));
	commands.extend(CommandList({Command::deleteTable(kBridge)}));

	BOOST_CHECK_EQUAL(commands.size(), 2u);
	Json::Value document = commands.toJson();
	BOOST_REQUIRE(document["nftables"].isArray());
	BOOST_CHECK(document["nftables"][1].isMember("delete"));

	BOOST_CHECK_EQUAL(CommandList().toString(), "{\"nftables\":[]}");
	BOOST_CHECK_EQUAL(commands.toString().find('\n'), std::string::npos);
}

BOOST_AUTO_TEST_CASE(chainListingReply) {
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	std::string text = R"({"nftables": [
		{"metainfo": {"version": "1.0.6", "json_schema_version": 1}},
		{"chain": {"family": "inet", "table": "proxmox-firewall", "name": "group-web-in", "handle": 12}},
		{"chain": {"family": "inet", "table": "proxmox-firewall", "name": "input", "handle": 1,
		           "type": "filter", "hook": "input", "prio": -100, "policy": "accept"}},
		{"chain": {"family": "bridge", "table": "proxmox-firewall-guests", "name": "guest-100-in", "handle": 3}},
		{"chain": {"family": "bridge", "table": "proxmox-firewall", "name": "group-web-in", "handle": 4}},
		{"chain": {"family": "decnet", "table": "x", "name": "y"}}
	]})";
	Json::Value reply;
	std::string errors;
	BOOST_REQUIRE(reader->parse(text.data(), text.data() + text.size(), &reply, &errors));

	auto chains = ListChain::fromReply(reply);

	BOOST_CHECK_EQUAL(chains.size(), 4u);
	BOOST_CHECK_EQUAL(chains.count("group-web-in"), 2u);

	const ListChain& guest = chains.find("guest-100-in")->second;
	BOOST_CHECK(guest.family == TableFamily::Bridge);
	BOOST_CHECK_EQUAL(guest.table, "proxmox-firewall-guests");
	BOOST_CHECK(guest.handle == int64_t(3));
	BOOST_CHECK(!guest.isBaseChain());
	BOOST_CHECK(!guest.policy);

	const ListChain& input = chains.find("input")->second;
	BOOST_CHECK(input.isBaseChain());
	BOOST_CHECK(input.type == std::string("filter"));
	BOOST_CHECK(input.hook == std::string("input"));
	BOOST_CHECK(input.prio == int64_t(-100));
	BOOST_CHECK(input.policy == std::string("accept"));

	BOOST_CHECK(ListChain::fromReply(Json::Value()).empty());
}

BOOST_AUTO_TEST_CASE(memoryEngine) {
	MemoryNftEngine engine;

	BOOST_CHECK(engine.listChains().empty());
	BOOST_CHECK(engine.jsonBatches().empty());

	CommandList batch({Command::deleteTable(kInet)});
	BOOST_CHECK(!engine.runJsonCommands(batch));
	engine.runCommands("flush ruleset");

	BOOST_CHECK_EQUAL(engine.jsonBatches().size(), 1u);
	BOOST_REQUIRE_EQUAL(engine.scripts().size(), 1u);
	BOOST_CHECK_EQUAL(engine.scripts()[0], "flush ruleset");

	engine.failWith(NftError::Kind::Command, "Error: No such file or directory");
	try {
		engine.runJsonCommands(batch);
		BOOST_ERROR("expected NftError");
	} catch (const NftError& e) {
		BOOST_CHECK(e.kind() == NftError::Kind::Command);
		BOOST_CHECK_EQUAL(e.detail(), "Error: No such file or directory");
	}
	BOOST_CHECK_THROW(engine.listChains(), NftError);
}

BOOST_AUTO_TEST_CASE(missingBinaryIsIoError) {
	NftClient client("/nonexistent/nft");

	try {
		client.runCommands("list ruleset");
		BOOST_ERROR("expected NftError");
	} catch (const NftError& e) {
		BOOST_CHECK(e.kind() == NftError::Kind::Io);
	}
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(command_executor)

BOOST_AUTO_TEST_CASE(feedsStandardInput) {
	CommandResult result = CommandExecutor::execute({"cat"}, "{\"nftables\":[]}");

	BOOST_CHECK(result.isSuccess());
	BOOST_CHECK_EQUAL(result.stdout_output, "{\"nftables\":[]}");
	BOOST_CHECK(result.stderr_output.empty());
}

BOOST_AUTO_TEST_CASE(capturesErrorOutput) {
	CommandResult result = CommandExecutor::execute({"sh", "-c", "echo broken >&2; exit 3"});

	BOOST_CHECK(result.success);
	BOOST_CHECK_EQUAL(result.exit_code, 3);
	BOOST_CHECK_EQUAL(result.stderr_output, "broken\n");
	BOOST_CHECK(!result.getErrorMessage().empty());
}

BOOST_AUTO_TEST_CASE(emptyArguments) {
	CommandResult result = CommandExecutor::execute({});

	BOOST_CHECK(!result.success);
	BOOST_CHECK(!result.isSuccess());
}

BOOST_AUTO_TEST_CASE(programLookup) {
	BOOST_CHECK(CommandExecutor::isAvailable("sh"));
	BOOST_CHECK(!CommandExecutor::isAvailable("no-such-program-anywhere"));
	BOOST_CHECK(!CommandExecutor::isAvailable("/nonexistent/nft"));
}

BOOST_AUTO_TEST_SUITE_END()
