#include "config_loader.hpp"
#include "firewall_config.hpp"
#include "macro_tables.hpp"
#include "nft_client.hpp"
#include "nft_expression.hpp"
#include "rule_compiler.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>

using namespace nftfw;

namespace {

const TableName kInet{TableFamily::Inet, "proxmox-firewall"};
const TableName kBridge{TableFamily::Bridge, "proxmox-firewall-guests"};

const std::string kCluster =
	"[OPTIONS]\nenable: 1\n\n"
	"[ALIASES]\ntest 10.0.0.0/8\n\n"
	"[IPSET test]\n10.1.0.0/16\n!10.1.2.0/24\n";

const std::string kGuestFirewall =
	"[OPTIONS]\nenable: 1\n\n"
	"[IPSET ipfilter-net0]\n10.0.0.5\nfd00::5\n";

const std::string kGuestResource =
	"net0: virtio=BC:24:11:AA:BB:CC,bridge=vmbr0,firewall=1\n";

FirewallConfig loadConfig() {
	MemoryConfigLoader loader;
	loader.setCluster(kCluster);
	loader.setHost("[OPTIONS]\nnftables: 1\n");
	loader.addGuest(100, GuestType::Vm, kGuestFirewall, kGuestResource);
	loader.setInterfaceMapping({{"enp1s0alt", "enp1s0"}});

	MemoryNftEngine engine;
	return FirewallConfig::load(loader, engine);
}

RuleEnv clusterEnv(const FirewallConfig& config, Direction direction = Direction::In) {
	return RuleEnv{ChainName{kInet, "cluster-" + directionToString(direction)}, direction, config, std::nullopt};
}

RuleEnv guestEnv(const FirewallConfig& config, Direction direction = Direction::In) {
	return RuleEnv{ChainName{kBridge, "guest-100-" + directionToString(direction)}, direction, config, 100u};
}

Json::Value terminalOf(const NftRule& rule) {
	return rule.terminal.back();
}

} // namespace

BOOST_AUTO_TEST_SUITE(rule_compiler)

BOOST_AUTO_TEST_CASE(unrestrictedRuleOncePerFamily) {
	FirewallConfig config = loadConfig();
	auto rules = RuleCompiler::compileRule(Rule::parse("IN ACCEPT"), clusterEnv(config));

	BOOST_REQUIRE_EQUAL(rules.size(), 2u);
	BOOST_CHECK(rules[0].family == Family::V4);
	BOOST_CHECK(rules[1].family == Family::V6);
	BOOST_CHECK(terminalOf(rules[0]) == Statement::accept());
	BOOST_CHECK(terminalOf(rules[1]) == Statement::accept());

	auto v4 = rules[0].allStatements();
	BOOST_REQUIRE_EQUAL(v4.size(), 2u);
	BOOST_CHECK_EQUAL(v4[0]["match"]["left"]["meta"]["key"].asString(), "nfproto");
	BOOST_CHECK_EQUAL(v4[0]["match"]["right"].asString(), "ipv4");
	BOOST_CHECK_EQUAL(rules[1].allStatements()[0]["match"]["right"].asString(), "ipv6");
}

BOOST_AUTO_TEST_CASE(singleFamilyTableNeedsNoMarker) {
	FirewallConfig config = loadConfig();
	RuleEnv env{ChainName{TableName{TableFamily::Ip6, "t"}, "c"}, Direction::In, config, std::nullopt};

	auto rules = RuleCompiler::compileRule(Rule::parse("IN DROP"), env);

	BOOST_REQUIRE_EQUAL(rules.size(), 1u);
	BOOST_CHECK(rules[0].family == Family::V6);
	BOOST_CHECK(rules[0].statements.empty());
}

BOOST_AUTO_TEST_CASE(otherDirectionAndDisabledSkipped) {
	FirewallConfig config = loadConfig();

	BOOST_CHECK(RuleCompiler::compileRule(Rule::parse("OUT ACCEPT"), clusterEnv(config)).empty());
	BOOST_CHECK(RuleCompiler::compileRule(Rule::parse("|IN ACCEPT"), clusterEnv(config)).empty());
}

BOOST_AUTO_TEST_CASE(guestPortsWithLog) {
	FirewallConfig config = loadConfig();
	RuleEnv env = guestEnv(config);
	Rule rule = Rule::parse("IN ACCEPT -p udp -dport 33 -sport 22 -log warning");

	auto candidates = RuleCompiler::candidates(rule, env);
	BOOST_REQUIRE_EQUAL(candidates.size(), 2u);

	auto rules = RuleCompiler::compileRule(rule, env);
	BOOST_REQUIRE_EQUAL(rules.size(), 4u);

	for (Family family : {Family::V4, Family::V6}) {
		const NftRule& log = rules[family == Family::V4 ? 0 : 1];
		const NftRule& verdict = rules[family == Family::V4 ? 2 : 3];

		BOOST_CHECK(log.family == family);
		BOOST_CHECK(verdict.family == family);

		BOOST_REQUIRE_EQUAL(log.terminal.size(), 2u);
		BOOST_CHECK(log.terminal[0] == Statement::limit(1, RateUnit::Second, 5));
		BOOST_CHECK_EQUAL(log.terminal[1]["log"]["prefix"].asString(), ":100:4:guest-100-in: ACCEPT: ");

		auto statements = verdict.allStatements();
		BOOST_REQUIRE_EQUAL(statements.size(), 5u);
		BOOST_CHECK_EQUAL(statements[0]["match"]["left"]["meta"]["key"].asString(), "protocol");
		BOOST_CHECK_EQUAL(statements[0]["match"]["right"].asString(), family == Family::V4 ? "ip" : "ip6");
		BOOST_CHECK(statements[1] == Statement::matchEq(Expression::meta("l4proto"), Json::Value("udp")));
		BOOST_CHECK(statements[2] == Statement::matchEq(Expression::payload("th", "sport"), Json::Value(22u)));
		BOOST_CHECK(statements[3] == Statement::matchEq(Expression::payload("th", "dport"), Json::Value(33u)));
		BOOST_CHECK(statements[4] == Statement::accept());
	}
}

BOOST_AUTO_TEST_CASE(macroMultipliesCandidates) {
	FirewallConfig config = loadConfig();
	RuleEnv env = clusterEnv(config);

	const FwMacro* dns = MacroTable::find("DNS");
	BOOST_REQUIRE(dns != nullptr);
	BOOST_CHECK_EQUAL(dns->code.size(), 2u);

	BOOST_CHECK_EQUAL(RuleCompiler::candidates(Rule::parse("IN DNS(ACCEPT)"), env).size(), 2u);
	BOOST_CHECK_EQUAL(RuleCompiler::candidates(Rule::parse("IN DNS(ACCEPT) -log info"), env).size(), 4u);
	BOOST_CHECK_EQUAL(RuleCompiler::compileRule(Rule::parse("IN DNS(ACCEPT)"), env).size(), 4u);

	auto ssh = RuleCompiler::candidates(Rule::parse("IN SSH(DROP)"), env);
	BOOST_REQUIRE_EQUAL(ssh.size(), 1u);
	BOOST_CHECK(ssh[0].statements[1] == Statement::matchEq(Expression::payload("th", "dport"), Json::Value(22u)));
}

BOOST_AUTO_TEST_CASE(unknownMacroFails) {
	FirewallConfig config = loadConfig();

	BOOST_CHECK_THROW(RuleCompiler::compileRule(Rule::parse("IN NoSuchMacro(ACCEPT)"), clusterEnv(config)),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(aliasAndSetPinToIpv4) {
	FirewallConfig config = loadConfig();
	auto rules = RuleCompiler::compileRule(Rule::parse("IN ACCEPT --source dc/test --dest +dc/test"),
	                                       clusterEnv(config));

	BOOST_REQUIRE_EQUAL(rules.size(), 1u);
	BOOST_CHECK(rules[0].family == Family::V4);

	auto statements = rules[0].allStatements();
	BOOST_REQUIRE_EQUAL(statements.size(), 4u);
	BOOST_CHECK(statements[0] == Statement::matchEq(Expression::payload("ip", "saddr"),
	                                                Expression::prefix(Cidr::parse("10.0.0.0/8"))));
	BOOST_CHECK(statements[1] == Statement::matchEq(Expression::payload("ip", "daddr"), Json::Value("@v4-dc/test")));
	BOOST_CHECK(statements[2] == Statement::matchNe(Expression::payload("ip", "daddr"),
	                                                Json::Value("@v4-dc/test-nomatch")));
	BOOST_CHECK(statements[3] == Statement::accept());
}

BOOST_AUTO_TEST_CASE(setReferenceSplitsFamilies) {
	FirewallConfig config = loadConfig();
	auto rules = RuleCompiler::compileRule(Rule::parse("IN DROP -dest +dc/test"), clusterEnv(config));

	BOOST_REQUIRE_EQUAL(rules.size(), 2u);
	BOOST_CHECK(rules[0].family == Family::V4);
	BOOST_CHECK(rules[1].family == Family::V6);
	BOOST_REQUIRE_EQUAL(rules[1].statements.size(), 2u);
	BOOST_CHECK_EQUAL(rules[1].statements[0]["match"]["right"].asString(), "@v6-dc/test");
	BOOST_CHECK_EQUAL(rules[1].statements[1]["match"]["op"].asString(), "!=");
}

BOOST_AUTO_TEST_CASE(guestSetOutsideGuestFails) {
	FirewallConfig config = loadConfig();

	BOOST_CHECK_THROW(RuleCompiler::compileRule(Rule::parse("IN DROP -dest +guest/web"), clusterEnv(config)),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(missingAliasFails) {
	FirewallConfig config = loadConfig();

	BOOST_CHECK_THROW(RuleCompiler::compileRule(Rule::parse("IN ACCEPT -source dc/unknown"), clusterEnv(config)),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(literalOfOtherFamilyDropped) {
	FirewallConfig config = loadConfig();
	RuleEnv v4only{ChainName{TableName{TableFamily::Ip, "t"}, "c"}, Direction::In, config, std::nullopt};

	BOOST_CHECK(RuleCompiler::compileRule(Rule::parse("IN ACCEPT -source fd00::/64"), v4only).empty());
	BOOST_CHECK_EQUAL(RuleCompiler::compileRule(Rule::parse("IN ACCEPT -source 10.0.0.0/8"), v4only).size(), 1u);
}

BOOST_AUTO_TEST_CASE(icmpPinsFamily) {
	FirewallConfig config = loadConfig();
	Rule ping = Rule::parse("IN ACCEPT -p icmp -icmp-type echo-request");

	auto rules = RuleCompiler::compileRule(ping, clusterEnv(config));
	BOOST_REQUIRE_EQUAL(rules.size(), 1u);
	BOOST_CHECK(rules[0].family == Family::V4);
	BOOST_CHECK(rules[0].statements[0] == Statement::matchEq(Expression::payload("icmp", "type"),
	                                                         Json::Value("echo-request")));

	RuleEnv v6only{ChainName{TableName{TableFamily::Ip6, "t"}, "c"}, Direction::In, config, std::nullopt};
	BOOST_CHECK(RuleCompiler::compileRule(ping, v6only).empty());

	auto bare = RuleCompiler::compileRule(Rule::parse("IN ACCEPT -p icmpv6"), clusterEnv(config));
	BOOST_REQUIRE_EQUAL(bare.size(), 1u);
	BOOST_CHECK(bare[0].statements[0] == Statement::matchEq(Expression::meta("l4proto"), Json::Value("icmpv6")));
}

BOOST_AUTO_TEST_CASE(interfaceKeysFollowContext) {
	FirewallConfig config = loadConfig();

	auto guest_in = RuleCompiler::candidates(Rule::parse("IN ACCEPT -i net0"), guestEnv(config));
	BOOST_REQUIRE_EQUAL(guest_in.size(), 1u);
	BOOST_CHECK(guest_in[0].statements[0] ==
	            Statement::matchEq(Expression::meta("oifname"), Json::Value("tap100i0")));

	auto guest_out = RuleCompiler::candidates(Rule::parse("OUT ACCEPT -i net0"), guestEnv(config, Direction::Out));
	BOOST_CHECK_EQUAL(guest_out[0].statements[0]["match"]["left"]["meta"]["key"].asString(), "iifname");

	auto host_in = RuleCompiler::candidates(Rule::parse("IN ACCEPT -i enp1s0alt"), clusterEnv(config));
	BOOST_CHECK(host_in[0].statements[0] ==
	            Statement::matchEq(Expression::meta("iifname"), Json::Value("enp1s0")));

	auto host_out = RuleCompiler::candidates(Rule::parse("OUT ACCEPT -i vmbr0"), clusterEnv(config, Direction::Out));
	BOOST_CHECK(host_out[0].statements[0] ==
	            Statement::matchEq(Expression::meta("oifname"), Json::Value("vmbr0")));
}

BOOST_AUTO_TEST_CASE(groupJump) {
	FirewallConfig config = loadConfig();

	auto rules = RuleCompiler::compileRule(Rule::parse("GROUP web -i vmbr0"), clusterEnv(config));
	BOOST_REQUIRE_EQUAL(rules.size(), 1u);
	BOOST_CHECK(!rules[0].family);
	BOOST_CHECK(terminalOf(rules[0]) == Statement::jump("group-web-in"));
	BOOST_CHECK_EQUAL(rules[0].statements.size(), 1u);

	RuleEnv forward{ChainName{kInet, "forward"}, Direction::Forward, config, std::nullopt};
	BOOST_CHECK(RuleCompiler::compileRule(Rule::parse("GROUP web -i vmbr0"), forward).empty());

	auto plain = RuleCompiler::compileRule(Rule::parse("GROUP web"), forward);
	BOOST_REQUIRE_EQUAL(plain.size(), 1u);
	BOOST_CHECK(terminalOf(plain[0]) == Statement::jump("group-web-forward"));
}

BOOST_AUTO_TEST_CASE(rejectVerdicts) {
	FirewallConfig config = loadConfig();

	BOOST_CHECK(RuleCompiler::generateVerdict(Verdict::Reject, guestEnv(config)) == Statement::drop());
	BOOST_CHECK(RuleCompiler::generateVerdict(Verdict::Reject, guestEnv(config, Direction::Out)) ==
	            Statement::jump("do-reject"));
	BOOST_CHECK(RuleCompiler::generateVerdict(Verdict::Reject, clusterEnv(config)) ==
	            Statement::jump("do-reject"));
	BOOST_CHECK(RuleCompiler::generateVerdict(Verdict::Drop, clusterEnv(config)) == Statement::drop());
}

BOOST_AUTO_TEST_CASE(familyMarkers) {
	BOOST_CHECK(RuleCompiler::familyMarker(TableFamily::Inet, Family::V6) ==
	            Statement::matchEq(Expression::meta("nfproto"), Json::Value("ipv6")));
	BOOST_CHECK(RuleCompiler::familyMarker(TableFamily::Bridge, Family::V4) ==
	            Statement::matchEq(Expression::meta("protocol"), Json::Value("ip")));
}

BOOST_AUTO_TEST_CASE(pinnedRulesSurviveOnlyInTheirFamily) {
	NftRule v6(Statement::accept());
	v6.family = Family::V6;
	NftRule unpinned(Statement::drop());

	auto expanded = RuleCompiler::expandFamilies({v6, unpinned}, TableFamily::Ip);

	BOOST_REQUIRE_EQUAL(expanded.size(), 1u);
	BOOST_CHECK(expanded[0].family == Family::V4);
	BOOST_CHECK(terminalOf(expanded[0]) == Statement::drop());
}

BOOST_AUTO_TEST_CASE(ctHelperBothFamilies) {
	FirewallConfig config = loadConfig();
	RuleEnv env{ChainName{kInet, "ct-in"}, Direction::In, config, std::nullopt};

	const CtHelperMacro* ftp = CtHelperTable::find("ftp");
	BOOST_REQUIRE(ftp != nullptr);
	BOOST_CHECK(!ftp->family());

	auto rules = RuleCompiler::compileCtHelper(*ftp, env);
	BOOST_REQUIRE_EQUAL(rules.size(), 6u);

	auto established = rules[0].allStatements();
	BOOST_REQUIRE_EQUAL(established.size(), 5u);
	BOOST_CHECK(established[1] == Statement::matchEq(Expression::meta("l4proto"), Json::Value("tcp")));
	BOOST_CHECK(established[2] == Statement::matchEq(Expression::payload("th", "dport"), Json::Value(21u)));
	BOOST_CHECK_EQUAL(established[3]["match"]["left"]["ct"]["key"].asString(), "state");
	BOOST_CHECK(established[4] == Statement::accept());

	BOOST_CHECK(terminalOf(rules[2]) == Statement::ctHelper("helper-ftp-tcp"));

	auto helper = rules[4].allStatements();
	BOOST_CHECK(helper[1] == Statement::matchEq(Expression::ct("helper"), Json::Value("ftp")));
}

BOOST_AUTO_TEST_CASE(ctHelperSingleFamily) {
	FirewallConfig config = loadConfig();
	RuleEnv env{ChainName{kInet, "ct-in"}, Direction::In, config, std::nullopt};

	const CtHelperMacro* snmp = CtHelperTable::find("snmp");
	BOOST_REQUIRE(snmp != nullptr);
	BOOST_CHECK(snmp->family() == Family::V4);

	auto rules = RuleCompiler::compileCtHelper(*snmp, env);
	BOOST_REQUIRE_EQUAL(rules.size(), 3u);
	for (const auto& rule : rules) {
		BOOST_CHECK(rule.family == Family::V4);
		BOOST_CHECK(rule.statements[0] == RuleCompiler::familyMarker(TableFamily::Inet, Family::V4));
	}
	BOOST_CHECK(rules[2].statements[1] ==
	            Statement::matchEq(Expression::ct("helper", Family::V4), Json::Value("snmp")));

	RuleEnv v6only{ChainName{TableName{TableFamily::Ip6, "t"}, "ct-in"}, Direction::In, config, std::nullopt};
	BOOST_CHECK(RuleCompiler::compileCtHelper(*snmp, v6only).empty());
}

BOOST_AUTO_TEST_CASE(ipfilterRules) {
	FirewallConfig config = loadConfig();
	const IpSet& filter = config.guests().at(100).ipsets().at("ipfilter-net0");

	auto in = RuleCompiler::compileIpfilter(filter, guestEnv(config));
	BOOST_REQUIRE_EQUAL(in.size(), 1u);
	BOOST_CHECK(in[0].family == Family::V4);
	BOOST_CHECK(in[0].statements[1] == Statement::matchNe(Expression::payload("arp", "daddr ip"),
	                                                      Json::Value("@v4-guest-100/ipfilter-net0")));

	auto out = RuleCompiler::compileIpfilter(filter, guestEnv(config, Direction::Out));
	BOOST_REQUIRE_EQUAL(out.size(), 5u);
	BOOST_CHECK(out[0].statements[1] == Statement::matchNe(Expression::payload("ip", "saddr"),
	                                                       Json::Value("@v4-guest-100/ipfilter-net0")));
	BOOST_CHECK(out[1].statements[1] == Statement::matchEq(Expression::payload("ip", "saddr"),
	                                                       Json::Value("@v4-guest-100/ipfilter-net0-nomatch")));
	BOOST_CHECK(out[2].family == Family::V6);
	BOOST_CHECK(out[4].statements[1] == Statement::matchNe(Expression::payload("arp", "saddr ip"),
	                                                       Json::Value("@v4-guest-100/ipfilter-net0")));
	for (const auto& rule : out) {
		BOOST_CHECK(terminalOf(rule) == Statement::drop());
		BOOST_CHECK(rule.statements[0] == Statement::matchEq(Expression::meta("iifname"), Json::Value("tap100i0")));
	}

	BOOST_CHECK_THROW(RuleCompiler::compileIpfilter(filter, clusterEnv(config)), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(addRuleCommand) {
	NftRule rule(Statement::accept());
	rule.statements.push_back(Statement::matchEq(Expression::meta("l4proto"), Json::Value("tcp")));

	Json::Value command = rule.toAddRule(ChainName{kInet, "host-in"});
	const Json::Value& body = command["add"]["rule"];

	BOOST_CHECK_EQUAL(body["family"].asString(), "inet");
	BOOST_CHECK_EQUAL(body["table"].asString(), "proxmox-firewall");
	BOOST_CHECK_EQUAL(body["chain"].asString(), "host-in");
	BOOST_REQUIRE_EQUAL(body["expr"].size(), 2u);
	BOOST_CHECK(body["expr"][1] == Statement::accept());
}

BOOST_AUTO_TEST_SUITE_END()
