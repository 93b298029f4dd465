#include "rule.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <variant>

using namespace nftfw;

BOOST_AUTO_TEST_SUITE(rule_parse)

BOOST_AUTO_TEST_CASE(simpleAccept) {
	Rule rule = Rule::parse("IN ACCEPT");

	BOOST_CHECK(!rule.isGroup());
	BOOST_CHECK(!rule.isDisabled());
	BOOST_CHECK(rule.match().direction == Direction::In);
	BOOST_CHECK(rule.match().verdict == Verdict::Accept);
	BOOST_CHECK(!rule.match().proto);
	BOOST_CHECK(!rule.match().ip);
}

BOOST_AUTO_TEST_CASE(portsAndLog) {
	Rule rule = Rule::parse("IN ACCEPT -p udp -dport 33 -sport 22 -log warning");
	const RuleMatch& match = rule.match();

	BOOST_REQUIRE(match.proto);
	const auto* proto = std::get_if<PortProtocol>(&*match.proto);
	BOOST_REQUIRE(proto != nullptr);
	BOOST_CHECK_EQUAL(proto->name, "udp");
	BOOST_REQUIRE(proto->ports.dport);
	BOOST_CHECK_EQUAL(proto->ports.dport->toString(), "33");
	BOOST_REQUIRE(proto->ports.sport);
	BOOST_CHECK_EQUAL(proto->ports.sport->toString(), "22");
	BOOST_CHECK(match.log == RuleLogLevel::Warn);
}

BOOST_AUTO_TEST_CASE(macroWithVerdict) {
	Rule rule = Rule::parse("OUT SSH(DROP) -i net0");

	BOOST_REQUIRE(rule.match().fw_macro);
	BOOST_CHECK_EQUAL(*rule.match().fw_macro, "SSH");
	BOOST_CHECK(rule.match().verdict == Verdict::Drop);
	BOOST_CHECK(rule.match().direction == Direction::Out);
	BOOST_REQUIRE(rule.iface());
	BOOST_CHECK_EQUAL(*rule.iface(), "net0");
}

BOOST_AUTO_TEST_CASE(addressForms) {
	Rule rule = Rule::parse("IN ACCEPT --source dc/test --dest +dc/test");

	BOOST_REQUIRE(rule.match().ip);
	const IpMatch& ip = *rule.match().ip;
	BOOST_REQUIRE(ip.src());
	BOOST_REQUIRE(ip.dst());

	const auto* alias = std::get_if<AliasName>(&*ip.src());
	BOOST_REQUIRE(alias != nullptr);
	BOOST_CHECK(alias->scope() == ConfigScope::Datacenter);
	BOOST_CHECK_EQUAL(alias->name(), "test");

	const auto* set = std::get_if<IpsetName>(&*ip.dst());
	BOOST_REQUIRE(set != nullptr);
	BOOST_CHECK_EQUAL(set->toString(), "+dc/test");
}

BOOST_AUTO_TEST_CASE(literalAddressList) {
	Rule rule = Rule::parse("IN DROP -source 10.0.0.0/8,192.168.0.0/16");

	const auto* list = std::get_if<IpList>(&*rule.match().ip->src());
	BOOST_REQUIRE(list != nullptr);
	BOOST_CHECK(list->family() == Family::V4);
	BOOST_CHECK_EQUAL(list->entries().size(), 2u);
}

BOOST_AUTO_TEST_CASE(mixedFamiliesRejected) {
	BOOST_CHECK_THROW(Rule::parse("IN DROP -source 10.0.0.1 -dest fd00::1"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(icmpType) {
	Rule named = Rule::parse("IN ACCEPT -p icmp -icmp-type echo-request");
	const auto* icmp = std::get_if<IcmpMatch>(&*named.match().proto);
	BOOST_REQUIRE(icmp != nullptr);
	BOOST_CHECK(icmp->family == Family::V4);
	BOOST_REQUIRE(icmp->type);
	BOOST_CHECK_EQUAL(icmp->type->toString(), "echo-request");
	BOOST_CHECK(!icmp->code);

	Rule code = Rule::parse("IN ACCEPT -p icmpv6 -icmp-type no-route");
	const auto* icmp6 = std::get_if<IcmpMatch>(&*code.match().proto);
	BOOST_REQUIRE(icmp6 != nullptr);
	BOOST_CHECK(icmp6->family == Family::V6);
	BOOST_REQUIRE(icmp6->code);

	BOOST_CHECK_THROW(Rule::parse("IN ACCEPT -p icmp -icmp-type bogus"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN ACCEPT -p icmp -icmp-type 8 -dport 22"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(numericProtocol) {
	Rule rule = Rule::parse("IN ACCEPT -p 47");

	BOOST_CHECK(std::holds_alternative<NumericProtocol>(*rule.match().proto));

	Rule tcp = Rule::parse("IN ACCEPT -p 6 -dport 80");
	BOOST_CHECK(std::holds_alternative<PortProtocol>(*tcp.match().proto));
}

BOOST_AUTO_TEST_CASE(disabledWithComment) {
	Rule rule = Rule::parse("|IN ACCEPT -p tcp -dport 8006 # web interface");

	BOOST_CHECK(rule.isDisabled());
	BOOST_CHECK_EQUAL(rule.comment(), "web interface");
}

BOOST_AUTO_TEST_CASE(groupRule) {
	Rule rule = Rule::parse("GROUP webservers -i net1");

	BOOST_REQUIRE(rule.isGroup());
	BOOST_CHECK_EQUAL(rule.group().group, "webservers");
	BOOST_REQUIRE(rule.iface());
	BOOST_CHECK_EQUAL(*rule.iface(), "net1");

	BOOST_CHECK_THROW(Rule::parse("GROUP webservers -p tcp"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(malformedLines) {
	BOOST_CHECK_THROW(Rule::parse("SIDEWAYS ACCEPT"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN MAYBE"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN ACCEPT -unknown 1"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN ACCEPT -p tcp -p udp"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN ACCEPT -dport"), std::invalid_argument);
	BOOST_CHECK_THROW(Rule::parse("IN SSH(ACCEPT"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(logLevels) {
	BOOST_CHECK(nflogLevel(RuleLogLevel::Warn) == 4);
	BOOST_CHECK(nflogLevel(RuleLogLevel::Audit) == 7);
	BOOST_CHECK(!nflogLevel(RuleLogLevel::Nolog));
	BOOST_CHECK_THROW(parseRuleLogLevel("loud"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
