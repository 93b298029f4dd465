#include "policy_config.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>

using namespace nftfw;

namespace {

const std::string kClusterConfig = R"(
[OPTIONS]
enable: 1
policy_in: DROP
log_ratelimit: enable=1,rate=10/minute,burst=20

[ALIASES]
test 10.0.0.0/8 # private network
local6 fd00::/64

[IPSET test] # test set
10.1.0.0/16
!10.1.2.0/24
dc/local6

[RULES]
IN ACCEPT -p tcp -dport 22
|OUT DROP

[group webservers] # web
IN HTTP(ACCEPT)
IN HTTPS(ACCEPT)
)";

const std::string kGuestResource = R"(
boot: order=scsi0
net0: virtio=BC:24:11:AA:BB:CC,bridge=vmbr0,firewall=1
net1: virtio=BC:24:11:DD:EE:FF,bridge=vmbr1,firewall=0
ipconfig0: ip=10.0.0.5/24

[snapshot]
net2: virtio=BC:24:11:00:00:01,bridge=vmbr0
)";

} // namespace

BOOST_AUTO_TEST_SUITE(policy_config)

BOOST_AUTO_TEST_CASE(clusterOptions) {
	ClusterConfig cluster = ClusterConfig::parse(kClusterConfig);

	BOOST_CHECK(cluster.isEnabled());
	BOOST_CHECK(cluster.defaultPolicy(Direction::In) == Verdict::Drop);
	BOOST_CHECK(cluster.defaultPolicy(Direction::Out) == Verdict::Accept);

	auto limit = cluster.logRateLimit();
	BOOST_REQUIRE(limit);
	BOOST_CHECK_EQUAL(limit->rate, 10);
	BOOST_CHECK(limit->per == RateUnit::Minute);
	BOOST_CHECK_EQUAL(limit->burst, 20);
}

BOOST_AUTO_TEST_CASE(clusterObjects) {
	ClusterConfig cluster = ClusterConfig::parse(kClusterConfig);

	BOOST_CHECK_EQUAL(cluster.aliases().size(), 2u);
	const Alias* alias = cluster.alias("test");
	BOOST_REQUIRE(alias != nullptr);
	BOOST_CHECK_EQUAL(alias->address.toString(), "10.0.0.0/8");
	BOOST_CHECK_EQUAL(alias->comment, "private network");

	BOOST_REQUIRE_EQUAL(cluster.ipsets().count("test"), 1u);
	const IpSet& set = cluster.ipsets().at("test");
	BOOST_CHECK_EQUAL(set.comment(), "test set");
	BOOST_REQUIRE_EQUAL(set.entries().size(), 3u);
	BOOST_CHECK(!set.entries()[0].nomatch);
	BOOST_CHECK(set.entries()[1].nomatch);
	BOOST_CHECK(std::holds_alternative<AliasName>(set.entries()[2].address));
	BOOST_CHECK(!set.kind().isDeviceFilter());

	BOOST_CHECK_EQUAL(cluster.rules().size(), 2u);
	BOOST_CHECK(cluster.rules()[1].isDisabled());

	BOOST_REQUIRE_EQUAL(cluster.groups().count("webservers"), 1u);
	BOOST_CHECK_EQUAL(cluster.groups().at("webservers").rules.size(), 2u);
	BOOST_CHECK_EQUAL(cluster.groups().at("webservers").comment, "web");
}

BOOST_AUTO_TEST_CASE(defaultLogRateLimit) {
	ClusterConfig cluster = ClusterConfig::parse("[OPTIONS]\nenable: 1\n");

	auto limit = cluster.logRateLimit();
	BOOST_REQUIRE(limit);
	BOOST_CHECK_EQUAL(limit->rate, 1);
	BOOST_CHECK(limit->per == RateUnit::Second);
	BOOST_CHECK_EQUAL(limit->burst, 5);

	ClusterConfig disabled = ClusterConfig::parse("[OPTIONS]\nlog_ratelimit: enable=0\n");
	BOOST_CHECK(!disabled.logRateLimit());
	BOOST_CHECK(!disabled.isEnabled());
}

BOOST_AUTO_TEST_CASE(errorsCarryLineNumber) {
	try {
		ClusterConfig::parse("[OPTIONS]\nenable: 1\n[RULES]\nIN MAYBE\n");
		BOOST_ERROR("expected a parse error");
	} catch (const std::runtime_error& e) {
		BOOST_CHECK_EQUAL(std::string(e.what()).compare(0, 7, "line 4:"), 0);
	}

	BOOST_CHECK_THROW(ClusterConfig::parse("enable: 1\n"), std::runtime_error);
	BOOST_CHECK_THROW(ClusterConfig::parse("[NOPE]\n"), std::runtime_error);
	BOOST_CHECK_THROW(ClusterConfig::parse("[OPTIONS]\nenable: maybe\n"), std::runtime_error);
	BOOST_CHECK_THROW(ClusterConfig::parse("[ALIASES]\na 10.0.0.1\na 10.0.0.2\n"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(hostOptions) {
	HostConfig host = HostConfig::parse(
		"[OPTIONS]\n"
		"nftables: 1\n"
		"tcpflags: 1\n"
		"protection_synflood: 1\n"
		"protection_synflood_rate: 300\n"
		"nf_conntrack_helpers: ftp, sip\n"
		"nf_conntrack_max: 262144\n"
		"log_level_in: info\n");

	BOOST_CHECK(host.isEnabled());
	BOOST_CHECK(host.nftablesEnabled());
	BOOST_CHECK(host.blockInvalidConntrack());
	BOOST_CHECK(host.options().tcpflags);
	BOOST_CHECK(host.options().nosmurfs);
	BOOST_CHECK(host.options().protection_synflood);
	BOOST_CHECK_EQUAL(host.options().protection_synflood_rate, 300);
	BOOST_CHECK_EQUAL(host.options().protection_synflood_burst, 1000);
	BOOST_REQUIRE_EQUAL(host.options().nf_conntrack_helpers.size(), 2u);
	BOOST_CHECK_EQUAL(host.options().nf_conntrack_helpers[1], "sip");
	BOOST_CHECK(host.options().nf_conntrack_max == int64_t(262144));
	BOOST_CHECK(!host.options().nf_conntrack_tcp_timeout_syn_recv);
	BOOST_CHECK(host.logLevel(Direction::In) == RuleLogLevel::Info);
	BOOST_CHECK(host.logLevel(Direction::Out) == RuleLogLevel::Nolog);
}

BOOST_AUTO_TEST_CASE(hostRejectsObjects) {
	BOOST_CHECK_THROW(HostConfig::parse("[ALIASES]\na 10.0.0.1\n"), std::runtime_error);
	BOOST_CHECK_THROW(HostConfig::parse("[group g]\nIN ACCEPT\n"), std::runtime_error);
	BOOST_CHECK_THROW(HostConfig::parse("[IPSET s]\n10.0.0.1\n"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(guestConfig) {
	GuestConfig guest = GuestConfig::parse(100, GuestType::Vm,
		"[OPTIONS]\nenable: 1\nipfilter: 1\npolicy_in: REJECT\n\n"
		"[IPSET ipfilter-net0]\n10.0.0.5\n\n"
		"[RULES]\nIN ACCEPT -i net0 -p tcp -dport 80\n",
		kGuestResource);

	BOOST_CHECK_EQUAL(guest.vmid(), 100u);
	BOOST_CHECK(guest.isEnabled());
	BOOST_CHECK(guest.options().ipfilter);
	BOOST_CHECK(guest.options().macfilter);
	BOOST_CHECK(guest.defaultPolicy(Direction::In) == Verdict::Reject);
	BOOST_CHECK(guest.defaultPolicy(Direction::Out) == Verdict::Accept);

	const IpSet& filter = guest.ipsets().at("ipfilter-net0");
	BOOST_CHECK(filter.kind().isDeviceFilter());
	BOOST_CHECK_EQUAL(filter.kind().device_index, 0);

	const auto& devices = guest.networkConfig().devices();
	BOOST_REQUIRE_EQUAL(devices.size(), 2u);
	BOOST_CHECK(devices.at(0).firewall);
	BOOST_CHECK(!devices.at(1).firewall);
	BOOST_CHECK_EQUAL(devices.at(0).mac_address.toString(), "BC:24:11:AA:BB:CC");

	BOOST_CHECK_EQUAL(guest.ifaceNameByKey("net1"), "tap100i1");
	BOOST_CHECK_THROW(guest.ifaceNameByKey("eth0"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(containerInterfaceNames) {
	GuestConfig guest = GuestConfig::parse(200, GuestType::Ct, "[OPTIONS]\nenable: 1\n",
		"net0: name=eth0,bridge=vmbr0,hwaddr=BC:24:11:01:02:03,ip=192.168.0.2/24,ip6=auto,type=veth\n");

	const NetworkDevice& device = guest.networkConfig().devices().at(0);
	BOOST_REQUIRE(device.ip);
	BOOST_CHECK_EQUAL(device.ip->toString(), "192.168.0.2/24");
	BOOST_CHECK(!device.ip6);
	BOOST_CHECK_EQUAL(guest.ifaceNameByIndex(0), "veth200i0");
}

BOOST_AUTO_TEST_CASE(guestRuleInterfaceMustBeDevice) {
	BOOST_CHECK_THROW(GuestConfig::parse(100, GuestType::Vm, "[RULES]\nIN ACCEPT -i eth0\n", ""),
	                  std::runtime_error);
	BOOST_CHECK_THROW(GuestConfig::parse(100, GuestType::Vm, "[group g]\nIN ACCEPT\n", ""),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(guestMap) {
	GuestMap map = GuestMap::fromJson(
		R"({"version":1,"ids":{"100":{"node":"node1","type":"qemu"},"101":{"node":"node2","type":"lxc"}}})");

	BOOST_REQUIRE_EQUAL(map.guests().size(), 2u);
	BOOST_CHECK_EQUAL(map.guests().at(100).node, "node1");
	BOOST_CHECK(map.guests().at(101).type == GuestType::Ct);

	BOOST_CHECK_THROW(GuestMap::fromJson(R"({"ids":{"100":{"node":"n","type":"vz"}}})"),
	                  std::runtime_error);
	BOOST_CHECK_THROW(GuestMap::fromJson("not json"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(guestMapRejectsOversizedVmid) {
	GuestMap largest = GuestMap::fromJson(R"({"ids":{"4294967295":{"node":"n","type":"qemu"}}})");
	BOOST_CHECK_EQUAL(largest.guests().count(4294967295u), 1u);

	BOOST_CHECK_THROW(GuestMap::fromJson(R"({"ids":{"4294967297":{"node":"n","type":"qemu"}}})"),
	                  std::runtime_error);
	BOOST_CHECK_THROW(GuestMap::fromJson(R"({"ids":{"-1":{"node":"n","type":"qemu"}}})"),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(bridgeConfig) {
	BridgeConfig bridge = BridgeConfig::parse("vnet0",
		"[OPTIONS]\nenable: 1\npolicy_forward: DROP\n\n[RULES]\nIN ACCEPT -p tcp\n");

	BOOST_CHECK_EQUAL(bridge.bridgeName(), "vnet0");
	BOOST_CHECK(bridge.isEnabled());
	BOOST_CHECK(bridge.options().policy_forward == Verdict::Drop);
	BOOST_CHECK_EQUAL(bridge.rules().size(), 1u);

	BOOST_CHECK_THROW(BridgeConfig::parse("vnet0", "[IPSET s]\n10.0.0.1\n"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
