#include "system_utils.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace nftfw;

BOOST_AUTO_TEST_SUITE(system_utils)

BOOST_AUTO_TEST_CASE(managementNetworksContainHostAddresses) {
	std::vector<IpAddress> host = {IpAddress::parse("192.168.1.20"), IpAddress::parse("fd00::20")};
	std::vector<Cidr> interfaces = {
		Cidr::parse("127.0.0.1/8"),
		Cidr::parse("192.168.1.20/24"),
		Cidr::parse("10.10.0.1/16"),
		Cidr::parse("fd00::20/64"),
	};

	auto management = SystemUtils::selectManagementCidrs(host, interfaces);

	BOOST_REQUIRE_EQUAL(management.size(), 2u);
	BOOST_CHECK_EQUAL(management[0].toString(), "192.168.1.0/24");
	BOOST_CHECK_EQUAL(management[1].toString(), "fd00::/64");

	BOOST_CHECK(SystemUtils::selectManagementCidrs({}, interfaces).empty());
}

BOOST_AUTO_TEST_CASE(interfaceAltnames) {
	auto mapping = SystemUtils::parseInterfaceMapping(R"([
		{"ifname": "lo"},
		{"ifname": "enp1s0", "altnames": ["enx0a1b2c3d4e5f", "wan0"]},
		{"ifname": "vmbr0", "altnames": []}
	])");

	BOOST_CHECK_EQUAL(mapping.size(), 2u);
	BOOST_CHECK_EQUAL(mapping["wan0"], "enp1s0");
	BOOST_CHECK_EQUAL(mapping["enx0a1b2c3d4e5f"], "enp1s0");

	BOOST_CHECK_THROW(SystemUtils::parseInterfaceMapping("{\"ifname\": \"lo\"}"), std::runtime_error);
	BOOST_CHECK_THROW(SystemUtils::parseInterfaceMapping("[{"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(writeTunable) {
	std::filesystem::path file = std::filesystem::temp_directory_path() /
	                             ("nftfw-tunable-" + std::to_string(getpid()));

	BOOST_REQUIRE(SystemUtils::writeTunable(file.string(), "262144"));

	std::ifstream in(file);
	std::string content;
	std::getline(in, content);
	std::filesystem::remove(file);

	BOOST_CHECK_EQUAL(content, "262144");
	BOOST_CHECK(!SystemUtils::writeTunable("/nonexistent/dir/nf_conntrack_max", "1"));
}

BOOST_AUTO_TEST_SUITE_END()
