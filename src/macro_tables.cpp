#include "macro_tables.hpp"
#include "logger.hpp"
#include <json/json.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace nftfw {

namespace {

const char* const kMacrosJson = R"JSON({
  "Amanda": {"desc": "Amanda Backup", "code": [{"proto": "udp", "dport": "10080"}, {"proto": "tcp", "dport": "10080"}]},
  "Auth": {"desc": "Auth (identd) traffic", "code": [{"proto": "tcp", "dport": "113"}]},
  "BGP": {"desc": "Border Gateway Protocol traffic", "code": [{"proto": "tcp", "dport": "179"}]},
  "BitTorrent": {"desc": "BitTorrent traffic for BitTorrent 3.1 and earlier", "code": [{"proto": "tcp", "dport": "6881:6889"}, {"proto": "udp", "dport": "6881"}]},
  "BitTorrent32": {"desc": "BitTorrent traffic for BitTorrent 3.2 and later", "code": [{"proto": "tcp", "dport": "6881:6999"}, {"proto": "udp", "dport": "6881"}]},
  "CVS": {"desc": "Concurrent Versions System pserver traffic", "code": [{"proto": "tcp", "dport": "2401"}]},
  "Ceph": {"desc": "Ceph Storage Cluster traffic", "code": [{"proto": "tcp", "dport": "6789"}, {"proto": "tcp", "dport": "3300"}, {"proto": "tcp", "dport": "6800:7300"}]},
  "Citrix": {"desc": "Citrix/ICA traffic", "code": [{"proto": "tcp", "dport": "1494"}, {"proto": "udp", "dport": "1604"}, {"proto": "tcp", "dport": "2598"}]},
  "DAAP": {"desc": "Digital Audio Access Protocol traffic", "code": [{"proto": "tcp", "dport": "3689"}, {"proto": "udp", "dport": "3689"}]},
  "DHCPfwd": {"desc": "Forwarded DHCP traffic", "code": [{"proto": "udp", "sport": "67:68", "dport": "67:68"}]},
  "DHCPv6": {"desc": "DHCPv6 traffic", "code": [{"proto": "udp", "sport": "546:547", "dport": "546:547"}]},
  "DNS": {"desc": "Domain Name System traffic (upd and tcp)", "code": [{"proto": "udp", "dport": "53"}, {"proto": "tcp", "dport": "53"}]},
  "Distcc": {"desc": "Distributed Compiler service", "code": [{"proto": "tcp", "dport": "3632"}]},
  "FTP": {"desc": "File Transfer Protocol", "code": [{"proto": "tcp", "dport": "21"}]},
  "Finger": {"desc": "Finger protocol (RFC 742)", "code": [{"proto": "tcp", "dport": "79"}]},
  "GRE": {"desc": "Generic Routing Encapsulation tunneling protocol", "code": [{"proto": "47"}]},
  "Git": {"desc": "Git distributed revision control traffic", "code": [{"proto": "tcp", "dport": "9418"}]},
  "HKP": {"desc": "OpenPGP HTTP key server protocol traffic", "code": [{"proto": "tcp", "dport": "11371"}]},
  "HTTP": {"desc": "Hypertext Transfer Protocol (WWW)", "code": [{"proto": "tcp", "dport": "80"}]},
  "HTTPS": {"desc": "Hypertext Transfer Protocol (WWW) over SSL", "code": [{"proto": "tcp", "dport": "443"}]},
  "IMAP": {"desc": "Internet Message Access Protocol", "code": [{"proto": "tcp", "dport": "143"}]},
  "IMAPS": {"desc": "Internet Message Access Protocol over SSL", "code": [{"proto": "tcp", "dport": "993"}]},
  "IPIP": {"desc": "IPIP capsulation traffic", "code": [{"proto": "94"}]},
  "IPsec": {"desc": "IPsec traffic", "code": [{"proto": "udp", "sport": "500", "dport": "500"}, {"proto": "50"}]},
  "IPsecah": {"desc": "IPsec authentication (AH) traffic", "code": [{"proto": "udp", "sport": "500", "dport": "500"}, {"proto": "51"}]},
  "IPsecnat": {"desc": "IPsec traffic and Nat-Traversal", "code": [{"proto": "udp", "dport": "500"}, {"proto": "udp", "dport": "4500"}, {"proto": "50"}]},
  "IRC": {"desc": "Internet Relay Chat traffic", "code": [{"proto": "tcp", "dport": "6667"}]},
  "Jetdirect": {"desc": "HP Jetdirect printing", "code": [{"proto": "tcp", "dport": "9100"}]},
  "L2TP": {"desc": "Layer 2 Tunneling Protocol traffic", "code": [{"proto": "udp", "dport": "1701"}]},
  "LDAP": {"desc": "Lightweight Directory Access Protocol traffic", "code": [{"proto": "tcp", "dport": "389"}]},
  "LDAPS": {"desc": "Secure Lightweight Directory Access Protocol traffic", "code": [{"proto": "tcp", "dport": "636"}]},
  "MDNS": {"desc": "Multicast DNS", "code": [{"proto": "udp", "dport": "5353"}]},
  "MSNP": {"desc": "Microsoft Notification Protocol", "code": [{"proto": "tcp", "dport": "1863"}]},
  "MSSQL": {"desc": "Microsoft SQL Server", "code": [{"proto": "tcp", "dport": "1433"}]},
  "Mail": {"desc": "Mail traffic (SMTP, SMTPS, Submission)", "code": [{"proto": "tcp", "dport": "25"}, {"proto": "tcp", "dport": "465"}, {"proto": "tcp", "dport": "587"}]},
  "Munin": {"desc": "Munin networked resource monitoring traffic", "code": [{"proto": "tcp", "dport": "4949"}]},
  "MySQL": {"desc": "MySQL server", "code": [{"proto": "tcp", "dport": "3306"}]},
  "NNTP": {"desc": "NNTP traffic (Usenet).", "code": [{"proto": "tcp", "dport": "119"}]},
  "NNTPS": {"desc": "Encrypted NNTP traffic (Usenet)", "code": [{"proto": "tcp", "dport": "563"}]},
  "NTP": {"desc": "Network Time Protocol (ntpd)", "code": [{"proto": "udp", "dport": "123"}]},
  "NeighborDiscovery": {"desc": "IPv6 neighbor solicitation, neighbor and router advertisement", "code": [
      {"proto": "icmpv6", "icmp-type": "nd-router-solicit"},
      {"proto": "icmpv6", "icmp-type": "nd-router-advert"},
      {"proto": "icmpv6", "icmp-type": "nd-neighbor-solicit"},
      {"proto": "icmpv6", "icmp-type": "nd-neighbor-advert"}]},
  "OSPF": {"desc": "OSPF multicast traffic", "code": [{"proto": "89"}]},
  "OpenVPN": {"desc": "OpenVPN traffic", "code": [{"proto": "udp", "dport": "1194"}]},
  "PCA": {"desc": "Symantec PCAnywere (tm)", "code": [{"proto": "udp", "dport": "5632"}, {"proto": "tcp", "dport": "5631"}]},
  "POP3": {"desc": "POP3 traffic", "code": [{"proto": "tcp", "dport": "110"}]},
  "POP3S": {"desc": "Encrypted POP3 traffic", "code": [{"proto": "tcp", "dport": "995"}]},
  "PPtP": {"desc": "Point-to-Point Tunneling Protocol", "code": [{"proto": "47"}, {"proto": "tcp", "dport": "1723"}]},
  "Ping": {"desc": "ICMP echo request", "code": [{"proto": "icmp", "icmp-type": "echo-request"}]},
  "PostgreSQL": {"desc": "PostgreSQL server", "code": [{"proto": "tcp", "dport": "5432"}]},
  "Printer": {"desc": "Line Printer protocol printing", "code": [{"proto": "tcp", "dport": "515"}]},
  "RDP": {"desc": "Microsoft Remote Desktop Protocol traffic", "code": [{"proto": "tcp", "dport": "3389"}]},
  "RIP": {"desc": "Routing Information Protocol (bidirectional)", "code": [{"proto": "udp", "dport": "520"}]},
  "RNDC": {"desc": "BIND remote management protocol", "code": [{"proto": "tcp", "dport": "953"}]},
  "Razor": {"desc": "Razor Antispam System", "code": [{"proto": "tcp", "dport": "2703"}]},
  "Rdate": {"desc": "Remote time retrieval (rdate)", "code": [{"proto": "tcp", "dport": "37"}]},
  "Rsync": {"desc": "Rsync server", "code": [{"proto": "tcp", "dport": "873"}]},
  "SANE": {"desc": "SANE network scanning", "code": [{"proto": "tcp", "dport": "6566"}]},
  "SMB": {"desc": "Microsoft SMB traffic", "code": [
      {"proto": "udp", "dport": "135,445"},
      {"proto": "udp", "dport": "137:139"},
      {"proto": "udp", "sport": "137", "dport": "1024:65535"},
      {"proto": "tcp", "dport": "135,139,445"}]},
  "SMBswat": {"desc": "Samba Web Administration Tool", "code": [{"proto": "tcp", "dport": "901"}]},
  "SMTP": {"desc": "Simple Mail Transfer Protocol", "code": [{"proto": "tcp", "dport": "25"}]},
  "SMTPS": {"desc": "Encrypted Simple Mail Transfer Protocol", "code": [{"proto": "tcp", "dport": "465"}]},
  "SNMP": {"desc": "Simple Network Management Protocol", "code": [{"proto": "udp", "dport": "161:162"}, {"proto": "tcp", "dport": "161"}]},
  "SPAMD": {"desc": "Spam Assassin SPAMD traffic", "code": [{"proto": "tcp", "dport": "783"}]},
  "SSH": {"desc": "Secure shell traffic", "code": [{"proto": "tcp", "dport": "22"}]},
  "SVN": {"desc": "Subversion server (svnserve)", "code": [{"proto": "tcp", "dport": "3690"}]},
  "Squid": {"desc": "Squid web proxy traffic", "code": [{"proto": "tcp", "dport": "3128"}]},
  "Submission": {"desc": "Mail message submission traffic", "code": [{"proto": "tcp", "dport": "587"}]},
  "Syslog": {"desc": "Syslog protocol (RFC 5424) traffic", "code": [{"proto": "udp", "dport": "514"}, {"proto": "tcp", "dport": "514"}]},
  "TFTP": {"desc": "Trivial File Transfer Protocol traffic", "code": [{"proto": "udp", "dport": "69"}]},
  "Telnet": {"desc": "Telnet traffic", "code": [{"proto": "tcp", "dport": "23"}]},
  "Telnets": {"desc": "Telnet over SSL", "code": [{"proto": "tcp", "dport": "992"}]},
  "Time": {"desc": "RFC 868 Time protocol", "code": [{"proto": "tcp", "dport": "37"}]},
  "Trcrt": {"desc": "Traceroute (for up to 30 hops) traffic", "code": [{"proto": "udp", "dport": "33434:33524"}, {"proto": "icmp", "icmp-type": "echo-request"}]},
  "VNC": {"desc": "VNC traffic for VNC display's 0 - 99", "code": [{"proto": "tcp", "dport": "5900:5999"}]},
  "VNCL": {"desc": "VNC traffic from Vncservers to Vncviewers in listen mode", "code": [{"proto": "tcp", "dport": "5500"}]},
  "Web": {"desc": "WWW traffic (HTTP and HTTPS)", "code": [{"proto": "tcp", "dport": "80"}, {"proto": "tcp", "dport": "443"}]},
  "Webcache": {"desc": "Web Cache/Proxy traffic (port 8080)", "code": [{"proto": "tcp", "dport": "8080"}]},
  "Webmin": {"desc": "Webmin traffic", "code": [{"proto": "tcp", "dport": "10000"}]},
  "Whois": {"desc": "Whois (nicname, RFC 3912) traffic", "code": [{"proto": "tcp", "dport": "43"}]}
})JSON";

const char* const kCtHelpersJson = R"JSON([
  {"name": "amanda", "v4": true, "v6": true, "udp": 10080},
  {"name": "ftp", "v4": true, "v6": true, "tcp": 21},
  {"name": "irc", "v4": true, "tcp": 6667},
  {"name": "netbios-ns", "v4": true, "udp": 137},
  {"name": "pptp", "v4": true, "tcp": 1723},
  {"name": "sane", "v4": true, "v6": true, "tcp": 6566},
  {"name": "sip", "v4": true, "v6": true, "udp": 5060},
  {"name": "snmp", "v4": true, "udp": 161},
  {"name": "tftp", "v4": true, "v6": true, "udp": 69}
])JSON";

Json::Value parseJson(const std::string& json, const std::string& what) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw std::runtime_error("could not parse " + what + ": " + errors);
    }
    return root;
}

std::optional<std::string> optionalString(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    return value.asString();
}

std::optional<bool> optionalBool(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    return value.asBool();
}

std::optional<uint16_t> optionalPort(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isUInt() || value.asUInt() > 65535) {
        throw std::invalid_argument(std::string("invalid port for '") + key + "'");
    }
    return static_cast<uint16_t>(value.asUInt());
}

} // namespace

// MacroTable

const std::map<std::string, FwMacro>& MacroTable::all() {
    static std::once_flag flag;
    static std::map<std::string, FwMacro> macros;

    std::call_once(flag, []() {
        try {
            macros = parse(kMacrosJson);
        } catch (const std::runtime_error& e) {
            Logger::error("MacroTable", std::string("could not load data for macros: ") + e.what());
        }
    });

    return macros;
}

const FwMacro* MacroTable::find(const std::string& name) {
    const auto& macros = all();
    auto it = macros.find(name);
    return it == macros.end() ? nullptr : &it->second;
}

std::map<std::string, FwMacro> MacroTable::parse(const std::string& json) {
    Json::Value root = parseJson(json, "macro definitions");
    if (!root.isObject()) {
        throw std::runtime_error("macro definitions must be a JSON object");
    }

    std::map<std::string, FwMacro> macros;

    for (const auto& name : root.getMemberNames()) {
        const Json::Value& data = root[name];
        FwMacro fw_macro;
        fw_macro.description = data["desc"].asString();

        bool valid = true;
        for (const auto& entry : data["code"]) {
            try {
                RuleOptions options;
                options.proto = optionalString(entry, "proto");
                options.dport = optionalString(entry, "dport");
                options.sport = optionalString(entry, "sport");
                options.icmp_type = optionalString(entry, "icmp-type");

                auto protocol = protocolFromOptions(options);
                if (!protocol) {
                    valid = false;
                    break;
                }
                fw_macro.code.push_back(*protocol);
            } catch (const std::invalid_argument& e) {
                Logger::error("MacroTable", "could not parse data for macro " + name + ": " + e.what());
                valid = false;
                break;
            }
        }

        if (valid && !fw_macro.code.empty()) {
            macros.emplace(name, std::move(fw_macro));
        }
    }

    return macros;
}

// CtHelperMacro

CtHelperMacro CtHelperMacro::fromJson(const std::string& name, std::optional<bool> v4,
                                      std::optional<bool> v6, std::optional<uint16_t> tcp,
                                      std::optional<uint16_t> udp) {
    if (!tcp && !udp) {
        throw std::invalid_argument("neither TCP nor UDP port set in CT helper " + name);
    }

    CtHelperMacro helper;
    helper.name_ = name;

    bool has_v4 = v4.value_or(false);
    bool has_v6 = v6.value_or(false);
    if (has_v4 && has_v6) {
        helper.family_ = std::nullopt;
    } else if (has_v4) {
        helper.family_ = Family::V4;
    } else if (has_v6) {
        helper.family_ = Family::V6;
    } else {
        throw std::invalid_argument("neither v4 nor v6 set in CT helper " + name);
    }

    if (tcp) {
        helper.tcp_ = Protocol(PortProtocol{"tcp", Ports{std::nullopt, PortList({PortEntry(*tcp)})}});
    }
    if (udp) {
        helper.udp_ = Protocol(PortProtocol{"udp", Ports{std::nullopt, PortList({PortEntry(*udp)})}});
    }

    return helper;
}

// CtHelperTable

const CtHelperMacro* CtHelperTable::find(const std::string& name) {
    static std::once_flag flag;
    static std::map<std::string, CtHelperMacro> helpers;

    std::call_once(flag, []() {
        try {
            helpers = parse(kCtHelpersJson);
        } catch (const std::runtime_error& e) {
            Logger::error("CtHelperTable", std::string("could not load data for ct helpers: ") + e.what());
        }
    });

    auto it = helpers.find(name);
    return it == helpers.end() ? nullptr : &it->second;
}

std::map<std::string, CtHelperMacro> CtHelperTable::parse(const std::string& json) {
    Json::Value root = parseJson(json, "ct helper definitions");
    if (!root.isArray()) {
        throw std::runtime_error("ct helper definitions must be a JSON array");
    }

    std::map<std::string, CtHelperMacro> helpers;
    for (const auto& entry : root) {
        std::string name = entry["name"].asString();
        try {
            helpers.emplace(name, CtHelperMacro::fromJson(name, optionalBool(entry, "v4"),
                                                          optionalBool(entry, "v6"),
                                                          optionalPort(entry, "tcp"),
                                                          optionalPort(entry, "udp")));
        } catch (const std::invalid_argument& e) {
            Logger::error("CtHelperTable", std::string("invalid ct helper definition: ") + e.what());
        }
    }
    return helpers;
}

} // namespace nftfw
