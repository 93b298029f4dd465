#include "rule_match.hpp"
#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace nftfw {

namespace {

using NameTable = std::pair<const char*, uint8_t>;

const NameTable kIcmpTypes[] = {
    {"address-mask-reply", 18},
    {"address-mask-request", 17},
    {"destination-unreachable", 3},
    {"echo-reply", 0},
    {"echo-request", 8},
    {"info-reply", 16},
    {"info-request", 15},
    {"parameter-problem", 12},
    {"redirect", 5},
    {"router-advertisement", 9},
    {"router-solicitation", 10},
    {"source-quench", 4},
    {"time-exceeded", 11},
    {"timestamp-reply", 14},
    {"timestamp-request", 13},
};

const NameTable kIcmpCodes[] = {
    {"admin-prohibited", 13},
    {"host-prohibited", 10},
    {"host-unreachable", 1},
    {"net-prohibited", 9},
    {"net-unreachable", 0},
    {"port-unreachable", 3},
    {"prot-unreachable", 2},
};

const NameTable kIcmpv6Types[] = {
    {"destination-unreachable", 1},
    {"echo-reply", 129},
    {"echo-request", 128},
    {"ind-neighbor-advert", 142},
    {"ind-neighbor-solicit", 141},
    {"mld-listener-done", 132},
    {"mld-listener-query", 130},
    {"mld-listener-reduction", 132},
    {"mld-listener-report", 131},
    {"mld2-listener-report", 143},
    {"nd-neighbor-advert", 136},
    {"nd-neighbor-solicit", 135},
    {"nd-redirect", 137},
    {"nd-router-advert", 134},
    {"nd-router-solicit", 133},
    {"packet-too-big", 2},
    {"parameter-problem", 4},
    {"router-renumbering", 138},
    {"time-exceeded", 3},
};

const NameTable kIcmpv6Codes[] = {
    {"addr-unreachable", 3},
    {"admin-prohibited", 1},
    {"no-route", 0},
    {"policy-fail", 5},
    {"port-unreachable", 4},
    {"reject-route", 6},
};

template <size_t N>
bool containsName(const NameTable (&table)[N], const std::string& name) {
    return std::any_of(std::begin(table), std::end(table),
                       [&name](const NameTable& entry) { return name == entry.first; });
}

std::optional<uint8_t> parseU8(const std::string& text) {
    if (text.empty() || text.size() > 3 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    int value = std::stoi(text);
    if (value > 255) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(value);
}

Ports portsFromOptions(const RuleOptions& options) {
    Ports ports;
    if (options.sport) {
        ports.sport = PortList::parse(*options.sport);
    }
    if (options.dport) {
        ports.dport = PortList::parse(*options.dport);
    }
    return ports;
}

std::optional<std::string>* optionSlot(RuleOptions& options, const std::string& name) {
    if (name == "proto" || name == "p") return &options.proto;
    if (name == "dport") return &options.dport;
    if (name == "sport") return &options.sport;
    if (name == "dest") return &options.dest;
    if (name == "source") return &options.source;
    if (name == "iface" || name == "i") return &options.iface;
    if (name == "log") return &options.log;
    if (name == "icmp-type") return &options.icmp_type;
    return nullptr;
}

// "<verdict>" or "<macro>(<verdict>)", returns macro, verdict and remaining text
std::tuple<std::optional<std::string>, Verdict, std::string> parseAction(const std::string& line) {
    auto first = matchName(line);
    if (!first) {
        throw std::invalid_argument("expected a verdict or macro name");
    }

    const std::string& rest = first->second;
    if (rest.empty() || rest[0] != '(') {
        return {std::nullopt, parseVerdict(first->first), trim(rest)};
    }

    auto verdict = matchName(rest.substr(1));
    if (!verdict) {
        throw std::invalid_argument("expected a verdict");
    }
    if (verdict->second.empty() || verdict->second[0] != ')') {
        throw std::invalid_argument("expected closing ')' after verdict");
    }

    return {first->first, parseVerdict(verdict->first), trim(verdict->second.substr(1))};
}

} // namespace

RuleOptions RuleOptions::parse(const std::string& text) {
    RuleOptions options;
    std::string line = trim(text);

    while (!line.empty()) {
        if (line[0] != '-') {
            throw std::invalid_argument("expected an option starting with '-'");
        }
        line = line.substr(1);
        if (!line.empty() && line[0] == '-') {
            line = line.substr(1);
        }

        auto param = matchName(line);
        if (!param) {
            throw std::invalid_argument("expected a parameter name after '-'");
        }

        auto value = matchNonWhitespace(trim(param->second));
        if (!value) {
            throw std::invalid_argument("expected a value for '" + param->first + "'");
        }

        auto* slot = optionSlot(options, param->first);
        if (slot == nullptr) {
            throw std::invalid_argument("unknown option in rule: " + param->first);
        }
        if (slot->has_value()) {
            throw std::invalid_argument("duplicate option in rule: " + param->first);
        }
        *slot = value->first;

        line = value->second;
    }

    return options;
}

std::string IcmpValue::toString() const {
    if (isNamed()) {
        return std::get<std::string>(value);
    }
    return std::to_string(std::get<uint8_t>(value));
}

IcmpMatch IcmpMatch::parse(Family family, const std::string& text) {
    IcmpMatch icmp;
    icmp.family = family;

    if (auto number = parseU8(text)) {
        icmp.type = IcmpValue{*number};
        return icmp;
    }

    bool is_type = family == Family::V4 ? containsName(kIcmpTypes, text)
                                        : containsName(kIcmpv6Types, text);
    if (is_type) {
        icmp.type = IcmpValue{text};
        return icmp;
    }

    bool is_code = family == Family::V4 ? containsName(kIcmpCodes, text)
                                        : containsName(kIcmpv6Codes, text);
    if (is_code) {
        icmp.code = IcmpValue{text};
        return icmp;
    }

    throw std::invalid_argument("'" + text + "' is neither a valid " +
                                (family == Family::V4 ? "icmp" : "icmpv6") + " type nor code");
}

std::optional<Protocol> protocolFromOptions(const RuleOptions& options) {
    if (!options.proto) {
        return std::nullopt;
    }

    const std::string& proto = *options.proto;

    if (proto == "tcp" || proto == "6") return Protocol(PortProtocol{"tcp", portsFromOptions(options)});
    if (proto == "udp" || proto == "17") return Protocol(PortProtocol{"udp", portsFromOptions(options)});
    if (proto == "sctp" || proto == "132") return Protocol(PortProtocol{"sctp", portsFromOptions(options)});
    if (proto == "dccp" || proto == "33") return Protocol(PortProtocol{"dccp", portsFromOptions(options)});
    if (proto == "udplite" || proto == "136") return Protocol(PortProtocol{"udplite", portsFromOptions(options)});

    if (proto == "icmp" || proto == "1") {
        if (options.icmp_type) {
            return Protocol(IcmpMatch::parse(Family::V4, *options.icmp_type));
        }
        return Protocol(IcmpMatch{Family::V4, std::nullopt, std::nullopt});
    }

    if (proto == "icmpv6" || proto == "ipv6-icmp" || proto == "58") {
        if (options.icmp_type) {
            return Protocol(IcmpMatch::parse(Family::V6, *options.icmp_type));
        }
        return Protocol(IcmpMatch{Family::V6, std::nullopt, std::nullopt});
    }

    if (auto number = parseU8(proto)) {
        return Protocol(NumericProtocol{*number});
    }
    return Protocol(NamedProtocol{proto});
}

std::optional<Family> protocolFamily(const Protocol& protocol) {
    if (const auto* icmp = std::get_if<IcmpMatch>(&protocol)) {
        return icmp->family;
    }
    return std::nullopt;
}

IpAddrMatch parseIpAddrMatch(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty IP specification");
    }

    try {
        return IpList::parse(text);
    } catch (const std::invalid_argument&) {
        // not a literal list, try the named forms
    }

    try {
        if (text[0] == '+') {
            return IpsetName::parse(text);
        }
        return AliasName::parse(text);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("invalid IP specification: " + text);
    }
}

std::optional<Family> ipAddrMatchFamily(const IpAddrMatch& match) {
    if (const auto* list = std::get_if<IpList>(&match)) {
        return list->family();
    }
    return std::nullopt;
}

IpMatch::IpMatch(std::optional<IpAddrMatch> src, std::optional<IpAddrMatch> dst)
    : src_(std::move(src)), dst_(std::move(dst)) {
    if (!src_ && !dst_) {
        throw std::invalid_argument("either src or dst must be set");
    }

    if (src_ && dst_) {
        auto src_family = ipAddrMatchFamily(*src_);
        auto dst_family = ipAddrMatchFamily(*dst_);
        if (src_family && dst_family && *src_family != *dst_family) {
            throw std::invalid_argument("src and dst family must be equal");
        }
    }
}

std::optional<IpMatch> IpMatch::fromOptions(const RuleOptions& options) {
    std::optional<IpAddrMatch> src;
    std::optional<IpAddrMatch> dst;

    if (options.source) {
        src = parseIpAddrMatch(*options.source);
    }
    if (options.dest) {
        dst = parseIpAddrMatch(*options.dest);
    }

    if (!src && !dst) {
        return std::nullopt;
    }
    return IpMatch(std::move(src), std::move(dst));
}

RuleMatch RuleMatch::fromOptions(Direction direction, Verdict verdict,
                                 std::optional<std::string> fw_macro, const RuleOptions& options) {
    if (options.dport && options.icmp_type) {
        throw std::invalid_argument("dport and icmp-type are mutually exclusive");
    }

    RuleMatch match;
    match.direction = direction;
    match.verdict = verdict;
    match.fw_macro = std::move(fw_macro);
    match.iface = options.iface;
    if (options.log) {
        match.log = parseRuleLogLevel(*options.log);
    }
    match.ip = IpMatch::fromOptions(options);
    match.proto = protocolFromOptions(options);
    return match;
}

RuleMatch RuleMatch::parse(const std::string& line) {
    auto direction = matchName(line);
    if (!direction) {
        throw std::invalid_argument("expected a direction");
    }

    Direction dir = parseDirection(direction->first);
    auto [fw_macro, verdict, rest] = parseAction(trim(direction->second));

    return fromOptions(dir, verdict, std::move(fw_macro), RuleOptions::parse(rest));
}

} // namespace nftfw
