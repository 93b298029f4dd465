#include "policy_config.hpp"
#include "logger.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace nftfw {

namespace {

enum class SectionType {
    None,
    Options,
    Aliases,
    Rules,
    Ipset,
    Group
};

struct Section {
    SectionType type = SectionType::None;
    std::string name;
    std::string comment;
};

// Parses the tail of "[IPSET name] # comment" after the keyword
std::pair<std::string, std::string> parseNamedSectionTail(const std::string& type,
                                                          const std::string& tail) {
    if (tail.empty() || !std::isspace(static_cast<unsigned char>(tail[0]))) {
        throw std::invalid_argument("incomplete " + type + " section");
    }

    std::string rest = trim(tail);
    size_t end = 0;
    while (end < rest.size() &&
           (std::isalnum(static_cast<unsigned char>(rest[end])) || rest[end] == '-' || rest[end] == '_')) {
        ++end;
    }
    if (end == 0) {
        throw std::invalid_argument("expected a name for the " + type + " section");
    }

    std::string name = rest.substr(0, end);
    rest = rest.substr(end);
    if (rest.empty() || rest[0] != ']') {
        throw std::invalid_argument("expected closing ']' in " + type + " section header");
    }

    rest = trim(rest.substr(1));
    if (rest.empty()) {
        return {name, ""};
    }
    if (rest[0] != '#') {
        throw std::invalid_argument("trailing characters after " + type + " section header");
    }
    return {name, trim(rest.substr(1))};
}

bool startsWithNoCase(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && toUpper(text.substr(0, prefix.size())) == toUpper(prefix);
}

/**
 * Typed access to raw option strings. Missing keys fall back to the
 * given default; malformed values throw with the key name.
 */
class OptionReader {
public:
    explicit OptionReader(const PolicyConfig& config) : config_(config) {}

    bool boolean(const std::string& key, bool fallback) const {
        return read<bool>(key, fallback, [](const std::string& v) { return parseBool(v); });
    }

    int64_t integer(const std::string& key, int64_t fallback) const {
        return read<int64_t>(key, fallback, [](const std::string& v) { return parseInteger(v); });
    }

    std::optional<int64_t> optionalInteger(const std::string& key) const {
        if (!config_.option(key)) {
            return std::nullopt;
        }
        return integer(key, 0);
    }

    Verdict verdict(const std::string& key, Verdict fallback) const {
        return read<Verdict>(key, fallback, [](const std::string& v) { return parseVerdict(v); });
    }

    RuleLogLevel logLevel(const std::string& key) const {
        return read<RuleLogLevel>(key, RuleLogLevel::Nolog,
                                  [](const std::string& v) { return parseRuleLogLevel(v); });
    }

    std::vector<std::string> list(const std::string& key) const {
        std::vector<std::string> result;
        auto value = config_.option(key);
        if (!value) {
            return result;
        }

        std::istringstream stream(*value);
        std::string element;
        while (std::getline(stream, element, ',')) {
            element = trim(element);
            if (!element.empty()) {
                result.push_back(element);
            }
        }
        return result;
    }

    std::optional<LogRateLimit> rateLimit(const std::string& key) const {
        auto value = config_.option(key);
        if (!value) {
            return std::nullopt;
        }
        try {
            return LogRateLimit::parse(*value);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("invalid value for option '" + key + "': " + e.what());
        }
    }

private:
    template <typename T, typename Parser>
    T read(const std::string& key, T fallback, Parser parser) const {
        auto value = config_.option(key);
        if (!value) {
            return fallback;
        }
        try {
            return parser(*value);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("invalid value for option '" + key + "': " + e.what());
        }
    }

    const PolicyConfig& config_;
};

} // namespace

// PolicyConfig

PolicyConfig PolicyConfig::parse(const std::string& content, const ParserConfig& parser_config) {
    PolicyConfig config;
    Section section;
    std::vector<IpsetEntry> ipset_entries;
    Group group;

    // Store a finished ipset or group section
    auto closeSection = [&]() {
        if (section.type == SectionType::Ipset) {
            IpsetName name(*parser_config.ipset_scope, section.name);
            IpSet ipset(name, std::move(ipset_entries), section.comment);
            if (!config.ipsets_.emplace(section.name, std::move(ipset)).second) {
                throw std::invalid_argument("duplicate ipset: " + section.name);
            }
        } else if (section.type == SectionType::Group) {
            group.comment = section.comment;
            if (!config.groups_.emplace(section.name, std::move(group)).second) {
                throw std::invalid_argument("duplicate group: " + section.name);
            }
        }
        ipset_entries.clear();
        group = Group();
    };

    std::istringstream stream(content);
    std::string raw_line;
    size_t line_number = 0;

    while (std::getline(stream, raw_line)) {
        ++line_number;
        std::string line = trim(raw_line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        try {
            std::string upper = toUpper(line);

            if (upper == "[OPTIONS]") {
                closeSection();
                section = Section{SectionType::Options, "", ""};
            } else if (upper == "[ALIASES]") {
                closeSection();
                section = Section{SectionType::Aliases, "", ""};
            } else if (upper == "[RULES]") {
                closeSection();
                section = Section{SectionType::Rules, "", ""};
            } else if (startsWithNoCase(line, "[IPSET")) {
                if (!parser_config.ipset_scope) {
                    throw std::invalid_argument("IPSET in config, but ipsets are not allowed in this scope");
                }
                auto [name, comment] = parseNamedSectionTail("ipset", line.substr(6));
                closeSection();
                section = Section{SectionType::Ipset, name, comment};
            } else if (startsWithNoCase(line, "[group")) {
                auto [name, comment] = parseNamedSectionTail("group", line.substr(6));
                closeSection();
                section = Section{SectionType::Group, name, comment};
            } else if (line[0] == '[') {
                throw std::invalid_argument("invalid section " + line);
            } else {
                switch (section.type) {
                    case SectionType::None:
                        throw std::invalid_argument("config line with no section: " + line);

                    case SectionType::Options: {
                        auto colon = line.find(':');
                        if (colon == std::string::npos) {
                            throw std::invalid_argument("expected colon separated key and value, found " + line);
                        }
                        std::string key = trim(line.substr(0, colon));
                        std::string value = trim(line.substr(colon + 1));
                        if (!config.options_.emplace(key, value).second) {
                            throw std::invalid_argument("duplicate option " + key);
                        }
                        break;
                    }

                    case SectionType::Aliases: {
                        Alias alias = Alias::parse(line);
                        std::string name = alias.name;
                        if (!config.aliases_.emplace(name, std::move(alias)).second) {
                            throw std::invalid_argument("duplicate alias: " + name);
                        }
                        break;
                    }

                    case SectionType::Rules: {
                        Rule rule = Rule::parse(line);
                        if (parser_config.guest_iface_names && rule.iface()) {
                            const std::string& iface = *rule.iface();
                            std::string digits = iface.compare(0, 3, "net") == 0 ? iface.substr(3) : "";
                            if (digits.empty() || digits.size() > 5 ||
                                digits.find_first_not_of("0123456789") != std::string::npos) {
                                throw std::invalid_argument("interface name must be of the form \"net<number>\"");
                            }
                        }
                        config.rules_.push_back(std::move(rule));
                        break;
                    }

                    case SectionType::Ipset:
                        ipset_entries.push_back(IpsetEntry::parse(line));
                        break;

                    case SectionType::Group:
                        group.rules.push_back(Rule::parse(line));
                        break;
                }
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    try {
        closeSection();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    return config;
}

std::optional<std::string> PolicyConfig::option(const std::string& key) const {
    auto it = options_.find(key);
    if (it == options_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Alias* PolicyConfig::alias(const std::string& name) const {
    auto it = aliases_.find(name);
    return it == aliases_.end() ? nullptr : &it->second;
}

// ClusterConfig

ClusterConfig ClusterConfig::parse(const std::string& content) {
    ClusterConfig cluster;
    cluster.config_ = PolicyConfig::parse(content, ParserConfig{false, ConfigScope::Datacenter});

    OptionReader reader(cluster.config_);
    cluster.options_.enable = reader.boolean("enable", false);
    cluster.options_.ebtables = reader.boolean("ebtables", false);
    cluster.options_.policy_in = reader.verdict("policy_in", Verdict::Drop);
    cluster.options_.policy_out = reader.verdict("policy_out", Verdict::Accept);
    cluster.options_.log_ratelimit = reader.rateLimit("log_ratelimit");

    return cluster;
}

Verdict ClusterConfig::defaultPolicy(Direction direction) const {
    switch (direction) {
        case Direction::In: return options_.policy_in;
        case Direction::Out: return options_.policy_out;
        case Direction::Forward: return Verdict::Accept;
    }
    return Verdict::Drop;
}

std::optional<LogRateLimit> ClusterConfig::logRateLimit() const {
    LogRateLimit limit = options_.log_ratelimit.value_or(LogRateLimit{});
    if (!limit.enabled) {
        return std::nullopt;
    }
    return limit;
}

// HostConfig

HostConfig HostConfig::parse(const std::string& content) {
    HostConfig host;
    host.config_ = PolicyConfig::parse(content, ParserConfig{false, ConfigScope::Datacenter});

    if (!host.config_.groups().empty()) {
        throw std::runtime_error("host firewall config cannot declare groups");
    }
    if (!host.config_.aliases().empty()) {
        throw std::runtime_error("host firewall config cannot declare aliases");
    }
    if (!host.config_.ipsets().empty()) {
        throw std::runtime_error("host firewall config cannot declare ipsets");
    }

    OptionReader reader(host.config_);
    HostOptions& options = host.options_;
    options.enable = reader.boolean("enable", true);
    options.nftables = reader.boolean("nftables", false);
    options.log_level_in = reader.logLevel("log_level_in");
    options.log_level_out = reader.logLevel("log_level_out");
    options.log_nf_conntrack = reader.boolean("log_nf_conntrack", false);
    options.ndp = reader.boolean("ndp", true);
    options.nf_conntrack_allow_invalid = reader.boolean("nf_conntrack_allow_invalid", false);
    options.nf_conntrack_helpers = reader.list("nf_conntrack_helpers");
    options.nf_conntrack_max = reader.optionalInteger("nf_conntrack_max");
    options.nf_conntrack_tcp_timeout_established =
        reader.optionalInteger("nf_conntrack_tcp_timeout_established");
    options.nf_conntrack_tcp_timeout_syn_recv =
        reader.optionalInteger("nf_conntrack_tcp_timeout_syn_recv");
    options.nosmurfs = reader.boolean("nosmurfs", true);
    options.protection_synflood = reader.boolean("protection_synflood", false);
    options.protection_synflood_burst = reader.integer("protection_synflood_burst", 1000);
    options.protection_synflood_rate = reader.integer("protection_synflood_rate", 200);
    options.smurf_log_level = reader.logLevel("smurf_log_level");
    options.tcp_flags_log_level = reader.logLevel("tcp_flags_log_level");
    options.tcpflags = reader.boolean("tcpflags", false);

    return host;
}

RuleLogLevel HostConfig::logLevel(Direction direction) const {
    switch (direction) {
        case Direction::In: return options_.log_level_in;
        case Direction::Out: return options_.log_level_out;
        case Direction::Forward: return RuleLogLevel::Nolog;
    }
    return RuleLogLevel::Nolog;
}

// GuestConfig

GuestConfig GuestConfig::parse(uint32_t vmid, GuestType type,
                               const std::string& firewall_content,
                               const std::string& resource_content) {
    GuestConfig guest;
    guest.vmid_ = vmid;
    guest.type_ = type;
    guest.config_ = PolicyConfig::parse(firewall_content, ParserConfig{true, ConfigScope::Guest});

    if (!guest.config_.groups().empty()) {
        throw std::runtime_error("guest firewall config cannot declare groups");
    }

    OptionReader reader(guest.config_);
    GuestOptions& options = guest.options_;
    options.enable = reader.boolean("enable", false);
    options.ndp = reader.boolean("ndp", true);
    options.dhcp = reader.boolean("dhcp", true);
    options.radv = reader.boolean("radv", false);
    options.macfilter = reader.boolean("macfilter", true);
    options.ipfilter = reader.boolean("ipfilter", false);
    options.policy_in = reader.verdict("policy_in", Verdict::Drop);
    options.policy_out = reader.verdict("policy_out", Verdict::Accept);
    options.log_level_in = reader.logLevel("log_level_in");
    options.log_level_out = reader.logLevel("log_level_out");

    try {
        guest.network_config_ = NetworkConfig::parse(resource_content);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("invalid network config for guest " + std::to_string(vmid) +
                                 ": " + e.what());
    }

    return guest;
}

Verdict GuestConfig::defaultPolicy(Direction direction) const {
    return direction == Direction::Out ? options_.policy_out : options_.policy_in;
}

RuleLogLevel GuestConfig::logLevel(Direction direction) const {
    return direction == Direction::Out ? options_.log_level_out : options_.log_level_in;
}

std::string GuestConfig::ifaceNameByIndex(int index) const {
    return guestIfacePrefix(type_) + std::to_string(vmid_) + "i" + std::to_string(index);
}

std::string GuestConfig::ifaceNameByKey(const std::string& key) const {
    return ifaceNameByIndex(NetworkConfig::indexFromNetKey(key));
}

// BridgeConfig

BridgeConfig BridgeConfig::parse(const std::string& bridge_name, const std::string& content) {
    BridgeConfig bridge;
    bridge.bridge_name_ = bridge_name;
    bridge.config_ = PolicyConfig::parse(content, ParserConfig{false, std::nullopt});

    OptionReader reader(bridge.config_);
    bridge.options_.enable = reader.boolean("enable", false);
    bridge.options_.log_level_forward = reader.logLevel("log_level_forward");
    bridge.options_.policy_forward = reader.verdict("policy_forward", Verdict::Accept);

    Logger::debug("BridgeConfig", "loaded firewall config for bridge " + bridge_name);
    return bridge;
}

} // namespace nftfw
