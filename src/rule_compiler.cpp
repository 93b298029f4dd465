#include "rule_compiler.hpp"
#include "logger.hpp"
#include "nft_command.hpp"
#include "nft_expression.hpp"
#include <stdexcept>

namespace nftfw {

namespace {

const std::string kComponent = "RuleCompiler";

void addIface(std::vector<NftRule>& rules, const RuleEnv& env, const std::string& name) {
    std::string key;
    switch (env.direction) {
        case Direction::In:
            key = env.vmid ? "oifname" : "iifname";
            break;
        case Direction::Out:
            key = env.vmid ? "iifname" : "oifname";
            break;
        case Direction::Forward:
            throw std::runtime_error("cannot define interfaces for forward direction");
    }

    std::string iface = env.ifaceName(name);
    Logger::debug(kComponent, "adding interface: " + iface);

    for (auto& rule : rules) {
        rule.statements.push_back(Statement::matchEq(Expression::meta(key), Json::Value(iface)));
    }
}

void addL4Protocol(std::vector<NftRule>& rules, const Json::Value& protocol) {
    for (auto& rule : rules) {
        rule.statements.push_back(Statement::matchEq(Expression::meta("l4proto"), protocol));
    }
}

void addPorts(std::vector<NftRule>& rules, const Ports& ports) {
    for (auto& rule : rules) {
        if (ports.sport) {
            rule.statements.push_back(Statement::matchEq(Expression::payload("th", "sport"),
                                                         Expression::fromPortList(*ports.sport)));
        }
        if (ports.dport) {
            rule.statements.push_back(Statement::matchEq(Expression::payload("th", "dport"),
                                                         Expression::fromPortList(*ports.dport)));
        }
    }
}

void addIcmp(std::vector<NftRule>& rules, const IcmpMatch& icmp) {
    std::string protocol = icmp.family == Family::V4 ? "icmp" : "icmpv6";

    for (auto& rule : rules) {
        if (rule.family && *rule.family != icmp.family) {
            continue;
        }

        if (icmp.code) {
            rule.statements.push_back(Statement::matchEq(Expression::payload(protocol, "code"),
                                                         Expression::fromIcmpValue(*icmp.code)));
        } else if (icmp.type) {
            rule.statements.push_back(Statement::matchEq(Expression::payload(protocol, "type"),
                                                         Expression::fromIcmpValue(*icmp.type)));
        } else {
            rule.statements.push_back(Statement::matchEq(Expression::meta("l4proto"), Json::Value(protocol)));
        }

        rule.family = icmp.family;
    }
}

void addProtocol(std::vector<NftRule>& rules, const Protocol& protocol) {
    if (const auto* ports = std::get_if<PortProtocol>(&protocol)) {
        addL4Protocol(rules, Json::Value(ports->name));
        addPorts(rules, ports->ports);
    } else if (const auto* icmp = std::get_if<IcmpMatch>(&protocol)) {
        addIcmp(rules, *icmp);
    } else if (const auto* named = std::get_if<NamedProtocol>(&protocol)) {
        addL4Protocol(rules, Json::Value(named->name));
    } else if (const auto* numeric = std::get_if<NumericProtocol>(&protocol)) {
        addL4Protocol(rules, Json::Value(static_cast<Json::UInt>(numeric->number)));
    }
}

/// Every protocol of the macro applied to its own copy of the candidates
void addMacro(std::vector<NftRule>& rules, const FwMacro& macro) {
    std::vector<NftRule> initial;
    initial.swap(rules);

    for (const auto& protocol : macro.code) {
        std::vector<NftRule> copies = initial;
        addProtocol(copies, protocol);
        rules.insert(rules.end(), copies.begin(), copies.end());
    }
}

/// Attach a match to unpinned candidates and candidates of the same family
void addFamilyMatch(std::vector<NftRule>& rules, Family family, const std::string& field,
                    const Json::Value& right) {
    Json::Value left = Expression::payload(Expression::ipProtocol(family), field);

    for (auto& rule : rules) {
        if (rule.family && *rule.family != family) {
            continue;
        }
        rule.statements.push_back(Statement::matchEq(left, right));
        rule.family = family;
    }
}

/**
 * Replace each candidate with one copy per family matching the set pair.
 * A containment match is "in members and not in nomatch". A negated match
 * needs two rules since either condition alone is enough.
 */
void addSetMatch(std::vector<NftRule>& rules, const IpsetName& name, const std::string& field,
                 const RuleEnv& env, bool contains) {
    std::vector<NftRule> expanded;

    for (const auto& rule : rules) {
        for (Family family : {Family::V4, Family::V6}) {
            if ((rule.family && *rule.family != family) || !env.containsFamily(family)) {
                continue;
            }

            Json::Value left = Expression::payload(Expression::ipProtocol(family), field);
            Json::Value members = Expression::setReference(name.nftSetName(family, env.vmid, false));
            Json::Value nomatch = Expression::setReference(name.nftSetName(family, env.vmid, true));

            if (contains) {
                NftRule copy = rule;
                copy.family = family;
                copy.statements.push_back(Statement::matchEq(left, members));
                copy.statements.push_back(Statement::matchNe(left, nomatch));
                expanded.push_back(std::move(copy));
            } else {
                NftRule outside = rule;
                outside.family = family;
                outside.statements.push_back(Statement::matchNe(left, members));
                expanded.push_back(std::move(outside));

                NftRule excluded = rule;
                excluded.family = family;
                excluded.statements.push_back(Statement::matchEq(left, nomatch));
                expanded.push_back(std::move(excluded));
            }
        }
    }

    rules.swap(expanded);
}

void addAddressMatch(std::vector<NftRule>& rules, const IpAddrMatch& match,
                     const std::string& field, const RuleEnv& env) {
    if (const auto* list = std::get_if<IpList>(&match)) {
        addFamilyMatch(rules, list->family(), field, Expression::fromIpList(*list));
    } else if (const auto* alias_name = std::get_if<AliasName>(&match)) {
        const Alias* alias = env.alias(*alias_name);
        if (alias == nullptr) {
            throw std::runtime_error("could not find alias " + alias_name->toString());
        }
        addFamilyMatch(rules, alias->address.family(), field, Expression::prefix(alias->address));
    } else if (const auto* set = std::get_if<IpsetName>(&match)) {
        addSetMatch(rules, *set, field, env, true);
    }
}

void addIpMatch(std::vector<NftRule>& rules, const IpMatch& ip, const RuleEnv& env) {
    if (ip.src()) {
        addAddressMatch(rules, *ip.src(), "saddr", env);
    }
    if (ip.dst()) {
        addAddressMatch(rules, *ip.dst(), "daddr", env);
    }
}

std::vector<NftRule> compileMatch(const RuleMatch& match, const RuleEnv& env) {
    std::vector<NftRule> rules;

    if (match.direction != env.direction) {
        return rules;
    }

    if (std::optional<int> level = nflogLevel(match.log)) {
        std::vector<Json::Value> terminal;
        if (std::optional<LogRateLimit> limit = env.defaultLogLimit()) {
            terminal.push_back(Statement::fromLogRateLimit(*limit));
        }
        terminal.push_back(Statement::log(
            Statement::logPrefix(env.vmid, *level, env.chain.name, match.verdict), 0));
        rules.emplace_back(std::move(terminal));
    }

    rules.emplace_back(RuleCompiler::generateVerdict(match.verdict, env));

    if (match.iface) {
        addIface(rules, env, *match.iface);
    }

    if (match.proto) {
        addProtocol(rules, *match.proto);
    }

    if (match.fw_macro) {
        const FwMacro* macro = MacroTable::find(*match.fw_macro);
        if (macro == nullptr) {
            throw std::runtime_error("cannot find macro " + *match.fw_macro);
        }
        addMacro(rules, *macro);
    }

    if (match.ip) {
        addIpMatch(rules, *match.ip, env);
    }

    return rules;
}

std::vector<NftRule> compileGroup(const RuleGroup& group, const RuleEnv& env) {
    std::vector<NftRule> rules;

    if (env.direction == Direction::Forward && group.iface) {
        return rules;
    }

    rules.emplace_back(Statement::jump("group-" + group.group + "-" + directionToString(env.direction)));

    if (group.iface) {
        addIface(rules, env, *group.iface);
    }

    return rules;
}

} // anonymous namespace

std::vector<Json::Value> NftRule::allStatements() const {
    std::vector<Json::Value> all = statements;
    all.insert(all.end(), terminal.begin(), terminal.end());
    return all;
}

Json::Value NftRule::toAddRule(const ChainName& chain) const {
    return Command::addRule(chain, allStatements());
}

std::string RuleEnv::ifaceName(const std::string& rule_iface) const {
    if (vmid) {
        auto it = config.guests().find(*vmid);
        if (it != config.guests().end()) {
            try {
                return it->second.ifaceNameByKey(rule_iface);
            } catch (const std::invalid_argument& e) {
                Logger::debug(kComponent, e.what());
            }
        }

        Logger::warn(kComponent, "Unable to resolve interface name " + rule_iface +
                                     " for VM #" + std::to_string(*vmid));
        return rule_iface;
    }

    return config.interfaceMapping(rule_iface).value_or(rule_iface);
}

std::vector<NftRule> RuleCompiler::candidates(const Rule& rule, const RuleEnv& env) {
    if (rule.isDisabled()) {
        return {};
    }

    if (rule.isGroup()) {
        return compileGroup(rule.group(), env);
    }

    return compileMatch(rule.match(), env);
}

std::vector<NftRule> RuleCompiler::compileRule(const Rule& rule, const RuleEnv& env) {
    std::vector<NftRule> rules = candidates(rule, env);

    // A group jump applies to every family at once
    if (rule.isGroup()) {
        return rules;
    }

    return expandFamilies(std::move(rules), env.tableFamily());
}

std::vector<NftRule> RuleCompiler::compileCtHelper(const CtHelperMacro& helper, const RuleEnv& env) {
    std::vector<NftRule> rules;

    if (helper.family() && !env.containsFamily(*helper.family())) {
        return rules;
    }

    if (!helper.tcp() && !helper.udp()) {
        return rules;
    }

    Logger::debug(kComponent, "applying ct helper: " + helper.name());

    auto addHelper = [&](const Protocol& protocol, const std::string& helper_name) {
        NftRule established(std::vector<Json::Value>{
            Statement::matchEq(Expression::ct("state"),
                               Expression::list({Json::Value("new"), Json::Value("established")})),
            Statement::accept(),
        });
        NftRule assign(Statement::ctHelper(helper_name));

        std::vector<NftRule> ct_rules = {established, assign};
        addProtocol(ct_rules, protocol);
        rules.insert(rules.end(), ct_rules.begin(), ct_rules.end());
    };

    if (helper.tcp()) {
        addHelper(*helper.tcp(), helper.tcpHelperName());
    }
    if (helper.udp()) {
        addHelper(*helper.udp(), helper.udpHelperName());
    }

    NftRule helper_rule(Statement::accept());
    helper_rule.statements.push_back(
        Statement::matchEq(Expression::ct("helper", helper.family()), Json::Value(helper.name())));
    rules.push_back(std::move(helper_rule));

    if (helper.family()) {
        for (auto& rule : rules) {
            rule.family = *helper.family();
            if (tableFamilies(env.tableFamily()).size() > 1) {
                rule.statements.insert(rule.statements.begin(),
                                       familyMarker(env.tableFamily(), *helper.family()));
            }
        }
    }

    return expandFamilies(std::move(rules), env.tableFamily());
}

std::vector<NftRule> RuleCompiler::compileIpfilter(const IpSet& ipset, const RuleEnv& env) {
    if (!env.vmid) {
        throw std::runtime_error("can only create ipfilter for guests");
    }

    auto it = env.config.guests().find(*env.vmid);
    if (it == env.config.guests().end()) {
        throw std::runtime_error("no guest config found for #" + std::to_string(*env.vmid));
    }
    const GuestConfig& guest = it->second;

    std::vector<NftRule> rules;
    std::string iface = guest.ifaceNameByIndex(ipset.kind().device_index);
    std::string members = ipset.name().nftSetName(Family::V4, env.vmid, false);

    switch (env.direction) {
        case Direction::In: {
            if (env.containsFamily(Family::V4)) {
                NftRule rule(Statement::drop());
                rule.family = Family::V4;
                rule.statements.push_back(Statement::matchEq(Expression::meta("oifname"), Json::Value(iface)));
                rule.statements.push_back(Statement::matchNe(Expression::payload("arp", "daddr ip"),
                                                             Expression::setReference(members)));
                rules.push_back(std::move(rule));
            }
            break;
        }
        case Direction::Out: {
            NftRule base(Statement::drop());
            base.statements.push_back(Statement::matchEq(Expression::meta("iifname"), Json::Value(iface)));

            std::vector<NftRule> address_rules = {base};
            addSetMatch(address_rules, ipset.name(), "saddr", env, false);
            rules.insert(rules.end(), address_rules.begin(), address_rules.end());

            if (env.containsFamily(Family::V4)) {
                base.family = Family::V4;
                base.statements.push_back(Statement::matchNe(Expression::payload("arp", "saddr ip"),
                                                             Expression::setReference(members)));
                rules.push_back(std::move(base));
            }
            break;
        }
        case Direction::Forward:
            throw std::runtime_error("cannot generate IP filter for direction forward");
    }

    return expandFamilies(std::move(rules), env.tableFamily());
}

std::vector<NftRule> RuleCompiler::expandFamilies(std::vector<NftRule> rules, TableFamily table) {
    std::vector<Family> families = tableFamilies(table);
    std::vector<NftRule> expanded;

    for (auto& rule : rules) {
        if (rule.family) {
            if (tableSupports(table, *rule.family)) {
                expanded.push_back(std::move(rule));
            }
            continue;
        }

        if (families.size() == 1) {
            rule.family = families.front();
            expanded.push_back(std::move(rule));
            continue;
        }

        for (Family family : families) {
            NftRule copy = rule;
            copy.family = family;
            copy.statements.insert(copy.statements.begin(), familyMarker(table, family));
            expanded.push_back(std::move(copy));
        }
    }

    return expanded;
}

Json::Value RuleCompiler::familyMarker(TableFamily table, Family family) {
    if (table == TableFamily::Inet) {
        return Statement::matchEq(Expression::meta("nfproto"),
                                  Json::Value(family == Family::V4 ? "ipv4" : "ipv6"));
    }
    return Statement::matchEq(Expression::meta("protocol"), Json::Value(Expression::ipProtocol(family)));
}

Json::Value RuleCompiler::generateVerdict(Verdict verdict, const RuleEnv& env) {
    if (verdict == Verdict::Reject) {
        if (env.tableFamily() == TableFamily::Bridge && env.direction == Direction::In) {
            return Statement::drop();
        }
        return Statement::jump("do-reject");
    }
    return Statement::fromVerdict(verdict);
}

} // namespace nftfw
