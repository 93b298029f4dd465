#include "firewall.hpp"
#include "logger.hpp"
#include "nft_expression.hpp"
#include "object_synthesizer.hpp"
#include "rule_compiler.hpp"
#include "system_utils.hpp"
#include <stdexcept>

namespace nftfw {

namespace {

const std::string kComponent = "Firewall";

const std::string kManagementIpset = "management";

Json::Value addRule(const ChainName& chain, std::vector<Json::Value> statements) {
    return Command::addRule(chain, statements);
}

void appendRules(CommandList& commands, const std::vector<NftRule>& rules, const ChainName& chain) {
    for (const auto& rule : rules) {
        commands.append(rule.toAddRule(chain));
    }
}

} // anonymous namespace

const std::string Firewall::kClusterTable = "proxmox-firewall";
const std::string Firewall::kHostTable = "proxmox-firewall";
const std::string Firewall::kGuestTable = "proxmox-firewall-guests";

const std::string Firewall::kConntrackMaxFile = "/proc/sys/net/netfilter/nf_conntrack_max";
const std::string Firewall::kConntrackTimeoutEstablishedFile =
    "/proc/sys/net/netfilter/nf_conntrack_tcp_timeout_established";
const std::string Firewall::kConntrackTimeoutSynRecvFile =
    "/proc/sys/net/netfilter/nf_conntrack_tcp_timeout_syn_recv";

HostAccess HostAccess::system() {
    HostAccess access;
    access.management_cidrs = &SystemUtils::getManagementCidrs;
    access.write_tunable = &SystemUtils::writeTunable;
    return access;
}

Firewall::Firewall(FirewallConfig config, HostAccess host_access)
    : config_(std::move(config)), host_access_(std::move(host_access)) {}

TableName Firewall::clusterTable() {
    return TableName{TableFamily::Inet, kClusterTable};
}

TableName Firewall::hostTable() {
    return TableName{TableFamily::Inet, kHostTable};
}

TableName Firewall::guestTable() {
    return TableName{TableFamily::Bridge, kGuestTable};
}

SetName Firewall::guestVmap(Direction direction) {
    return SetName{guestTable(), "vm-map-" + directionToString(direction)};
}

ChainName Firewall::clusterChain(Direction direction) {
    return ChainName{clusterTable(), "cluster-" + directionToString(direction)};
}

ChainName Firewall::hostChain(Direction direction) {
    return ChainName{hostTable(), "host-" + directionToString(direction)};
}

ChainName Firewall::hostOptionChain(Direction direction) {
    return ChainName{hostTable(), "option-" + directionToString(direction)};
}

ChainName Firewall::guestChain(Direction direction, uint32_t vmid) {
    return ChainName{guestTable(), "guest-" + std::to_string(vmid) + "-" + directionToString(direction)};
}

ChainName Firewall::groupChain(const TableName& table, const std::string& name, Direction direction) {
    return ChainName{table, "group-" + name + "-" + directionToString(direction)};
}

ChainName Firewall::hostConntrackChain() {
    return ChainName{hostTable(), "ct-in"};
}

ChainName Firewall::synfloodLimitChain() {
    return ChainName{hostTable(), "ratelimit-synflood"};
}

ChainName Firewall::logInvalidTcpChain() {
    return ChainName{hostTable(), "log-invalid-tcp"};
}

ChainName Firewall::logSmurfsChain() {
    return ChainName{hostTable(), "log-smurfs"};
}

std::vector<CommandList> Firewall::removeCommands() {
    return {
        CommandList({Command::deleteTable(clusterTable())}),
        CommandList({Command::deleteTable(guestTable())}),
    };
}

void Firewall::resetFirewall(CommandList& commands) const {
    commands.extend(std::vector<Json::Value>{
        Command::flushChain(clusterChain(Direction::In)),
        Command::flushChain(clusterChain(Direction::Out)),
        Command::addChain(hostChain(Direction::In)),
        Command::flushChain(hostChain(Direction::In)),
        Command::flushChain(hostOptionChain(Direction::In)),
        Command::addChain(hostChain(Direction::Out)),
        Command::flushChain(hostChain(Direction::Out)),
        Command::flushChain(hostOptionChain(Direction::Out)),
        Command::flushMap(guestVmap(Direction::In)),
        Command::flushMap(guestVmap(Direction::Out)),
        Command::flushChain(hostConntrackChain()),
        Command::flushChain(synfloodLimitChain()),
        Command::flushChain(logInvalidTcpChain()),
        Command::flushChain(logSmurfsChain()),
    });

    // Guest chains jump into group chains, so they have to go first
    for (const std::string prefix : {"guest-", "group-"}) {
        for (const auto& [name, chain] : config_.nftChains()) {
            if (name.compare(0, prefix.size(), prefix) == 0) {
                commands.append(Command::deleteChain(chain.chainName()));
            }
        }
    }
}

void Firewall::createManagementIpset(CommandList& commands) const {
    if (config_.cluster().ipsets().count(kManagementIpset) != 0) {
        return;
    }

    Logger::debug(kComponent, "auto-generating management ipset");

    std::vector<IpsetEntry> entries;
    if (host_access_.management_cidrs) {
        for (const auto& cidr : host_access_.management_cidrs()) {
            entries.push_back(IpsetEntry{false, IpEntry(cidr), ""});
        }
    }

    IpSet ipset(IpsetName(ConfigScope::Datacenter, kManagementIpset), std::move(entries));
    ObjectEnv env{clusterTable(), config_, std::nullopt};
    commands.extend(ObjectSynthesizer::ipsetObjects(ipset, env));
}

CommandList Firewall::fullHostFw() const {
    CommandList commands;

    if (!config_.isEnabled()) {
        Logger::info(kComponent, "firewall is disabled - doing nothing!");
        return commands;
    }

    resetFirewall(commands);

    if (config_.host().isEnabled()) {
        Logger::info(kComponent, "creating cluster / host configuration");

        createManagementIpset(commands);
        createIpsets(commands, config_.cluster().ipsets(), clusterTable(), nullptr);

        for (const auto& [name, group] : config_.cluster().groups()) {
            createGroupChain(commands, clusterTable(), group, name, Direction::In);
            createGroupChain(commands, clusterTable(), group, name, Direction::Out);
        }

        createClusterRules(commands, Direction::In);
        createClusterRules(commands, Direction::Out);

        Logger::debug(kComponent, "generating host firewall config");

        setupCtHelper(commands);
        handleHostOptions(commands);

        createHostRules(commands, Direction::In);
        createHostRules(commands, Direction::Out);
    } else {
        commands.append(Command::deleteTable(clusterTable()));
    }

    std::vector<const GuestConfig*> enabled_guests;
    for (const auto& [vmid, guest] : config_.guests()) {
        if (guest.isEnabled()) {
            enabled_guests.push_back(&guest);
        }
    }

    if (!enabled_guests.empty()) {
        Logger::info(kComponent, "creating guest configuration");

        createIpsets(commands, config_.cluster().ipsets(), guestTable(), nullptr);

        for (const auto& [name, group] : config_.cluster().groups()) {
            createGroupChain(commands, guestTable(), group, name, Direction::In);
            createGroupChain(commands, guestTable(), group, name, Direction::Out);
        }
    } else {
        commands.append(Command::deleteTable(guestTable()));
    }

    for (const GuestConfig* guest : enabled_guests) {
        Logger::debug(kComponent, "generating firewall config for VM #" + std::to_string(guest->vmid()));

        createGuestChain(commands, guest->vmid(), Direction::In);
        createGuestChain(commands, guest->vmid(), Direction::Out);

        createIpsets(commands, guest->ipsets(), guestTable(), guest);

        handleGuestOptions(commands, *guest);

        createGuestRules(commands, *guest, Direction::In);
        createGuestRules(commands, *guest, Direction::Out);
    }

    return commands;
}

void Firewall::createIpsets(CommandList& commands, const std::map<std::string, IpSet>& ipsets,
                            const TableName& table, const GuestConfig* guest) const {
    std::optional<uint32_t> vmid;
    if (guest != nullptr) {
        vmid = guest->vmid();
    }

    ObjectEnv env{table, config_, vmid};

    for (const auto& [name, ipset] : ipsets) {
        if (ipset.kind().isDeviceFilter()) {
            continue;
        }

        Logger::info(kComponent, "creating ipset " + name + " in table " + table.name);
        commands.extend(ObjectSynthesizer::ipsetObjects(ipset, env));
    }

    if (guest == nullptr) {
        return;
    }

    for (const auto& [index, device] : guest->networkConfig().devices()) {
        std::string filter_name = "ipfilter-net" + std::to_string(index);

        auto it = ipsets.find(filter_name);
        if (it != ipsets.end()) {
            Logger::debug(kComponent, "creating ipfilter for guest #" + std::to_string(*vmid) +
                                          " net" + std::to_string(index));

            commands.extend(ObjectSynthesizer::ipsetObjects(it->second, env));
            createIpfilterRules(commands, *vmid, it->second);
        } else if (guest->options().ipfilter) {
            Logger::debug(kComponent, "generating default ipfilter for guest #" + std::to_string(*vmid) +
                                          " net" + std::to_string(index));

            std::vector<IpsetEntry> entries;
            entries.push_back(IpsetEntry{false, IpEntry(Cidr(device.mac_address.eui64LinkLocalAddress(), 128)), ""});
            if (device.ip) {
                entries.push_back(IpsetEntry{false, IpEntry(*device.ip), ""});
            }
            if (device.ip6) {
                entries.push_back(IpsetEntry{false, IpEntry(*device.ip6), ""});
            }

            IpSet ipset(IpsetName(ConfigScope::Guest, filter_name), std::move(entries));
            commands.extend(ObjectSynthesizer::ipsetObjects(ipset, env));
            createIpfilterRules(commands, *vmid, ipset);
        }
    }
}

void Firewall::createIpfilterRules(CommandList& commands, uint32_t vmid, const IpSet& ipset) const {
    for (Direction direction : {Direction::In, Direction::Out}) {
        ChainName chain = guestChain(direction, vmid);
        RuleEnv env{chain, direction, config_, vmid};
        appendRules(commands, RuleCompiler::compileIpfilter(ipset, env), chain);
    }
}

void Firewall::createGroupChain(CommandList& commands, const TableName& table, const Group& group,
                                const std::string& name, Direction direction) const {
    Logger::info(kComponent, "creating group chain " + name + " in table " + table.name + " " +
                                 directionToString(direction));

    ChainName chain = groupChain(table, name, direction);
    RuleEnv env{chain, direction, config_, std::nullopt};

    commands.append(Command::addChain(chain));
    commands.append(Command::flushChain(chain));

    for (const auto& rule : group.rules) {
        appendRules(commands, RuleCompiler::compileRule(rule, env), chain);
    }
}

void Firewall::createClusterRules(CommandList& commands, Direction direction) const {
    Logger::info(kComponent, "creating cluster chain " + directionToString(direction));

    ChainName chain = clusterChain(direction);
    RuleEnv env{chain, direction, config_, std::nullopt};

    for (const auto& rule : config_.cluster().rules()) {
        appendRules(commands, RuleCompiler::compileRule(rule, env), chain);
    }

    Verdict policy = config_.cluster().defaultPolicy(direction);
    createLogRule(commands, config_.host().logLevel(direction), chain, policy, std::nullopt);
    commands.append(addRule(chain, {RuleCompiler::generateVerdict(policy, env)}));
}

void Firewall::createHostRules(CommandList& commands, Direction direction) const {
    Logger::info(kComponent, "creating host chain " + directionToString(direction));

    ChainName chain = hostChain(direction);
    RuleEnv env{chain, direction, config_, std::nullopt};

    for (const auto& rule : config_.host().rules()) {
        appendRules(commands, RuleCompiler::compileRule(rule, env), chain);
    }
}

void Firewall::createGuestChain(CommandList& commands, uint32_t vmid, Direction direction) const {
    Logger::info(kComponent, "creating guest chain #" + std::to_string(vmid) + " " +
                                 directionToString(direction));

    ChainName chain = guestChain(direction, vmid);
    commands.append(Command::addChain(chain));
    commands.append(Command::flushChain(chain));
}

void Firewall::createGuestRules(CommandList& commands, const GuestConfig& guest, Direction direction) const {
    uint32_t vmid = guest.vmid();
    Logger::info(kComponent, "creating guest rules #" + std::to_string(vmid) + " " +
                                 directionToString(direction));

    ChainName chain = guestChain(direction, vmid);
    RuleEnv env{chain, direction, config_, vmid};

    for (const auto& rule : guest.rules()) {
        appendRules(commands, RuleCompiler::compileRule(rule, env), chain);
    }

    std::vector<std::pair<Json::Value, Json::Value>> map_elements;
    for (const auto& [index, device] : guest.networkConfig().devices()) {
        if (device.firewall) {
            map_elements.emplace_back(Json::Value(guest.ifaceNameByIndex(index)),
                                      Statement::goTo(chain.name));
        }
    }

    if (!map_elements.empty()) {
        commands.append(Command::addMapElements(guestVmap(direction), map_elements));
    }

    if (direction == Direction::In) {
        commands.append(addRule(chain, {Statement::jump("after-vm-in")}));
    }

    Verdict policy = guest.defaultPolicy(direction);
    createLogRule(commands, guest.logLevel(direction), chain, policy, vmid);
    commands.append(addRule(chain, {RuleCompiler::generateVerdict(policy, env)}));
}

void Firewall::setupCtHelper(CommandList& commands) const {
    const std::vector<std::string>& helpers = config_.host().options().nf_conntrack_helpers;
    if (helpers.empty()) {
        return;
    }

    ChainName chain = hostConntrackChain();
    ObjectEnv object_env{chain.table, config_, std::nullopt};
    RuleEnv rule_env{chain, Direction::In, config_, std::nullopt};

    for (const auto& name : helpers) {
        Logger::debug(kComponent, "adding conntrack helper: " + name);

        const CtHelperMacro* helper = CtHelperTable::find(name);
        if (helper == nullptr) {
            throw std::runtime_error("provided invalid helper macro name: " + name);
        }

        commands.extend(ObjectSynthesizer::ctHelperObjects(*helper, object_env));
        appendRules(commands, RuleCompiler::compileCtHelper(*helper, rule_env), chain);
    }
}

void Firewall::handleHostOptions(CommandList& commands) const {
    Logger::info(kComponent, "setting host options");

    const HostOptions& options = config_.host().options();
    ChainName chain_in = hostOptionChain(Direction::In);
    ChainName chain_out = hostOptionChain(Direction::Out);

    if (options.ndp) {
        commands.append(addRule(chain_in, {Statement::jump("allow-ndp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("allow-ndp-out")}));
    } else {
        commands.append(addRule(chain_in, {Statement::jump("block-ndp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("block-ndp-out")}));
    }

    if (options.protection_synflood) {
        Logger::debug(kComponent, "set block_synflood");

        std::vector<Json::Value> limit = {
            Statement::limit(static_cast<uint64_t>(options.protection_synflood_rate), RateUnit::Second,
                             static_cast<uint64_t>(options.protection_synflood_burst), true),
        };

        ChainName synflood = synfloodLimitChain();
        commands.append(addRule(chain_in, {Statement::jump("block-synflood")}));
        commands.append(addRule(synflood, {
            Statement::setUpdate(Expression::payload("ip", "saddr"), "v4-synflood-limit", limit),
            Statement::drop(),
        }));
        commands.append(addRule(synflood, {
            Statement::setUpdate(Expression::payload("ip6", "saddr"), "v6-synflood-limit", limit),
            Statement::drop(),
        }));
    }

    if (options.tcpflags) {
        Logger::debug(kComponent, "set block_invalid_tcp");

        commands.append(addRule(chain_in, {Statement::jump("block-invalid-tcp")}));
        createLogRule(commands, options.tcp_flags_log_level, logInvalidTcpChain(), Verdict::Drop,
                      std::nullopt);
    }

    if (options.nosmurfs) {
        Logger::debug(kComponent, "set block_smurfs");

        commands.append(addRule(chain_in, {Statement::jump("block-smurfs")}));
        createLogRule(commands, options.smurf_log_level, logSmurfsChain(), Verdict::Drop, std::nullopt);
    }

    if (config_.host().blockInvalidConntrack()) {
        Logger::debug(kComponent, "set block_invalid_conntrack");
        commands.append(addRule(chain_in, {Statement::jump("block-conntrack-invalid")}));
    }

    if (options.nf_conntrack_max) {
        writeTunable("nf_conntrack_max", kConntrackMaxFile, std::to_string(*options.nf_conntrack_max));
    }

    if (options.nf_conntrack_tcp_timeout_established) {
        writeTunable("nf_conntrack_tcp_timeout_established", kConntrackTimeoutEstablishedFile,
                     std::to_string(*options.nf_conntrack_tcp_timeout_established));
    }

    if (options.nf_conntrack_tcp_timeout_syn_recv) {
        writeTunable("nf_conntrack_tcp_timeout_syn_recv", kConntrackTimeoutSynRecvFile,
                     std::to_string(*options.nf_conntrack_tcp_timeout_syn_recv));
    }

    writeTunable("conntrack_log_file", host_access_.conntrack_log_flag,
                 options.log_nf_conntrack ? "1" : "0");
}

void Firewall::handleGuestOptions(CommandList& commands, const GuestConfig& guest) const {
    const GuestOptions& options = guest.options();
    ChainName chain_in = guestChain(Direction::In, guest.vmid());
    ChainName chain_out = guestChain(Direction::Out, guest.vmid());

    if (options.macfilter) {
        Logger::debug(kComponent, "setting macfilter for guest #" + std::to_string(guest.vmid()));

        std::vector<Json::Value> mac_addresses;
        for (const auto& [index, device] : guest.networkConfig().devices()) {
            mac_addresses.push_back(Expression::concat({
                Json::Value(guest.ifaceNameByIndex(index)),
                Json::Value(device.mac_address.toString()),
            }));
        }

        if (!mac_addresses.empty()) {
            for (const std::string field : {"saddr", "saddr ether"}) {
                std::string protocol = field == "saddr" ? "ether" : "arp";
                Json::Value source = Expression::concat({
                    Expression::meta("iifname"),
                    Expression::payload(protocol, field),
                });
                commands.append(addRule(chain_out, {
                    Statement::matchNe(source, Expression::set(mac_addresses)),
                    Statement::drop(),
                }));
            }
        }
    }

    if (options.dhcp) {
        commands.append(addRule(chain_in, {Statement::jump("allow-dhcp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("allow-dhcp-out")}));
    } else {
        commands.append(addRule(chain_in, {Statement::jump("block-dhcp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("block-dhcp-out")}));
    }

    if (options.ndp) {
        commands.append(addRule(chain_in, {Statement::jump("allow-ndp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("allow-ndp-out")}));
    } else {
        commands.append(addRule(chain_in, {Statement::jump("block-ndp-in")}));
        commands.append(addRule(chain_out, {Statement::jump("block-ndp-out")}));
    }

    commands.append(addRule(chain_out, {Statement::jump(options.radv ? "allow-ra-out" : "block-ra-out")}));

    // Outgoing ARP passes unless the MAC filter dropped it
    commands.append(addRule(chain_out, {
        Statement::matchEq(Expression::payload("ether", "type"), Json::Value("arp")),
        Statement::accept(),
    }));
}

void Firewall::createLogRule(CommandList& commands, RuleLogLevel level, const ChainName& chain,
                             Verdict verdict, std::optional<uint32_t> vmid) const {
    std::optional<int> nflog = nflogLevel(level);
    if (!nflog) {
        return;
    }

    std::vector<Json::Value> statements;
    if (std::optional<LogRateLimit> limit = config_.cluster().logRateLimit()) {
        statements.push_back(Statement::fromLogRateLimit(*limit));
    }
    statements.push_back(Statement::log(Statement::logPrefix(vmid, *nflog, chain.name, verdict), 0));

    commands.append(Command::addRule(chain, statements));
}

void Firewall::writeTunable(const std::string& name, const std::string& path, const std::string& value) const {
    Logger::debug(kComponent, "set " + name);

    if (!host_access_.write_tunable) {
        return;
    }

    if (!host_access_.write_tunable(path, value)) {
        Logger::warn(kComponent, "cannot set " + name);
    }
}

} // namespace nftfw
