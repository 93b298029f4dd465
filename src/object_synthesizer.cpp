#include "object_synthesizer.hpp"
#include "logger.hpp"
#include "nft_command.hpp"
#include "nft_expression.hpp"
#include <stdexcept>

namespace nftfw {

namespace {

const std::string kComponent = "ObjectSynthesizer";

/// Element expression of an entry, none if it belongs to another family
std::optional<Json::Value> entryElement(const IpsetEntry& entry, Family family, const ObjectEnv& env) {
    if (const auto* ip = std::get_if<IpEntry>(&entry.address)) {
        if (ip->family() != family) {
            return std::nullopt;
        }
        return Expression::fromIpEntry(*ip);
    }

    const AliasName& name = std::get<AliasName>(entry.address);
    const Alias* alias = env.alias(name);
    if (alias == nullptr) {
        throw std::runtime_error("could not find alias " + name.toString() + " in environment");
    }

    if (alias->address.family() != family) {
        return std::nullopt;
    }
    return Expression::prefix(alias->address);
}

} // anonymous namespace

std::vector<Json::Value> ObjectSynthesizer::ipsetObjects(const IpSet& ipset, const ObjectEnv& env) {
    std::vector<Json::Value> commands;
    Logger::debug(kComponent, "generating objects for ipset " + ipset.name().toString());

    for (Family family : tableFamilies(env.table.family)) {
        std::vector<Json::Value> elements;
        std::vector<Json::Value> nomatch_elements;

        for (const auto& entry : ipset.entries()) {
            std::optional<Json::Value> element = entryElement(entry, family, env);
            if (!element) {
                continue;
            }

            if (entry.nomatch) {
                nomatch_elements.push_back(std::move(*element));
            } else {
                elements.push_back(std::move(*element));
            }
        }

        SetName set{env.table, ipset.name().nftSetName(family, env.vmid, false)};
        SetName nomatch{env.table, ipset.name().nftSetName(family, env.vmid, true)};

        commands.push_back(Command::addSet(set, family));
        commands.push_back(Command::flushSet(set));
        commands.push_back(Command::addSet(nomatch, family));
        commands.push_back(Command::flushSet(nomatch));

        if (!elements.empty()) {
            commands.push_back(Command::addElements(set, elements));
        }
        if (!nomatch_elements.empty()) {
            commands.push_back(Command::addElements(nomatch, nomatch_elements));
        }
    }

    return commands;
}

std::vector<Json::Value> ObjectSynthesizer::ctHelperObjects(const CtHelperMacro& helper, const ObjectEnv& env) {
    std::vector<Json::Value> commands;

    if (helper.tcp()) {
        commands.push_back(Command::addCtHelper(env.table, helper.tcpHelperName(), helper.name(),
                                                "tcp", helper.family()));
    }

    if (helper.udp()) {
        commands.push_back(Command::addCtHelper(env.table, helper.udpHelperName(), helper.name(),
                                                "udp", helper.family()));
    }

    return commands;
}

} // namespace nftfw
