#include "nft_types.hpp"
#include <stdexcept>

namespace nftfw {

std::string tableFamilyToString(TableFamily family) {
    switch (family) {
        case TableFamily::Ip: return "ip";
        case TableFamily::Ip6: return "ip6";
        case TableFamily::Inet: return "inet";
        case TableFamily::Arp: return "arp";
        case TableFamily::Bridge: return "bridge";
        case TableFamily::Netdev: return "netdev";
    }
    return "inet";
}

TableFamily parseTableFamily(const std::string& text) {
    if (text == "ip") return TableFamily::Ip;
    if (text == "ip6") return TableFamily::Ip6;
    if (text == "inet") return TableFamily::Inet;
    if (text == "arp") return TableFamily::Arp;
    if (text == "bridge") return TableFamily::Bridge;
    if (text == "netdev") return TableFamily::Netdev;
    throw std::invalid_argument("unknown table family: " + text);
}

std::vector<Family> tableFamilies(TableFamily family) {
    switch (family) {
        case TableFamily::Ip:
        case TableFamily::Arp:
            return {Family::V4};
        case TableFamily::Ip6:
            return {Family::V6};
        case TableFamily::Inet:
        case TableFamily::Bridge:
        case TableFamily::Netdev:
            return {Family::V4, Family::V6};
    }
    return {};
}

bool tableSupports(TableFamily table, Family family) {
    for (Family supported : tableFamilies(table)) {
        if (supported == family) {
            return true;
        }
    }
    return false;
}

void TableName::appendTo(Json::Value& object) const {
    object["family"] = tableFamilyToString(family);
    object["table"] = name;
}

Json::Value ChainName::toJson() const {
    Json::Value object(Json::objectValue);
    table.appendTo(object);
    object["name"] = name;
    return object;
}

Json::Value SetName::toJson() const {
    Json::Value object(Json::objectValue);
    table.appendTo(object);
    object["name"] = name;
    return object;
}

std::multimap<std::string, ListChain> ListChain::fromReply(const Json::Value& reply) {
    std::multimap<std::string, ListChain> chains;

    const Json::Value& entries = reply["nftables"];
    if (!entries.isArray()) {
        return chains;
    }

    for (const auto& entry : entries) {
        if (!entry.isObject() || !entry.isMember("chain")) {
            continue;
        }

        const Json::Value& chain = entry["chain"];
        ListChain listed;
        try {
            listed.family = parseTableFamily(chain["family"].asString());
        } catch (const std::invalid_argument&) {
            continue;
        }
        listed.table = chain["table"].asString();
        listed.name = chain["name"].asString();
        if (chain.isMember("handle")) {
            listed.handle = chain["handle"].asInt64();
        }
        if (chain["type"].isString()) {
            listed.type = chain["type"].asString();
        }
        if (chain["hook"].isString()) {
            listed.hook = chain["hook"].asString();
        }
        if (chain["prio"].isIntegral()) {
            listed.prio = chain["prio"].asInt64();
        }
        if (chain["policy"].isString()) {
            listed.policy = chain["policy"].asString();
        }

        chains.emplace(listed.name, listed);
    }

    return chains;
}

} // namespace nftfw
