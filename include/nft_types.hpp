/**
 * @file nft_types.hpp
 * @brief Table, chain and set identifiers of the packet filter engine
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "address.hpp"
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @enum TableFamily
 * @brief nftables address family of a table
 */
enum class TableFamily {
    Ip,
    Ip6,
    Inet,
    Arp,
    Bridge,
    Netdev
};

std::string tableFamilyToString(TableFamily family);

/// @throws std::invalid_argument for unknown family names
TableFamily parseTableFamily(const std::string& text);

/**
 * @brief IP families a table of the given family can carry
 *
 * ip, arp: V4; ip6: V6; inet, bridge, netdev: V4 and V6.
 */
std::vector<Family> tableFamilies(TableFamily family);

bool tableSupports(TableFamily table, Family family);

/**
 * @struct TableName
 * @brief Fully qualified table
 */
struct TableName {
    TableFamily family;
    std::string name;

    /// Adds "family" and "table" keys to a command object
    void appendTo(Json::Value& object) const;

    bool operator==(const TableName& other) const {
        return family == other.family && name == other.name;
    }
};

/**
 * @struct ChainName
 * @brief Chain within a table
 */
struct ChainName {
    TableName table;
    std::string name;

    /// Command object with family, table and name
    Json::Value toJson() const;
};

/**
 * @struct SetName
 * @brief Named set or map within a table
 */
struct SetName {
    TableName table;
    std::string name;

    Json::Value toJson() const;
};

/**
 * @struct ListChain
 * @brief Chain entry of a "list chains" reply
 */
struct ListChain {
    TableFamily family;
    std::string table;
    std::string name;
    std::optional<int64_t> handle;

    /// Base chain metadata, unset for regular chains
    std::optional<std::string> type;
    std::optional<std::string> hook;
    std::optional<int64_t> prio;
    std::optional<std::string> policy;

    bool isBaseChain() const { return hook.has_value(); }

    ChainName chainName() const { return ChainName{TableName{family, table}, name}; }

    /**
     * @brief Extract the chain entries from a JSON reply
     *
     * Non-chain entries (metainfo) and chains of unknown families are
     * skipped.
     * @return chains keyed by name
     */
    static std::multimap<std::string, ListChain> fromReply(const Json::Value& reply);
};

} // namespace nftfw
