/**
 * @file nft_command.hpp
 * @brief nftables JSON commands and command batches
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "address.hpp"
#include "nft_types.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nftfw {

/**
 * @class Command
 * @brief Static factory for single batch commands
 *
 * Each method returns one element of the "nftables" array, for example
 * {"add": {"chain": {"family": "inet", "table": "t", "name": "c"}}}.
 */
class Command {
public:
    static Json::Value addTable(const TableName& table);
    static Json::Value flushTable(const TableName& table);
    static Json::Value deleteTable(const TableName& table);

    static Json::Value addChain(const ChainName& chain);
    static Json::Value flushChain(const ChainName& chain);
    static Json::Value deleteChain(const ChainName& chain);

    /// Rule built from the statements in order
    static Json::Value addRule(const ChainName& chain, const std::vector<Json::Value>& statements);

    /**
     * @brief Interval set of addresses with auto-merge enabled
     */
    static Json::Value addSet(const SetName& set, Family family);
    static Json::Value flushSet(const SetName& set);

    /// Elements must not be empty
    static Json::Value addElements(const SetName& set, const std::vector<Json::Value>& elements);

    static Json::Value flushMap(const SetName& map);

    /// Verdict map elements as [key, verdict] pairs
    static Json::Value addMapElements(const SetName& map,
                                      const std::vector<std::pair<Json::Value, Json::Value>>& elements);

    /**
     * @brief Conntrack helper object
     * @param type Kernel helper name, e.g. "ftp"
     * @param protocol "tcp" or "udp"
     * @param l3proto Family restriction, none for both
     */
    static Json::Value addCtHelper(const TableName& table, const std::string& name,
                                   const std::string& type, const std::string& protocol,
                                   std::optional<Family> l3proto);

    /// {"list": {"chains": null}}
    static Json::Value listChains();
};

/**
 * @class CommandList
 * @brief Ordered batch of commands submitted in one engine call
 */
class CommandList {
public:
    CommandList() = default;
    explicit CommandList(std::vector<Json::Value> commands) : commands_(std::move(commands)) {}

    void append(Json::Value command) { commands_.push_back(std::move(command)); }
    void extend(const CommandList& other);
    void extend(const std::vector<Json::Value>& commands);

    const std::vector<Json::Value>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

    /// {"nftables": [...]}
    Json::Value toJson() const;

    /// Compact single line document for the engine
    std::string toString() const;

    /// Indented document for humans
    std::string toStyledString() const;

private:
    std::vector<Json::Value> commands_;
};

} // namespace nftfw
