/**
 * @file ipset.hpp
 * @brief Named addresses (aliases) and named address sets (ipsets)
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Aliases name a single network. IP sets name a collection of networks,
 * ranges and aliases, each optionally negated ("nomatch"). Both live either
 * in the datacenter scope (cluster config) or in a guest scope.
 */

#pragma once

#include "address.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nftfw {

/**
 * @enum ConfigScope
 * @brief Where an alias or ipset is declared
 */
enum class ConfigScope {
    Datacenter, ///< cluster.fw, written "dc/<name>"
    Guest       ///< <vmid>.fw, written "guest/<name>"
};

std::string scopeToString(ConfigScope scope);

/// Alias and ipset names: a letter followed by letters, digits, '-' or '_'
bool isValidObjectName(const std::string& name);

/**
 * @class AliasName
 * @brief Scoped reference to an alias, "dc/name" or "guest/name"
 */
class AliasName {
public:
    AliasName(ConfigScope scope, std::string name);

    /// @throws std::invalid_argument without a known scope prefix
    static AliasName parse(const std::string& text);

    ConfigScope scope() const { return scope_; }
    const std::string& name() const { return name_; }

    std::string toString() const;

    bool operator==(const AliasName& other) const {
        return scope_ == other.scope_ && name_ == other.name_;
    }

private:
    ConfigScope scope_;
    std::string name_;
};

/**
 * @struct Alias
 * @brief Line of an [ALIASES] section: "<name> <cidr> [# comment]"
 */
struct Alias {
    std::string name;     ///< Unscoped name
    Cidr address;         ///< Aliased network
    std::string comment;  ///< Optional comment, empty if absent

    static Alias parse(const std::string& line);
};

/**
 * @class IpsetName
 * @brief Scoped reference to an IP set, written "+dc/name" in rules
 */
class IpsetName {
public:
    IpsetName(ConfigScope scope, std::string name);

    /// Accepts "dc/name" or "guest/name", with or without the leading '+'
    static IpsetName parse(const std::string& text);

    ConfigScope scope() const { return scope_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Name of the backing nft set
     * @param family IPv4 sets are prefixed "v4-", IPv6 sets "v6-"
     * @param vmid Required for the guest scope
     * @param nomatch Name of the companion set holding negated entries
     * @throws std::runtime_error for a guest scoped set without vmid
     */
    std::string nftSetName(Family family, std::optional<uint32_t> vmid, bool nomatch = false) const;

    /// "+scope/name"
    std::string toString() const;

    bool operator==(const IpsetName& other) const {
        return scope_ == other.scope_ && name_ == other.name_;
    }

private:
    ConfigScope scope_;
    std::string name_;
};

/**
 * @struct IpsetEntry
 * @brief One line inside an [IPSET] section: "[!]<address|alias> [# comment]"
 */
struct IpsetEntry {
    bool nomatch = false;                          ///< Entry was prefixed with '!'
    std::variant<IpEntry, AliasName> address;      ///< Literal network/range or alias reference
    std::string comment;                           ///< Optional comment

    static IpsetEntry parse(const std::string& line);
};

/**
 * @struct IpSetKind
 * @brief Role of a set, decided once when the set is created
 *
 * Guest sets named "ipfilter-net<N>" (0 <= N < 31) restrict the source
 * addresses of guest device N instead of being ordinary match sets.
 */
struct IpSetKind {
    enum class Type {
        Ordinary,
        DeviceFilter
    };

    Type type = Type::Ordinary;
    int device_index = -1;   ///< Only meaningful for DeviceFilter

    bool isDeviceFilter() const { return type == Type::DeviceFilter; }
};

/**
 * @class IpSet
 * @brief Named collection of entries from an [IPSET <name>] section
 */
class IpSet {
public:
    IpSet(IpsetName name, std::vector<IpsetEntry> entries, std::string comment = "");

    const IpsetName& name() const { return name_; }
    const std::vector<IpsetEntry>& entries() const { return entries_; }
    const std::string& comment() const { return comment_; }
    const IpSetKind& kind() const { return kind_; }

    void addEntry(IpsetEntry entry) { entries_.push_back(std::move(entry)); }

private:
    IpsetName name_;
    std::vector<IpsetEntry> entries_;
    std::string comment_;
    IpSetKind kind_;
};

} // namespace nftfw
