/**
 * @file macro_tables.hpp
 * @brief Bundled firewall macros and conntrack helper definitions
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Macros ("SSH", "HTTP", ...) expand to one or more protocol matches.
 * Conntrack helpers ("ftp", "sip", ...) name a kernel helper together with
 * the ports it watches. Both tables are compiled into the binary as JSON
 * and parsed once per process on first lookup.
 */

#pragma once

#include "address.hpp"
#include "rule_match.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @struct FwMacro
 * @brief Expansion of a rule macro
 */
struct FwMacro {
    std::string description;
    std::vector<Protocol> code;   ///< One compiled candidate per entry
};

/**
 * @class MacroTable
 * @brief Process wide macro lookup
 */
class MacroTable {
public:
    /// @return macro by exact name, nullptr if unknown
    static const FwMacro* find(const std::string& name);

    static const std::map<std::string, FwMacro>& all();

    /**
     * @brief Parse macro definitions
     *
     * Format: {"NAME": {"desc": "...", "code": [{"proto": "tcp", "dport": "22"}]}}.
     * Macros with invalid entries are logged and skipped.
     * @throws std::runtime_error if the document is not valid JSON
     */
    static std::map<std::string, FwMacro> parse(const std::string& json);
};

/**
 * @class CtHelperMacro
 * @brief Conntrack helper with the ports and families it applies to
 */
class CtHelperMacro {
public:
    /**
     * @brief Parse {"name": "ftp", "v4": true, "v6": true, "tcp": 21}
     * @throws std::invalid_argument without tcp/udp port or without family
     */
    static CtHelperMacro fromJson(const std::string& name, std::optional<bool> v4,
                                  std::optional<bool> v6, std::optional<uint16_t> tcp,
                                  std::optional<uint16_t> udp);

    const std::string& name() const { return name_; }

    /// std::nullopt when the helper works for both families
    std::optional<Family> family() const { return family_; }

    const std::optional<Protocol>& tcp() const { return tcp_; }
    const std::optional<Protocol>& udp() const { return udp_; }

    /// "helper-<name>-tcp"
    std::string tcpHelperName() const { return helperName("tcp"); }
    /// "helper-<name>-udp"
    std::string udpHelperName() const { return helperName("udp"); }

private:
    std::string helperName(const std::string& protocol) const {
        return "helper-" + name_ + "-" + protocol;
    }

    std::string name_;
    std::optional<Family> family_;
    std::optional<Protocol> tcp_;
    std::optional<Protocol> udp_;
};

/**
 * @class CtHelperTable
 * @brief Process wide conntrack helper lookup
 */
class CtHelperTable {
public:
    static const CtHelperMacro* find(const std::string& name);

    /// @throws std::runtime_error if the document is not a JSON array
    static std::map<std::string, CtHelperMacro> parse(const std::string& json);
};

} // namespace nftfw
