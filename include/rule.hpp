/**
 * @file rule.hpp
 * @brief Firewall rule lines and security groups
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * A rule line is either a match rule ("IN ACCEPT -p tcp --dport 22") or a
 * group reference ("GROUP webservers -i net0"). Either form may be disabled
 * with a leading '|' and may carry a trailing "# comment".
 */

#pragma once

#include "rule_match.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nftfw {

/**
 * @struct RuleGroup
 * @brief Reference to a security group, compiled to a jump
 */
struct RuleGroup {
    std::string group;                ///< Name of the referenced [group]
    std::optional<std::string> iface; ///< Only option permitted on group rules

    static RuleGroup parse(const std::string& line);
};

/**
 * @class Rule
 * @brief One line of a [RULES] or [group] section
 */
class Rule {
public:
    Rule(RuleMatch match, bool disabled = false, std::string comment = "");
    Rule(RuleGroup group, bool disabled = false, std::string comment = "");

    /**
     * @brief Parse a complete rule line
     * @throws std::invalid_argument on malformed lines
     */
    static Rule parse(const std::string& line);

    bool isDisabled() const { return disabled_; }
    const std::string& comment() const { return comment_; }

    bool isGroup() const { return std::holds_alternative<RuleGroup>(kind_); }
    const RuleGroup& group() const { return std::get<RuleGroup>(kind_); }
    const RuleMatch& match() const { return std::get<RuleMatch>(kind_); }

    /// Interface option of either form
    const std::optional<std::string>& iface() const;

private:
    bool disabled_;
    std::variant<RuleMatch, RuleGroup> kind_;
    std::string comment_;
};

/**
 * @struct Group
 * @brief Security group: a named list of rules from the cluster config
 */
struct Group {
    std::vector<Rule> rules;
    std::string comment;
};

} // namespace nftfw
