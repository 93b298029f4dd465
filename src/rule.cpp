#include "rule.hpp"
#include <stdexcept>

namespace nftfw {

RuleGroup RuleGroup::parse(const std::string& line) {
    auto keyword = matchName(line);
    if (!keyword) {
        throw std::invalid_argument("expected a leading keyword in rule group");
    }
    if (toUpper(keyword->first) != "GROUP") {
        throw std::invalid_argument("expected keyword GROUP");
    }

    auto name = matchName(trim(keyword->second));
    if (!name) {
        throw std::invalid_argument("expected a name for rule group");
    }

    RuleOptions options = RuleOptions::parse(name->second);

    // Only the interface may narrow a group jump
    if (options.proto || options.dport || options.sport || options.dest ||
        options.source || options.log || options.icmp_type) {
        throw std::invalid_argument("only interface parameter is permitted for group rules");
    }

    return RuleGroup{name->first, options.iface};
}

Rule::Rule(RuleMatch match, bool disabled, std::string comment)
    : disabled_(disabled), kind_(std::move(match)), comment_(std::move(comment)) {}

Rule::Rule(RuleGroup group, bool disabled, std::string comment)
    : disabled_(disabled), kind_(std::move(group)), comment_(std::move(comment)) {}

Rule Rule::parse(const std::string& input) {
    if (input.find_first_of("\r\n") != std::string::npos) {
        throw std::invalid_argument("rule must not contain any newlines");
    }

    std::string line = trim(input);
    std::string comment;

    auto hash = input.rfind('#');
    if (hash != std::string::npos && hash + 1 < input.size()) {
        line = trim(input.substr(0, hash));
        comment = trim(input.substr(hash + 1));
    }

    bool disabled = false;
    if (!line.empty() && line[0] == '|') {
        disabled = true;
        line = trim(line.substr(1));
    }

    if (line.compare(0, 5, "GROUP") == 0) {
        return Rule(RuleGroup::parse(line), disabled, comment);
    }
    return Rule(RuleMatch::parse(line), disabled, comment);
}

const std::optional<std::string>& Rule::iface() const {
    if (isGroup()) {
        return group().iface;
    }
    return match().iface;
}

} // namespace nftfw
