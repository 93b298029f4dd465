#include "ipset.hpp"
#include "policy_types.hpp"
#include <cctype>
#include <stdexcept>

namespace nftfw {

namespace {

std::pair<ConfigScope, std::string> splitScope(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        throw std::invalid_argument("missing scope (dc/ or guest/) in name: " + text);
    }

    std::string scope = text.substr(0, slash);
    std::string name = text.substr(slash + 1);

    ConfigScope parsed;
    if (scope == "dc") {
        parsed = ConfigScope::Datacenter;
    } else if (scope == "guest") {
        parsed = ConfigScope::Guest;
    } else {
        throw std::invalid_argument("invalid scope '" + scope + "' in name: " + text);
    }
    return {parsed, name};
}

// "<body> # comment" -> (trimmed body, trimmed comment)
std::pair<std::string, std::string> splitComment(const std::string& line) {
    auto hash = line.find('#');
    if (hash == std::string::npos) {
        return {trim(line), ""};
    }
    return {trim(line.substr(0, hash)), trim(line.substr(hash + 1))};
}

std::optional<int> deviceFilterIndex(const IpsetName& name) {
    static const std::string prefix = "ipfilter-net";

    if (name.scope() != ConfigScope::Guest || name.name().compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string suffix = name.name().substr(prefix.size());
    if (suffix.empty() || suffix.size() > 2 ||
        suffix.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    int index = std::stoi(suffix);
    if (index >= 31) {
        return std::nullopt;
    }
    return index;
}

} // namespace

std::string scopeToString(ConfigScope scope) {
    return scope == ConfigScope::Datacenter ? "dc" : "guest";
}

bool isValidObjectName(const std::string& name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

// AliasName

AliasName::AliasName(ConfigScope scope, std::string name)
    : scope_(scope), name_(std::move(name)) {
    if (!isValidObjectName(name_)) {
        throw std::invalid_argument("invalid alias name: " + name_);
    }
}

AliasName AliasName::parse(const std::string& text) {
    auto [scope, name] = splitScope(text);
    return AliasName(scope, name);
}

std::string AliasName::toString() const {
    return scopeToString(scope_) + "/" + name_;
}

// Alias

Alias Alias::parse(const std::string& line) {
    auto [body, comment] = splitComment(line);

    auto name = matchNonWhitespace(body);
    if (!name) {
        throw std::invalid_argument("missing alias name");
    }
    if (!isValidObjectName(name->first)) {
        throw std::invalid_argument("invalid alias name: " + name->first);
    }

    std::string address = trim(name->second);
    if (address.empty()) {
        throw std::invalid_argument("missing address for alias " + name->first);
    }
    if (address.find_first_of(" \t") != std::string::npos) {
        throw std::invalid_argument("unexpected trailing data in alias " + name->first);
    }

    return Alias{name->first, Cidr::parse(address), comment};
}

// IpsetName

IpsetName::IpsetName(ConfigScope scope, std::string name)
    : scope_(scope), name_(std::move(name)) {
    if (!isValidObjectName(name_)) {
        throw std::invalid_argument("invalid ipset name: " + name_);
    }
}

IpsetName IpsetName::parse(const std::string& text) {
    std::string value = (!text.empty() && text[0] == '+') ? text.substr(1) : text;
    auto [scope, name] = splitScope(value);
    return IpsetName(scope, name);
}

std::string IpsetName::nftSetName(Family family, std::optional<uint32_t> vmid, bool nomatch) const {
    std::string result = family == Family::V4 ? "v4-" : "v6-";

    if (scope_ == ConfigScope::Datacenter) {
        result += "dc";
    } else {
        if (!vmid) {
            throw std::runtime_error("guest ipset " + toString() + " referenced outside of a guest");
        }
        result += "guest-" + std::to_string(*vmid);
    }

    result += "/" + name_;
    if (nomatch) {
        result += "-nomatch";
    }
    return result;
}

std::string IpsetName::toString() const {
    return "+" + scopeToString(scope_) + "/" + name_;
}

// IpsetEntry

IpsetEntry IpsetEntry::parse(const std::string& line) {
    auto [body, comment] = splitComment(line);
    if (body.empty()) {
        throw std::invalid_argument("empty ipset entry");
    }

    bool nomatch = false;
    if (body[0] == '!') {
        nomatch = true;
        body = trim(body.substr(1));
    }

    if (IpAddress::tryParse(body.substr(0, body.find_first_of("/-")))) {
        return IpsetEntry{nomatch, IpEntry::parse(body), comment};
    }
    return IpsetEntry{nomatch, AliasName::parse(body), comment};
}

// IpSet

IpSet::IpSet(IpsetName name, std::vector<IpsetEntry> entries, std::string comment)
    : name_(std::move(name)), entries_(std::move(entries)), comment_(std::move(comment)) {
    if (auto index = deviceFilterIndex(name_)) {
        kind_.type = IpSetKind::Type::DeviceFilter;
        kind_.device_index = *index;
    }
}

} // namespace nftfw
