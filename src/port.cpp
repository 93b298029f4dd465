#include "port.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nftfw {

namespace {

constexpr const char* kServicesFile = "/etc/services";

std::optional<uint16_t> parsePortNumber(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    unsigned long value = std::stoul(text);
    if (value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

uint16_t resolvePort(const std::string& text) {
    if (auto number = parsePortNumber(text)) {
        return *number;
    }
    if (auto named = NamedPorts::instance().find(text)) {
        return *named;
    }
    throw std::invalid_argument("unknown port: " + text);
}

} // namespace

// NamedPorts

const NamedPorts& NamedPorts::instance() {
    static std::once_flag flag;
    static NamedPorts table;

    std::call_once(flag, []() {
        std::ifstream file(kServicesFile);
        if (!file) {
            Logger::warn("NamedPorts", std::string("cannot read ") + kServicesFile +
                         ", only numeric ports are available");
            return;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        table = fromString(buffer.str());
    });

    return table;
}

NamedPorts NamedPorts::fromString(const std::string& content) {
    NamedPorts result;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream fields(line);
        std::string name;
        std::string port_proto;
        if (!(fields >> name >> port_proto)) {
            continue;
        }

        auto port = parsePortNumber(port_proto.substr(0, port_proto.find('/')));
        if (!port) {
            continue;
        }

        // first mapping wins, tcp and udp usually share numbers
        result.ports_.emplace(name, *port);

        std::string alias;
        while (fields >> alias) {
            result.ports_.emplace(alias, *port);
        }
    }

    return result;
}

std::optional<uint16_t> NamedPorts::find(const std::string& name) const {
    auto it = ports_.find(name);
    if (it == ports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// PortEntry

PortEntry::PortEntry(uint16_t start, uint16_t end) : start_(start), end_(end) {
    if (start_ > end_) {
        throw std::invalid_argument("invalid port range " + std::to_string(start_) + ":" +
                                    std::to_string(end_) + ", start is greater than end");
    }
}

PortEntry PortEntry::parse(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return PortEntry(resolvePort(text));
    }
    return PortEntry(resolvePort(text.substr(0, colon)), resolvePort(text.substr(colon + 1)));
}

std::string PortEntry::toString() const {
    if (isRange()) {
        return std::to_string(start_) + ":" + std::to_string(end_);
    }
    return std::to_string(start_);
}

// PortList

PortList::PortList(std::vector<PortEntry> entries) : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw std::invalid_argument("empty port list");
    }
}

PortList PortList::parse(const std::string& text) {
    std::vector<PortEntry> entries;
    std::istringstream stream(text);
    std::string element;

    while (std::getline(stream, element, ',')) {
        if (element.empty()) {
            throw std::invalid_argument("empty element in port list: " + text);
        }
        entries.push_back(PortEntry::parse(element));
    }
    return PortList(std::move(entries));
}

std::string PortList::toString() const {
    std::string result;
    for (const auto& entry : entries_) {
        if (!result.empty()) {
            result += ",";
        }
        result += entry.toString();
    }
    return result;
}

} // namespace nftfw
