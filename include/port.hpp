/**
 * @file port.hpp
 * @brief Port numbers, ranges and service name resolution
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @class NamedPorts
 * @brief Service name to port lookup backed by /etc/services
 *
 * The table is read once per process on first use. A missing or unreadable
 * services file yields an empty table; numeric ports keep working.
 */
class NamedPorts {
public:
    static const NamedPorts& instance();

    /// Parse services(5) text: "name port/proto [aliases...] [# comment]"
    static NamedPorts fromString(const std::string& content);

    /// @return port for a service name or alias, if known
    std::optional<uint16_t> find(const std::string& name) const;

    size_t size() const { return ports_.size(); }

private:
    std::map<std::string, uint16_t> ports_;
};

/**
 * @class PortEntry
 * @brief A single port or an inclusive range "start:end"
 */
class PortEntry {
public:
    explicit PortEntry(uint16_t port) : start_(port), end_(port) {}

    /// @throws std::invalid_argument if start > end
    PortEntry(uint16_t start, uint16_t end);

    /**
     * @brief Parse "22", "ssh", "1024:2048" or "ssh:http"
     * @throws std::invalid_argument on unknown names or reversed ranges
     */
    static PortEntry parse(const std::string& text);

    bool isRange() const { return start_ != end_; }
    uint16_t start() const { return start_; }
    uint16_t end() const { return end_; }

    std::string toString() const;

    bool operator==(const PortEntry& other) const {
        return start_ == other.start_ && end_ == other.end_;
    }

private:
    uint16_t start_;
    uint16_t end_;
};

/**
 * @class PortList
 * @brief Non-empty comma separated list of port entries
 */
class PortList {
public:
    explicit PortList(std::vector<PortEntry> entries);

    static PortList parse(const std::string& text);

    const std::vector<PortEntry>& entries() const { return entries_; }

    std::string toString() const;

    bool operator==(const PortList& other) const { return entries_ == other.entries_; }

private:
    std::vector<PortEntry> entries_;
};

} // namespace nftfw
