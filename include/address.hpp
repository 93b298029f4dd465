/**
 * @file address.hpp
 * @brief IP and MAC address value types
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * Value types for addresses appearing in the firewall language: single
 * addresses, CIDR networks, ranges, comma separated lists and MAC
 * addresses. Parsing failures throw std::invalid_argument.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nftfw {

/**
 * @enum Family
 * @brief Address family of a value or of a compiled rule
 */
enum class Family {
    V4, ///< IPv4
    V6  ///< IPv6
};

std::string familyToString(Family family);

/**
 * @class IpAddress
 * @brief A single IPv4 or IPv6 address
 *
 * Stored as 16 raw bytes in network order; IPv4 addresses only use the
 * first four. Ordering compares family first, then bytes.
 */
class IpAddress {
public:
    IpAddress() = default;
    IpAddress(Family family, const std::array<uint8_t, 16>& bytes);

    /// @throws std::invalid_argument if text is neither IPv4 nor IPv6
    static IpAddress parse(const std::string& text);
    static std::optional<IpAddress> tryParse(const std::string& text);

    Family family() const { return family_; }
    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    /// @return 32 for IPv4, 128 for IPv6
    uint8_t width() const;

    std::string toString() const;

    bool operator==(const IpAddress& other) const;
    bool operator!=(const IpAddress& other) const { return !(*this == other); }
    bool operator<(const IpAddress& other) const;

private:
    Family family_ = Family::V4;
    std::array<uint8_t, 16> bytes_{};
};

/**
 * @class Cidr
 * @brief Address with prefix length
 *
 * The address is kept exactly as written; host bits are not cleared.
 * Text without a prefix length means a full-width mask.
 */
class Cidr {
public:
    /// @throws std::invalid_argument if mask exceeds the family width
    Cidr(const IpAddress& address, uint8_t mask);

    /// @throws std::invalid_argument on malformed text
    static Cidr parse(const std::string& text);

    const IpAddress& address() const { return address_; }
    uint8_t mask() const { return mask_; }
    Family family() const { return address_.family(); }

    /// True when the mask covers the whole address (a single host)
    bool isHost() const { return mask_ == address_.width(); }

    /// True when the first mask bits of both addresses match
    bool contains(const IpAddress& address) const;

    /// Same prefix with the host bits cleared
    Cidr network() const;

    /// Always "address/mask"
    std::string toString() const;

    bool operator==(const Cidr& other) const;
    bool operator!=(const Cidr& other) const { return !(*this == other); }

private:
    IpAddress address_;
    uint8_t mask_;
};

/**
 * @class IpRange
 * @brief Inclusive range "start-end" of one family with start < end
 */
class IpRange {
public:
    /// @throws std::invalid_argument on mixed families or start >= end
    IpRange(const IpAddress& start, const IpAddress& end);

    const IpAddress& start() const { return start_; }
    const IpAddress& end() const { return end_; }
    Family family() const { return start_.family(); }

    std::string toString() const;

    bool operator==(const IpRange& other) const;

private:
    IpAddress start_;
    IpAddress end_;
};

/**
 * @class IpEntry
 * @brief One element of an address list: a CIDR or a range
 */
class IpEntry {
public:
    explicit IpEntry(const Cidr& cidr) : value_(cidr) {}
    explicit IpEntry(const IpRange& range) : value_(range) {}

    /// "a-b" is parsed as a range, anything else as a CIDR
    static IpEntry parse(const std::string& text);

    Family family() const;
    bool isCidr() const { return std::holds_alternative<Cidr>(value_); }
    const Cidr& cidr() const { return std::get<Cidr>(value_); }
    const IpRange& range() const { return std::get<IpRange>(value_); }

    std::string toString() const;

    bool operator==(const IpEntry& other) const { return value_ == other.value_; }

private:
    std::variant<Cidr, IpRange> value_;
};

/**
 * @class IpList
 * @brief Non-empty comma separated list of entries sharing one family
 */
class IpList {
public:
    /// @throws std::invalid_argument if empty or of mixed families
    explicit IpList(std::vector<IpEntry> entries);

    static IpList parse(const std::string& text);

    const std::vector<IpEntry>& entries() const { return entries_; }
    Family family() const { return family_; }

    std::string toString() const;

    bool operator==(const IpList& other) const { return entries_ == other.entries_; }

private:
    std::vector<IpEntry> entries_;
    Family family_;
};

/**
 * @class MacAddress
 * @brief 48-bit hardware address
 */
class MacAddress {
public:
    MacAddress() = default;
    explicit MacAddress(const std::array<uint8_t, 6>& bytes) : bytes_(bytes) {}

    /// Six colon separated hex octets. @throws std::invalid_argument
    static MacAddress parse(const std::string& text);

    const std::array<uint8_t, 6>& bytes() const { return bytes_; }

    /// Uppercase "AA:BB:CC:DD:EE:FF"
    std::string toString() const;

    /**
     * @brief Derive the EUI-64 IPv6 link-local address (fe80::/64 + interface id)
     *
     * The interface id is mac[0..3] ff:fe mac[3..6] with the
     * universal/local bit (0x02 of the first octet) flipped.
     */
    IpAddress eui64LinkLocalAddress() const;

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }

private:
    std::array<uint8_t, 6> bytes_{};
};

} // namespace nftfw
