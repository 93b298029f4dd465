#include "address.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace nftfw {

std::string familyToString(Family family) {
    return family == Family::V4 ? "ipv4" : "ipv6";
}

// IpAddress

IpAddress::IpAddress(Family family, const std::array<uint8_t, 16>& bytes)
    : family_(family), bytes_(bytes) {
    if (family_ == Family::V4) {
        std::fill(bytes_.begin() + 4, bytes_.end(), 0);
    }
}

std::optional<IpAddress> IpAddress::tryParse(const std::string& text) {
    std::array<uint8_t, 16> bytes{};

    if (inet_pton(AF_INET, text.c_str(), bytes.data()) == 1) {
        return IpAddress(Family::V4, bytes);
    }
    if (inet_pton(AF_INET6, text.c_str(), bytes.data()) == 1) {
        return IpAddress(Family::V6, bytes);
    }
    return std::nullopt;
}

IpAddress IpAddress::parse(const std::string& text) {
    auto address = tryParse(text);
    if (!address) {
        throw std::invalid_argument("invalid IP address: " + text);
    }
    return *address;
}

uint8_t IpAddress::width() const {
    return family_ == Family::V4 ? 32 : 128;
}

std::string IpAddress::toString() const {
    char buffer[INET6_ADDRSTRLEN] = {};
    int af = family_ == Family::V4 ? AF_INET : AF_INET6;
    if (inet_ntop(af, bytes_.data(), buffer, sizeof(buffer)) == nullptr) {
        throw std::runtime_error("unable to format IP address");
    }
    return buffer;
}

bool IpAddress::operator==(const IpAddress& other) const {
    return family_ == other.family_ && bytes_ == other.bytes_;
}

bool IpAddress::operator<(const IpAddress& other) const {
    if (family_ != other.family_) {
        return family_ < other.family_;
    }
    return bytes_ < other.bytes_;
}

// Cidr

Cidr::Cidr(const IpAddress& address, uint8_t mask) : address_(address), mask_(mask) {
    if (mask_ > address_.width()) {
        throw std::invalid_argument("invalid netmask " + std::to_string(mask_) +
                                    " for " + address_.toString());
    }
}

Cidr Cidr::parse(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        IpAddress address = IpAddress::parse(text);
        return Cidr(address, address.width());
    }

    IpAddress address = IpAddress::parse(text.substr(0, slash));
    std::string mask_text = text.substr(slash + 1);
    if (mask_text.empty() || mask_text.size() > 3 ||
        mask_text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid netmask in CIDR: " + text);
    }

    int mask = std::stoi(mask_text);
    if (mask > address.width()) {
        throw std::invalid_argument("invalid netmask in CIDR: " + text);
    }
    return Cidr(address, static_cast<uint8_t>(mask));
}

bool Cidr::contains(const IpAddress& other) const {
    if (other.family() != family()) {
        return false;
    }

    const auto& lhs = address_.bytes();
    const auto& rhs = other.bytes();
    unsigned remaining = mask_;

    for (size_t i = 0; remaining > 0; ++i) {
        if (remaining >= 8) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
            remaining -= 8;
        } else {
            uint8_t bits = static_cast<uint8_t>(0xff << (8 - remaining));
            return (lhs[i] & bits) == (rhs[i] & bits);
        }
    }
    return true;
}

Cidr Cidr::network() const {
    std::array<uint8_t, 16> bytes = address_.bytes();
    unsigned remaining = mask_;

    for (size_t i = 0; i < bytes.size(); ++i) {
        if (remaining >= 8) {
            remaining -= 8;
        } else {
            bytes[i] &= static_cast<uint8_t>(0xff << (8 - remaining));
            remaining = 0;
        }
    }

    return Cidr(IpAddress(family(), bytes), mask_);
}

std::string Cidr::toString() const {
    return address_.toString() + "/" + std::to_string(mask_);
}

bool Cidr::operator==(const Cidr& other) const {
    return address_ == other.address_ && mask_ == other.mask_;
}

// IpRange

IpRange::IpRange(const IpAddress& start, const IpAddress& end) : start_(start), end_(end) {
    if (start_.family() != end_.family()) {
        throw std::invalid_argument("IP range " + toString() + " mixes address families");
    }
    if (!(start_ < end_)) {
        throw std::invalid_argument("start of IP range " + toString() + " must be lower than its end");
    }
}

std::string IpRange::toString() const {
    return start_.toString() + "-" + end_.toString();
}

bool IpRange::operator==(const IpRange& other) const {
    return start_ == other.start_ && end_ == other.end_;
}

// IpEntry

IpEntry IpEntry::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty IP entry");
    }

    auto dash = text.find('-');
    if (dash != std::string::npos) {
        return IpEntry(IpRange(IpAddress::parse(text.substr(0, dash)),
                               IpAddress::parse(text.substr(dash + 1))));
    }
    return IpEntry(Cidr::parse(text));
}

Family IpEntry::family() const {
    return isCidr() ? cidr().family() : range().family();
}

std::string IpEntry::toString() const {
    return isCidr() ? cidr().toString() : range().toString();
}

// IpList

IpList::IpList(std::vector<IpEntry> entries) : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw std::invalid_argument("empty IP list");
    }

    family_ = entries_.front().family();
    for (const auto& entry : entries_) {
        if (entry.family() != family_) {
            throw std::invalid_argument("IP list contains both IPv4 and IPv6 entries");
        }
    }
}

IpList IpList::parse(const std::string& text) {
    std::vector<IpEntry> entries;
    std::istringstream stream(text);
    std::string element;

    while (std::getline(stream, element, ',')) {
        entries.push_back(IpEntry::parse(element));
    }
    if (!text.empty() && text.back() == ',') {
        throw std::invalid_argument("trailing comma in IP list: " + text);
    }
    return IpList(std::move(entries));
}

std::string IpList::toString() const {
    std::string result;
    for (const auto& entry : entries_) {
        if (!result.empty()) {
            result += ",";
        }
        result += entry.toString();
    }
    return result;
}

// MacAddress

MacAddress MacAddress::parse(const std::string& text) {
    std::array<uint8_t, 6> bytes{};
    std::istringstream stream(text);
    std::string octet;
    size_t index = 0;

    while (std::getline(stream, octet, ':')) {
        if (index >= bytes.size() || octet.empty() || octet.size() > 2 ||
            octet.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            throw std::invalid_argument("invalid MAC address: " + text);
        }
        bytes[index++] = static_cast<uint8_t>(std::stoul(octet, nullptr, 16));
    }

    if (index != bytes.size() || text.back() == ':') {
        throw std::invalid_argument("invalid MAC address: " + text);
    }
    return MacAddress(bytes);
}

std::string MacAddress::toString() const {
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i > 0) {
            out << ':';
        }
        out << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return out.str();
}

IpAddress MacAddress::eui64LinkLocalAddress() const {
    std::array<uint8_t, 16> bytes{};
    bytes[0] = 0xfe;
    bytes[1] = 0x80;

    bytes[8] = bytes_[0] ^ 0x02;
    bytes[9] = bytes_[1];
    bytes[10] = bytes_[2];
    bytes[11] = 0xff;
    bytes[12] = 0xfe;
    bytes[13] = bytes_[3];
    bytes[14] = bytes_[4];
    bytes[15] = bytes_[5];

    return IpAddress(Family::V6, bytes);
}

} // namespace nftfw
