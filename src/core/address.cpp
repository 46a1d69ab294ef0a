#include "address.hpp"
#include <cctype>
#include <vector>

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);
    return parts;
}

bool is_ipv4_address(const std::string& s) {
    auto parts = split(s, '.');
    if (parts.size() != 4) return false;

    for (const auto& p : parts) {
        if (p.empty() || p.size() > 3) return false;
        for (char c : p) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        // No leading zeros ("01" is not a valid octet)
        if (p.size() > 1 && p[0] == '0') return false;
        if (std::stoi(p) > 255) return false;
    }
    return true;
}

bool is_bluetooth_address(const std::string& s) {
    if (s.size() != 17) return false;
    char sep = s[2];
    if (sep != ':' && sep != '-') return false;

    auto parts = split(s, sep);
    if (parts.size() != 6) return false;
    for (const auto& p : parts) {
        if (p.size() != 2) return false;
        for (char c : p) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        }
    }
    return true;
}

AddressKind classify_address(const std::string& address) {
    if (is_ipv4_address(address)) return AddressKind::IPv4;
    if (is_bluetooth_address(address)) return AddressKind::Bluetooth;
    return AddressKind::Name;
}

const char* address_kind_name(AddressKind kind) {
    switch (kind) {
        case AddressKind::IPv4:      return "ipv4";
        case AddressKind::Bluetooth: return "bluetooth";
        case AddressKind::Name:      return "name";
    }
    return "unknown";
}
