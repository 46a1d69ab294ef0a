#pragma once

#include <string>

// What kind of device an address names. Decides which hub backend is used.
enum class AddressKind {
    IPv4,       // dotted quad, e.g. 192.168.133.101
    Bluetooth,  // six hex pairs, e.g. 90:84:2B:4A:2B:75
    Name,       // hostname or human-readable device name
};

AddressKind classify_address(const std::string& address);

bool is_ipv4_address(const std::string& s);
bool is_bluetooth_address(const std::string& s);

const char* address_kind_name(AddressKind kind);
