// AddressBook.cpp
#include <iostream>

#include "AddressBook.h"
#include "Utils.h"

AddressBook::AddressBook(IpDiscovery& discovery, int ipv6Prefix)
    : discovery(discovery), ipv6Prefix(ipv6Prefix) {}

ResolvedAddresses AddressBook::Resolve(bool enableIPv4, bool enableIPv6, const std::set<Cidr>& staticCidrs) const {
    ResolvedAddresses resolved;
    resolved.sources = staticCidrs;

    std::vector<AddressFamily> families;
    if (enableIPv4) {
        families.push_back(AddressFamily::IPv4);
    }
    if (enableIPv6) {
        families.push_back(AddressFamily::IPv6);
    }

    for (AddressFamily family : families) {
        Cidr address;
        std::string error;
        if (!discovery.Discover(family, address, error)) {
            std::cerr << "[!] Could not discover public " << Utils::FamilyLabel(family)
                      << " address, continuing without it: " << error << "\n";
            resolved.failedFamilies.push_back(family);
            continue;
        }
        if (address.family != family) {
            std::cerr << "[!] Discovery returned " << Utils::CidrToString(address) << " for an "
                      << Utils::FamilyLabel(family) << " request, ignoring it.\n";
            resolved.failedFamilies.push_back(family);
            continue;
        }

        const int prefix = family == AddressFamily::IPv6 ? ipv6Prefix : Utils::MaxPrefix(family);
        resolved.sources.insert(Utils::MaskToPrefix(address, prefix));
    }

    if (resolved.sources.empty()) {
        std::cout << "[i] No source addresses available, rules will not permit any traffic.\n";
    }
    return resolved;
}
