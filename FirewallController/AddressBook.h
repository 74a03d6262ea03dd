// AddressBook.h
// Merges discovered public addresses with configured static networks
#pragma once
#include <set>
#include <vector>

#include "IpDiscovery.h"
#include "Models.h"

struct ResolvedAddresses {
    std::set<Cidr> sources;
    std::vector<AddressFamily> failedFamilies; // enabled families whose discovery failed
};

class AddressBook {
public:
    // Discovered IPv6 addresses are reduced to `ipv6Prefix` bits (128 keeps the single host).
    explicit AddressBook(IpDiscovery& discovery, int ipv6Prefix = 128);

    // A failing family is logged and left out; it never aborts the resolution.
    ResolvedAddresses Resolve(bool enableIPv4, bool enableIPv6, const std::set<Cidr>& staticCidrs) const;

private:
    IpDiscovery& discovery;
    int ipv6Prefix;
};
