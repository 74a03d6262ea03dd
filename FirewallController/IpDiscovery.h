// IpDiscovery.h
// Abstract lookup of the caller's public address
#pragma once
#include <string>

#include "Models.h"

class IpDiscovery {
public:
    virtual ~IpDiscovery() = default;

    // Fills `address` with a single host CIDR of the requested family.
    virtual bool Discover(AddressFamily family, Cidr& address, std::string& error) = 0;
};
