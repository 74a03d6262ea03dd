// HttpIpDiscovery.h
// Public address lookup against a plain-text HTTP endpoint
#pragma once
#include <string>

#include "IpDiscovery.h"

class HttpIpDiscovery : public IpDiscovery {
public:
    HttpIpDiscovery(std::string endpoint, int timeoutSeconds);

    // Connects over the requested family only, so the endpoint sees the matching address.
    bool Discover(AddressFamily family, Cidr& address, std::string& error) override;

private:
    std::string endpoint;
    int timeoutSeconds;
};
