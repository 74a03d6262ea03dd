// HttpIpDiscovery.cpp
#include <sys/socket.h>

#include <iostream>
#include <utility>

#include "HttpIpDiscovery.h"
#include "Utils.h"

#include <httplib.h>

HttpIpDiscovery::HttpIpDiscovery(std::string endpoint, int timeoutSeconds)
    : endpoint(std::move(endpoint)), timeoutSeconds(timeoutSeconds) {}

bool HttpIpDiscovery::Discover(AddressFamily family, Cidr& address, std::string& error) {
    std::string base;
    std::string path;
    if (!Utils::SplitUrl(endpoint, base, path)) {
        error = "invalid IP endpoint URL '" + endpoint + "'";
        return false;
    }

    httplib::Client client(base);
    client.set_address_family(family == AddressFamily::IPv4 ? AF_INET : AF_INET6);
    client.set_connection_timeout(timeoutSeconds, 0);
    client.set_read_timeout(timeoutSeconds, 0);
    client.set_follow_location(true);

    auto res = client.Get(path);
    if (!res) {
        error = std::string(Utils::FamilyLabel(family)) + " request to " + endpoint +
                " failed: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        error = std::string(Utils::FamilyLabel(family)) + " request to " + endpoint +
                " returned HTTP " + std::to_string(res->status);
        return false;
    }

    const std::string body = Utils::Trim(res->body);
    auto parsed = Utils::ParseAddress(body);
    if (!parsed) {
        error = "endpoint " + endpoint + " returned '" + body + "', which is not an IP address";
        return false;
    }
    if (parsed->family != family) {
        error = "endpoint " + endpoint + " returned " + Utils::FamilyLabel(parsed->family) +
                " address " + body + " for an " + Utils::FamilyLabel(family) + " request";
        return false;
    }

    if (Utils::IsVerbose()) {
        std::cout << "[d] Discovered public " << Utils::FamilyLabel(family) << " address " << body << "\n";
    }
    address = *parsed;
    return true;
}
