// Models.h
// Data structures for firewall rules and remote firewalls
#pragma once
#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <tuple>
#include <vector>

enum class AddressFamily { IPv4, IPv6 };

enum class Protocol { ICMP, GRE, ESP, TCP, UDP };

enum class Direction { Inbound, Outbound };

// Network address plus prefix length. Host bits below the prefix must be zero.
struct Cidr {
    AddressFamily family = AddressFamily::IPv4;
    std::array<std::uint8_t, 16> address{}; // IPv4 uses the first 4 bytes
    int prefix = 0;

    bool operator==(const Cidr& other) const {
        return family == other.family && address == other.address && prefix == other.prefix;
    }
    bool operator!=(const Cidr& other) const { return !(*this == other); }
    bool operator<(const Cidr& other) const {
        return std::tie(family, address, prefix) < std::tie(other.family, other.address, other.prefix);
    }
};

// Inclusive port range, start == end for a single port.
struct PortRange {
    std::uint16_t start = 0;
    std::uint16_t end = 0;

    bool operator==(const PortRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const PortRange& other) const { return !(*this == other); }
    bool operator<(const PortRange& other) const {
        return std::tie(start, end) < std::tie(other.start, other.end);
    }
};

struct RuleSpec {
    Protocol protocol = Protocol::ICMP;
    Direction direction = Direction::Inbound;
    std::vector<PortRange> ports; // empty for ICMP, GRE and ESP
    std::set<Cidr> sources;

    bool operator==(const RuleSpec& other) const {
        return protocol == other.protocol && direction == other.direction && ports == other.ports &&
               sources == other.sources;
    }
    bool operator!=(const RuleSpec& other) const { return !(*this == other); }
    bool operator<(const RuleSpec& other) const {
        return std::tie(protocol, direction, ports, sources) <
               std::tie(other.protocol, other.direction, other.ports, other.sources);
    }
};

// Which protocols and ports the firewall should open.
struct RuleConfig {
    std::set<Protocol> simpleProtocols; // ICMP, GRE, ESP
    std::vector<PortRange> tcpPorts;
    std::vector<PortRange> udpPorts;
};

struct Account {
    std::string label;        // used in logs instead of the token
    std::string token;
    std::string firewallName;
};

struct Firewall {
    std::int64_t id = 0;
    std::string name;
    std::vector<RuleSpec> rules;
    bool rulesRecognized = true; // false when the remote rules could not be decoded
};
