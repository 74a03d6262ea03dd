// Utils.h
// Helper functions for address, port and protocol parsing, formatting and logging
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "Models.h"

namespace Utils {
    std::string Trim(const std::string& value);
    std::string ToLower(std::string value);
    // Splits on the delimiter, trims each item and drops empty ones
    std::vector<std::string> SplitList(const std::string& value, char delimiter = ',');

    int MaxPrefix(AddressFamily family);
    // Bare IPv4/IPv6 address as a single host CIDR (/32 or /128)
    std::optional<Cidr> ParseAddress(const std::string& text);
    // "addr/prefix"; rejects addresses whose host bits are set
    std::optional<Cidr> ParseCidr(const std::string& text, std::string* error = nullptr);
    bool IsNetworkId(const Cidr& cidr);
    Cidr MaskToPrefix(const Cidr& cidr, int prefix);
    std::string CidrToString(const Cidr& cidr);
    std::string JoinCidrs(const std::set<Cidr>& cidrs);

    std::optional<PortRange> ParsePortRange(const std::string& text, std::string* error = nullptr);
    // Each item may itself be a comma separated list, e.g. {"80,443", "8000-8080"}
    std::optional<std::vector<PortRange>> ParsePortSpec(const std::vector<std::string>& items,
                                                        std::string* error = nullptr);
    // Sorts and merges overlapping or adjacent ranges
    std::vector<PortRange> NormalizePortRanges(std::vector<PortRange> ranges);
    std::string PortRangeToString(const PortRange& range);

    const char* ProtocolName(Protocol protocol);  // wire name, "tcp"
    const char* ProtocolLabel(Protocol protocol); // display name, "TCP"
    std::optional<Protocol> ParseProtocol(const std::string& name);
    bool IsSimpleProtocol(Protocol protocol);
    const char* FamilyLabel(AddressFamily family);

    // "https://host:port/path" -> {"https://host:port", "/path"}
    bool SplitUrl(const std::string& url, std::string& base, std::string& path);

    // Enables "[d]" debug lines
    void SetVerbose(bool verbose);
    bool IsVerbose();
}
