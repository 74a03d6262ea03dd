// Utils.cpp
#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>
#include <sstream>

#include "Utils.h"

namespace {

std::atomic<bool> g_verbose{false};

bool ParsePortNumber(const std::string& text, std::uint16_t& out) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return false;
    }
    const int value = std::stoi(text);
    if (value <= 0 || value > 65535) {
        return false;
    }
    out = static_cast<std::uint16_t>(value);
    return true;
}

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

} // namespace

namespace Utils {
    std::string Trim(const std::string& value) {
        const auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        const auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }

    std::string ToLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return value;
    }

    std::vector<std::string> SplitList(const std::string& value, char delimiter) {
        std::vector<std::string> items;
        std::istringstream iss(value);
        std::string item;
        while (std::getline(iss, item, delimiter)) {
            item = Trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    int MaxPrefix(AddressFamily family) {
        return family == AddressFamily::IPv4 ? 32 : 128;
    }

    std::optional<Cidr> ParseAddress(const std::string& text) {
        Cidr cidr;
        if (text.find(':') != std::string::npos) {
            in6_addr addr{};
            if (inet_pton(AF_INET6, text.c_str(), &addr) != 1) {
                return std::nullopt;
            }
            cidr.family = AddressFamily::IPv6;
            std::memcpy(cidr.address.data(), addr.s6_addr, 16);
        } else {
            in_addr addr{};
            if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
                return std::nullopt;
            }
            cidr.family = AddressFamily::IPv4;
            std::memcpy(cidr.address.data(), &addr.s_addr, 4);
        }
        cidr.prefix = MaxPrefix(cidr.family);
        return cidr;
    }

    std::optional<Cidr> ParseCidr(const std::string& text, std::string* error) {
        const std::string trimmed = Trim(text);
        const auto slash = trimmed.find('/');
        if (slash == std::string::npos) {
            SetError(error, "'" + trimmed + "' is not in CIDR notation (address/prefix)");
            return std::nullopt;
        }

        auto cidr = ParseAddress(trimmed.substr(0, slash));
        if (!cidr) {
            SetError(error, "'" + trimmed + "' does not contain a valid IP address");
            return std::nullopt;
        }

        const std::string prefixText = trimmed.substr(slash + 1);
        const bool numeric = !prefixText.empty() && prefixText.size() <= 3 &&
                             std::all_of(prefixText.begin(), prefixText.end(),
                                         [](unsigned char ch) { return std::isdigit(ch) != 0; });
        const int prefix = numeric ? std::stoi(prefixText) : -1;
        if (prefix < 0 || prefix > MaxPrefix(cidr->family)) {
            SetError(error, "'" + trimmed + "' has an invalid prefix length");
            return std::nullopt;
        }
        cidr->prefix = prefix;

        if (!IsNetworkId(*cidr)) {
            SetError(error, "'" + trimmed + "' is not a network id, use " +
                                CidrToString(MaskToPrefix(*cidr, prefix)) + " instead");
            return std::nullopt;
        }
        return cidr;
    }

    bool IsNetworkId(const Cidr& cidr) {
        return MaskToPrefix(cidr, cidr.prefix).address == cidr.address;
    }

    Cidr MaskToPrefix(const Cidr& cidr, int prefix) {
        Cidr masked = cidr;
        masked.prefix = prefix;
        const int bytes = cidr.family == AddressFamily::IPv4 ? 4 : 16;
        for (int i = 0; i < bytes; ++i) {
            const int bitsInByte = std::clamp(prefix - i * 8, 0, 8);
            const auto mask = static_cast<std::uint8_t>(0xFF << (8 - bitsInByte));
            masked.address[i] = static_cast<std::uint8_t>(cidr.address[i] & mask);
        }
        return masked;
    }

    std::string CidrToString(const Cidr& cidr) {
        char buffer[INET6_ADDRSTRLEN] = {};
        if (cidr.family == AddressFamily::IPv4) {
            inet_ntop(AF_INET, cidr.address.data(), buffer, sizeof(buffer));
        } else {
            inet_ntop(AF_INET6, cidr.address.data(), buffer, sizeof(buffer));
        }
        std::ostringstream oss;
        oss << buffer << '/' << cidr.prefix;
        return oss.str();
    }

    std::string JoinCidrs(const std::set<Cidr>& cidrs) {
        std::ostringstream oss;
        oss << '[';
        bool first = true;
        for (const auto& cidr : cidrs) {
            if (!first) {
                oss << ", ";
            }
            oss << CidrToString(cidr);
            first = false;
        }
        oss << ']';
        return oss.str();
    }

    std::optional<PortRange> ParsePortRange(const std::string& text, std::string* error) {
        const std::string trimmed = Trim(text);
        const auto dash = trimmed.find('-');
        PortRange range;
        if (dash == std::string::npos) {
            if (!ParsePortNumber(trimmed, range.start)) {
                SetError(error, "invalid port '" + trimmed + "', expected 1-65535");
                return std::nullopt;
            }
            range.end = range.start;
            return range;
        }

        if (!ParsePortNumber(Trim(trimmed.substr(0, dash)), range.start) ||
            !ParsePortNumber(Trim(trimmed.substr(dash + 1)), range.end)) {
            SetError(error, "invalid port range '" + trimmed + "', expected START-END within 1-65535");
            return std::nullopt;
        }
        if (range.start > range.end) {
            SetError(error, "invalid port range '" + trimmed + "', start is greater than end");
            return std::nullopt;
        }
        return range;
    }

    std::optional<std::vector<PortRange>> ParsePortSpec(const std::vector<std::string>& items,
                                                        std::string* error) {
        std::vector<PortRange> ranges;
        for (const auto& item : items) {
            for (const auto& token : SplitList(item)) {
                auto range = ParsePortRange(token, error);
                if (!range) {
                    return std::nullopt;
                }
                ranges.push_back(*range);
            }
        }
        return NormalizePortRanges(std::move(ranges));
    }

    std::vector<PortRange> NormalizePortRanges(std::vector<PortRange> ranges) {
        std::sort(ranges.begin(), ranges.end());
        std::vector<PortRange> merged;
        for (const auto& range : ranges) {
            if (!merged.empty() && static_cast<int>(range.start) <= static_cast<int>(merged.back().end) + 1) {
                merged.back().end = std::max(merged.back().end, range.end);
                continue;
            }
            merged.push_back(range);
        }
        return merged;
    }

    std::string PortRangeToString(const PortRange& range) {
        if (range.start == range.end) {
            return std::to_string(range.start);
        }
        return std::to_string(range.start) + "-" + std::to_string(range.end);
    }

    const char* ProtocolName(Protocol protocol) {
        switch (protocol) {
            case Protocol::ICMP: return "icmp";
            case Protocol::GRE:  return "gre";
            case Protocol::ESP:  return "esp";
            case Protocol::TCP:  return "tcp";
            case Protocol::UDP:  return "udp";
        }
        return "unknown";
    }

    const char* ProtocolLabel(Protocol protocol) {
        switch (protocol) {
            case Protocol::ICMP: return "ICMP";
            case Protocol::GRE:  return "GRE";
            case Protocol::ESP:  return "ESP";
            case Protocol::TCP:  return "TCP";
            case Protocol::UDP:  return "UDP";
        }
        return "UNKNOWN";
    }

    std::optional<Protocol> ParseProtocol(const std::string& name) {
        const std::string lower = ToLower(Trim(name));
        if (lower == "icmp") return Protocol::ICMP;
        if (lower == "gre") return Protocol::GRE;
        if (lower == "esp") return Protocol::ESP;
        if (lower == "tcp") return Protocol::TCP;
        if (lower == "udp") return Protocol::UDP;
        return std::nullopt;
    }

    bool IsSimpleProtocol(Protocol protocol) {
        return protocol == Protocol::ICMP || protocol == Protocol::GRE || protocol == Protocol::ESP;
    }

    const char* FamilyLabel(AddressFamily family) {
        return family == AddressFamily::IPv4 ? "IPv4" : "IPv6";
    }

    bool SplitUrl(const std::string& url, std::string& base, std::string& path) {
        const auto scheme = url.find("://");
        if (scheme == std::string::npos) {
            return false;
        }
        const std::string schemeName = ToLower(url.substr(0, scheme));
        if (schemeName != "http" && schemeName != "https") {
            return false;
        }
        const auto hostStart = scheme + 3;
        const auto slash = url.find('/', hostStart);
        if (slash == hostStart) {
            return false;
        }
        if (slash == std::string::npos) {
            base = url;
            path = "/";
        } else {
            base = url.substr(0, slash);
            path = url.substr(slash);
        }
        if (base.size() <= hostStart) {
            return false;
        }
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        return true;
    }

    void SetVerbose(bool verbose) {
        g_verbose.store(verbose);
    }

    bool IsVerbose() {
        return g_verbose.load();
    }
}
