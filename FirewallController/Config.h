// Config.h
// Controller settings from the command line and HFC_* environment variables
#pragma once
#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "Models.h"

constexpr const char* kDefaultFirewallName = "hcloud-firewall-controller";
constexpr const char* kDefaultIpEndpoint = "https://ip.fotoallerlei.com";
constexpr const char* kDefaultApiEndpoint = "https://api.hetzner.cloud/v1";

// Upper bound for the interval and the account delay; keeps steady_clock deadlines representable.
constexpr std::chrono::hours kMaxWait{24 * 365};

struct ControllerConfig {
    std::vector<Account> accounts;
    RuleConfig rules;
    std::set<Cidr> staticCidrs;
    bool enableIPv4 = true;
    bool enableIPv6 = true;
    int ipv6Prefix = 128;
    std::chrono::seconds interval{60};
    bool runOnce = false;
    std::string ipEndpoint = kDefaultIpEndpoint;
    std::string apiEndpoint = kDefaultApiEndpoint;
    int httpTimeoutSeconds = 10;
    std::chrono::milliseconds accountDelay{500};
    bool verbose = false;
};

enum class ParseStatus { Ok, Help, Error };

namespace Config {
    // Command line values take precedence over the environment. On Error, `message`
    // describes the first invalid setting; on Help it holds the usage text.
    ParseStatus Parse(int argc, const char* const argv[], ControllerConfig& config, std::string& message);

    std::string Usage();
}
