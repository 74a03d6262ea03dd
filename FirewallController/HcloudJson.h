// HcloudJson.h
// Conversion between rule specs and Hetzner Cloud firewall JSON
#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Models.h"

namespace HcloudJson {
    using json = nlohmann::json;

    // One rule object per simple protocol and per TCP/UDP port range.
    json EncodeRules(const std::vector<RuleSpec>& rules);

    // Groups inbound/outbound rule objects by protocol, direction and sources.
    // Returns false and names the offending entry when a rule cannot be represented.
    bool DecodeRules(const json& rules, std::vector<RuleSpec>& out, std::string& problem);

    // Parses a firewall object. An undecodable rule list is not an error: the
    // firewall is returned with rulesRecognized = false.
    bool DecodeFirewall(const json& object, Firewall& out, std::string& error);

    // Picks the firewall named exactly `name` out of a {"firewalls": [...]} body.
    bool DecodeFirewallList(const json& body,
                            const std::string& name,
                            std::optional<Firewall>& found,
                            std::string& error);

    // Formats {"error": {...}} bodies, empty when the body carries no error.
    std::string DescribeError(const json& body);
}
