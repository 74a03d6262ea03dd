// HcloudJson.cpp
#include <cstdint>
#include <limits>
#include <map>
#include <tuple>

#include "HcloudJson.h"
#include "Utils.h"

namespace HcloudJson {

namespace {

json EncodeRule(const RuleSpec& spec, const std::optional<PortRange>& port) {
    json sources = json::array();
    for (const auto& cidr : spec.sources) {
        sources.push_back(Utils::CidrToString(cidr));
    }

    std::string description = Utils::ProtocolLabel(spec.protocol);
    json rule;
    if (port) {
        description += "-" + Utils::PortRangeToString(*port);
        rule["port"] = Utils::PortRangeToString(*port);
    }
    rule["description"] = description;
    rule["direction"] = spec.direction == Direction::Inbound ? "in" : "out";
    rule["protocol"] = Utils::ProtocolName(spec.protocol);
    if (spec.direction == Direction::Inbound) {
        rule["source_ips"] = sources;
        rule["destination_ips"] = json::array();
    } else {
        rule["source_ips"] = json::array();
        rule["destination_ips"] = sources;
    }
    return rule;
}

bool DecodeAddressList(const json& rule, const char* key, std::set<Cidr>& out, std::string& problem) {
    if (!rule.contains(key) || rule[key].is_null()) {
        return true;
    }
    if (!rule[key].is_array()) {
        problem = std::string("'") + key + "' is not an array";
        return false;
    }
    for (const auto& entry : rule[key]) {
        if (!entry.is_string()) {
            problem = std::string("'") + key + "' contains a non-string entry";
            return false;
        }
        std::string cidrError;
        auto cidr = Utils::ParseCidr(entry.get<std::string>(), &cidrError);
        if (!cidr) {
            problem = cidrError;
            return false;
        }
        out.insert(*cidr);
    }
    return true;
}

using RuleGroups = std::map<std::tuple<Protocol, Direction, std::set<Cidr>>, std::vector<PortRange>>;

bool DecodeRule(const json& rule, RuleGroups& groups, std::string& problem) {
    if (!rule.is_object()) {
        problem = "rule entry is not an object";
        return false;
    }

    const std::string protocolName = rule.value("protocol", "");
    auto protocol = Utils::ParseProtocol(protocolName);
    if (!protocol) {
        problem = "unsupported protocol '" + protocolName + "'";
        return false;
    }

    const std::string directionName = rule.value("direction", "");
    Direction direction = Direction::Inbound;
    if (directionName == "out") {
        direction = Direction::Outbound;
    } else if (directionName != "in") {
        problem = "unsupported direction '" + directionName + "'";
        return false;
    }

    std::set<Cidr> addresses;
    const char* addressKey = direction == Direction::Inbound ? "source_ips" : "destination_ips";
    if (!DecodeAddressList(rule, addressKey, addresses, problem)) {
        return false;
    }

    auto& ports = groups[std::make_tuple(*protocol, direction, addresses)];
    if (Utils::IsSimpleProtocol(*protocol)) {
        return true;
    }

    if (!rule.contains("port") || !rule["port"].is_string()) {
        problem = std::string(Utils::ProtocolLabel(*protocol)) + " rule without a port";
        return false;
    }
    std::string portError;
    auto range = Utils::ParsePortRange(rule["port"].get<std::string>(), &portError);
    if (!range) {
        problem = portError;
        return false;
    }
    ports.push_back(*range);
    return true;
}

} // namespace

json EncodeRules(const std::vector<RuleSpec>& rules) {
    json encoded = json::array();
    for (const auto& spec : rules) {
        if (Utils::IsSimpleProtocol(spec.protocol)) {
            encoded.push_back(EncodeRule(spec, std::nullopt));
            continue;
        }
        for (const auto& port : Utils::NormalizePortRanges(spec.ports)) {
            encoded.push_back(EncodeRule(spec, port));
        }
    }
    return encoded;
}

bool DecodeRules(const json& rules, std::vector<RuleSpec>& out, std::string& problem) {
    if (rules.is_null()) {
        out.clear();
        return true;
    }
    if (!rules.is_array()) {
        problem = "'rules' is not an array";
        return false;
    }

    RuleGroups groups;
    try {
        for (const auto& rule : rules) {
            if (!DecodeRule(rule, groups, problem)) {
                return false;
            }
        }
    } catch (const json::exception& e) {
        problem = std::string("malformed rule: ") + e.what();
        return false;
    }

    out.clear();
    for (auto& [key, ports] : groups) {
        RuleSpec spec;
        spec.protocol = std::get<0>(key);
        spec.direction = std::get<1>(key);
        spec.sources = std::get<2>(key);
        spec.ports = Utils::NormalizePortRanges(std::move(ports));
        out.push_back(std::move(spec));
    }
    return true;
}

bool DecodeFirewall(const json& object, Firewall& out, std::string& error) {
    if (!object.is_object()) {
        error = "firewall is not a JSON object";
        return false;
    }
    if (!object.contains("id") || !object["id"].is_number_integer()) {
        error = "firewall object has no numeric 'id'";
        return false;
    }
    if (object["id"].is_number_unsigned() &&
        object["id"].get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        error = "firewall id " + object["id"].dump() + " is out of range";
        return false;
    }

    out.id = object["id"].get<std::int64_t>();
    out.name = object.contains("name") && object["name"].is_string() ? object["name"].get<std::string>() : "";
    out.rules.clear();
    out.rulesRecognized = true;

    std::string problem;
    const json rules = object.contains("rules") ? object["rules"] : json::array();
    if (!DecodeRules(rules, out.rules, problem)) {
        out.rules.clear();
        out.rulesRecognized = false;
        error = problem;
    }
    return true;
}

bool DecodeFirewallList(const json& body,
                        const std::string& name,
                        std::optional<Firewall>& found,
                        std::string& error) {
    found.reset();
    if (!body.is_object() || !body.contains("firewalls") || !body["firewalls"].is_array()) {
        error = "response has no 'firewalls' array";
        return false;
    }

    for (const auto& entry : body["firewalls"]) {
        if (!entry.is_object() || !entry.contains("name") || entry["name"] != name) {
            continue;
        }
        Firewall firewall;
        std::string problem;
        if (!DecodeFirewall(entry, firewall, problem)) {
            error = problem;
            return false;
        }
        if (!firewall.rulesRecognized) {
            error = problem;
        }
        found = std::move(firewall);
        return true;
    }
    return true;
}

std::string DescribeError(const json& body) {
    if (!body.is_object() || !body.contains("error") || !body["error"].is_object()) {
        return {};
    }
    const json& err = body["error"];
    const std::string code = err.contains("code") && err["code"].is_string() ? err["code"].get<std::string>() : "unknown_error";
    const std::string message = err.contains("message") && err["message"].is_string() ? err["message"].get<std::string>() : "";
    std::string description = code + ": " + message;
    if (err.contains("details") && !err["details"].is_null()) {
        description += ", details: " + err["details"].dump();
    }
    return description;
}

} // namespace HcloudJson
