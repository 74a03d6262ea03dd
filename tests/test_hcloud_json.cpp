#include "HcloudJson.h"
#include "fakes.h"

#include <cassert>
#include <string>

using json = nlohmann::json;

int main() {
    const std::set<Cidr> sources{MakeCidr("198.51.100.0/24"), MakeCidr("203.0.113.9/32")};

    // Encoding: one object per simple protocol and per port range
    {
        RuleSpec icmp;
        icmp.protocol = Protocol::ICMP;
        icmp.sources = sources;

        RuleSpec tcp;
        tcp.protocol = Protocol::TCP;
        tcp.ports = {{443, 443}, {80, 80}, {8000, 8080}};
        tcp.sources = sources;

        const json encoded = HcloudJson::EncodeRules({icmp, tcp});
        assert(encoded.is_array());
        assert(encoded.size() == 4);

        assert(encoded[0]["protocol"] == "icmp");
        assert(encoded[0]["direction"] == "in");
        assert(encoded[0]["description"] == "ICMP");
        assert(!encoded[0].contains("port"));
        assert((encoded[0]["source_ips"] == json{"198.51.100.0/24", "203.0.113.9/32"}));
        assert(encoded[0]["destination_ips"].empty());

        assert(encoded[1]["protocol"] == "tcp");
        assert(encoded[1]["port"] == "80");
        assert(encoded[1]["description"] == "TCP-80");
        assert(encoded[2]["port"] == "443");
        assert(encoded[3]["port"] == "8000-8080");
        assert(encoded[3]["description"] == "TCP-8000-8080");
    }

    // Empty sources are still encoded
    {
        RuleSpec udp;
        udp.protocol = Protocol::UDP;
        udp.ports = {PortRange{51820, 51820}};
        const json encoded = HcloudJson::EncodeRules({udp});
        assert(encoded.size() == 1);
        assert(encoded[0]["source_ips"].is_array());
        assert(encoded[0]["source_ips"].empty());
    }

    // Decoding groups port rules sharing protocol, direction and sources
    {
        const json rules = json::parse(R"([
            {"direction": "in", "protocol": "tcp", "port": "443", "source_ips": ["203.0.113.9/32", "198.51.100.0/24"], "destination_ips": []},
            {"direction": "in", "protocol": "icmp", "port": null, "source_ips": ["198.51.100.0/24", "203.0.113.9/32"], "destination_ips": []},
            {"direction": "in", "protocol": "tcp", "port": "80", "source_ips": ["198.51.100.0/24", "203.0.113.9/32"], "destination_ips": []},
            {"direction": "in", "protocol": "tcp", "port": "22", "source_ips": ["10.0.0.0/8"], "destination_ips": []}
        ])");

        std::vector<RuleSpec> decoded;
        std::string problem;
        assert(HcloudJson::DecodeRules(rules, decoded, problem));
        assert(decoded.size() == 3);

        int matchingTcp = 0;
        for (const auto& spec : decoded) {
            if (spec.protocol == Protocol::TCP && spec.sources == sources) {
                assert((spec.ports == std::vector<PortRange>{{80, 80}, {443, 443}}));
                ++matchingTcp;
            }
            if (spec.protocol == Protocol::ICMP) {
                assert(spec.ports.empty());
                assert(spec.sources == sources);
            }
        }
        assert(matchingTcp == 1);
    }

    // Encoded rules decode back to an equal set
    {
        RuleSpec tcp;
        tcp.protocol = Protocol::TCP;
        tcp.ports = {{80, 80}, {443, 443}};
        tcp.sources = sources;

        std::vector<RuleSpec> decoded;
        std::string problem;
        assert(HcloudJson::DecodeRules(HcloudJson::EncodeRules({tcp}), decoded, problem));
        assert(decoded.size() == 1);
        assert(decoded.front() == tcp);
    }

    // Rules this controller cannot represent
    {
        std::vector<RuleSpec> decoded;
        std::string problem;

        assert(!HcloudJson::DecodeRules(json::parse(R"([{"direction": "in", "protocol": "sctp"}])"), decoded, problem));
        assert(problem.find("sctp") != std::string::npos);

        assert(!HcloudJson::DecodeRules(json::parse(R"([{"direction": "in", "protocol": "tcp", "source_ips": []}])"),
                                        decoded, problem));
        assert(problem.find("port") != std::string::npos);

        assert(!HcloudJson::DecodeRules(
            json::parse(R"([{"direction": "in", "protocol": "udp", "port": "any", "source_ips": []}])"), decoded, problem));

        assert(!HcloudJson::DecodeRules(
            json::parse(R"([{"direction": "in", "protocol": "icmp", "source_ips": ["10.0.0.1/8"]}])"), decoded, problem));

        assert(!HcloudJson::DecodeRules(json::parse(R"([{"direction": "sideways", "protocol": "icmp"}])"), decoded,
                                        problem));

        assert(!HcloudJson::DecodeRules(json::parse(R"({"rules": []})"), decoded, problem));

        assert(!HcloudJson::DecodeRules(json::parse(R"([{"direction": 1, "protocol": "icmp"}])"), decoded, problem));
    }

    // Firewall objects
    {
        Firewall firewall;
        std::string error;
        assert(HcloudJson::DecodeFirewall(json::parse(R"({"id": 42, "name": "fw", "rules": []})"), firewall, error));
        assert(firewall.id == 42);
        assert(firewall.name == "fw");
        assert(firewall.rules.empty());
        assert(firewall.rulesRecognized);

        assert(HcloudJson::DecodeFirewall(
            json::parse(R"({"id": 43, "name": "fw", "rules": [{"direction": "in", "protocol": "sctp"}]})"), firewall,
            error));
        assert(firewall.id == 43);
        assert(!firewall.rulesRecognized);

        assert(!HcloudJson::DecodeFirewall(json::parse(R"({"name": "fw"})"), firewall, error));
        assert(!HcloudJson::DecodeFirewall(json::parse(R"({"id": "42"})"), firewall, error));

        assert(!HcloudJson::DecodeFirewall(json::parse(R"({"id": 18446744073709551615, "name": "fw"})"), firewall,
                                           error));
        assert(error.find("out of range") != std::string::npos);
        assert(HcloudJson::DecodeFirewall(json::parse(R"({"id": 9223372036854775807, "name": "fw"})"), firewall,
                                          error));
        assert(firewall.id == 9223372036854775807LL);
    }

    // Lookup requires an exact name match
    {
        const json body = json::parse(R"({"firewalls": [
            {"id": 1, "name": "hcloud-firewall-controller-old", "rules": []},
            {"id": 2, "name": "hcloud-firewall-controller", "rules": []}
        ]})");

        std::optional<Firewall> found;
        std::string error;
        assert(HcloudJson::DecodeFirewallList(body, "hcloud-firewall-controller", found, error));
        assert(found && found->id == 2);

        assert(HcloudJson::DecodeFirewallList(body, "hcloud-firewall", found, error));
        assert(!found);

        assert(!HcloudJson::DecodeFirewallList(json::parse(R"({"servers": []})"), "x", found, error));
    }

    // Error bodies
    {
        const json body = json::parse(
            R"({"error": {"code": "uniqueness_error", "message": "name is already used", "details": {"fields": [{"name": "name"}]}}})");
        const std::string described = HcloudJson::DescribeError(body);
        assert(described.find("uniqueness_error: name is already used") == 0);
        assert(described.find("details") != std::string::npos);

        assert(HcloudJson::DescribeError(json::parse(R"({"firewalls": []})")).empty());
        assert(HcloudJson::DescribeError(json::parse(R"({"error": null})")).empty());
    }

    return 0;
}
