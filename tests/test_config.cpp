#include "Config.h"
#include "fakes.h"

#include <cassert>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

ParseStatus ParseArgs(std::initializer_list<const char*> args, ControllerConfig& config, std::string& message) {
    std::vector<const char*> argv{"hcloud-firewall-controller"};
    argv.insert(argv.end(), args.begin(), args.end());
    return Config::Parse(static_cast<int>(argv.size()), argv.data(), config, message);
}

bool Rejects(std::initializer_list<const char*> args, const std::string& expected) {
    ControllerConfig config;
    std::string message;
    return ParseArgs(args, config, message) == ParseStatus::Error && message.find(expected) != std::string::npos;
}

} // namespace

int main() {
    // Defaults
    {
        ControllerConfig config;
        std::string message;
        assert(ParseArgs({"-t", "token"}, config, message) == ParseStatus::Ok);
        assert(config.accounts.size() == 1);
        assert(config.accounts[0].token == "token");
        assert(config.accounts[0].firewallName == "hcloud-firewall-controller");
        assert(config.accounts[0].label == "project #1");
        assert(!config.runOnce);
        assert(config.enableIPv4 && config.enableIPv6);
        assert(config.ipv6Prefix == 128);
        assert(config.interval == std::chrono::seconds(60));
        assert(config.accountDelay == std::chrono::milliseconds(500));
        assert(config.httpTimeoutSeconds == 10);
        assert(config.ipEndpoint == "https://ip.fotoallerlei.com");
        assert(config.apiEndpoint == "https://api.hetzner.cloud/v1");
        assert(config.rules.simpleProtocols.empty());
        assert(config.rules.tcpPorts.empty() && config.rules.udpPorts.empty());
        assert(config.staticCidrs.empty());
        assert(!config.verbose);
    }

    // Full command line
    {
        ControllerConfig config;
        std::string message;
        const ParseStatus status = ParseArgs({"-1", "--hcloud-token", "a, b@other", "-t", "c", "-f", "custom",
                                              "--tcp", "80,443", "--tcp", "8000-8080", "--udp", "51820",
                                              "--icmp", "--esp", "--ip", "10.0.0.0/8,2001:db8::/32",
                                              "--disable-ipv6", "--ipv6-prefix", "64", "-r", "30",
                                              "--account-delay-ms", "0", "--http-timeout", "3", "-v"},
                                             config, message);
        assert(status == ParseStatus::Ok);
        assert(config.runOnce);
        assert(config.verbose);

        assert(config.accounts.size() == 3);
        assert(config.accounts[0].token == "a" && config.accounts[0].firewallName == "custom");
        assert(config.accounts[1].token == "b" && config.accounts[1].firewallName == "other");
        assert(config.accounts[2].token == "c" && config.accounts[2].label == "project #3");

        assert((config.rules.simpleProtocols == std::set<Protocol>{Protocol::ICMP, Protocol::ESP}));
        assert((config.rules.tcpPorts == std::vector<PortRange>{{80, 80}, {443, 443}, {8000, 8080}}));
        assert((config.rules.udpPorts == std::vector<PortRange>{{51820, 51820}}));
        assert((config.staticCidrs == std::set<Cidr>{MakeCidr("10.0.0.0/8"), MakeCidr("2001:db8::/32")}));

        assert(config.enableIPv4 && !config.enableIPv6);
        assert(config.ipv6Prefix == 64);
        assert(config.interval == std::chrono::seconds(30));
        assert(config.accountDelay == std::chrono::milliseconds(0));
        assert(config.httpTimeoutSeconds == 3);
    }

    // Environment binding, the command line wins
    {
        setenv("HFC_HCLOUD_TOKEN", "env-token@env-firewall", 1);
        setenv("HFC_TCP", "22", 1);
        setenv("HFC_ICMP", "true", 1);
        setenv("HFC_RECONCILIATION_INTERVAL", "15", 1);
        setenv("HFC_RUN_ONCE", "yes", 1);
        setenv("HFC_HELP", "1", 1);
        setenv("HFC_UNRELATED_SETTING", "x", 1);

        ControllerConfig config;
        std::string message;
        assert(ParseArgs({"-r", "5"}, config, message) == ParseStatus::Ok);
        assert(config.accounts.size() == 1);
        assert(config.accounts[0].token == "env-token");
        assert(config.accounts[0].firewallName == "env-firewall");
        assert((config.rules.tcpPorts == std::vector<PortRange>{{22, 22}}));
        assert(config.rules.simpleProtocols.count(Protocol::ICMP));
        assert(config.interval == std::chrono::seconds(5));
        assert(config.runOnce);

        assert(ParseArgs({"-t", "cli-token"}, config, message) == ParseStatus::Ok);
        assert(config.accounts.size() == 1);
        assert(config.accounts[0].token == "cli-token");
        assert(config.interval == std::chrono::seconds(15));

        unsetenv("HFC_HCLOUD_TOKEN");
        unsetenv("HFC_TCP");
        unsetenv("HFC_ICMP");
        unsetenv("HFC_RECONCILIATION_INTERVAL");
        unsetenv("HFC_RUN_ONCE");
        unsetenv("HFC_HELP");
        unsetenv("HFC_UNRELATED_SETTING");
    }

    // Longest accepted waits
    {
        ControllerConfig config;
        std::string message;
        assert(ParseArgs({"-t", "token", "-r", "31536000", "--account-delay-ms", "31536000000"}, config, message) ==
               ParseStatus::Ok);
        assert(config.interval == kMaxWait);
        assert(config.accountDelay == kMaxWait);
    }

    // Help
    {
        ControllerConfig config;
        std::string message;
        assert(ParseArgs({"--help"}, config, message) == ParseStatus::Help);
        assert(message.find("--hcloud-token") != std::string::npos);
        assert(message.find("HFC_RECONCILIATION_INTERVAL") != std::string::npos);
    }

    // Validation errors
    {
        assert(Rejects({}, "token"));
        assert(Rejects({"-t", "token@"}, "TOKEN@FIREWALL"));
        assert(Rejects({"-t", "token", "-f", " "}, "firewall name"));
        assert(Rejects({"-t", "token", "--ip", "127.0.0.1/24"}, "127.0.0.0/24"));
        assert(Rejects({"-t", "token", "--ip", "127.0.0.1"}, "CIDR"));
        assert(Rejects({"-t", "token", "--tcp", "0"}, "--tcp"));
        assert(Rejects({"-t", "token", "--udp", "90-80"}, "--udp"));
        assert(Rejects({"-t", "token", "--tcp", "65536"}, "65535"));
        assert(Rejects({"-t", "token", "-r", "0"}, "reconciliation-interval"));
        assert(Rejects({"-t", "token", "-r", "9223372036854775807"}, "reconciliation-interval"));
        assert(Rejects({"-t", "token", "-r", "31536001"}, "reconciliation-interval"));
        assert(Rejects({"-t", "token", "--account-delay-ms", "9223372036854775807"}, "account-delay-ms"));
        assert(Rejects({"-t", "token", "--ipv6-prefix", "129"}, "ipv6-prefix"));
        assert(Rejects({"-t", "token", "--http-timeout", "0"}, "http-timeout"));
        assert(Rejects({"-t", "token", "--account-delay-ms", "-5"}, "account-delay-ms"));
        assert(Rejects({"-t", "token", "--ip-endpoint", "ftp://example.com"}, "ip-endpoint"));
        assert(Rejects({"-t", "token", "--api-endpoint", "api.hetzner.cloud"}, "api-endpoint"));
        assert(Rejects({"-t", "token", "--bogus"}, "bogus"));
        assert(Rejects({"-t", "token", "-r", "soon"}, "reconciliation-interval"));
    }

    return 0;
}
