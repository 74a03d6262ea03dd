// main.cpp
// Hetzner Cloud firewall controller
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "Config.h"
#include "HcloudApi.h"
#include "HttpIpDiscovery.h"
#include "Scheduler.h"
#include "Utils.h"

namespace {

std::atomic<bool> g_stop{false};

void SignalHandler(int) {
    g_stop.store(true);
}

void PrintStartup(const ControllerConfig& config) {
    std::cout << "[+] Managing " << config.accounts.size() << " project(s), "
              << (config.runOnce ? "single run" : "interval " + std::to_string(config.interval.count()) + "s")
              << ".\n";
    if (!Utils::IsVerbose()) {
        return;
    }

    for (const auto& account : config.accounts) {
        std::cout << "[d] " << account.label << ": firewall '" << account.firewallName << "'\n";
    }
    std::cout << "[d] IPv4 discovery: " << (config.enableIPv4 ? "on" : "off")
              << ", IPv6 discovery: " << (config.enableIPv6 ? "on" : "off")
              << " (/" << config.ipv6Prefix << "), endpoint " << config.ipEndpoint << "\n";
    std::cout << "[d] Static networks: " << Utils::JoinCidrs(config.staticCidrs) << "\n";
    for (Protocol protocol : config.rules.simpleProtocols) {
        std::cout << "[d] Allow " << Utils::ProtocolLabel(protocol) << "\n";
    }
    for (const auto& range : config.rules.tcpPorts) {
        std::cout << "[d] Allow TCP " << Utils::PortRangeToString(range) << "\n";
    }
    for (const auto& range : config.rules.udpPorts) {
        std::cout << "[d] Allow UDP " << Utils::PortRangeToString(range) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ControllerConfig config;
    std::string message;
    switch (Config::Parse(argc, argv, config, message)) {
        case ParseStatus::Help:
            std::cout << message;
            return 0;
        case ParseStatus::Error:
            std::cerr << "[!] " << message << "\n\n" << Config::Usage();
            return 2;
        case ParseStatus::Ok:
            break;
    }

    Utils::SetVerbose(config.verbose);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    PrintStartup(config);

    HttpIpDiscovery discovery(config.ipEndpoint, config.httpTimeoutSeconds);
    Scheduler scheduler(
        config,
        discovery,
        [&config](const Account& account) -> std::unique_ptr<CloudApi> {
            return std::make_unique<HcloudApi>(config.apiEndpoint, account.token, config.httpTimeoutSeconds);
        },
        g_stop);

    return scheduler.Run();
}
