// Config.cpp
// Command line and environment parsing with boost::program_options
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "Config.h"
#include "Utils.h"

namespace po = boost::program_options;

namespace {

constexpr const char* kEnvPrefix = "HFC_";

po::typed_value<bool>* Flag() {
    return po::value<bool>()->implicit_value(true)->default_value(false);
}

po::options_description BuildOptions() {
    po::options_description options("Options");
    // clang-format off
    options.add_options()
        ("help,h", "Show this message and exit")
        ("run-once,1", Flag(),
            "Run only once and exit, useful if run by cron or other tools [HFC_RUN_ONCE]")
        ("hcloud-token,t", po::value<std::vector<std::string>>()->value_name("TOKEN[@FIREWALL]"),
            "Hetzner Cloud API token with read and write permissions. Repeat the option or pass a comma "
            "separated list to manage several projects; append @NAME to use a different firewall name "
            "for that project [HFC_HCLOUD_TOKEN]")
        ("firewall-name,f", po::value<std::string>()->default_value(kDefaultFirewallName),
            "Name of the firewall to manage [HFC_FIREWALL_NAME]")
        ("tcp", po::value<std::vector<std::string>>()->value_name("PORT | PORT RANGE"),
            "TCP ports or port ranges to allow, e.g. '80', '80,443', '80-85' or '80,443-450' [HFC_TCP]")
        ("udp", po::value<std::vector<std::string>>()->value_name("PORT | PORT RANGE"),
            "UDP ports or port ranges to allow, see --tcp [HFC_UDP]")
        ("icmp", Flag(), "Allow ICMP traffic [HFC_ICMP]")
        ("gre", Flag(), "Allow GRE traffic [HFC_GRE]")
        ("esp", Flag(), "Allow ESP traffic [HFC_ESP]")
        ("ip", po::value<std::vector<std::string>>()->value_name("CIDR"),
            "Static networks in CIDR notation added to every rule. The address must be the network id, "
            "so 127.0.0.0/24 works while 127.0.0.1/24 is rejected [HFC_IP]")
        ("disable-ipv4", Flag(), "Disable the detection of the public IPv4 address [HFC_DISABLE_IPV4]")
        ("disable-ipv6", Flag(), "Disable the detection of the public IPv6 address [HFC_DISABLE_IPV6]")
        ("ipv6-prefix", po::value<int>()->default_value(128),
            "Prefix length applied to the discovered IPv6 address [HFC_IPV6_PREFIX]")
        ("reconciliation-interval,r", po::value<long>()->default_value(60),
            "Reconciliation interval in seconds [HFC_RECONCILIATION_INTERVAL]")
        ("ip-endpoint,i", po::value<std::string>()->default_value(kDefaultIpEndpoint),
            "Endpoint to query the public IP from [HFC_IP_ENDPOINT]")
        ("api-endpoint", po::value<std::string>()->default_value(kDefaultApiEndpoint),
            "Hetzner Cloud API root [HFC_API_ENDPOINT]")
        ("http-timeout", po::value<int>()->default_value(10),
            "Connect and read timeout of every HTTP request in seconds [HFC_HTTP_TIMEOUT]")
        ("account-delay-ms", po::value<long>()->default_value(500),
            "Pause between two projects within one cycle [HFC_ACCOUNT_DELAY_MS]")
        ("verbose,v", Flag(), "Print debug output [HFC_VERBOSE]");
    // clang-format on
    return options;
}

// HFC_FIREWALL_NAME -> firewall-name, unknown variables are ignored
std::string MapEnvironmentName(const po::options_description& options, const std::string& variable) {
    const std::string prefix = kEnvPrefix;
    if (variable.compare(0, prefix.size(), prefix) != 0) {
        return {};
    }
    std::string name = Utils::ToLower(variable.substr(prefix.size()));
    for (char& ch : name) {
        if (ch == '_') {
            ch = '-';
        }
    }
    if (name == "help" || !options.find_nothrow(name, false)) {
        return {};
    }
    return name;
}

std::vector<std::string> ListValues(const po::variables_map& vm, const char* key) {
    std::vector<std::string> values;
    if (!vm.count(key)) {
        return values;
    }
    for (const auto& item : vm[key].as<std::vector<std::string>>()) {
        for (const auto& value : Utils::SplitList(item)) {
            values.push_back(value);
        }
    }
    return values;
}

bool ParseAccounts(const po::variables_map& vm, ControllerConfig& config, std::string& message) {
    const std::string defaultName = Utils::Trim(vm["firewall-name"].as<std::string>());
    if (defaultName.empty()) {
        message = "the firewall name must not be empty";
        return false;
    }

    for (const auto& entry : ListValues(vm, "hcloud-token")) {
        Account account;
        const auto at = entry.find('@');
        account.token = Utils::Trim(entry.substr(0, at));
        account.firewallName = at == std::string::npos ? defaultName : Utils::Trim(entry.substr(at + 1));
        if (account.token.empty() || account.firewallName.empty()) {
            message = "invalid --hcloud-token entry, expected TOKEN or TOKEN@FIREWALL";
            return false;
        }
        account.label = "project #" + std::to_string(config.accounts.size() + 1);
        config.accounts.push_back(std::move(account));
    }

    if (config.accounts.empty()) {
        message = "at least one Hetzner Cloud API token is required (--hcloud-token or HFC_HCLOUD_TOKEN)";
        return false;
    }
    return true;
}

bool ParseRules(const po::variables_map& vm, ControllerConfig& config, std::string& message) {
    if (vm["icmp"].as<bool>()) config.rules.simpleProtocols.insert(Protocol::ICMP);
    if (vm["gre"].as<bool>()) config.rules.simpleProtocols.insert(Protocol::GRE);
    if (vm["esp"].as<bool>()) config.rules.simpleProtocols.insert(Protocol::ESP);

    std::string error;
    auto tcp = Utils::ParsePortSpec(ListValues(vm, "tcp"), &error);
    if (!tcp) {
        message = "--tcp: " + error;
        return false;
    }
    auto udp = Utils::ParsePortSpec(ListValues(vm, "udp"), &error);
    if (!udp) {
        message = "--udp: " + error;
        return false;
    }
    config.rules.tcpPorts = std::move(*tcp);
    config.rules.udpPorts = std::move(*udp);

    for (const auto& text : ListValues(vm, "ip")) {
        auto cidr = Utils::ParseCidr(text, &error);
        if (!cidr) {
            message = "--ip: " + error;
            return false;
        }
        config.staticCidrs.insert(*cidr);
    }
    return true;
}

bool ParseTiming(const po::variables_map& vm, ControllerConfig& config, std::string& message) {
    const int prefix = vm["ipv6-prefix"].as<int>();
    if (prefix < 1 || prefix > 128) {
        message = "--ipv6-prefix must be between 1 and 128";
        return false;
    }
    config.ipv6Prefix = prefix;

    const long interval = vm["reconciliation-interval"].as<long>();
    if (interval <= 0 || interval > std::chrono::seconds(kMaxWait).count()) {
        message = "--reconciliation-interval must be between 1 and " +
                  std::to_string(std::chrono::seconds(kMaxWait).count()) + " seconds";
        return false;
    }
    config.interval = std::chrono::seconds(interval);

    const int timeout = vm["http-timeout"].as<int>();
    if (timeout <= 0) {
        message = "--http-timeout must be a positive number of seconds";
        return false;
    }
    config.httpTimeoutSeconds = timeout;

    const long delay = vm["account-delay-ms"].as<long>();
    if (delay < 0 || delay > std::chrono::milliseconds(kMaxWait).count()) {
        message = "--account-delay-ms must be between 0 and " +
                  std::to_string(std::chrono::milliseconds(kMaxWait).count());
        return false;
    }
    config.accountDelay = std::chrono::milliseconds(delay);
    return true;
}

bool ParseEndpoints(const po::variables_map& vm, ControllerConfig& config, std::string& message) {
    std::string base;
    std::string path;
    config.ipEndpoint = Utils::Trim(vm["ip-endpoint"].as<std::string>());
    if (!Utils::SplitUrl(config.ipEndpoint, base, path)) {
        message = "--ip-endpoint '" + config.ipEndpoint + "' is not an http(s) URL";
        return false;
    }
    config.apiEndpoint = Utils::Trim(vm["api-endpoint"].as<std::string>());
    if (!Utils::SplitUrl(config.apiEndpoint, base, path)) {
        message = "--api-endpoint '" + config.apiEndpoint + "' is not an http(s) URL";
        return false;
    }
    return true;
}

} // namespace

namespace Config {

std::string Usage() {
    std::ostringstream oss;
    oss << "Usage: hcloud-firewall-controller [OPTIONS] --hcloud-token TOKEN\n\n"
        << "Keeps a Hetzner Cloud firewall in sync with the current public IP address.\n"
        << "Every option can also be set through the environment variable named in brackets.\n\n"
        << BuildOptions();
    return oss.str();
}

ParseStatus Parse(int argc, const char* const argv[], ControllerConfig& config, std::string& message) {
    const po::options_description options = BuildOptions();
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(options).run(), vm);
        po::store(po::parse_environment(options,
                                        [&options](const std::string& variable) {
                                            return MapEnvironmentName(options, variable);
                                        }),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        message = e.what();
        return ParseStatus::Error;
    }

    if (vm.count("help")) {
        message = Usage();
        return ParseStatus::Help;
    }

    ControllerConfig parsed;
    parsed.runOnce = vm["run-once"].as<bool>();
    parsed.enableIPv4 = !vm["disable-ipv4"].as<bool>();
    parsed.enableIPv6 = !vm["disable-ipv6"].as<bool>();
    parsed.verbose = vm["verbose"].as<bool>();

    if (!ParseAccounts(vm, parsed, message) || !ParseRules(vm, parsed, message) ||
        !ParseTiming(vm, parsed, message) || !ParseEndpoints(vm, parsed, message)) {
        return ParseStatus::Error;
    }

    config = std::move(parsed);
    return ParseStatus::Ok;
}

} // namespace Config
