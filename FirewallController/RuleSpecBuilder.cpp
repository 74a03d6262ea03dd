// RuleSpecBuilder.cpp
#include <utility>

#include "RuleSpecBuilder.h"
#include "Utils.h"

namespace RuleSpecBuilder {

std::vector<RuleSpec> Build(const std::set<Protocol>& simpleProtocols,
                            const std::vector<PortRange>& tcpPorts,
                            const std::vector<PortRange>& udpPorts,
                            const std::set<Cidr>& sources) {
    std::vector<RuleSpec> rules;

    for (Protocol protocol : simpleProtocols) {
        if (!Utils::IsSimpleProtocol(protocol)) {
            continue;
        }
        RuleSpec spec;
        spec.protocol = protocol;
        spec.sources = sources;
        rules.push_back(std::move(spec));
    }

    auto addPortRule = [&](Protocol protocol, const std::vector<PortRange>& ports) {
        if (ports.empty()) {
            return;
        }
        RuleSpec spec;
        spec.protocol = protocol;
        spec.ports = Utils::NormalizePortRanges(ports);
        spec.sources = sources;
        rules.push_back(std::move(spec));
    };
    addPortRule(Protocol::TCP, tcpPorts);
    addPortRule(Protocol::UDP, udpPorts);

    return rules;
}

std::vector<RuleSpec> Build(const RuleConfig& config, const std::set<Cidr>& sources) {
    return Build(config.simpleProtocols, config.tcpPorts, config.udpPorts, sources);
}

} // namespace RuleSpecBuilder
