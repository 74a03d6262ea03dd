// RuleSpecBuilder.h
// Builds the desired inbound rules from protocol/port settings and source addresses
#pragma once
#include <set>
#include <vector>

#include "Models.h"

namespace RuleSpecBuilder {
    // One rule per simple protocol, one TCP and one UDP rule when ports are configured.
    // Every rule carries all `sources`; an empty set still yields the rules.
    std::vector<RuleSpec> Build(const std::set<Protocol>& simpleProtocols,
                                const std::vector<PortRange>& tcpPorts,
                                const std::vector<PortRange>& udpPorts,
                                const std::set<Cidr>& sources);

    std::vector<RuleSpec> Build(const RuleConfig& config, const std::set<Cidr>& sources);
}
