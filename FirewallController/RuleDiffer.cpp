// RuleDiffer.cpp
#include <algorithm>
#include <utility>

#include "RuleDiffer.h"
#include "Utils.h"

namespace RuleDiffer {

std::vector<RuleSpec> Canonicalize(std::vector<RuleSpec> rules) {
    for (auto& spec : rules) {
        spec.ports = Utils::NormalizePortRanges(std::move(spec.ports));
    }
    std::sort(rules.begin(), rules.end());
    rules.erase(std::unique(rules.begin(), rules.end()), rules.end());
    return rules;
}

bool Equal(const std::vector<RuleSpec>& desired, const std::vector<RuleSpec>& current) {
    return Canonicalize(desired) == Canonicalize(current);
}

} // namespace RuleDiffer
