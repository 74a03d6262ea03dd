// RuleDiffer.h
// Order-insensitive comparison of desired and remote rule sets
#pragma once
#include <vector>

#include "Models.h"

namespace RuleDiffer {
    // Merges and sorts port ranges, sorts and deduplicates the rules.
    std::vector<RuleSpec> Canonicalize(std::vector<RuleSpec> rules);

    bool Equal(const std::vector<RuleSpec>& desired, const std::vector<RuleSpec>& current);
}
