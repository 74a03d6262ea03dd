// AccountReconciler.h
// Converges the firewall of one account towards the desired rules
#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "CloudApi.h"
#include "Models.h"

enum class ReconcileStatus { Skipped, Applied, Failed };

// Step that failed, None for successful cycles. Setup means no API client could be built.
enum class FailureStage { None, Setup, Lookup, Create, Apply };

struct ReconcileOutcome {
    std::string account;
    std::string firewallName;
    ReconcileStatus status = ReconcileStatus::Failed;
    FailureStage stage = FailureStage::None;
    std::optional<std::int64_t> firewallId;
    bool created = false;
    std::string message;

    bool Succeeded() const { return status != ReconcileStatus::Failed; }
};

const char* FailureStageLabel(FailureStage stage);

class AccountReconciler {
public:
    AccountReconciler(const Account& account, CloudApi& api);

    // Lookup (or create), diff, and update only when the rules differ.
    // Never throws: every failure is returned as a Failed outcome.
    ReconcileOutcome Reconcile(const RuleConfig& rules, const std::set<Cidr>& sources);

private:
    ReconcileOutcome Fail(FailureStage stage, const ApiError& error);

    const Account& account;
    CloudApi& api;
};
