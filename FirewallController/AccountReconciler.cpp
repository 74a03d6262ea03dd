// AccountReconciler.cpp
#include <iostream>
#include <utility>

#include "AccountReconciler.h"
#include "RuleDiffer.h"
#include "RuleSpecBuilder.h"
#include "Utils.h"

const char* FailureStageLabel(FailureStage stage) {
    switch (stage) {
        case FailureStage::None:   return "none";
        case FailureStage::Setup:  return "setup";
        case FailureStage::Lookup: return "lookup";
        case FailureStage::Create: return "create";
        case FailureStage::Apply:  return "apply";
    }
    return "unknown";
}

AccountReconciler::AccountReconciler(const Account& account, CloudApi& api) : account(account), api(api) {}

ReconcileOutcome AccountReconciler::Fail(FailureStage stage, const ApiError& error) {
    ReconcileOutcome outcome;
    outcome.account = account.label;
    outcome.firewallName = account.firewallName;
    outcome.status = ReconcileStatus::Failed;
    outcome.stage = stage;
    outcome.message = std::string(ApiErrorKindLabel(error.kind)) + " error: " + error.message;

    std::cerr << "[!] " << account.label << ": " << FailureStageLabel(stage) << " of firewall '"
              << account.firewallName << "' failed (" << outcome.message << ")\n";
    return outcome;
}

ReconcileOutcome AccountReconciler::Reconcile(const RuleConfig& rules, const std::set<Cidr>& sources) {
    const std::vector<RuleSpec> desired = RuleSpecBuilder::Build(rules, sources);

    std::optional<Firewall> existing;
    ApiError error;
    if (!api.FindFirewall(account.firewallName, existing, error)) {
        return Fail(FailureStage::Lookup, error);
    }

    ReconcileOutcome outcome;
    outcome.account = account.label;
    outcome.firewallName = account.firewallName;

    Firewall firewall;
    if (existing) {
        firewall = std::move(*existing);
    } else {
        if (!api.CreateFirewall(account.firewallName, {}, firewall, error)) {
            return Fail(FailureStage::Create, error);
        }
        outcome.created = true;
        std::cout << "[+] " << account.label << ": created new firewall '" << account.firewallName
                  << "' (id: " << firewall.id << ")\n";
    }
    outcome.firewallId = firewall.id;

    if (firewall.rulesRecognized && RuleDiffer::Equal(desired, firewall.rules)) {
        outcome.status = ReconcileStatus::Skipped;
        std::cout << "[i] " << account.label << ": rules of '" << account.firewallName << "' (id: " << firewall.id
                  << ") are already up to date for " << Utils::JoinCidrs(sources) << "\n";
        return outcome;
    }

    if (Utils::IsVerbose()) {
        std::cout << "[d] " << account.label << ": " << firewall.rules.size() << " remote rule groups differ from "
                  << desired.size() << " desired rule groups\n";
    }

    if (!api.UpdateFirewallRules(firewall.id, desired, error)) {
        ReconcileOutcome failed = Fail(FailureStage::Apply, error);
        failed.firewallId = firewall.id;
        failed.created = outcome.created;
        return failed;
    }

    outcome.status = ReconcileStatus::Applied;
    std::cout << "[+] " << account.label << ": rules of '" << account.firewallName << "' (id: " << firewall.id
              << ") have been updated for " << Utils::JoinCidrs(sources) << "\n";
    return outcome;
}
