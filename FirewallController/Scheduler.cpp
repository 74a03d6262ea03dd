// Scheduler.cpp
#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

#include "AddressBook.h"
#include "Scheduler.h"
#include "Utils.h"

namespace {

constexpr std::chrono::milliseconds kStopPollSlice{200};

} // namespace

bool CycleReport::Succeeded() const {
    if (interrupted) {
        return false;
    }
    return std::all_of(outcomes.begin(), outcomes.end(),
                       [](const ReconcileOutcome& outcome) { return outcome.Succeeded(); });
}

Scheduler::Scheduler(const ControllerConfig& config,
                     IpDiscovery& discovery,
                     CloudApiFactory apiFactory,
                     const std::atomic<bool>& stopFlag)
    : config(config), discovery(discovery), apiFactory(std::move(apiFactory)), stopFlag(stopFlag) {}

bool Scheduler::WaitFor(std::chrono::milliseconds duration) const {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::min<std::chrono::milliseconds>(duration, kMaxWait);
    while (!stopFlag.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kStopPollSlice));
    }
    return false;
}

CycleReport Scheduler::RunCycle() {
    CycleReport report;

    AddressBook addressBook(discovery, config.ipv6Prefix);
    ResolvedAddresses resolved = addressBook.Resolve(config.enableIPv4, config.enableIPv6, config.staticCidrs);
    report.sources = std::move(resolved.sources);
    report.discoveryFailures = std::move(resolved.failedFamilies);

    for (std::size_t i = 0; i < config.accounts.size(); ++i) {
        const Account& account = config.accounts[i];
        if (i > 0 && !WaitFor(config.accountDelay)) {
            report.interrupted = true;
            break;
        }
        if (stopFlag.load()) {
            report.interrupted = true;
            break;
        }

        try {
            std::unique_ptr<CloudApi> api = apiFactory(account);
            AccountReconciler reconciler(account, *api);
            report.outcomes.push_back(reconciler.Reconcile(config.rules, report.sources));
        } catch (const std::exception& e) {
            std::cerr << "[!] " << account.label << ": reconciliation aborted: " << e.what() << "\n";
            ReconcileOutcome outcome;
            outcome.account = account.label;
            outcome.firewallName = account.firewallName;
            outcome.status = ReconcileStatus::Failed;
            outcome.stage = FailureStage::Setup;
            outcome.message = e.what();
            report.outcomes.push_back(std::move(outcome));
        }
    }

    if (report.interrupted) {
        std::cout << "[i] Shutdown requested, " << report.outcomes.size() << " of " << config.accounts.size()
                  << " projects reconciled in this cycle.\n";
    }
    return report;
}

int Scheduler::RunOnce() {
    const CycleReport report = RunCycle();
    if (!report.Succeeded()) {
        const auto failed = std::count_if(report.outcomes.begin(), report.outcomes.end(),
                                          [](const ReconcileOutcome& outcome) { return !outcome.Succeeded(); });
        std::cerr << "[!] Reconciliation finished with " << failed << " failed project(s).\n";
        return 1;
    }
    if (Utils::IsVerbose()) {
        std::cout << "[d] Reconciliation succeeded\n";
    }
    return 0;
}

int Scheduler::RunForever() {
    while (!stopFlag.load()) {
        if (Utils::IsVerbose()) {
            std::cout << "[d] Reconciliation cycle started\n";
        }
        const CycleReport report = RunCycle();
        if (Utils::IsVerbose()) {
            std::cout << "[d] Reconciliation cycle finished (" << (report.Succeeded() ? "ok" : "with failures")
                      << "), sleeping for " << config.interval.count() << " seconds\n";
        }
        if (!WaitFor(config.interval)) {
            break;
        }
    }
    std::cout << "[+] Controller stopped.\n";
    return 0;
}

int Scheduler::Run() {
    return config.runOnce ? RunOnce() : RunForever();
}
