// Scheduler.h
// Drives reconciliation of all accounts, once or on a fixed interval
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <vector>

#include "AccountReconciler.h"
#include "CloudApi.h"
#include "Config.h"
#include "IpDiscovery.h"

struct CycleReport {
    std::set<Cidr> sources;
    std::vector<AddressFamily> discoveryFailures;
    std::vector<ReconcileOutcome> outcomes;
    bool interrupted = false; // stop was requested before every account was attempted

    bool Succeeded() const;
};

using CloudApiFactory = std::function<std::unique_ptr<CloudApi>(const Account&)>;

class Scheduler {
public:
    Scheduler(const ControllerConfig& config,
              IpDiscovery& discovery,
              CloudApiFactory apiFactory,
              const std::atomic<bool>& stopFlag);

    // Resolves addresses once and reconciles every account in turn.
    CycleReport RunCycle();

    // Single cycle, returns the process exit status (0 when every account succeeded).
    int RunOnce();

    // Cycles until the stop flag is raised, returns 0.
    int RunForever();

    int Run();

private:
    // Sleeps in short slices; returns false as soon as stop is requested.
    bool WaitFor(std::chrono::milliseconds duration) const;

    const ControllerConfig& config;
    IpDiscovery& discovery;
    CloudApiFactory apiFactory;
    const std::atomic<bool>& stopFlag;
};
