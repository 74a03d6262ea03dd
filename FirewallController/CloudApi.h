// CloudApi.h
// Abstract access to a cloud provider's firewall resources
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Models.h"

enum class ApiErrorKind { Network, Auth, RateLimit, Validation, Server, Protocol };

struct ApiError {
    ApiErrorKind kind = ApiErrorKind::Network;
    int status = 0; // HTTP status, 0 when no response was received
    std::string message;
};

const char* ApiErrorKindLabel(ApiErrorKind kind);

// One instance talks to one account. All calls return false on failure and fill `error`.
class CloudApi {
public:
    virtual ~CloudApi() = default;

    // `found` is left empty when no firewall carries exactly this name.
    virtual bool FindFirewall(const std::string& name, std::optional<Firewall>& found, ApiError& error) = 0;
    virtual bool CreateFirewall(const std::string& name,
                                const std::vector<RuleSpec>& rules,
                                Firewall& created,
                                ApiError& error) = 0;
    // Replaces the complete rule set of the firewall.
    virtual bool UpdateFirewallRules(std::int64_t id, const std::vector<RuleSpec>& rules, ApiError& error) = 0;
};
