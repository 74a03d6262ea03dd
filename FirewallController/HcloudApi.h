// HcloudApi.h
// Hetzner Cloud firewall API client for a single project token
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CloudApi.h"

class HcloudApi : public CloudApi {
public:
    // `endpoint` is the API root, e.g. https://api.hetzner.cloud/v1
    HcloudApi(std::string endpoint, std::string token, int timeoutSeconds);

    bool FindFirewall(const std::string& name, std::optional<Firewall>& found, ApiError& error) override;
    bool CreateFirewall(const std::string& name,
                        const std::vector<RuleSpec>& rules,
                        Firewall& created,
                        ApiError& error) override;
    bool UpdateFirewallRules(std::int64_t id, const std::vector<RuleSpec>& rules, ApiError& error) override;

    // Maps an HTTP status of a failed call to an error class
    static ApiErrorKind ClassifyStatus(int status);

private:
    enum class Method { Get, Post };
    using Query = std::multimap<std::string, std::string>;

    bool Send(Method method,
              const std::string& path,
              const Query& query,
              const nlohmann::json* payload,
              nlohmann::json& response,
              ApiError& error);

    std::string endpoint;
    std::string token;
    int timeoutSeconds;
};
