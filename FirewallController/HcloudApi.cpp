// HcloudApi.cpp
// Firewall lookup, creation and rule replacement over the Hetzner Cloud REST API

#include <iostream>
#include <utility>

#include "HcloudApi.h"
#include "HcloudJson.h"
#include "Utils.h"

#include <httplib.h>

using json = nlohmann::json;

namespace {

constexpr const char* kUserAgent = "hcloud-firewall-controller";

std::string DescribeFailure(int status, const json& body, const std::string& rawBody) {
    std::string described = HcloudJson::DescribeError(body);
    if (described.empty()) {
        described = rawBody.size() > 200 ? rawBody.substr(0, 200) + "..." : rawBody;
    }
    return "HTTP " + std::to_string(status) + (described.empty() ? "" : " " + described);
}

} // namespace

HcloudApi::HcloudApi(std::string endpoint, std::string token, int timeoutSeconds)
    : endpoint(std::move(endpoint)), token(std::move(token)), timeoutSeconds(timeoutSeconds) {}

ApiErrorKind HcloudApi::ClassifyStatus(int status) {
    if (status == 401 || status == 403) {
        return ApiErrorKind::Auth;
    }
    if (status == 429) {
        return ApiErrorKind::RateLimit;
    }
    if (status >= 500) {
        return ApiErrorKind::Server;
    }
    if (status >= 400) {
        return ApiErrorKind::Validation;
    }
    return ApiErrorKind::Protocol;
}

bool HcloudApi::Send(Method method,
                     const std::string& path,
                     const Query& query,
                     const json* payload,
                     json& response,
                     ApiError& error) {
    std::string base;
    std::string basePath;
    if (!Utils::SplitUrl(endpoint, base, basePath)) {
        error = {ApiErrorKind::Protocol, 0, "invalid API endpoint URL '" + endpoint + "'"};
        return false;
    }
    if (basePath == "/") {
        basePath.clear();
    }

    httplib::Client client(base);
    client.set_bearer_token_auth(token);
    client.set_connection_timeout(timeoutSeconds, 0);
    client.set_read_timeout(timeoutSeconds, 0);
    client.set_write_timeout(timeoutSeconds, 0);

    const httplib::Headers headers = {{"User-Agent", kUserAgent}, {"Accept", "application/json"}};
    const std::string target = basePath + path;

    std::string body = "{}";
    if (payload) {
        try {
            body = payload->dump();
        } catch (const json::exception& e) {
            error = {ApiErrorKind::Protocol, 0, "cannot encode request to " + target + ": " + e.what()};
            return false;
        }
    }

    const httplib::Params params(query.begin(), query.end());
    httplib::Result res = method == Method::Get ? client.Get(target, params, headers)
                                                : client.Post(target, headers, body, "application/json");
    if (!res) {
        error = {ApiErrorKind::Network, 0, "request to " + base + target + " failed: " + httplib::to_string(res.error())};
        return false;
    }

    response = json::parse(res->body, nullptr, /*allow_exceptions=*/false);
    if (res->status < 200 || res->status >= 300) {
        error = {ClassifyStatus(res->status), res->status, DescribeFailure(res->status, response, res->body)};
        return false;
    }
    if (response.is_discarded()) {
        error = {ApiErrorKind::Protocol, res->status, "response from " + target + " is not valid JSON"};
        return false;
    }
    const std::string apiError = HcloudJson::DescribeError(response);
    if (!apiError.empty()) {
        error = {ApiErrorKind::Validation, res->status, apiError};
        return false;
    }

    if (Utils::IsVerbose()) {
        std::cout << "[d] " << (method == Method::Get ? "GET " : "POST ") << target << " -> HTTP " << res->status
                  << "\n";
    }
    return true;
}

bool HcloudApi::FindFirewall(const std::string& name, std::optional<Firewall>& found, ApiError& error) {
    json response;
    if (!Send(Method::Get, "/firewalls", {{"name", name}}, nullptr, response, error)) {
        return false;
    }

    std::string problem;
    if (!HcloudJson::DecodeFirewallList(response, name, found, problem)) {
        error = {ApiErrorKind::Protocol, 200, "unexpected firewall list: " + problem};
        return false;
    }

    if (found && Utils::IsVerbose()) {
        std::cout << "[d] Firewall '" << found->name << "' (id: " << found->id << ") found with "
                  << found->rules.size() << " rule groups\n";
    }
    if (found && !found->rulesRecognized) {
        std::cout << "[i] Firewall '" << name << "' contains rules that are not managed by this controller ("
                  << problem << "); they will be replaced.\n";
    }
    return true;
}

bool HcloudApi::CreateFirewall(const std::string& name,
                               const std::vector<RuleSpec>& rules,
                               Firewall& created,
                               ApiError& error) {
    json payload;
    payload["name"] = name;
    payload["rules"] = HcloudJson::EncodeRules(rules);

    json response;
    if (!Send(Method::Post, "/firewalls", {}, &payload, response, error)) {
        return false;
    }

    std::string problem;
    if (!response.contains("firewall") || !HcloudJson::DecodeFirewall(response["firewall"], created, problem)) {
        error = {ApiErrorKind::Protocol, 201, "unexpected create response: " + problem};
        return false;
    }
    return true;
}

bool HcloudApi::UpdateFirewallRules(std::int64_t id, const std::vector<RuleSpec>& rules, ApiError& error) {
    json payload;
    payload["rules"] = HcloudJson::EncodeRules(rules);

    json response;
    return Send(Method::Post, "/firewalls/" + std::to_string(id) + "/actions/set_rules", {}, &payload, response, error);
}
