#include "api/api_client.hpp"

#include <algorithm>

#include "errors/errors.hpp"
#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::api {

namespace {

// Control-plane address split into what httplib::Client wants and the path
// prefix every request carries.
struct Endpoint {
    std::string origin;
    std::string base_path;
};

Endpoint ParseEndpoint(const std::string& url) {
    std::string scheme = "https";
    std::string rest = url;
    if (const auto marker = url.find("://"); marker != std::string::npos) {
        scheme = utils::ToLower(url.substr(0, marker));
        rest = url.substr(marker + 3);
    }
    if (scheme != "https" && scheme != "http") {
        throw errors::InvalidArgumentError("unsupported api url scheme: " + scheme);
    }

    Endpoint endpoint{};
    std::string authority = rest.substr(0, rest.find('/'));
    if (authority.size() < rest.size()) {
        endpoint.base_path = rest.substr(authority.size());
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    int port = scheme == "https" ? 443 : 80;
    if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        const auto port_text = authority.substr(colon + 1);
        authority.resize(colon);
        try {
            port = std::stoi(port_text);
        } catch (const std::exception&) {
            throw errors::InvalidArgumentError("invalid port in api url: " + url);
        }
        if (port <= 0 || port > 65535) {
            throw errors::InvalidArgumentError("invalid port in api url: " + url);
        }
    }
    if (authority.empty()) {
        throw errors::InvalidArgumentError("invalid api url: " + url);
    }
    endpoint.origin = scheme + "://" + authority + ":" + std::to_string(port);
    return endpoint;
}

// Responses are either the object itself or {"data": {...}}.
const nlohmann::json& Unwrap(const nlohmann::json& body) {
    if (body.is_object() && body.contains("data") && body.at("data").is_object()) {
        return body.at("data");
    }
    return body;
}

std::string StringField(const nlohmann::json& data, const char* snake, const char* camel) {
    for (const char* key : {snake, camel}) {
        auto it = data.find(key);
        if (it != data.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

std::optional<std::string> OptionalStringField(const nlohmann::json& data, const char* snake, const char* camel) {
    auto value = StringField(data, snake, camel);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

polling::StatusSnapshot ParseSandboxStatus(const nlohmann::json& body, const std::string& sandbox_id) {
    const auto& data = Unwrap(body);
    if (!data.is_object()) {
        throw errors::SandboxError("unexpected sandbox status response", "invalid_response");
    }
    polling::StatusSnapshot snapshot{};
    snapshot.id = StringField(data, "sandbox_id", "sandboxId");
    if (snapshot.id.empty()) {
        snapshot.id = sandbox_id;
    }
    snapshot.status = StringField(data, "status", "status");
    if (snapshot.status.empty()) {
        throw errors::SandboxError("sandbox status response has no status", "invalid_response");
    }
    snapshot.substatus = OptionalStringField(data, "substatus", "subStatus");
    snapshot.reason = OptionalStringField(data, "reason", "reason");
    snapshot.updated_at = StringField(data, "updated_at", "updatedAt");
    return snapshot;
}

ImportJobInfo ParseImportJob(const nlohmann::json& body, const std::string& template_id) {
    const auto& data = Unwrap(body);
    if (!data.is_object()) {
        throw errors::SandboxError("unexpected import status response", "invalid_response");
    }
    ImportJobInfo info{};
    info.job_id = StringField(data, "job_id", "jobId");
    info.template_id = StringField(data, "template_id", "templateId");
    if (info.template_id.empty()) {
        info.template_id = template_id;
    }
    info.status = StringField(data, "status", "status");
    if (info.status.empty()) {
        throw errors::SandboxError("import status response has no status", "invalid_response");
    }
    for (const char* key : {"progress_percentage", "progressPercentage"}) {
        auto it = data.find(key);
        if (it != data.end() && it->is_number()) {
            info.progress_percentage = it->get<double>();
            break;
        }
    }
    info.error_message = OptionalStringField(data, "error_message", "errorMessage");
    info.updated_at = OptionalStringField(data, "updated_at", "updatedAt");
    return info;
}

ApiClient::ApiClient(const config::Config& config)
    : ApiClient(config.connection, config.polling) {}

ApiClient::ApiClient(config::ConnectionConfig config, config::PollingConfig polling)
    : config_(std::move(config))
    , polling_(polling) {
    auto endpoint = ParseEndpoint(config_.api_url);
    base_path_ = std::move(endpoint.base_path);
    client_ = std::make_unique<httplib::Client>(endpoint.origin);

    const auto timeout_s = std::max(1, config_.request_timeout_ms / 1000);
    client_->set_connection_timeout(timeout_s);
    client_->set_read_timeout(timeout_s);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("X-API-KEY", config_.api_key);
    } else if (!config_.access_token.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.access_token);
    }
    if (config_.debug) {
        headers.emplace("X-Debug", "true");
    }
    for (const auto& [key, value] : config_.headers) {
        headers.emplace(key, value);
    }
    client_->set_default_headers(headers);
}

ApiClient::~ApiClient() = default;

nlohmann::json ApiClient::GetJson(const std::string& path) {
    const std::string endpoint = base_path_ + path;
    utils::LogDebug("api", "GET " + endpoint);
    auto response = client_->Get(endpoint.c_str());
    if (!response) {
        const auto err = response.error();
        throw errors::SandboxError(
            "request to " + endpoint + " failed: " + httplib::to_string(err), "transport");
    }
    if (response->status == 401 || response->status == 403) {
        throw errors::AuthenticationError(
            "authentication failed (HTTP " + std::to_string(response->status) + ")", "unauthorized");
    }
    if (response->status == 404) {
        throw errors::NotFoundError(endpoint + " not found", "not_found");
    }
    if (response->status >= 400) {
        utils::LogWarn("api", "HTTP " + std::to_string(response->status) + " body=" + response->body);
        throw errors::SandboxError(
            "HTTP " + std::to_string(response->status) + " from " + endpoint, "http_" + std::to_string(response->status));
    }
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        throw errors::SandboxError("invalid JSON from " + endpoint, "invalid_response");
    }
    return body;
}

polling::StatusSnapshot ApiClient::GetSandboxStatus(const std::string& sandbox_id) {
    if (sandbox_id.empty()) {
        throw errors::InvalidArgumentError("sandbox id must not be empty");
    }
    return ParseSandboxStatus(GetJson("/v1/sandboxes/" + sandbox_id + "/status"), sandbox_id);
}

polling::PollOptions ApiClient::ResolvePollOptions(std::optional<polling::PollOptions> options) const {
    if (options.has_value()) {
        return std::move(*options);
    }
    return polling::PollOptionsFromConfig(polling_);
}

polling::StatusSnapshot ApiClient::WaitUntilStatus(const std::string& sandbox_id,
                                                   const std::set<std::string>& targets,
                                                   std::optional<polling::PollOptions> options) {
    auto resolved = ResolvePollOptions(std::move(options));
    resolved.subject = "sandbox " + sandbox_id;
    return polling::PollUntil(
        [this, &sandbox_id]() { return GetSandboxStatus(sandbox_id); },
        polling::IsStatusIn(targets),
        resolved);
}

bool ApiClient::IsRunning(const std::string& sandbox_id) {
    try {
        return utils::ToLower(GetSandboxStatus(sandbox_id).status) == "running";
    } catch (const errors::ScaleboxError& ex) {
        utils::LogDebug("api", std::string("status lookup failed: ") + ex.what());
        return false;
    }
}

ImportJobInfo ApiClient::GetImportStatus(const std::string& template_id) {
    if (template_id.empty()) {
        throw errors::InvalidArgumentError("template id must not be empty");
    }
    return ParseImportJob(GetJson("/v1/templates/" + template_id + "/import-status"), template_id);
}

ImportJobInfo ApiClient::WaitUntilImportComplete(const std::string& template_id,
                                                 std::optional<polling::PollOptions> options) {
    auto resolved = ResolvePollOptions(std::move(options));
    resolved.subject = "import of template " + template_id;
    ImportJobInfo latest{};
    polling::PollUntil(
        [this, &template_id, &latest]() {
            latest = GetImportStatus(template_id);
            return polling::StatusSnapshot{
                .id = latest.job_id,
                .status = latest.status,
                .substatus = std::nullopt,
                .reason = latest.error_message,
                .updated_at = latest.updated_at.value_or(""),
            };
        },
        polling::IsStatusIn({"completed", "failed", "cancelled"}),
        resolved);
    return latest;
}

}  // namespace scalebox::api
