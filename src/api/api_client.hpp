#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "polling/status_poller.hpp"

namespace httplib {
class Client;
}

namespace scalebox::api {

struct ImportJobInfo {
    std::string job_id;
    std::string template_id;
    std::string status;
    std::optional<double> progress_percentage;
    std::optional<std::string> error_message;
    std::optional<std::string> updated_at;
};

// REST client for the status endpoints of the control plane.
class ApiClient {
public:
    explicit ApiClient(config::ConnectionConfig config, config::PollingConfig polling = {});
    explicit ApiClient(const config::Config& config);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    polling::StatusSnapshot GetSandboxStatus(const std::string& sandbox_id);
    polling::StatusSnapshot WaitUntilStatus(const std::string& sandbox_id,
                                            const std::set<std::string>& targets,
                                            std::optional<polling::PollOptions> options = std::nullopt);
    // false on any lookup failure.
    bool IsRunning(const std::string& sandbox_id);

    ImportJobInfo GetImportStatus(const std::string& template_id);
    // Without options, timing comes from the PollingConfig given at construction.
    ImportJobInfo WaitUntilImportComplete(const std::string& template_id,
                                          std::optional<polling::PollOptions> options = std::nullopt);

private:
    nlohmann::json GetJson(const std::string& path);
    polling::PollOptions ResolvePollOptions(std::optional<polling::PollOptions> options) const;

    config::ConnectionConfig config_;
    config::PollingConfig polling_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
};

// Exposed for tests.
polling::StatusSnapshot ParseSandboxStatus(const nlohmann::json& body, const std::string& sandbox_id);
ImportJobInfo ParseImportJob(const nlohmann::json& body, const std::string& template_id);

}  // namespace scalebox::api
