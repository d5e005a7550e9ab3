#pragma once
#include "config.h"
#include "sync_orchestrator.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace httplib { class Server; }

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

struct LogParseError {
    size_t index = 0;
    nlohmann::json entry;
    std::string message;
};

// Pushed log entries -> punches. Bad entries are skipped and reported;
// timestamps without a zone are branch-local.
std::vector<RawPunchEvent> parse_pushed_logs(const nlohmann::json& logs, const std::string& branch_id,
    int utc_offset_minutes, std::vector<LogParseError>& errors);

// Request handlers, independent of the HTTP transport. `authorization` is the
// raw Authorization header value.
class SyncApi {
public:
    using Clock = std::function<time_t()>;

    SyncApi(SyncOrchestrator& orchestrator, SyncCursorStore& cursors, const AppConfig& config, Clock clock = {});

    ApiResponse sync_from_branch(const std::string& authorization, const std::string& body);
    ApiResponse last_sync(const std::string& authorization, const std::string& branch_id);
    ApiResponse sync_device(const std::string& authorization, const std::string& body);

private:
    // Empty response status 0 when authorized.
    ApiResponse authorize(const std::string& authorization, const std::string& branch_id) const;

    SyncOrchestrator& orchestrator_;
    SyncCursorStore& cursors_;
    const AppConfig& config_;
    Clock clock_;
};

// cpp-httplib front end for SyncApi.
class HttpServer {
public:
    HttpServer(SyncApi& api, HttpConfig cfg);
    ~HttpServer();

    // Blocks until stop(); false if the port could not be bound.
    bool run();
    void stop();
    bool listening() const { return listening_.load(); }

private:
    SyncApi& api_;
    HttpConfig cfg_;
    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> listening_{ false };
};
