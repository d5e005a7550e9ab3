#include "http_api.h"
#include "auth_manager.h"
#include "logger.h"
#include "sync_errors.h"
#include "time_util.h"

#include <httplib.h>

using nlohmann::json;

namespace {

ApiResponse fail(int status, const std::string& message) {
    return { status, json{ {"success", false}, {"message", message} } };
}

// Numbers and strings both appear for ids in agent payloads.
std::optional<std::string> scalar_string(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    const json& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return std::nullopt;
}

std::optional<int> scalar_int(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    const json& v = j[key];
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_string()) {
        try { return std::stoi(v.get<std::string>()); }
        catch (const std::exception&) { return std::nullopt; }
    }
    return std::nullopt;
}

std::string bearer_token(const std::string& authorization) {
    const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) != 0) return "";
    return authorization.substr(prefix.size());
}

json error_entry(const std::string& enroll, const std::optional<std::string>& admission,
    const json& timestamp, const std::string& message) {
    return json{ {"enrollNumber", enroll},
        {"admissionNumber", admission ? json(*admission) : json(nullptr)},
        {"timestamp", timestamp}, {"message", message} };
}

}  // namespace

std::vector<RawPunchEvent> parse_pushed_logs(const json& logs, const std::string& branch_id,
    int utc_offset_minutes, std::vector<LogParseError>& errors) {
    std::vector<RawPunchEvent> out;
    for (size_t i = 0; i < logs.size(); ++i) {
        const json& entry = logs[i];
        if (!entry.is_object()) { errors.push_back({ i, entry, "log entry is not an object" }); continue; }

        auto enroll = scalar_string(entry, "enrollNumber");
        if (!enroll || enroll->empty()) { errors.push_back({ i, entry, "enrollNumber is required" }); continue; }

        if (!entry.contains("timestamp") || !entry["timestamp"].is_string()) {
            errors.push_back({ i, entry, "timestamp is required" });
            continue;
        }
        auto ts = parse_iso_timestamp(entry["timestamp"].get<std::string>(), utc_offset_minutes);
        if (!ts) { errors.push_back({ i, entry, "Invalid timestamp format" }); continue; }

        RawPunchEvent e;
        e.branch_id = branch_id;
        e.enroll_number = *enroll;
        e.timestamp = *ts;
        if (auto adm = scalar_string(entry, "admissionNumber"); adm && !adm->empty()) e.admission_number = adm;

        if (entry.contains("checkType") && entry["checkType"].is_string())
            e.direction = direction_from_check_type(entry["checkType"].get<std::string>());
        else if (auto mode = scalar_int(entry, "inOutMode"))
            e.direction = direction_from_device(*mode);

        if (auto vm = scalar_int(entry, "verifyMode")) e.verify_mode = verify_mode_from_device(*vm);
        if (auto wc = scalar_int(entry, "workCode")) e.work_code = *wc;

        if (auto dev = scalar_string(entry, "deviceId")) e.source_device_id = *dev;
        else if (auto sensor = scalar_string(entry, "sensorId")) e.source_device_id = "sensor-" + *sensor;
        else e.source_device_id = "branch-agent";

        const std::string raw = entry.dump();
        e.raw_payload.assign(raw.begin(), raw.end());
        out.push_back(std::move(e));
    }
    return out;
}

SyncApi::SyncApi(SyncOrchestrator& orchestrator, SyncCursorStore& cursors, const AppConfig& config, Clock clock)
    : orchestrator_(orchestrator), cursors_(cursors), config_(config),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

ApiResponse SyncApi::authorize(const std::string& authorization, const std::string& branch_id) const {
    const std::string token = bearer_token(authorization);
    if (token.empty()) return fail(401, "Missing bearer token");
    VerifyResult v = verify_sync_token(config_.sync_secret, token, clock_());
    if (!v.ok) {
        log_warn("rejected sync token " + sha256_hex(token).substr(0, 12) + ": " + v.error);
        return fail(401, "Invalid token: " + v.error);
    }
    if (!is_sync_role(v.role)) return fail(403, "Role '" + v.role + "' may not sync attendance");
    if (!token_covers_branch(v, branch_id)) return fail(403, "Token is not valid for branch " + branch_id);
    return { 0, json() };
}

ApiResponse SyncApi::sync_from_branch(const std::string& authorization, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    }
    catch (const json::parse_error& e) {
        return fail(400, std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) return fail(400, "expected a JSON object");
    if (!j.contains("logs") || !j["logs"].is_array()) return fail(400, "Invalid logs data - expected array");
    auto branch_id = scalar_string(j, "branchId");
    if (!branch_id || branch_id->empty()) return fail(400, "Branch ID is required");

    ApiResponse denied = authorize(authorization, *branch_id);
    if (denied.status != 0) return denied;

    const BranchConfig* bc = config_.find_branch(*branch_id);
    if (!bc || !orchestrator_.has_branch(*branch_id)) return fail(404, "Unknown branch " + *branch_id);

    const json& logs = j["logs"];
    log_info("receiving " + std::to_string(logs.size()) + " logs from " +
        (j.contains("branchName") && j["branchName"].is_string() ? j["branchName"].get<std::string>() : std::string("branch")) +
        " (" + *branch_id + ")");

    std::vector<LogParseError> parse_errors;
    std::vector<RawPunchEvent> events = parse_pushed_logs(logs, *branch_id, bc->utc_offset_minutes, parse_errors);

    SyncResult r;
    if (!events.empty()) r = orchestrator_.ingest_pushed(*branch_id, events);

    json errors = json::array();
    size_t error_count = parse_errors.size() + r.unresolved.size() + (events.size() - r.unresolved.size() - r.events_committed);
    for (const auto& pe : parse_errors) {
        if (errors.size() >= 10) break;
        const json& e = pe.entry;
        errors.push_back(error_entry(e.is_object() ? scalar_string(e, "enrollNumber").value_or("") : "",
            e.is_object() ? scalar_string(e, "admissionNumber") : std::nullopt,
            e.is_object() && e.contains("timestamp") ? e["timestamp"] : json(nullptr), pe.message));
    }
    for (const auto& u : r.unresolved) {
        if (errors.size() >= 10) break;
        errors.push_back(error_entry(u.enroll_number, u.admission_number,
            iso_from_time_t_with_offset(u.timestamp, bc->utc_offset_minutes),
            "User not found - enroll/admission number not mapped to any user"));
    }
    for (const auto& f : r.failed) {
        if (errors.size() >= 10) break;
        errors.push_back(json{ {"record", f.index}, {"message", f.message} });
    }

    if (!r.ok() && !r.cancelled) {
        json out{ {"success", false}, {"message", "Sync failed: " + r.error},
            {"data", { {"processedCount", r.events_committed}, {"errorCount", error_count},
                       {"totalLogs", logs.size()}, {"errors", errors} }} };
        return { r.halted ? 500 : 503, out };
    }

    json out{ {"success", true},
        {"message", "Processed " + std::to_string(r.events_committed) + " of " + std::to_string(logs.size()) + " logs"},
        {"data", { {"processedCount", r.events_committed}, {"errorCount", error_count},
                   {"totalLogs", logs.size()}, {"errors", errors} }} };
    return { 200, out };
}

ApiResponse SyncApi::last_sync(const std::string& authorization, const std::string& branch_id) {
    if (branch_id.empty()) return fail(400, "Branch ID is required");
    ApiResponse denied = authorize(authorization, branch_id);
    if (denied.status != 0) return denied;

    std::optional<SyncCursor> c;
    try {
        c = cursors_.get_cursor(branch_id);
    }
    catch (const CommitError& e) {
        return fail(503, e.what());
    }
    json data{ {"branchId", branch_id} };
    if (c) {
        data["lastSyncTime"] = iso_from_time_t_utc(c->last_sync_time);
        data["lastSyncBatchId"] = c->last_sync_batch_id;
        data["status"] = "active";
    }
    else {
        data["lastSyncTime"] = nullptr;
        data["lastSyncBatchId"] = nullptr;
        data["status"] = "no_sync_yet";
    }
    if (orchestrator_.halted(branch_id)) data["halted"] = true;
    return { 200, json{ {"success", true}, {"data", data} } };
}

ApiResponse SyncApi::sync_device(const std::string& authorization, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    }
    catch (const json::parse_error& e) {
        return fail(400, std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) return fail(400, "expected a JSON object");
    auto branch_id = scalar_string(j, "branchId");
    if (!branch_id || branch_id->empty()) return fail(400, "Branch ID is required");

    ApiResponse denied = authorize(authorization, *branch_id);
    if (denied.status != 0) return denied;

    const BranchConfig* bc = config_.find_branch(*branch_id);
    if (!bc || !orchestrator_.has_branch(*branch_id)) return fail(404, "Unknown branch " + *branch_id);

    SyncResult r;
    auto ip = scalar_string(j, "deviceIp");
    if (ip && !ip->empty()) {
        DeviceEndpoint ep = bc->endpoint();
        ep.ip = *ip;
        if (auto port = scalar_int(j, "devicePort")) {
            if (*port <= 0 || *port > 65535) return fail(400, "devicePort out of range");
            ep.port = static_cast<uint16_t>(*port);
        }
        DeviceLogExtractor extractor(ep, bc->utc_offset_minutes);
        r = orchestrator_.run_once_with(*branch_id, extractor);
    }
    else {
        r = orchestrator_.run_once(*branch_id);
    }

    json out{ {"success", r.ok()}, {"data", to_json(r)} };
    if (!r.ok()) out["message"] = r.error;
    return { r.ok() ? 200 : 502, out };
}

HttpServer::HttpServer(SyncApi& api, HttpConfig cfg)
    : api_(api), cfg_(std::move(cfg)), svr_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::run() {
    httplib::Server& svr = *svr_;
    auto add_cors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.set_header("Access-Control-Allow-Methods", "GET,POST,OPTIONS");
    };
    auto reply = [add_cors](httplib::Response& res, const ApiResponse& r) {
        add_cors(res);
        res.status = r.status;
        res.set_content(r.body.dump(), "application/json");
    };
    auto guarded = [reply](httplib::Response& res, const std::function<ApiResponse()>& handler) {
        try {
            reply(res, handler());
        }
        catch (const std::exception& e) {
            log_error(std::string("HTTP handler failed: ") + e.what());
            reply(res, ApiResponse{ 500, json{ {"success", false}, {"message", e.what()} } });
        }
    };

    svr.Options(R"(.*)", [add_cors](const httplib::Request&, httplib::Response& res) { add_cors(res); res.status = 204; });
    svr.set_logger([](const auto& req, const auto& res) {
        log_info(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    svr.Get("/health", [add_cors](const httplib::Request&, httplib::Response& res) {
        add_cors(res); res.set_content("{\"ok\":true}", "application/json");
    });

    svr.Post("/api/attendance/sync-from-branch", [this, guarded](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] { return api_.sync_from_branch(req.get_header_value("Authorization"), req.body); });
    });

    svr.Get(R"(/api/attendance/last-sync/([^/]+))", [this, guarded](const httplib::Request& req, httplib::Response& res) {
        const std::string branch = req.matches.size() > 1 ? std::string(req.matches[1]) : std::string();
        guarded(res, [&] { return api_.last_sync(req.get_header_value("Authorization"), branch); });
    });

    svr.Post("/api/attendance/sync-device", [this, guarded](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] { return api_.sync_device(req.get_header_value("Authorization"), req.body); });
    });

    if (!svr.bind_to_port(cfg_.host.c_str(), cfg_.port)) {
        log_error("HTTP bind failed on " + cfg_.host + ":" + std::to_string(cfg_.port));
        return false;
    }
    listening_.store(true);
    log_info("HTTP listening on " + cfg_.host + ":" + std::to_string(cfg_.port));
    svr.listen_after_bind();
    listening_.store(false);
    return true;
}

void HttpServer::stop() {
    if (svr_) svr_->stop();
}
