#include "config.h"
#include "sync_errors.h"
#include "time_util.h"

#include <cstdlib>
#include <fstream>
#include <set>

using nlohmann::json;

namespace {

template <typename T>
T get_or(const json& j, const char* key, const T& fallback, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    try {
        return j[key].get<T>();
    }
    catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

WorkingHours parse_hours(const json& j, const WorkingHours& fallback, const std::string& where) {
    if (!j.is_object()) throw ConfigError(where + ": expected an object");
    WorkingHours h = fallback;
    if (j.contains("start")) {
        auto m = parse_hh_mm(get_or<std::string>(j, "start", "", where));
        if (!m) throw ConfigError(where + ".start: expected HH:MM");
        h.start_minute = *m;
    }
    if (j.contains("end")) {
        auto m = parse_hh_mm(get_or<std::string>(j, "end", "", where));
        if (!m) throw ConfigError(where + ".end: expected HH:MM");
        h.end_minute = *m;
    }
    h.grace_minutes = get_or<int>(j, "grace_minutes", h.grace_minutes, where);
    if (h.end_minute <= h.start_minute) throw ConfigError(where + ": end must be after start");
    if (h.grace_minutes < 0) throw ConfigError(where + ".grace_minutes: must not be negative");
    return h;
}

BranchConfig parse_branch(const json& j, size_t idx) {
    const std::string where = "branches[" + std::to_string(idx) + "]";
    if (!j.is_object()) throw ConfigError(where + ": expected an object");

    BranchConfig b;
    b.id = get_or<std::string>(j, "id", "", where);
    if (b.id.empty()) throw ConfigError(where + ".id: required");
    b.name = get_or<std::string>(j, "name", b.id, where);

    const std::string source = get_or<std::string>(j, "source", "device", where);
    if (source == "device") b.source = SourceKind::Device;
    else if (source == "sql") b.source = SourceKind::Sql;
    else throw ConfigError(where + ".source: expected device|sql, got " + source);

    b.device_ip = get_or<std::string>(j, "device_ip", "", where);
    const int port = get_or<int>(j, "device_port", DEFAULT_DEVICE_PORT, where);
    if (port <= 0 || port > 65535) throw ConfigError(where + ".device_port: out of range");
    b.device_port = static_cast<uint16_t>(port);
    b.connect_timeout_ms = get_or<int>(j, "connect_timeout_ms", b.connect_timeout_ms, where);
    b.command_timeout_ms = get_or<int>(j, "command_timeout_ms", b.command_timeout_ms, where);
    b.vendor_db = get_or<std::string>(j, "vendor_db", "", where);
    b.sync_interval_seconds = get_or<int>(j, "sync_interval_seconds", b.sync_interval_seconds, where);
    b.batch_size = get_or<int>(j, "batch_size", b.batch_size, where);
    b.utc_offset_minutes = get_or<int>(j, "utc_offset_minutes", b.utc_offset_minutes, where);
    b.synthesize_absences = get_or<bool>(j, "synthesize_absences", b.synthesize_absences, where);

    if (b.source == SourceKind::Device && b.device_ip.empty())
        throw ConfigError(where + ".device_ip: required for device source");
    if (b.source == SourceKind::Sql && b.vendor_db.empty())
        throw ConfigError(where + ".vendor_db: required for sql source");
    if (b.connect_timeout_ms <= 0 || b.command_timeout_ms <= 0)
        throw ConfigError(where + ": timeouts must be positive");
    if (b.sync_interval_seconds <= 0) throw ConfigError(where + ".sync_interval_seconds: must be positive");
    if (b.batch_size <= 0) throw ConfigError(where + ".batch_size: must be positive");
    if (b.utc_offset_minutes < -14 * 60 || b.utc_offset_minutes > 14 * 60)
        throw ConfigError(where + ".utc_offset_minutes: out of range");
    return b;
}

}  // namespace

DeviceEndpoint BranchConfig::endpoint() const {
    DeviceEndpoint ep;
    ep.ip = device_ip;
    ep.port = device_port;
    ep.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    ep.command_timeout = std::chrono::milliseconds(command_timeout_ms);
    return ep;
}

const BranchConfig* AppConfig::find_branch(const std::string& id) const {
    for (const auto& b : branches)
        if (b.id == id) return &b;
    return nullptr;
}

ReconciliationConfig AppConfig::reconciliation_for(const BranchConfig& b) const {
    ReconciliationConfig rc;
    rc.utc_offset_minutes = b.utc_offset_minutes;
    rc.student = student;
    rc.teacher = teacher;
    rc.staff = staff;
    return rc;
}

AppConfig parse_config(const json& j) {
    if (!j.is_object()) throw ConfigError("config: expected a JSON object");
    AppConfig c;
    const std::string root = "config";

    c.ledger_db = get_or<std::string>(j, "ledger_db", c.ledger_db, root);
    c.sync_secret = get_or<std::string>(j, "sync_secret", "", root);
    c.log_file = get_or<std::string>(j, "log_file", "", root);
    c.initial_lookback_hours = get_or<int>(j, "initial_lookback_hours", c.initial_lookback_hours, root);
    if (c.initial_lookback_hours < 0) throw ConfigError("config.initial_lookback_hours: must not be negative");

    if (j.contains("http")) {
        const json& h = j["http"];
        if (!h.is_object()) throw ConfigError("config.http: expected an object");
        c.http.host = get_or<std::string>(h, "host", c.http.host, "http");
        c.http.port = get_or<int>(h, "port", c.http.port, "http");
        c.http.enabled = get_or<bool>(h, "enabled", c.http.enabled, "http");
        if (c.http.port <= 0 || c.http.port > 65535) throw ConfigError("http.port: out of range");
    }

    if (j.contains("retry")) {
        const json& r = j["retry"];
        if (!r.is_object()) throw ConfigError("config.retry: expected an object");
        c.retry.max_attempts = get_or<int>(r, "max_attempts", c.retry.max_attempts, "retry");
        c.retry.initial_backoff = std::chrono::milliseconds(
            get_or<long long>(r, "initial_backoff_ms", c.retry.initial_backoff.count(), "retry"));
        c.retry.max_backoff = std::chrono::milliseconds(
            get_or<long long>(r, "max_backoff_ms", c.retry.max_backoff.count(), "retry"));
        if (c.retry.max_attempts < 1) throw ConfigError("retry.max_attempts: must be at least 1");
        if (c.retry.initial_backoff.count() < 0 || c.retry.max_backoff < c.retry.initial_backoff)
            throw ConfigError("retry: backoff bounds are inconsistent");
    }

    if (j.contains("working_hours")) {
        const json& w = j["working_hours"];
        if (!w.is_object()) throw ConfigError("config.working_hours: expected an object");
        if (w.contains("student")) c.student = parse_hours(w["student"], c.student, "working_hours.student");
        if (w.contains("teacher")) c.teacher = parse_hours(w["teacher"], c.teacher, "working_hours.teacher");
        if (w.contains("staff")) c.staff = parse_hours(w["staff"], c.staff, "working_hours.staff");
    }

    if (!j.contains("branches") || !j["branches"].is_array())
        throw ConfigError("config.branches: required array");
    std::set<std::string> seen;
    for (size_t i = 0; i < j["branches"].size(); ++i) {
        BranchConfig b = parse_branch(j["branches"][i], i);
        if (!seen.insert(b.id).second) throw ConfigError("branches: duplicate id " + b.id);
        c.branches.push_back(std::move(b));
    }
    return c;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);
    json j;
    try {
        j = json::parse(in);
    }
    catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    return parse_config(j);
}

void apply_env_overrides(AppConfig& cfg) {
    if (const char* v = std::getenv("ATTENDANCE_DB"); v && *v) cfg.ledger_db = v;
    if (const char* v = std::getenv("SYNC_SECRET"); v && *v) cfg.sync_secret = v;
    if (const char* v = std::getenv("LOG_FILE"); v && *v) cfg.log_file = v;
    if (const char* v = std::getenv("HTTP_PORT"); v && *v) {
        int port = 0;
        try { port = std::stoi(v); }
        catch (const std::exception&) { throw ConfigError(std::string("HTTP_PORT: not a number: ") + v); }
        if (port <= 0 || port > 65535) throw ConfigError("HTTP_PORT: out of range");
        cfg.http.port = port;
    }
}
