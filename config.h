#pragma once
#include "reconciliation.h"
#include "remote_log_extractor.h"
#include "retry.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

enum class SourceKind { Device, Sql };

struct BranchConfig {
    std::string id;
    std::string name;
    SourceKind source = SourceKind::Device;

    std::string device_ip;
    uint16_t device_port = DEFAULT_DEVICE_PORT;
    int connect_timeout_ms = 5000;
    int command_timeout_ms = 5000;

    std::string vendor_db;

    int sync_interval_seconds = 60;
    int batch_size = 100;
    int utc_offset_minutes = 0;
    bool synthesize_absences = false;

    DeviceEndpoint endpoint() const;
};

struct HttpConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    bool enabled = true;
};

struct AppConfig {
    std::string ledger_db = "attendance.db";
    HttpConfig http;
    std::string sync_secret;
    std::string log_file;
    int initial_lookback_hours = 24;
    RetryPolicy retry;
    WorkingHours student;
    WorkingHours teacher;
    WorkingHours staff;
    std::vector<BranchConfig> branches;

    const BranchConfig* find_branch(const std::string& id) const;
    ReconciliationConfig reconciliation_for(const BranchConfig& b) const;
};

// Both throw ConfigError naming the offending key.
AppConfig parse_config(const nlohmann::json& j);
AppConfig load_config(const std::string& path);

// ATTENDANCE_DB, HTTP_PORT, SYNC_SECRET, LOG_FILE.
void apply_env_overrides(AppConfig& cfg);
