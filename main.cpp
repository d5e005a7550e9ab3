// main.cpp
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "attendance_dao.h"
#include "auth_manager.h"
#include "config.h"
#include "cursor_dao.h"
#include "http_api.h"
#include "ledger_db.h"
#include "logger.h"
#include "remote_log_extractor.h"
#include "sync_errors.h"
#include "sync_orchestrator.h"
#include "user_dao.h"

using nlohmann::json;

static std::atomic<bool> g_stop{ false };

static void on_signal(int) { g_stop.store(true); }

static void print_usage(const char* argv0) {
    std::cerr <<
        "usage: " << argv0 << " [--config path] [--once <branchId>] [--test <branchId>]\n"
        "       " << argv0 << " [--config path] --issue-token <branchId|*> <role> <days>\n"
        "       " << argv0 << " [--config path] --import-users <users.json>\n";
}

static std::shared_ptr<LogExtractor> make_extractor(const BranchConfig& b) {
    if (b.source == SourceKind::Sql)
        return std::make_shared<SqlLogExtractor>(b.vendor_db, b.utc_offset_minutes, b.id + "-vendor-db");
    return std::make_shared<DeviceLogExtractor>(b.endpoint(), b.utc_offset_minutes);
}

// users.json: [{"id","branchId","name","type","classId","enrollNumber","admissionNumber","active"}]
static int import_users(LedgerDb& db, const std::string& path) {
    std::ifstream in(path);
    if (!in) { log_error("cannot open " + path); return 1; }
    json arr;
    try {
        arr = json::parse(in);
    }
    catch (const json::parse_error& e) {
        log_error("invalid JSON in " + path + ": " + e.what());
        return 1;
    }
    if (!arr.is_array()) { log_error(path + ": expected an array of users"); return 1; }

    int imported = 0, skipped = 0;
    for (const auto& j : arr) {
        User u;
        try {
            u.id = j.at("id").get<std::string>();
            u.branch_id = j.at("branchId").get<std::string>();
            u.name = j.value("name", std::string());
            auto type = user_type_from_string(j.value("type", std::string("student")));
            if (!type) throw std::invalid_argument("unknown type " + j.value("type", std::string()));
            u.type = *type;
            if (j.contains("classId") && j["classId"].is_string()) u.class_id = j["classId"].get<std::string>();
            u.enroll_number = j.value("enrollNumber", std::string());
            u.admission_number = j.value("admissionNumber", std::string());
            u.active = j.value("active", true);
        }
        catch (const std::exception& e) {
            log_warn("skipping user entry: " + std::string(e.what()));
            ++skipped;
            continue;
        }
        std::string err;
        if (!upsert_user(db, u, &err)) { log_warn("user " + u.id + " not stored: " + err); ++skipped; continue; }
        ++imported;
    }
    log_info("imported " + std::to_string(imported) + " users, skipped " + std::to_string(skipped));
    return skipped == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    std::string config_path = "attendance_sync.json";
    std::string once_branch, test_branch, users_file;
    std::vector<std::string> token_args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](int n) {
            if (i + n >= argc) { print_usage(argv[0]); std::exit(2); }
        };
        if (a == "--config") { need(1); config_path = argv[++i]; }
        else if (a == "--once") { need(1); once_branch = argv[++i]; }
        else if (a == "--test") { need(1); test_branch = argv[++i]; }
        else if (a == "--import-users") { need(1); users_file = argv[++i]; }
        else if (a == "--issue-token") {
            need(3);
            token_args = { argv[i + 1], argv[i + 2], argv[i + 3] };
            i += 3;
        }
        else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else { std::cerr << "unknown argument: " << a << "\n"; print_usage(argv[0]); return 2; }
    }

    AppConfig cfg;
    try {
        cfg = load_config(config_path);
        apply_env_overrides(cfg);
        if (!cfg.log_file.empty()) Logger::instance().initialize(cfg.log_file);
    }
    catch (const ConfigError& e) {
        std::cerr << "config: " << e.what() << "\n";
        return 2;
    }

    if (!token_args.empty()) {
        int days = 0;
        try { days = std::stoi(token_args[2]); }
        catch (const std::exception&) { std::cerr << "days must be a number\n"; return 2; }
        if (!is_sync_role(token_args[1])) std::cerr << "warning: role '" << token_args[1] << "' cannot sync\n";
        try {
            std::cout << issue_sync_token(cfg.sync_secret, token_args[0], token_args[1], days, std::time(nullptr)) << "\n";
        }
        catch (const std::invalid_argument& e) {
            std::cerr << "cannot issue token: " << e.what() << "\n";
            return 2;
        }
        return 0;
    }

    std::unique_ptr<LedgerDb> db;
    try {
        db = std::make_unique<LedgerDb>(cfg.ledger_db);
    }
    catch (const std::runtime_error& e) {
        log_error(e.what());
        return 1;
    }
    if (!users_file.empty()) return import_users(*db, users_file);

    SqliteUserDirectory directory(*db);
    SqliteSyncCursorStore cursors(*db);
    SyncOrchestrator orchestrator(directory, cursors, cfg.retry, cfg.initial_lookback_hours);

    for (const auto& b : cfg.branches) {
        BranchPipeline p;
        p.branch_id = b.id;
        p.extractor = make_extractor(b);
        p.engine = std::make_shared<const ReconciliationEngine>(cfg.reconciliation_for(b));
        p.sink = std::make_shared<SqliteAttendanceSink>(*db, *p.engine);
        p.batch_size = static_cast<size_t>(b.batch_size);
        p.synthesize_absences = b.synthesize_absences;
        p.interval = std::chrono::seconds(b.sync_interval_seconds);
        orchestrator.add_branch(std::move(p));
    }

    if (!test_branch.empty()) {
        const BranchConfig* b = cfg.find_branch(test_branch);
        if (!b) { log_error("unknown branch " + test_branch); return 2; }
        auto extractor = make_extractor(*b);
        try {
            extractor->test_connection();
        }
        catch (const ExtractionError& e) {
            log_error("[" + b->id + "] " + extractor->describe() + " unreachable: " + e.what());
            return 1;
        }
        log_info("[" + b->id + "] " + extractor->describe() + " OK");
        return 0;
    }

    if (!once_branch.empty()) {
        if (!orchestrator.has_branch(once_branch)) { log_error("unknown branch " + once_branch); return 2; }
        SyncResult r = orchestrator.run_once(once_branch);
        std::cout << to_json(r).dump(2) << "\n";
        return r.ok() ? 0 : 1;
    }

    if (cfg.branches.empty()) log_warn("no branches configured; only the push endpoint is useful");
    if (cfg.sync_secret.empty()) log_warn("sync_secret is empty; every HTTP sync request will be rejected");

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    SyncApi api(orchestrator, cursors, cfg);
    HttpServer server(api, cfg.http);
    std::atomic<bool> http_ok{ true };
    std::thread http_thread;
    if (cfg.http.enabled) {
        http_thread = std::thread([&] {
            if (!server.run()) { http_ok.store(false); g_stop.store(true); }
        });
    }

    orchestrator.start();
    log_info("attendance sync running with " + std::to_string(cfg.branches.size()) + " branches");

    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    log_info("shutting down");
    orchestrator.stop();
    server.stop();
    if (http_thread.joinable()) http_thread.join();
    return http_ok.load() ? 0 : 1;
}
