#include "remote_log_extractor.h"
#include "device_session.h"
#include "ledger_db.h"
#include "logger.h"
#include "sync_errors.h"
#include "time_util.h"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <cstdio>

using nlohmann::json;

// ===================== SQL (vendor database) =====================

namespace {

// Read-only handle that closes itself.
struct VendorDb {
    sqlite3* db = nullptr;
    explicit VendorDb(const std::string& path) {
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            db = nullptr;
            throw ExtractionError("cannot open vendor database " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db, 5000);
    }
    ~VendorDb() { sqlite3_close(db); }
    VendorDb(const VendorDb&) = delete;
    VendorDb& operator=(const VendorDb&) = delete;
};

// Best-effort ENABLE_DEVICE after a failed read, over a fresh connection when
// the old one is gone. Never throws.
void restore_device(DeviceSession& session, const DeviceEndpoint& ep, const std::string& device_id) {
    if (session.state() == SessionState::Connected) {
        try {
            session.enable_device(ep.command_timeout);
            return;
        }
        catch (const ProtocolError& e) {
            log_warn(device_id + ": could not re-enable device: " + e.what());
            return;
        }
        catch (const ConnectionError& e) {
            log_warn(device_id + ": re-enable failed (" + e.what() + "), reconnecting");
        }
    }
    session.disconnect();
    try {
        DeviceSession fresh(device_id);
        fresh.connect(ep.ip, ep.port, ep.connect_timeout);
        fresh.enable_device(ep.command_timeout);
        fresh.disconnect();
        log_info(device_id + ": device re-enabled over a new connection");
    }
    catch (const ConnectionError& e) {
        log_error(device_id + ": device may still be disabled: " + e.what());
    }
    catch (const ProtocolError& e) {
        log_error(device_id + ": device may still be disabled: " + e.what());
    }
}

std::string local_wall_text(time_t t, int utc_offset_minutes) {
    LocalDateTime lt = local_from_utc(t, utc_offset_minutes);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
        lt.year, lt.month, lt.day, lt.hour, lt.minute, lt.second);
    return buf;
}

}  // namespace

SqlLogExtractor::SqlLogExtractor(std::string vendor_db_path, int utc_offset_minutes, std::string device_label)
    : db_path_(std::move(vendor_db_path)), utc_offset_minutes_(utc_offset_minutes), device_label_(std::move(device_label)) {}

std::vector<RawPunchEvent> SqlLogExtractor::extract_since(const std::string& branch_id, time_t last_sync_time) {
    VendorDb vdb(db_path_);

    // strict '>' so the boundary row is never re-emitted
    const char* SQL =
        "SELECT c.USERID, c.CHECKTIME, c.CHECKTYPE, c.VERIFYCODE, c.SENSORID, c.WorkCode,"
        "       u.SSN, u.Name, u.BADGENUMBER "
        "FROM CHECKINOUT c LEFT JOIN USERINFO u ON c.USERID = u.USERID "
        "WHERE c.CHECKTIME > ? "
        "ORDER BY c.CHECKTIME ASC;";
    StmtGuard s;
    if (sqlite3_prepare_v2(vdb.db, SQL, -1, &s.st, nullptr) != SQLITE_OK)
        throw ExtractionError(std::string("vendor query prepare failed: ") + sqlite3_errmsg(vdb.db));
    const std::string since = local_wall_text(last_sync_time, utc_offset_minutes_);
    sqlite3_bind_text(s.st, 1, since.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<RawPunchEvent> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        const std::string enroll = sqlite_column_string(s.st, 0);
        const std::string check_time = sqlite_column_string(s.st, 1);
        auto ts = parse_iso_timestamp(check_time, utc_offset_minutes_);
        if (enroll.empty() || !ts) {
            log_warn(describe() + ": skipping row with enroll '" + enroll + "' time '" + check_time + "'");
            continue;
        }
        // CHECKTIME text in 'T' or fractional form passes the text comparison at the boundary
        if (*ts <= last_sync_time) continue;

        RawPunchEvent e;
        e.enroll_number = enroll;
        e.branch_id = branch_id;
        e.timestamp = *ts;
        e.direction = direction_from_check_type(sqlite_column_string(s.st, 2));
        e.verify_mode = verify_mode_from_device(sqlite3_column_int(s.st, 3));
        const std::string sensor = sqlite_column_string(s.st, 4);
        e.source_device_id = sensor.empty() ? device_label_ : sensor;
        e.work_code = sqlite3_column_int(s.st, 5);
        const std::string ssn = sqlite_column_string(s.st, 6);
        if (!ssn.empty()) e.admission_number = ssn;

        json row = { {"USERID", enroll}, {"CHECKTIME", check_time}, {"CHECKTYPE", sqlite_column_string(s.st, 2)},
            {"VERIFYCODE", sqlite3_column_int(s.st, 3)}, {"SENSORID", sensor}, {"WorkCode", e.work_code},
            {"SSN", ssn}, {"Name", sqlite_column_string(s.st, 7)}, {"BADGENUMBER", sqlite_column_string(s.st, 8)} };
        // vendor names are often Latin-1 or GBK, not UTF-8
        const std::string dumped = row.dump(-1, ' ', false, json::error_handler_t::replace);
        e.raw_payload.assign(dumped.begin(), dumped.end());
        out.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE)
        throw ExtractionError(std::string("vendor query failed: ") + sqlite3_errmsg(vdb.db));

    std::stable_sort(out.begin(), out.end(),
        [](const RawPunchEvent& a, const RawPunchEvent& b) { return a.timestamp < b.timestamp; });
    return out;
}

void SqlLogExtractor::test_connection() {
    VendorDb vdb(db_path_);
    for (const char* table : { "CHECKINOUT", "USERINFO" }) {
        StmtGuard s;
        if (sqlite3_prepare_v2(vdb.db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;", -1, &s.st, nullptr) != SQLITE_OK)
            throw ExtractionError(std::string("schema probe failed: ") + sqlite3_errmsg(vdb.db));
        sqlite3_bind_text(s.st, 1, table, -1, SQLITE_STATIC);
        if (sqlite3_step(s.st) != SQLITE_ROW)
            throw ExtractionError(std::string(table) + " table not found in " + db_path_);
    }
}

// ===================== Device =====================

bool punch_from_device_record(const PunchRecord& rec, const std::string& branch_id,
    const std::string& device_id, int utc_offset_minutes, RawPunchEvent& out) {
    if (rec.month < 1 || rec.month > 12 || rec.day < 1 || rec.day > 31 ||
        rec.hour > 23 || rec.minute > 59 || rec.second > 59 || rec.year < 1970)
        return false;
    LocalDateTime lt;
    lt.year = rec.year; lt.month = rec.month; lt.day = rec.day;
    lt.hour = rec.hour; lt.minute = rec.minute; lt.second = rec.second;

    out = RawPunchEvent{};
    out.enroll_number = std::to_string(rec.enroll_number);
    out.branch_id = branch_id;
    out.timestamp = utc_from_local(lt, utc_offset_minutes);
    out.direction = direction_from_device(rec.in_out_mode);
    out.verify_mode = verify_mode_from_device(rec.verify_mode);
    out.work_code = rec.work_code;
    out.source_device_id = device_id;
    out.raw_payload = rec.raw;
    return true;
}

DeviceLogExtractor::DeviceLogExtractor(DeviceEndpoint endpoint, int utc_offset_minutes)
    : endpoint_(std::move(endpoint)), utc_offset_minutes_(utc_offset_minutes) {}

std::string DeviceLogExtractor::describe() const {
    return "device:" + endpoint_.ip + ":" + std::to_string(endpoint_.port);
}

std::vector<RawPunchEvent> DeviceLogExtractor::extract_since(const std::string& branch_id, time_t last_sync_time) {
    const std::string device_id = endpoint_.ip + ":" + std::to_string(endpoint_.port);
    std::vector<PunchRecord> records;
    try {
        DeviceSession session(device_id);
        session.connect(endpoint_.ip, endpoint_.port, endpoint_.connect_timeout);

        // Keep the terminal from taking new punches while the log is read.
        bool disabled = false;
        try {
            session.disable_device(endpoint_.command_timeout);
            disabled = true;
        }
        catch (const ProtocolError& e) {
            log_warn(device_id + ": could not disable device: " + e.what());
        }
        catch (const ConnectionError&) {
            // the command may have landed before the link dropped
            restore_device(session, endpoint_, device_id);
            throw;
        }

        try {
            records = session.read_attendance_log(endpoint_.command_timeout);
        }
        catch (const ConnectionError&) {
            if (disabled) restore_device(session, endpoint_, device_id);
            throw;
        }
        catch (const ProtocolError&) {
            if (disabled) restore_device(session, endpoint_, device_id);
            throw;
        }
        if (disabled) restore_device(session, endpoint_, device_id);
        session.disconnect();
    }
    catch (const ConnectionError& e) {
        throw ExtractionError(std::string("device ") + to_string(e.kind()) + ": " + e.what());
    }
    catch (const ProtocolError& e) {
        throw ExtractionError(std::string("device protocol ") + to_string(e.kind()) + ": " + e.what());
    }

    std::vector<RawPunchEvent> out;
    size_t skipped = 0;
    for (const auto& rec : records) {
        RawPunchEvent e;
        if (!punch_from_device_record(rec, branch_id, device_id, utc_offset_minutes_, e)) { ++skipped; continue; }
        if (e.timestamp > last_sync_time) out.push_back(std::move(e));
    }
    if (skipped) log_warn(device_id + ": skipped " + std::to_string(skipped) + " records with invalid dates");

    std::stable_sort(out.begin(), out.end(),
        [](const RawPunchEvent& a, const RawPunchEvent& b) { return a.timestamp < b.timestamp; });
    log_debug(device_id + ": " + std::to_string(records.size()) + " records on device, " +
        std::to_string(out.size()) + " newer than watermark");
    return out;
}

void DeviceLogExtractor::test_connection() {
    const std::string device_id = endpoint_.ip + ":" + std::to_string(endpoint_.port);
    try {
        DeviceSession session(device_id);
        session.connect(endpoint_.ip, endpoint_.port, endpoint_.connect_timeout);
        try {
            log_info(device_id + ": firmware " + session.read_firmware_version(endpoint_.command_timeout));
        }
        catch (const ProtocolError& e) {
            log_warn(device_id + ": firmware version unavailable: " + e.what());
        }
        session.disconnect();
    }
    catch (const ConnectionError& e) {
        throw ExtractionError(std::string("device ") + to_string(e.kind()) + ": " + e.what());
    }
}
