#pragma once
#include "protocol_codec.h"
#include "sync_interfaces.h"

#include <chrono>
#include <string>

// Reads the vendor's attendance database (CHECKINOUT / USERINFO tables). The
// vendor writes CHECKTIME as branch-local "YYYY-MM-DD HH:MM:SS" text.
class SqlLogExtractor : public LogExtractor {
public:
    SqlLogExtractor(std::string vendor_db_path, int utc_offset_minutes, std::string device_label = "vendor-db");

    std::vector<RawPunchEvent> extract_since(const std::string& branch_id, time_t last_sync_time) override;
    void test_connection() override;
    std::string describe() const override { return "sql:" + db_path_; }

private:
    std::string db_path_;
    int utc_offset_minutes_;
    std::string device_label_;
};

struct DeviceEndpoint {
    std::string ip;
    uint16_t port = DEFAULT_DEVICE_PORT;
    std::chrono::milliseconds connect_timeout{ 5000 };
    std::chrono::milliseconds command_timeout{ 5000 };
};

// Pulls the full attendance log over a fresh DeviceSession and keeps the
// records newer than the watermark. The session never outlives the call.
class DeviceLogExtractor : public LogExtractor {
public:
    DeviceLogExtractor(DeviceEndpoint endpoint, int utc_offset_minutes);

    std::vector<RawPunchEvent> extract_since(const std::string& branch_id, time_t last_sync_time) override;
    void test_connection() override;
    std::string describe() const override;

private:
    DeviceEndpoint endpoint_;
    int utc_offset_minutes_;
};

// Device log record -> canonical punch. Returns false for records whose
// date fields are not a valid calendar time.
bool punch_from_device_record(const PunchRecord& rec, const std::string& branch_id,
    const std::string& device_id, int utc_offset_minutes, RawPunchEvent& out);
