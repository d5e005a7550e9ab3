#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

enum class PunchDirection { In, Out, Unknown };
enum class VerifyMode { Fingerprint, Card, Password, Other };
enum class UserType { Student, Teacher, Staff };
enum class AttendanceStatus { Present, Late, Absent, HalfDay, EarlyDeparture };
enum class AttendanceType { Biometric, Manual, Api };

const char* to_string(PunchDirection d);
const char* to_string(VerifyMode v);
const char* to_string(UserType t);
const char* to_string(AttendanceStatus s);
const char* to_string(AttendanceType t);

std::optional<UserType> user_type_from_string(const std::string& s);
std::optional<AttendanceStatus> status_from_string(const std::string& s);

// Device in/out byte: 0 check-in, 1 check-out, anything else unknown.
// Vendor databases use 'I'/'O' as well.
PunchDirection direction_from_device(int in_out_mode);
PunchDirection direction_from_check_type(const std::string& check_type);
// 1 fingerprint, 2 card, 3 password (device numbering); 0 is also a fingerprint
// on older terminals.
VerifyMode verify_mode_from_device(int verify_mode);

// One observed scan. Immutable once extracted.
struct RawPunchEvent {
    std::string enroll_number;
    std::optional<std::string> admission_number;
    std::string branch_id;
    time_t timestamp = 0;
    PunchDirection direction = PunchDirection::Unknown;
    VerifyMode verify_mode = VerifyMode::Other;
    int work_code = 0;
    std::string source_device_id;
    std::vector<uint8_t> raw_payload;
};

// (branch, enroll, timestamp, device) identifies a punch across ingestions.
bool same_punch(const RawPunchEvent& a, const RawPunchEvent& b);
std::string punch_key(const RawPunchEvent& e);

struct ResolvedIdentity {
    std::string user_id;
    UserType user_type = UserType::Student;
    std::optional<std::string> class_id;
};

struct ResolvedPunch {
    RawPunchEvent event;
    std::optional<ResolvedIdentity> identity;
};

struct Provenance {
    AttendanceType attendance_type = AttendanceType::Biometric;
    std::string device_id;
    std::string sync_batch_id;
    time_t derived_as_of = 0;  // instant status was derived against; 0 if never
};

struct AttendanceRecord {
    std::string user_id;
    UserType user_type = UserType::Student;
    std::string branch_id;
    std::optional<std::string> class_id;
    std::string date;  // YYYY-MM-DD, branch-local

    std::optional<time_t> clock_in_time;
    std::optional<time_t> clock_out_time;

    AttendanceStatus status = AttendanceStatus::Present;
    bool is_late = false;
    int late_minutes = 0;
    bool is_early_departure = false;
    int early_departure_minutes = 0;
    double total_hours = 0.0;

    Provenance provenance;
    std::vector<RawPunchEvent> punches;  // everything folded in, audit trail
    time_t latest_event_time = 0;
};

bool operator==(const RawPunchEvent& a, const RawPunchEvent& b);
bool operator==(const AttendanceRecord& a, const AttendanceRecord& b);
inline bool operator!=(const AttendanceRecord& a, const AttendanceRecord& b) { return !(a == b); }

struct UnresolvedIdentity {
    std::string enroll_number;
    std::optional<std::string> admission_number;
    time_t timestamp = 0;
    std::string source_device_id;
};

struct RecordFailure {
    size_t index = 0;  // position in the ingested batch
    std::string message;
};

// Per-record outcome of AttendanceSink::ingest. Indices refer to the batch.
struct IngestResult {
    std::vector<size_t> committed;
    std::vector<RecordFailure> failed;
};
