#include "punch_types.h"

#include <cctype>

const char* to_string(PunchDirection d) {
    switch (d) {
    case PunchDirection::In: return "IN";
    case PunchDirection::Out: return "OUT";
    case PunchDirection::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(VerifyMode v) {
    switch (v) {
    case VerifyMode::Fingerprint: return "FINGERPRINT";
    case VerifyMode::Card: return "CARD";
    case VerifyMode::Password: return "PASSWORD";
    case VerifyMode::Other: return "OTHER";
    }
    return "OTHER";
}

const char* to_string(UserType t) {
    switch (t) {
    case UserType::Student: return "student";
    case UserType::Teacher: return "teacher";
    case UserType::Staff: return "staff";
    }
    return "staff";
}

const char* to_string(AttendanceStatus s) {
    switch (s) {
    case AttendanceStatus::Present: return "present";
    case AttendanceStatus::Late: return "late";
    case AttendanceStatus::Absent: return "absent";
    case AttendanceStatus::HalfDay: return "half_day";
    case AttendanceStatus::EarlyDeparture: return "early_departure";
    }
    return "present";
}

const char* to_string(AttendanceType t) {
    switch (t) {
    case AttendanceType::Biometric: return "biometric";
    case AttendanceType::Manual: return "manual";
    case AttendanceType::Api: return "api";
    }
    return "biometric";
}

std::optional<UserType> user_type_from_string(const std::string& s) {
    if (s == "student") return UserType::Student;
    if (s == "teacher") return UserType::Teacher;
    if (s == "staff") return UserType::Staff;
    return std::nullopt;
}

std::optional<AttendanceStatus> status_from_string(const std::string& s) {
    if (s == "present") return AttendanceStatus::Present;
    if (s == "late") return AttendanceStatus::Late;
    if (s == "absent") return AttendanceStatus::Absent;
    if (s == "half_day") return AttendanceStatus::HalfDay;
    if (s == "early_departure") return AttendanceStatus::EarlyDeparture;
    return std::nullopt;
}

PunchDirection direction_from_device(int in_out_mode) {
    if (in_out_mode == 0) return PunchDirection::In;
    if (in_out_mode == 1) return PunchDirection::Out;
    return PunchDirection::Unknown;
}

PunchDirection direction_from_check_type(const std::string& check_type) {
    if (check_type.empty()) return PunchDirection::Unknown;
    const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(check_type[0])));
    if (c == 'I' || c == '0') return PunchDirection::In;
    if (c == 'O' || c == '1') return PunchDirection::Out;
    return PunchDirection::Unknown;
}

VerifyMode verify_mode_from_device(int verify_mode) {
    switch (verify_mode) {
    case 0:
    case 1: return VerifyMode::Fingerprint;
    case 2: return VerifyMode::Card;
    case 3: return VerifyMode::Password;
    default: return VerifyMode::Other;
    }
}

bool same_punch(const RawPunchEvent& a, const RawPunchEvent& b) {
    return a.branch_id == b.branch_id && a.enroll_number == b.enroll_number &&
        a.timestamp == b.timestamp && a.source_device_id == b.source_device_id;
}

std::string punch_key(const RawPunchEvent& e) {
    return e.branch_id + "|" + e.enroll_number + "|" + std::to_string(static_cast<long long>(e.timestamp)) +
        "|" + e.source_device_id;
}

bool operator==(const RawPunchEvent& a, const RawPunchEvent& b) {
    return same_punch(a, b) && a.admission_number == b.admission_number && a.direction == b.direction &&
        a.verify_mode == b.verify_mode && a.work_code == b.work_code && a.raw_payload == b.raw_payload;
}

bool operator==(const AttendanceRecord& a, const AttendanceRecord& b) {
    return a.user_id == b.user_id && a.user_type == b.user_type && a.branch_id == b.branch_id &&
        a.class_id == b.class_id && a.date == b.date &&
        a.clock_in_time == b.clock_in_time && a.clock_out_time == b.clock_out_time &&
        a.status == b.status && a.is_late == b.is_late && a.late_minutes == b.late_minutes &&
        a.is_early_departure == b.is_early_departure &&
        a.early_departure_minutes == b.early_departure_minutes &&
        a.total_hours == b.total_hours &&
        a.provenance.attendance_type == b.provenance.attendance_type &&
        a.provenance.device_id == b.provenance.device_id &&
        a.provenance.sync_batch_id == b.provenance.sync_batch_id &&
        a.provenance.derived_as_of == b.provenance.derived_as_of &&
        a.punches == b.punches && a.latest_event_time == b.latest_event_time;
}
