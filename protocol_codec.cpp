#include "protocol_codec.h"
#include "sync_errors.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

static inline uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}
static inline void write_u16_le(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

const char* command_name(uint16_t code) {
    switch (code) {
    case cmd::CONNECT: return "CONNECT";
    case cmd::EXIT: return "EXIT";
    case cmd::ENABLE_DEVICE: return "ENABLE_DEVICE";
    case cmd::DISABLE_DEVICE: return "DISABLE_DEVICE";
    case cmd::VERSION: return "VERSION";
    case cmd::AUTH: return "AUTH";
    case cmd::ATTLOG_RRQ: return "ATTLOG_RRQ";
    case cmd::CLEAR_ATTLOG: return "CLEAR_ATTLOG";
    case cmd::GET_TIME: return "GET_TIME";
    case cmd::SET_TIME: return "SET_TIME";
    case cmd::ACK_OK: return "ACK_OK";
    case cmd::ACK_ERROR: return "ACK_ERROR";
    case cmd::ACK_DATA: return "ACK_DATA";
    case cmd::ACK_RETRY: return "ACK_RETRY";
    case cmd::ACK_REPEAT: return "ACK_REPEAT";
    case cmd::ACK_UNAUTH: return "ACK_UNAUTH";
    case cmd::ACK_UNKNOWN: return "ACK_UNKNOWN";
    case cmd::ACK_ERROR_CMD: return "ACK_ERROR_CMD";
    case cmd::ACK_ERROR_INIT: return "ACK_ERROR_INIT";
    case cmd::ACK_ERROR_DATA: return "ACK_ERROR_DATA";
    default: return "?";
    }
}

uint16_t frame_checksum(const uint8_t* bytes, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; i += 2) {
        if (i == 2) continue;  // checksum field counts as zero
        uint16_t word = (i + 1 < len) ? read_u16_le(bytes + i) : bytes[i];
        sum = (sum + word) & 0xFFFF;
    }
    return static_cast<uint16_t>(sum);
}

std::vector<uint8_t> encode_command(uint16_t command, uint16_t session_id, uint16_t reply_id,
    const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out(FRAME_HEADER_SIZE + payload.size());
    write_u16_le(&out[0], command);
    write_u16_le(&out[2], 0);
    write_u16_le(&out[4], session_id);
    write_u16_le(&out[6], reply_id);
    std::copy(payload.begin(), payload.end(), out.begin() + FRAME_HEADER_SIZE);
    write_u16_le(&out[2], frame_checksum(out.data(), out.size()));
    return out;
}

Frame decode_response(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < FRAME_HEADER_SIZE)
        throw ProtocolError(ProtocolErrorKind::Truncated,
            "frame truncated: " + std::to_string(bytes.size()) + " bytes");
    Frame f;
    f.command = read_u16_le(&bytes[0]);
    f.checksum = read_u16_le(&bytes[2]);
    f.session_id = read_u16_le(&bytes[4]);
    f.reply_id = read_u16_le(&bytes[6]);
    f.data.assign(bytes.begin() + FRAME_HEADER_SIZE, bytes.end());
    return f;
}

bool verify_checksum(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < FRAME_HEADER_SIZE) return false;
    return read_u16_le(&bytes[2]) == frame_checksum(bytes.data(), bytes.size());
}

void expect_checksum(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < FRAME_HEADER_SIZE)
        throw ProtocolError(ProtocolErrorKind::Truncated, "frame truncated");
    const uint16_t embedded = read_u16_le(&bytes[2]);
    const uint16_t computed = frame_checksum(bytes.data(), bytes.size());
    if (embedded != computed) {
        std::ostringstream oss;
        oss << "checksum mismatch: frame=0x" << std::hex << embedded << " computed=0x" << computed;
        throw ProtocolError(ProtocolErrorKind::ChecksumMismatch, oss.str());
    }
}

std::vector<PunchRecord> decode_attendance_log(const std::vector<uint8_t>& data) {
    std::vector<PunchRecord> out;
    out.reserve(data.size() / ATTLOG_RECORD_SIZE);
    for (size_t off = 0; off + ATTLOG_RECORD_SIZE <= data.size(); off += ATTLOG_RECORD_SIZE) {
        const uint8_t* r = &data[off];
        PunchRecord p;
        p.enroll_number = read_u16_le(r);
        p.verify_mode = r[2];
        p.in_out_mode = r[3];
        p.year = read_u16_le(r + 4);
        p.month = r[6]; p.day = r[7];
        p.hour = r[8]; p.minute = r[9]; p.second = r[10];
        p.work_code = r[11];
        p.raw.assign(r, r + ATTLOG_RECORD_SIZE);
        out.push_back(std::move(p));
    }
    return out;
}

std::vector<uint8_t> encode_device_time(uint32_t epoch_seconds) {
    return {
        static_cast<uint8_t>(epoch_seconds & 0xFF),
        static_cast<uint8_t>((epoch_seconds >> 8) & 0xFF),
        static_cast<uint8_t>((epoch_seconds >> 16) & 0xFF),
        static_cast<uint8_t>((epoch_seconds >> 24) & 0xFF),
    };
}

uint32_t decode_device_time(const std::vector<uint8_t>& data) {
    if (data.size() < 4)
        throw ProtocolError(ProtocolErrorKind::Truncated, "time payload shorter than 4 bytes");
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
        (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

std::string hex_encode(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss; oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
}
