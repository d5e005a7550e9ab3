#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

// Wire format of the access-control terminal (port 4370):
//   command:u16  checksum:u16  session:u16  reply:u16  payload...
// all little-endian. There is no length field.

namespace cmd {
constexpr uint16_t CONNECT = 1000;
constexpr uint16_t EXIT = 1001;
constexpr uint16_t ENABLE_DEVICE = 1002;
constexpr uint16_t DISABLE_DEVICE = 1003;
constexpr uint16_t VERSION = 1100;
constexpr uint16_t AUTH = 1102;
constexpr uint16_t ATTLOG_RRQ = 1700;
constexpr uint16_t CLEAR_ATTLOG = 1702;
constexpr uint16_t GET_TIME = 1737;
constexpr uint16_t SET_TIME = 1738;

constexpr uint16_t ACK_OK = 2000;
constexpr uint16_t ACK_ERROR = 2001;
constexpr uint16_t ACK_DATA = 2002;
constexpr uint16_t ACK_RETRY = 2003;
constexpr uint16_t ACK_REPEAT = 2004;
constexpr uint16_t ACK_UNAUTH = 2005;
constexpr uint16_t ACK_UNKNOWN = 0xFFFF;
constexpr uint16_t ACK_ERROR_CMD = 0xFFFD;
constexpr uint16_t ACK_ERROR_INIT = 0xFFFC;
constexpr uint16_t ACK_ERROR_DATA = 0xFFFB;
}  // namespace cmd

static constexpr size_t FRAME_HEADER_SIZE = 8;
static constexpr size_t ATTLOG_RECORD_SIZE = 40;
static constexpr uint16_t DEFAULT_DEVICE_PORT = 4370;

const char* command_name(uint16_t code);

struct Frame {
    uint16_t command = 0;
    uint16_t checksum = 0;
    uint16_t session_id = 0;
    uint16_t reply_id = 0;
    std::vector<uint8_t> data;
};

// One fixed-width attendance log entry as the terminal stores it.
struct PunchRecord {
    uint16_t enroll_number = 0;
    uint8_t verify_mode = 0;
    uint8_t in_out_mode = 0;
    uint16_t year = 0;
    uint8_t month = 0, day = 0, hour = 0, minute = 0, second = 0;
    uint8_t work_code = 0;
    std::vector<uint8_t> raw;
};

// Sum of 16-bit LE words mod 65536 with bytes [2,4) treated as zero.
// An odd trailing byte is a word with a zero high byte.
uint16_t frame_checksum(const uint8_t* bytes, size_t len);

std::vector<uint8_t> encode_command(uint16_t command, uint16_t session_id, uint16_t reply_id,
    const std::vector<uint8_t>& payload);

// Throws ProtocolError(Truncated) below 8 bytes. Does not check the checksum.
Frame decode_response(const std::vector<uint8_t>& bytes);

bool verify_checksum(const std::vector<uint8_t>& bytes);
// Throws ProtocolError(ChecksumMismatch) / (Truncated).
void expect_checksum(const std::vector<uint8_t>& bytes);

// 40-byte strides; a trailing partial record is dropped.
std::vector<PunchRecord> decode_attendance_log(const std::vector<uint8_t>& data);

// GET_TIME / SET_TIME payload: u32-LE epoch seconds.
std::vector<uint8_t> encode_device_time(uint32_t epoch_seconds);
uint32_t decode_device_time(const std::vector<uint8_t>& data);

std::string hex_encode(const std::vector<uint8_t>& bytes);

// Reply id sequence owned by one session.
class ReplyCounter {
public:
    uint16_t current() const { return value_; }
    // Returns the id to use for this command and advances mod 0xFFFF.
    uint16_t next() {
        const uint16_t id = value_;
        value_ = static_cast<uint16_t>((value_ + 1u) % 0xFFFFu);
        return id;
    }
    void reset() { value_ = 0; }
private:
    uint16_t value_ = 0;
};
