#pragma once
#include "protocol_codec.h"
#include "sync_errors.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class SessionState { Disconnected, Connecting, Connected, Disconnecting, Errored };
const char* to_string(SessionState s);

// One TCP conversation with a terminal: connect -> commands -> disconnect.
//
// Replies are correlated by the connection, not by id, so commands on one
// session are serialized internally; callers still should not share a
// session across cycles.
//
// The protocol has no length field. A reply is read until at least the 8
// header bytes are in, then for as long as more bytes keep arriving within
// the settle window. A multi-packet reply that stalls longer than the window
// is cut at that read boundary.
class DeviceSession {
public:
    explicit DeviceSession(std::string device_id = "");
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Throws ConnectionError (Timeout, Refused, Reset, Handshake).
    void connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout);

    // Exactly one frame out, one reply in. Throws ConnectionError on I/O
    // failure or timeout (the session becomes Errored), ProtocolError on a
    // malformed reply.
    Frame send_command(uint16_t command, const std::vector<uint8_t>& payload,
        std::chrono::milliseconds timeout);

    // Best-effort EXIT, then close. Always ends Disconnected.
    void disconnect() noexcept;

    SessionState state() const;
    uint16_t session_id() const;
    uint16_t next_reply_id() const;
    const std::string& device_id() const { return device_id_; }

    void set_settle_window(std::chrono::milliseconds w) { settle_window_ = w; }

    std::vector<PunchRecord> read_attendance_log(std::chrono::milliseconds timeout);
    uint32_t get_time(std::chrono::milliseconds timeout);
    void set_time(uint32_t epoch_seconds, std::chrono::milliseconds timeout);
    void clear_attendance_log(std::chrono::milliseconds timeout);
    void enable_device(std::chrono::milliseconds timeout);
    void disable_device(std::chrono::milliseconds timeout);
    std::string read_firmware_version(std::chrono::milliseconds timeout);

private:
    Frame round_trip_locked(uint16_t command, const std::vector<uint8_t>& payload,
        std::chrono::milliseconds timeout);
    void write_all_locked(const std::vector<uint8_t>& bytes, std::chrono::steady_clock::time_point deadline);
    std::vector<uint8_t> read_frame_locked(std::chrono::steady_clock::time_point deadline);
    void expect_ok(const Frame& reply, uint16_t command) const;
    void close_socket_locked() noexcept;
    [[noreturn]] void fail_locked(ConnectionErrorKind kind, const std::string& what);

    std::string device_id_;
    mutable std::mutex mutex_;
    int fd_ = -1;
    SessionState state_ = SessionState::Disconnected;
    uint16_t session_id_ = 0;
    ReplyCounter reply_;
    std::chrono::milliseconds settle_window_{ 50 };
};
