#include "device_session.h"
#include "logger.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

using Clock = std::chrono::steady_clock;

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left <= 0 ? 0 : static_cast<int>(std::min<long long>(left, 1 << 30));
}

static ConnectionErrorKind kind_from_errno(int err) {
    switch (err) {
    case ECONNREFUSED: return ConnectionErrorKind::Refused;
    case ETIMEDOUT: return ConnectionErrorKind::Timeout;
    default: return ConnectionErrorKind::Reset;
    }
}

const char* to_string(SessionState s) {
    switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting: return "connecting";
    case SessionState::Connected: return "connected";
    case SessionState::Disconnecting: return "disconnecting";
    case SessionState::Errored: return "errored";
    }
    return "unknown";
}

DeviceSession::DeviceSession(std::string device_id) : device_id_(std::move(device_id)) {}

DeviceSession::~DeviceSession() { disconnect(); }

SessionState DeviceSession::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

uint16_t DeviceSession::session_id() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return session_id_;
}

uint16_t DeviceSession::next_reply_id() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return reply_.current();
}

void DeviceSession::close_socket_locked() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void DeviceSession::fail_locked(ConnectionErrorKind kind, const std::string& what) {
    close_socket_locked();
    state_ = SessionState::Errored;
    throw ConnectionError(kind, device_id_ + ": " + what);
}

void DeviceSession::connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != SessionState::Disconnected && state_ != SessionState::Errored)
        throw std::logic_error("connect() on a session in state " + std::string(to_string(state_)));

    close_socket_locked();
    state_ = SessionState::Connecting;
    session_id_ = 0;
    reply_.reset();
    if (device_id_.empty()) device_id_ = ip + ":" + std::to_string(port);
    const auto deadline = Clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(port);
    if (int rc = ::getaddrinfo(ip.c_str(), port_str.c_str(), &hints, &res); rc != 0 || !res) {
        fail_locked(ConnectionErrorKind::Refused, "cannot resolve " + ip + ": " + gai_strerror(rc));
    }

    fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd_ < 0) {
        ::freeaddrinfo(res);
        fail_locked(ConnectionErrorKind::Refused, std::string("socket(): ") + std::strerror(errno));
    }
    int flags = ::fcntl(fd_, F_GETFL, 0);
    ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    int one = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    int rc = ::connect(fd_, res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);
    if (rc != 0) {
        if (errno != EINPROGRESS) fail_locked(kind_from_errno(errno), std::string("connect: ") + std::strerror(errno));
        pollfd pfd{ fd_, POLLOUT, 0 };
        int pr = ::poll(&pfd, 1, remaining_ms(deadline));
        if (pr == 0) fail_locked(ConnectionErrorKind::Timeout, "connect timed out");
        if (pr < 0) fail_locked(ConnectionErrorKind::Reset, std::string("poll: ") + std::strerror(errno));
        int soerr = 0; socklen_t len = sizeof(soerr);
        ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soerr, &len);
        if (soerr != 0) fail_locked(kind_from_errno(soerr), std::string("connect: ") + std::strerror(soerr));
    }

    Frame reply = round_trip_locked(cmd::CONNECT, {}, std::chrono::milliseconds(remaining_ms(deadline)));
    if (reply.command == cmd::ACK_UNAUTH)
        fail_locked(ConnectionErrorKind::Handshake, "device requires a comm key (ACK_UNAUTH)");
    if (reply.command != cmd::ACK_OK)
        fail_locked(ConnectionErrorKind::Handshake,
            std::string("handshake rejected with ") + command_name(reply.command) + " (" +
            std::to_string(reply.command) + ")");

    session_id_ = reply.session_id;
    state_ = SessionState::Connected;
    log_debug(device_id_ + ": connected, session " + std::to_string(session_id_));
}

Frame DeviceSession::send_command(uint16_t command, const std::vector<uint8_t>& payload,
    std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != SessionState::Connected)
        throw ConnectionError(ConnectionErrorKind::Reset,
            device_id_ + ": " + command_name(command) + " on a " + to_string(state_) + " session");
    return round_trip_locked(command, payload, timeout);
}

Frame DeviceSession::round_trip_locked(uint16_t command, const std::vector<uint8_t>& payload,
    std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    const uint16_t reply_id = reply_.next();
    write_all_locked(encode_command(command, session_id_, reply_id, payload), deadline);
    std::vector<uint8_t> bytes = read_frame_locked(deadline);
    Frame reply = decode_response(bytes);
    if (!verify_checksum(bytes))
        log_debug(device_id_ + ": " + command_name(reply.command) + " reply has a bad checksum");
    if (reply.reply_id != reply_id)
        log_debug(device_id_ + ": reply id " + std::to_string(reply.reply_id) + " for request " +
            std::to_string(reply_id));
    return reply;
}

void DeviceSession::write_all_locked(const std::vector<uint8_t>& bytes, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n > 0) { sent += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{ fd_, POLLOUT, 0 };
            int pr = ::poll(&pfd, 1, remaining_ms(deadline));
            if (pr == 0) fail_locked(ConnectionErrorKind::Timeout, "send timed out");
            if (pr < 0 && errno != EINTR) fail_locked(ConnectionErrorKind::Reset, std::string("poll: ") + std::strerror(errno));
            continue;
        }
        fail_locked(kind_from_errno(errno), std::string("send: ") + std::strerror(errno));
    }
}

std::vector<uint8_t> DeviceSession::read_frame_locked(Clock::time_point deadline) {
    std::vector<uint8_t> buf;
    uint8_t chunk[4096];

    auto read_some = [&](int wait_ms) -> bool {
        pollfd pfd{ fd_, POLLIN, 0 };
        int pr = ::poll(&pfd, 1, wait_ms);
        if (pr == 0) return false;
        if (pr < 0) {
            if (errno == EINTR) return true;
            fail_locked(ConnectionErrorKind::Reset, std::string("poll: ") + std::strerror(errno));
        }
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) fail_locked(ConnectionErrorKind::Reset, "connection closed by device");
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return true;
            fail_locked(kind_from_errno(errno), std::string("recv: ") + std::strerror(errno));
        }
        buf.insert(buf.end(), chunk, chunk + n);
        return true;
    };

    while (buf.size() < FRAME_HEADER_SIZE) {
        const int left = remaining_ms(deadline);
        if (left == 0 || !read_some(left))
            fail_locked(ConnectionErrorKind::Timeout,
                "no complete reply before timeout (" + std::to_string(buf.size()) + " bytes)");
    }

    // No length field: drain whatever follows within the settle window.
    for (;;) {
        const int left = remaining_ms(deadline);
        const int wait = std::min<int>(left, static_cast<int>(settle_window_.count()));
        if (wait <= 0) break;
        pollfd pfd{ fd_, POLLIN, 0 };
        if (::poll(&pfd, 1, wait) <= 0) break;
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n <= 0) break;  // EOF after a complete header: keep what we have
        buf.insert(buf.end(), chunk, chunk + n);
    }
    return buf;
}

void DeviceSession::disconnect() noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == SessionState::Connected) {
        state_ = SessionState::Disconnecting;
        try {
            round_trip_locked(cmd::EXIT, {}, std::chrono::milliseconds(1000));
        }
        catch (const std::exception& e) {
            log_debug(device_id_ + ": EXIT not acknowledged: " + e.what());
        }
    }
    close_socket_locked();
    state_ = SessionState::Disconnected;
    session_id_ = 0;
}

void DeviceSession::expect_ok(const Frame& reply, uint16_t command) const {
    if (reply.command == cmd::ACK_OK) return;
    throw ProtocolError(ProtocolErrorKind::UnexpectedCommand,
        device_id_ + ": " + command_name(command) + " answered with " + command_name(reply.command) +
        " (" + std::to_string(reply.command) + ")");
}

std::vector<PunchRecord> DeviceSession::read_attendance_log(std::chrono::milliseconds timeout) {
    Frame reply = send_command(cmd::ATTLOG_RRQ, {}, timeout);
    if (reply.command != cmd::ACK_DATA && reply.command != cmd::ACK_OK)
        throw ProtocolError(ProtocolErrorKind::UnexpectedCommand,
            device_id_ + ": ATTLOG_RRQ answered with " + command_name(reply.command));
    return decode_attendance_log(reply.data);
}

uint32_t DeviceSession::get_time(std::chrono::milliseconds timeout) {
    Frame reply = send_command(cmd::GET_TIME, {}, timeout);
    expect_ok(reply, cmd::GET_TIME);
    return decode_device_time(reply.data);
}

void DeviceSession::set_time(uint32_t epoch_seconds, std::chrono::milliseconds timeout) {
    expect_ok(send_command(cmd::SET_TIME, encode_device_time(epoch_seconds), timeout), cmd::SET_TIME);
}

void DeviceSession::clear_attendance_log(std::chrono::milliseconds timeout) {
    expect_ok(send_command(cmd::CLEAR_ATTLOG, {}, timeout), cmd::CLEAR_ATTLOG);
}

void DeviceSession::enable_device(std::chrono::milliseconds timeout) {
    expect_ok(send_command(cmd::ENABLE_DEVICE, {}, timeout), cmd::ENABLE_DEVICE);
}

void DeviceSession::disable_device(std::chrono::milliseconds timeout) {
    expect_ok(send_command(cmd::DISABLE_DEVICE, {}, timeout), cmd::DISABLE_DEVICE);
}

std::string DeviceSession::read_firmware_version(std::chrono::milliseconds timeout) {
    Frame reply = send_command(cmd::VERSION, {}, timeout);
    expect_ok(reply, cmd::VERSION);
    std::string v(reply.data.begin(), reply.data.end());
    v.erase(std::find(v.begin(), v.end(), '\0'), v.end());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\n' || v.back() == '\r')) v.pop_back();
    return v;
}
