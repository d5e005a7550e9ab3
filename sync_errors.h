#pragma once
#include <stdexcept>
#include <string>

// Error taxonomy for the ingestion pipeline. Kinds are kept as enums so the
// orchestrator can decide on retry without string matching.

enum class ProtocolErrorKind { Truncated, ChecksumMismatch, UnexpectedCommand };
enum class ConnectionErrorKind { Timeout, Refused, Reset, Handshake };

inline const char* to_string(ProtocolErrorKind k) {
    switch (k) {
    case ProtocolErrorKind::Truncated: return "truncated";
    case ProtocolErrorKind::ChecksumMismatch: return "checksum_mismatch";
    case ProtocolErrorKind::UnexpectedCommand: return "unexpected_command";
    }
    return "unknown";
}

inline const char* to_string(ConnectionErrorKind k) {
    switch (k) {
    case ConnectionErrorKind::Timeout: return "timeout";
    case ConnectionErrorKind::Refused: return "refused";
    case ConnectionErrorKind::Reset: return "reset";
    case ConnectionErrorKind::Handshake: return "handshake";
    }
    return "unknown";
}

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ProtocolErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ProtocolErrorKind kind() const noexcept { return kind_; }
private:
    ProtocolErrorKind kind_;
};

class ConnectionError : public std::runtime_error {
public:
    ConnectionError(ConnectionErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ConnectionErrorKind kind() const noexcept { return kind_; }
private:
    ConnectionErrorKind kind_;
};

// Source unreachable or query failed; the cycle is retried later.
class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wholesale sink failure. Per-record failures travel in IngestResult instead.
class CommitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Broken reconciliation invariant: a bug, not a transient condition.
class ReconciliationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised between pipeline stages when shutdown was requested. Not a
// runtime_error so retry loops never treat it as a transient failure.
class CancelledError : public std::exception {
public:
    const char* what() const noexcept override { return "sync cycle cancelled"; }
};
