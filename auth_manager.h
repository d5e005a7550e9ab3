#pragma once
#include <ctime>
#include <string>

// Bearer tokens for branch agents pushing logs over HTTP.
// Format: "<branch>|<role>|<expires_at>|<nonce>|<hmac-sha256 hex>", the MAC
// covering everything before the last '|'. Branch "*" grants every branch.

std::string hmac_sha256_hex(const std::string& key, const std::string& data);
std::string sha256_hex(const std::string& s);
std::string rand_hex(size_t nbytes = 8);

// Roles allowed to push attendance: admin, secretary, sync.
bool is_sync_role(const std::string& role);

// Throws std::invalid_argument for an empty secret, a branch or role
// containing '|', or ttl_days <= 0.
std::string issue_sync_token(const std::string& secret, const std::string& branch_scope,
    const std::string& role, int ttl_days, time_t now);

struct VerifyResult {
    bool ok = false;
    std::string error;
    std::string branch_scope;
    std::string role;
    time_t expires_at = 0;
};

VerifyResult verify_sync_token(const std::string& secret, const std::string& token, time_t now);

// Does a verified token allow pushing for this branch?
bool token_covers_branch(const VerifyResult& v, const std::string& branch_id);
