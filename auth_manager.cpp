#include "auth_manager.h"
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned int len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), (int)key.size(),
        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
        mac, &len);
    std::ostringstream oss; oss << std::hex << std::setfill('0');
    for (unsigned i = 0; i < len; i++) oss << std::setw(2) << (int)mac[i];
    return oss.str();
}

std::string sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    std::ostringstream o; o << std::hex << std::setfill('0');
    for (unsigned char b : h) o << std::setw(2) << (int)b;
    return o.str();
}

std::string rand_hex(size_t nbytes) {
    std::random_device rd; std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    std::ostringstream oss; oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < nbytes; i++) oss << std::setw(2) << dist(gen);
    return oss.str();
}

bool is_sync_role(const std::string& role) {
    return role == "admin" || role == "secretary" || role == "sync";
}

std::string issue_sync_token(const std::string& secret, const std::string& branch_scope,
    const std::string& role, int ttl_days, time_t now) {
    if (secret.empty()) throw std::invalid_argument("sync secret is empty");
    if (branch_scope.empty() || branch_scope.find('|') != std::string::npos)
        throw std::invalid_argument("invalid branch scope: " + branch_scope);
    if (role.empty() || role.find('|') != std::string::npos)
        throw std::invalid_argument("invalid role: " + role);
    if (ttl_days <= 0) throw std::invalid_argument("token lifetime must be positive");

    const long long expires = static_cast<long long>(now) + static_cast<long long>(ttl_days) * 86400;
    std::string data = branch_scope + "|" + role + "|" + std::to_string(expires) + "|" + rand_hex(8);
    return data + "|" + hmac_sha256_hex(secret, data);
}

VerifyResult verify_sync_token(const std::string& secret, const std::string& token, time_t now) {
    if (secret.empty()) return { false, "sync secret not configured" };
    std::vector<std::string> parts;
    std::string cur;
    for (char c : token) {
        if (c == '|') { parts.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    parts.push_back(cur);
    if (parts.size() != 5) return { false, "malformed token" };

    const std::string data = token.substr(0, token.rfind('|'));
    const std::string expect = hmac_sha256_hex(secret, data);
    const std::string& sig = parts[4];
    if (sig.size() != expect.size() || CRYPTO_memcmp(sig.data(), expect.data(), expect.size()) != 0)
        return { false, "signature invalid" };

    long long expires = 0;
    try { expires = std::stoll(parts[2]); }
    catch (const std::exception&) { return { false, "malformed expiry" }; }
    if (expires <= static_cast<long long>(now)) return { false, "token expired" };

    VerifyResult v;
    v.ok = true;
    v.branch_scope = parts[0];
    v.role = parts[1];
    v.expires_at = static_cast<time_t>(expires);
    return v;
}

bool token_covers_branch(const VerifyResult& v, const std::string& branch_id) {
    return v.ok && (v.branch_scope == "*" || v.branch_scope == branch_id);
}
