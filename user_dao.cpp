#include "user_dao.h"

static User user_from_row(sqlite3_stmt* s) {
    User u;
    u.id = sqlite_column_string(s, 0);
    u.branch_id = sqlite_column_string(s, 1);
    u.name = sqlite_column_string(s, 2);
    u.type = user_type_from_string(sqlite_column_string(s, 3)).value_or(UserType::Staff);
    if (sqlite3_column_type(s, 4) != SQLITE_NULL) u.class_id = sqlite_column_string(s, 4);
    u.enroll_number = sqlite_column_string(s, 5);
    u.admission_number = sqlite_column_string(s, 6);
    u.active = sqlite3_column_int(s, 7) != 0;
    return u;
}

static ResolvedIdentity identity_of(const User& u) {
    return ResolvedIdentity{ u.id, u.type, u.class_id };
}

std::vector<User> load_users(LedgerDb& db, const std::string& branch_id) {
    std::lock_guard<std::mutex> lk(db.mutex());
    std::vector<User> v; StmtGuard s;
    if (sqlite3_prepare_v2(db.handle(),
        "SELECT id,branch_id,name,user_type,class_id,enroll_number,admission_number,active "
        "FROM users WHERE branch_id=? ORDER BY id ASC;", -1, &s.st, nullptr) != SQLITE_OK)
        return v;
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(s.st) == SQLITE_ROW) v.push_back(user_from_row(s.st));
    return v;
}

bool upsert_user(LedgerDb& db, const User& user, std::string* out_err) {
    std::lock_guard<std::mutex> lk(db.mutex());
    StmtGuard s;
    const char* SQL =
        "INSERT OR REPLACE INTO users(id,branch_id,name,user_type,class_id,enroll_number,admission_number,active) "
        "VALUES(?,?,?,?,?,?,?,?);";
    if (sqlite3_prepare_v2(db.handle(), SQL, -1, &s.st, nullptr) != SQLITE_OK) {
        if (out_err) *out_err = sqlite3_errmsg(db.handle());
        return false;
    }
    auto bind_opt = [&](int idx, const std::string& v) {
        if (v.empty()) sqlite3_bind_null(s.st, idx);
        else sqlite3_bind_text(s.st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
    };
    sqlite3_bind_text(s.st, 1, user.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, user.branch_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 3, user.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 4, to_string(user.type), -1, SQLITE_STATIC);
    bind_opt(5, user.class_id.value_or(""));
    bind_opt(6, user.enroll_number);
    bind_opt(7, user.admission_number);
    sqlite3_bind_int(s.st, 8, user.active ? 1 : 0);

    if (sqlite3_step(s.st) != SQLITE_DONE) {
        if (out_err) *out_err = sqlite3_errmsg(db.handle());
        return false;
    }
    return true;
}

std::optional<ResolvedIdentity> SqliteUserDirectory::resolve_identity(const std::string& branch_id,
    const std::string& enroll_number, const std::optional<std::string>& admission_number) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    const char* COLS = "SELECT id,branch_id,name,user_type,class_id,enroll_number,admission_number,active FROM users ";

    // inactive users still resolve; their punch reactivates them on commit
    auto lookup = [&](const std::string& where, const std::string& value) -> std::optional<ResolvedIdentity> {
        StmtGuard s;
        const std::string sql = COLS + where + " ORDER BY active DESC LIMIT 1;";
        if (sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) return std::nullopt;
        sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.st, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
        return identity_of(user_from_row(s.st));
    };

    if (admission_number && !admission_number->empty()) {
        if (auto id = lookup("WHERE branch_id=? AND admission_number=?", *admission_number)) return id;
    }
    if (!enroll_number.empty()) {
        if (auto id = lookup("WHERE branch_id=? AND enroll_number=?", enroll_number)) return id;
    }
    return std::nullopt;
}

std::vector<RosterEntry> SqliteUserDirectory::expected_roster(const std::string& branch_id) {
    std::vector<RosterEntry> roster;
    for (const auto& u : load_users(db_, branch_id)) {
        if (u.active) roster.push_back(RosterEntry{ identity_of(u) });
    }
    return roster;
}
