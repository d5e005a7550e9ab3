#pragma once
#include "ledger_db.h"
#include "sync_interfaces.h"

#include <optional>
#include <string>
#include <vector>

struct User {
    std::string id;
    std::string branch_id;
    std::string name;
    UserType    type = UserType::Student;
    std::optional<std::string> class_id;
    std::string enroll_number;     // device-local id, may be empty
    std::string admission_number;  // external student/employee id, may be empty
    bool        active = true;
};

std::vector<User> load_users(LedgerDb& db, const std::string& branch_id);
// Insert or replace by id; false on DB error (message in out_err).
bool upsert_user(LedgerDb& db, const User& user, std::string* out_err = nullptr);

// Directory over the users table. Inactive users resolve (an active match
// wins) but are left off the roster.
class SqliteUserDirectory : public UserDirectory {
public:
    explicit SqliteUserDirectory(LedgerDb& db) : db_(db) {}

    std::optional<ResolvedIdentity> resolve_identity(const std::string& branch_id,
        const std::string& enroll_number, const std::optional<std::string>& admission_number) override;
    std::vector<RosterEntry> expected_roster(const std::string& branch_id) override;

private:
    LedgerDb& db_;
};
