#pragma once
#include "ledger_db.h"
#include "sync_interfaces.h"

// Watermark per branch in the sync_cursors table. The stored value only ever
// moves forward.
class SqliteSyncCursorStore : public SyncCursorStore {
public:
    explicit SqliteSyncCursorStore(LedgerDb& db) : db_(db) {}

    std::optional<SyncCursor> get_cursor(const std::string& branch_id) override;
    bool set_last_sync_time(const std::string& branch_id, time_t ts, const std::string& batch_id) override;

private:
    LedgerDb& db_;
};
