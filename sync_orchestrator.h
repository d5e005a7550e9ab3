#pragma once
#include "reconciliation.h"
#include "retry.h"
#include "sync_interfaces.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Everything the orchestrator needs to run one branch.
struct BranchPipeline {
    std::string branch_id;
    std::shared_ptr<LogExtractor> extractor;  // null for push-only branches
    std::shared_ptr<AttendanceSink> sink;
    std::shared_ptr<const ReconciliationEngine> engine;
    size_t batch_size = 100;
    bool synthesize_absences = false;
    std::chrono::seconds interval{ 60 };
};

struct SyncResult {
    std::string branch_id;
    std::string batch_id;
    size_t extracted = 0;  // raw events pulled or pushed
    size_t attempted = 0;  // records handed to the sink
    size_t committed = 0;
    size_t events_committed = 0;
    std::vector<UnresolvedIdentity> unresolved;
    std::vector<RecordFailure> failed;  // indices into this cycle's records
    std::optional<time_t> new_watermark;
    bool watermark_advanced = false;
    std::string error;  // empty on success
    bool halted = false;
    bool cancelled = false;

    bool ok() const { return error.empty(); }
};

nlohmann::json to_json(const SyncResult& r);

// Largest committed event time strictly below every uncommitted event time.
// Events are matched to commit outcomes by punch_key.
std::optional<time_t> compute_watermark(const std::vector<RawPunchEvent>& events,
    const std::vector<AttendanceRecord>& records, const std::vector<size_t>& committed_indices,
    size_t* committed_events = nullptr);

// Drives extract -> resolve -> reconcile -> commit -> advance per branch.
// Cycles for one branch never overlap; different branches run in parallel.
class SyncOrchestrator {
public:
    using Clock = std::function<time_t()>;

    SyncOrchestrator(UserDirectory& directory, SyncCursorStore& cursors, RetryPolicy retry,
        int initial_lookback_hours, Clock clock = {});
    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    // Not after start().
    void add_branch(BranchPipeline pipeline);
    bool has_branch(const std::string& branch_id) const;

    // One cycle with the branch's configured extractor.
    SyncResult run_once(const std::string& branch_id, CancellationToken* cancel = nullptr);
    // One cycle with a caller-supplied extractor (manual sync against another terminal).
    SyncResult run_once_with(const std::string& branch_id, LogExtractor& extractor, CancellationToken* cancel = nullptr);
    // Events pushed by a remote branch agent. No extraction step.
    SyncResult ingest_pushed(const std::string& branch_id, const std::vector<RawPunchEvent>& events);

    // Continuous mode: one worker per branch with an extractor. start() after
    // stop() runs the workers again.
    void start();
    void stop();
    bool running() const { return running_.load(); }
    bool halted(const std::string& branch_id) const;

private:
    struct BranchState {
        BranchPipeline pipeline;
        std::mutex cycle_mutex;
        std::atomic<bool> halted{ false };
    };

    BranchState& state_for(const std::string& branch_id) const;
    SyncResult run_cycle_locked(BranchState& st, LogExtractor* extractor,
        const std::vector<RawPunchEvent>* pushed, CancellationToken* cancel);
    std::vector<ResolvedPunch> resolve_all(const std::string& branch_id, const std::vector<RawPunchEvent>& events);
    void commit_batches(BranchState& st, const std::vector<AttendanceRecord>& records,
        CancellationToken* cancel, SyncResult& result, std::vector<size_t>& committed_indices);
    void worker_loop(BranchState& st);
    std::string new_batch_id(const std::string& branch_id) const;

    UserDirectory& directory_;
    SyncCursorStore& cursors_;
    RetryPolicy retry_;
    int initial_lookback_hours_;
    Clock clock_;

    std::map<std::string, std::unique_ptr<BranchState>> branches_;
    CancellationToken stop_token_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{ false };
};
