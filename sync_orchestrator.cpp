#include "sync_orchestrator.h"
#include "auth_manager.h"
#include "logger.h"
#include "sync_errors.h"
#include "time_util.h"

#include <algorithm>
#include <set>
#include <stdexcept>

using nlohmann::json;

json to_json(const SyncResult& r) {
    json unresolved = json::array();
    for (const auto& u : r.unresolved) {
        unresolved.push_back({ {"enrollNumber", u.enroll_number},
            {"admissionNumber", u.admission_number ? json(*u.admission_number) : json(nullptr)},
            {"timestamp", iso_from_time_t_utc(u.timestamp)},
            {"deviceId", u.source_device_id} });
    }
    json failed = json::array();
    for (const auto& f : r.failed) failed.push_back({ {"index", f.index}, {"message", f.message} });

    return json{
        {"branchId", r.branch_id},
        {"batchId", r.batch_id},
        {"extracted", r.extracted},
        {"attempted", r.attempted},
        {"committed", r.committed},
        {"eventsCommitted", r.events_committed},
        {"unresolved", unresolved},
        {"failed", failed},
        {"newWatermark", r.new_watermark ? json(iso_from_time_t_utc(*r.new_watermark)) : json(nullptr)},
        {"watermarkAdvanced", r.watermark_advanced},
        {"error", r.error.empty() ? json(nullptr) : json(r.error)},
        {"halted", r.halted},
    };
}

std::optional<time_t> compute_watermark(const std::vector<RawPunchEvent>& events,
    const std::vector<AttendanceRecord>& records, const std::vector<size_t>& committed_indices,
    size_t* committed_events) {
    std::set<std::string> committed_keys;
    for (size_t idx : committed_indices) {
        if (idx >= records.size()) continue;
        for (const auto& p : records[idx].punches) committed_keys.insert(punch_key(p));
    }

    std::optional<time_t> lowest_pending;
    std::vector<time_t> done;
    for (const auto& e : events) {
        if (committed_keys.count(punch_key(e))) done.push_back(e.timestamp);
        else if (!lowest_pending || e.timestamp < *lowest_pending) lowest_pending = e.timestamp;
    }

    if (committed_events) *committed_events = done.size();
    std::optional<time_t> best;
    for (time_t t : done) {
        if (lowest_pending && t >= *lowest_pending) continue;
        if (!best || t > *best) best = t;
    }
    return best;
}

SyncOrchestrator::SyncOrchestrator(UserDirectory& directory, SyncCursorStore& cursors, RetryPolicy retry,
    int initial_lookback_hours, Clock clock)
    : directory_(directory), cursors_(cursors), retry_(retry), initial_lookback_hours_(initial_lookback_hours),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

SyncOrchestrator::~SyncOrchestrator() { stop(); }

void SyncOrchestrator::add_branch(BranchPipeline pipeline) {
    if (running_) throw std::logic_error("add_branch after start");
    if (!pipeline.sink || !pipeline.engine)
        throw std::invalid_argument("branch " + pipeline.branch_id + " needs a sink and an engine");
    if (pipeline.batch_size == 0) pipeline.batch_size = 1;
    auto st = std::make_unique<BranchState>();
    const std::string id = pipeline.branch_id;
    st->pipeline = std::move(pipeline);
    branches_[id] = std::move(st);
}

bool SyncOrchestrator::has_branch(const std::string& branch_id) const {
    return branches_.count(branch_id) > 0;
}

bool SyncOrchestrator::halted(const std::string& branch_id) const {
    auto it = branches_.find(branch_id);
    return it != branches_.end() && it->second->halted.load();
}

SyncOrchestrator::BranchState& SyncOrchestrator::state_for(const std::string& branch_id) const {
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) throw std::invalid_argument("unknown branch: " + branch_id);
    return *it->second;
}

SyncResult SyncOrchestrator::run_once(const std::string& branch_id, CancellationToken* cancel) {
    BranchState& st = state_for(branch_id);
    if (!st.pipeline.extractor) {
        SyncResult r;
        r.branch_id = branch_id;
        r.error = "branch has no extraction source";
        return r;
    }
    std::lock_guard<std::mutex> lk(st.cycle_mutex);
    return run_cycle_locked(st, st.pipeline.extractor.get(), nullptr, cancel);
}

SyncResult SyncOrchestrator::run_once_with(const std::string& branch_id, LogExtractor& extractor, CancellationToken* cancel) {
    BranchState& st = state_for(branch_id);
    std::lock_guard<std::mutex> lk(st.cycle_mutex);
    return run_cycle_locked(st, &extractor, nullptr, cancel);
}

SyncResult SyncOrchestrator::ingest_pushed(const std::string& branch_id, const std::vector<RawPunchEvent>& events) {
    BranchState& st = state_for(branch_id);
    std::lock_guard<std::mutex> lk(st.cycle_mutex);
    return run_cycle_locked(st, nullptr, &events, nullptr);
}

std::string SyncOrchestrator::new_batch_id(const std::string& branch_id) const {
    std::string stamp;
    for (char c : iso_from_time_t_utc(clock_()))
        if (c >= '0' && c <= '9') stamp.push_back(c);
    return branch_id + "-" + stamp + "-" + rand_hex(4);
}

std::vector<ResolvedPunch> SyncOrchestrator::resolve_all(const std::string& branch_id,
    const std::vector<RawPunchEvent>& events) {
    std::map<std::pair<std::string, std::string>, std::optional<ResolvedIdentity>> cache;
    std::vector<ResolvedPunch> out;
    out.reserve(events.size());
    for (const auto& e : events) {
        const auto key = std::make_pair(e.enroll_number, e.admission_number.value_or(""));
        auto it = cache.find(key);
        if (it == cache.end())
            it = cache.emplace(key, directory_.resolve_identity(branch_id, e.enroll_number, e.admission_number)).first;
        out.push_back(ResolvedPunch{ e, it->second });
    }
    return out;
}

void SyncOrchestrator::commit_batches(BranchState& st, const std::vector<AttendanceRecord>& records,
    CancellationToken* cancel, SyncResult& result, std::vector<size_t>& committed_indices) {
    const std::string& id = st.pipeline.branch_id;
    const size_t step = st.pipeline.batch_size;

    for (size_t offset = 0; offset < records.size(); offset += step) {
        if (cancel) cancel->throw_if_cancelled();
        const size_t end = std::min(records.size(), offset + step);
        std::vector<AttendanceRecord> batch(records.begin() + offset, records.begin() + end);
        result.attempted += batch.size();

        IngestResult ir;
        try {
            ir = with_retry<CommitError>(retry_, cancel, "commit " + id, [&] {
                return st.pipeline.sink->ingest(id, batch);
            });
        }
        catch (const CommitError& e) {
            result.error = std::string("commit failed: ") + e.what();
            log_error("[" + id + "] " + result.error);
            for (size_t i = offset; i < records.size(); ++i)
                result.failed.push_back(RecordFailure{ i, i < end ? e.what() : "not attempted after commit failure" });
            return;
        }

        for (size_t i : ir.committed) committed_indices.push_back(offset + i);
        for (const auto& f : ir.failed) {
            const size_t idx = offset + f.index;
            const AttendanceRecord& r = records[std::min(idx, records.size() - 1)];
            log_warn("[" + id + "] record " + r.user_id + " " + r.date + " not committed: " + f.message);
            result.failed.push_back(RecordFailure{ idx, f.message });
        }
    }
}

SyncResult SyncOrchestrator::run_cycle_locked(BranchState& st, LogExtractor* extractor,
    const std::vector<RawPunchEvent>* pushed, CancellationToken* cancel) {
    const BranchPipeline& p = st.pipeline;
    SyncResult result;
    result.branch_id = p.branch_id;
    result.batch_id = new_batch_id(p.branch_id);
    const time_t as_of = clock_();

    try {
        std::vector<RawPunchEvent> events;
        if (pushed) {
            events = *pushed;
        }
        else {
            auto cursor = cursors_.get_cursor(p.branch_id);
            const time_t since = cursor ? cursor->last_sync_time
                : as_of - static_cast<time_t>(initial_lookback_hours_) * 3600;
            if (!cursor)
                log_info("[" + p.branch_id + "] no previous sync, looking back " +
                    std::to_string(initial_lookback_hours_) + "h");
            if (cancel) cancel->throw_if_cancelled();
            events = with_retry<ExtractionError>(retry_, cancel, "extract " + p.branch_id + " from " + extractor->describe(),
                [&] { return extractor->extract_since(p.branch_id, since); });
        }
        for (auto& e : events) {
            if (e.branch_id.empty()) e.branch_id = p.branch_id;
        }
        result.extracted = events.size();
        if (events.empty()) {
            log_debug("[" + p.branch_id + "] nothing new");
            return result;
        }

        if (cancel) cancel->throw_if_cancelled();
        const std::vector<ResolvedPunch> resolved = resolve_all(p.branch_id, events);

        if (cancel) cancel->throw_if_cancelled();
        ReconciliationOutput out = p.engine->reconcile(resolved, as_of, result.batch_id);
        result.unresolved = out.unresolved;
        for (const auto& u : out.unresolved) {
            log_warn("[" + p.branch_id + "] unresolved enroll " + u.enroll_number +
                (u.admission_number ? " (admission " + *u.admission_number + ")" : "") +
                " at " + iso_from_time_t_utc(u.timestamp) + " from " + u.source_device_id);
        }

        std::vector<AttendanceRecord> records = std::move(out.records);
        if (p.synthesize_absences) {
            std::set<std::string> dates;
            for (const auto& e : events)
                dates.insert(local_date_key(e.timestamp, p.engine->config().utc_offset_minutes));
            auto absent = p.engine->synthesize_absences(p.branch_id, directory_.expected_roster(p.branch_id),
                dates, records, as_of, result.batch_id);
            if (!absent.empty())
                log_info("[" + p.branch_id + "] " + std::to_string(absent.size()) + " absences synthesized");
            for (auto& r : absent) records.push_back(std::move(r));
        }

        if (cancel) cancel->throw_if_cancelled();
        std::vector<size_t> committed;
        commit_batches(st, records, cancel, result, committed);
        result.committed = committed.size();

        result.new_watermark = compute_watermark(events, records, committed, &result.events_committed);
        if (result.new_watermark)
            result.watermark_advanced = cursors_.set_last_sync_time(p.branch_id, *result.new_watermark, result.batch_id);
    }
    catch (const CancelledError& e) {
        result.cancelled = true;
        result.error = e.what();
        log_info("[" + p.branch_id + "] " + result.error);
        return result;
    }
    catch (const ReconciliationError& e) {
        st.halted = true;
        result.halted = true;
        result.error = std::string("reconciliation invariant broken: ") + e.what();
        log_error("[" + p.branch_id + "] " + result.error + " (batch " + result.batch_id +
            ", extracted " + std::to_string(result.extracted) + "); branch halted");
        return result;
    }
    catch (const ExtractionError& e) {
        result.error = std::string("extraction failed: ") + e.what();
        log_error("[" + p.branch_id + "] " + result.error);
        return result;
    }
    catch (const CommitError& e) {
        result.error = std::string("ledger failure: ") + e.what();
        log_error("[" + p.branch_id + "] " + result.error);
        return result;
    }
    catch (const std::exception& e) {
        // fails this cycle only; the watermark has not moved
        result.error = std::string("unexpected failure: ") + e.what();
        log_error("[" + p.branch_id + "] " + result.error + " (batch " + result.batch_id + ")");
        return result;
    }

    log_info("[" + p.branch_id + "] batch " + result.batch_id + ": " + std::to_string(result.extracted) +
        " events, " + std::to_string(result.committed) + "/" + std::to_string(result.attempted) +
        " records committed, " + std::to_string(result.unresolved.size()) + " unresolved, " +
        std::to_string(result.failed.size()) + " failed" +
        (result.watermark_advanced ? ", watermark " + iso_from_time_t_utc(*result.new_watermark) : ""));
    return result;
}

void SyncOrchestrator::worker_loop(BranchState& st) {
    const std::string& id = st.pipeline.branch_id;
    log_info("[" + id + "] worker started, every " + std::to_string(st.pipeline.interval.count()) + "s via " +
        st.pipeline.extractor->describe());
    while (!stop_token_.cancelled()) {
        if (!st.halted) {
            std::lock_guard<std::mutex> lk(st.cycle_mutex);
            run_cycle_locked(st, st.pipeline.extractor.get(), nullptr, &stop_token_);
        }
        if (!stop_token_.wait_for(st.pipeline.interval)) break;
    }
    log_info("[" + id + "] worker stopped");
}

void SyncOrchestrator::start() {
    if (running_.exchange(true)) return;
    stop_token_.reset();
    for (auto& kv : branches_) {
        BranchState& st = *kv.second;
        if (!st.pipeline.extractor) continue;
        workers_.emplace_back(&SyncOrchestrator::worker_loop, this, std::ref(st));
    }
}

void SyncOrchestrator::stop() {
    stop_token_.cancel();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
    workers_.clear();
    running_ = false;
}
