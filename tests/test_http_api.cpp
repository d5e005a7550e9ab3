#include "auth_manager.h"
#include "fake_terminal.h"
#include "fakes.h"
#include "http_api.h"

#include <gtest/gtest.h>

using nlohmann::json;

namespace {

const std::string SECRET = "api-test-secret";
constexpr time_t NOW = 1709575200;  // 2024-03-04T18:00:00Z

class SyncApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        BranchConfig b1;
        b1.id = "b1";
        b1.device_ip = "127.0.0.1";
        b1.connect_timeout_ms = 2000;
        b1.command_timeout_ms = 2000;
        BranchConfig b2 = b1;
        b2.id = "b2";
        config_.branches = { b1, b2 };
        config_.sync_secret = SECRET;

        directory_.add("1", "u1");
        directory_.add("2", "u2");
        extractor_ = std::make_shared<FakeExtractor>();
        sink_ = std::make_shared<FakeSink>();

        RetryPolicy retry;
        retry.max_attempts = 1;
        orchestrator_ = std::make_unique<SyncOrchestrator>(directory_, cursors_, retry, 24, [] { return NOW; });
        for (const auto& b : config_.branches) {
            BranchPipeline p;
            p.branch_id = b.id;
            p.extractor = extractor_;
            p.sink = sink_;
            p.engine = std::make_shared<ReconciliationEngine>(config_.reconciliation_for(b));
            orchestrator_->add_branch(std::move(p));
        }
        api_ = std::make_unique<SyncApi>(*orchestrator_, cursors_, config_, [] { return NOW; });
    }

    std::string bearer(const std::string& scope = "b1", const std::string& role = "sync") {
        return "Bearer " + issue_sync_token(SECRET, scope, role, 7, NOW);
    }

    AppConfig config_;
    FakeDirectory directory_;
    FakeCursorStore cursors_;
    std::shared_ptr<FakeExtractor> extractor_;
    std::shared_ptr<FakeSink> sink_;
    std::unique_ptr<SyncOrchestrator> orchestrator_;
    std::unique_ptr<SyncApi> api_;
};

std::string push_body(const std::string& branch, const json& logs) {
    return json{ {"branchId", branch}, {"branchName", "Main Campus"}, {"logs", logs} }.dump();
}

}  // namespace

TEST_F(SyncApiTest, PushRequiresToken) {
    const std::string body = push_body("b1", json::array());
    EXPECT_EQ(api_->sync_from_branch("", body).status, 401);
    EXPECT_EQ(api_->sync_from_branch("Basic abc", body).status, 401);
    EXPECT_EQ(api_->sync_from_branch("Bearer garbage", body).status, 401);

    const std::string expired = "Bearer " + issue_sync_token(SECRET, "b1", "sync", 1, NOW - 2 * 86400);
    auto r = api_->sync_from_branch(expired, body);
    EXPECT_EQ(r.status, 401);
    EXPECT_FALSE(r.body["success"].get<bool>());
}

TEST_F(SyncApiTest, PushIsScopedToBranchAndRole) {
    const std::string body = push_body("b1", json::array());
    EXPECT_EQ(api_->sync_from_branch(bearer("b2"), body).status, 403);
    EXPECT_EQ(api_->sync_from_branch(bearer("b1", "teacher"), body).status, 403);
    EXPECT_EQ(api_->sync_from_branch(bearer("*", "admin"), body).status, 200);
}

TEST_F(SyncApiTest, PushValidatesBody) {
    EXPECT_EQ(api_->sync_from_branch(bearer(), "{not json").status, 400);
    EXPECT_EQ(api_->sync_from_branch(bearer(), "[]").status, 400);
    EXPECT_EQ(api_->sync_from_branch(bearer(), json{ {"branchId", "b1"} }.dump()).status, 400);
    EXPECT_EQ(api_->sync_from_branch(bearer(), json{ {"logs", json::array()} }.dump()).status, 400);
    EXPECT_EQ(api_->sync_from_branch(bearer("*"), push_body("b9", json::array())).status, 404);
}

TEST_F(SyncApiTest, MixedPushReportsPerEntryErrors) {
    json logs = json::array({
        { {"enrollNumber", 1}, {"timestamp", "2024-03-04T08:00:00"}, {"checkType", "I"}, {"verifyMode", 1} },
        { {"enrollNumber", "2"}, {"timestamp", "yesterday morning"} },
        { {"enrollNumber", "404"}, {"admissionNumber", "ADM-404"}, {"timestamp", "2024-03-04T08:03:00"} },
    });
    auto r = api_->sync_from_branch(bearer(), push_body("b1", logs));
    ASSERT_EQ(r.status, 200) << r.body.dump();
    EXPECT_TRUE(r.body["success"].get<bool>());
    const json& data = r.body["data"];
    EXPECT_EQ(data["processedCount"], 1);
    EXPECT_EQ(data["errorCount"], 2);
    EXPECT_EQ(data["totalLogs"], 3);
    ASSERT_EQ(data["errors"].size(), 2u);
    EXPECT_EQ(data["errors"][0]["message"], "Invalid timestamp format");
    EXPECT_EQ(data["errors"][1]["enrollNumber"], "404");
    EXPECT_EQ(data["errors"][1]["admissionNumber"], "ADM-404");

    ASSERT_EQ(sink_->committed.size(), 1u);
    EXPECT_EQ(sink_->committed[0].user_id, "u1");
    EXPECT_EQ(cursors_.cursors["b1"].last_sync_time, *parse_iso_timestamp("2024-03-04T08:00:00Z", 0));
}

TEST_F(SyncApiTest, LastSyncBeforeAndAfter) {
    EXPECT_EQ(api_->last_sync("", "b1").status, 401);
    EXPECT_EQ(api_->last_sync(bearer("b2"), "b1").status, 403);

    auto before = api_->last_sync(bearer(), "b1");
    ASSERT_EQ(before.status, 200);
    EXPECT_EQ(before.body["data"]["status"], "no_sync_yet");
    EXPECT_TRUE(before.body["data"]["lastSyncTime"].is_null());

    cursors_.set_last_sync_time("b1", *parse_iso_timestamp("2024-03-04T08:00:00Z", 0), "b1-batch");
    auto after = api_->last_sync(bearer(), "b1");
    ASSERT_EQ(after.status, 200);
    EXPECT_EQ(after.body["data"]["status"], "active");
    EXPECT_EQ(after.body["data"]["lastSyncTime"], "2024-03-04T08:00:00Z");
    EXPECT_EQ(after.body["data"]["lastSyncBatchId"], "b1-batch");
    EXPECT_EQ(after.body["data"]["branchId"], "b1");
}

TEST_F(SyncApiTest, DeviceSyncUsesConfiguredSource) {
    extractor_->events = { make_event("2", "2024-03-04 08:30:00") };
    auto r = api_->sync_device(bearer(), json{ {"branchId", "b1"} }.dump());
    ASSERT_EQ(r.status, 200) << r.body.dump();
    EXPECT_TRUE(r.body["success"].get<bool>());
    EXPECT_EQ(r.body["data"]["committed"], 1);
    EXPECT_EQ(r.body["data"]["branchId"], "b1");

    extractor_->always_fail = true;
    auto failed = api_->sync_device(bearer(), json{ {"branchId", "b1"} }.dump());
    EXPECT_EQ(failed.status, 502);
    EXPECT_FALSE(failed.body["success"].get<bool>());
    EXPECT_TRUE(failed.body.contains("message"));
}

TEST_F(SyncApiTest, DeviceSyncAgainstNamedTerminal) {
    const uint16_t session = 0x0042;
    const auto record = attlog_record(1, 1, 0, 2024, 3, 4, 7, 59, 0);
    FakeTerminal dev([&](const Frame& req) -> FakeTerminal::Chunks {
        if (req.command == cmd::ATTLOG_RRQ) return { FakeTerminal::reply(cmd::ACK_DATA, session, req.reply_id, record) };
        return { FakeTerminal::reply(cmd::ACK_OK, session, req.reply_id) };
    });

    json body{ {"branchId", "b1"}, {"deviceIp", "127.0.0.1"}, {"devicePort", dev.port()} };
    auto r = api_->sync_device(bearer(), body.dump());
    ASSERT_EQ(r.status, 200) << r.body.dump();
    EXPECT_EQ(r.body["data"]["extracted"], 1);
    EXPECT_EQ(extractor_->calls.load(), 0);
    ASSERT_EQ(sink_->committed.size(), 1u);
    EXPECT_EQ(sink_->committed[0].user_id, "u1");

    json bad_port{ {"branchId", "b1"}, {"deviceIp", "127.0.0.1"}, {"devicePort", 0} };
    EXPECT_EQ(api_->sync_device(bearer(), bad_port.dump()).status, 400);
}

TEST(PushedLogs, FieldMapping) {
    json logs = json::array({
        { {"enrollNumber", 15}, {"timestamp", "2024-03-04 08:00:00"}, {"inOutMode", 1}, {"verifyMode", "2"},
          {"workCode", 3}, {"sensorId", 4} },
        { {"enrollNumber", "16"}, {"timestamp", "2024-03-04T05:00:00Z"}, {"deviceId", "gate-2"}, {"admissionNumber", ""} },
        "not an object",
        { {"timestamp", "2024-03-04 08:00:00"} },
        { {"enrollNumber", "17"} },
    });
    std::vector<LogParseError> errors;
    auto events = parse_pushed_logs(logs, "b1", 180, errors);
    ASSERT_EQ(events.size(), 2u);

    EXPECT_EQ(events[0].enroll_number, "15");
    EXPECT_EQ(events[0].timestamp, *parse_iso_timestamp("2024-03-04T05:00:00Z", 0));
    EXPECT_EQ(events[0].direction, PunchDirection::Out);
    EXPECT_EQ(events[0].verify_mode, VerifyMode::Card);
    EXPECT_EQ(events[0].work_code, 3);
    EXPECT_EQ(events[0].source_device_id, "sensor-4");
    EXPECT_EQ(events[0].branch_id, "b1");
    EXPECT_FALSE(events[0].raw_payload.empty());

    EXPECT_EQ(events[1].timestamp, events[0].timestamp);
    EXPECT_EQ(events[1].source_device_id, "gate-2");
    EXPECT_FALSE(events[1].admission_number.has_value());
    EXPECT_EQ(events[1].direction, PunchDirection::Unknown);

    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].index, 2u);
    EXPECT_EQ(errors[1].message, "enrollNumber is required");
    EXPECT_EQ(errors[2].message, "timestamp is required");
}
