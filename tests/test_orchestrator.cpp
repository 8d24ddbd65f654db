#include <gtest/gtest.h>
#include <sstream>
#include "test_support.hpp"
#include "../shared/cpp/filebatch_core/include/errors.hpp"
#include "../shared/cpp/filebatch_core/include/orchestrator.hpp"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {
class OrchestratorTest : public ::testing::Test {
protected:
    CommandBatch batch(const char* text) { return parse_batch(ordered_json::parse(text)); }

    InMemoryFingerprintStore cache_;
    std::ostringstream progress_out_;
    ConsoleProgress progress_{"file manager", progress_out_};
};
}

TEST_F(OrchestratorTest, EndToEndSequentialCopySkipsEmptyDel) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto b = batch(R"({"copy": {"items": ["a", "b", "c"], "options": {}}, "del": {"items": [], "options": {}}})");
    auto summary = o.run(b, {{"parallel", 0}, {"cache", true}});

    auto calls = rec.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].job, "a");
    EXPECT_EQ(calls[1].job, "b");
    EXPECT_EQ(calls[2].job, "c");
    for (const auto& c : calls) EXPECT_EQ(c.command, Command::Copy);
    EXPECT_EQ(cache_.get(Command::Copy), std::optional<std::string>(fingerprint(json::parse(R"(["a","b","c"])"))));
    EXPECT_FALSE(cache_.get(Command::Del).has_value());

    ASSERT_EQ(summary.units.size(), 2u);
    EXPECT_EQ(summary.units[0].status, UnitStatus::Executed);
    EXPECT_EQ(summary.units[0].completed, 3u);
    EXPECT_EQ(summary.units[1].status, UnitStatus::SkippedEmpty);
}

TEST_F(OrchestratorTest, SecondIdenticalRunIssuesNoCalls) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto b = batch(R"({"copy": {"items": [{"source": "x", "destination": "y"}]}, "zip": {"items": ["z"]}})");
    o.run(b, json::object());
    ASSERT_EQ(rec.calls().size(), 2u);
    auto summary = o.run(b, json::object());
    EXPECT_EQ(rec.calls().size(), 2u);
    EXPECT_EQ(summary.units[0].status, UnitStatus::SkippedCached);
    EXPECT_EQ(summary.units[1].status, UnitStatus::SkippedCached);
}

TEST_F(OrchestratorTest, ChangedOrReorderedItemsRunAgain) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    o.run(batch(R"({"move": {"items": ["a", "b"]}})"), json::object());
    o.run(batch(R"({"move": {"items": ["b", "a"]}})"), json::object());
    EXPECT_EQ(rec.calls().size(), 4u);
    o.run(batch(R"({"move": {"items": ["b", "c"]}})"), json::object());
    EXPECT_EQ(rec.calls().size(), 6u);
}

TEST_F(OrchestratorTest, CacheDisabledAlwaysRuns) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto b = batch(R"({"del": {"items": ["a", "b"], "options": {"cache": false}}})");
    o.run(b, json::object());
    o.run(b, json::object());
    EXPECT_EQ(rec.calls().size(), 4u);

    auto global_off = batch(R"({"rename": {"items": ["r"]}})");
    o.run(global_off, {{"cache", false}});
    o.run(global_off, {{"cache", false}});
    EXPECT_EQ(rec.jobs_for(Command::Rename).size(), 2u);
}

TEST_F(OrchestratorTest, DisabledCacheRunDoesNotSeedLaterCachedRun) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto b = batch(R"({"copy": {"items": ["a", "b"]}})");
    o.run(b, {{"cache", false}});
    EXPECT_FALSE(cache_.get(Command::Copy).has_value());
    auto summary = o.run(b, {{"cache", true}});
    EXPECT_EQ(rec.calls().size(), 4u);
    EXPECT_EQ(summary.units[0].status, UnitStatus::Executed);
    EXPECT_TRUE(cache_.get(Command::Copy).has_value());
}

TEST_F(OrchestratorTest, EmptyItemsNeverTouchCache) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    o.run(batch(R"({"unzip": {"items": []}})"), {{"cache", false}});
    o.run(batch(R"({"unzip": {"items": []}})"), {{"cache", true}});
    EXPECT_TRUE(rec.calls().empty());
    EXPECT_FALSE(cache_.get(Command::Unzip).has_value());
}

TEST_F(OrchestratorTest, UnknownCommandsProduceNoCallsAndNoError) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto summary = o.run(batch(R"({"chmod": {"items": ["a"]}, "touch": "whatever"})"), json::object());
    EXPECT_TRUE(rec.calls().empty());
    EXPECT_TRUE(summary.units.empty());
}

TEST_F(OrchestratorTest, CommandsRunInBatchKeyOrder) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    o.run(batch(R"({"zip": {"items": [1]}, "del": {"items": [2]}, "copy": {"items": [3]}})"), json::object());
    auto calls = rec.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].command, Command::Zip);
    EXPECT_EQ(calls[1].command, Command::Del);
    EXPECT_EQ(calls[2].command, Command::Copy);
}

TEST_F(OrchestratorTest, SequentialFailureStopsCommandAndKeepsOldCache) {
    RecordingCommands rec(json("c"));
    BatchOrchestrator o(rec.set(), cache_, &progress_);
    cache_.set(Command::Copy, "previous");
    try {
        o.run(batch(R"({"copy": {"items": ["a", "b", "c", "d"]}, "del": {"items": ["x"]}})"), {{"progress", true}});
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.command(), Command::Copy);
        EXPECT_EQ(e.item(), 2u);
        EXPECT_EQ(e.completed(), 2u);
    }
    EXPECT_EQ(rec.jobs_for(Command::Copy).size(), 2u);
    // Fail fast: later commands never start.
    EXPECT_TRUE(rec.jobs_for(Command::Del).empty());
    EXPECT_EQ(cache_.get(Command::Copy), std::optional<std::string>("previous"));
    EXPECT_EQ(progress_.done(), 2u);
    EXPECT_EQ(progress_.total(), 5u);
}

TEST_F(OrchestratorTest, ParallelRunsEveryItemAndUpdatesCache) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_, &progress_);
    auto b = batch(R"({"copy": {"items": [0, 1, 2, 3, 4, 5, 6]}})");
    auto summary = o.run(b, {{"parallel", 3}, {"progress", true}});
    EXPECT_EQ(rec.calls().size(), 7u);
    EXPECT_EQ(summary.units[0].workers, 3u);
    EXPECT_EQ(summary.units[0].completed, 7u);
    EXPECT_EQ(progress_.done(), 7u);
    EXPECT_TRUE(cache_.get(Command::Copy).has_value());
}

TEST_F(OrchestratorTest, PerCommandParallelOverridesGlobal) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto summary = o.run(batch(R"({"zip": {"items": [1, 2], "options": {"parallel": 2}}, "del": {"items": [3]}})"),
                         {{"parallel", 0}});
    EXPECT_EQ(summary.units[0].workers, 2u);
    EXPECT_EQ(summary.units[1].workers, 0u);
}

TEST_F(OrchestratorTest, ParallelFailureLeavesCacheUnchanged) {
    RecordingCommands rec(json(1));
    BatchOrchestrator o(rec.set(), cache_);
    EXPECT_THROW(o.run(batch(R"({"unzip": {"items": [0, 1, 2, 3]}})"), {{"parallel", 2}}), CommandError);
    EXPECT_FALSE(cache_.get(Command::Unzip).has_value());
}

TEST_F(OrchestratorTest, ConfigErrorBeforeAnyExecutorCall) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto b = batch(R"({"copy": {"items": ["a"]}, "del": {"items": ["b"], "options": {"parallel": -2}}})");
    EXPECT_THROW(o.run(b, json::object()), BatchConfigError);
    EXPECT_TRUE(rec.calls().empty());
    EXPECT_THROW(o.run(b, json::array()), BatchConfigError);
}

TEST_F(OrchestratorTest, MergedOptionsReachExecutor) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    o.run(batch(R"({"copy": {"items": ["a"], "options": {"context": "/src", "cache": false}}})"),
          {{"context", "/root"}, {"verbose", true}});
    auto calls = rec.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].options["context"], "/src");
    EXPECT_EQ(calls[0].options["verbose"], true);
    EXPECT_EQ(calls[0].options["cache"], false);
}

TEST_F(OrchestratorTest, ProgressTotalsOnlyCountNonSkippedItems) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_, &progress_);
    auto b = batch(R"({"copy": {"items": ["a", "b"]}, "del": {"items": []}})");
    o.run(b, {{"progress", true}});
    o.run(b, {{"progress", true}});
    EXPECT_EQ(progress_.total(), 2u);
    EXPECT_EQ(progress_.done(), 2u);
    EXPECT_NE(progress_out_.str().find("[file manager] 2/2 (100%)"), std::string::npos);
}

TEST_F(OrchestratorTest, ParallelFailureAdvancesProgressByCompletedItems) {
    RecordingCommands rec(json(1));
    BatchOrchestrator o(rec.set(), cache_, &progress_);
    try {
        o.run(batch(R"({"zip": {"items": [0, 1, 2, 3]}})"), {{"progress", true}, {"parallel", 2}});
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.item(), 1u);
        EXPECT_EQ(progress_.done(), e.completed());
        EXPECT_EQ(e.completed(), rec.calls().size());
    }
    EXPECT_EQ(progress_.total(), 4u);
    EXPECT_FALSE(cache_.get(Command::Zip).has_value());
}

TEST_F(OrchestratorTest, NonStandardThrowBecomesUnknownError) {
    CommandSet set;
    set.bind(Command::Del, [](const json& job, const json&) {
        if (job == "bad") throw 42;
    });
    BatchOrchestrator o(set, cache_);
    try {
        o.run(batch(R"({"del": {"items": ["ok", "bad", "later"]}})"), json::object());
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.command(), Command::Del);
        EXPECT_EQ(e.item(), 1u);
        EXPECT_EQ(e.reason(), "unknown error");
        EXPECT_EQ(e.completed(), 1u);
    }
    EXPECT_FALSE(cache_.get(Command::Del).has_value());
}

TEST_F(OrchestratorTest, PlanDoesNotExecute) {
    RecordingCommands rec;
    BatchOrchestrator o(rec.set(), cache_);
    auto units = o.plan(batch(R"({"copy": {"items": ["a"]}, "move": {"items": []}})"), {{"parallel", 2}});
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].workers, 2u);
    EXPECT_EQ(units[0].status, UnitStatus::Executed);
    EXPECT_EQ(units[1].status, UnitStatus::SkippedEmpty);
    EXPECT_TRUE(rec.calls().empty());
}

TEST(RunSummary, SerializesUnits) {
    RunSummary s;
    s.units.push_back({Command::Zip, UnitStatus::Executed, 3, 3, 2});
    s.units.push_back({Command::Del, UnitStatus::SkippedCached, 1, 0, 0});
    auto j = s.to_json();
    EXPECT_EQ(j["completed"], 3);
    EXPECT_EQ(j["units"][0]["command"], "zip");
    EXPECT_EQ(j["units"][1]["status"], "skipped_cached");
}
