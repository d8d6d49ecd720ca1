#include "SessionEngine.hpp"
#include "UsageMerger.hpp"
#include "TestUtil.hpp"
#include <algorithm>
#include <random>


namespace {

std::vector<UsageEntry> sorted_entries(std::vector<UsageEntry> v) {
    std::vector<std::vector<UsageEntry>> files{std::move(v)};
    uint64_t dropped = 0;
    return merge_usage_entries(std::move(files), dropped);
}

void expect_same_session(const ObservedSession& a, const ObservedSession& b) {
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.plan_type, b.plan_type);
    EXPECT_EQ(a.start_time_ns, b.start_time_ns);
    EXPECT_EQ(a.reset_time_ns, b.reset_time_ns);
    EXPECT_EQ(a.has_end_time, b.has_end_time);
    EXPECT_EQ(a.tokens_used, b.tokens_used);
    EXPECT_EQ(a.tokens_limit, b.tokens_limit);
    EXPECT_EQ(a.is_active, b.is_active);
    EXPECT_EQ(a.breakdown.entry_count, b.breakdown.entry_count);
    EXPECT_EQ(a.breakdown.model_tokens, b.breakdown.model_tokens);
}

} // namespace


class SessionEngineTest : public ::testing::Test {
protected:
    MonitorConfig cfg_;
    DerivationReport report_;
};

TEST_F(SessionEngineTest, NoEntriesMeansInactiveWithoutSession) {
    SessionEngine engine(cfg_, -1);
    EXPECT_FALSE(engine.derive({}, kT0, report_));
    EXPECT_FALSE(engine.hasCurrent());
    EXPECT_TRUE(engine.history().empty());
}

TEST_F(SessionEngineTest, DuplicateAcrossFilesCountsOnce) {
    std::vector<std::vector<UsageEntry>> files(2);
    files[0] = {make_entry(kT0, 100, "A", "req-A")};
    files[1] = {make_entry(kT0, 100, "A", "req-A"),
                make_entry(kT0 + kNsPerMinute, 50, "B", "req-B")};
    uint64_t dropped = 0;
    auto entries = merge_usage_entries(std::move(files), dropped);

    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0 + 2 * kNsPerMinute, report_));
    EXPECT_EQ(engine.current().tokens_used, 150u);
    EXPECT_EQ(dropped, 1u);
}

TEST_F(SessionEngineTest, WindowAnchoredAtLatestEntry) {
    const int64_t late = kT0 + 5 * kNsPerHour + kNsPerMinute;
    auto entries = sorted_entries({make_entry(kT0, 10, "a"), make_entry(late, 20, "b")});

    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, late + kNsPerMinute, report_));

    const ObservedSession& cur = engine.current();
    EXPECT_EQ(cur.start_time_ns, late);
    EXPECT_EQ(cur.reset_time_ns, late + kSessionWindowNs);
    EXPECT_EQ(cur.tokens_used, 20u);
    EXPECT_TRUE(cur.is_active);
    EXPECT_FALSE(cur.has_end_time);

    // the t=0 entry is only visible through the closed earlier window
    ASSERT_EQ(engine.history().size(), 1u);
    const ObservedSession& old = engine.history()[0];
    EXPECT_EQ(old.start_time_ns, kT0);
    EXPECT_EQ(old.tokens_used, 10u);
    EXPECT_TRUE(old.has_end_time);
    EXPECT_EQ(old.end_time_ns, old.reset_time_ns);
    EXPECT_FALSE(old.is_active);
}

TEST_F(SessionEngineTest, EntriesExactlyFiveHoursBeforeLatestAreOutside) {
    auto entries = sorted_entries({
        make_entry(kT0, 1, "a"),
        make_entry(kT0 + kNsPerSecond, 2, "b"),
        make_entry(kT0 + 5 * kNsPerHour, 4, "c"),
    });
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0 + 5 * kNsPerHour, report_));
    EXPECT_EQ(engine.current().tokens_used, 6u);
    EXPECT_EQ(engine.current().start_time_ns, kT0 + kNsPerSecond);
}

TEST_F(SessionEngineTest, IdIsDerivedFromWholeSecondStart) {
    auto entries = sorted_entries({make_entry(kT0 + 500 * 1000000LL, 1, "a")});
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0 + kNsPerMinute, report_));
    EXPECT_EQ(engine.current().start_time_ns, kT0);
    EXPECT_EQ(engine.current().id, "observed-1736935200");
    EXPECT_EQ(session_id_for(kT0), "observed-1736935200");
}

TEST_F(SessionEngineTest, RepeatedPassesAreIdempotent) {
    auto entries = sorted_entries({
        make_entry(kT0, 100, "a"),
        make_entry(kT0 + kNsPerHour, 200, "b"),
        make_entry(kT0 + 7 * kNsPerHour, 300, "c"),
    });
    const int64_t now = kT0 + 8 * kNsPerHour;

    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, now, report_));
    const ObservedSession first = engine.current();
    const std::vector<ObservedSession> first_history = engine.history();

    ASSERT_TRUE(engine.derive(entries, now, report_));
    expect_same_session(engine.current(), first);
    ASSERT_EQ(engine.history().size(), first_history.size());
    for (size_t i = 0; i < first_history.size(); ++i)
        expect_same_session(engine.history()[i], first_history[i]);

    SessionEngine fresh(cfg_, -1);
    ASSERT_TRUE(fresh.derive(entries, now, report_));
    expect_same_session(fresh.current(), first);
}

TEST_F(SessionEngineTest, NewAnchorClosesPreviousSession) {
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(sorted_entries({make_entry(kT0, 1000, "a")}), kT0 + kNsPerHour, report_));
    const std::string first_id = engine.current().id;

    auto later = sorted_entries({make_entry(kT0, 1000, "a"), make_entry(kT0 + 6 * kNsPerHour, 500, "b")});
    ASSERT_TRUE(engine.derive(later, kT0 + 6 * kNsPerHour, report_));

    EXPECT_NE(engine.current().id, first_id);
    EXPECT_EQ(engine.current().tokens_used, 500u);
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(engine.history()[0].id, first_id);
    EXPECT_EQ(engine.history()[0].end_time_ns, kT0 + kSessionWindowNs);
    EXPECT_EQ(engine.history()[0].tokens_used, 1000u);
}

TEST_F(SessionEngineTest, FutureEntriesBeyondSkewAreExcluded) {
    cfg_.clock_skew_sec = 60;
    UsageEntry future = make_entry(kT0 + 2 * kNsPerHour, 1000, "c");   // clock skew
    future.source_file = "/data/proj/late.jsonl";
    future.line_no = 7;
    auto entries = sorted_entries({
        make_entry(kT0, 100, "a"),
        make_entry(kT0 + 30 * kNsPerSecond, 10, "b"),     // within tolerance
        future,
    });
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0, report_));
    EXPECT_EQ(engine.current().tokens_used, 110u);
    EXPECT_EQ(report_.skewed_entries, 1u);
    ASSERT_EQ(report_.skewed.size(), 1u);
    EXPECT_EQ(report_.skewed[0].source_file, "/data/proj/late.jsonl");
    EXPECT_EQ(report_.skewed[0].line_no, 7u);
    EXPECT_EQ(report_.skewed[0].timestamp_ns, kT0 + 2 * kNsPerHour);

    // the record list resets with every pass
    ASSERT_TRUE(engine.derive(entries, kT0 + 3 * kNsPerHour, report_));
    EXPECT_EQ(report_.skewed_entries, 0u);
    EXPECT_TRUE(report_.skewed.empty());
}

TEST_F(SessionEngineTest, SkewedRecordsAreBounded) {
    std::vector<UsageEntry> raw = {make_entry(kT0, 1, "a")};
    for (int i = 0; i < 150; ++i) {
        raw.push_back(make_entry(kT0 + kNsPerHour + i * kNsPerSecond, 1, "f" + std::to_string(i)));
    }
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(sorted_entries(raw), kT0, report_));
    EXPECT_EQ(report_.skewed_entries, 150u);
    ASSERT_EQ(report_.skewed.size(), kMaxSkewedRecords);
    EXPECT_EQ(report_.skewed.front().timestamp_ns, kT0 + kNsPerHour);
}

TEST_F(SessionEngineTest, OnlyFutureEntriesMeansInactive) {
    SessionEngine engine(cfg_, -1);
    EXPECT_FALSE(engine.derive(sorted_entries({make_entry(kT0 + kNsPerHour, 1, "a")}), kT0, report_));
    EXPECT_EQ(report_.skewed_entries, 1u);
}

TEST_F(SessionEngineTest, ActivityFollowsTheClock) {
    auto entries = sorted_entries({make_entry(kT0, 1, "a")});
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0 + 4 * kNsPerHour, report_));
    EXPECT_TRUE(engine.current().is_active);

    engine.refresh(kT0 + kSessionWindowNs - 1);
    EXPECT_TRUE(engine.current().is_active);
    engine.refresh(kT0 + kSessionWindowNs);
    EXPECT_FALSE(engine.current().is_active);

    ASSERT_TRUE(engine.derive(entries, kT0 + kSessionWindowNs + kNsPerSecond, report_));
    EXPECT_FALSE(engine.current().is_active);
    EXPECT_TRUE(engine.history().empty());
}

TEST(PlanDetectionTest, Thresholds) {
    EXPECT_EQ(detect_plan(20001, 1), PlanType::Max20);
    EXPECT_EQ(detect_plan(20000, 1), PlanType::Pro);
    EXPECT_EQ(detect_plan(10001, 1), PlanType::Pro);
    EXPECT_EQ(detect_plan(10000, 21), PlanType::Pro);
    EXPECT_EQ(detect_plan(10000, 20), PlanType::Max5);
    EXPECT_EQ(detect_plan(0, 0), PlanType::Max5);
    EXPECT_EQ(plan_default_limit(PlanType::Pro, 0), 40000u);
    EXPECT_EQ(plan_default_limit(PlanType::Max5, 0), 20000u);
    EXPECT_EQ(plan_default_limit(PlanType::Max20, 0), 100000u);
    EXPECT_EQ(plan_default_limit(PlanType::Custom, 777), 777u);
}

TEST_F(SessionEngineTest, DetectedPlanNeverDowngradesWithinSession) {
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(sorted_entries({make_entry(kT0, 25000, "a")}), kT0 + kNsPerMinute, report_));
    EXPECT_EQ(engine.current().plan_type, PlanType::Max20);
    EXPECT_EQ(engine.current().tokens_limit, 100000u);

    // same window identity, the source shrank
    ASSERT_TRUE(engine.derive(sorted_entries({make_entry(kT0, 5000, "a")}), kT0 + 2 * kNsPerMinute, report_));
    EXPECT_EQ(engine.current().plan_type, PlanType::Max20);
    EXPECT_EQ(engine.current().tokens_limit, 100000u);
    EXPECT_EQ(engine.current().tokens_used, 25000u);
}

TEST_F(SessionEngineTest, ConfiguredPlanOverridesDetection) {
    cfg_.auto_plan = false;
    cfg_.plan_type = PlanType::Custom;
    cfg_.custom_limit = 1234;
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(sorted_entries({make_entry(kT0, 50000, "a")}), kT0 + kNsPerMinute, report_));
    EXPECT_EQ(engine.current().plan_type, PlanType::Custom);
    EXPECT_EQ(engine.current().tokens_limit, 1234u);
}

TEST_F(SessionEngineTest, FirstPassBackfillsEarlierWindows) {
    auto entries = sorted_entries({
        make_entry(kT0, 1, "a"),
        make_entry(kT0 + 6 * kNsPerHour, 2, "b"),
        make_entry(kT0 + 12 * kNsPerHour, 4, "c"),
    });
    const int64_t now = kT0 + 12 * kNsPerHour + kNsPerMinute;
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, now, report_));

    ASSERT_EQ(engine.history().size(), 2u);
    EXPECT_EQ(engine.history()[0].start_time_ns, kT0);
    EXPECT_EQ(engine.history()[1].start_time_ns, kT0 + 6 * kNsPerHour);
    EXPECT_EQ(engine.current().start_time_ns, kT0 + 12 * kNsPerHour);

    ASSERT_TRUE(engine.derive(entries, now, report_));
    EXPECT_EQ(engine.history().size(), 2u);
}

TEST_F(SessionEngineTest, HistoryLimitDropsOldest) {
    cfg_.history_limit = 2;
    std::vector<UsageEntry> v;
    for (int i = 0; i < 4; ++i)
        v.push_back(make_entry(kT0 + i * 6 * kNsPerHour, 1, "m" + std::to_string(i)));
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(sorted_entries(v), kT0 + 18 * kNsPerHour, report_));
    ASSERT_EQ(engine.history().size(), 2u);
    EXPECT_EQ(engine.history()[0].start_time_ns, kT0 + 6 * kNsPerHour);
    EXPECT_EQ(engine.history()[1].start_time_ns, kT0 + 12 * kNsPerHour);
}

TEST_F(SessionEngineTest, SeededOpenSessionIsClosedByLaterWindow) {
    ObservedSession open;
    open.id = session_id_for(kT0);
    open.start_time_ns = kT0;
    open.reset_time_ns = kT0 + kSessionWindowNs;
    open.tokens_used = 500;
    open.tokens_limit = 40000;
    open.is_active = true;

    SessionEngine engine(cfg_, -1);
    engine.seed({}, &open);
    ASSERT_TRUE(engine.hasCurrent());

    const int64_t later = kT0 + 7 * kNsPerHour;
    ASSERT_TRUE(engine.derive(sorted_entries({make_entry(later, 50, "x")}), later + kNsPerMinute, report_));
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(engine.history()[0].id, open.id);
    EXPECT_TRUE(engine.history()[0].has_end_time);
    EXPECT_EQ(engine.history()[0].end_time_ns, open.reset_time_ns);
    EXPECT_EQ(engine.current().start_time_ns, later);
}

TEST_F(SessionEngineTest, SeededHistoryIsNotBackfilledTwice) {
    ObservedSession past;
    past.id = session_id_for(kT0 + 6 * kNsPerHour);
    past.start_time_ns = kT0 + 6 * kNsPerHour;
    past.reset_time_ns = past.start_time_ns + kSessionWindowNs;
    past.end_time_ns = past.reset_time_ns;
    past.has_end_time = true;

    SessionEngine engine(cfg_, -1);
    engine.seed({past}, nullptr);
    auto entries = sorted_entries({
        make_entry(kT0, 1, "a"),
        make_entry(kT0 + 6 * kNsPerHour, 2, "b"),
        make_entry(kT0 + 12 * kNsPerHour, 4, "c"),
    });
    ASSERT_TRUE(engine.derive(entries, kT0 + 12 * kNsPerHour, report_));
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(engine.history()[0].id, past.id);
}

TEST_F(SessionEngineTest, BreakdownPerModelSortedByTokens) {
    auto entries = sorted_entries({
        make_entry(kT0, 10, "a", "", "model-a"),
        make_entry(kT0 + kNsPerSecond, 30, "b", "", "model-b"),
        make_entry(kT0 + 2 * kNsPerSecond, 5, "c", "", "model-a"),
        make_entry(kT0 + 3 * kNsPerSecond, 1, "d", "", ""),
    });
    SessionEngine engine(cfg_, -1);
    ASSERT_TRUE(engine.derive(entries, kT0 + kNsPerMinute, report_));
    const TokenBreakdown& b = engine.current().breakdown;
    const std::vector<std::pair<std::string, uint64_t>> expected = {
        {"model-b", 30}, {"model-a", 15}, {"unknown", 1}};
    EXPECT_EQ(b.model_tokens, expected);
    EXPECT_EQ(b.entry_count, 4u);
    EXPECT_EQ(b.input_tokens, 46u);
    ASSERT_EQ(engine.series().size(), 5u);
    EXPECT_EQ(engine.series().front().timestamp_ns, kT0);
    EXPECT_EQ(engine.series().front().cumulative_tokens, 0u);
    EXPECT_EQ(engine.series().back().cumulative_tokens, 46u);
}

// tokens_used equals the sum over exactly the entries within 5h of the latest one.
TEST_F(SessionEngineTest, WindowSumMatchesBruteForce) {
    std::mt19937 rng(20250115);
    for (int round = 0; round < 200; ++round) {
        const int n = 1 + static_cast<int>(rng() % 60);
        std::vector<UsageEntry> v;
        for (int i = 0; i < n; ++i) {
            const int64_t ts = kT0 + static_cast<int64_t>(rng() % (20 * 3600)) * kNsPerSecond;
            UsageEntry e = make_entry(ts, rng() % 5000, "m" + std::to_string(i));
            e.output_tokens = rng() % 500;
            e.cache_read_tokens = rng() % 100;
            v.push_back(e);
        }
        auto entries = sorted_entries(v);
        const int64_t latest = entries.back().timestamp_ns;
        uint64_t expected = 0;
        int64_t earliest = latest;
        for (const auto& e : entries) {
            if (latest - e.timestamp_ns < kSessionWindowNs) {
                expected += e.total_tokens();
                earliest = std::min(earliest, e.timestamp_ns);
            }
        }

        SessionEngine engine(cfg_, -1);
        DerivationReport report;
        ASSERT_TRUE(engine.derive(entries, latest + kNsPerMinute, report));
        EXPECT_EQ(engine.current().tokens_used, expected) << "round " << round;
        EXPECT_EQ(engine.current().start_time_ns, earliest);
        EXPECT_LT(latest, engine.current().reset_time_ns);

        // every history window ends before the current one starts
        for (const auto& h : engine.history()) {
            EXPECT_LT(h.start_time_ns, engine.current().start_time_ns);
            EXPECT_TRUE(h.has_end_time);
        }
    }
}
