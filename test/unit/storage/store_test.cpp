#include <gtest/gtest.h>
#include "telemdb/storage/store.h"

#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace telemdb::storage;
using namespace telemdb::core;

namespace {
constexpr Timestamp kNow = 1700000000000;
}

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(kNow);
        config_.compression_enabled = false;
        store_ = std::make_unique<Store>(config_, clock_);
    }

    size_t SeriesSize(const std::string& measurement, const Tags::Map& tags) {
        auto series = store_->index().find(SeriesKey(measurement, Tags(tags)));
        return series ? series->size() : 0;
    }

    StoreConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<Store> store_;
};

TEST_F(StoreTest, InsertCreatesSeries) {
    EXPECT_TRUE(store_->insert("speed", {{"carId", "1"}}, {{"value", 287.5}}, kNow - 10));

    auto stats = store_->stats();
    EXPECT_EQ(stats.series_count, 1u);
    EXPECT_EQ(stats.total_points, 1u);
    ASSERT_TRUE(stats.oldest_timestamp.has_value());
    EXPECT_EQ(*stats.oldest_timestamp, kNow - 10);
}

TEST_F(StoreTest, TimestampDefaultsToClock) {
    EXPECT_TRUE(store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}}));
    auto selected = store_->select("speed", Tags{});
    ASSERT_EQ(selected.size(), 1u);
    ASSERT_EQ(selected[0].second.size(), 1u);
    EXPECT_EQ(selected[0].second[0]->timestamp(), kNow);
}

TEST_F(StoreTest, KeyDeterminism) {
    Tags::Map first;
    first["carId"] = "1";
    first["session"] = "race";
    Tags::Map second;
    second["session"] = "race";
    second["carId"] = "1";

    EXPECT_TRUE(store_->insert("speed", first, {{"value", 1.0}}, kNow - 2));
    EXPECT_TRUE(store_->insert("speed", second, {{"value", 2.0}}, kNow - 1));

    EXPECT_EQ(store_->stats().series_count, 1u);
    EXPECT_EQ(SeriesSize("speed", first), 2u);
}

TEST_F(StoreTest, RejectsInvalidInput) {
    EXPECT_FALSE(store_->insert("", {{"carId", "1"}}, {{"value", 1.0}}));
    EXPECT_FALSE(store_->insert("speed", {{"", "1"}}, {{"value", 1.0}}));
    EXPECT_FALSE(store_->insert("speed", {{"carId", "1"}}, {{"", 1.0}}));
    EXPECT_FALSE(store_->insert("speed", {{"carId", "1"}},
                                {{"value", std::numeric_limits<double>::quiet_NaN()}}));
    EXPECT_FALSE(store_->insert("speed", {{"carId", "1"}},
                                {{"ok", 1.0}, {"value", std::numeric_limits<double>::infinity()}}));

    // No partial mutation
    EXPECT_EQ(store_->stats().series_count, 0u);
    EXPECT_EQ(store_->stats().total_points, 0u);
}

TEST_F(StoreTest, EmptyFieldsAccepted) {
    EXPECT_TRUE(store_->insert("heartbeat", {{"carId", "1"}}, {}));
    EXPECT_EQ(store_->stats().total_points, 1u);
}

TEST_F(StoreTest, SizeBound) {
    const Tags::Map tags{{"carId", "1"}};
    const int kTotal = 10050;
    for (int i = 0; i < kTotal; ++i) {
        ASSERT_TRUE(store_->insert("speed", tags, {{"value", static_cast<double>(i)}}, kNow - kTotal + i));
    }

    auto selected = store_->select("speed", Tags(tags));
    ASSERT_EQ(selected.size(), 1u);
    const auto& points = selected[0].second;
    ASSERT_EQ(points.size(), 10000u);

    // The 10,000 most recent by insertion order
    EXPECT_DOUBLE_EQ(*points.front()->field("value"), 50.0);
    EXPECT_DOUBLE_EQ(*points.back()->field("value"), 10049.0);
}

TEST_F(StoreTest, InsertEvictsExpiredPointImmediately) {
    EXPECT_TRUE(store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}},
                               kNow - config_.retention_period_ms - 1));
    EXPECT_EQ(SeriesSize("speed", {{"carId", "1"}}), 0u);
}

TEST_F(StoreTest, RetentionBound) {
    const Tags::Map tags{{"carId", "1"}};
    EXPECT_TRUE(store_->insert("speed", tags, {{"value", 1.0}}, kNow - 1000));
    EXPECT_TRUE(store_->insert("speed", tags, {{"value", 2.0}}, kNow));

    // Let the first point age past the window
    clock_->advance(config_.retention_period_ms - 999);

    auto report = store_->cleanup();
    EXPECT_EQ(report.points_removed, 1u);
    EXPECT_EQ(report.series_touched, 1u);

    auto selected = store_->select("speed", Tags(tags));
    ASSERT_EQ(selected[0].second.size(), 1u);
    EXPECT_EQ(selected[0].second[0]->timestamp(), kNow);
}

TEST_F(StoreTest, RetentionEdges) {
    const Tags::Map tags{{"carId", "1"}};
    // Both points are inside the window when inserted
    EXPECT_TRUE(store_->insert("speed", tags, {{"value", 1.0}}, kNow - 5000));
    EXPECT_TRUE(store_->insert("speed", tags, {{"value", 2.0}}, kNow - 3999));

    // Now one sits at now - retention - 1, the other at now - retention + 1000
    clock_->advance(config_.retention_period_ms - 4999);
    store_->cleanup();

    auto selected = store_->select("speed", Tags(tags));
    ASSERT_EQ(selected[0].second.size(), 1u);
    EXPECT_EQ(selected[0].second[0]->timestamp(), kNow - 3999);
}

TEST_F(StoreTest, EmptiedSeriesStaysInIndex) {
    EXPECT_TRUE(store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}}, kNow));
    clock_->advance(config_.retention_period_ms + 1);
    store_->cleanup();

    auto stats = store_->stats();
    EXPECT_EQ(stats.series_count, 1u);
    EXPECT_EQ(stats.total_points, 0u);
    EXPECT_FALSE(stats.oldest_timestamp.has_value());
    EXPECT_EQ(store_->select("speed", Tags{}).size(), 1u);
}

TEST_F(StoreTest, CleanupAppliesLoweredSizeLimit) {
    for (int i = 0; i < 20; ++i) {
        store_->insert("speed", {{"carId", "1"}}, {{"value", static_cast<double>(i)}}, kNow - 100 + i);
    }
    ASSERT_TRUE(store_->set_max_points_per_series(5).ok());

    auto report = store_->cleanup();
    EXPECT_EQ(report.points_removed, 15u);
    EXPECT_EQ(SeriesSize("speed", {{"carId", "1"}}), 5u);
}

TEST_F(StoreTest, Setters) {
    EXPECT_FALSE(store_->set_retention_period(0).ok());
    EXPECT_FALSE(store_->set_retention_period(-5).ok());
    EXPECT_FALSE(store_->set_max_points_per_series(0).ok());

    EXPECT_TRUE(store_->set_retention_period(60000).ok());
    EXPECT_TRUE(store_->set_max_points_per_series(100).ok());
    store_->set_compression_enabled(true);

    auto stats = store_->stats();
    EXPECT_EQ(stats.retention_period_ms, 60000);
    EXPECT_EQ(stats.max_points_per_series, 100u);
    EXPECT_TRUE(stats.compression_enabled);
}

TEST_F(StoreTest, CompressionOnInsert) {
    store_->set_compression_enabled(true);
    for (int i = 0; i < 50; ++i) {
        store_->insert("speed", {{"carId", "1"}}, {{"value", 200.0}}, kNow - 100 + i);
    }
    // Flat data collapses to its endpoints on every compaction pass
    EXPECT_LT(SeriesSize("speed", {{"carId", "1"}}), 10u);
}

TEST_F(StoreTest, CompressionDisabledKeepsEverything) {
    for (int i = 0; i < 50; ++i) {
        store_->insert("speed", {{"carId", "1"}}, {{"value", 200.0}}, kNow - 100 + i);
    }
    EXPECT_EQ(SeriesSize("speed", {{"carId", "1"}}), 50u);
}

TEST_F(StoreTest, ExplicitCompaction) {
    for (int i = 0; i < 12; ++i) {
        store_->insert("speed", {{"carId", "1"}}, {{"value", 200.0}}, kNow - 100 + i);
        store_->insert("speed", {{"carId", "2"}}, {{"value", 100.0 * (i % 2 + 1)}}, kNow - 100 + i);
    }

    EXPECT_EQ(store_->compact(SeriesKey("speed", Tags{{"carId", "1"}})), 10u);
    EXPECT_EQ(store_->compact(SeriesKey("speed", Tags{{"carId", "9"}})), 0u);
    // Alternating values are all significant
    EXPECT_EQ(store_->compact_all(), 0u);
    EXPECT_EQ(SeriesSize("speed", {{"carId", "2"}}), 12u);
}

TEST_F(StoreTest, CompactedPointsAreGone) {
    for (int i = 0; i < 12; ++i) {
        store_->insert("speed", {{"carId", "1"}}, {{"value", 200.0}}, kNow - 100 + i);
    }
    store_->compact_all();

    auto selected = store_->select("speed", Tags{});
    ASSERT_EQ(selected[0].second.size(), 2u);
    EXPECT_EQ(selected[0].second[0]->timestamp(), kNow - 100);
    EXPECT_EQ(selected[0].second[1]->timestamp(), kNow - 89);
}

TEST_F(StoreTest, InsertBatch) {
    std::vector<PointRecord> records = {
        {"speed", {{"carId", "1"}}, {{"value", 1.0}}, kNow - 3},
        {"speed", {{"carId", "2"}}, {{"value", 2.0}}, kNow - 2},
        {"", {{"carId", "3"}}, {{"value", 3.0}}, kNow - 1},
        {"rpm", {}, {{"value", 11000.0}}, std::nullopt},
    };
    EXPECT_EQ(store_->insert_batch(records), 3u);
    EXPECT_EQ(store_->stats().series_count, 3u);
}

TEST_F(StoreTest, SelectMatchesSuperset) {
    store_->insert("speed", {{"carId", "1"}, {"team", "ferrari"}}, {{"value", 1.0}}, kNow);
    store_->insert("speed", {{"carId", "2"}, {"team", "ferrari"}}, {{"value", 2.0}}, kNow);
    store_->insert("speed", {{"carId", "3"}, {"team", "mclaren"}}, {{"value", 3.0}}, kNow);

    EXPECT_EQ(store_->select("speed", Tags{}).size(), 3u);
    EXPECT_EQ(store_->select("speed", Tags{{"team", "ferrari"}}).size(), 2u);
    EXPECT_EQ(store_->select("speed", Tags{{"team", "ferrari"}, {"carId", "2"}}).size(), 1u);
    EXPECT_TRUE(store_->select("nonexistent", Tags{}).empty());
}

TEST_F(StoreTest, StatsAcrossSeries) {
    store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}}, kNow - 500);
    store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}}, kNow - 50);
    store_->insert("speed", {{"carId", "2"}}, {{"value", 1.0}}, kNow - 800);
    // Out of order inside one series
    store_->insert("speed", {{"carId", "2"}}, {{"value", 1.0}}, kNow - 900);

    auto stats = store_->stats();
    EXPECT_EQ(stats.series_count, 2u);
    EXPECT_EQ(stats.total_points, 4u);
    EXPECT_DOUBLE_EQ(stats.average_points_per_series, 2.0);
    EXPECT_EQ(*stats.oldest_timestamp, kNow - 900);
    EXPECT_EQ(*stats.newest_timestamp, kNow - 50);
    EXPECT_EQ(stats.retention_period_ms, config_.retention_period_ms);
    EXPECT_EQ(stats.max_points_per_series, config_.max_points_per_series);
    EXPECT_FALSE(stats.compression_enabled);
}

TEST_F(StoreTest, Clear) {
    store_->insert("speed", {{"carId", "1"}}, {{"value", 1.0}}, kNow);
    store_->clear();
    auto stats = store_->stats();
    EXPECT_EQ(stats.series_count, 0u);
    EXPECT_FALSE(stats.newest_timestamp.has_value());
}

TEST_F(StoreTest, RestoreAppliesRetention) {
    PointList points;
    points.push_back(std::make_shared<const Point>(kNow - config_.retention_period_ms - 1,
                                                   Fields{{"value", 1.0}}, Tags{{"carId", "1"}}));
    points.push_back(std::make_shared<const Point>(kNow - 10, Fields{{"value", 2.0}}, Tags{{"carId", "1"}}));

    EXPECT_EQ(store_->restore(SeriesKey("speed", Tags{{"carId", "1"}}), points), 1u);
    EXPECT_EQ(SeriesSize("speed", {{"carId", "1"}}), 1u);
}

TEST_F(StoreTest, ConcurrentInsertsAndReads) {
    const int kWriters = 4;
    const int kPerWriter = 500;

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([this, w]() {
            for (int i = 0; i < kPerWriter; ++i) {
                store_->insert("speed", {{"carId", std::to_string(w % 2)}},
                               {{"value", static_cast<double>(i % 7) * 10.0}}, kNow - kPerWriter + i);
            }
        });
    }
    threads.emplace_back([this]() {
        for (int i = 0; i < 200; ++i) {
            auto selected = store_->select("speed", Tags{});
            for (const auto& entry : selected) {
                for (const auto& point : entry.second) {
                    ASSERT_TRUE(point != nullptr);
                }
            }
            store_->stats();
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = store_->stats();
    EXPECT_EQ(stats.series_count, 2u);
    EXPECT_EQ(stats.total_points, static_cast<size_t>(kWriters * kPerWriter));
}
