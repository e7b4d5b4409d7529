#include <gtest/gtest.h>
#include "telemdb/storage/index.h"

#include <set>
#include <thread>
#include <vector>

using namespace telemdb::storage;
using namespace telemdb::core;

class SeriesIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        speed_1_ = index_.get_or_create(SeriesKey("speed", Tags{{"carId", "1"}, {"team", "ferrari"}}));
        speed_2_ = index_.get_or_create(SeriesKey("speed", Tags{{"carId", "2"}, {"team", "ferrari"}}));
        speed_3_ = index_.get_or_create(SeriesKey("speed", Tags{{"carId", "3"}, {"team", "mclaren"}}));
        position_1_ = index_.get_or_create(SeriesKey("position", Tags{{"carId", "1"}}));
    }

    static std::set<std::string> Keys(const std::vector<std::shared_ptr<Series>>& series) {
        std::set<std::string> keys;
        for (const auto& s : series) {
            keys.insert(s->key().to_string());
        }
        return keys;
    }

    SeriesIndex index_;
    std::shared_ptr<Series> speed_1_;
    std::shared_ptr<Series> speed_2_;
    std::shared_ptr<Series> speed_3_;
    std::shared_ptr<Series> position_1_;
};

TEST_F(SeriesIndexTest, GetOrCreateReturnsSameSeries) {
    auto again = index_.get_or_create(SeriesKey("speed", Tags{{"team", "ferrari"}, {"carId", "1"}}));
    EXPECT_EQ(again, speed_1_);
    EXPECT_EQ(again->id(), speed_1_->id());
    EXPECT_EQ(index_.num_series(), 4u);
}

TEST_F(SeriesIndexTest, DistinctIds) {
    std::set<SeriesID> ids = {speed_1_->id(), speed_2_->id(), speed_3_->id(), position_1_->id()};
    EXPECT_EQ(ids.size(), 4u);
}

TEST_F(SeriesIndexTest, Find) {
    EXPECT_EQ(index_.find(SeriesKey("position", Tags{{"carId", "1"}})), position_1_);
    EXPECT_EQ(index_.find(SeriesKey("position", Tags{{"carId", "9"}})), nullptr);
}

TEST_F(SeriesIndexTest, FindByMeasurementOnly) {
    auto result = index_.find_series("speed", Tags{});
    ASSERT_EQ(result.size(), 3u);
    // Creation order
    EXPECT_EQ(result[0], speed_1_);
    EXPECT_EQ(result[1], speed_2_);
    EXPECT_EQ(result[2], speed_3_);
}

TEST_F(SeriesIndexTest, FindWithTagSubset) {
    auto ferrari = index_.find_series("speed", Tags{{"team", "ferrari"}});
    EXPECT_EQ(Keys(ferrari), (std::set<std::string>{
        "speed,carId=1,team=ferrari", "speed,carId=2,team=ferrari"}));

    auto car_1 = index_.find_series("speed", Tags{{"carId", "1"}, {"team", "ferrari"}});
    ASSERT_EQ(car_1.size(), 1u);
    EXPECT_EQ(car_1[0], speed_1_);
}

TEST_F(SeriesIndexTest, FindNoMatch) {
    EXPECT_TRUE(index_.find_series("speed", Tags{{"team", "williams"}}).empty());
    EXPECT_TRUE(index_.find_series("speed", Tags{{"carId", "1"}, {"team", "mclaren"}}).empty());
    EXPECT_TRUE(index_.find_series("nonexistent", Tags{}).empty());
}

TEST_F(SeriesIndexTest, MeasurementMatchIsExact) {
    EXPECT_TRUE(index_.find_series("spe", Tags{}).empty());
    EXPECT_TRUE(index_.find_series("speedy", Tags{}).empty());
}

TEST_F(SeriesIndexTest, TagFilterDoesNotCrossMeasurements) {
    auto result = index_.find_series("position", Tags{{"carId", "1"}});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], position_1_);
}

TEST_F(SeriesIndexTest, AllSeries) {
    EXPECT_EQ(index_.all_series().size(), 4u);
}

TEST_F(SeriesIndexTest, PostingLists) {
    // speed, position, carId=1..3, team=ferrari, team=mclaren
    EXPECT_EQ(index_.num_posting_lists(), 7u);
}

TEST_F(SeriesIndexTest, Clear) {
    index_.clear();
    EXPECT_EQ(index_.num_series(), 0u);
    EXPECT_EQ(index_.num_posting_lists(), 0u);
    EXPECT_TRUE(index_.find_series("speed", Tags{}).empty());

    auto recreated = index_.get_or_create(SeriesKey("speed", Tags{{"carId", "1"}, {"team", "ferrari"}}));
    EXPECT_NE(recreated, speed_1_);
}

TEST_F(SeriesIndexTest, Metrics) {
    auto& metrics = index_.get_metrics();
    EXPECT_EQ(metrics.add_count.load(), 4u);

    index_.find_series("speed", Tags{{"team", "ferrari"}});
    EXPECT_EQ(metrics.lookup_count.load(), 1u);
    EXPECT_GE(metrics.intersect_count.load(), 1u);
}

TEST(SeriesIndexConcurrencyTest, ConcurrentGetOrCreate) {
    SeriesIndex index;
    const int kThreads = 8;
    const int kCars = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&index]() {
            for (int car = 0; car < kCars; ++car) {
                index.get_or_create(SeriesKey("speed", Tags{{"carId", std::to_string(car)}}));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(index.num_series(), static_cast<size_t>(kCars));
    EXPECT_EQ(index.find_series("speed", Tags{}).size(), static_cast<size_t>(kCars));
}
