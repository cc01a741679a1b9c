#include <chrono> // std::chrono::{milliseconds, sys_days}

#include <Climatime/Services/Historical.hpp>
#include <Climatime/Utils/Clock.hpp>
#include <Climatime/Utils/Error.hpp>
#include <Climatime/Utils/PartialResult.hpp>
#include <Climatime/Utils/RateLimiter.hpp>
#include <Climatime/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Support/DailySeriesFixtures.hpp"

using namespace testing;
using namespace climatime::utils::types;
using namespace std::chrono_literals;
using climatime::services::historical::YearFetcher;
using climatime::services::historical::YearlySummary;
using climatime::services::weather::Coords;
using climatime::services::weather::DailyRecord;
using climatime::services::weather::SeriesQuery;
using climatime::testing_support::MakeDays;
using climatime::testing_support::MockDailySeriesService;
using climatime::testing_support::ServeSeries;
using climatime::utils::clock::ManualClock;
using climatime::utils::error::ClimaError;
using climatime::utils::ratelimit::IntervalScheduler;
using enum climatime::utils::error::ClimaErrorCode;

namespace {
  constexpr Coords NEW_YORK = { .lat = 40.7128, .lon = -74.0060 };

  fn Warming(const i32 year) -> f64 {
    return 10.0 + (0.05 * (year - 2000));
  }
} // namespace

class IntervalSchedulerTest : public Test {
 protected:
  ManualClock m_clock;
};

TEST_F(IntervalSchedulerTest, FirstGrantIsImmediate) {
  IntervalScheduler scheduler(m_clock, 2000ms);

  const TimePoint start = m_clock.now();
  scheduler.acquire();

  EXPECT_EQ(m_clock.now(), start);
  EXPECT_EQ(scheduler.lastGrant(), start);
}

TEST_F(IntervalSchedulerTest, ConsecutiveGrantsAreSpaced) {
  IntervalScheduler scheduler(m_clock, 2000ms);

  const TimePoint start = m_clock.now();

  scheduler.acquire();
  scheduler.acquire();
  scheduler.acquire();

  EXPECT_EQ(m_clock.now() - start, 4000ms);
}

TEST_F(IntervalSchedulerTest, ElapsedTimeCountsTowardsTheInterval) {
  IntervalScheduler scheduler(m_clock, 2000ms);

  scheduler.acquire();
  m_clock.advance(1500ms);

  const TimePoint before = m_clock.now();
  scheduler.acquire();

  EXPECT_EQ(m_clock.now() - before, 500ms);

  m_clock.advance(5000ms);

  const TimePoint idle = m_clock.now();
  scheduler.acquire();

  EXPECT_EQ(m_clock.now(), idle);
}

TEST_F(IntervalSchedulerTest, NegativeIntervalIsClamped) {
  IntervalScheduler scheduler(m_clock, -5ms);

  EXPECT_EQ(scheduler.interval(), 0ms);
}

class YearFetcherTest : public Test {
 protected:
  YearFetcherTest()
    : m_clock(std::chrono::sys_days { std::chrono::year { 2025 } / 1 / 15 }), m_scheduler(m_clock, 2000ms) {}

  StrictMock<MockDailySeriesService> m_archive;
  ManualClock                        m_clock;
  IntervalScheduler                  m_scheduler;
};

TEST_F(YearFetcherTest, FetchesEachYearAsAFullCalendarYear) {
  EXPECT_CALL(m_archive, fetchDaily(AllOf(Field(&SeriesQuery::startDate, "2019-01-01"), Field(&SeriesQuery::endDate, "2019-12-31"), Field(&SeriesQuery::model, Eq(Option<String>())))))
    .WillOnce(ServeSeries(Warming, 2.0));
  EXPECT_CALL(m_archive, fetchDaily(Field(&SeriesQuery::startDate, "2020-01-01")))
    .WillOnce(ServeSeries(Warming, 2.0));

  const YearFetcher fetcher(m_archive, m_scheduler);

  const Vec<i32>                             years  = { 2019, 2020 };
  const Result<PartialResult<YearlySummary>> result = fetcher.fetchYears(NEW_YORK, years);

  ASSERT_TRUE(result);
  EXPECT_TRUE(result->isComplete());
  ASSERT_EQ(result->items.size(), 2U);
  EXPECT_EQ(result->items[0].year, 2019);
  EXPECT_EQ(result->items[0].dataPointsCount, 365);
  EXPECT_EQ(result->items[1].dataPointsCount, 366);
  EXPECT_NEAR(result->items[1].temperatureMeanAvg, 11.0, 1e-9);
}

TEST_F(YearFetcherTest, RequestsArePacedEvenAfterFailures) {
  Vec<TimePoint> requestTimes;

  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(3)
    .WillRepeatedly([&](const SeriesQuery& query) -> Result<Vec<DailyRecord>> {
      requestTimes.push_back(m_clock.now());

      if (query.startDate == "2001-01-01")
        return Err(ClimaError(NetworkError, "connection reset"));

      return MakeDays(2000, 2000, 12.0, 1.0);
    });

  const YearFetcher fetcher(m_archive, m_scheduler);

  const Vec<i32>                             years  = { 2000, 2001, 2002 };
  const Result<PartialResult<YearlySummary>> result = fetcher.fetchYears(NEW_YORK, years);

  ASSERT_TRUE(result);
  ASSERT_EQ(requestTimes.size(), 3U);
  EXPECT_GE(requestTimes[1] - requestTimes[0], 2000ms);
  EXPECT_GE(requestTimes[2] - requestTimes[1], 2000ms);

  EXPECT_EQ(result->items.size(), 2U);
  ASSERT_EQ(result->skipped.size(), 1U);
  EXPECT_EQ(result->skipped[0].id, 2001);
  EXPECT_EQ(result->skipped[0].error.code, NetworkError);
  EXPECT_TRUE(result->hasFetchFailures());
}

TEST_F(YearFetcherTest, YearWithoutValidDaysIsSkippedAsNotFound) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .WillOnce(Return(Result<Vec<DailyRecord>>(Vec<DailyRecord> { { .date = "1950-01-01", .temperatureMax = None } })));

  const YearFetcher fetcher(m_archive, m_scheduler);

  const Vec<i32>                             years  = { 1950 };
  const Result<PartialResult<YearlySummary>> result = fetcher.fetchYears(NEW_YORK, years);

  ASSERT_TRUE(result);
  EXPECT_TRUE(result->items.empty());
  ASSERT_EQ(result->skipped.size(), 1U);
  EXPECT_EQ(result->skipped[0].error.code, NotFound);
  EXPECT_FALSE(result->hasFetchFailures());
}

TEST_F(YearFetcherTest, RejectsMoreYearsThanThePerCallLimit) {
  EXPECT_CALL(m_archive, fetchDaily(_)).Times(0);

  const YearFetcher fetcher(m_archive, m_scheduler, 3);

  const Vec<i32>                             years  = { 2000, 2001, 2002, 2003 };
  const Result<PartialResult<YearlySummary>> result = fetcher.fetchYears(NEW_YORK, years);

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(YearFetcherTest, BatchedFetchCoversLongRanges) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(7)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const YearFetcher fetcher(m_archive, m_scheduler, 3);

  const Vec<i32>                     years  = { 2000, 2001, 2002, 2003, 2004, 2005, 2006 };
  const PartialResult<YearlySummary> result = fetcher.fetchYearsBatched(NEW_YORK, years);

  EXPECT_TRUE(result.isComplete());
  ASSERT_EQ(result.items.size(), 7U);

  for (usize i = 0; i < years.size(); ++i)
    EXPECT_EQ(result.items[i].year, years[i]);
}

TEST_F(YearFetcherTest, ZeroLimitIsTreatedAsOne) {
  const YearFetcher fetcher(m_archive, m_scheduler, 0);

  EXPECT_EQ(fetcher.maxYearsPerCall(), 1U);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
