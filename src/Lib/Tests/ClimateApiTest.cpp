#include <chrono> // std::chrono::{sys_days, year}

#include <Climatime/Api/ClimateApi.hpp>
#include <Climatime/Services/Historical.hpp>
#include <Climatime/Services/Projections.hpp>
#include <Climatime/Utils/CacheManager.hpp>
#include <Climatime/Utils/Clock.hpp>
#include <Climatime/Utils/Error.hpp>
#include <Climatime/Utils/RateLimiter.hpp>
#include <Climatime/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Support/DailySeriesFixtures.hpp"

using namespace testing;
using namespace climatime::utils::types;
using namespace climatime::api;
using namespace std::chrono_literals;
using climatime::services::historical::TrendDirection;
using climatime::services::historical::YearFetcher;
using climatime::services::projections::DataSource;
using climatime::services::projections::ProjectionEngine;
using climatime::services::projections::Scenario;
using climatime::services::projections::ScenarioProjection;
using climatime::services::projections::ScenarioSet;
using climatime::services::weather::DailyRecord;
using climatime::testing_support::MockDailySeriesService;
using climatime::testing_support::ServeSeries;
using climatime::utils::cache::CacheManager;
using climatime::utils::clock::ManualClock;
using climatime::utils::error::ClimaError;
using climatime::utils::error::ClimaErrorCode;
using climatime::utils::ratelimit::IntervalScheduler;
using enum climatime::utils::error::ClimaErrorCode;

namespace {
  constexpr f64 NYC_LAT = 40.7128;
  constexpr f64 NYC_LON = -74.0060;

  fn Warming(const i32 year) -> f64 {
    return 10.0 + (0.05 * (year - 2000));
  }

  fn FlatSixteen(i32) -> f64 {
    return 16.0;
  }

  fn Failure(const ClimaErrorCode code) -> Result<Vec<DailyRecord>> {
    return Err(ClimaError(code, "simulated upstream failure"));
  }
} // namespace

class ClimateApiTest : public Test {
 protected:
  ClimateApiTest()
    : m_clock(std::chrono::sys_days { std::chrono::year { 2025 } / 6 / 1 }),
      m_scheduler(m_clock, 2000ms),
      m_fetcher(m_archive, m_scheduler),
      m_engine(m_climateModel, m_clock),
      m_cache(m_clock),
      m_api(m_cache, m_fetcher, m_engine, m_clock) {}

  NiceMock<MockDailySeriesService> m_archive;
  NiceMock<MockDailySeriesService> m_climateModel;
  ManualClock                      m_clock;
  IntervalScheduler                m_scheduler;
  YearFetcher                      m_fetcher;
  ProjectionEngine                 m_engine;
  CacheManager                     m_cache;
  ClimateApi                       m_api;
};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(ClimateApiTest, RejectsOutOfRangeCoordinates) {
  EXPECT_CALL(m_archive, fetchDaily(_)).Times(0);

  const Result<YearlyResponse> response = m_api.yearly({ .latitude = 91.0, .longitude = 0.0, .years = { 2020 } });

  ASSERT_FALSE(response);
  EXPECT_EQ(response.error().code, InvalidArgument);
  EXPECT_EQ(response.error().message, "Invalid coordinates. Latitude must be between -90 and 90, longitude between -180 and 180.");

  EXPECT_FALSE(m_api.projections({ .latitude = 0.0, .longitude = -180.5 }));
}

TEST_F(ClimateApiTest, Yearly_RejectsTheCurrentYear) {
  const Result<YearlyResponse> response = m_api.yearly({ .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 2019, 2025, 1939 } });

  ASSERT_FALSE(response);
  EXPECT_EQ(response.error().message, "Invalid years: 2025, 1939. Years must be between 1940 and 2024");
}

TEST_F(ClimateApiTest, Yearly_RejectsMoreThanTenYears) {
  Vec<i32> years;

  for (i32 year = 2000; year <= 2010; ++year)
    years.push_back(year);

  const Result<YearlyResponse> response = m_api.yearly({ .latitude = NYC_LAT, .longitude = NYC_LON, .years = years });

  ASSERT_FALSE(response);
  EXPECT_EQ(response.error().message, "Too many years requested. Maximum 10 years per request.");
}

TEST_F(ClimateApiTest, Yearly_DeduplicatesAndCaches) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(2)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const YearlyRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 2020, 2019, 2020 } };

  const Result<YearlyResponse> first = m_api.yearly(request);

  ASSERT_TRUE(first);
  EXPECT_THAT(first->requestedYears, ElementsAre(2019, 2020));
  EXPECT_THAT(first->retrievedYears, ElementsAre(2019, 2020));
  EXPECT_TRUE(first->skippedYears.empty());

  EXPECT_TRUE(m_cache.get<YearlyResponse>("historical:40.71,-74.01:2019-2020").has_value());

  const Result<YearlyResponse> second = m_api.yearly(request);

  ASSERT_TRUE(second);
  ASSERT_EQ(second->yearlyData.size(), 2U);
  EXPECT_DOUBLE_EQ(second->yearlyData[1].temperatureMeanAvg, first->yearlyData[1].temperatureMeanAvg);
}

TEST_F(ClimateApiTest, Yearly_SmallFetchBatchesStillServeTheFullRequest) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(5)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const YearFetcher smallBatches(m_archive, m_scheduler, 3);
  ClimateApi        api(m_cache, smallBatches, m_engine, m_clock);

  const Result<YearlyResponse> response = api.yearly({ .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 2016, 2017, 2018, 2019, 2020 } });

  ASSERT_TRUE(response) << response.error().message;
  EXPECT_THAT(response->retrievedYears, ElementsAre(2016, 2017, 2018, 2019, 2020));
  EXPECT_TRUE(response->skippedYears.empty());
}

TEST_F(ClimateApiTest, Yearly_TransportFailuresAreReportedButNotCached) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(2)
    .WillRepeatedly(Return(Failure(NetworkError)));

  const YearlyRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 2015 } };

  const Result<YearlyResponse> first = m_api.yearly(request);

  ASSERT_TRUE(first);
  EXPECT_TRUE(first->yearlyData.empty());
  ASSERT_EQ(first->skippedYears.size(), 1U);
  EXPECT_EQ(first->skippedYears[0].year, 2015);

  ASSERT_TRUE(m_api.yearly(request));
  EXPECT_EQ(m_cache.size(), 0U);
}

TEST_F(ClimateApiTest, Yearly_YearsWithoutDataAreCached) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(1)
    .WillRepeatedly(Return(Result<Vec<DailyRecord>>(Vec<DailyRecord> {})));

  const YearlyRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 1941 } };

  ASSERT_TRUE(m_api.yearly(request));
  ASSERT_TRUE(m_api.yearly(request));
}

TEST_F(ClimateApiTest, Yearly_CacheExpiresAfterAWeek) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(2)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const YearlyRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .years = { 2010 } };

  ASSERT_TRUE(m_api.yearly(request));
  m_clock.advance(std::chrono::hours(24 * 7));
  ASSERT_TRUE(m_api.yearly(request));
}

TEST_F(ClimateApiTest, Decades_GroupsPartialCurrentDecade) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(15)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const Result<DecadesResponse> response = m_api.decades({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 2013, .end = 2020 });

  ASSERT_TRUE(response);
  EXPECT_EQ(response->requestedDecades.start, 2010);
  EXPECT_EQ(response->requestedDecades.end, 2020);
  ASSERT_EQ(response->decadalData.size(), 2U);
  EXPECT_EQ(response->decadalData[0].decadeStart, 2010);
  EXPECT_EQ(response->decadalData[0].yearsCount, 10);
  EXPECT_EQ(response->decadalData[1].decadeStart, 2020);
  EXPECT_EQ(response->decadalData[1].yearsCount, 5);
  EXPECT_NEAR(response->decadalData[1].temperatureMeanAvg, Warming(2022), 1e-9);
}

TEST_F(ClimateApiTest, Decades_RejectsRangesOutsideTheArchive) {
  EXPECT_CALL(m_archive, fetchDaily(_)).Times(0);

  const Result<DecadesResponse> early = m_api.decades({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 1930, .end = 1950 });

  ASSERT_FALSE(early);
  EXPECT_EQ(early.error().message, "Decade range must be between 1940 and 2010");

  const Result<DecadesResponse> wide = m_api.decades({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 1960, .end = 2010 });

  ASSERT_FALSE(wide);
  EXPECT_EQ(wide.error().message, "Too many years requested. Limit to 5 decades maximum.");
}

TEST_F(ClimateApiTest, Trends_DetectsWarming) {
  EXPECT_CALL(m_archive, fetchDaily(_))
    .Times(21)
    .WillRepeatedly(ServeSeries(Warming, 2.0));

  const Result<TrendsResponse> response = m_api.trends({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 2000, .end = 2020 });

  ASSERT_TRUE(response);
  EXPECT_EQ(response->dataYears.size(), 21U);
  EXPECT_EQ(response->period.startYear, 2000);
  EXPECT_EQ(response->period.endYear, 2020);
  ASSERT_EQ(response->trends.size(), 2U);

  const auto& temperature = response->trends[0];
  EXPECT_EQ(temperature.metric, "temperature_mean");
  EXPECT_EQ(temperature.trendDirection, TrendDirection::Increasing);
  EXPECT_NEAR(temperature.trendSlope, 0.05, 1e-6);
  EXPECT_GT(temperature.confidenceLevel, 99.0);

  EXPECT_TRUE(m_cache.get<TrendsResponse>("trends:40.71,-74.01:2000-2020").has_value());
}

TEST_F(ClimateApiTest, Trends_ValidatesTheSpan) {
  EXPECT_CALL(m_archive, fetchDaily(_)).Times(0);

  const Result<TrendsResponse> shortSpan = m_api.trends({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 2000, .end = 2005 });
  ASSERT_FALSE(shortSpan);
  EXPECT_EQ(shortSpan.error().message, "Minimum 10 years required for trend analysis");

  const Result<TrendsResponse> longSpan = m_api.trends({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 1950, .end = 2024 });
  ASSERT_FALSE(longSpan);
  EXPECT_EQ(longSpan.error().message, "Too many years requested. Maximum 50 years for trend analysis.");

  const Result<TrendsResponse> future = m_api.trends({ .latitude = NYC_LAT, .longitude = NYC_LON, .start = 2000, .end = 2025 });
  ASSERT_FALSE(future);
  EXPECT_EQ(future.error().message, "Invalid year range. Must be between 1940 and 2024, with startYear < endYear");
}

TEST_F(ClimateApiTest, Projections_RealDataIsCached) {
  EXPECT_CALL(m_climateModel, fetchDaily(_))
    .Times(4)
    .WillRepeatedly(ServeSeries(FlatSixteen, 800.0 / 365.0));

  const ProjectionRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .scenario = Scenario::Pessimistic };

  const Result<ScenarioProjection> first = m_api.projections(request);

  ASSERT_TRUE(first);
  EXPECT_EQ(first->metadata.source, DataSource::Real);
  EXPECT_EQ(first->model, "EC_Earth3P_HR");

  const Result<ScenarioProjection> second = m_api.projections(request);

  ASSERT_TRUE(second);
  EXPECT_EQ(second->metadata.lastUpdated, first->metadata.lastUpdated);
  EXPECT_TRUE(m_cache.get<ScenarioProjection>("future-projections:40.71,-74.01:pessimistic").has_value());
}

TEST_F(ClimateApiTest, Projections_SyntheticFallbackIsNotCached) {
  EXPECT_CALL(m_climateModel, fetchDaily(_))
    .Times(8)
    .WillRepeatedly(Return(Failure(ApiUnavailable)));

  const ProjectionRequest request { .latitude = NYC_LAT, .longitude = NYC_LON, .scenario = Scenario::Moderate };

  const Result<ScenarioProjection> first = m_api.projections(request);

  ASSERT_TRUE(first);
  EXPECT_EQ(first->metadata.source, DataSource::Synthetic);

  ASSERT_TRUE(m_api.projections(request));
  EXPECT_EQ(m_cache.size(), 0U);
}

TEST_F(ClimateApiTest, Scenarios_ComparesAndCaches) {
  EXPECT_CALL(m_climateModel, fetchDaily(_))
    .Times(12)
    .WillRepeatedly(ServeSeries(FlatSixteen, 800.0 / 365.0));

  const Result<ScenarioSet> set = m_api.scenarios(NYC_LAT, NYC_LON);

  ASSERT_TRUE(set);
  EXPECT_EQ(set->optimistic.scenario, Scenario::Optimistic);
  EXPECT_EQ(set->moderate.scenario, Scenario::Moderate);
  EXPECT_EQ(set->pessimistic.scenario, Scenario::Pessimistic);

  ASSERT_TRUE(m_api.scenarios(NYC_LAT, NYC_LON));
}

TEST_F(ClimateApiTest, Periods_DefaultsToTheLastThreePeriods) {
  ON_CALL(m_climateModel, fetchDaily(_)).WillByDefault(ServeSeries(FlatSixteen, 800.0 / 365.0));

  const Result<PeriodsResponse> response = m_api.periods({ .latitude = NYC_LAT, .longitude = NYC_LON });

  ASSERT_TRUE(response);
  EXPECT_THAT(response->requestedPeriods, ElementsAre("2030s", "2040s", "2050s"));
  EXPECT_THAT(response->availablePeriods, ElementsAre("2020s", "2030s", "2040s", "2050s"));
  ASSERT_EQ(response->projectionPeriods.size(), 3U);
  EXPECT_EQ(response->projectionPeriods[0].period, "2030s");
}

TEST_F(ClimateApiTest, Periods_RejectsUnknownLabels) {
  EXPECT_CALL(m_climateModel, fetchDaily(_)).Times(0);

  const Result<PeriodsResponse> response = m_api.periods({ .latitude = NYC_LAT, .longitude = NYC_LON, .periods = { "2030s", "2060s" } });

  ASSERT_FALSE(response);
  EXPECT_EQ(response.error().message, "Invalid periods: 2060s. Valid periods: 2020s, 2030s, 2040s, 2050s");
}

TEST_F(ClimateApiTest, Summary_ReportsModerateChanges) {
  ON_CALL(m_climateModel, fetchDaily(_)).WillByDefault(ServeSeries(FlatSixteen, 800.0 / 365.0));

  const Result<FutureSummary> summary = m_api.summary(NYC_LAT, NYC_LON);

  ASSERT_TRUE(summary);
  EXPECT_NEAR(summary->keyChanges.temperature2030s, 1.0, 1e-9);
  EXPECT_NEAR(summary->keyChanges.temperature2050s, 1.0, 1e-9);
  ASSERT_EQ(summary->projectionPeriods.size(), 4U);
  EXPECT_NEAR(summary->projectionPeriods[1].uncertaintyRange.temperature.low, -0.8, 1e-9);
  EXPECT_NEAR(summary->projectionPeriods[1].uncertaintyRange.temperature.high, 0.8, 1e-9);
  EXPECT_EQ(summary->metadata.source, DataSource::Real);
}

class RequestParsingTest : public Test {};

TEST_F(RequestParsingTest, YearList) {
  const Result<Vec<i32>> years = ParseYearList("2019, 2020,2021");

  ASSERT_TRUE(years);
  EXPECT_THAT(*years, ElementsAre(2019, 2020, 2021));

  EXPECT_FALSE(ParseYearList("2019,abc"));
  EXPECT_FALSE(ParseYearList(""));
}

TEST_F(RequestParsingTest, Range) {
  const Result<Pair<i32, i32>> range = ParseRange("1980:2010");

  ASSERT_TRUE(range);
  EXPECT_EQ(range->first, 1980);
  EXPECT_EQ(range->second, 2010);

  EXPECT_FALSE(ParseRange("1980-2010"));
  EXPECT_FALSE(ParseRange("19x0:2010"));
}

TEST_F(RequestParsingTest, Coordinates) {
  const Result<f64> latitude = ParseCoordinate(" 40.7128 ");

  ASSERT_TRUE(latitude);
  EXPECT_DOUBLE_EQ(*latitude, 40.7128);

  EXPECT_FALSE(ParseCoordinate("north"));
  EXPECT_FALSE(ValidateCoordinates(0.0, 181.0));
  EXPECT_TRUE(ValidateCoordinates(-90.0, 180.0));
}

TEST_F(RequestParsingTest, PeriodListSkipsBlanks) {
  EXPECT_THAT(ParsePeriodList("2030s, ,2050s"), ElementsAre("2030s", "2050s"));
}

TEST_F(RequestParsingTest, DecadeYearsStopBeforeTheCurrentYear) {
  const Result<Vec<i32>> years = DecadeYears(2000, 2020, 2023);

  ASSERT_TRUE(years);
  EXPECT_EQ(years->front(), 2000);
  EXPECT_EQ(years->back(), 2022);
  EXPECT_EQ(years->size(), 23U);
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
