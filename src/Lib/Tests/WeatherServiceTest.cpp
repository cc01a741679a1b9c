// clang-format off
#include "Services/Weather/DataTransferObjects.hpp"
#include "Services/Weather/WeatherUtils.hpp"

#include <Climatime/Services/Weather.hpp>
#include <Climatime/Utils/Error.hpp>
#include <Climatime/Utils/Types.hpp>

#include "gtest/gtest.h"
// clang-format on

using namespace climatime::utils::types;
using namespace climatime::services::weather::utils;
using climatime::services::weather::ARCHIVE_URL;
using climatime::services::weather::CLIMATE_URL;
using climatime::services::weather::DailyRecord;
using climatime::services::weather::Endpoint;
using climatime::services::weather::SeriesQuery;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;

class WeatherServiceTest : public testing::Test {};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(WeatherServiceTest, ArchiveUrl_IncludesEveryMetricAndTimezone) {
  const SeriesQuery query { .coords = { .lat = 40.7128, .lon = -74.006 }, .startDate = "2019-01-01", .endDate = "2019-12-31" };

  const String url = BuildDailySeriesUrl(Endpoint::Archive, ARCHIVE_URL, query);

  EXPECT_EQ(url.rfind("https://archive-api.open-meteo.com/v1/archive?", 0), 0U);
  EXPECT_NE(url.find("latitude=40.7128&longitude=-74.0060"), String::npos);
  EXPECT_NE(url.find("start_date=2019-01-01&end_date=2019-12-31"), String::npos);
  EXPECT_NE(url.find("relative_humidity_2m_mean,wind_speed_10m_mean,surface_pressure_mean"), String::npos);
  EXPECT_NE(url.find("&timezone=auto"), String::npos);
  EXPECT_EQ(url.find("models="), String::npos);
}

TEST_F(WeatherServiceTest, ClimateUrl_NamesTheModel) {
  const SeriesQuery query {
    .coords    = { .lat = 51.5074, .lon = -0.1278 },
    .startDate = "2030-01-01",
    .endDate   = "2039-12-31",
    .model     = "MPI_ESM1_2_HR",
  };

  const String url = BuildDailySeriesUrl(Endpoint::ClimateModel, CLIMATE_URL, query);

  EXPECT_NE(url.find("daily=temperature_2m_max,temperature_2m_min,temperature_2m_mean,precipitation_sum&"), String::npos);
  EXPECT_NE(url.find("&models=MPI_ESM1_2_HR"), String::npos);
  EXPECT_EQ(url.find("humidity"), String::npos);
  EXPECT_EQ(url.find("timezone"), String::npos);
}

TEST_F(WeatherServiceTest, ParseDailySeries_Success) {
  const String json = R"({
    "latitude": 40.71,
    "longitude": -74.0,
    "daily_units": { "temperature_2m_max": "°C" },
    "daily": {
      "time": ["2019-01-01", "2019-01-02"],
      "temperature_2m_max": [5.1, 7.3],
      "temperature_2m_min": [-2.0, 0.4],
      "temperature_2m_mean": [1.5, 3.9],
      "precipitation_sum": [0.0, 12.6],
      "relative_humidity_2m_mean": [71, 88],
      "wind_speed_10m_mean": [14.2, 20.0],
      "surface_pressure_mean": [1016.3, 1002.8]
    }
  })";

  const Result<Vec<DailyRecord>> result = ParseDailySeries(json);

  ASSERT_TRUE(result.has_value()) << result.error().message;
  ASSERT_EQ(result->size(), 2U);

  const DailyRecord& second = (*result)[1];
  EXPECT_EQ(second.date, "2019-01-02");
  EXPECT_EQ(second.temperatureMax, 7.3);
  EXPECT_EQ(second.temperatureMin, 0.4);
  EXPECT_EQ(second.temperatureMean, 3.9);
  EXPECT_EQ(second.precipitation, 12.6);
  EXPECT_EQ(second.humidity, 88.0);
  EXPECT_EQ(second.windSpeed, 20.0);
  EXPECT_EQ(second.pressure, 1002.8);
}

TEST_F(WeatherServiceTest, ParseDailySeries_NullsAndMissingSeriesAreAbsent) {
  const String json = R"({
    "daily": {
      "time": ["2050-06-01", "2050-06-02"],
      "temperature_2m_max": [30.0, null],
      "temperature_2m_min": [18.0, 17.5],
      "temperature_2m_mean": [24.0, 23.0],
      "precipitation_sum": [null, 0.2]
    }
  })";

  const Result<Vec<DailyRecord>> result = ParseDailySeries(json);

  ASSERT_TRUE(result.has_value()) << result.error().message;
  ASSERT_EQ(result->size(), 2U);

  EXPECT_FALSE((*result)[0].precipitation.has_value());
  EXPECT_FALSE((*result)[1].temperatureMax.has_value());
  EXPECT_FALSE((*result)[0].humidity.has_value());
  EXPECT_FALSE((*result)[1].pressure.has_value());
}

TEST_F(WeatherServiceTest, ParseDailySeries_EmptySeries) {
  const Result<Vec<DailyRecord>> result = ParseDailySeries(R"({"daily": {"time": []}})");

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
}

TEST_F(WeatherServiceTest, ParseDailySeries_MissingDailyObject) {
  const Result<Vec<DailyRecord>> result = ParseDailySeries(R"({"latitude": 1.0})");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ParseError);
}

TEST_F(WeatherServiceTest, ParseDailySeries_MissingTime) {
  const Result<Vec<DailyRecord>> result = ParseDailySeries(R"({"daily": {"temperature_2m_max": [1.0]}})");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ParseError);
}

TEST_F(WeatherServiceTest, ParseDailySeries_InvalidJson) {
  const Result<Vec<DailyRecord>> result = ParseDailySeries("{ not json");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ParseError);
}

TEST_F(WeatherServiceTest, ParseDailySeries_LengthMismatchIsCorruptData) {
  const String json = R"({
    "daily": {
      "time": ["2019-01-01", "2019-01-02"],
      "temperature_2m_mean": [1.5]
    }
  })";

  const Result<Vec<DailyRecord>> result = ParseDailySeries(json);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, CorruptedData);
  EXPECT_NE(result.error().message.find("temperature_2m_mean"), String::npos);
}

TEST_F(WeatherServiceTest, UpstreamFailure_RateLimit) {
  const ClimaError error = DescribeUpstreamFailure(429, R"({"error": true, "reason": "Daily API request limit exceeded"})");

  EXPECT_EQ(error.code, ResourceExhausted);
  EXPECT_NE(error.message.find("Daily API request limit exceeded"), String::npos);
}

TEST_F(WeatherServiceTest, UpstreamFailure_BadRequest) {
  const ClimaError error = DescribeUpstreamFailure(400, R"({"error": true, "reason": "Parameter 'start_date' is out of range"})");

  EXPECT_EQ(error.code, InvalidArgument);
  EXPECT_NE(error.message.find("HTTP 400"), String::npos);
}

TEST_F(WeatherServiceTest, UpstreamFailure_ServerErrorWithoutBody) {
  const ClimaError error = DescribeUpstreamFailure(503, "<html>Service Unavailable</html>");

  EXPECT_EQ(error.code, ApiUnavailable);
  EXPECT_NE(error.message.find("no reason given"), String::npos);
}

TEST_F(WeatherServiceTest, ErrorResponseDto_Reads) {
  climatime::services::weather::dto::openmeteo::ErrorResponse body {};

  const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(body, String(R"({"error": true, "reason": "bad"})"));

  ASSERT_FALSE(errc);
  EXPECT_EQ(body.error, true);
  EXPECT_EQ(body.reason, "bad");
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)

fn main(i32 argc, char** argv) -> i32 {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
