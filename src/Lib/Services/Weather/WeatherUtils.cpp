#include "WeatherUtils.hpp"

#include <format> // std::format

#include "DataTransferObjects.hpp"

using namespace climatime::utils::types;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;

namespace climatime::services::weather::utils {
  namespace {
    // clang-format off
    constexpr StringView ARCHIVE_METRICS = "temperature_2m_max,temperature_2m_min,temperature_2m_mean,precipitation_sum,"
                                           "relative_humidity_2m_mean,wind_speed_10m_mean,surface_pressure_mean";
    constexpr StringView CLIMATE_METRICS = "temperature_2m_max,temperature_2m_min,temperature_2m_mean,precipitation_sum";
    // clang-format on

    fn CheckSeriesLength(const dto::openmeteo::Series& series, const usize expected, const StringView name) -> Result<> {
      if (series && series->size() != expected)
        ERR_FMT(CorruptedData, "Series '{}' has {} values for {} dates", name, series->size(), expected);

      return {};
    }

    fn ValueAt(const dto::openmeteo::Series& series, const usize index) -> Option<f64> {
      return series ? (*series)[index] : None;
    }
  } // namespace

  fn BuildDailySeriesUrl(const Endpoint endpoint, const StringView baseUrl, const SeriesQuery& query) -> String {
    String url = std::format(
      "{}?latitude={:.4f}&longitude={:.4f}&start_date={}&end_date={}&daily={}",
      baseUrl,
      query.coords.lat,
      query.coords.lon,
      query.startDate,
      query.endDate,
      endpoint == Endpoint::Archive ? ARCHIVE_METRICS : CLIMATE_METRICS
    );

    if (endpoint == Endpoint::Archive)
      url += "&timezone=auto";
    else if (query.model)
      url += std::format("&models={}", *query.model);

    return url;
  }

  fn ParseDailySeries(const String& body) -> Result<Vec<DailyRecord>> {
    using glz::error_ctx, glz::read, glz::error_code;

    dto::openmeteo::DailyResponse response {};

    if (error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(response, body); errc.ec != error_code::none)
      ERR_FMT(ParseError, "Failed to parse JSON response: {}", glz::format_error(errc, body));

    if (!response.daily)
      ERR(ParseError, "Response has no 'daily' object");

    const dto::openmeteo::Daily& daily = *response.daily;

    if (!daily.time)
      ERR(ParseError, "Response has no 'daily.time' series");

    const usize count = daily.time->size();

    // clang-format off
    const Array<Pair<const dto::openmeteo::Series*, StringView>, 7> metrics = {{
      { &daily.temperatureMax,  "temperature_2m_max" },
      { &daily.temperatureMin,  "temperature_2m_min" },
      { &daily.temperatureMean, "temperature_2m_mean" },
      { &daily.precipitation,   "precipitation_sum" },
      { &daily.humidity,        "relative_humidity_2m_mean" },
      { &daily.windSpeed,       "wind_speed_10m_mean" },
      { &daily.pressure,        "surface_pressure_mean" },
    }};
    // clang-format on

    for (const auto& [series, name] : metrics)
      if (Result res = CheckSeriesLength(*series, count, name); !res)
        return Err(res.error());

    Vec<DailyRecord> records;
    records.reserve(count);

    for (usize i = 0; i < count; ++i)
      records.push_back({
        .date            = (*daily.time)[i],
        .temperatureMax  = ValueAt(daily.temperatureMax, i),
        .temperatureMin  = ValueAt(daily.temperatureMin, i),
        .temperatureMean = ValueAt(daily.temperatureMean, i),
        .precipitation   = ValueAt(daily.precipitation, i),
        .humidity        = ValueAt(daily.humidity, i),
        .windSpeed       = ValueAt(daily.windSpeed, i),
        .pressure        = ValueAt(daily.pressure, i),
      });

    return records;
  }

  fn DescribeUpstreamFailure(const i64 status, const String& body) -> ClimaError {
    dto::openmeteo::ErrorResponse errorBody {};

    String reason = "no reason given";

    if (!glz::read<glz::opts { .error_on_unknown_keys = false }>(errorBody, body) && errorBody.reason)
      reason = *errorBody.reason;

    if (status == 429)
      return { ResourceExhausted, std::format("Upstream rate limit hit (HTTP 429): {}", reason) };

    if (status >= 400 && status < 500)
      return { InvalidArgument, std::format("Upstream rejected request (HTTP {}): {}", status, reason) };

    return { ApiUnavailable, std::format("Upstream unavailable (HTTP {}): {}", status, reason) };
  }
} // namespace climatime::services::weather::utils
