#pragma once

#include "Climatime/Services/Weather.hpp"
#include "Climatime/Utils/Error.hpp"
#include "Climatime/Utils/Types.hpp"

namespace climatime::services::weather::utils {
  namespace {
    using climatime::utils::error::ClimaError;
    using climatime::utils::types::i64;
    using climatime::utils::types::Result;
    using climatime::utils::types::String;
    using climatime::utils::types::StringView;
    using climatime::utils::types::Vec;
  } // namespace

  /**
   * @brief Builds the request URL for a daily series.
   * @param endpoint Archive requests add `timezone=auto`; climate-model requests add `models`.
   * @param baseUrl Endpoint root, e.g. ARCHIVE_URL.
   * @param query Location, inclusive date range and optional model.
   * @return The full GET URL with coordinates at four decimals.
   */
  fn BuildDailySeriesUrl(Endpoint endpoint, StringView baseUrl, const SeriesQuery& query) -> String;

  /**
   * @brief Parses an Open-Meteo `daily` payload into one record per date.
   * @param body JSON response body.
   * @return ParseError for invalid JSON or a missing `daily`/`time`, CorruptedData when
   *         a metric array does not line up with `time`.
   */
  fn ParseDailySeries(const String& body) -> Result<Vec<DailyRecord>>;

  /**
   * @brief Error for a non-success HTTP status, using the body's `reason` when present.
   *
   * 429 maps to ResourceExhausted, other 4xx to InvalidArgument, the rest to ApiUnavailable.
   */
  fn DescribeUpstreamFailure(i64 status, const String& body) -> ClimaError;
} // namespace climatime::services::weather::utils
