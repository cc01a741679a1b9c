#pragma once

#include <glaze/glaze.hpp>

#include "../Utils/Error.hpp"
#include "../Utils/PartialResult.hpp"
#include "../Utils/RateLimiter.hpp"
#include "../Utils/Types.hpp"
#include "Weather.hpp"

namespace climatime::services::historical {
  namespace {
    using utils::types::f64;
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::PartialResult;
    using utils::types::Result;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::usize;
    using utils::types::Vec;

    using weather::Coords;
    using weather::DailyRecord;
    using weather::IDailySeriesService;
  } // namespace

  inline constexpr i32   EARLIEST_ARCHIVE_YEAR  = 1940;
  inline constexpr usize MAX_YEARS_PER_FETCH    = 10;
  inline constexpr usize MIN_TREND_POINTS       = 10;
  inline constexpr f64   STABLE_SLOPE_THRESHOLD = 0.01;

  /**
   * @struct YearlySummary
   * @brief One calendar year reduced from its valid days.
   */
  struct YearlySummary {
    i32 year               = 0;
    f64 temperatureMaxAvg  = 0.0;
    f64 temperatureMinAvg  = 0.0;
    f64 temperatureMeanAvg = 0.0;
    f64 precipitationTotal = 0.0; ///< Sum over valid days, mm.
    f64 precipitationAvg   = 0.0; ///< Mean daily precipitation, mm.
    f64 humidityAvg        = 0.0;
    f64 windSpeedAvg       = 0.0;
    f64 pressureAvg        = 0.0;
    i32 dataPointsCount    = 0; ///< Number of valid days, always > 0.
  };

  /**
   * @struct DecadalSummary
   * @brief Unweighted mean of the yearly summaries that fall in one decade.
   */
  struct DecadalSummary {
    i32 decadeStart            = 0;
    i32 decadeEnd              = 0;
    f64 temperatureMaxAvg      = 0.0;
    f64 temperatureMinAvg      = 0.0;
    f64 temperatureMeanAvg     = 0.0;
    f64 precipitationTotalAvg  = 0.0;
    f64 precipitationAnnualAvg = 0.0;
    f64 humidityAvg            = 0.0;
    f64 windSpeedAvg           = 0.0;
    f64 pressureAvg            = 0.0;
    i32 yearsCount             = 0;
  };

  enum class TrendDirection : u8 {
    Increasing,
    Decreasing,
    Stable,
  };

  struct TrendResult {
    String         metric;
    i32            periodStart     = 0;
    i32            periodEnd       = 0;
    f64            trendSlope      = 0.0; ///< Units per year.
    TrendDirection trendDirection  = TrendDirection::Stable;
    f64            confidenceLevel = 0.0; ///< R^2 * 100.
    f64            baselineValue   = 0.0; ///< First chronological value.
    f64            currentValue    = 0.0; ///< Last chronological value.
    f64            percentChange   = 0.0;
  };

  struct LinearFit {
    f64 slope     = 0.0;
    f64 intercept = 0.0;
    f64 rSquared  = 0.0;
  };

  struct YearValue {
    i32 year;
    f64 value;
  };

  /**
   * @brief True when mean, max and min temperature are all present.
   */
  fn IsValidDay(const DailyRecord& record) -> bool;

  /**
   * @brief Reduces one year of daily records.
   * @param year The calendar year the records belong to.
   * @param records Daily records, in any order.
   * @return The summary, or None when no day is valid.
   */
  fn AggregateYear(i32 year, Span<const DailyRecord> records) -> Option<YearlySummary>;

  /**
   * @brief Decade key of a year: floor(year / 10) * 10.
   */
  constexpr fn DecadeOf(const i32 year) -> i32 {
    const i32 quotient = year / 10;
    return (year % 10 < 0 ? quotient - 1 : quotient) * 10;
  }

  /**
   * @brief Groups yearly summaries by decade.
   * @return Non-empty decades, ascending by decadeStart.
   */
  fn SummarizeDecades(Span<const YearlySummary> years) -> Vec<DecadalSummary>;

  /**
   * @brief Ordinary least-squares fit of y over x.
   *
   * Degenerate inputs (fewer than two points, or all x equal) yield a zero fit.
   * A constant y series fitted exactly reports R^2 = 1.
   */
  fn FitLinear(Span<const YearValue> points) -> LinearFit;

  /**
   * @brief Trend statistics for one metric.
   * @param metric Name reported in the result.
   * @param series Points in any order; sorted by year before analysis.
   * @return The trend, or None with fewer than MIN_TREND_POINTS points.
   */
  fn AnalyzeTrend(StringView metric, Vec<YearValue> series) -> Option<TrendResult>;

  /**
   * @brief Trend set over a yearly series: `temperature_mean` then `precipitation_annual`.
   *
   * Empty when fewer than MIN_TREND_POINTS summaries are given.
   */
  fn CalculateClimateTrends(Span<const YearlySummary> years) -> Vec<TrendResult>;

  /**
   * @brief Drives the archive client once per year, paced by a shared scheduler.
   *
   * Failed or empty years are logged and reported as skipped; they never fail the
   * whole call.
   */
  class YearFetcher {
   public:
    YearFetcher(const IDailySeriesService& archive, utils::ratelimit::IntervalScheduler& scheduler, usize maxYearsPerCall = MAX_YEARS_PER_FETCH);

    /**
     * @brief Fetches and aggregates up to maxYearsPerCall years.
     * @param coords Location to query.
     * @param years Distinct years, fetched in the given order.
     * @return Summaries in input order plus skipped years, or InvalidArgument when
     *         too many years are requested.
     */
    fn fetchYears(const Coords& coords, Span<const i32> years) const -> Result<PartialResult<YearlySummary>>;

    /**
     * @brief Fetches any number of years in batches of at most maxYearsPerCall.
     */
    fn fetchYearsBatched(const Coords& coords, Span<const i32> years) const -> PartialResult<YearlySummary>;

    [[nodiscard]] fn maxYearsPerCall() const -> usize {
      return m_maxYearsPerCall;
    }

   private:
    fn fetchOne(const Coords& coords, i32 year) const -> Result<YearlySummary>;

    const IDailySeriesService&           m_archive;
    utils::ratelimit::IntervalScheduler& m_scheduler;
    usize                                m_maxYearsPerCall;
  };
} // namespace climatime::services::historical

namespace glz {
  template <>
  struct meta<climatime::services::historical::YearlySummary> {
    using T = climatime::services::historical::YearlySummary;

    // clang-format off
    static constexpr auto value = object(
      "year",               &T::year,
      "temperatureMaxAvg",  &T::temperatureMaxAvg,
      "temperatureMinAvg",  &T::temperatureMinAvg,
      "temperatureMeanAvg", &T::temperatureMeanAvg,
      "precipitationTotal", &T::precipitationTotal,
      "precipitationAvg",   &T::precipitationAvg,
      "humidityAvg",        &T::humidityAvg,
      "windSpeedAvg",       &T::windSpeedAvg,
      "pressureAvg",        &T::pressureAvg,
      "dataPointsCount",    &T::dataPointsCount
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::historical::DecadalSummary> {
    using T = climatime::services::historical::DecadalSummary;

    // clang-format off
    static constexpr auto value = object(
      "decadeStart",            &T::decadeStart,
      "decadeEnd",              &T::decadeEnd,
      "temperatureMaxAvg",      &T::temperatureMaxAvg,
      "temperatureMinAvg",      &T::temperatureMinAvg,
      "temperatureMeanAvg",     &T::temperatureMeanAvg,
      "precipitationTotalAvg",  &T::precipitationTotalAvg,
      "precipitationAnnualAvg", &T::precipitationAnnualAvg,
      "humidityAvg",            &T::humidityAvg,
      "windSpeedAvg",           &T::windSpeedAvg,
      "pressureAvg",            &T::pressureAvg,
      "yearsCount",             &T::yearsCount
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::historical::TrendDirection> {
    using enum climatime::services::historical::TrendDirection;

    static constexpr auto value = enumerate("increasing", Increasing, "decreasing", Decreasing, "stable", Stable);
  };

  template <>
  struct meta<climatime::services::historical::TrendResult> {
    using T = climatime::services::historical::TrendResult;

    // clang-format off
    static constexpr auto value = object(
      "metric",          &T::metric,
      "periodStart",     &T::periodStart,
      "periodEnd",       &T::periodEnd,
      "trendSlope",      &T::trendSlope,
      "trendDirection",  &T::trendDirection,
      "confidenceLevel", &T::confidenceLevel,
      "baselineValue",   &T::baselineValue,
      "currentValue",    &T::currentValue,
      "percentChange",   &T::percentChange
    );
    // clang-format on
  };
} // namespace glz
