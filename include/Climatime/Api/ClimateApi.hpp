/**
 * @file ClimateApi.hpp
 * @brief Request validation, caching and response shaping for every climate query.
 *
 * The facade is the only layer that knows about cache keys and caller-facing
 * limits; the services below it assume validated input.
 */

#pragma once

#include <glaze/glaze.hpp>

#include "../Services/Historical.hpp"
#include "../Services/Projections.hpp"
#include "../Services/Weather.hpp"
#include "../Utils/CacheManager.hpp"
#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace climatime::api {
  namespace {
    using utils::types::Array;
    using utils::types::Duration;
    using utils::types::f64;
    using utils::types::i32;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;

    using services::historical::DecadalSummary;
    using services::historical::TrendResult;
    using services::historical::YearFetcher;
    using services::historical::YearlySummary;
    using services::projections::Baseline;
    using services::projections::ProjectionEngine;
    using services::projections::ProjectionMetadata;
    using services::projections::ProjectionPeriod;
    using services::projections::Scenario;
    using services::projections::ScenarioProjection;
    using services::projections::ScenarioSet;
    using services::weather::Coords;
  } // namespace

  inline constexpr usize MAX_YEARLY_YEARS = 10;
  inline constexpr usize MAX_SPAN_YEARS   = 50;
  inline constexpr i32   MIN_TREND_SPAN   = 10;

  // clang-format off
  inline constexpr Array<StringView, 3> DEFAULT_PERIODS = { "2030s", "2040s", "2050s" };
  // clang-format on

  /**
   * @brief Checks a latitude/longitude pair.
   * @return The coordinates, or InvalidArgument when out of range or not finite.
   */
  fn ValidateCoordinates(f64 lat, f64 lon) -> Result<Coords>;

  /**
   * @brief Parses a decimal coordinate, e.g. "40.7128".
   */
  fn ParseCoordinate(StringView text) -> Result<f64>;

  /**
   * @brief Parses "2019,2020, 2021" into years, in the given order.
   */
  fn ParseYearList(StringView text) -> Result<Vec<i32>>;

  /**
   * @brief Parses "START:END" into a pair of years.
   */
  fn ParseRange(StringView text) -> Result<Pair<i32, i32>>;

  /**
   * @brief Splits a comma list of period labels, trimming blanks.
   */
  fn ParsePeriodList(StringView text) -> Vec<String>;

  /**
   * @brief Validates a yearly request's years against [1940, currentYear - 1].
   * @return The distinct years sorted ascending.
   */
  fn ValidateYearlyYears(Span<const i32> years, i32 currentYear) -> Result<Vec<i32>>;

  /**
   * @brief Expands a decade range into the years it covers.
   *
   * Bounds are normalized to the start of their decade. Years stop at
   * currentYear - 1, and at most MAX_SPAN_YEARS are allowed.
   */
  fn DecadeYears(i32 startDecade, i32 endDecade, i32 currentYear) -> Result<Vec<i32>>;

  /**
   * @brief Expands an inclusive trend range after checking its span.
   */
  fn TrendYears(i32 startYear, i32 endYear, i32 currentYear) -> Result<Vec<i32>>;

  /**
   * @brief Rejects labels outside the four projection periods.
   */
  fn ValidatePeriods(Span<const String> periods) -> Result<>;

  struct YearlyRequest {
    f64      latitude  = 0.0;
    f64      longitude = 0.0;
    Vec<i32> years;
  };

  struct RangeRequest {
    f64 latitude  = 0.0;
    f64 longitude = 0.0;
    i32 start     = 0;
    i32 end       = 0;
  };

  struct ProjectionRequest {
    f64      latitude  = 0.0;
    f64      longitude = 0.0;
    Scenario scenario  = Scenario::Moderate;
  };

  struct PeriodsRequest {
    f64         latitude  = 0.0;
    f64         longitude = 0.0;
    Scenario    scenario  = Scenario::Moderate;
    Vec<String> periods; ///< Empty selects DEFAULT_PERIODS.
  };

  struct SkippedYear {
    i32    year = 0;
    String reason;
  };

  struct YearlyResponse {
    Coords             location;
    Vec<i32>           requestedYears;
    Vec<i32>           retrievedYears;
    Vec<YearlySummary> yearlyData;
    Vec<SkippedYear>   skippedYears;
  };

  struct DecadeRange {
    i32 start = 0;
    i32 end   = 0;
  };

  struct DecadesResponse {
    Coords              location;
    DecadeRange         requestedDecades;
    Vec<DecadalSummary> decadalData;
    Vec<SkippedYear>    skippedYears;
  };

  struct TrendPeriod {
    i32 startYear = 0;
    i32 endYear   = 0;
  };

  struct TrendsResponse {
    Coords             location;
    TrendPeriod        period;
    Vec<i32>           dataYears;
    Vec<TrendResult>   trends;
    Vec<YearlySummary> yearlyData;
    Vec<SkippedYear>   skippedYears;
  };

  struct PeriodsResponse {
    Coords                location;
    Scenario              scenario = Scenario::Moderate;
    String                model;
    Vec<ProjectionPeriod> projectionPeriods;
    Baseline              baseline;
    ProjectionMetadata    metadata;
    Vec<String>           requestedPeriods;
    Vec<String>           availablePeriods;
  };

  struct KeyChanges {
    f64 temperature2030s   = 0.0;
    f64 temperature2050s   = 0.0;
    f64 precipitation2030s = 0.0;
    f64 precipitation2050s = 0.0;
  };

  struct TemperatureBand {
    f64 low  = 0.0; ///< Offset from the period mean.
    f64 high = 0.0; ///< Offset from the period mean.
  };

  struct SummaryUncertainty {
    TemperatureBand temperature;
  };

  struct PeriodSummary {
    String             period;
    f64                temperatureChange   = 0.0;
    f64                precipitationChange = 0.0;
    SummaryUncertainty uncertaintyRange;
  };

  struct FutureSummary {
    Coords             location;
    KeyChanges         keyChanges;
    Vec<PeriodSummary> projectionPeriods;
    Baseline           baseline;
    ProjectionMetadata metadata;
  };

  struct ApiOptions {
    Duration yearlyTtl      = utils::cache::HISTORICAL_YEARLY_TTL;
    Duration trendsTtl      = utils::cache::CLIMATE_TRENDS_TTL;
    Duration projectionsTtl = utils::cache::PROJECTIONS_TTL;
  };

  /**
   * @brief Entry point for every query the tool answers.
   *
   * Each operation validates its input, consults the cache, runs the service and
   * stores the result. Historical results with transport failures and projections
   * that fell back to synthetic data are returned but not cached.
   */
  class ClimateApi {
   public:
    ClimateApi(utils::cache::CacheManager& cache, const YearFetcher& fetcher, const ProjectionEngine& engine, const utils::clock::IClock& clock, ApiOptions options = {});

    fn yearly(const YearlyRequest& request) -> Result<YearlyResponse>;

    fn decades(const RangeRequest& request) -> Result<DecadesResponse>;

    fn trends(const RangeRequest& request) -> Result<TrendsResponse>;

    fn projections(const ProjectionRequest& request) -> Result<ScenarioProjection>;

    fn scenarios(f64 latitude, f64 longitude) -> Result<ScenarioSet>;

    /**
     * @brief Projection restricted to the requested periods.
     */
    fn periods(const PeriodsRequest& request) -> Result<PeriodsResponse>;

    /**
     * @brief Condensed moderate-scenario outlook.
     */
    fn summary(f64 latitude, f64 longitude) -> Result<FutureSummary>;

   private:
    [[nodiscard]] fn currentYear() const -> i32;

    utils::cache::CacheManager& m_cache;
    const YearFetcher&          m_fetcher;
    const ProjectionEngine&     m_engine;
    const utils::clock::IClock& m_clock;
    ApiOptions                  m_options;
  };
} // namespace climatime::api

namespace glz {
  template <>
  struct meta<climatime::api::SkippedYear> {
    using T = climatime::api::SkippedYear;

    static constexpr auto value = object("year", &T::year, "reason", &T::reason);
  };

  template <>
  struct meta<climatime::api::YearlyResponse> {
    using T = climatime::api::YearlyResponse;

    // clang-format off
    static constexpr auto value = object(
      "location",       &T::location,
      "requestedYears", &T::requestedYears,
      "retrievedYears", &T::retrievedYears,
      "yearlyData",     &T::yearlyData,
      "skippedYears",   &T::skippedYears
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::DecadeRange> {
    using T = climatime::api::DecadeRange;

    static constexpr auto value = object("start", &T::start, "end", &T::end);
  };

  template <>
  struct meta<climatime::api::DecadesResponse> {
    using T = climatime::api::DecadesResponse;

    // clang-format off
    static constexpr auto value = object(
      "location",         &T::location,
      "requestedDecades", &T::requestedDecades,
      "decadalData",      &T::decadalData,
      "skippedYears",     &T::skippedYears
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::TrendPeriod> {
    using T = climatime::api::TrendPeriod;

    static constexpr auto value = object("startYear", &T::startYear, "endYear", &T::endYear);
  };

  template <>
  struct meta<climatime::api::TrendsResponse> {
    using T = climatime::api::TrendsResponse;

    // clang-format off
    static constexpr auto value = object(
      "location",     &T::location,
      "period",       &T::period,
      "dataYears",    &T::dataYears,
      "trends",       &T::trends,
      "yearlyData",   &T::yearlyData,
      "skippedYears", &T::skippedYears
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::PeriodsResponse> {
    using T = climatime::api::PeriodsResponse;

    // clang-format off
    static constexpr auto value = object(
      "location",          &T::location,
      "scenario",          &T::scenario,
      "model",             &T::model,
      "projectionPeriods", &T::projectionPeriods,
      "baseline",          &T::baseline,
      "metadata",          &T::metadata,
      "requestedPeriods",  &T::requestedPeriods,
      "availablePeriods",  &T::availablePeriods
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::KeyChanges> {
    using T = climatime::api::KeyChanges;

    // clang-format off
    static constexpr auto value = object(
      "temperature2030s",   &T::temperature2030s,
      "temperature2050s",   &T::temperature2050s,
      "precipitation2030s", &T::precipitation2030s,
      "precipitation2050s", &T::precipitation2050s
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::TemperatureBand> {
    using T = climatime::api::TemperatureBand;

    static constexpr auto value = object("low", &T::low, "high", &T::high);
  };

  template <>
  struct meta<climatime::api::SummaryUncertainty> {
    using T = climatime::api::SummaryUncertainty;

    static constexpr auto value = object("temperature", &T::temperature);
  };

  template <>
  struct meta<climatime::api::PeriodSummary> {
    using T = climatime::api::PeriodSummary;

    // clang-format off
    static constexpr auto value = object(
      "period",              &T::period,
      "temperatureChange",   &T::temperatureChange,
      "precipitationChange", &T::precipitationChange,
      "uncertaintyRange",    &T::uncertaintyRange
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::api::FutureSummary> {
    using T = climatime::api::FutureSummary;

    // clang-format off
    static constexpr auto value = object(
      "location",          &T::location,
      "keyChanges",        &T::keyChanges,
      "projectionPeriods", &T::projectionPeriods,
      "baseline",          &T::baseline,
      "metadata",          &T::metadata
    );
    // clang-format on
  };
} // namespace glz
