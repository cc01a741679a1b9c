#pragma once

#include <glaze/glaze.hpp>

#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Weather.hpp"

namespace climatime::services::projections {
  namespace {
    using utils::types::Array;
    using utils::types::f64;
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Vec;

    using weather::Coords;
    using weather::IDailySeriesService;
  } // namespace

  enum class Scenario : u8 {
    Optimistic,
    Moderate,
    Pessimistic,
  };

  inline constexpr Array<Scenario, 3> ALL_SCENARIOS = { Scenario::Optimistic, Scenario::Moderate, Scenario::Pessimistic };

  /**
   * @brief Whether a projection came from upstream model data or the synthetic generator.
   */
  enum class DataSource : u8 {
    Real,
    Synthetic,
  };

  struct PeriodRange {
    StringView label;
    i32        startYear;
    i32        endYear;
  };

  // clang-format off
  inline constexpr Array<PeriodRange, 4> PROJECTION_PERIODS = {{
    { "2020s", 2020, 2029 },
    { "2030s", 2030, 2039 },
    { "2040s", 2040, 2049 },
    { "2050s", 2050, 2059 },
  }};
  // clang-format on

  inline constexpr i32        DEFAULT_COVERAGE_END_YEAR = 2050;
  inline constexpr StringView BASELINE_PERIOD           = "1990-2020";
  inline constexpr f64        BASELINE_TEMPERATURE      = 15.0;
  inline constexpr f64        BASELINE_PRECIPITATION    = 800.0;

  /**
   * @brief Fixed per-scenario constants: model id, warming multiplier,
   *        uncertainty half-widths and synthetic bases.
   */
  struct ScenarioParameters {
    StringView id;
    StringView model;
    f64        warmingMultiplier;
    f64        temperatureUncertainty;      ///< +/- degrees C.
    f64        precipitationUncertaintyPct; ///< +/- percent of the period total.
    f64        syntheticTemperatureBase;
    f64        syntheticPrecipitationBase;
  };

  struct BaselineChange {
    f64 temperature   = 0.0; ///< Degrees C above the baseline mean.
    f64 precipitation = 0.0; ///< Percent change of the period total against the baseline.
  };

  struct UncertaintyRange {
    f64 temperatureLow    = 0.0;
    f64 temperatureHigh   = 0.0;
    f64 precipitationLow  = 0.0;
    f64 precipitationHigh = 0.0;
  };

  struct ProjectionPeriod {
    String           period;
    i32              startYear          = 0;
    i32              endYear            = 0;
    f64              temperatureMaxAvg  = 0.0;
    f64              temperatureMinAvg  = 0.0;
    f64              temperatureMeanAvg = 0.0;
    f64              precipitationTotal = 0.0; ///< Sum over every valid day of the series.
    f64              precipitationAvg   = 0.0;
    BaselineChange   changeFromBaseline;
    UncertaintyRange uncertaintyRange;
  };

  struct Baseline {
    String period;
    f64    temperatureMean = 0.0;
    f64    precipitation   = 0.0;
  };

  struct ProjectionMetadata {
    DataSource source = DataSource::Real;
    String     dataSource;
    String     lastUpdated; ///< ISO-8601 UTC timestamp.
    String     confidenceLevel;
  };

  struct ScenarioProjection {
    Coords                location;
    Scenario              scenario = Scenario::Moderate;
    String                model;
    Vec<ProjectionPeriod> projectionPeriods;
    Baseline              baseline;
    ProjectionMetadata    metadata;
  };

  struct ScenarioSet {
    ScenarioProjection optimistic;
    ScenarioProjection moderate;
    ScenarioProjection pessimistic;
  };

  fn GetScenarioParameters(Scenario scenario) -> const ScenarioParameters&;

  /**
   * @brief Parses a scenario id ("optimistic", "moderate", "pessimistic").
   */
  fn ParseScenario(StringView name) -> Option<Scenario>;

  fn ScenarioName(Scenario scenario) -> StringView;

  /**
   * @brief Looks up a period by label, e.g. "2030s".
   */
  fn FindPeriod(StringView label) -> Option<PeriodRange>;

  /**
   * @brief Symmetric band around a projected temperature and precipitation total.
   */
  fn CalculateUncertaintyRange(Scenario scenario, f64 temperature, f64 precipitationTotal) -> UncertaintyRange;

  /**
   * @brief Deterministic projection for periods past model coverage.
   *
   * Warms 0.8 C and wets 5 % per decade after 2020, scaled by the scenario multiplier.
   */
  fn ExtrapolateProjection(Scenario scenario, const PeriodRange& range) -> ProjectionPeriod;

  /**
   * @brief Synthetic period used when upstream data cannot be used.
   */
  fn SyntheticProjectionPeriod(Scenario scenario, const PeriodRange& range) -> ProjectionPeriod;

  /**
   * @brief Complete synthetic projection for a location, tagged DataSource::Synthetic.
   */
  fn SyntheticScenarioProjection(const Coords& coords, Scenario scenario, String lastUpdated) -> ScenarioProjection;

  struct ProjectionOptions {
    i32 coverageEndYear = DEFAULT_COVERAGE_END_YEAR; ///< Last year the climate-model endpoint serves.
  };

  /**
   * @brief Builds scenario projections from the climate-model endpoint.
   *
   * Periods are computed concurrently. If any period cannot be computed from
   * upstream data the whole projection is replaced by the synthetic one, so a
   * response never mixes real and synthetic periods.
   */
  class ProjectionEngine {
   public:
    ProjectionEngine(const IDailySeriesService& climateModel, const utils::clock::IClock& clock, ProjectionOptions options = {});

    [[nodiscard]] fn project(const Coords& coords, Scenario scenario) const -> ScenarioProjection;

    /**
     * @brief Projects all three scenarios concurrently.
     */
    [[nodiscard]] fn compareScenarios(const Coords& coords) const -> ScenarioSet;

    /**
     * @brief One period from upstream data, or by extrapolation past coverage.
     */
    [[nodiscard]] fn projectPeriod(const Coords& coords, Scenario scenario, const PeriodRange& range) const -> Result<ProjectionPeriod>;

   private:
    [[nodiscard]] fn timestamp() const -> String;

    const IDailySeriesService&  m_climateModel;
    const utils::clock::IClock& m_clock;
    ProjectionOptions           m_options;
  };
} // namespace climatime::services::projections

namespace glz {
  template <>
  struct meta<climatime::services::projections::Scenario> {
    using enum climatime::services::projections::Scenario;

    static constexpr auto value = enumerate("optimistic", Optimistic, "moderate", Moderate, "pessimistic", Pessimistic);
  };

  template <>
  struct meta<climatime::services::projections::DataSource> {
    using enum climatime::services::projections::DataSource;

    static constexpr auto value = enumerate("real", Real, "synthetic", Synthetic);
  };

  template <>
  struct meta<climatime::services::projections::BaselineChange> {
    using T = climatime::services::projections::BaselineChange;

    static constexpr auto value = object("temperature", &T::temperature, "precipitation", &T::precipitation);
  };

  template <>
  struct meta<climatime::services::projections::UncertaintyRange> {
    using T = climatime::services::projections::UncertaintyRange;

    // clang-format off
    static constexpr auto value = object(
      "temperatureLow",    &T::temperatureLow,
      "temperatureHigh",   &T::temperatureHigh,
      "precipitationLow",  &T::precipitationLow,
      "precipitationHigh", &T::precipitationHigh
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::projections::ProjectionPeriod> {
    using T = climatime::services::projections::ProjectionPeriod;

    // clang-format off
    static constexpr auto value = object(
      "period",             &T::period,
      "startYear",          &T::startYear,
      "endYear",            &T::endYear,
      "temperatureMaxAvg",  &T::temperatureMaxAvg,
      "temperatureMinAvg",  &T::temperatureMinAvg,
      "temperatureMeanAvg", &T::temperatureMeanAvg,
      "precipitationTotal", &T::precipitationTotal,
      "precipitationAvg",   &T::precipitationAvg,
      "changeFromBaseline", &T::changeFromBaseline,
      "uncertaintyRange",   &T::uncertaintyRange
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::projections::Baseline> {
    using T = climatime::services::projections::Baseline;

    static constexpr auto value = object("period", &T::period, "temperatureMean", &T::temperatureMean, "precipitation", &T::precipitation);
  };

  template <>
  struct meta<climatime::services::projections::ProjectionMetadata> {
    using T = climatime::services::projections::ProjectionMetadata;

    // clang-format off
    static constexpr auto value = object(
      "source",          &T::source,
      "dataSource",      &T::dataSource,
      "lastUpdated",     &T::lastUpdated,
      "confidenceLevel", &T::confidenceLevel
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::projections::ScenarioProjection> {
    using T = climatime::services::projections::ScenarioProjection;

    // clang-format off
    static constexpr auto value = object(
      "location",          &T::location,
      "scenario",          &T::scenario,
      "model",             &T::model,
      "projectionPeriods", &T::projectionPeriods,
      "baseline",          &T::baseline,
      "metadata",          &T::metadata
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::projections::ScenarioSet> {
    using T = climatime::services::projections::ScenarioSet;

    static constexpr auto value = object("optimistic", &T::optimistic, "moderate", &T::moderate, "pessimistic", &T::pessimistic);
  };
} // namespace glz
