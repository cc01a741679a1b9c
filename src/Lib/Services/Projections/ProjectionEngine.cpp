#include <algorithm> // std::{min, ranges::find_if}
#include <chrono>    // std::chrono::{floor, milliseconds}
#include <future>    // std::{async, launch}

#include "Climatime/Services/Projections.hpp"

#include "Climatime/Services/Historical.hpp"
#include "Climatime/Utils/Logging.hpp"

using namespace climatime::utils::types;
using climatime::services::weather::Coords;
using climatime::services::weather::DailyRecord;
using climatime::services::weather::SeriesQuery;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;

namespace climatime::services::projections {
  namespace {
    // clang-format off
    constexpr Array<ScenarioParameters, 3> SCENARIO_PARAMETERS = {{
      { "optimistic",  "CMCC_CM2_VHR4", 0.6, 0.5, 10.0, 16.5, 850.0 },
      { "moderate",    "MPI_ESM1_2_HR", 1.0, 0.8, 15.0, 17.2, 820.0 },
      { "pessimistic", "EC_Earth3P_HR", 1.4, 1.2, 20.0, 18.8, 780.0 },
    }};
    // clang-format on

    constexpr i32 EXTRAPOLATION_BASE_YEAR = 2020;
    constexpr f64 WARMING_PER_DECADE      = 0.8;
    constexpr f64 WETTING_PCT_PER_DECADE  = 5.0;
    constexpr f64 EXTRAPOLATED_SPREAD     = 5.0;

    constexpr i32 SYNTHETIC_BASE_YEAR        = 2025;
    constexpr f64 SYNTHETIC_WARMING_PER_YEAR = 0.06;
    constexpr f64 SYNTHETIC_PRECIP_PER_YEAR  = 0.5;
    constexpr f64 SYNTHETIC_MAX_SPREAD       = 6.0;
    constexpr f64 SYNTHETIC_MIN_SPREAD       = 4.0;
    constexpr f64 SYNTHETIC_BASELINE_TEMP    = 15.2;
    constexpr f64 SYNTHETIC_BASELINE_PRECIP  = 845.0;
    constexpr f64 DAYS_PER_YEAR              = 365.0;

    constexpr StringView REAL_DATA_SOURCE      = "Open-Meteo Climate API (CMIP6)";
    constexpr StringView REAL_CONFIDENCE       = "Medium-High (CMIP6 multi-model ensemble)";
    constexpr StringView SYNTHETIC_DATA_SOURCE = "Mock Climate Projections (Development)";
    constexpr StringView SYNTHETIC_CONFIDENCE  = "Mock Data - For Development Only";

    fn ReduceModelSeries(const PeriodRange& range, const Span<const DailyRecord> records) -> Result<ProjectionPeriod> {
      f64   maxSum = 0.0, minSum = 0.0, meanSum = 0.0, precipSum = 0.0;
      usize validDays = 0;

      for (const DailyRecord& record : records) {
        if (!historical::IsValidDay(record))
          continue;

        ++validDays;

        maxSum += *record.temperatureMax;
        minSum += *record.temperatureMin;
        meanSum += *record.temperatureMean;

        precipSum += record.precipitation.value_or(0.0);
      }

      if (validDays == 0)
        ERR_FMT(NotFound, "No valid model days for {}", range.label);

      const auto days = static_cast<f64>(validDays);

      return ProjectionPeriod {
        .period             = String(range.label),
        .startYear          = range.startYear,
        .endYear            = range.endYear,
        .temperatureMaxAvg  = maxSum / days,
        .temperatureMinAvg  = minSum / days,
        .temperatureMeanAvg = meanSum / days,
        .precipitationTotal = precipSum,
        .precipitationAvg   = precipSum / days,
      };
    }
  } // namespace

  fn GetScenarioParameters(const Scenario scenario) -> const ScenarioParameters& {
    return SCENARIO_PARAMETERS.at(static_cast<usize>(scenario));
  }

  fn ParseScenario(const StringView name) -> Option<Scenario> {
    for (const Scenario scenario : ALL_SCENARIOS)
      if (GetScenarioParameters(scenario).id == name)
        return scenario;

    return None;
  }

  fn ScenarioName(const Scenario scenario) -> StringView {
    return GetScenarioParameters(scenario).id;
  }

  fn FindPeriod(const StringView label) -> Option<PeriodRange> {
    const auto iter = std::ranges::find_if(PROJECTION_PERIODS, [&](const PeriodRange& range) { return range.label == label; });

    if (iter == PROJECTION_PERIODS.end())
      return None;

    return *iter;
  }

  fn CalculateUncertaintyRange(const Scenario scenario, const f64 temperature, const f64 precipitationTotal) -> UncertaintyRange {
    const ScenarioParameters& params = GetScenarioParameters(scenario);

    const f64 precipFraction = params.precipitationUncertaintyPct / 100.0;

    return {
      .temperatureLow    = temperature - params.temperatureUncertainty,
      .temperatureHigh   = temperature + params.temperatureUncertainty,
      .precipitationLow  = precipitationTotal * (1.0 - precipFraction),
      .precipitationHigh = precipitationTotal * (1.0 + precipFraction),
    };
  }

  fn ExtrapolateProjection(const Scenario scenario, const PeriodRange& range) -> ProjectionPeriod {
    const f64 multiplier      = GetScenarioParameters(scenario).warmingMultiplier;
    const f64 decadesFromBase = static_cast<f64>(range.startYear - EXTRAPOLATION_BASE_YEAR) / 10.0;
    const f64 tempIncrease    = decadesFromBase * WARMING_PER_DECADE * multiplier;
    const f64 precipChangePct = decadesFromBase * WETTING_PCT_PER_DECADE * multiplier;
    const f64 temperature     = BASELINE_TEMPERATURE + tempIncrease;
    const f64 precipitation   = BASELINE_PRECIPITATION * (1.0 + (precipChangePct / 100.0));

    return {
      .period             = String(range.label),
      .startYear          = range.startYear,
      .endYear            = range.endYear,
      .temperatureMaxAvg  = temperature + EXTRAPOLATED_SPREAD,
      .temperatureMinAvg  = temperature - EXTRAPOLATED_SPREAD,
      .temperatureMeanAvg = temperature,
      .precipitationTotal = precipitation,
      .precipitationAvg   = precipitation / DAYS_PER_YEAR,
      .changeFromBaseline = { .temperature = tempIncrease, .precipitation = precipChangePct },
      .uncertaintyRange   = CalculateUncertaintyRange(scenario, temperature, precipitation),
    };
  }

  fn SyntheticProjectionPeriod(const Scenario scenario, const PeriodRange& range) -> ProjectionPeriod {
    const ScenarioParameters& params = GetScenarioParameters(scenario);

    const auto yearsFromNow  = static_cast<f64>(range.startYear - SYNTHETIC_BASE_YEAR);
    const f64  tempIncrease  = yearsFromNow * SYNTHETIC_WARMING_PER_YEAR;
    const f64  precipChange  = yearsFromNow * SYNTHETIC_PRECIP_PER_YEAR;
    const f64  temperature   = params.syntheticTemperatureBase + tempIncrease;
    const f64  precipitation = params.syntheticPrecipitationBase + precipChange;

    return {
      .period             = String(range.label),
      .startYear          = range.startYear,
      .endYear            = range.endYear,
      .temperatureMaxAvg  = temperature + SYNTHETIC_MAX_SPREAD,
      .temperatureMinAvg  = temperature - SYNTHETIC_MIN_SPREAD,
      .temperatureMeanAvg = temperature,
      .precipitationTotal = precipitation,
      .precipitationAvg   = precipitation / DAYS_PER_YEAR,
      .changeFromBaseline = {
        .temperature   = tempIncrease,
        .precipitation = precipChange / params.syntheticPrecipitationBase * 100.0,
      },
      .uncertaintyRange = CalculateUncertaintyRange(scenario, temperature, precipitation),
    };
  }

  fn SyntheticScenarioProjection(const Coords& coords, const Scenario scenario, String lastUpdated) -> ScenarioProjection {
    ScenarioProjection projection {
      .location = coords,
      .scenario = scenario,
      .model    = String(GetScenarioParameters(scenario).model),
      .baseline = {
        .period          = String(BASELINE_PERIOD),
        .temperatureMean = SYNTHETIC_BASELINE_TEMP,
        .precipitation   = SYNTHETIC_BASELINE_PRECIP,
      },
      .metadata = {
        .source          = DataSource::Synthetic,
        .dataSource      = String(SYNTHETIC_DATA_SOURCE),
        .lastUpdated     = std::move(lastUpdated),
        .confidenceLevel = String(SYNTHETIC_CONFIDENCE),
      },
    };

    projection.projectionPeriods.reserve(PROJECTION_PERIODS.size());

    for (const PeriodRange& range : PROJECTION_PERIODS)
      projection.projectionPeriods.push_back(SyntheticProjectionPeriod(scenario, range));

    return projection;
  }

  ProjectionEngine::ProjectionEngine(const IDailySeriesService& climateModel, const utils::clock::IClock& clock, const ProjectionOptions options)
    : m_climateModel(climateModel), m_clock(clock), m_options(options) {}

  fn ProjectionEngine::timestamp() const -> String {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(m_clock.now()));
  }

  fn ProjectionEngine::projectPeriod(const Coords& coords, const Scenario scenario, const PeriodRange& range) const -> Result<ProjectionPeriod> {
    if (range.startYear > m_options.coverageEndYear)
      return ExtrapolateProjection(scenario, range);

    const SeriesQuery query {
      .coords    = coords,
      .startDate = std::format("{:04}-01-01", range.startYear),
      .endDate   = std::format("{:04}-12-31", std::min(range.endYear, m_options.coverageEndYear)),
      .model     = String(GetScenarioParameters(scenario).model),
    };

    Result<Vec<DailyRecord>> records = m_climateModel.fetchDaily(query);

    if (!records)
      return Err(records.error());

    Result<ProjectionPeriod> period = ReduceModelSeries(range, *records);

    if (!period)
      return period;

    period->changeFromBaseline = {
      .temperature   = period->temperatureMeanAvg - BASELINE_TEMPERATURE,
      .precipitation = (period->precipitationTotal - BASELINE_PRECIPITATION) / BASELINE_PRECIPITATION * 100.0,
    };
    period->uncertaintyRange = CalculateUncertaintyRange(scenario, period->temperatureMeanAvg, period->precipitationTotal);

    return period;
  }

  fn ProjectionEngine::project(const Coords& coords, const Scenario scenario) const -> ScenarioProjection {
    Vec<Future<Result<ProjectionPeriod>>> pending;
    pending.reserve(PROJECTION_PERIODS.size());

    for (const PeriodRange& range : PROJECTION_PERIODS)
      pending.push_back(std::async(std::launch::async, [this, coords, scenario, range] { return projectPeriod(coords, scenario, range); }));

    Vec<ProjectionPeriod> periods;
    Option<ClimaError>    failure;

    // Join every task before deciding, so none outlives this call.
    for (Future<Result<ProjectionPeriod>>& task : pending) {
      Result<ProjectionPeriod> period = task.get();

      if (!period) {
        if (!failure)
          failure = period.error();

        continue;
      }

      periods.push_back(std::move(*period));
    }

    if (failure) {
      warn_log("Using synthetic {} projection for {:.4f},{:.4f}: {}", ScenarioName(scenario), coords.lat, coords.lon, failure->message);
      return SyntheticScenarioProjection(coords, scenario, timestamp());
    }

    return {
      .location          = coords,
      .scenario          = scenario,
      .model             = String(GetScenarioParameters(scenario).model),
      .projectionPeriods = std::move(periods),
      .baseline          = {
        .period          = String(BASELINE_PERIOD),
        .temperatureMean = BASELINE_TEMPERATURE,
        .precipitation   = BASELINE_PRECIPITATION,
      },
      .metadata = {
        .source          = DataSource::Real,
        .dataSource      = String(REAL_DATA_SOURCE),
        .lastUpdated     = timestamp(),
        .confidenceLevel = String(REAL_CONFIDENCE),
      },
    };
  }

  fn ProjectionEngine::compareScenarios(const Coords& coords) const -> ScenarioSet {
    using enum Scenario;

    Future<ScenarioProjection> optimistic  = std::async(std::launch::async, [this, coords] { return project(coords, Optimistic); });
    Future<ScenarioProjection> moderate    = std::async(std::launch::async, [this, coords] { return project(coords, Moderate); });
    Future<ScenarioProjection> pessimistic = std::async(std::launch::async, [this, coords] { return project(coords, Pessimistic); });

    return {
      .optimistic  = optimistic.get(),
      .moderate    = moderate.get(),
      .pessimistic = pessimistic.get(),
    };
  }
} // namespace climatime::services::projections
