#include "Climatime/Api/ClimateApi.hpp"

#include <algorithm> // std::ranges::{any_of, find, find_if, sort, transform}
#include <charconv>  // std::from_chars
#include <cmath>     // std::isfinite

#include "Climatime/Utils/Logging.hpp"

using namespace climatime::utils::types;
using climatime::services::historical::DecadalSummary;
using climatime::services::historical::EARLIEST_ARCHIVE_YEAR;
using climatime::services::historical::YearlySummary;
using climatime::services::projections::DataSource;
using climatime::services::projections::PROJECTION_PERIODS;
using climatime::services::projections::ProjectionPeriod;
using climatime::services::projections::Scenario;
using climatime::services::projections::ScenarioProjection;
using climatime::services::projections::ScenarioSet;
using climatime::services::weather::Coords;
using climatime::utils::cache::CachePolicy;
using climatime::utils::cache::LocationKey;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;

namespace climatime::api {
  namespace {
    fn Trim(StringView text) -> StringView {
      while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);

      while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);

      return text;
    }

    fn SplitList(const StringView text, const char delimiter) -> Vec<StringView> {
      Vec<StringView> parts;

      usize begin = 0;

      while (begin <= text.size()) {
        const usize end = std::min(text.find(delimiter, begin), text.size());

        parts.push_back(Trim(text.substr(begin, end - begin)));
        begin = end + 1;
      }

      return parts;
    }

    fn ParseInteger(const StringView text) -> Option<i32> {
      i32 value = 0;

      const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), value);

      if (text.empty() || errc != std::errc {} || ptr != text.data() + text.size())
        return None;

      return value;
    }

    fn JoinYears(const Span<const i32> years, const StringView separator) -> String {
      String joined;

      for (const i32 year : years)
        joined += joined.empty() ? std::format("{}", year) : std::format("{}{}", separator, year);

      return joined;
    }

    // "2000-2009" for a contiguous ascending run, "1990,2000,2010" otherwise.
    fn YearsKeySuffix(const Span<const i32> sortedYears) -> String {
      const bool contiguous = sortedYears.back() - sortedYears.front() + 1 == static_cast<i32>(sortedYears.size());

      if (contiguous)
        return std::format("{}-{}", sortedYears.front(), sortedYears.back());

      return JoinYears(sortedYears, ",");
    }

    fn ToSkippedYears(const Span<const Skipped<i32>> skipped) -> Vec<SkippedYear> {
      Vec<SkippedYear> out;
      out.reserve(skipped.size());

      for (const Skipped<i32>& skip : skipped)
        out.push_back({ .year = skip.id, .reason = skip.error.message });

      return out;
    }

    fn YearsOf(const Span<const YearlySummary> summaries) -> Vec<i32> {
      Vec<i32> years;
      years.reserve(summaries.size());

      for (const YearlySummary& summary : summaries)
        years.push_back(summary.year);

      return years;
    }

    fn FindProjectionPeriod(const ScenarioProjection& projection, const StringView label) -> const ProjectionPeriod* {
      const auto iter = std::ranges::find_if(projection.projectionPeriods, [&](const ProjectionPeriod& period) { return period.period == label; });

      return iter == projection.projectionPeriods.end() ? nullptr : &*iter;
    }
  } // namespace

  fn ValidateCoordinates(const f64 lat, const f64 lon) -> Result<Coords> {
    if (!std::isfinite(lat) || !std::isfinite(lon) || lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0)
      ERR(InvalidArgument, "Invalid coordinates. Latitude must be between -90 and 90, longitude between -180 and 180.");

    return Coords { .lat = lat, .lon = lon };
  }

  fn ParseCoordinate(const StringView text) -> Result<f64> {
    const StringView trimmed = Trim(text);

    f64 value = 0.0;

    const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

    if (trimmed.empty() || errc != std::errc {} || ptr != trimmed.data() + trimmed.size())
      ERR_FMT(InvalidArgument, "Invalid coordinate '{}'", text);

    return value;
  }

  fn ParseYearList(const StringView text) -> Result<Vec<i32>> {
    Vec<i32> years;

    for (const StringView part : SplitList(text, ',')) {
      Option<i32> year = ParseInteger(part);

      if (!year)
        ERR(InvalidArgument, "Invalid years format. Provide comma-separated years like: 2020,2021,2022");

      years.push_back(*year);
    }

    return years;
  }

  fn ParseRange(const StringView text) -> Result<Pair<i32, i32>> {
    const usize colon = text.find(':');

    if (colon == StringView::npos)
      ERR_FMT(InvalidArgument, "Invalid range '{}'. Use START:END, e.g. 1980:2020", text);

    const Option<i32> start = ParseInteger(Trim(text.substr(0, colon)));
    const Option<i32> end   = ParseInteger(Trim(text.substr(colon + 1)));

    if (!start || !end)
      ERR(InvalidArgument, "Invalid year format. Use 4-digit years like: 1980, 2020");

    return Pair<i32, i32> { *start, *end };
  }

  fn ParsePeriodList(const StringView text) -> Vec<String> {
    Vec<String> periods;

    for (const StringView part : SplitList(text, ','))
      if (!part.empty())
        periods.emplace_back(part);

    return periods;
  }

  fn ValidateYearlyYears(const Span<const i32> years, const i32 currentYear) -> Result<Vec<i32>> {
    if (years.empty())
      ERR(InvalidArgument, "Invalid years format. Provide comma-separated years like: 2020,2021,2022");

    Vec<i32> invalid;

    for (const i32 year : years)
      if (year < EARLIEST_ARCHIVE_YEAR || year >= currentYear)
        invalid.push_back(year);

    if (!invalid.empty())
      ERR_FMT(InvalidArgument, "Invalid years: {}. Years must be between {} and {}", JoinYears(invalid, ", "), EARLIEST_ARCHIVE_YEAR, currentYear - 1);

    Vec<i32> distinct(years.begin(), years.end());
    std::ranges::sort(distinct);
    distinct.erase(std::ranges::unique(distinct).begin(), distinct.end());

    if (distinct.size() > MAX_YEARLY_YEARS)
      ERR_FMT(InvalidArgument, "Too many years requested. Maximum {} years per request.", MAX_YEARLY_YEARS);

    return distinct;
  }

  fn DecadeYears(const i32 startDecade, const i32 endDecade, const i32 currentYear) -> Result<Vec<i32>> {
    const i32 start = services::historical::DecadeOf(startDecade);
    const i32 end   = services::historical::DecadeOf(endDecade);

    if (start < EARLIEST_ARCHIVE_YEAR || end >= currentYear)
      ERR_FMT(InvalidArgument, "Decade range must be between {} and {}", EARLIEST_ARCHIVE_YEAR, services::historical::DecadeOf(currentYear) - 10);

    if (start > end)
      ERR(InvalidArgument, "Start decade must not be after end decade");

    Vec<i32> years;

    for (i32 decade = start; decade <= end; decade += 10)
      for (i32 year = decade; year < decade + 10 && year <= currentYear - 1; ++year)
        years.push_back(year);

    if (years.size() > MAX_SPAN_YEARS)
      ERR(InvalidArgument, "Too many years requested. Limit to 5 decades maximum.");

    return years;
  }

  fn TrendYears(const i32 startYear, const i32 endYear, const i32 currentYear) -> Result<Vec<i32>> {
    const i32 lastYear = currentYear - 1;

    if (startYear < EARLIEST_ARCHIVE_YEAR || endYear > lastYear || startYear >= endYear)
      ERR_FMT(InvalidArgument, "Invalid year range. Must be between {} and {}, with startYear < endYear", EARLIEST_ARCHIVE_YEAR, lastYear);

    if (endYear - startYear < MIN_TREND_SPAN)
      ERR(InvalidArgument, "Minimum 10 years required for trend analysis");

    if (static_cast<usize>(endYear - startYear + 1) > MAX_SPAN_YEARS)
      ERR(InvalidArgument, "Too many years requested. Maximum 50 years for trend analysis.");

    Vec<i32> years;
    years.reserve(static_cast<usize>(endYear - startYear + 1));

    for (i32 year = startYear; year <= endYear; ++year)
      years.push_back(year);

    return years;
  }

  fn ValidatePeriods(const Span<const String> periods) -> Result<> {
    String invalid;

    for (const String& period : periods)
      if (!services::projections::FindPeriod(period))
        invalid += invalid.empty() ? period : std::format(", {}", period);

    if (invalid.empty())
      return {};

    String valid;

    for (const auto& range : PROJECTION_PERIODS)
      valid += valid.empty() ? String(range.label) : std::format(", {}", range.label);

    ERR_FMT(InvalidArgument, "Invalid periods: {}. Valid periods: {}", invalid, valid);
  }

  ClimateApi::ClimateApi(utils::cache::CacheManager& cache, const YearFetcher& fetcher, const ProjectionEngine& engine, const utils::clock::IClock& clock, const ApiOptions options)
    : m_cache(cache), m_fetcher(fetcher), m_engine(engine), m_clock(clock), m_options(options) {}

  fn ClimateApi::currentYear() const -> i32 {
    return utils::clock::CurrentYear(m_clock);
  }

  fn ClimateApi::yearly(const YearlyRequest& request) -> Result<YearlyResponse> {
    Result<Coords> coords = ValidateCoordinates(request.latitude, request.longitude);

    if (!coords)
      return Err(coords.error());

    Result<Vec<i32>> years = ValidateYearlyYears(request.years, currentYear());

    if (!years)
      return Err(years.error());

    const String key = LocationKey("historical", coords->lat, coords->lon, YearsKeySuffix(*years));

    if (Option<YearlyResponse> cached = m_cache.get<YearlyResponse>(key)) {
      info_log("Returning cached yearly climate data for {}", key);
      return *std::move(cached);
    }

    PartialResult<YearlySummary> fetched = m_fetcher.fetchYearsBatched(*coords, *years);

    YearlyResponse response {
      .location       = *coords,
      .requestedYears = *years,
      .retrievedYears = YearsOf(fetched.items),
      .yearlyData     = std::move(fetched.items),
      .skippedYears   = ToSkippedYears(fetched.skipped),
    };

    if (!fetched.hasFetchFailures())
      if (Result<> stored = m_cache.set(key, response, CachePolicy::expiresAfter(m_options.yearlyTtl)); !stored)
        warn_at(stored.error());

    return response;
  }

  fn ClimateApi::decades(const RangeRequest& request) -> Result<DecadesResponse> {
    Result<Coords> coords = ValidateCoordinates(request.latitude, request.longitude);

    if (!coords)
      return Err(coords.error());

    Result<Vec<i32>> years = DecadeYears(request.start, request.end, currentYear());

    if (!years)
      return Err(years.error());

    const DecadeRange range { .start = services::historical::DecadeOf(request.start), .end = services::historical::DecadeOf(request.end) };

    const String key = LocationKey("decades", coords->lat, coords->lon, std::format("{}-{}", range.start, range.end));

    if (Option<DecadesResponse> cached = m_cache.get<DecadesResponse>(key)) {
      info_log("Returning cached decadal climate data for {}", key);
      return *std::move(cached);
    }

    const PartialResult<YearlySummary> fetched = m_fetcher.fetchYearsBatched(*coords, *years);

    DecadesResponse response {
      .location         = *coords,
      .requestedDecades = range,
      .decadalData      = services::historical::SummarizeDecades(fetched.items),
      .skippedYears     = ToSkippedYears(fetched.skipped),
    };

    if (!fetched.hasFetchFailures())
      if (Result<> stored = m_cache.set(key, response, CachePolicy::expiresAfter(m_options.yearlyTtl)); !stored)
        warn_at(stored.error());

    return response;
  }

  fn ClimateApi::trends(const RangeRequest& request) -> Result<TrendsResponse> {
    Result<Coords> coords = ValidateCoordinates(request.latitude, request.longitude);

    if (!coords)
      return Err(coords.error());

    Result<Vec<i32>> years = TrendYears(request.start, request.end, currentYear());

    if (!years)
      return Err(years.error());

    const String key = LocationKey("trends", coords->lat, coords->lon, std::format("{}-{}", request.start, request.end));

    if (Option<TrendsResponse> cached = m_cache.get<TrendsResponse>(key)) {
      info_log("Returning cached climate trends for {}", key);
      return *std::move(cached);
    }

    PartialResult<YearlySummary> fetched = m_fetcher.fetchYearsBatched(*coords, *years);

    if (fetched.items.size() < services::historical::MIN_TREND_POINTS)
      warn_log("Only {} usable years for {}; trends need at least {}", fetched.items.size(), key, services::historical::MIN_TREND_POINTS);

    TrendsResponse response {
      .location     = *coords,
      .period       = { .startYear = request.start, .endYear = request.end },
      .dataYears    = YearsOf(fetched.items),
      .trends       = services::historical::CalculateClimateTrends(fetched.items),
      .yearlyData   = std::move(fetched.items),
      .skippedYears = ToSkippedYears(fetched.skipped),
    };

    if (!fetched.hasFetchFailures())
      if (Result<> stored = m_cache.set(key, response, CachePolicy::expiresAfter(m_options.trendsTtl)); !stored)
        warn_at(stored.error());

    return response;
  }

  fn ClimateApi::projections(const ProjectionRequest& request) -> Result<ScenarioProjection> {
    Result<Coords> coords = ValidateCoordinates(request.latitude, request.longitude);

    if (!coords)
      return Err(coords.error());

    const String key = LocationKey("future-projections", coords->lat, coords->lon, services::projections::ScenarioName(request.scenario));

    if (Option<ScenarioProjection> cached = m_cache.get<ScenarioProjection>(key)) {
      info_log("Returning cached future projections for {}", key);
      return *std::move(cached);
    }

    ScenarioProjection projection = m_engine.project(*coords, request.scenario);

    if (projection.metadata.source == DataSource::Real)
      if (Result<> stored = m_cache.set(key, projection, CachePolicy::expiresAfter(m_options.projectionsTtl)); !stored)
        warn_at(stored.error());

    return projection;
  }

  fn ClimateApi::scenarios(const f64 latitude, const f64 longitude) -> Result<ScenarioSet> {
    Result<Coords> coords = ValidateCoordinates(latitude, longitude);

    if (!coords)
      return Err(coords.error());

    const String key = LocationKey("all-scenarios", coords->lat, coords->lon);

    if (Option<ScenarioSet> cached = m_cache.get<ScenarioSet>(key)) {
      info_log("Returning cached scenario comparison for {}", key);
      return *std::move(cached);
    }

    ScenarioSet set = m_engine.compareScenarios(*coords);

    const bool allReal = set.optimistic.metadata.source == DataSource::Real && set.moderate.metadata.source == DataSource::Real &&
      set.pessimistic.metadata.source == DataSource::Real;

    if (allReal)
      if (Result<> stored = m_cache.set(key, set, CachePolicy::expiresAfter(m_options.projectionsTtl)); !stored)
        warn_at(stored.error());

    return set;
  }

  fn ClimateApi::periods(const PeriodsRequest& request) -> Result<PeriodsResponse> {
    Vec<String> requested = request.periods;

    if (requested.empty())
      for (const StringView label : DEFAULT_PERIODS)
        requested.emplace_back(label);

    // Validate everything before the (possibly slow) projection call.
    if (Result<Coords> coords = ValidateCoordinates(request.latitude, request.longitude); !coords)
      return Err(coords.error());

    if (Result<> valid = ValidatePeriods(requested); !valid)
      return Err(valid.error());

    Result<ScenarioProjection> projection = projections({ .latitude = request.latitude, .longitude = request.longitude, .scenario = request.scenario });

    if (!projection)
      return Err(projection.error());

    PeriodsResponse response {
      .location         = projection->location,
      .scenario         = projection->scenario,
      .model            = std::move(projection->model),
      .baseline         = std::move(projection->baseline),
      .metadata         = std::move(projection->metadata),
      .requestedPeriods = requested,
    };

    for (ProjectionPeriod& period : projection->projectionPeriods) {
      response.availablePeriods.push_back(period.period);

      if (std::ranges::find(requested, period.period) != requested.end())
        response.projectionPeriods.push_back(std::move(period));
    }

    return response;
  }

  fn ClimateApi::summary(const f64 latitude, const f64 longitude) -> Result<FutureSummary> {
    Result<ScenarioProjection> projection = projections({ .latitude = latitude, .longitude = longitude, .scenario = Scenario::Moderate });

    if (!projection)
      return Err(projection.error());

    const ProjectionPeriod* thirties = FindProjectionPeriod(*projection, "2030s");
    const ProjectionPeriod* fifties  = FindProjectionPeriod(*projection, "2050s");

    FutureSummary summary {
      .location   = projection->location,
      .keyChanges = {
        .temperature2030s   = thirties ? thirties->changeFromBaseline.temperature : 0.0,
        .temperature2050s   = fifties ? fifties->changeFromBaseline.temperature : 0.0,
        .precipitation2030s = thirties ? thirties->changeFromBaseline.precipitation : 0.0,
        .precipitation2050s = fifties ? fifties->changeFromBaseline.precipitation : 0.0,
      },
      .baseline = projection->baseline,
      .metadata = projection->metadata,
    };

    summary.projectionPeriods.reserve(projection->projectionPeriods.size());

    for (const ProjectionPeriod& period : projection->projectionPeriods)
      summary.projectionPeriods.push_back({
        .period              = period.period,
        .temperatureChange   = period.changeFromBaseline.temperature,
        .precipitationChange = period.changeFromBaseline.precipitation,
        .uncertaintyRange    = {
          .temperature = {
            .low  = period.uncertaintyRange.temperatureLow - period.temperatureMeanAvg,
            .high = period.uncertaintyRange.temperatureHigh - period.temperatureMeanAvg,
          },
        },
      });

    return summary;
  }
} // namespace climatime::api
