#include <algorithm> // std::min

#include "Climatime/Services/Historical.hpp"

#include "Climatime/Utils/Logging.hpp"

using namespace climatime::utils::types;
using climatime::services::weather::Coords;
using climatime::services::weather::DailyRecord;
using climatime::services::weather::SeriesQuery;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;

namespace climatime::services::historical {
  YearFetcher::YearFetcher(const IDailySeriesService& archive, utils::ratelimit::IntervalScheduler& scheduler, const usize maxYearsPerCall)
    : m_archive(archive), m_scheduler(scheduler), m_maxYearsPerCall(maxYearsPerCall == 0 ? 1 : maxYearsPerCall) {}

  fn YearFetcher::fetchOne(const Coords& coords, const i32 year) const -> Result<YearlySummary> {
    // Pace every upstream request, including ones following a failure.
    m_scheduler.acquire();

    const SeriesQuery query {
      .coords    = coords,
      .startDate = std::format("{:04}-01-01", year),
      .endDate   = std::format("{:04}-12-31", year),
    };

    Result<Vec<DailyRecord>> records = m_archive.fetchDaily(query);

    if (!records)
      return Err(records.error());

    if (Option<YearlySummary> summary = AggregateYear(year, *records))
      return *summary;

    ERR_FMT(NotFound, "No valid daily records for {}", year);
  }

  fn YearFetcher::fetchYears(const Coords& coords, const Span<const i32> years) const -> Result<PartialResult<YearlySummary>> {
    if (years.size() > m_maxYearsPerCall)
      ERR_FMT(InvalidArgument, "Too many years requested ({}); at most {} per call", years.size(), m_maxYearsPerCall);

    PartialResult<YearlySummary> result;
    result.items.reserve(years.size());

    for (const i32 year : years) {
      debug_log("Fetching year {} for {:.4f},{:.4f}", year, coords.lat, coords.lon);

      Result<YearlySummary> summary = fetchOne(coords, year);

      if (summary) {
        result.items.push_back(*summary);
        continue;
      }

      warn_log("Skipping year {}: {}", year, summary.error().message);
      result.skipped.push_back({ .id = year, .error = std::move(summary.error()) });
    }

    return result;
  }

  fn YearFetcher::fetchYearsBatched(const Coords& coords, const Span<const i32> years) const -> PartialResult<YearlySummary> {
    PartialResult<YearlySummary> combined;
    combined.items.reserve(years.size());

    for (usize offset = 0; offset < years.size(); offset += m_maxYearsPerCall) {
      const Span<const i32> batch = years.subspan(offset, std::min(m_maxYearsPerCall, years.size() - offset));

      // Batches never exceed the per-call limit.
      Result<PartialResult<YearlySummary>> part = fetchYears(coords, batch);

      if (!part) {
        for (const i32 year : batch)
          combined.skipped.push_back({ .id = year, .error = part.error() });

        continue;
      }

      combined.items.insert(combined.items.end(), part->items.begin(), part->items.end());
      combined.skipped.insert(combined.skipped.end(), part->skipped.begin(), part->skipped.end());
    }

    return combined;
  }
} // namespace climatime::services::historical
