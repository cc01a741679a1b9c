#include <algorithm> // std::ranges::sort
#include <cmath>     // std::abs

#include "Climatime/Services/Historical.hpp"

using namespace climatime::utils::types;

namespace climatime::services::historical {
  fn FitLinear(const Span<const YearValue> points) -> LinearFit {
    if (points.size() < 2)
      return {};

    const auto count = static_cast<f64>(points.size());

    f64 sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumXX = 0.0;

    for (const auto& [year, value] : points) {
      const auto xVal = static_cast<f64>(year);

      sumX += xVal;
      sumY += value;
      sumXY += xVal * value;
      sumXX += xVal * xVal;
    }

    const f64 denominator = (count * sumXX) - (sumX * sumX);

    if (denominator == 0.0)
      return {};

    const f64 slope     = ((count * sumXY) - (sumX * sumY)) / denominator;
    const f64 intercept = (sumY - (slope * sumX)) / count;
    const f64 meanY     = sumY / count;

    f64 totalSquares = 0.0, residualSquares = 0.0;

    for (const auto& [year, value] : points) {
      const f64 predicted = (slope * static_cast<f64>(year)) + intercept;

      totalSquares += (value - meanY) * (value - meanY);
      residualSquares += (value - predicted) * (value - predicted);
    }

    // A flat series is fitted exactly.
    const f64 rSquared = totalSquares == 0.0 ? 1.0 : 1.0 - (residualSquares / totalSquares);

    return { .slope = slope, .intercept = intercept, .rSquared = rSquared };
  }

  fn AnalyzeTrend(const StringView metric, Vec<YearValue> series) -> Option<TrendResult> {
    if (series.size() < MIN_TREND_POINTS)
      return None;

    std::ranges::sort(series, {}, &YearValue::year);

    const LinearFit fit = FitLinear(series);

    const YearValue& first = series.front();
    const YearValue& last  = series.back();

    TrendDirection direction = TrendDirection::Stable;

    if (std::abs(fit.slope) >= STABLE_SLOPE_THRESHOLD)
      direction = fit.slope > 0 ? TrendDirection::Increasing : TrendDirection::Decreasing;

    return TrendResult {
      .metric          = String(metric),
      .periodStart     = first.year,
      .periodEnd       = last.year,
      .trendSlope      = fit.slope,
      .trendDirection  = direction,
      .confidenceLevel = fit.rSquared * 100.0,
      .baselineValue   = first.value,
      .currentValue    = last.value,
      .percentChange   = first.value == 0.0 ? 0.0 : (last.value - first.value) / first.value * 100.0,
    };
  }

  fn CalculateClimateTrends(const Span<const YearlySummary> years) -> Vec<TrendResult> {
    Vec<YearValue> temperature, precipitation;
    temperature.reserve(years.size());
    precipitation.reserve(years.size());

    for (const YearlySummary& summary : years) {
      temperature.push_back({ .year = summary.year, .value = summary.temperatureMeanAvg });
      precipitation.push_back({ .year = summary.year, .value = summary.precipitationTotal });
    }

    Vec<TrendResult> trends;

    if (Option<TrendResult> trend = AnalyzeTrend("temperature_mean", std::move(temperature)))
      trends.push_back(std::move(*trend));

    if (Option<TrendResult> trend = AnalyzeTrend("precipitation_annual", std::move(precipitation)))
      trends.push_back(std::move(*trend));

    return trends;
  }
} // namespace climatime::services::historical
