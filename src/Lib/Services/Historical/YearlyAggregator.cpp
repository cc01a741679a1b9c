#include "Climatime/Services/Historical.hpp"

using namespace climatime::utils::types;
using climatime::services::weather::DailyRecord;

namespace climatime::services::historical {
  namespace {
    // Mean over present values only; 0 when none are present.
    struct RunningMean {
      f64   sum   = 0.0;
      usize count = 0;

      fn add(const Option<f64>& value) -> Unit {
        if (!value)
          return;

        sum += *value;
        ++count;
      }

      [[nodiscard]] fn mean() const -> f64 {
        return count == 0 ? 0.0 : sum / static_cast<f64>(count);
      }
    };
  } // namespace

  fn IsValidDay(const DailyRecord& record) -> bool {
    return record.temperatureMean.has_value() && record.temperatureMax.has_value() && record.temperatureMin.has_value();
  }

  fn AggregateYear(const i32 year, const Span<const DailyRecord> records) -> Option<YearlySummary> {
    RunningMean tempMax, tempMin, tempMean, humidity, wind, pressure;
    f64         precipitationTotal = 0.0;
    i32         validDays          = 0;

    for (const DailyRecord& record : records) {
      if (!IsValidDay(record))
        continue;

      ++validDays;

      tempMax.add(record.temperatureMax);
      tempMin.add(record.temperatureMin);
      tempMean.add(record.temperatureMean);
      humidity.add(record.humidity);
      wind.add(record.windSpeed);
      pressure.add(record.pressure);

      precipitationTotal += record.precipitation.value_or(0.0);
    }

    if (validDays == 0)
      return None;

    return YearlySummary {
      .year               = year,
      .temperatureMaxAvg  = tempMax.mean(),
      .temperatureMinAvg  = tempMin.mean(),
      .temperatureMeanAvg = tempMean.mean(),
      .precipitationTotal = precipitationTotal,
      .precipitationAvg   = precipitationTotal / static_cast<f64>(validDays),
      .humidityAvg        = humidity.mean(),
      .windSpeedAvg       = wind.mean(),
      .pressureAvg        = pressure.mean(),
      .dataPointsCount    = validDays,
    };
  }
} // namespace climatime::services::historical
