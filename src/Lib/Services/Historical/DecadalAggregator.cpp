#include "Climatime/Services/Historical.hpp"

using namespace climatime::utils::types;

namespace climatime::services::historical {
  fn SummarizeDecades(const Span<const YearlySummary> years) -> Vec<DecadalSummary> {
    Map<i32, Vec<const YearlySummary*>> byDecade;

    for (const YearlySummary& summary : years)
      byDecade[DecadeOf(summary.year)].push_back(&summary);

    Vec<DecadalSummary> decades;
    decades.reserve(byDecade.size());

    for (const auto& [decade, members] : byDecade) {
      const auto count = static_cast<f64>(members.size());

      DecadalSummary out {
        .decadeStart = decade,
        .decadeEnd   = decade + 9,
        .yearsCount  = static_cast<i32>(members.size()),
      };

      for (const YearlySummary* year : members) {
        out.temperatureMaxAvg += year->temperatureMaxAvg;
        out.temperatureMinAvg += year->temperatureMinAvg;
        out.temperatureMeanAvg += year->temperatureMeanAvg;
        out.precipitationTotalAvg += year->precipitationTotal;
        out.precipitationAnnualAvg += year->precipitationAvg;
        out.humidityAvg += year->humidityAvg;
        out.windSpeedAvg += year->windSpeedAvg;
        out.pressureAvg += year->pressureAvg;
      }

      out.temperatureMaxAvg /= count;
      out.temperatureMinAvg /= count;
      out.temperatureMeanAvg /= count;
      out.precipitationTotalAvg /= count;
      out.precipitationAnnualAvg /= count;
      out.humidityAvg /= count;
      out.windSpeedAvg /= count;
      out.pressureAvg /= count;

      decades.push_back(out);
    }

    return decades;
  }
} // namespace climatime::services::historical
