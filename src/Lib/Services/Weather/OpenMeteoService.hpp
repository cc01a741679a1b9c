#pragma once

#include "Climatime/Services/Weather.hpp"

#include "Climatime/Utils/Types.hpp"

namespace climatime::services::weather {
  /**
   * @brief Daily series client for the Open-Meteo archive and climate-model endpoints.
   *
   * Stateless apart from its options, so one instance may serve concurrent callers.
   */
  class OpenMeteoService final : public IDailySeriesService {
   public:
    OpenMeteoService(Endpoint endpoint, ServiceOptions options);

    [[nodiscard]] fn fetchDaily(const SeriesQuery& query) const -> utils::types::Result<utils::types::Vec<DailyRecord>> override;

   private:
    Endpoint       m_endpoint;
    ServiceOptions m_options;
  };
} // namespace climatime::services::weather
