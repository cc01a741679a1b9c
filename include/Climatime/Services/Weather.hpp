#pragma once

#include <glaze/glaze.hpp>

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace climatime::services::weather {
  namespace {
    using utils::types::f64;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u8;
    using utils::types::UniquePointer;
    using utils::types::Vec;
  } // namespace

  // clang-format off
  inline constexpr const char* ARCHIVE_URL = "https://archive-api.open-meteo.com/v1/archive";
  inline constexpr const char* CLIMATE_URL = "https://climate-api.open-meteo.com/v1/climate";
  // clang-format on

  struct Coords {
    f64 lat;
    f64 lon;
  };

  /**
   * @struct DailyRecord
   * @brief One day of observations or model output.
   *
   * Every metric may be missing; absence is distinct from zero.
   */
  struct DailyRecord {
    String      date;            ///< ISO date, YYYY-MM-DD.
    Option<f64> temperatureMax;  ///< Degrees C.
    Option<f64> temperatureMin;  ///< Degrees C.
    Option<f64> temperatureMean; ///< Degrees C.
    Option<f64> precipitation;   ///< Millimetres.
    Option<f64> humidity;        ///< Relative humidity, percent.
    Option<f64> windSpeed;       ///< km/h.
    Option<f64> pressure;        ///< hPa.
  };

  /**
   * @brief A bounded date range at one location, optionally for one climate model.
   */
  struct SeriesQuery {
    Coords         coords;
    String         startDate; ///< Inclusive, YYYY-MM-DD.
    String         endDate;   ///< Inclusive, YYYY-MM-DD.
    Option<String> model = None;
  };

  /**
   * @brief Which Open-Meteo endpoint a service talks to.
   */
  enum class Endpoint : u8 {
    Archive,      ///< Reanalysis observations, seven daily metrics.
    ClimateModel, ///< CMIP6 model output, four daily metrics, requires a model.
  };

  struct ServiceOptions {
    String         baseUrl;
    i64            timeoutSecs        = 30;
    i64            connectTimeoutSecs = 10;
    Option<String> userAgent          = None;
  };

  /**
   * @brief Source of daily weather series.
   *
   * One call issues one bounded-range upstream request and either returns every
   * day in the range or fails.
   */
  class IDailySeriesService {
   public:
    IDailySeriesService(const IDailySeriesService&) = delete;
    IDailySeriesService(IDailySeriesService&&)      = delete;

    fn operator=(const IDailySeriesService&)->IDailySeriesService& = delete;
    fn operator=(IDailySeriesService&&)->IDailySeriesService&      = delete;

    virtual ~IDailySeriesService() = default;

    [[nodiscard]] virtual fn fetchDaily(const SeriesQuery& query) const -> Result<Vec<DailyRecord>> = 0;

   protected:
    IDailySeriesService() = default;
  };

  fn CreateDailySeriesService(Endpoint endpoint, ServiceOptions options) -> UniquePointer<IDailySeriesService>;
} // namespace climatime::services::weather

template <>
struct glz::meta<climatime::services::weather::Coords> {
  using T = climatime::services::weather::Coords;

  static constexpr auto value = object("latitude", &T::lat, "longitude", &T::lon);
};
