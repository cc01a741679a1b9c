#pragma once

// clang-format off
// glaze.hpp goes first; core/meta.hpp relies on <cstdint> being pulled in by it
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include "Climatime/Utils/Types.hpp"
// clang-format on

namespace climatime::services::weather::dto::openmeteo {
  namespace {
    using utils::types::f64;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  using Series = Option<Vec<Option<f64>>>;

  /**
   * @brief Parallel daily arrays keyed by `time`; any array may be absent and any element null.
   */
  struct Daily {
    Option<Vec<String>> time;
    Series              temperatureMax;
    Series              temperatureMin;
    Series              temperatureMean;
    Series              precipitation;
    Series              humidity;
    Series              windSpeed;
    Series              pressure;
  };

  struct DailyResponse {
    Option<Daily> daily;
  };

  /**
   * @brief Body Open-Meteo sends alongside a 4xx status.
   */
  struct ErrorResponse {
    Option<bool>   error;
    Option<String> reason;
  };
} // namespace climatime::services::weather::dto::openmeteo

namespace glz {
  template <>
  struct meta<climatime::services::weather::dto::openmeteo::Daily> {
    using T = climatime::services::weather::dto::openmeteo::Daily;

    // clang-format off
    static constexpr auto value = object(
      "time",                      &T::time,
      "temperature_2m_max",        &T::temperatureMax,
      "temperature_2m_min",        &T::temperatureMin,
      "temperature_2m_mean",       &T::temperatureMean,
      "precipitation_sum",         &T::precipitation,
      "relative_humidity_2m_mean", &T::humidity,
      "wind_speed_10m_mean",       &T::windSpeed,
      "surface_pressure_mean",     &T::pressure
    );
    // clang-format on
  };

  template <>
  struct meta<climatime::services::weather::dto::openmeteo::DailyResponse> {
    using T = climatime::services::weather::dto::openmeteo::DailyResponse;

    static constexpr auto value = object("daily", &T::daily);
  };

  template <>
  struct meta<climatime::services::weather::dto::openmeteo::ErrorResponse> {
    using T = climatime::services::weather::dto::openmeteo::ErrorResponse;

    static constexpr auto value = object("error", &T::error, "reason", &T::reason);
  };
} // namespace glz
