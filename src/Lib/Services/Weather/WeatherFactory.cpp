#include <mutex> // std::{call_once, once_flag}

#include "Climatime/Services/Weather.hpp"

#include "Climatime/Utils/Logging.hpp"

#include "Services/Weather/OpenMeteoService.hpp"
#include "Wrappers/Curl.hpp"

namespace climatime::services::weather {
  fn CreateDailySeriesService(const Endpoint endpoint, ServiceOptions options) -> UniquePointer<IDailySeriesService> {
    static std::once_flag CurlInitFlag;

    // Handles are later created on worker threads; global setup has to happen first.
    std::call_once(CurlInitFlag, [] {
      if (Result<> res = Curl::GlobalInit(); !res)
        error_at(res.error());
    });

    if (options.baseUrl.empty())
      options.baseUrl = endpoint == Endpoint::Archive ? ARCHIVE_URL : CLIMATE_URL;

    return std::make_unique<OpenMeteoService>(endpoint, std::move(options));
  }
} // namespace climatime::services::weather
