#include "OpenMeteoService.hpp"

#include "Climatime/Utils/Error.hpp"
#include "Climatime/Utils/Logging.hpp"
#include "Climatime/Utils/Types.hpp"

#include "WeatherUtils.hpp"
#include "Wrappers/Curl.hpp"

using namespace climatime::utils::types;
using climatime::utils::error::ClimaError;
using enum climatime::utils::error::ClimaErrorCode;
using climatime::services::weather::DailyRecord;
using climatime::services::weather::Endpoint;
using climatime::services::weather::OpenMeteoService;
using climatime::services::weather::SeriesQuery;
using climatime::services::weather::ServiceOptions;

namespace weather_utils = climatime::services::weather::utils;

OpenMeteoService::OpenMeteoService(const Endpoint endpoint, ServiceOptions options)
  : m_endpoint(endpoint), m_options(std::move(options)) {}

fn OpenMeteoService::fetchDaily(const SeriesQuery& query) const -> Result<Vec<DailyRecord>> {
  if (m_endpoint == Endpoint::ClimateModel && !query.model)
    ERR(InvalidArgument, "Climate-model requests need a model name");

  const String url = weather_utils::BuildDailySeriesUrl(m_endpoint, m_options.baseUrl, query);

  debug_log("GET {}", url);

  String responseBuffer;

  Curl::Easy curl({
    .url                = url,
    .writeBuffer        = &responseBuffer,
    .timeoutSecs        = m_options.timeoutSecs,
    .connectTimeoutSecs = m_options.connectTimeoutSecs,
    .userAgent          = m_options.userAgent,
  });

  if (!curl) {
    if (const Option<ClimaError>& initError = curl.getInitializationError())
      return Err(*initError);

    ERR(ApiUnavailable, "Failed to initialize cURL (Easy handle is invalid after construction)");
  }

  if (Result res = curl.perform(); !res)
    return Err(res.error());

  Result<i64> status = curl.getResponseCode();

  if (!status)
    return Err(status.error());

  if (*status >= 400)
    return Err(weather_utils::DescribeUpstreamFailure(*status, responseBuffer));

  return weather_utils::ParseDailySeries(responseBuffer);
}
