#include <algorithm>       // std::ranges::count_if
#include <cstdlib>         // EXIT_FAILURE, EXIT_SUCCESS
#include <glaze/glaze.hpp> // glz::{write, write_json, format_error}

#include <Climatime/Api/ClimateApi.hpp>
#include <Climatime/Services/Historical.hpp>
#include <Climatime/Services/Projections.hpp>
#include <Climatime/Services/Weather.hpp>
#include <Climatime/Utils/ArgumentParser.hpp>
#include <Climatime/Utils/CacheManager.hpp>
#include <Climatime/Utils/Clock.hpp>
#include <Climatime/Utils/Error.hpp>
#include <Climatime/Utils/Logging.hpp>
#include <Climatime/Utils/RateLimiter.hpp>
#include <Climatime/Utils/Types.hpp>

#include "Config/Config.hpp"

using namespace climatime::utils::types;
using namespace climatime::utils::logging;
using climatime::config::Config;

namespace {
  namespace api         = climatime::api;
  namespace projections = climatime::services::projections;
  namespace weather     = climatime::services::weather;

  using climatime::utils::error::ClimaError;
  using enum climatime::utils::error::ClimaErrorCode;

  // clang-format off
  constexpr Array<StringView, 7> QUERY_FLAGS = {
    "--yearly", "--decades", "--trends", "--projections", "--scenarios", "--periods", "--summary",
  };
  // clang-format on

  template <typename T>
  fn PrintJson(const T& value, const bool pretty) -> Result<> {
    String jsonStr;

    glz::error_ctx errorContext =
      pretty
      ? glz::write<glz::opts { .prettify = true }>(value, jsonStr)
      : glz::write_json(value, jsonStr);

    if (errorContext)
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    Println(jsonStr);
    return {};
  }

  // Prints the response on stdout, or logs the error; returns the exit code.
  template <typename T>
  fn Emit(const Result<T>& response, const bool pretty) -> i32 {
    if (!response) {
      error_at(response.error());
      return EXIT_FAILURE;
    }

    if (Result<> printed = PrintJson(*response, pretty); !printed) {
      error_at(printed.error());
      return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
  }

  fn ParseScenarioArg(const StringView name) -> Result<projections::Scenario> {
    if (Option<projections::Scenario> scenario = projections::ParseScenario(name))
      return *scenario;

    ERR(InvalidArgument, "Invalid scenario. Must be: optimistic, moderate, or pessimistic");
  }
} // namespace

fn main(const i32 argc, PCStr argv[]) -> i32 try {
  using climatime::utils::argparse::ArgumentParser;

  ArgumentParser parser(CLIMATIME_VERSION, "Historical climate statistics and scenario projections for a location.");

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level. Defaults to the config file's value.")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("--lat")
    .help("Latitude in degrees, -90 to 90.");

  parser
    .addArguments("--lon")
    .help("Longitude in degrees, -180 to 180.");

  parser
    .addArguments("--yearly")
    .help("Yearly summaries for a comma-separated list of up to 10 years, e.g. 2019,2020.");

  parser
    .addArguments("--decades")
    .help("Decadal summaries for START:END decades, e.g. 1980:2010.");

  parser
    .addArguments("--trends")
    .help("Linear trends over START:END years, at least 10 and at most 50 years apart.");

  parser
    .addArguments("--projections")
    .help("Projections for one scenario.")
    .choices({ "optimistic", "moderate", "pessimistic" });

  parser
    .addArguments("--scenarios")
    .help("Compare all three scenarios.")
    .flag();

  parser
    .addArguments("--periods")
    .help("Projections restricted to a comma-separated list of periods (2020s..2050s).");

  parser
    .addArguments("--scenario")
    .help("Scenario used by --periods.")
    .choices({ "optimistic", "moderate", "pessimistic" })
    .defaultValue(String("moderate"));

  parser
    .addArguments("--summary")
    .help("Condensed moderate-scenario outlook.")
    .flag();

  parser
    .addArguments("--pretty")
    .help("Pretty-print JSON output.")
    .flag();

  if (Result result = parser.parseArgs({ argv, static_cast<usize>(argc) }); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.get<bool>("--help")) {
    parser.printHelp();
    return EXIT_SUCCESS;
  }

  if (parser.get<bool>("--version")) {
    Println("climatime {}", parser.getVersion());
    return EXIT_SUCCESS;
  }

  if (parser.get<bool>("--verbose"))
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level"))
    SetRuntimeLogLevel(parser.getEnum<LogLevel>("--log-level").value_or(LogLevel::Info));

  const Config config = Config::getInstance();

  if (!parser.get<bool>("--verbose") && !parser.isUsed("--log-level"))
    SetRuntimeLogLevel(config.general.logLevel);

  const auto queryCount = std::ranges::count_if(QUERY_FLAGS, [&](const StringView flag) { return parser.isUsed(flag); });

  if (queryCount != 1) {
    if (queryCount > 1)
      error_log("Choose exactly one of --yearly, --decades, --trends, --projections, --scenarios, --periods or --summary");
    else
      parser.printHelp();

    return EXIT_FAILURE;
  }

  if (!parser.isUsed("--lat") || !parser.isUsed("--lon")) {
    error_log("Missing required parameters: --lat and --lon");
    return EXIT_FAILURE;
  }

  Result<f64> latitude  = api::ParseCoordinate(parser.get<String>("--lat"));
  Result<f64> longitude = api::ParseCoordinate(parser.get<String>("--lon"));

  if (!latitude || !longitude) {
    error_at(!latitude ? latitude.error() : longitude.error());
    return EXIT_FAILURE;
  }

  using climatime::utils::cache::CacheManager;
  using climatime::utils::clock::SystemClock;
  using climatime::utils::ratelimit::IntervalScheduler;

  const SystemClock clock;

  const UniquePointer<weather::IDailySeriesService> archive = weather::CreateDailySeriesService(weather::Endpoint::Archive, config.upstream.serviceOptions(weather::Endpoint::Archive));
  const UniquePointer<weather::IDailySeriesService> climate = weather::CreateDailySeriesService(weather::Endpoint::ClimateModel, config.upstream.serviceOptions(weather::Endpoint::ClimateModel));

  IntervalScheduler scheduler(clock, config.historical.fetchInterval());

  const climatime::services::historical::YearFetcher fetcher(*archive, scheduler, static_cast<usize>(config.historical.maxYearsPerRequest));
  const projections::ProjectionEngine                engine(*climate, clock, { .coverageEndYear = config.projections.coverageEndYear });

  CacheManager cache(clock);
  cache.startSweeper(config.cache.sweepInterval());

  api::ClimateApi climateApi(cache, fetcher, engine, clock, config.cache.apiOptions());

  const bool pretty = parser.get<bool>("--pretty");

  if (parser.isUsed("--yearly")) {
    Result<Vec<i32>> years = api::ParseYearList(parser.get<String>("--yearly"));

    if (!years) {
      error_at(years.error());
      return EXIT_FAILURE;
    }

    return Emit(climateApi.yearly({ .latitude = *latitude, .longitude = *longitude, .years = *years }), pretty);
  }

  if (parser.isUsed("--decades") || parser.isUsed("--trends")) {
    const bool isDecades = parser.isUsed("--decades");

    Result<Pair<i32, i32>> range = api::ParseRange(parser.get<String>(isDecades ? "--decades" : "--trends"));

    if (!range) {
      error_at(range.error());
      return EXIT_FAILURE;
    }

    const api::RangeRequest request { .latitude = *latitude, .longitude = *longitude, .start = range->first, .end = range->second };

    return isDecades ? Emit(climateApi.decades(request), pretty) : Emit(climateApi.trends(request), pretty);
  }

  if (parser.isUsed("--projections")) {
    Result<projections::Scenario> scenario = ParseScenarioArg(parser.get<String>("--projections"));

    if (!scenario) {
      error_at(scenario.error());
      return EXIT_FAILURE;
    }

    return Emit(climateApi.projections({ .latitude = *latitude, .longitude = *longitude, .scenario = *scenario }), pretty);
  }

  if (parser.isUsed("--scenarios"))
    return Emit(climateApi.scenarios(*latitude, *longitude), pretty);

  if (parser.isUsed("--periods")) {
    Result<projections::Scenario> scenario = ParseScenarioArg(parser.get<String>("--scenario"));

    if (!scenario) {
      error_at(scenario.error());
      return EXIT_FAILURE;
    }

    return Emit(
      climateApi.periods({
        .latitude  = *latitude,
        .longitude = *longitude,
        .scenario  = *scenario,
        .periods   = api::ParsePeriodList(parser.get<String>("--periods")),
      }),
      pretty
    );
  }

  return Emit(climateApi.summary(*latitude, *longitude), pretty);
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
