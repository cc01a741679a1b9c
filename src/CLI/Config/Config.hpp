#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Climatime/Api/ClimateApi.hpp>
#include <Climatime/Services/Weather.hpp>
#include <Climatime/Utils/Definitions.hpp>
#include <Climatime/Utils/Logging.hpp>
#include <Climatime/Utils/Types.hpp>

namespace climatime::config {
  namespace {
    using utils::logging::LogLevel;
    using utils::types::Duration;
    using utils::types::i32;
    using utils::types::i64;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
  } // namespace

  /**
   * @brief Reads a positive integer from a table.
   * @return The value when present and > 0; otherwise the fallback, with a warning
   *         when the key was present but unusable.
   */
  inline fn ReadPositive(const toml::table& tbl, const StringView key, const i64 fallback) -> i64 {
    const toml::node_view<const toml::node> node = tbl[key];

    if (!node)
      return fallback;

    if (const Option<i64> value = node.value<i64>(); value && *value > 0)
      return *value;

    warn_log("Ignoring invalid value for '{}' in config; using {}", key, fallback);
    return fallback;
  }

  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    LogLevel logLevel = LogLevel::Info; ///< Minimum level printed unless overridden on the command line.

    /**
     * @brief Parses a TOML table to create a General instance.
     * @param tbl The TOML table to parse, containing [general].
     * @return A General instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> General {
      General gen;

      if (const Option<String> level = tbl["log_level"].value<String>()) {
        if (const Option<LogLevel> parsed = utils::logging::ParseLogLevel(*level))
          gen.logLevel = *parsed;
        else
          warn_log("Unknown log_level '{}' in config; using info", *level);
      }

      return gen;
    }
  };

  /**
   * @struct Upstream
   * @brief Open-Meteo endpoints and transfer limits.
   */
  struct Upstream {
    String         archiveUrl         = services::weather::ARCHIVE_URL;
    String         climateUrl         = services::weather::CLIMATE_URL;
    i64            timeoutSecs        = 30;
    i64            connectTimeoutSecs = 10;
    Option<String> userAgent          = String("climatime/" CLIMATIME_VERSION);

    static fn fromToml(const toml::table& tbl) -> Upstream {
      Upstream upstream;

      upstream.archiveUrl         = tbl["archive_url"].value_or(upstream.archiveUrl);
      upstream.climateUrl         = tbl["climate_url"].value_or(upstream.climateUrl);
      upstream.timeoutSecs        = ReadPositive(tbl, "timeout_secs", upstream.timeoutSecs);
      upstream.connectTimeoutSecs = ReadPositive(tbl, "connect_timeout_secs", upstream.connectTimeoutSecs);

      if (const Option<String> agent = tbl["user_agent"].value<String>())
        upstream.userAgent = agent->empty() ? Option<String>() : agent;

      return upstream;
    }

    [[nodiscard]] fn serviceOptions(const services::weather::Endpoint endpoint) const -> services::weather::ServiceOptions {
      return {
        .baseUrl            = endpoint == services::weather::Endpoint::Archive ? archiveUrl : climateUrl,
        .timeoutSecs        = timeoutSecs,
        .connectTimeoutSecs = connectTimeoutSecs,
        .userAgent          = userAgent,
      };
    }
  };

  /**
   * @struct Historical
   * @brief Pacing and batch size for archive requests.
   */
  struct Historical {
    i64 fetchIntervalMs    = 2000;
    i64 maxYearsPerRequest = 10;

    static fn fromToml(const toml::table& tbl) -> Historical {
      Historical historical;

      historical.fetchIntervalMs    = ReadPositive(tbl, "fetch_interval_ms", historical.fetchIntervalMs);
      historical.maxYearsPerRequest = ReadPositive(tbl, "max_years_per_request", historical.maxYearsPerRequest);

      return historical;
    }

    [[nodiscard]] fn fetchInterval() const -> Duration {
      return std::chrono::milliseconds(fetchIntervalMs);
    }
  };

  struct Projections {
    i32 coverageEndYear = services::projections::DEFAULT_COVERAGE_END_YEAR; ///< Last year the climate-model endpoint serves.

    static fn fromToml(const toml::table& tbl) -> Projections {
      return { .coverageEndYear = static_cast<i32>(ReadPositive(tbl, "coverage_end_year", services::projections::DEFAULT_COVERAGE_END_YEAR)) };
    }
  };

  /**
   * @struct Cache
   * @brief Result cache lifetimes and sweep cadence.
   */
  struct Cache {
    i64 sweepIntervalMinutes = 30;
    i64 yearlyTtlHours       = 24 * 7;
    i64 trendsTtlHours       = 24 * 30;
    i64 projectionsTtlHours  = 24 * 7;

    static fn fromToml(const toml::table& tbl) -> Cache {
      Cache cache;

      cache.sweepIntervalMinutes = ReadPositive(tbl, "sweep_interval_minutes", cache.sweepIntervalMinutes);
      cache.yearlyTtlHours       = ReadPositive(tbl, "yearly_ttl_hours", cache.yearlyTtlHours);
      cache.trendsTtlHours       = ReadPositive(tbl, "trends_ttl_hours", cache.trendsTtlHours);
      cache.projectionsTtlHours  = ReadPositive(tbl, "projections_ttl_hours", cache.projectionsTtlHours);

      return cache;
    }

    [[nodiscard]] fn sweepInterval() const -> Duration {
      return std::chrono::minutes(sweepIntervalMinutes);
    }

    [[nodiscard]] fn apiOptions() const -> api::ApiOptions {
      return {
        .yearlyTtl      = std::chrono::hours(yearlyTtlHours),
        .trendsTtl      = std::chrono::hours(trendsTtlHours),
        .projectionsTtl = std::chrono::hours(projectionsTtlHours),
      };
    }
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General     general;     ///< [general]
    Upstream    upstream;    ///< [upstream]
    Historical  historical;  ///< [historical]
    Projections projections; ///< [projections]
    Cache       cache;       ///< [cache]

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The parsed document; missing sections keep their defaults.
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Loads the configuration file, creating a default one if none exists.
     * @return The parsed configuration, or defaults if the file cannot be read.
     */
    static fn getInstance() -> Config;
  };

  /**
   * @brief Resolves the configuration file location.
   *
   * Checks $CLIMATIME_CONFIG, $XDG_CONFIG_HOME/climatime, ~/.config/climatime and
   * ./config.toml in that order. When none exists, the first candidate is returned.
   */
  fn GetConfigPath() -> std::filesystem::path;

  /**
   * @brief Writes the commented default configuration.
   * @return Whether the file was written.
   */
  fn CreateDefaultConfig(const std::filesystem::path& configPath) -> bool;
} // namespace climatime::config
