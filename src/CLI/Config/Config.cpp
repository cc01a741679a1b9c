#include "Config.hpp"

#include <fstream>                // std::ofstream
#include <system_error>           // std::error_code
#include <toml++/impl/parser.hpp> // toml::{parse_file, parse_error}

#include <Climatime/Utils/Env.hpp>

namespace fs = std::filesystem;

using namespace climatime::utils::types;

namespace climatime::config {
  namespace {
    constexpr PCStr DEFAULT_CONFIG_TEMPLATE = R"toml(# climatime configuration file

[general]
log_level = "info" # debug, info, warn or error

[upstream]
archive_url = "https://archive-api.open-meteo.com/v1/archive"
climate_url = "https://climate-api.open-meteo.com/v1/climate"
timeout_secs = 30
connect_timeout_secs = 10
user_agent = "climatime/{}"

[historical]
fetch_interval_ms = 2000   # Minimum spacing between archive requests
max_years_per_request = 10

[projections]
coverage_end_year = 2050 # Later periods are extrapolated

[cache]
sweep_interval_minutes = 30
yearly_ttl_hours = 168
trends_ttl_hours = 720
projections_ttl_hours = 168
)toml";
  } // namespace

  fn GetConfigPath() -> fs::path {
    using utils::env::GetEnv;

    Vec<fs::path> possiblePaths;

    if (Result<PCStr> result = GetEnv("CLIMATIME_CONFIG"))
      possiblePaths.emplace_back(*result);

    if (Result<PCStr> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "climatime" / "config.toml");

    if (Result<PCStr> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "climatime" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  fn CreateDefaultConfig(const fs::path& configPath) -> bool {
    std::error_code errc;

    if (configPath.has_parent_path())
      create_directories(configPath.parent_path(), errc);

    if (errc) {
      error_log("Failed to create config directory: {}", errc.message());
      return false;
    }

    std::ofstream file(configPath);

    if (!file) {
      error_log("Failed to open config file for writing: {}", configPath.string());
      return false;
    }

    const StringView version = CLIMATIME_VERSION;

    file << std::vformat(DEFAULT_CONFIG_TEMPLATE, std::make_format_args(version));

    if (!file) {
      error_log("Failed to write to config file: {}", configPath.string());
      return false;
    }

    info_log("Created default config file at {}", configPath.string());
    return true;
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view genTbl  = tbl["general"];
    const toml::node_view upTbl   = tbl["upstream"];
    const toml::node_view histTbl = tbl["historical"];
    const toml::node_view projTbl = tbl["projections"];
    const toml::node_view cchTbl  = tbl["cache"];

    this->general     = genTbl.is_table() ? General::fromToml(*genTbl.as_table()) : General {};
    this->upstream    = upTbl.is_table() ? Upstream::fromToml(*upTbl.as_table()) : Upstream {};
    this->historical  = histTbl.is_table() ? Historical::fromToml(*histTbl.as_table()) : Historical {};
    this->projections = projTbl.is_table() ? Projections::fromToml(*projTbl.as_table()) : Projections {};
    this->cache       = cchTbl.is_table() ? Cache::fromToml(*cchTbl.as_table()) : Cache {};
  }

  fn Config::getInstance() -> Config {
    const fs::path configPath = GetConfigPath();

    if (std::error_code errc; !fs::exists(configPath, errc)) {
      info_log("Config file not found at {}, creating defaults.", configPath.string());

      if (!CreateDefaultConfig(configPath))
        return {};
    }

    try {
      const toml::table parsedConfig = toml::parse_file(configPath.string());

      debug_log("Config loaded from {}", configPath.string());

      return Config(parsedConfig);
    } catch (const toml::parse_error& err) {
      warn_log("Failed to parse {}: {}. Using defaults.", configPath.string(), err.description());
      return {};
    }
  }
} // namespace climatime::config
