#pragma once

#include <chrono>             // std::chrono::{hours, minutes}
#include <cmath>              // std::floor
#include <condition_variable> // std::condition_variable_any
#include <glaze/glaze.hpp>    // glz::{read_beve, write_beve}
#include <stop_token>         // std::stop_token
#include <thread>             // std::jthread

#include "Clock.hpp"
#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace climatime::utils::cache {
  namespace {
    using types::Duration;
    using types::Err;
    using types::f64;
    using types::Fn;
    using types::LockGuard;
    using types::Mutex;
    using types::None;
    using types::Option;
    using types::Result;
    using types::String;
    using types::StringView;
    using types::TimePoint;
    using types::UniqueLock;
    using types::Unit;
    using types::UnorderedMap;
    using types::usize;

    using error::ClimaError;
    using enum error::ClimaErrorCode;

    using std::chrono::hours;
    using std::chrono::minutes;
  } // namespace

  // clang-format off
  inline constexpr Duration HISTORICAL_YEARLY_TTL = hours(24 * 7);
  inline constexpr Duration CLIMATE_TRENDS_TTL    = hours(24 * 30);
  inline constexpr Duration PROJECTIONS_TTL       = hours(24 * 7);
  inline constexpr Duration DEFAULT_TTL           = hours(1);
  inline constexpr Duration SWEEP_INTERVAL        = minutes(30);
  // clang-format on

  struct CachePolicy {
    Duration ttl = DEFAULT_TTL; ///< Time an entry stays readable after it is written.

    static fn expiresAfter(const Duration ttl) -> CachePolicy {
      return { .ttl = ttl };
    }
  };

  /**
   * @brief Formats a coordinate the way cache keys spell it.
   *
   * Rounds half up to two decimals and prints the shortest representation, so
   * 40.0 becomes "40" and 40.7128 becomes "40.71".
   */
  inline fn FormatKeyCoordinate(const f64 value) -> String {
    f64 rounded = std::floor((value * 100.0) + 0.5) / 100.0;

    if (rounded == 0.0)
      rounded = 0.0; // drop negative zero

    return std::format("{}", rounded);
  }

  /**
   * @brief Builds a location-scoped cache key: `prefix:lat,lon[:suffix]`.
   * @param prefix Key namespace, e.g. "historical" or "trends".
   * @param lat Latitude in degrees.
   * @param lon Longitude in degrees.
   * @param suffix Optional discriminator appended after a colon.
   */
  inline fn LocationKey(const StringView prefix, const f64 lat, const f64 lon, const Option<StringView> suffix = None) -> String {
    String key = std::format("{}:{},{}", prefix, FormatKeyCoordinate(lat), FormatKeyCoordinate(lon));

    if (suffix)
      key += std::format(":{}", *suffix);

    return key;
  }

  /**
   * @brief Process-lifetime key/value store with per-entry expiry.
   *
   * Values are stored BEVE-encoded, so any type with a glaze mapping can be
   * cached. Expired entries are dropped lazily on read and by an optional
   * background sweep owned by the instance.
   */
  class CacheManager {
   public:
    explicit CacheManager(const clock::IClock& clock, const CachePolicy globalPolicy = {})
      : m_clock(clock), m_globalPolicy(globalPolicy) {}

    CacheManager(const CacheManager&) = delete;
    CacheManager(CacheManager&&)      = delete;

    fn operator=(const CacheManager&)->CacheManager& = delete;
    fn operator=(CacheManager&&)->CacheManager&      = delete;

    ~CacheManager() {
      stopSweeper();
    }

    fn setGlobalPolicy(const CachePolicy& policy) -> Unit {
      LockGuard lock(m_cacheMutex);
      m_globalPolicy = policy;
    }

    /**
     * @brief Stores a value under a key, replacing any previous entry.
     * @return An error if the value could not be serialized.
     */
    template <typename T>
    fn set(const String& key, const T& value, const Option<CachePolicy> overridePolicy = None) -> Result<> {
      String buffer;

      if (const glz::error_ctx errc = glz::write_beve(value, buffer); errc)
        return Err(ClimaError(InternalError, std::format("Failed to serialize cache entry '{}': {}", key, glz::format_error(errc, buffer))));

      LockGuard lock(m_cacheMutex);

      const Duration ttl = overridePolicy.value_or(m_globalPolicy).ttl;

      m_entries.insert_or_assign(key, Entry { .payload = std::move(buffer), .expires = m_clock.now() + ttl });

      debug_log("Cached '{}' for {}", key, std::chrono::duration_cast<minutes>(ttl));

      return {};
    }

    /**
     * @brief Reads a live entry.
     * @return The value, or None when absent, expired or undecodable. Stale and
     *         undecodable entries are removed.
     */
    template <typename T>
    fn get(const String& key) -> Option<T> {
      LockGuard lock(m_cacheMutex);

      const auto iter = m_entries.find(key);

      if (iter == m_entries.end())
        return None;

      if (m_clock.now() >= iter->second.expires) {
        debug_log("Cache entry '{}' expired", key);
        m_entries.erase(iter);
        return None;
      }

      T value {};

      if (const glz::error_ctx errc = glz::read_beve(value, iter->second.payload); errc) {
        warn_log("Dropping undecodable cache entry '{}'", key);
        m_entries.erase(iter);
        return None;
      }

      return value;
    }

    /**
     * @brief Returns the cached value, or computes, stores and returns it.
     *
     * The fetcher runs without the cache lock held, so slow fetches do not block
     * other readers. Failed fetches are returned as-is and not stored.
     */
    template <typename T>
    fn getOrSet(const String& key, Fn<Result<T>()> fetcher, const Option<CachePolicy> overridePolicy = None) -> Result<T> {
      if (Option<T> cached = get<T>(key)) {
        debug_log("Cache hit for '{}'", key);
        return *std::move(cached);
      }

      debug_log("Cache miss for '{}'", key);

      Result<T> fetched = fetcher();

      if (!fetched)
        return fetched;

      if (Result<> stored = set(key, *fetched, overridePolicy); !stored)
        warn_at(stored.error());

      return fetched;
    }

    fn erase(const String& key) -> bool {
      LockGuard lock(m_cacheMutex);
      return m_entries.erase(key) > 0;
    }

    /**
     * @brief Drops every entry.
     * @return The number of entries removed.
     */
    fn clear() -> usize {
      LockGuard lock(m_cacheMutex);

      const usize removed = m_entries.size();
      m_entries.clear();

      info_log("Cache cleared ({} entries)", removed);
      return removed;
    }

    [[nodiscard]] fn size() const -> usize {
      LockGuard lock(m_cacheMutex);
      return m_entries.size();
    }

    /**
     * @brief Removes every expired entry.
     * @return The number of entries removed.
     */
    fn cleanup() -> usize {
      LockGuard lock(m_cacheMutex);

      const TimePoint now = m_clock.now();

      const usize removed = std::erase_if(m_entries, [now](const auto& item) { return now >= item.second.expires; });

      if (removed > 0)
        debug_log("Cache sweep removed {} expired entries", removed);

      return removed;
    }

    /**
     * @brief Starts the periodic sweep on a background thread.
     *
     * Calling it again restarts the sweep with the new interval.
     */
    fn startSweeper(const Duration interval = SWEEP_INTERVAL) -> Unit {
      stopSweeper();

      m_sweeper = std::jthread([this, interval](const std::stop_token& stopToken) {
        Mutex                       waitMutex;
        std::condition_variable_any wakeup;

        while (!stopToken.stop_requested()) {
          UniqueLock lock(waitMutex);

          // Nothing notifies the variable; the wait ends on timeout or stop.
          wakeup.wait_for(lock, stopToken, interval, [] { return false; });

          if (stopToken.stop_requested())
            break;

          lock.unlock();
          cleanup();
        }
      });
    }

    fn stopSweeper() -> Unit {
      if (m_sweeper.joinable()) {
        m_sweeper.request_stop();
        m_sweeper.join();
      }
    }

    [[nodiscard]] fn isSweeping() const -> bool {
      return m_sweeper.joinable();
    }

   private:
    struct Entry {
      String    payload; ///< BEVE-encoded value.
      TimePoint expires; ///< First instant at which the entry is stale.
    };

    const clock::IClock& m_clock;
    CachePolicy          m_globalPolicy;

    UnorderedMap<String, Entry> m_entries;

    mutable Mutex m_cacheMutex;

    std::jthread m_sweeper;
  };
} // namespace climatime::utils::cache
