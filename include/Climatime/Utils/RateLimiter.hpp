#pragma once

#include <chrono> // std::chrono::milliseconds

#include "Clock.hpp"
#include "Types.hpp"

namespace climatime::utils::ratelimit {
  namespace {
    using types::Duration;
    using types::Mutex;
    using types::Option;
    using types::TimePoint;
    using types::Unit;
  } // namespace

  inline constexpr Duration DEFAULT_FETCH_INTERVAL = std::chrono::milliseconds(2000);

  /**
   * @brief Grants permits no closer together than a fixed interval.
   *
   * acquire() blocks (through the clock) until at least `interval` has passed
   * since the previous grant. The first permit is immediate. Callers on
   * different threads are serialized.
   */
  class IntervalScheduler {
   public:
    explicit IntervalScheduler(const clock::IClock& clock, Duration interval = DEFAULT_FETCH_INTERVAL);

    IntervalScheduler(const IntervalScheduler&) = delete;
    IntervalScheduler(IntervalScheduler&&)      = delete;

    fn operator=(const IntervalScheduler&)->IntervalScheduler& = delete;
    fn operator=(IntervalScheduler&&)->IntervalScheduler&      = delete;

    ~IntervalScheduler() = default;

    fn acquire() -> Unit;

    [[nodiscard]] fn interval() const -> Duration {
      return m_interval;
    }

    /**
     * @brief Time of the most recent grant, if any.
     */
    [[nodiscard]] fn lastGrant() const -> Option<TimePoint>;

   private:
    const clock::IClock& m_clock;
    Duration             m_interval;
    Option<TimePoint>    m_lastGrant;
    mutable Mutex        m_mutex;
  };
} // namespace climatime::utils::ratelimit
