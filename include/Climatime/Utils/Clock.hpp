#pragma once

#include <chrono> // std::chrono::{system_clock, year_month_day, floor, days}
#include <thread> // std::this_thread::sleep_for

#include "Types.hpp"

namespace climatime::utils::clock {
  namespace {
    using types::Duration;
    using types::i32;
    using types::LockGuard;
    using types::Mutex;
    using types::TimePoint;
    using types::Unit;
  } // namespace

  /**
   * @brief Source of time for expiry checks and request pacing.
   *
   * Anything that waits or timestamps takes an IClock so tests can drive time
   * without sleeping.
   */
  class IClock {
   public:
    IClock(const IClock&) = delete;
    IClock(IClock&&)      = delete;

    fn operator=(const IClock&)->IClock& = delete;
    fn operator=(IClock&&)->IClock&      = delete;

    virtual ~IClock() = default;

    [[nodiscard]] virtual fn now() const -> TimePoint = 0;

    /**
     * @brief Blocks the caller (or advances virtual time) for the given duration.
     */
    virtual fn sleepFor(Duration duration) const -> Unit = 0;

   protected:
    IClock() = default;
  };

  class SystemClock final : public IClock {
   public:
    SystemClock() = default;

    [[nodiscard]] fn now() const -> TimePoint override {
      return std::chrono::system_clock::now();
    }

    fn sleepFor(const Duration duration) const -> Unit override {
      std::this_thread::sleep_for(duration);
    }
  };

  /**
   * @brief Virtual clock that only moves when told to.
   *
   * sleepFor() advances the clock instead of blocking, so a paced loop under test
   * finishes instantly while still observing the intended spacing.
   */
  class ManualClock final : public IClock {
   public:
    explicit ManualClock(const TimePoint start = TimePoint {}) : m_now(start) {}

    [[nodiscard]] fn now() const -> TimePoint override {
      LockGuard lock(m_mutex);
      return m_now;
    }

    fn sleepFor(const Duration duration) const -> Unit override {
      LockGuard lock(m_mutex);
      m_now += duration;
    }

    fn advance(const Duration duration) -> Unit {
      LockGuard lock(m_mutex);
      m_now += duration;
    }

    fn set(const TimePoint point) -> Unit {
      LockGuard lock(m_mutex);
      m_now = point;
    }

   private:
    mutable Mutex     m_mutex;
    mutable TimePoint m_now;
  };

  /**
   * @brief Calendar year (UTC) of the clock's current time.
   */
  inline fn CurrentYear(const IClock& clock) -> i32 {
    using namespace std::chrono;

    const year_month_day ymd { floor<days>(clock.now()) };

    return static_cast<i32>(ymd.year());
  }
} // namespace climatime::utils::clock
