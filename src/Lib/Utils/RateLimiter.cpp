#include "Climatime/Utils/RateLimiter.hpp"

#include "Climatime/Utils/Logging.hpp"

using namespace climatime::utils::types;

namespace climatime::utils::ratelimit {
  IntervalScheduler::IntervalScheduler(const clock::IClock& clock, const Duration interval)
    : m_clock(clock), m_interval(interval < Duration::zero() ? Duration::zero() : interval) {}

  fn IntervalScheduler::acquire() -> Unit {
    LockGuard lock(m_mutex);

    if (m_lastGrant) {
      const TimePoint readyAt = *m_lastGrant + m_interval;
      const TimePoint now     = m_clock.now();

      if (now < readyAt) {
        const auto wait = std::chrono::ceil<Duration>(readyAt - now);

        debug_log("Waiting {} before next upstream request", wait);
        m_clock.sleepFor(wait);
      }
    }

    m_lastGrant = m_clock.now();
  }

  fn IntervalScheduler::lastGrant() const -> Option<TimePoint> {
    LockGuard lock(m_mutex);
    return m_lastGrant;
  }
} // namespace climatime::utils::ratelimit
