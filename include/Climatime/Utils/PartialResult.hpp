#pragma once

#include <algorithm> // std::ranges::any_of

#include "Error.hpp"
#include "Types.hpp"

namespace climatime::utils::types {
  /**
   * @brief An item that could not be produced, with the reason.
   */
  template <typename Id>
  struct Skipped {
    Id                id;
    error::ClimaError error;
  };

  /**
   * @struct PartialResult
   * @brief Output of a batch operation that tolerates per-item failures.
   *
   * `items` keeps input order; `skipped` lists every id that produced nothing.
   */
  template <typename T, typename Id = i32>
  struct PartialResult {
    Vec<T>           items;
    Vec<Skipped<Id>> skipped;

    [[nodiscard]] fn isComplete() const -> bool {
      return skipped.empty();
    }

    /**
     * @brief True when any skip has a code other than NotFound (no usable days).
     */
    [[nodiscard]] fn hasFetchFailures() const -> bool {
      return std::ranges::any_of(skipped, [](const Skipped<Id>& skip) { return skip.error.code != error::ClimaErrorCode::NotFound; });
    }
  };
} // namespace climatime::utils::types
