#pragma once

#include <cstdlib> // std::getenv

#include "Error.hpp"
#include "Types.hpp"

namespace climatime::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;

    using error::ClimaError;
    using enum error::ClimaErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing the value, or NotFound when unset or empty.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<PCStr> {
    const PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      return Err(ClimaError(NotFound, "Environment variable not found"));

    return value;
  }
} // namespace climatime::utils::env
