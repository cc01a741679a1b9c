#pragma once

#include <expected>        // std::{expected, unexpected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, _}
#include <source_location> // std::source_location

#include "Types.hpp"

namespace climatime::utils {
  namespace error {
    namespace {
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum ClimaErrorCode
     * @brief Error codes for data acquisition, analysis and request handling.
     */
    enum class ClimaErrorCode : u8 {
      ApiUnavailable,     ///< An upstream API is unavailable or a client library failed unexpectedly.
      ConfigurationError, ///< Configuration or environment issue.
      CorruptedData,      ///< Data present but corrupt or inconsistent (e.g. mismatched series lengths).
      InternalError,      ///< An error occurred within the application's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or request.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NetworkError,       ///< A network-related error occurred (e.g., DNS resolution, connection failure).
      NotFound,           ///< A required resource or data set was not found or was empty.
      NotSupported,       ///< The requested operation is not supported.
      Other,              ///< A generic or unclassified error.
      ParseError,         ///< Failed to parse data obtained from an upstream payload or input.
      ResourceExhausted,  ///< An upstream rate limit or quota was hit.
      Timeout,            ///< An operation timed out.
    };

    /**
     * @struct ClimaError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout the library.
     */
    struct ClimaError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      ClimaErrorCode       code;     ///< The general category of the error.

      ClimaError(const ClimaErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::ClimaError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::ClimaError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace climatime::utils

namespace std {
  template <>
  struct formatter<::climatime::utils::error::ClimaErrorCode> : formatter<::climatime::utils::types::StringView> {
    template <typename FormatContext>
    fn format(::climatime::utils::error::ClimaErrorCode code, FormatContext& ctx) const {
      using enum ::climatime::utils::error::ClimaErrorCode;
      using matchit::match, matchit::is, matchit::_;

      ::climatime::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | ConfigurationError = "ConfigurationError",
        is | CorruptedData      = "CorruptedData",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | NotSupported       = "NotSupported",
        is | ParseError         = "ParseError",
        is | ResourceExhausted  = "ResourceExhausted",
        is | Timeout            = "Timeout",
        is | _                  = "Other"
      );

      return formatter<::climatime::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::climatime::utils::types::Err(::climatime::utils::error::ClimaError(errc, msg))
#define ERR_FROM(err)           return ::climatime::utils::types::Err(err)
#define ERR_FMT(errc, fmt, ...) return ::climatime::utils::types::Err(::climatime::utils::error::ClimaError(errc, std::format(fmt, __VA_ARGS__)))
