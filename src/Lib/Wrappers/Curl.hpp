#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include "Climatime/Utils/Error.hpp"
#include "Climatime/Utils/Types.hpp"

namespace Curl {
  namespace {
    using climatime::utils::error::ClimaError;
    using enum climatime::utils::error::ClimaErrorCode;

    using climatime::utils::types::Err;
    using climatime::utils::types::i64;
    using climatime::utils::types::None;
    using climatime::utils::types::Option;
    using climatime::utils::types::RawPointer;
    using climatime::utils::types::Result;
    using climatime::utils::types::String;
    using climatime::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None;    ///< URL to set for the transfer
    String*        writeBuffer        = nullptr; ///< Pointer to a string buffer to store the response
    Option<i64>    timeoutSecs        = None;    ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None;    ///< Timeout for the connection phase in seconds
    Option<String> userAgent          = None;    ///< User-agent string
  };

  /**
   * @brief Maps a transfer failure onto the closest error code.
   */
  inline fn CodeForTransferError(const CURLcode code) -> climatime::utils::error::ClimaErrorCode {
    switch (code) {
      case CURLE_OPERATION_TIMEDOUT:
        return Timeout;
      case CURLE_COULDNT_RESOLVE_HOST:
      case CURLE_COULDNT_RESOLVE_PROXY:
      case CURLE_COULDNT_CONNECT:
      case CURLE_SEND_ERROR:
      case CURLE_RECV_ERROR:
      case CURLE_GOT_NOTHING:
      case CURLE_SSL_CONNECT_ERROR:
        return NetworkError;
      default:
        return ApiUnavailable;
    }
  }

  /**
   * @brief RAII wrapper for CURL easy handle.
   *
   * Handles are not shared between threads; each request builds its own.
   */
  class Easy {
    CURL*              m_curl      = nullptr;
    Option<ClimaError> m_initError = None; ///< Stores any error that occurred during initialization via options constructor

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    // Records the first failing option as the initialization error.
    fn applyOption(Result<> res) -> bool {
      if (!res)
        m_initError = res.error();

      return res.has_value();
    }

   public:
    /**
     * @brief Constructor with options. Initializes a CURL easy handle and sets options.
     * @param options The options to configure the CURL handle.
     */
    explicit Easy(const EasyOptions& options)
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = ClimaError(ApiUnavailable, "curl_easy_init() failed");
        return;
      }

      // Worker threads run transfers concurrently; signals would be process-wide.
      if (!applyOption(setOpt(CURLOPT_NOSIGNAL, 1L)))
        return;

      if (options.url && !applyOption(setUrl(*options.url)))
        return;

      if (options.writeBuffer && !applyOption(setWriteFunction(options.writeBuffer)))
        return;

      if (options.timeoutSecs && !applyOption(setOpt(CURLOPT_TIMEOUT, static_cast<long>(*options.timeoutSecs))))
        return;

      if (options.connectTimeoutSecs && !applyOption(setOpt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(*options.connectTimeoutSecs))))
        return;

      if (options.userAgent)
        applyOption(setOpt(CURLOPT_USERAGENT, options.userAgent->c_str()));
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    // Non-copyable
    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);

        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    /**
     * @brief Checks if the CURL handle is valid and initialized without errors.
     */
    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<ClimaError>& {
      return m_initError;
    }

    /**
     * @brief Sets a CURL option.
     * @tparam T The type of the option value.
     * @param option The CURL option to set.
     * @param value The value to set for the option.
     * @return A Result indicating success or failure.
     */
    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(ApiUnavailable, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return Timeout, NetworkError or ApiUnavailable on failure.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK)
        ERR_FMT(CodeForTransferError(res), "curl_easy_perform failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Gets information from a CURL transfer.
     * @tparam T The type of the information to get.
     * @param info The CURLINFO to get.
     * @param value A pointer to store the retrieved information.
     * @return A Result indicating success or failure.
     */
    template <typename T>
    fn getInfo(const CURLINFO info, T* value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_getinfo(m_curl, info, value); res != CURLE_OK)
        ERR_FMT(ApiUnavailable, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief HTTP status of the last transfer (0 if none was received).
     */
    fn getResponseCode() -> Result<i64> {
      long status = 0;

      if (Result res = getInfo(CURLINFO_RESPONSE_CODE, &status); !res)
        return Err(res.error());

      return static_cast<i64>(status);
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    /**
     * @brief Sets the write function and data for the transfer.
     * @param buffer The string buffer to write the response to.
     */
    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }
  };

  /**
   * @brief Initializes CURL globally. Must run before any worker thread creates a handle.
   * @param flags CURL global init flags.
   * @return A Result indicating success or failure.
   */
  inline fn GlobalInit(const long flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(ApiUnavailable, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }
} // namespace Curl
