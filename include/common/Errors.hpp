#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wapi::common {

/// Base error for all client-level exceptions.
/// Carries the HTTP status of the appliance response (0 when no response was
/// received) and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// Invalid or missing client configuration. Raised at construction only.
struct ConfigurationError : AppError {
  explicit ConfigurationError(std::string sCode, std::string sMsg)
      : AppError(0, std::move(sCode), std::move(sMsg)) {}
};

/// Trust-store load or TLS context initialization failure. Raised at construction only.
struct SecurityInitError : AppError {
  explicit SecurityInitError(std::string sCode, std::string sMsg)
      : AppError(0, std::move(sCode), std::move(sMsg)) {}
};

/// 400: malformed caller input (IP literal, empty required argument).
/// Raised before any network call is made.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// Structured failure reported by the appliance as a JSON error body.
/// _sErrorCode holds the WAPI code (e.g. "Client.Ibap.Data.NotFound"),
/// what() the "Error" field and _sText the "text" field.
struct ApiError : AppError {
  std::string _sText;

  explicit ApiError(int iHttpStatus, std::string sCode, std::string sMsg, std::string sText)
      : AppError(iHttpStatus, std::move(sCode), std::move(sMsg)), _sText(std::move(sText)) {}
};

/// Network/IO failure, timeout, TLS handshake failure, or a non-JSON error body.
/// _iHttpStatus is 0 when the exchange never produced a response.
struct TransportError : AppError {
  explicit TransportError(int iHttpStatus, std::string sCode, std::string sMsg)
      : AppError(iHttpStatus, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace wapi::common
