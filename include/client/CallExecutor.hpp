#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "transport/IHttpTransport.hpp"

namespace wapi::client {

/// Single choke point between WAPI operations and the transport.
/// Converts a pending request into a parsed body or a typed failure:
///   - 2xx                                  -> parsed JSON body
///   - error with application/json body     -> common::ApiError
///   - any other error response             -> common::TransportError(status)
///   - transport failure                    -> common::TransportError (propagated)
/// Class abbreviation: ce
class CallExecutor {
 public:
  explicit CallExecutor(const transport::IHttpTransport& htTransport);

  /// Send the request and return the parsed JSON body of a successful response.
  nlohmann::json execute(const transport::HttpRequest& hreq) const;

  /// Send the request and deserialize a successful response as T.
  /// Throws TransportError("malformed_response") carrying the response status
  /// if the body does not map to T.
  template <typename T>
  T execute(const transport::HttpRequest& hreq) const {
    ParsedResponse prResponse = send(hreq);
    try {
      return prResponse.jBody.get<T>();
    } catch (const nlohmann::json::exception& ex) {
      throw malformed(hreq, prResponse.iStatus, ex.what());
    } catch (const std::out_of_range& ex) {
      throw malformed(hreq, prResponse.iStatus, ex.what());
    }
  }

  /// True if the media type of a Content-Type header is application/json.
  static bool isJsonContentType(const std::string& sContentType);

 private:
  /// Successful response status with its parsed body.
  /// Class abbreviation: pr
  struct ParsedResponse {
    int iStatus = 0;
    nlohmann::json jBody;
  };

  ParsedResponse send(const transport::HttpRequest& hreq) const;

  [[noreturn]] static void raiseFailure(const transport::HttpResponse& hres);

  static common::TransportError malformed(const transport::HttpRequest& hreq, int iStatus,
                                          const std::string& sDetail);

  const transport::IHttpTransport& _htTransport;
};

}  // namespace wapi::client
