#pragma once

#include <string>
#include <utility>
#include <vector>

namespace wapi::transport {

/// A prepared, not-yet-sent WAPI request. sPath is relative to the /wapi/
/// base URL, e.g. "v2.5/record:a" or "v2.5/record:a/ZG5z...:host/default".
/// Class abbreviation: hreq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sPath;
  std::vector<std::pair<std::string, std::string>> vQuery;
  std::string sBody;
};

/// Raw appliance response.
/// Class abbreviation: hres
struct HttpResponse {
  int iStatus = 0;
  std::string sStatusMessage;
  std::string sContentType;
  std::string sBody;
};

/// Pure abstract interface for the HTTP channel to the appliance.
/// send() blocks until the exchange completes and throws TransportError on
/// network/TLS failure. Implementations must be safe for concurrent send().
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse send(const HttpRequest& hreq) const = 0;
};

}  // namespace wapi::transport
