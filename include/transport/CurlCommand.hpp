#pragma once

#include <string>
#include <vector>

namespace wapi::transport {

/// Render an HTTP exchange as an equivalent curl command line for debug logs.
/// The Authorization header value is always redacted.
/// Arguments are single-quoted with embedded quotes escaped.
std::string toCurlCommand(const std::string& sMethod, const std::string& sUrl,
                          const std::vector<std::string>& vHeaders, const std::string& sBody,
                          bool bInsecure);

}  // namespace wapi::transport
