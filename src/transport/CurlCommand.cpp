#include "transport/CurlCommand.hpp"

#include <algorithm>
#include <cctype>

namespace wapi::transport {

namespace {

std::string shellQuote(const std::string& sArg) {
  std::string sOut = "'";
  for (char c : sArg) {
    if (c == '\'') {
      sOut += "'\\''";
    } else {
      sOut += c;
    }
  }
  sOut += "'";
  return sOut;
}

bool isAuthorization(const std::string& sHeader) {
  static const std::string kName = "authorization:";
  if (sHeader.size() < kName.size()) {
    return false;
  }
  return std::equal(kName.begin(), kName.end(), sHeader.begin(), [](char a, char b) {
    return a == std::tolower(static_cast<unsigned char>(b));
  });
}

}  // namespace

std::string toCurlCommand(const std::string& sMethod, const std::string& sUrl,
                          const std::vector<std::string>& vHeaders, const std::string& sBody,
                          bool bInsecure) {
  std::string sCmd = "curl";
  if (bInsecure) {
    sCmd += " -k";
  }
  sCmd += " -X " + sMethod;
  for (const auto& sHeader : vHeaders) {
    sCmd += " -H ";
    sCmd += shellQuote(isAuthorization(sHeader) ? "Authorization: ****" : sHeader);
  }
  if (!sBody.empty()) {
    sCmd += " -d " + shellQuote(sBody);
  }
  sCmd += " " + shellQuote(sUrl);
  return sCmd;
}

}  // namespace wapi::transport
