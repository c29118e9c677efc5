#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace wapi::common {

namespace {

bool isBlank(const std::optional<std::string>& oValue) {
  return !oValue.has_value() || oValue->empty();
}

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

}  // namespace

Config::Config(ConfigOptions coOptions) : _coOptions(std::move(coOptions)) {}

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int64_t Config::getEnvInt(const char* pVarName, int64_t iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nPos = 0;
  int64_t iValue = 0;
  try {
    iValue = std::stoll(sValue, &nPos);
  } catch (const std::exception&) {
    nPos = 0;
  }
  if (nPos == 0 || nPos != sValue.size()) {
    throw ConfigurationError("invalid_integer",
                             std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = toLower(getEnv(pVarName));
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") {
    return true;
  }
  if (sValue == "false" || sValue == "0" || sValue == "no") {
    return false;
  }
  throw ConfigurationError("invalid_boolean",
                           std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigurationError("secret_file_unreadable",
                             "Cannot open secret file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigurationError("secret_file_empty",
                             "Secret file is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::create(ConfigOptions coOptions) {
  if (coOptions.sEndpoint.empty()) {
    throw ConfigurationError("missing_endpoint", "Infoblox endpoint is empty.");
  }
  if (coOptions.sUsername.empty()) {
    throw ConfigurationError("missing_username", "Infoblox user name is empty.");
  }
  if (coOptions.sPassword.empty()) {
    throw ConfigurationError("missing_password", "Infoblox password is empty.");
  }
  if (coOptions.sWapiVersion.empty()) {
    throw ConfigurationError("missing_wapi_version", "WAPI version is empty.");
  }
  if (coOptions.sDnsView.empty()) {
    throw ConfigurationError("missing_dns_view", "DNS view is empty.");
  }
  if (coOptions.iTimeoutSeconds <= 0) {
    throw ConfigurationError("invalid_timeout",
                             "Timeout must be > 0 seconds (got " +
                                 std::to_string(coOptions.iTimeoutSeconds) + ")");
  }

  // Trust-store properties are mandatory when TLS verification is enabled.
  if (coOptions.bTlsVerify) {
    if (isBlank(coOptions.oTrustStore)) {
      throw ConfigurationError("missing_trust_store", "Truststore path is empty.");
    }
    if (isBlank(coOptions.oTrustStorePassword)) {
      throw ConfigurationError("missing_trust_store_password", "Truststore password is empty.");
    }
  }

  return Config(std::move(coOptions));
}

Config Config::load() {
  ConfigOptions co;

  // ── Required vars ──────────────────────────────────────────────────────
  co.sEndpoint = getEnv("WAPI_ENDPOINT");
  co.sUsername = getEnv("WAPI_USERNAME");
  co.sPassword = loadSecret("WAPI_PASSWORD").value_or(std::string{});

  // ── Optional vars with defaults ────────────────────────────────────────
  const std::string sVersion = getEnv("WAPI_VERSION");
  if (!sVersion.empty()) {
    co.sWapiVersion = sVersion;
  }
  const std::string sView = getEnv("WAPI_DNS_VIEW");
  if (!sView.empty()) {
    co.sDnsView = sView;
  }

  const int64_t iTtl = getEnvInt("WAPI_TTL", co.uTtl);
  if (iTtl < 0 || iTtl > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    throw ConfigurationError("invalid_ttl",
                             "WAPI_TTL must be within 0..4294967295 (got " +
                                 std::to_string(iTtl) + ")");
  }
  co.uTtl = static_cast<uint32_t>(iTtl);

  // TLS
  co.bTlsVerify = getEnvBool("WAPI_TLS_VERIFY", co.bTlsVerify);
  const std::string sTrustStore = getEnv("WAPI_TRUST_STORE");
  if (!sTrustStore.empty()) {
    co.oTrustStore = sTrustStore;
  }
  co.oTrustStorePassword = loadSecret("WAPI_TRUST_STORE_PASSWORD");
  const std::string sResourceDir = getEnv("WAPI_RESOURCE_DIR");
  if (!sResourceDir.empty()) {
    co.sResourceDir = sResourceDir;
  }

  // HTTP
  const int64_t iTimeout = getEnvInt("WAPI_TIMEOUT_SECONDS", co.iTimeoutSeconds);
  if (iTimeout > std::numeric_limits<int>::max()) {
    throw ConfigurationError("invalid_timeout", "WAPI_TIMEOUT_SECONDS is out of range");
  }
  co.iTimeoutSeconds = static_cast<int>(iTimeout);
  co.bDebug = getEnvBool("WAPI_DEBUG", co.bDebug);

  // Logging
  const std::string sLogLevel = getEnv("WAPI_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    co.sLogLevel = sLogLevel;
  }

  return create(std::move(co));
}

std::string Config::toString() const {
  std::ostringstream oss;
  oss << "Config{endpoint=" << _coOptions.sEndpoint
      << ", wapiVersion=" << _coOptions.sWapiVersion
      << ", username=****, password=****"
      << ", dnsView=" << _coOptions.sDnsView
      << ", ttl=" << _coOptions.uTtl
      << ", tlsVerify=" << (_coOptions.bTlsVerify ? "true" : "false")
      << ", trustStore=" << _coOptions.oTrustStore.value_or("<none>")
      << ", trustStorePassword=****"
      << ", timeout=" << _coOptions.iTimeoutSeconds
      << ", debug=" << (_coOptions.bDebug ? "true" : "false") << "}";
  return oss.str();
}

}  // namespace wapi::common
