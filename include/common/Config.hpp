#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace wapi::common {

/// Mutable draft of the client connection parameters. Only a validated
/// Config produced by Config::create() is ever handed to the client.
/// Class abbreviation: co
struct ConfigOptions {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sEndpoint;   // host, host:port or full URL of the management interface
  std::string sUsername;
  std::string sPassword;

  // ── WAPI ──────────────────────────────────────────────────────────────
  std::string sWapiVersion = "v2.5";
  std::string sDnsView = "default";
  uint32_t uTtl = 60;      // seconds; applied with use_ttl on create

  // ── TLS ───────────────────────────────────────────────────────────────
  bool bTlsVerify = true;
  std::optional<std::string> oTrustStore;          // PKCS#12 path or "classpath:" resource
  std::optional<std::string> oTrustStorePassword;
  std::string sResourceDir = "/usr/share/wapi-client";

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iTimeoutSeconds = 30;
  bool bDebug = false;

  // ── Logging (CLI only) ────────────────────────────────────────────────
  std::string sLogLevel = "info";
};

/// Immutable, validated client configuration.
/// Class abbreviation: cfg
class Config {
 public:
  /// Validate the draft and freeze it.
  /// Throws ConfigurationError on missing required fields, out-of-range
  /// values, or TLS verification without trust-store path and password.
  static Config create(ConfigOptions coOptions);

  /// Load from WAPI_* environment variables and validate via create().
  /// Implements _FILE fallback for WAPI_PASSWORD and WAPI_TRUST_STORE_PASSWORD.
  static Config load();

  const std::string& endpoint() const { return _coOptions.sEndpoint; }
  const std::string& username() const { return _coOptions.sUsername; }
  const std::string& password() const { return _coOptions.sPassword; }
  const std::string& wapiVersion() const { return _coOptions.sWapiVersion; }
  const std::string& dnsView() const { return _coOptions.sDnsView; }
  uint32_t ttl() const { return _coOptions.uTtl; }
  bool tlsVerify() const { return _coOptions.bTlsVerify; }
  const std::optional<std::string>& trustStore() const { return _coOptions.oTrustStore; }
  const std::optional<std::string>& trustStorePassword() const {
    return _coOptions.oTrustStorePassword;
  }
  const std::string& resourceDir() const { return _coOptions.sResourceDir; }
  int timeoutSeconds() const { return _coOptions.iTimeoutSeconds; }
  bool debug() const { return _coOptions.bDebug; }
  const std::string& logLevel() const { return _coOptions.sLogLevel; }

  /// Human-readable summary with credentials redacted.
  std::string toString() const;

 private:
  explicit Config(ConfigOptions coOptions);

  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  /// Returns nullopt when neither is set.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int64 with a default value.
  static int64_t getEnvInt(const char* pVarName, int64_t iDefault);

  /// Read an env var as bool (true/false/1/0/yes/no).
  static bool getEnvBool(const char* pVarName, bool bDefault);

  ConfigOptions _coOptions;
};

}  // namespace wapi::common
