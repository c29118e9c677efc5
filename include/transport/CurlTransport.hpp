#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/Config.hpp"
#include "security/TrustStore.hpp"
#include "transport/IHttpTransport.hpp"

namespace wapi::transport {

/// Parsed form of the WAPI base URL.
/// Class abbreviation: ep
struct Endpoint {
  std::string sScheme;      // "https" or "http"
  std::string sHost;        // host name or IP literal, without brackets
  std::string sAuthority;   // host[:port] as configured, used for the Host header
  std::string sPort;        // empty when the scheme default applies
  bool bIpLiteral = false;
};

/// libcurl transport to the appliance, built once per client.
///
/// - TLS 1.2 only, pinned in libcurl and on the OpenSSL SSL_CTX.
/// - SNI disabled: HTTPS requests connect to the resolved IP literal of the
///   endpoint host and carry the configured name in the Host header; the
///   certificate is still checked against that name via X509_VERIFY_PARAM.
/// - Trust: PKCS#12 trust store only (system CA bundle disabled), or an
///   explicit opt-in insecure mode that skips all certificate checks.
/// - Every request carries Basic credentials, Content-Type: application/json
///   and _return_as_object=1.
///
/// Holds only immutable state; each send() uses its own curl easy handle.
/// Class abbreviation: ct
class CurlTransport : public IHttpTransport {
 public:
  /// Throws SecurityInitError on trust-store or TLS context failure.
  CurlTransport(const common::Config& cfg, std::shared_ptr<spdlog::logger> spLog);
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  HttpResponse send(const HttpRequest& hreq) const override;

  /// Send through each connect address in turn, moving on to the next one
  /// only when the connection itself fails. Addresses are IP literals as
  /// returned by resolveConnectHosts(); the configured authority is sent in
  /// the Host header. An empty list connects to the configured authority.
  HttpResponse sendVia(const HttpRequest& hreq, const std::vector<std::string>& vConnectHosts) const;

  const std::string& baseUrl() const { return _sBaseUrl; }

  /// "https://<endpoint>/wapi/"; the scheme is added only if the endpoint
  /// does not already start with "http".
  static std::string buildBaseUrl(const std::string& sEndpoint);

  /// Split a base URL into scheme, host and port.
  /// Throws ConfigurationError if no host can be extracted.
  static Endpoint parseEndpoint(const std::string& sBaseUrl);

  /// "Basic " + base64(user ":" password).
  static std::string basicCredentials(const std::string& sUsername, const std::string& sPassword);

  /// Every address of sHost in resolver order, as URL host literals
  /// ("10.0.0.1", "[2001:db8::1]"). Throws TransportError("resolve_failed").
  static std::vector<std::string> resolveConnectHosts(const std::string& sHost);

 private:
  /// Apply TLS 1.2 pinning, trust material and host verification to an SSL_CTX.
  void configureSslContext(SSL_CTX* pCtx) const;

  /// One exchange with sAuthority in the URL.
  HttpResponse perform(const HttpRequest& hreq, const std::string& sAuthority,
                       bool bHostHeader) const;

  std::string _sBaseUrl;
  Endpoint _epTarget;
  std::string _sAuthHeader;
  bool _bTlsVerify;
  long _lTimeoutSeconds;
  bool _bDebug;
  std::unique_ptr<security::TrustStore> _upTrustStore;
  std::shared_ptr<spdlog::logger> _spLog;

  friend struct SslContextHook;
};

}  // namespace wapi::transport
