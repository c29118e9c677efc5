#include "transport/CurlTransport.hpp"

#include "common/Errors.hpp"
#include "common/IpAddrs.hpp"
#include "common/Logger.hpp"
#include "transport/CurlCommand.hpp"

#include <curl/curl.h>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace wapi::transport {

namespace {

constexpr const char* kReturnAsObject = "_return_as_object";

std::once_flag gCurlInitOnce;
CURLcode gCurlInitResult = CURLE_OK;

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

std::string base64Encode(const std::string& sInput) {
  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
  std::vector<unsigned char> vOut(4 * ((sInput.size() + 2) / 3) + 1);
  const int iLen = EVP_EncodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sInput.data()),
                                   static_cast<int>(sInput.size()));
  return std::string(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iLen));
}

std::string escape(CURL* pCurl, const std::string& sValue) {
  char* pEscaped = curl_easy_escape(pCurl, sValue.c_str(), static_cast<int>(sValue.size()));
  if (!pEscaped) {
    throw common::TransportError(0, "encode_failed", "Failed to URL-encode '" + sValue + "'");
  }
  std::string sOut(pEscaped);
  curl_free(pEscaped);
  return sOut;
}

/// Per-call state shared with the libcurl callbacks.
struct Exchange {
  std::string sBody;
  std::string sStatusMessage;
  std::string sSslError;
};

size_t writeCallback(char* pData, size_t nSize, size_t nMemb, void* pUser) {
  auto* pExchange = static_cast<Exchange*>(pUser);
  pExchange->sBody.append(pData, nSize * nMemb);
  return nSize * nMemb;
}

size_t headerCallback(char* pData, size_t nSize, size_t nMemb, void* pUser) {
  auto* pExchange = static_cast<Exchange*>(pUser);
  const size_t nLen = nSize * nMemb;
  std::string sLine(pData, nLen);
  if (sLine.rfind("HTTP/", 0) == 0) {
    // Status line: "HTTP/1.1 500 Internal Server Error". Later status lines
    // (after 100 Continue) replace earlier ones.
    while (!sLine.empty() && (sLine.back() == '\r' || sLine.back() == '\n')) {
      sLine.pop_back();
    }
    const auto nFirst = sLine.find(' ');
    const auto nSecond = nFirst == std::string::npos ? nFirst : sLine.find(' ', nFirst + 1);
    pExchange->sStatusMessage =
        nSecond == std::string::npos ? std::string{} : sLine.substr(nSecond + 1);
  }
  return nLen;
}

std::string errorCodeFor(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return "timeout";
    case CURLE_COULDNT_RESOLVE_HOST:
      return "resolve_failed";
    case CURLE_COULDNT_CONNECT:
      return "connect_failed";
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
      return "tls_failed";
    default:
      return "transport_failed";
  }
}

}  // namespace

/// Bridges libcurl's CURLOPT_SSL_CTX_FUNCTION to CurlTransport.
struct SslContextHook {
  const CurlTransport* pTransport;
  Exchange* pExchange;

  static CURLcode callback(CURL* /*pCurl*/, void* pSslCtx, void* pUser) {
    auto* pHook = static_cast<SslContextHook*>(pUser);
    try {
      pHook->pTransport->configureSslContext(static_cast<SSL_CTX*>(pSslCtx));
    } catch (const common::AppError& ex) {
      // Reported by send() as a TransportError once curl_easy_perform returns.
      pHook->pExchange->sSslError = ex.what();
      return CURLE_SSL_CERTPROBLEM;
    }
    return CURLE_OK;
  }
};

// ── Construction ───────────────────────────────────────────────────────────

std::string CurlTransport::buildBaseUrl(const std::string& sEndpoint) {
  std::string sUrl;
  if (toLower(sEndpoint).rfind("http", 0) != 0) {
    sUrl = "https://";
  }
  std::string sTrimmed = sEndpoint;
  while (!sTrimmed.empty() && sTrimmed.back() == '/') {
    sTrimmed.pop_back();
  }
  return sUrl + sTrimmed + "/wapi/";
}

Endpoint CurlTransport::parseEndpoint(const std::string& sBaseUrl) {
  Endpoint ep;
  const auto nScheme = sBaseUrl.find("://");
  if (nScheme == std::string::npos) {
    throw common::ConfigurationError("invalid_endpoint", "Endpoint has no scheme: " + sBaseUrl);
  }
  ep.sScheme = toLower(sBaseUrl.substr(0, nScheme));
  if (ep.sScheme != "https" && ep.sScheme != "http") {
    throw common::ConfigurationError("invalid_endpoint",
                                     "Unsupported endpoint scheme: " + ep.sScheme);
  }

  const auto nHostStart = nScheme + 3;
  const auto nPathStart = sBaseUrl.find('/', nHostStart);
  ep.sAuthority = sBaseUrl.substr(nHostStart, nPathStart == std::string::npos
                                                  ? std::string::npos
                                                  : nPathStart - nHostStart);

  if (!ep.sAuthority.empty() && ep.sAuthority.front() == '[') {
    const auto nClose = ep.sAuthority.find(']');
    if (nClose == std::string::npos) {
      throw common::ConfigurationError("invalid_endpoint",
                                       "Unterminated IPv6 literal: " + ep.sAuthority);
    }
    ep.sHost = ep.sAuthority.substr(1, nClose - 1);
    if (nClose + 1 < ep.sAuthority.size() && ep.sAuthority[nClose + 1] == ':') {
      ep.sPort = ep.sAuthority.substr(nClose + 2);
    }
  } else {
    const auto nColon = ep.sAuthority.find(':');
    ep.sHost = ep.sAuthority.substr(0, nColon);
    if (nColon != std::string::npos) {
      ep.sPort = ep.sAuthority.substr(nColon + 1);
    }
  }

  if (ep.sHost.empty()) {
    throw common::ConfigurationError("invalid_endpoint", "Endpoint has no host: " + sBaseUrl);
  }
  ep.bIpLiteral = common::ipaddrs::isIPv4(ep.sHost) || common::ipaddrs::isIPv6(ep.sHost);
  return ep;
}

std::string CurlTransport::basicCredentials(const std::string& sUsername,
                                            const std::string& sPassword) {
  return "Basic " + base64Encode(sUsername + ":" + sPassword);
}

CurlTransport::CurlTransport(const common::Config& cfg, std::shared_ptr<spdlog::logger> spLog)
    : _sBaseUrl(buildBaseUrl(cfg.endpoint())),
      _epTarget(parseEndpoint(_sBaseUrl)),
      _sAuthHeader("Authorization: " + basicCredentials(cfg.username(), cfg.password())),
      _bTlsVerify(cfg.tlsVerify()),
      _lTimeoutSeconds(cfg.timeoutSeconds()),
      _bDebug(cfg.debug()),
      _spLog(common::Logger::resolve(std::move(spLog))) {
  std::call_once(gCurlInitOnce, []() { gCurlInitResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (gCurlInitResult != CURLE_OK) {
    throw common::SecurityInitError("tls_init_failed",
                                    std::string("libcurl initialization failed: ") +
                                        curl_easy_strerror(gCurlInitResult));
  }

  // The SSL_CTX hook below needs libcurl built against OpenSSL.
  const curl_version_info_data* pVersion = curl_version_info(CURLVERSION_NOW);
  const std::string sSslBackend = (pVersion && pVersion->ssl_version) ? pVersion->ssl_version : "";
  if (sSslBackend.find("OpenSSL") == std::string::npos) {
    throw common::SecurityInitError("tls_init_failed",
                                    "libcurl TLS backend is not OpenSSL: '" + sSslBackend + "'");
  }

  if (_bTlsVerify) {
    _upTrustStore = std::make_unique<security::TrustStore>(
        cfg.trustStore().value_or(""), cfg.trustStorePassword().value_or(""), cfg.resourceDir());
    _spLog->info("Loaded the trustStore: {} ({} certificates)", _upTrustStore->path(),
                 _upTrustStore->size());
  } else {
    _spLog->info("Skipping TLS certs verification.");
  }

  // Fail fast: build a throwaway TLS 1.2 context with the same settings.
  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> upCheckCtx(
      SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
  if (!upCheckCtx) {
    ERR_clear_error();
    throw common::SecurityInitError("tls_context_failed", "Failed to create TLS context");
  }
  configureSslContext(upCheckCtx.get());
}

CurlTransport::~CurlTransport() = default;

void CurlTransport::configureSslContext(SSL_CTX* pCtx) const {
  if (SSL_CTX_set_min_proto_version(pCtx, TLS1_2_VERSION) != 1 ||
      SSL_CTX_set_max_proto_version(pCtx, TLS1_2_VERSION) != 1) {
    ERR_clear_error();
    throw common::SecurityInitError("tls_context_failed", "TLSv1.2 is not available");
  }

  if (!_bTlsVerify) {
    SSL_CTX_set_verify(pCtx, SSL_VERIFY_NONE, nullptr);
    return;
  }

  _upTrustStore->installTo(pCtx);
  SSL_CTX_set_verify(pCtx, SSL_VERIFY_PEER, nullptr);

  // libcurl sees only the IP literal, so the name check happens here.
  X509_VERIFY_PARAM* pParam = SSL_CTX_get0_param(pCtx);
  int iOk = 0;
  if (_epTarget.bIpLiteral) {
    iOk = X509_VERIFY_PARAM_set1_ip_asc(pParam, _epTarget.sHost.c_str());
  } else {
    X509_VERIFY_PARAM_set_hostflags(pParam, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
    iOk = X509_VERIFY_PARAM_set1_host(pParam, _epTarget.sHost.c_str(), 0);
  }
  if (iOk != 1) {
    ERR_clear_error();
    throw common::SecurityInitError("tls_context_failed",
                                    "Can't set certificate host check for " + _epTarget.sHost);
  }
}

// ── Request execution ──────────────────────────────────────────────────────

std::vector<std::string> CurlTransport::resolveConnectHosts(const std::string& sHost) {
  addrinfo aiHints{};
  aiHints.ai_family = AF_UNSPEC;
  aiHints.ai_socktype = SOCK_STREAM;
  addrinfo* pResult = nullptr;
  const int iRc = getaddrinfo(sHost.c_str(), nullptr, &aiHints, &pResult);
  if (iRc != 0 || !pResult) {
    throw common::TransportError(0, "resolve_failed",
                                 "Can't resolve " + sHost + ": " + gai_strerror(iRc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> upResult(pResult, &freeaddrinfo);

  std::vector<std::string> vHosts;
  for (const addrinfo* pAi = pResult; pAi != nullptr; pAi = pAi->ai_next) {
    char vBuf[INET6_ADDRSTRLEN] = {};
    std::string sLiteral;
    if (pAi->ai_family == AF_INET6) {
      const auto* pSin6 = reinterpret_cast<const sockaddr_in6*>(pAi->ai_addr);
      if (inet_ntop(AF_INET6, &pSin6->sin6_addr, vBuf, sizeof(vBuf)) == nullptr) {
        continue;
      }
      sLiteral = "[" + std::string(vBuf) + "]";
    } else if (pAi->ai_family == AF_INET) {
      const auto* pSin = reinterpret_cast<const sockaddr_in*>(pAi->ai_addr);
      if (inet_ntop(AF_INET, &pSin->sin_addr, vBuf, sizeof(vBuf)) == nullptr) {
        continue;
      }
      sLiteral = vBuf;
    } else {
      continue;
    }
    if (std::find(vHosts.begin(), vHosts.end(), sLiteral) == vHosts.end()) {
      vHosts.push_back(std::move(sLiteral));
    }
  }
  if (vHosts.empty()) {
    throw common::TransportError(0, "resolve_failed", "No usable address for " + sHost);
  }
  return vHosts;
}

HttpResponse CurlTransport::send(const HttpRequest& hreq) const {
  if (_epTarget.sScheme == "https" && !_epTarget.bIpLiteral) {
    // Connecting by IP literal keeps the server name out of the ClientHello.
    return sendVia(hreq, resolveConnectHosts(_epTarget.sHost));
  }
  return sendVia(hreq, {});
}

HttpResponse CurlTransport::sendVia(const HttpRequest& hreq,
                                    const std::vector<std::string>& vConnectHosts) const {
  if (vConnectHosts.empty()) {
    return perform(hreq, _epTarget.sAuthority, false);
  }

  for (size_t i = 0;; ++i) {
    std::string sAuthority = vConnectHosts[i];
    if (!_epTarget.sPort.empty()) {
      sAuthority += ":" + _epTarget.sPort;
    }
    try {
      return perform(hreq, sAuthority, true);
    } catch (const common::TransportError& ex) {
      if (ex._sErrorCode != "connect_failed" || i + 1 == vConnectHosts.size()) {
        throw;
      }
      _spLog->warn("Can't connect to {}, trying {}: {}", vConnectHosts[i], vConnectHosts[i + 1],
                   ex.what());
    }
  }
}

HttpResponse CurlTransport::perform(const HttpRequest& hreq, const std::string& sAuthority,
                                    bool bHostHeader) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> upCurl(curl_easy_init(),
                                                             &curl_easy_cleanup);
  if (!upCurl) {
    throw common::TransportError(0, "transport_failed", "Failed to initialize CURL");
  }
  CURL* pCurl = upCurl.get();

  const bool bHttps = _epTarget.sScheme == "https";
  std::vector<std::string> vHeaders = {"Content-Type: application/json", _sAuthHeader};
  if (bHostHeader) {
    vHeaders.push_back("Host: " + _epTarget.sAuthority);
  }

  std::string sUrl = _epTarget.sScheme + "://" + sAuthority + "/wapi/" + hreq.sPath + "?";
  for (const auto& [sKey, sValue] : hreq.vQuery) {
    sUrl += escape(pCurl, sKey) + "=" + escape(pCurl, sValue) + "&";
  }
  sUrl += std::string(kReturnAsObject) + "=1";

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> upHeaders(nullptr,
                                                                       &curl_slist_free_all);
  for (const auto& sHeader : vHeaders) {
    curl_slist* pNext = curl_slist_append(upHeaders.get(), sHeader.c_str());
    if (!pNext) {
      throw common::TransportError(0, "transport_failed", "Failed to build request headers");
    }
    upHeaders.release();
    upHeaders.reset(pNext);
  }

  Exchange exchange;
  SslContextHook hook{this, &exchange};
  char vErrBuf[CURL_ERROR_SIZE] = {};

  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &exchange);
  curl_easy_setopt(pCurl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(pCurl, CURLOPT_HEADERDATA, &exchange);
  curl_easy_setopt(pCurl, CURLOPT_ERRORBUFFER, vErrBuf);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(pCurl, CURLOPT_CONNECTTIMEOUT, _lTimeoutSeconds);
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT, _lTimeoutSeconds);

  if (hreq.sMethod == "GET") {
    curl_easy_setopt(pCurl, CURLOPT_HTTPGET, 1L);
  } else if (hreq.sMethod == "POST") {
    curl_easy_setopt(pCurl, CURLOPT_POST, 1L);
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(hreq.sBody.size()));
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, hreq.sBody.c_str());
  } else {
    curl_easy_setopt(pCurl, CURLOPT_CUSTOMREQUEST, hreq.sMethod.c_str());
    if (!hreq.sBody.empty()) {
      curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(hreq.sBody.size()));
      curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, hreq.sBody.c_str());
    }
  }

  if (bHttps) {
    curl_easy_setopt(pCurl, CURLOPT_SSLVERSION,
                     static_cast<long>(CURL_SSLVERSION_TLSv1_2 | CURL_SSLVERSION_MAX_TLSv1_2));
    curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYPEER, _bTlsVerify ? 1L : 0L);
    // Host name checking is done by OpenSSL against the configured name.
    curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYHOST, 0L);
    if (_bTlsVerify) {
      curl_easy_setopt(pCurl, CURLOPT_CAINFO, nullptr);
      curl_easy_setopt(pCurl, CURLOPT_CAPATH, nullptr);
    }
    curl_easy_setopt(pCurl, CURLOPT_SSL_CTX_FUNCTION, &SslContextHook::callback);
    curl_easy_setopt(pCurl, CURLOPT_SSL_CTX_DATA, &hook);
  }

  if (_bDebug) {
    _spLog->info("{}", toCurlCommand(hreq.sMethod, sUrl, vHeaders, hreq.sBody, !_bTlsVerify));
  }

  const CURLcode res = curl_easy_perform(pCurl);
  if (res != CURLE_OK) {
    std::string sDetail = !exchange.sSslError.empty() ? exchange.sSslError
                          : vErrBuf[0] != '\0'        ? std::string(vErrBuf)
                                                      : std::string(curl_easy_strerror(res));
    if (_bDebug) {
      _spLog->info("<-- HTTP FAILED: {}", sDetail);
    }
    throw common::TransportError(0, errorCodeFor(res),
                                 hreq.sMethod + " " + hreq.sPath + " failed: " + sDetail);
  }

  HttpResponse hres;
  long lStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &lStatus);
  hres.iStatus = static_cast<int>(lStatus);
  char* pContentType = nullptr;
  if (curl_easy_getinfo(pCurl, CURLINFO_CONTENT_TYPE, &pContentType) == CURLE_OK &&
      pContentType) {
    hres.sContentType = pContentType;
  }
  hres.sStatusMessage = std::move(exchange.sStatusMessage);
  hres.sBody = std::move(exchange.sBody);

  if (_bDebug) {
    _spLog->info("<-- {} {} ({} bytes)", hres.iStatus, hres.sStatusMessage, hres.sBody.size());
    if (!hres.sBody.empty()) {
      _spLog->info("{}", hres.sBody);
    }
  }
  return hres;
}

}  // namespace wapi::transport
