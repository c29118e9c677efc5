#pragma once

#include <string>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace wapi::security {

/// Trusted CA certificates loaded from a PKCS#12 (.p12) file.
/// A path prefixed with "classpath:" is resolved against the bundled
/// resource directory instead of the filesystem.
/// Immutable after construction; installTo() may be called concurrently.
/// Class abbreviation: ts
class TrustStore {
 public:
  static constexpr const char* kResourcePrefix = "classpath:";

  /// Load and parse the PKCS#12 file.
  /// Throws SecurityInitError if the file is missing, unreadable, the
  /// password is wrong, or it contains no certificates.
  TrustStore(const std::string& sPath, const std::string& sPassword,
             const std::string& sResourceDir);
  ~TrustStore();

  TrustStore(const TrustStore&) = delete;
  TrustStore& operator=(const TrustStore&) = delete;

  /// Add every trusted certificate to the SSL_CTX certificate store.
  /// Throws SecurityInitError if the store rejects a certificate.
  void installTo(SSL_CTX* pCtx) const;

  /// Number of trusted certificates.
  size_t size() const { return _vCerts.size(); }

  /// Filesystem path the store was read from.
  const std::string& path() const { return _sPath; }

  /// Map a configured trust-store location to a filesystem path.
  static std::string resolvePath(const std::string& sLocation, const std::string& sResourceDir);

 private:
  std::string _sPath;
  std::vector<X509*> _vCerts;  // owned
};

}  // namespace wapi::security
