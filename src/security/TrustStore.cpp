#include "security/TrustStore.hpp"

#include "common/Errors.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>

#include <memory>

namespace wapi::security {

namespace {

std::string lastOpenSslError() {
  const unsigned long uErr = ERR_get_error();
  if (uErr == 0) {
    return "unknown error";
  }
  char vBuf[256];
  ERR_error_string_n(uErr, vBuf, sizeof(vBuf));
  ERR_clear_error();
  return vBuf;
}

}  // namespace

std::string TrustStore::resolvePath(const std::string& sLocation,
                                    const std::string& sResourceDir) {
  const std::string sPrefix = kResourcePrefix;
  if (sLocation.compare(0, sPrefix.size(), sPrefix) != 0) {
    return sLocation;
  }

  std::string sRelative = sLocation.substr(sPrefix.size());
  while (!sRelative.empty() && sRelative.front() == '/') {
    sRelative.erase(0, 1);
  }
  if (sResourceDir.empty()) {
    return sRelative;
  }
  if (sResourceDir.back() == '/') {
    return sResourceDir + sRelative;
  }
  return sResourceDir + "/" + sRelative;
}

TrustStore::TrustStore(const std::string& sPath, const std::string& sPassword,
                       const std::string& sResourceDir)
    : _sPath(resolvePath(sPath, sResourceDir)) {
  std::unique_ptr<BIO, decltype(&BIO_free)> upBio(BIO_new_file(_sPath.c_str(), "rb"), &BIO_free);
  if (!upBio) {
    ERR_clear_error();
    throw common::SecurityInitError("trust_store_not_found",
                                    "Can't find the trustStore: " + _sPath);
  }

  std::unique_ptr<PKCS12, decltype(&PKCS12_free)> upP12(d2i_PKCS12_bio(upBio.get(), nullptr),
                                                        &PKCS12_free);
  if (!upP12) {
    throw common::SecurityInitError("trust_store_invalid",
                                    "Can't load the trustStore: " + _sPath + " (" +
                                        lastOpenSslError() + ")");
  }

  EVP_PKEY* pKey = nullptr;
  X509* pCert = nullptr;
  STACK_OF(X509)* pCa = nullptr;
  if (PKCS12_parse(upP12.get(), sPassword.c_str(), &pKey, &pCert, &pCa) != 1) {
    throw common::SecurityInitError("trust_store_invalid",
                                    "Can't load the trustStore: " + _sPath + " (" +
                                        lastOpenSslError() + ")");
  }

  // Only certificates are trust material; a private key, if bundled, is dropped.
  EVP_PKEY_free(pKey);

  if (pCert) {
    _vCerts.push_back(pCert);
  }
  if (pCa) {
    while (sk_X509_num(pCa) > 0) {
      _vCerts.push_back(sk_X509_shift(pCa));
    }
    sk_X509_free(pCa);
  }

  if (_vCerts.empty()) {
    throw common::SecurityInitError("trust_store_empty",
                                    "TrustStore contains no certificates: " + _sPath);
  }
}

TrustStore::~TrustStore() {
  for (X509* pCert : _vCerts) {
    X509_free(pCert);
  }
}

void TrustStore::installTo(SSL_CTX* pCtx) const {
  X509_STORE* pStore = SSL_CTX_get_cert_store(pCtx);
  if (!pStore) {
    throw common::SecurityInitError("tls_context_failed", "SSL_CTX has no certificate store");
  }
  for (X509* pCert : _vCerts) {
    if (X509_STORE_add_cert(pStore, pCert) != 1) {
      // The same CA may already be present from an earlier handshake setup.
      const unsigned long uErr = ERR_peek_last_error();
      if (ERR_GET_REASON(uErr) == X509_R_CERT_ALREADY_IN_HASH_TABLE) {
        ERR_clear_error();
        continue;
      }
      throw common::SecurityInitError("tls_context_failed",
                                      "Can't add trusted certificate: " + lastOpenSslError());
    }
  }
}

}  // namespace wapi::security
