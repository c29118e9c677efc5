#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "client/CallExecutor.hpp"
#include "client/Paginator.hpp"
#include "client/RecordEngine.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"
#include "model/Records.hpp"
#include "transport/IHttpTransport.hpp"

namespace wapi::client {

/// Client for the Infoblox appliance WAPI: DNS records and zones.
///
/// The transport is built once at construction (fail-fast on TLS or
/// trust-store problems). Every operation is synchronous and blocks for one
/// HTTP exchange; modify/delete by criteria issue one search followed by one
/// request per match, stopping at the first failure without rollback.
///
/// Errors: ValidationError before any request for malformed input,
/// ApiError for structured appliance errors, TransportError otherwise.
/// Class abbreviation: wc
class WapiClient {
 public:
  /// Build the libcurl transport from cfg. spLog defaults to Logger::get().
  explicit WapiClient(common::Config cfg, std::shared_ptr<spdlog::logger> spLog = nullptr);

  /// Use an existing transport (e.g. a test double).
  WapiClient(common::Config cfg, std::unique_ptr<transport::IHttpTransport> upTransport,
             std::shared_ptr<spdlog::logger> spLog = nullptr);

  ~WapiClient();

  WapiClient(const WapiClient&) = delete;
  WapiClient& operator=(const WapiClient&) = delete;

  const common::Config& config() const { return _cfg; }

  // ── Authoritative zones ────────────────────────────────────────────────
  std::vector<model::ZoneAuth> getAuthZones() const;
  std::vector<model::ZoneAuth> getAuthZones(const std::string& sDomainName) const;

  // ── Delegated zones ────────────────────────────────────────────────────
  /// Fetch all delegated zones, iPageSize results per request.
  std::vector<model::ZoneDelegate> getDelegatedZones(int iPageSize) const;
  std::vector<model::ZoneDelegate> getDelegatedZones(const std::string& sDomainName) const;
  model::ZoneDelegate createDelegatedZone(const std::string& sDomainName,
                                          const std::vector<model::Delegate>& vDelegateTo,
                                          uint32_t uTtl) const;
  std::vector<model::ZoneDelegate> modifyDelegatedZone(const std::string& sDomainName,
                                                       const nlohmann::json& jParams) const;
  std::vector<std::string> deleteDelegatedZone(const std::string& sDomainName) const;

  // ── Host ───────────────────────────────────────────────────────────────
  std::vector<model::HostRecord> getHostRec(const std::string& sDomainName,
                                            common::SearchModifier smModifier) const;
  std::vector<model::HostRecord> getHostRec(const std::string& sDomainName) const;
  model::HostRecord createHostRec(const std::string& sDomainName,
                                  const std::vector<std::string>& vIpv4Addrs) const;
  std::vector<std::string> deleteHostRec(const std::string& sDomainName) const;

  // ── A ──────────────────────────────────────────────────────────────────
  std::vector<model::ARecord> getARec(const std::string& sDomainName,
                                      common::SearchModifier smModifier) const;
  std::vector<model::ARecord> getARec(const std::string& sDomainName) const;
  std::vector<model::ARecord> getARec(const std::string& sDomainName,
                                      const std::string& sIpv4Address) const;
  std::vector<model::ARecord> getARecByIp(const std::string& sIpv4Address) const;
  model::ARecord createARec(const std::string& sDomainName, const std::string& sIpv4Address) const;
  std::vector<std::string> deleteARec(const std::string& sDomainName) const;
  std::vector<std::string> deleteARec(const std::string& sDomainName,
                                      const std::string& sIpv4Address) const;
  std::vector<model::ARecord> modifyARec(const std::string& sDomainName,
                                         const std::string& sNewDomainName) const;
  std::vector<model::ARecord> modifyARec(const std::string& sDomainName,
                                         const std::string& sIpv4Address,
                                         const std::string& sNewIpv4Address) const;

  // ── AAAA ───────────────────────────────────────────────────────────────
  std::vector<model::AaaaRecord> getAaaaRec(const std::string& sDomainName,
                                            common::SearchModifier smModifier) const;
  std::vector<model::AaaaRecord> getAaaaRec(const std::string& sDomainName) const;
  std::vector<model::AaaaRecord> getAaaaRec(const std::string& sDomainName,
                                            const std::string& sIpv6Address) const;
  std::vector<model::AaaaRecord> getAaaaRecByIp(const std::string& sIpv6Address) const;
  model::AaaaRecord createAaaaRec(const std::string& sDomainName,
                                  const std::string& sIpv6Address) const;
  std::vector<std::string> deleteAaaaRec(const std::string& sDomainName) const;
  std::vector<std::string> deleteAaaaRec(const std::string& sDomainName,
                                         const std::string& sIpv6Address) const;
  std::vector<model::AaaaRecord> modifyAaaaRec(const std::string& sDomainName,
                                               const std::string& sNewDomainName) const;
  std::vector<model::AaaaRecord> modifyAaaaRec(const std::string& sDomainName,
                                               const std::string& sIpv6Address,
                                               const std::string& sNewIpv6Address) const;

  // ── CNAME ──────────────────────────────────────────────────────────────
  std::vector<model::CnameRecord> getCNameRec(const std::string& sAliasName,
                                              common::SearchModifier smModifier) const;
  std::vector<model::CnameRecord> getCNameRec(const std::string& sAliasName) const;
  std::vector<model::CnameRecord> getCNameRec(const std::string& sAliasName,
                                              const std::string& sCanonicalName) const;
  std::vector<model::CnameRecord> getCNameCanonicalRec(const std::string& sCanonicalName) const;
  model::CnameRecord createCNameRec(const std::string& sAliasName,
                                    const std::string& sCanonicalName) const;
  std::vector<std::string> deleteCNameRec(const std::string& sAliasName) const;
  std::vector<std::string> deleteCNameRec(const std::string& sAliasName,
                                          const std::string& sCanonicalName) const;
  std::vector<model::CnameRecord> modifyCNameRec(const std::string& sAliasName,
                                                 const std::string& sNewAliasName) const;
  std::vector<model::CnameRecord> modifyCNameCanonicalRec(
      const std::string& sAliasName, const std::string& sNewCanonicalName) const;

  // ── MX ─────────────────────────────────────────────────────────────────
  std::vector<model::MxRecord> getMxRec(const std::string& sDomainName,
                                        common::SearchModifier smModifier) const;
  std::vector<model::MxRecord> getMxRec(const std::string& sDomainName) const;
  std::vector<model::MxRecord> getMxRec(const std::string& sDomainName,
                                        const std::string& sMailExchanger) const;
  model::MxRecord createMxRec(const std::string& sDomainName, const std::string& sMailExchanger,
                              int iPreference) const;
  std::vector<std::string> deleteMxRec(const std::string& sDomainName) const;
  std::vector<std::string> deleteMxRec(const std::string& sDomainName,
                                       const std::string& sMailExchanger) const;
  std::vector<model::MxRecord> modifyMxRec(const std::string& sDomainName,
                                           const std::string& sNewDomainName) const;

  // ── PTR ────────────────────────────────────────────────────────────────
  /// Search by address; ipv4addr or ipv6addr is chosen from the literal.
  std::vector<model::PtrRecord> getPtrRec(const std::string& sIpAddress) const;
  std::vector<model::PtrRecord> getPtrdRec(const std::string& sPtrdname) const;
  /// name is set to the reverse-mapping name of sIpAddress.
  model::PtrRecord createPtrRec(const std::string& sIpAddress, const std::string& sPtrdname) const;
  std::vector<model::PtrRecord> modifyPtrRec(const std::string& sIpAddress,
                                             const std::string& sNewPtrdname) const;
  std::vector<std::string> deletePtrRec(const std::string& sIpAddress) const;
  std::vector<std::string> deletePtrdRec(const std::string& sPtrdname) const;

  // ── TXT ────────────────────────────────────────────────────────────────
  std::vector<model::TxtRecord> getTxtRec(const std::string& sDomainName,
                                          common::SearchModifier smModifier) const;
  std::vector<model::TxtRecord> getTxtRec(const std::string& sDomainName) const;
  model::TxtRecord createTxtRec(const std::string& sDomainName, const std::string& sText) const;
  std::vector<std::string> deleteTxtRec(const std::string& sDomainName) const;
  std::vector<model::TxtRecord> modifyTxtRec(const std::string& sDomainName,
                                             const std::string& sNewText) const;

  // ── TTL / generic ──────────────────────────────────────────────────────
  /// Change the TTL of any record (sets use_ttl).
  template <typename T>
  model::TtlRecord modifyTtl(const T& rec, uint32_t uNewTtl) const {
    _spLog->warn("Changing TTL of {} record {} to '{}' seconds.", model::RecordTraits<T>::kLabel,
                 rec.sRef, uNewTtl);
    return modifyTtlRef(rec.sRef, uNewTtl);
  }

  /// Delete one record; returns its reference.
  template <typename T>
  std::string deleteRecord(const T& rec) const {
    _spLog->warn("Deleting a {} record: {}", model::RecordTraits<T>::kLabel,
                 nlohmann::json(rec).dump());
    return _reEngine.deleteRef(rec.sRef);
  }

  /// Delete the object with the given reference; returns the reference.
  std::string deleteRef(const std::string& sRef) const;

 private:
  model::TtlRecord modifyTtlRef(const std::string& sRef, uint32_t uNewTtl) const;

  std::vector<model::ARecord> searchARec(const std::optional<std::string>& oDomainName,
                                         const std::optional<std::string>& oIpv4Address,
                                         common::SearchModifier smModifier) const;
  std::vector<model::AaaaRecord> searchAaaaRec(const std::optional<std::string>& oDomainName,
                                               const std::optional<std::string>& oIpv6Address,
                                               common::SearchModifier smModifier) const;
  std::vector<model::CnameRecord> searchCNameRec(const std::optional<std::string>& oAliasName,
                                                 const std::optional<std::string>& oCanonicalName,
                                                 common::SearchModifier smModifier) const;

  common::Config _cfg;
  std::shared_ptr<spdlog::logger> _spLog;
  std::unique_ptr<transport::IHttpTransport> _upTransport;
  CallExecutor _ceExecutor;
  Paginator _pgPaginator;
  RecordEngine _reEngine;
};

}  // namespace wapi::client
