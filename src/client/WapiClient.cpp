#include "client/WapiClient.hpp"

#include "common/Errors.hpp"
#include "common/IpAddrs.hpp"
#include "common/Logger.hpp"
#include "transport/CurlTransport.hpp"

namespace wapi::client {

using common::QueryFilter;
using common::SearchModifier;
using common::withModifier;
namespace ipaddrs = common::ipaddrs;

namespace {

constexpr SearchModifier kDefaultModifier = SearchModifier::CaseInsensitive;

std::unique_ptr<transport::IHttpTransport> buildTransport(
    const common::Config& cfg, const std::shared_ptr<spdlog::logger>& spLog) {
  spLog->info("Initializing {}", cfg.toString());
  return std::make_unique<transport::CurlTransport>(cfg, spLog);
}

std::unique_ptr<transport::IHttpTransport> requireTransport(
    std::unique_ptr<transport::IHttpTransport> upTransport) {
  if (!upTransport) {
    throw common::ConfigurationError("missing_transport", "HTTP transport is null");
  }
  return upTransport;
}

}  // namespace

WapiClient::WapiClient(common::Config cfg, std::shared_ptr<spdlog::logger> spLog)
    : _cfg(std::move(cfg)),
      _spLog(common::Logger::resolve(std::move(spLog))),
      _upTransport(buildTransport(_cfg, _spLog)),
      _ceExecutor(*_upTransport),
      _pgPaginator(_ceExecutor, _spLog),
      _reEngine(_ceExecutor, _cfg.wapiVersion(), _cfg.ttl(), _spLog) {}

WapiClient::WapiClient(common::Config cfg, std::unique_ptr<transport::IHttpTransport> upTransport,
                       std::shared_ptr<spdlog::logger> spLog)
    : _cfg(std::move(cfg)),
      _spLog(common::Logger::resolve(std::move(spLog))),
      _upTransport(requireTransport(std::move(upTransport))),
      _ceExecutor(*_upTransport),
      _pgPaginator(_ceExecutor, _spLog),
      _reEngine(_ceExecutor, _cfg.wapiVersion(), _cfg.ttl(), _spLog) {}

WapiClient::~WapiClient() = default;

// ── Authoritative zones ────────────────────────────────────────────────────

std::vector<model::ZoneAuth> WapiClient::getAuthZones() const {
  return _reEngine.search<model::ZoneAuth>({});
}

std::vector<model::ZoneAuth> WapiClient::getAuthZones(const std::string& sDomainName) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return _reEngine.search<model::ZoneAuth>({{"fqdn", sDomainName}});
}

// ── Delegated zones ────────────────────────────────────────────────────────

std::vector<model::ZoneDelegate> WapiClient::getDelegatedZones(int iPageSize) const {
  return _pgPaginator.fetchAll<model::ZoneDelegate>(
      _reEngine.objectRequest("GET", model::RecordTraits<model::ZoneDelegate>::kObjectType),
      iPageSize);
}

std::vector<model::ZoneDelegate> WapiClient::getDelegatedZones(
    const std::string& sDomainName) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return _reEngine.search<model::ZoneDelegate>({{"fqdn", sDomainName}});
}

model::ZoneDelegate WapiClient::createDelegatedZone(
    const std::string& sDomainName, const std::vector<model::Delegate>& vDelegateTo,
    uint32_t uTtl) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  if (vDelegateTo.empty()) {
    throw common::ValidationError("missing_argument", "DelegateTo is empty");
  }
  nlohmann::json jReq = {
      {"fqdn", sDomainName}, {"delegate_to", vDelegateTo}, {"delegated_ttl", uTtl}};
  return _reEngine.create<model::ZoneDelegate>(jReq);
}

std::vector<model::ZoneDelegate> WapiClient::modifyDelegatedZone(
    const std::string& sDomainName, const nlohmann::json& jParams) const {
  if (!jParams.is_object() || jParams.empty()) {
    throw common::ValidationError("missing_argument", "Delegated zone params are empty");
  }
  return _reEngine.modifyEach(getDelegatedZones(sDomainName), jParams);
}

std::vector<std::string> WapiClient::deleteDelegatedZone(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getDelegatedZones(sDomainName));
}

// ── Host ───────────────────────────────────────────────────────────────────

std::vector<model::HostRecord> WapiClient::getHostRec(const std::string& sDomainName,
                                                      SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return _reEngine.search<model::HostRecord>({{withModifier("name", smModifier), sDomainName}});
}

std::vector<model::HostRecord> WapiClient::getHostRec(const std::string& sDomainName) const {
  return getHostRec(sDomainName, kDefaultModifier);
}

model::HostRecord WapiClient::createHostRec(const std::string& sDomainName,
                                            const std::vector<std::string>& vIpv4Addrs) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  if (vIpv4Addrs.empty()) {
    throw common::ValidationError("missing_argument", "IPv4Address list is empty");
  }
  nlohmann::json jAddrs = nlohmann::json::array();
  for (const auto& sAddr : vIpv4Addrs) {
    ipaddrs::requireIPv4(sAddr);
    jAddrs.push_back({{"ipv4addr", sAddr}});
  }

  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sDomainName;
  jReq["ipv4addrs"] = jAddrs;
  return _reEngine.create<model::HostRecord>(jReq);
}

std::vector<std::string> WapiClient::deleteHostRec(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getHostRec(sDomainName));
}

// ── A ──────────────────────────────────────────────────────────────────────

std::vector<model::ARecord> WapiClient::searchARec(const std::optional<std::string>& oDomainName,
                                                   const std::optional<std::string>& oIpv4Address,
                                                   SearchModifier smModifier) const {
  QueryFilter qf;
  if (oDomainName) {
    qf[withModifier("name", smModifier)] = *oDomainName;
  }
  if (oIpv4Address) {
    qf["ipv4addr"] = *oIpv4Address;
  }
  return _reEngine.search<model::ARecord>(qf);
}

std::vector<model::ARecord> WapiClient::getARec(const std::string& sDomainName,
                                                SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return searchARec(sDomainName, std::nullopt, smModifier);
}

std::vector<model::ARecord> WapiClient::getARec(const std::string& sDomainName) const {
  return getARec(sDomainName, kDefaultModifier);
}

std::vector<model::ARecord> WapiClient::getARec(const std::string& sDomainName,
                                                const std::string& sIpv4Address) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireIPv4(sIpv4Address);
  return searchARec(sDomainName, sIpv4Address, kDefaultModifier);
}

std::vector<model::ARecord> WapiClient::getARecByIp(const std::string& sIpv4Address) const {
  ipaddrs::requireIPv4(sIpv4Address);
  return searchARec(std::nullopt, sIpv4Address, kDefaultModifier);
}

model::ARecord WapiClient::createARec(const std::string& sDomainName,
                                      const std::string& sIpv4Address) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireIPv4(sIpv4Address);
  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sDomainName;
  jReq["ipv4addr"] = sIpv4Address;
  return _reEngine.create<model::ARecord>(jReq);
}

std::vector<std::string> WapiClient::deleteARec(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getARec(sDomainName));
}

std::vector<std::string> WapiClient::deleteARec(const std::string& sDomainName,
                                                const std::string& sIpv4Address) const {
  return _reEngine.deleteEach(getARec(sDomainName, sIpv4Address));
}

std::vector<model::ARecord> WapiClient::modifyARec(const std::string& sDomainName,
                                                   const std::string& sNewDomainName) const {
  ipaddrs::requireNonEmpty(sNewDomainName, "New domain name");
  return _reEngine.modifyEach(getARec(sDomainName), {{"name", sNewDomainName}});
}

std::vector<model::ARecord> WapiClient::modifyARec(const std::string& sDomainName,
                                                   const std::string& sIpv4Address,
                                                   const std::string& sNewIpv4Address) const {
  ipaddrs::requireIPv4(sNewIpv4Address);
  return _reEngine.modifyEach(getARec(sDomainName, sIpv4Address),
                              {{"ipv4addr", sNewIpv4Address}});
}

// ── AAAA ───────────────────────────────────────────────────────────────────

std::vector<model::AaaaRecord> WapiClient::searchAaaaRec(
    const std::optional<std::string>& oDomainName, const std::optional<std::string>& oIpv6Address,
    SearchModifier smModifier) const {
  QueryFilter qf;
  if (oDomainName) {
    qf[withModifier("name", smModifier)] = *oDomainName;
  }
  if (oIpv6Address) {
    qf["ipv6addr"] = *oIpv6Address;
  }
  return _reEngine.search<model::AaaaRecord>(qf);
}

std::vector<model::AaaaRecord> WapiClient::getAaaaRec(const std::string& sDomainName,
                                                      SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return searchAaaaRec(sDomainName, std::nullopt, smModifier);
}

std::vector<model::AaaaRecord> WapiClient::getAaaaRec(const std::string& sDomainName) const {
  return getAaaaRec(sDomainName, kDefaultModifier);
}

std::vector<model::AaaaRecord> WapiClient::getAaaaRec(const std::string& sDomainName,
                                                      const std::string& sIpv6Address) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireIPv6(sIpv6Address);
  return searchAaaaRec(sDomainName, sIpv6Address, kDefaultModifier);
}

std::vector<model::AaaaRecord> WapiClient::getAaaaRecByIp(const std::string& sIpv6Address) const {
  ipaddrs::requireIPv6(sIpv6Address);
  return searchAaaaRec(std::nullopt, sIpv6Address, kDefaultModifier);
}

model::AaaaRecord WapiClient::createAaaaRec(const std::string& sDomainName,
                                            const std::string& sIpv6Address) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireIPv6(sIpv6Address);
  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sDomainName;
  jReq["ipv6addr"] = sIpv6Address;
  return _reEngine.create<model::AaaaRecord>(jReq);
}

std::vector<std::string> WapiClient::deleteAaaaRec(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getAaaaRec(sDomainName));
}

std::vector<std::string> WapiClient::deleteAaaaRec(const std::string& sDomainName,
                                                   const std::string& sIpv6Address) const {
  return _reEngine.deleteEach(getAaaaRec(sDomainName, sIpv6Address));
}

std::vector<model::AaaaRecord> WapiClient::modifyAaaaRec(const std::string& sDomainName,
                                                         const std::string& sNewDomainName) const {
  ipaddrs::requireNonEmpty(sNewDomainName, "New domain name");
  return _reEngine.modifyEach(getAaaaRec(sDomainName), {{"name", sNewDomainName}});
}

std::vector<model::AaaaRecord> WapiClient::modifyAaaaRec(const std::string& sDomainName,
                                                         const std::string& sIpv6Address,
                                                         const std::string& sNewIpv6Address) const {
  ipaddrs::requireIPv6(sNewIpv6Address);
  return _reEngine.modifyEach(getAaaaRec(sDomainName, sIpv6Address),
                              {{"ipv6addr", sNewIpv6Address}});
}

// ── CNAME ──────────────────────────────────────────────────────────────────

std::vector<model::CnameRecord> WapiClient::searchCNameRec(
    const std::optional<std::string>& oAliasName, const std::optional<std::string>& oCanonicalName,
    SearchModifier smModifier) const {
  QueryFilter qf;
  if (oAliasName) {
    qf[withModifier("name", smModifier)] = *oAliasName;
  }
  if (oCanonicalName) {
    qf[withModifier("canonical", smModifier)] = *oCanonicalName;
  }
  return _reEngine.search<model::CnameRecord>(qf);
}

std::vector<model::CnameRecord> WapiClient::getCNameRec(const std::string& sAliasName,
                                                        SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sAliasName, "Alias name");
  return searchCNameRec(sAliasName, std::nullopt, smModifier);
}

std::vector<model::CnameRecord> WapiClient::getCNameRec(const std::string& sAliasName) const {
  return getCNameRec(sAliasName, kDefaultModifier);
}

std::vector<model::CnameRecord> WapiClient::getCNameRec(const std::string& sAliasName,
                                                        const std::string& sCanonicalName) const {
  ipaddrs::requireNonEmpty(sAliasName, "Alias name");
  ipaddrs::requireNonEmpty(sCanonicalName, "Canonical name");
  return searchCNameRec(sAliasName, sCanonicalName, kDefaultModifier);
}

std::vector<model::CnameRecord> WapiClient::getCNameCanonicalRec(
    const std::string& sCanonicalName) const {
  ipaddrs::requireNonEmpty(sCanonicalName, "Canonical name");
  return searchCNameRec(std::nullopt, sCanonicalName, kDefaultModifier);
}

model::CnameRecord WapiClient::createCNameRec(const std::string& sAliasName,
                                              const std::string& sCanonicalName) const {
  ipaddrs::requireNonEmpty(sAliasName, "Alias name");
  ipaddrs::requireNonEmpty(sCanonicalName, "Canonical name");
  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sAliasName;
  jReq["canonical"] = sCanonicalName;
  return _reEngine.create<model::CnameRecord>(jReq);
}

std::vector<std::string> WapiClient::deleteCNameRec(const std::string& sAliasName) const {
  return _reEngine.deleteEach(getCNameRec(sAliasName));
}

std::vector<std::string> WapiClient::deleteCNameRec(const std::string& sAliasName,
                                                    const std::string& sCanonicalName) const {
  return _reEngine.deleteEach(getCNameRec(sAliasName, sCanonicalName));
}

std::vector<model::CnameRecord> WapiClient::modifyCNameRec(const std::string& sAliasName,
                                                           const std::string& sNewAliasName) const {
  ipaddrs::requireNonEmpty(sNewAliasName, "New alias name");
  return _reEngine.modifyEach(getCNameRec(sAliasName), {{"name", sNewAliasName}});
}

std::vector<model::CnameRecord> WapiClient::modifyCNameCanonicalRec(
    const std::string& sAliasName, const std::string& sNewCanonicalName) const {
  ipaddrs::requireNonEmpty(sNewCanonicalName, "New canonical name");
  return _reEngine.modifyEach(getCNameRec(sAliasName), {{"canonical", sNewCanonicalName}});
}

// ── MX ─────────────────────────────────────────────────────────────────────

std::vector<model::MxRecord> WapiClient::getMxRec(const std::string& sDomainName,
                                                  SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return _reEngine.search<model::MxRecord>({{withModifier("name", smModifier), sDomainName}});
}

std::vector<model::MxRecord> WapiClient::getMxRec(const std::string& sDomainName) const {
  return getMxRec(sDomainName, kDefaultModifier);
}

std::vector<model::MxRecord> WapiClient::getMxRec(const std::string& sDomainName,
                                                  const std::string& sMailExchanger) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireNonEmpty(sMailExchanger, "MailExchanger");
  return _reEngine.search<model::MxRecord>(
      {{withModifier("name", kDefaultModifier), sDomainName}, {"mail_exchanger", sMailExchanger}});
}

model::MxRecord WapiClient::createMxRec(const std::string& sDomainName,
                                        const std::string& sMailExchanger,
                                        int iPreference) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireNonEmpty(sMailExchanger, "MailExchanger");
  if (iPreference < 0 || iPreference > 65535) {
    throw common::ValidationError("invalid_preference",
                                  "MX preference must be within 0..65535 (got " +
                                      std::to_string(iPreference) + ")");
  }
  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sDomainName;
  jReq["mail_exchanger"] = sMailExchanger;
  jReq["preference"] = iPreference;
  return _reEngine.create<model::MxRecord>(jReq);
}

std::vector<std::string> WapiClient::deleteMxRec(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getMxRec(sDomainName));
}

std::vector<std::string> WapiClient::deleteMxRec(const std::string& sDomainName,
                                                 const std::string& sMailExchanger) const {
  return _reEngine.deleteEach(getMxRec(sDomainName, sMailExchanger));
}

std::vector<model::MxRecord> WapiClient::modifyMxRec(const std::string& sDomainName,
                                                     const std::string& sNewDomainName) const {
  ipaddrs::requireNonEmpty(sNewDomainName, "New domain name");
  return _reEngine.modifyEach(getMxRec(sDomainName), {{"name", sNewDomainName}});
}

// ── PTR ────────────────────────────────────────────────────────────────────

std::vector<model::PtrRecord> WapiClient::getPtrRec(const std::string& sIpAddress) const {
  ipaddrs::requireNonEmpty(sIpAddress, "IPAddress");
  return _reEngine.search<model::PtrRecord>({{ipaddrs::addressField(sIpAddress), sIpAddress}});
}

std::vector<model::PtrRecord> WapiClient::getPtrdRec(const std::string& sPtrdname) const {
  ipaddrs::requireNonEmpty(sPtrdname, "Pointer domain name");
  return _reEngine.search<model::PtrRecord>(
      {{withModifier("ptrdname", kDefaultModifier), sPtrdname}});
}

model::PtrRecord WapiClient::createPtrRec(const std::string& sIpAddress,
                                          const std::string& sPtrdname) const {
  ipaddrs::requireNonEmpty(sPtrdname, "Pointer domain name");
  ipaddrs::requireNonEmpty(sIpAddress, "IPAddress");
  const std::string sAddrField = ipaddrs::addressField(sIpAddress);

  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = ipaddrs::reverseMapName(sIpAddress);
  jReq["ptrdname"] = sPtrdname;
  jReq[sAddrField] = sIpAddress;
  return _reEngine.create<model::PtrRecord>(jReq);
}

std::vector<model::PtrRecord> WapiClient::modifyPtrRec(const std::string& sIpAddress,
                                                       const std::string& sNewPtrdname) const {
  ipaddrs::requireNonEmpty(sNewPtrdname, "New pointer domain name");
  return _reEngine.modifyEach(getPtrRec(sIpAddress), {{"ptrdname", sNewPtrdname}});
}

std::vector<std::string> WapiClient::deletePtrRec(const std::string& sIpAddress) const {
  return _reEngine.deleteEach(getPtrRec(sIpAddress));
}

std::vector<std::string> WapiClient::deletePtrdRec(const std::string& sPtrdname) const {
  return _reEngine.deleteEach(getPtrdRec(sPtrdname));
}

// ── TXT ────────────────────────────────────────────────────────────────────

std::vector<model::TxtRecord> WapiClient::getTxtRec(const std::string& sDomainName,
                                                    SearchModifier smModifier) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  return _reEngine.search<model::TxtRecord>({{withModifier("name", smModifier), sDomainName}});
}

std::vector<model::TxtRecord> WapiClient::getTxtRec(const std::string& sDomainName) const {
  return getTxtRec(sDomainName, kDefaultModifier);
}

model::TxtRecord WapiClient::createTxtRec(const std::string& sDomainName,
                                          const std::string& sText) const {
  ipaddrs::requireNonEmpty(sDomainName, "Domain name");
  ipaddrs::requireNonEmpty(sText, "Text");
  auto jReq = _reEngine.newTtlRequest();
  jReq["name"] = sDomainName;
  jReq["text"] = sText;
  return _reEngine.create<model::TxtRecord>(jReq);
}

std::vector<std::string> WapiClient::deleteTxtRec(const std::string& sDomainName) const {
  return _reEngine.deleteEach(getTxtRec(sDomainName));
}

std::vector<model::TxtRecord> WapiClient::modifyTxtRec(const std::string& sDomainName,
                                                       const std::string& sNewText) const {
  ipaddrs::requireNonEmpty(sNewText, "New text");
  return _reEngine.modifyEach(getTxtRec(sDomainName), {{"text", sNewText}});
}

// ── TTL / generic ──────────────────────────────────────────────────────────

model::TtlRecord WapiClient::modifyTtlRef(const std::string& sRef, uint32_t uNewTtl) const {
  ipaddrs::requireNonEmpty(sRef, "Reference");
  auto jReq = _reEngine.newTtlRequest();
  jReq["ttl"] = uNewTtl;
  return _reEngine.modify<model::TtlRecord>(sRef, jReq);
}

std::string WapiClient::deleteRef(const std::string& sRef) const {
  _spLog->warn("Deleting a dns record with ref: {}", sRef);
  return _reEngine.deleteRef(sRef);
}

}  // namespace wapi::client
