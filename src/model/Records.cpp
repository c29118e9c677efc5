#include "model/Records.hpp"

#include <limits>
#include <stdexcept>

namespace wapi::model {

namespace {

using nlohmann::json;

// A create/modify response may carry a bare reference instead of an object.
template <typename T>
bool refOnly(const json& j, T& rec) {
  if (!j.is_string()) {
    return false;
  }
  rec = T{};
  rec.sRef = j.get<std::string>();
  return true;
}

std::string optString(const json& j, const char* pKey) {
  auto it = j.find(pKey);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

std::optional<std::string> optField(const json& j, const char* pKey) {
  auto it = j.find(pKey);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

// get<uint32_t>() wraps negative and oversized numbers silently.
std::optional<uint32_t> optTtl(const json& j, const char* pKey = "ttl") {
  auto it = j.find(pKey);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  constexpr uint64_t kMaxTtl = std::numeric_limits<uint32_t>::max();
  const bool bInRange =
      it->is_number_unsigned()
          ? it->get<uint64_t>() <= kMaxTtl
          : it->is_number_integer() && it->get<int64_t>() >= 0 &&
                static_cast<uint64_t>(it->get<int64_t>()) <= kMaxTtl;
  if (!bInRange) {
    throw std::out_of_range(std::string(pKey) + " is not a 32-bit unsigned value: " +
                            it->dump());
  }
  return static_cast<uint32_t>(it->get<uint64_t>());
}

void putCommon(json& j, const std::string& sRef, const std::string& sView,
               const std::optional<uint32_t>& oTtl) {
  j["_ref"] = sRef;
  if (!sView.empty()) {
    j["view"] = sView;
  }
  if (oTtl) {
    j["ttl"] = *oTtl;
  }
}

}  // namespace

// ── A / AAAA ───────────────────────────────────────────────────────────────

void from_json(const json& j, ARecord& ar) {
  if (refOnly(j, ar)) return;
  ar.sRef = j.at("_ref").get<std::string>();
  ar.sName = optString(j, "name");
  ar.sIpv4Addr = optString(j, "ipv4addr");
  ar.sView = optString(j, "view");
  ar.oTtl = optTtl(j);
}

void to_json(json& j, const ARecord& ar) {
  j = json::object();
  putCommon(j, ar.sRef, ar.sView, ar.oTtl);
  j["name"] = ar.sName;
  j["ipv4addr"] = ar.sIpv4Addr;
}

void from_json(const json& j, AaaaRecord& aaaa) {
  if (refOnly(j, aaaa)) return;
  aaaa.sRef = j.at("_ref").get<std::string>();
  aaaa.sName = optString(j, "name");
  aaaa.sIpv6Addr = optString(j, "ipv6addr");
  aaaa.sView = optString(j, "view");
  aaaa.oTtl = optTtl(j);
}

void to_json(json& j, const AaaaRecord& aaaa) {
  j = json::object();
  putCommon(j, aaaa.sRef, aaaa.sView, aaaa.oTtl);
  j["name"] = aaaa.sName;
  j["ipv6addr"] = aaaa.sIpv6Addr;
}

// ── CNAME ──────────────────────────────────────────────────────────────────

void from_json(const json& j, CnameRecord& cr) {
  if (refOnly(j, cr)) return;
  cr.sRef = j.at("_ref").get<std::string>();
  cr.sName = optString(j, "name");
  cr.sCanonical = optString(j, "canonical");
  cr.sView = optString(j, "view");
  cr.oTtl = optTtl(j);
}

void to_json(json& j, const CnameRecord& cr) {
  j = json::object();
  putCommon(j, cr.sRef, cr.sView, cr.oTtl);
  j["name"] = cr.sName;
  j["canonical"] = cr.sCanonical;
}

// ── MX ─────────────────────────────────────────────────────────────────────

void from_json(const json& j, MxRecord& mr) {
  if (refOnly(j, mr)) return;
  mr.sRef = j.at("_ref").get<std::string>();
  mr.sName = optString(j, "name");
  mr.sMailExchanger = optString(j, "mail_exchanger");
  mr.iPreference = j.value("preference", 0);
  mr.sView = optString(j, "view");
  mr.oTtl = optTtl(j);
}

void to_json(json& j, const MxRecord& mr) {
  j = json::object();
  putCommon(j, mr.sRef, mr.sView, mr.oTtl);
  j["name"] = mr.sName;
  j["mail_exchanger"] = mr.sMailExchanger;
  j["preference"] = mr.iPreference;
}

// ── PTR ────────────────────────────────────────────────────────────────────

void from_json(const json& j, PtrRecord& pr) {
  if (refOnly(j, pr)) return;
  pr.sRef = j.at("_ref").get<std::string>();
  pr.sName = optString(j, "name");
  pr.sPtrdname = optString(j, "ptrdname");
  pr.oIpv4Addr = optField(j, "ipv4addr");
  pr.oIpv6Addr = optField(j, "ipv6addr");
  pr.sView = optString(j, "view");
  pr.oTtl = optTtl(j);
}

void to_json(json& j, const PtrRecord& pr) {
  j = json::object();
  putCommon(j, pr.sRef, pr.sView, pr.oTtl);
  j["name"] = pr.sName;
  j["ptrdname"] = pr.sPtrdname;
  if (pr.oIpv4Addr) {
    j["ipv4addr"] = *pr.oIpv4Addr;
  }
  if (pr.oIpv6Addr) {
    j["ipv6addr"] = *pr.oIpv6Addr;
  }
}

// ── TXT ────────────────────────────────────────────────────────────────────

void from_json(const json& j, TxtRecord& tr) {
  if (refOnly(j, tr)) return;
  tr.sRef = j.at("_ref").get<std::string>();
  tr.sName = optString(j, "name");
  tr.sText = optString(j, "text");
  tr.sView = optString(j, "view");
  tr.oTtl = optTtl(j);
}

void to_json(json& j, const TxtRecord& tr) {
  j = json::object();
  putCommon(j, tr.sRef, tr.sView, tr.oTtl);
  j["name"] = tr.sName;
  j["text"] = tr.sText;
}

// ── Host ───────────────────────────────────────────────────────────────────

void from_json(const json& j, HostAddress& ha) {
  ha.sRef = optString(j, "_ref");
  ha.sIpv4Addr = optString(j, "ipv4addr");
  ha.sHost = optString(j, "host");
  ha.bConfigureForDhcp = j.value("configure_for_dhcp", false);
}

void to_json(json& j, const HostAddress& ha) {
  j = json::object();
  if (!ha.sRef.empty()) {
    j["_ref"] = ha.sRef;
  }
  j["ipv4addr"] = ha.sIpv4Addr;
  if (!ha.sHost.empty()) {
    j["host"] = ha.sHost;
  }
  j["configure_for_dhcp"] = ha.bConfigureForDhcp;
}

void from_json(const json& j, HostRecord& hr) {
  if (refOnly(j, hr)) return;
  hr.sRef = j.at("_ref").get<std::string>();
  hr.sName = optString(j, "name");
  hr.vIpv4Addrs.clear();
  auto it = j.find("ipv4addrs");
  if (it != j.end() && it->is_array()) {
    hr.vIpv4Addrs = it->get<std::vector<HostAddress>>();
  }
  hr.sView = optString(j, "view");
  hr.oTtl = optTtl(j);
}

void to_json(json& j, const HostRecord& hr) {
  j = json::object();
  putCommon(j, hr.sRef, hr.sView, hr.oTtl);
  j["name"] = hr.sName;
  j["ipv4addrs"] = hr.vIpv4Addrs;
}

// ── TTL ────────────────────────────────────────────────────────────────────

void from_json(const json& j, TtlRecord& ttl) {
  if (refOnly(j, ttl)) return;
  ttl.sRef = j.at("_ref").get<std::string>();
  ttl.oTtl = optTtl(j);
  ttl.bUseTtl = j.value("use_ttl", false);
}

void to_json(json& j, const TtlRecord& ttl) {
  j = json::object();
  j["_ref"] = ttl.sRef;
  if (ttl.oTtl) {
    j["ttl"] = *ttl.oTtl;
  }
  j["use_ttl"] = ttl.bUseTtl;
}

// ── Zones ──────────────────────────────────────────────────────────────────

void from_json(const json& j, ZoneAuth& za) {
  if (refOnly(j, za)) return;
  za.sRef = j.at("_ref").get<std::string>();
  za.sFqdn = optString(j, "fqdn");
  za.sView = optString(j, "view");
}

void to_json(json& j, const ZoneAuth& za) {
  j = json::object();
  putCommon(j, za.sRef, za.sView, std::nullopt);
  j["fqdn"] = za.sFqdn;
}

void from_json(const json& j, Delegate& dg) {
  dg.sAddress = optString(j, "address");
  dg.sName = optString(j, "name");
}

void to_json(json& j, const Delegate& dg) {
  j = json{{"address", dg.sAddress}, {"name", dg.sName}};
}

void from_json(const json& j, ZoneDelegate& zd) {
  if (refOnly(j, zd)) return;
  zd.sRef = j.at("_ref").get<std::string>();
  zd.sFqdn = optString(j, "fqdn");
  zd.vDelegateTo.clear();
  auto it = j.find("delegate_to");
  if (it != j.end() && it->is_array()) {
    zd.vDelegateTo = it->get<std::vector<Delegate>>();
  }
  zd.oDelegatedTtl = optTtl(j, "delegated_ttl");
  zd.sView = optString(j, "view");
  zd.bLocked = j.value("locked", false);
}

void to_json(json& j, const ZoneDelegate& zd) {
  j = json::object();
  putCommon(j, zd.sRef, zd.sView, std::nullopt);
  j["fqdn"] = zd.sFqdn;
  j["delegate_to"] = zd.vDelegateTo;
  if (zd.oDelegatedTtl) {
    j["delegated_ttl"] = *zd.oDelegatedTtl;
  }
  j["locked"] = zd.bLocked;
}

// ── Error body ─────────────────────────────────────────────────────────────

void from_json(const json& j, WapiError& we) {
  we.sError = j.at("Error").get<std::string>();
  we.sCode = optString(j, "code");
  we.sText = optString(j, "text");
}

}  // namespace wapi::model
