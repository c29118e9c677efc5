#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wapi::model {

// Every record carries the server-assigned reference (_ref) used for modify
// and delete. A response that returns a bare reference string instead of an
// object maps to a record with only sRef set.

/// Address (A) record.
/// Class abbreviation: ar
struct ARecord {
  std::string sRef;
  std::string sName;
  std::string sIpv4Addr;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// IPv6 address (AAAA) record.
/// Class abbreviation: aaaa
struct AaaaRecord {
  std::string sRef;
  std::string sName;
  std::string sIpv6Addr;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// Alias (CNAME) record.
/// Class abbreviation: cr
struct CnameRecord {
  std::string sRef;
  std::string sName;
  std::string sCanonical;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// Mail exchanger (MX) record.
/// Class abbreviation: mr
struct MxRecord {
  std::string sRef;
  std::string sName;
  std::string sMailExchanger;
  int iPreference = 0;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// Pointer (PTR) record. Exactly one of the address fields is normally set.
/// Class abbreviation: pr
struct PtrRecord {
  std::string sRef;
  std::string sName;
  std::string sPtrdname;
  std::optional<std::string> oIpv4Addr;
  std::optional<std::string> oIpv6Addr;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// Text (TXT) record.
/// Class abbreviation: tr
struct TxtRecord {
  std::string sRef;
  std::string sName;
  std::string sText;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// One IPv4 address entry of a host record.
/// Class abbreviation: ha
struct HostAddress {
  std::string sRef;
  std::string sIpv4Addr;
  std::string sHost;
  bool bConfigureForDhcp = false;
};

/// Host record.
/// Class abbreviation: hr
struct HostRecord {
  std::string sRef;
  std::string sName;
  std::vector<HostAddress> vIpv4Addrs;
  std::string sView;
  std::optional<uint32_t> oTtl;
};

/// Result of a TTL change: the record reference with its effective TTL.
/// Class abbreviation: ttl
struct TtlRecord {
  std::string sRef;
  std::optional<uint32_t> oTtl;
  bool bUseTtl = false;
};

/// Authoritative zone.
/// Class abbreviation: za
struct ZoneAuth {
  std::string sRef;
  std::string sFqdn;
  std::string sView;
};

/// Name server a zone is delegated to.
/// Class abbreviation: dg
struct Delegate {
  std::string sAddress;
  std::string sName;
};

/// Delegated zone.
/// Class abbreviation: zd
struct ZoneDelegate {
  std::string sRef;
  std::string sFqdn;
  std::vector<Delegate> vDelegateTo;
  std::optional<uint32_t> oDelegatedTtl;
  std::string sView;
  bool bLocked = false;
};

/// Structured WAPI error body: {"Error": ..., "code": ..., "text": ...}.
/// Class abbreviation: we
struct WapiError {
  std::string sError;
  std::string sCode;
  std::string sText;
};

// ── JSON mapping ───────────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, ARecord& ar);
void to_json(nlohmann::json& j, const ARecord& ar);
void from_json(const nlohmann::json& j, AaaaRecord& aaaa);
void to_json(nlohmann::json& j, const AaaaRecord& aaaa);
void from_json(const nlohmann::json& j, CnameRecord& cr);
void to_json(nlohmann::json& j, const CnameRecord& cr);
void from_json(const nlohmann::json& j, MxRecord& mr);
void to_json(nlohmann::json& j, const MxRecord& mr);
void from_json(const nlohmann::json& j, PtrRecord& pr);
void to_json(nlohmann::json& j, const PtrRecord& pr);
void from_json(const nlohmann::json& j, TxtRecord& tr);
void to_json(nlohmann::json& j, const TxtRecord& tr);
void from_json(const nlohmann::json& j, HostAddress& ha);
void to_json(nlohmann::json& j, const HostAddress& ha);
void from_json(const nlohmann::json& j, HostRecord& hr);
void to_json(nlohmann::json& j, const HostRecord& hr);
void from_json(const nlohmann::json& j, TtlRecord& ttl);
void to_json(nlohmann::json& j, const TtlRecord& ttl);
void from_json(const nlohmann::json& j, ZoneAuth& za);
void to_json(nlohmann::json& j, const ZoneAuth& za);
void from_json(const nlohmann::json& j, Delegate& dg);
void to_json(nlohmann::json& j, const Delegate& dg);
void from_json(const nlohmann::json& j, ZoneDelegate& zd);
void to_json(nlohmann::json& j, const ZoneDelegate& zd);
void from_json(const nlohmann::json& j, WapiError& we);

// ── Per-kind capability table ──────────────────────────────────────────────

/// WAPI object type and log label for each record kind handled by RecordEngine.
template <typename T>
struct RecordTraits;

template <>
struct RecordTraits<ARecord> {
  static constexpr const char* kObjectType = "record:a";
  static constexpr const char* kLabel = "A";
};

template <>
struct RecordTraits<AaaaRecord> {
  static constexpr const char* kObjectType = "record:aaaa";
  static constexpr const char* kLabel = "AAAA";
};

template <>
struct RecordTraits<CnameRecord> {
  static constexpr const char* kObjectType = "record:cname";
  static constexpr const char* kLabel = "CNAME";
};

template <>
struct RecordTraits<MxRecord> {
  static constexpr const char* kObjectType = "record:mx";
  static constexpr const char* kLabel = "MX";
};

template <>
struct RecordTraits<PtrRecord> {
  static constexpr const char* kObjectType = "record:ptr";
  static constexpr const char* kLabel = "PTR";
};

template <>
struct RecordTraits<TxtRecord> {
  static constexpr const char* kObjectType = "record:txt";
  static constexpr const char* kLabel = "TXT";
};

template <>
struct RecordTraits<HostRecord> {
  static constexpr const char* kObjectType = "record:host";
  static constexpr const char* kLabel = "host";
};

template <>
struct RecordTraits<ZoneAuth> {
  static constexpr const char* kObjectType = "zone_auth";
  static constexpr const char* kLabel = "authoritative zone";
};

template <>
struct RecordTraits<ZoneDelegate> {
  static constexpr const char* kObjectType = "zone_delegated";
  static constexpr const char* kLabel = "delegated zone";
};

}  // namespace wapi::model
