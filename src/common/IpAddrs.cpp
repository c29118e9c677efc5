#include "common/IpAddrs.hpp"

#include "common/Errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <cstdint>

namespace wapi::common::ipaddrs {

namespace {

// inet_pton needs a NUL-terminated string; string_view may not be.
template <int kFamily, typename Addr>
bool parse(std::string_view sAddr, Addr& addr) {
  if (sAddr.empty() || sAddr.size() > 64) {
    return false;
  }
  const std::string sCopy(sAddr);
  return inet_pton(kFamily, sCopy.c_str(), &addr) == 1;
}

}  // namespace

bool isIPv4(std::string_view sAddr) {
  in_addr addr{};
  return parse<AF_INET>(sAddr, addr);
}

bool isIPv6(std::string_view sAddr) {
  in6_addr addr{};
  return parse<AF_INET6>(sAddr, addr);
}

void requireIPv4(std::string_view sAddr) {
  if (!isIPv4(sAddr)) {
    throw ValidationError("invalid_ipv4", "Invalid IPv4 address: '" + std::string(sAddr) + "'");
  }
}

void requireIPv6(std::string_view sAddr) {
  if (!isIPv6(sAddr)) {
    throw ValidationError("invalid_ipv6", "Invalid IPv6 address: '" + std::string(sAddr) + "'");
  }
}

void requireIPAddress(std::string_view sAddr) {
  if (!isIPv4(sAddr) && !isIPv6(sAddr)) {
    throw ValidationError("invalid_ip", "Invalid IP address: '" + std::string(sAddr) + "'");
  }
}

std::string addressField(std::string_view sAddr) {
  if (isIPv4(sAddr)) {
    return "ipv4addr";
  }
  if (isIPv6(sAddr)) {
    return "ipv6addr";
  }
  throw ValidationError("invalid_ip", "Invalid IP address: '" + std::string(sAddr) + "'");
}

std::string reverseMapName(std::string_view sAddr) {
  in_addr addr4{};
  if (parse<AF_INET>(sAddr, addr4)) {
    const auto* pOctets = reinterpret_cast<const uint8_t*>(&addr4);
    return std::to_string(pOctets[3]) + "." + std::to_string(pOctets[2]) + "." +
           std::to_string(pOctets[1]) + "." + std::to_string(pOctets[0]) + ".in-addr.arpa";
  }

  in6_addr addr6{};
  if (!parse<AF_INET6>(sAddr, addr6)) {
    throw ValidationError("invalid_ip", "Invalid IP address: '" + std::string(sAddr) + "'");
  }

  static_assert(sizeof(addr6) == 16, "in6_addr is the wrong size");
  const auto* pBytes = reinterpret_cast<const uint8_t*>(&addr6);
  constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                               '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

  std::string sName;
  sName.reserve(4 * sizeof(addr6) + 8);
  for (int n = static_cast<int>(sizeof(addr6)) - 1; n >= 0; --n) {
    const uint8_t uByte = pBytes[n];
    sName += kHexDigits[uByte & 0xF];
    sName += '.';
    sName += kHexDigits[(uByte >> 4) & 0xF];
    sName += '.';
  }
  sName += "ip6.arpa";
  return sName;
}

void requireNonEmpty(std::string_view sValue, std::string_view sWhat) {
  if (sValue.empty()) {
    throw ValidationError("missing_argument", std::string(sWhat) + " is empty");
  }
}

}  // namespace wapi::common::ipaddrs
