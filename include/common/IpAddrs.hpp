#pragma once

#include <string>
#include <string_view>

namespace wapi::common::ipaddrs {

/// True if sAddr is a dotted-quad IPv4 literal.
bool isIPv4(std::string_view sAddr);

/// True if sAddr is an IPv6 literal (no brackets, no zone id).
bool isIPv6(std::string_view sAddr);

/// Throws ValidationError unless sAddr is an IPv4 literal.
void requireIPv4(std::string_view sAddr);

/// Throws ValidationError unless sAddr is an IPv6 literal.
void requireIPv6(std::string_view sAddr);

/// Throws ValidationError unless sAddr is an IPv4 or IPv6 literal.
void requireIPAddress(std::string_view sAddr);

/// WAPI field name for the address family of sAddr: "ipv4addr" or "ipv6addr".
/// Throws ValidationError if sAddr is neither.
std::string addressField(std::string_view sAddr);

/// Reverse-mapping name without trailing dot.
///   10.0.0.5     -> 5.0.0.10.in-addr.arpa
///   2001:db8::1  -> 1.0.0.0. ... .8.b.d.0.1.0.0.2.ip6.arpa
std::string reverseMapName(std::string_view sAddr);

/// Throws ValidationError with "<sWhat> is empty" if sValue is empty.
void requireNonEmpty(std::string_view sValue, std::string_view sWhat);

}  // namespace wapi::common::ipaddrs
