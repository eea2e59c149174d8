#include "fetch/AddressGuard.hpp"

#include "common/Logger.hpp"
#include "common/UrlUtils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <utility>

namespace feedlib::fetch {

namespace {

struct Ipv4Range {
  uint32_t uNetwork;
  int iPrefix;
};

constexpr uint32_t ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
  return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
         (static_cast<uint32_t>(c) << 8) | static_cast<uint32_t>(d);
}

constexpr std::array<Ipv4Range, 15> kIpv4NonPublic = {{
    {ipv4(0, 0, 0, 0), 8},        // "this" network
    {ipv4(10, 0, 0, 0), 8},       // RFC 1918
    {ipv4(100, 64, 0, 0), 10},    // CGNAT
    {ipv4(127, 0, 0, 0), 8},      // loopback
    {ipv4(169, 254, 0, 0), 16},   // link-local
    {ipv4(172, 16, 0, 0), 12},    // RFC 1918
    {ipv4(192, 0, 0, 0), 24},     // IETF protocol assignments
    {ipv4(192, 0, 2, 0), 24},     // TEST-NET-1
    {ipv4(192, 88, 99, 0), 24},   // 6to4 relay anycast
    {ipv4(192, 168, 0, 0), 16},   // RFC 1918
    {ipv4(198, 18, 0, 0), 15},    // benchmarking
    {ipv4(198, 51, 100, 0), 24},  // TEST-NET-2
    {ipv4(203, 0, 113, 0), 24},   // TEST-NET-3
    {ipv4(224, 0, 0, 0), 4},      // multicast
    {ipv4(240, 0, 0, 0), 4},      // reserved + broadcast
}};

bool isPrivateIpv4(uint32_t uAddr) {
  return std::any_of(kIpv4NonPublic.begin(), kIpv4NonPublic.end(), [uAddr](const Ipv4Range& r) {
    const uint32_t uMask = r.iPrefix == 0 ? 0 : ~uint32_t{0} << (32 - r.iPrefix);
    return (uAddr & uMask) == r.uNetwork;
  });
}

bool isPrivateIpv6(const uint8_t* pAddr) {
  static constexpr uint8_t kZero[16] = {};
  // :: and ::1
  if (std::memcmp(pAddr, kZero, 15) == 0 && (pAddr[15] == 0 || pAddr[15] == 1)) {
    return true;
  }
  // ::ffff:a.b.c.d and ::a.b.c.d carry an IPv4 address
  const bool bMapped = std::memcmp(pAddr, kZero, 10) == 0 && pAddr[10] == 0xff && pAddr[11] == 0xff;
  const bool bCompat = std::memcmp(pAddr, kZero, 12) == 0;
  if (bMapped || bCompat) {
    return isPrivateIpv4(ipv4(pAddr[12], pAddr[13], pAddr[14], pAddr[15]));
  }
  if ((pAddr[0] & 0xfe) == 0xfc) return true;                       // fc00::/7 unique local
  if (pAddr[0] == 0xfe && (pAddr[1] & 0xc0) == 0x80) return true;   // fe80::/10 link-local
  if (pAddr[0] == 0xfe && (pAddr[1] & 0xc0) == 0xc0) return true;   // fec0::/10 site-local
  if (pAddr[0] == 0xff) return true;                                // ff00::/8 multicast
  if (pAddr[0] == 0x20 && pAddr[1] == 0x01 && pAddr[2] == 0x0d && pAddr[3] == 0xb8) {
    return true;  // 2001:db8::/32 documentation
  }
  if (pAddr[0] == 0x01 && pAddr[1] == 0x00 && std::memcmp(pAddr + 2, kZero, 6) == 0) {
    return true;  // 100::/64 discard
  }
  // 64:ff9b::/96 NAT64 embeds IPv4
  static constexpr uint8_t kNat64[12] = {0x00, 0x64, 0xff, 0x9b, 0, 0, 0, 0, 0, 0, 0, 0};
  if (std::memcmp(pAddr, kNat64, 12) == 0) {
    return isPrivateIpv4(ipv4(pAddr[12], pAddr[13], pAddr[14], pAddr[15]));
  }
  return false;
}

bool isIpLiteral(const std::string& sHost) {
  in_addr v4{};
  in6_addr v6{};
  return inet_pton(AF_INET, sHost.c_str(), &v4) == 1 ||
         inet_pton(AF_INET6, sHost.c_str(), &v6) == 1;
}

}  // namespace

// ── SystemHostResolver ─────────────────────────────────────────────────────

std::vector<std::string> SystemHostResolver::resolve(const std::string& sHost) {
  addrinfo aiHints{};
  aiHints.ai_family = AF_UNSPEC;
  aiHints.ai_socktype = SOCK_STREAM;

  addrinfo* pResult = nullptr;
  const int iRc = getaddrinfo(sHost.c_str(), nullptr, &aiHints, &pResult);
  if (iRc != 0 || !pResult) {
    common::Logger::get()->debug("getaddrinfo({}) failed: {}", sHost, gai_strerror(iRc));
    return {};
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> upResult(pResult, &freeaddrinfo);

  std::vector<std::string> vAddresses;
  char szBuf[INET6_ADDRSTRLEN] = {};
  for (addrinfo* p = upResult.get(); p != nullptr; p = p->ai_next) {
    const char* pText = nullptr;
    if (p->ai_family == AF_INET) {
      auto* pSin = reinterpret_cast<sockaddr_in*>(p->ai_addr);
      pText = inet_ntop(AF_INET, &pSin->sin_addr, szBuf, sizeof(szBuf));
    } else if (p->ai_family == AF_INET6) {
      auto* pSin6 = reinterpret_cast<sockaddr_in6*>(p->ai_addr);
      pText = inet_ntop(AF_INET6, &pSin6->sin6_addr, szBuf, sizeof(szBuf));
    }
    if (pText && std::find(vAddresses.begin(), vAddresses.end(), pText) == vAddresses.end()) {
      vAddresses.emplace_back(pText);
    }
  }
  return vAddresses;
}

// ── GuardResult ────────────────────────────────────────────────────────────

std::string GuardResult::resolvePin() const {
  // A literal host is connected to as-is; there is no lookup to pin.
  if (eVerdict != GuardVerdict::Allowed || !oAddress || isIpLiteral(sHost)) {
    return {};
  }
  const bool bIpv6 = oAddress->find(':') != std::string::npos;
  return sHost + ":" + std::to_string(iPort) + ":" + (bIpv6 ? "[" + *oAddress + "]" : *oAddress);
}

// ── AddressGuard ───────────────────────────────────────────────────────────

AddressGuard::AddressGuard(std::shared_ptr<IHostResolver> spResolver)
    : _spResolver(std::move(spResolver)) {}

bool AddressGuard::isPrivateAddress(const std::string& sAddress) {
  in_addr v4{};
  if (inet_pton(AF_INET, sAddress.c_str(), &v4) == 1) {
    return isPrivateIpv4(ntohl(v4.s_addr));
  }
  in6_addr v6{};
  if (inet_pton(AF_INET6, sAddress.c_str(), &v6) == 1) {
    return isPrivateIpv6(v6.s6_addr);
  }
  return true;
}

GuardResult AddressGuard::check(const std::string& sUrl) const {
  GuardResult gr;
  const auto oParts = common::parseUrl(sUrl);
  if (!oParts || (oParts->sScheme != "http" && oParts->sScheme != "https")) {
    return gr;
  }
  gr.sHost = oParts->sHost;
  gr.iPort = oParts->iPort;

  std::vector<std::string> vAddresses;
  if (isIpLiteral(gr.sHost)) {
    vAddresses.push_back(gr.sHost);
  } else {
    vAddresses = _spResolver->resolve(gr.sHost);
  }
  if (vAddresses.empty()) {
    gr.eVerdict = GuardVerdict::ResolveFailed;
    return gr;
  }

  for (const auto& sAddress : vAddresses) {
    if (isPrivateAddress(sAddress)) {
      common::Logger::get()->warn("Rejected {}: host {} resolves to non-public address {}", sUrl,
                                  gr.sHost, sAddress);
      gr.eVerdict = GuardVerdict::PrivateAddress;
      gr.oAddress = sAddress;
      return gr;
    }
  }
  gr.eVerdict = GuardVerdict::Allowed;
  gr.oAddress = vAddresses.front();
  return gr;
}

}  // namespace feedlib::fetch
