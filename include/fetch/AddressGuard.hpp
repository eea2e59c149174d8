#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace feedlib::fetch {

/// Pure abstract interface for host name resolution.
class IHostResolver {
 public:
  virtual ~IHostResolver() = default;

  /// Numeric addresses ("93.184.216.34", "2606:2800::1") for sHost.
  /// Returns an empty vector when the name does not resolve.
  virtual std::vector<std::string> resolve(const std::string& sHost) = 0;
};

/// getaddrinfo()-backed resolver.
class SystemHostResolver : public IHostResolver {
 public:
  std::vector<std::string> resolve(const std::string& sHost) override;
};

/// Outcome of an address check.
enum class GuardVerdict { Allowed, PrivateAddress, ResolveFailed, InvalidUrl };

/// Class abbreviation: gr
struct GuardResult {
  GuardVerdict eVerdict = GuardVerdict::InvalidUrl;
  std::string sHost;
  int iPort = 0;
  std::optional<std::string> oAddress;  // verified public address

  /// "host:port:address" for CURLOPT_RESOLVE. Empty unless Allowed, and
  /// empty for IP-literal hosts.
  std::string resolvePin() const;
};

/// Rejects URLs whose host resolves to a non-public address.
/// Class abbreviation: ag
class AddressGuard {
 public:
  explicit AddressGuard(std::shared_ptr<IHostResolver> spResolver);

  /// Parse sUrl, resolve its host and classify every address. A single
  /// non-public address rejects the whole host.
  GuardResult check(const std::string& sUrl) const;

  /// True for loopback, private, link-local, CGNAT, unspecified, multicast,
  /// documentation, benchmark and reserved ranges (IPv4 and IPv6).
  /// Unparseable input is treated as private.
  static bool isPrivateAddress(const std::string& sAddress);

 private:
  std::shared_ptr<IHostResolver> _spResolver;
};

}  // namespace feedlib::fetch
