#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace feedlib::test {

/// One request as received by LocalHttpServer. Header names are lowercased.
struct ServerRequest {
  std::string sMethod;
  std::string sPath;
  std::map<std::string, std::string> mHeaders;
  std::string sBody;
};

struct ServerResponse {
  int iStatus = 200;
  std::vector<std::pair<std::string, std::string>> vHeaders;
  std::string sBody;
};

using RouteHandler = std::function<ServerResponse(const ServerRequest&)>;

/// Minimal HTTP/1.1 server on 127.0.0.1 with an ephemeral port, for
/// integration tests. Serves one connection at a time and closes it after
/// the response. Unrouted paths answer 404.
/// Class abbreviation: lhs
class LocalHttpServer {
 public:
  LocalHttpServer();
  ~LocalHttpServer();

  LocalHttpServer(const LocalHttpServer&) = delete;
  LocalHttpServer& operator=(const LocalHttpServer&) = delete;

  void route(const std::string& sPath, RouteHandler fnHandler);

  int port() const { return _iPort; }

  /// "http://127.0.0.1:<port><sPath>"
  std::string url(const std::string& sPath) const;

  int requestCount() const;
  std::vector<ServerRequest> requests() const;

 private:
  void serve(std::stop_token stToken);
  void handleClient(int iFd);

  int _iListenFd = -1;
  int _iPort = 0;
  mutable std::mutex _mtx;
  std::map<std::string, RouteHandler> _mRoutes;
  std::vector<ServerRequest> _vRequests;
  std::jthread _thrServer;
};

}  // namespace feedlib::test
