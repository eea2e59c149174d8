#include "fetch/AsyncFeedReader.hpp"

#include <utility>

namespace feedlib::fetch {

AsyncFeedReader::AsyncFeedReader(common::Config cfg, std::shared_ptr<IHttpTransport> spTransport,
                                 std::shared_ptr<IHostResolver> spResolver)
    : _frdReader(std::move(cfg), std::move(spTransport), std::move(spResolver)),
      _tpPool(_frdReader.config().iThreadPoolSize) {}

std::future<FeedResponse> AsyncFeedReader::read(const std::string& sUrl,
                                                FetchOptions foOptions) {
  return _tpPool.submit([this, sUrl, foOptions = std::move(foOptions)]() {
    return _frdReader.read(sUrl, foOptions);
  });
}

void AsyncFeedReader::shutdown() { _tpPool.shutdown(); }

}  // namespace feedlib::fetch
