#pragma once

#include <future>
#include <memory>
#include <string>

#include "common/Config.hpp"
#include "core/ThreadPool.hpp"
#include "fetch/FeedReader.hpp"

namespace feedlib::fetch {

/// Future-returning fetcher. Runs FeedReader::read on a fixed worker pool
/// sized by FEEDLIB_THREAD_POOL_SIZE.
/// Class abbreviation: afr
class AsyncFeedReader {
 public:
  explicit AsyncFeedReader(common::Config cfg,
                           std::shared_ptr<IHttpTransport> spTransport = nullptr,
                           std::shared_ptr<IHostResolver> spResolver = nullptr);

  /// Same result as FeedReader::read for the same inputs. A ConfigError is
  /// delivered through the future.
  std::future<FeedResponse> read(const std::string& sUrl, FetchOptions foOptions = {});

  /// Finish queued fetches and stop the workers.
  void shutdown();

 private:
  FeedReader _frdReader;
  core::ThreadPool _tpPool;  // declared last: joins before _frdReader is destroyed
};

}  // namespace feedlib::fetch
