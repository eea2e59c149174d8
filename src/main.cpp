#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "fetch/FeedReader.hpp"
#include "parse/FeedChecksum.hpp"
#include "parse/FeedJson.hpp"
#include "parse/FeedParser.hpp"

namespace {

constexpr const char* kUsage =
    "usage:\n"
    "  feedlib fetch <url> [--proxy] [--allow-private] [--allow-non-webpage]\n"
    "  feedlib parse <raw.json> [--checksum <in>] [--save-checksum <out>] [--no-validate]\n";

std::string readFile(const std::string& sPath) {
  std::ifstream ifs(sPath, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Cannot open " + sPath);
  }
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& sPath, const std::string& sData) {
  std::ofstream ofs(sPath, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("Cannot write " + sPath);
  }
  ofs << sData;
}

// ── fetch ──────────────────────────────────────────────────────────────────

int runFetch(const feedlib::common::Config& cfgApp, const std::vector<std::string>& vArgs) {
  std::optional<std::string> oUrl;
  feedlib::fetch::FetchOptions foOptions;
  for (const auto& sArg : vArgs) {
    if (sArg == "--proxy") {
      foOptions.bUseProxy = true;
    } else if (sArg == "--allow-private") {
      foOptions.bAllowPrivateAddress = true;
    } else if (sArg == "--allow-non-webpage") {
      foOptions.bAllowNonWebpage = true;
    } else if (!oUrl && sArg.rfind("--", 0) != 0) {
      oUrl = sArg;
    } else {
      std::cerr << "unknown argument: " << sArg << "\n" << kUsage;
      return 2;
    }
  }
  if (!oUrl) {
    std::cerr << kUsage;
    return 2;
  }

  feedlib::fetch::FeedReader frdReader(cfgApp);
  const auto frResponse = frdReader.read(*oUrl, foOptions);

  std::cout << "status:       " << frResponse.status() << " ("
            << feedlib::fetch::statusName(frResponse.status()) << ")\n"
            << "url:          " << frResponse.url() << "\n"
            << "encoding:     " << frResponse.encoding().value_or("-") << "\n"
            << "feed_type:    " << frResponse.feedType().value_or("-") << "\n"
            << "content_type: " << frResponse.contentType().value_or("-") << "\n"
            << "use_proxy:    " << (frResponse.useProxy() ? "yes" : "no") << "\n"
            << "length:       " << frResponse.content().size() << "\n";
  return frResponse.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

// ── parse ──────────────────────────────────────────────────────────────────

int runParse(const std::vector<std::string>& vArgs) {
  std::optional<std::string> oInput;
  std::optional<std::string> oChecksumIn;
  std::optional<std::string> oChecksumOut;
  bool bValidate = true;
  for (size_t i = 0; i < vArgs.size(); ++i) {
    const auto& sArg = vArgs[i];
    if (sArg == "--no-validate") {
      bValidate = false;
    } else if (sArg == "--checksum" && i + 1 < vArgs.size()) {
      oChecksumIn = vArgs[++i];
    } else if (sArg == "--save-checksum" && i + 1 < vArgs.size()) {
      oChecksumOut = vArgs[++i];
    } else if (!oInput && sArg.rfind("--", 0) != 0) {
      oInput = sArg;
    } else {
      std::cerr << "unknown argument: " << sArg << "\n" << kUsage;
      return 2;
    }
  }
  if (!oInput) {
    std::cerr << kUsage;
    return 2;
  }

  feedlib::parse::FeedChecksum fcChecksum;
  if (oChecksumIn) {
    fcChecksum = feedlib::parse::FeedChecksum::load(readFile(*oChecksumIn));
  }

  const auto jRaw = nlohmann::json::parse(readFile(*oInput));
  const auto rfrRaw = jRaw.get<feedlib::parse::RawFeedResult>();

  feedlib::parse::FeedParser fpParser(fcChecksum, bValidate);
  const auto fresResult = fpParser.parse(rfrRaw);

  if (oChecksumOut) {
    writeFile(*oChecksumOut, fresResult.checksum().dump());
  }
  std::cout << nlohmann::json(fresResult).dump(2) << "\n";
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << kUsage;
    return 2;
  }
  const std::string sCommand = argv[1];
  const std::vector<std::string> vArgs(argv + 2, argv + argc);

  try {
    auto cfgApp = feedlib::common::Config::load();
    feedlib::common::Logger::init(cfgApp.sLogLevel);

    if (sCommand == "fetch") {
      return runFetch(cfgApp, vArgs);
    }
    if (sCommand == "parse") {
      return runParse(vArgs);
    }
    std::cerr << "unknown command: " << sCommand << "\n" << kUsage;
    return 2;
  } catch (const feedlib::common::FeedError& ex) {
    std::cerr << "[error] " << ex._sErrorCode << ": " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
