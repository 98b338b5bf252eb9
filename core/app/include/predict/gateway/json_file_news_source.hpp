#pragma once

#include "predict/io/news_source.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// JsonFileNewsSource — paper-trading news feed
// -----------------------------------------------------------------------------
//
// @brief  Polls a JSON file that an external ingester keeps rewriting,
//         either {"articles": [...]} or a bare array of article objects.
//
// @details
// Returns articles published after the watermark that this instance has
// not returned before (key: url + headline), oldest first. A missing file
// means "no news yet". A file that cannot be read or parsed throws
// TransientIoError: the ingester may be mid-write, and the retry policy
// tries again shortly.
// -----------------------------------------------------------------------------
class JsonFileNewsSource final : public INewsSource {
 public:
  explicit JsonFileNewsSource(std::filesystem::path path);

  std::vector<domain::Article> fetchSince(
      std::int64_t watermark_ms, std::chrono::milliseconds timeout) override;

 private:
  std::filesystem::path path_;
  std::set<std::string> seen_;
};

}  // namespace predict
