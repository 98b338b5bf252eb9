#include "predict/gateway/json_file_news_source.hpp"

#include "predict/domain/errors.hpp"
#include "predict/storage/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

namespace predict {

JsonFileNewsSource::JsonFileNewsSource(std::filesystem::path path)
    : path_(std::move(path)) {}

std::vector<domain::Article> JsonFileNewsSource::fetchSince(
    std::int64_t watermark_ms, std::chrono::milliseconds /*timeout*/) {
  std::vector<domain::Article> out;
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return out;
  }

  std::ifstream in(path_);
  if (!in) {
    throw TransientIoError("cannot open news file " + path_.string());
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    throw TransientIoError("news file " + path_.string() + " is not valid JSON");
  }

  const nlohmann::json* list = &doc;
  if (doc.is_object()) {
    auto it = doc.find("articles");
    if (it == doc.end() || !it->is_array()) {
      throw TransientIoError("news file " + path_.string() +
                             " has no 'articles' list");
    }
    list = &*it;
  } else if (!doc.is_array()) {
    throw TransientIoError("news file " + path_.string() +
                           " is neither an object nor an array");
  }

  for (const auto& item : *list) {
    domain::Article article;
    try {
      article = item.get<domain::Article>();
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[JsonFileNewsSource] WARNING: skipping article: "
                << e.what() << "\n";
      continue;
    } catch (const InvalidSignalError& e) {
      std::cerr << "[JsonFileNewsSource] WARNING: skipping article: "
                << e.what() << "\n";
      continue;
    }
    if (article.published_at_ms <= watermark_ms) {
      continue;
    }
    if (!seen_.insert(article.key()).second) {
      continue;
    }
    out.push_back(std::move(article));
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const domain::Article& a, const domain::Article& b) {
                     return a.published_at_ms < b.published_at_ms;
                   });
  return out;
}

}  // namespace predict
