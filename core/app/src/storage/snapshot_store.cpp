#include "predict/storage/snapshot_store.hpp"

#include "predict/domain/errors.hpp"
#include "predict/storage/json_codec.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <system_error>
#include <utility>

namespace predict {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kNews = "news";
constexpr const char* kMarkets = "markets";
constexpr const char* kResolutions = "resolutions";
constexpr const char* kSignals = "signals";

std::int64_t dayStart(const std::string& day_key) {
  auto ms = time_utils::parseDayKey(day_key);
  if (!ms) {
    throw PersistenceError("invalid snapshot day '" + day_key + "'");
  }
  return *ms;
}

// The list stored under `list_key`, or an empty array if the file is absent.
json readList(const fs::path& path, const char* list_key) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return json::array();
  }
  std::ifstream in(path);
  if (!in) {
    throw PersistenceError("cannot read snapshot " + path.string());
  }
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw PersistenceError("snapshot " + path.string() + " is not a JSON object");
  }
  auto it = doc.find(list_key);
  if (it == doc.end() || !it->is_array()) {
    throw PersistenceError("snapshot " + path.string() + " has no '" +
                           list_key + "' list");
  }
  return *it;
}

void writeList(const fs::path& path, const std::string& day_key,
               const char* list_key, const json& list) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw PersistenceError("cannot create " + path.parent_path().string() +
                           ": " + ec.message());
  }
  const json doc = {{"date", day_key}, {list_key, list}};
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot write snapshot " + tmp.string());
    }
    out << doc.dump(2) << '\n';
    if (!out) {
      throw PersistenceError("write to snapshot " + tmp.string() + " failed");
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    throw PersistenceError("cannot move snapshot into place at " +
                           path.string() + ": " + ec.message());
  }
}

std::string stringField(const json& j, const char* key) {
  auto it = j.find(key);
  if (it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

std::string signalKey(const std::string& headline, const std::string& market_id,
                      const std::string& direction) {
  return headline + "\n" + market_id + "\n" + direction;
}

}  // namespace

SnapshotStore::SnapshotStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path SnapshotStore::pathFor(const char* kind,
                                const std::string& day_key) const {
  return dir_ / kind / (day_key + ".json");
}

int SnapshotStore::recordNews(const std::string& day_key,
                              const std::vector<domain::Article>& articles) const {
  if (articles.empty()) {
    return 0;
  }
  const fs::path path = pathFor(kNews, day_key);
  json list = readList(path, "articles");

  std::set<std::string> seen;
  for (const auto& a : list) {
    seen.insert(stringField(a, "url") + "\n" + stringField(a, "headline"));
  }
  int added = 0;
  for (const auto& article : articles) {
    if (!seen.insert(article.key()).second) {
      continue;
    }
    list.push_back(json(article));
    ++added;
  }
  if (added > 0) {
    writeList(path, day_key, "articles", list);
  }
  return added;
}

bool SnapshotStore::recordMarkets(
    const std::string& day_key,
    const std::vector<domain::MarketQuote>& markets) const {
  const fs::path path = pathFor(kMarkets, day_key);
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return false;
  }
  json list = json::array();
  for (const auto& m : markets) {
    list.push_back(json(m));
  }
  writeList(path, day_key, "markets", list);
  return true;
}

int SnapshotStore::recordResolutions(
    const std::string& day_key,
    const std::vector<domain::Resolution>& resolutions) const {
  if (resolutions.empty()) {
    return 0;
  }
  const fs::path path = pathFor(kResolutions, day_key);
  json list = readList(path, "resolutions");

  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& r : list) {
    seen.emplace(stringField(r, "market_id"), stringField(r, "outcome"));
  }
  int added = 0;
  for (const auto& r : resolutions) {
    if (!seen.emplace(r.market_id, domain::toString(r.outcome)).second) {
      continue;
    }
    list.push_back(json(r));
    ++added;
  }
  if (added > 0) {
    writeList(path, day_key, "resolutions", list);
  }
  return added;
}

int SnapshotStore::recordSignals(
    const std::string& day_key,
    const std::vector<domain::RawSignal>& signals) const {
  if (signals.empty()) {
    return 0;
  }
  const fs::path path = pathFor(kSignals, day_key);
  json list = readList(path, "signals");

  std::set<std::string> seen;
  for (const auto& s : list) {
    seen.insert(signalKey(stringField(s, "headline"),
                          stringField(s, "market_id"),
                          stringField(s, "direction")));
  }
  int added = 0;
  for (const auto& s : signals) {
    if (!seen.insert(signalKey(s.headline, s.market_id,
                               domain::toString(s.direction)))
             .second) {
      continue;
    }
    list.push_back(json(s));
    ++added;
  }
  if (added > 0) {
    writeList(path, day_key, "signals", list);
  }
  return added;
}

std::vector<domain::Article> SnapshotStore::loadNews(
    const std::string& day_key) const {
  const fs::path path = pathFor(kNews, day_key);
  std::vector<domain::Article> out;
  for (const auto& item : readList(path, "articles")) {
    try {
      out.push_back(item.get<domain::Article>());
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[SnapshotStore] WARNING: bad article in " << path.string()
                << ": " << e.what() << "\n";
    } catch (const InvalidSignalError& e) {
      std::cerr << "[SnapshotStore] WARNING: bad article in " << path.string()
                << ": " << e.what() << "\n";
    }
  }
  return out;
}

std::vector<domain::MarketQuote> SnapshotStore::loadMarkets(
    const std::string& day_key) const {
  const fs::path path = pathFor(kMarkets, day_key);
  const json list = readList(path, "markets");
  const std::int64_t observed = list.empty() ? 0 : dayStart(day_key);
  std::vector<domain::MarketQuote> out;
  for (const auto& item : list) {
    auto quote = codec::parseMarket(item, observed);
    if (!quote) {
      std::cerr << "[SnapshotStore] WARNING: skipping market without id or "
                   "prices in "
                << path.string() << "\n";
      continue;
    }
    out.push_back(std::move(*quote));
  }
  return out;
}

std::vector<domain::Resolution> SnapshotStore::loadResolutions(
    const std::string& day_key) const {
  const fs::path path = pathFor(kResolutions, day_key);
  const json list = readList(path, "resolutions");
  const std::int64_t fallback = list.empty() ? 0 : dayStart(day_key);
  std::vector<domain::Resolution> out;
  for (const auto& item : list) {
    auto r = codec::parseResolution(item, fallback);
    if (!r) {
      std::cerr << "[SnapshotStore] WARNING: skipping malformed resolution in "
                << path.string() << "\n";
      continue;
    }
    out.push_back(std::move(*r));
  }
  return out;
}

std::vector<domain::RawSignal> SnapshotStore::loadSignals(
    const std::string& day_key) const {
  const fs::path path = pathFor(kSignals, day_key);
  std::vector<domain::RawSignal> out;
  for (const auto& item : readList(path, "signals")) {
    try {
      out.push_back(item.get<domain::RawSignal>());
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[SnapshotStore] WARNING: bad signal in " << path.string()
                << ": " << e.what() << "\n";
    } catch (const InvalidSignalError& e) {
      std::cerr << "[SnapshotStore] WARNING: bad signal in " << path.string()
                << ": " << e.what() << "\n";
    }
  }
  return out;
}

std::vector<std::string> SnapshotStore::availableDays(
    const std::string& kind) const {
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path folder = dir_ / kind;
  if (!fs::is_directory(folder, ec)) {
    return out;
  }
  for (const auto& entry : fs::directory_iterator(folder, ec)) {
    const auto& p = entry.path();
    if (p.extension() != ".json") {
      continue;
    }
    const std::string stem = p.stem().string();
    if (time_utils::parseDayKey(stem)) {
      out.push_back(stem);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace predict
