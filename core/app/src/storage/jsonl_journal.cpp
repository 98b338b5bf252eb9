#include "predict/storage/jsonl_journal.hpp"

#include "predict/domain/errors.hpp"
#include "predict/storage/json_codec.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

namespace predict {

namespace fs = std::filesystem;

JsonlJournal::JsonlJournal(fs::path dir) : dir_(std::move(dir)) {
  for (const char* kind : {kSignals, kBets, kResolutions, kEquity}) {
    std::error_code ec;
    fs::create_directories(dir_ / kind, ec);
    if (ec) {
      throw PersistenceError("cannot create journal directory " +
                             (dir_ / kind).string() + ": " + ec.message());
    }
  }
}

void JsonlJournal::appendSignal(const SignalRecord& record) {
  appendLine(kSignals, record.signal.timestamp_ms,
             nlohmann::json(record).dump());
}

void JsonlJournal::appendBet(const domain::Bet& bet) {
  appendLine(kBets, bet.placed_at_ms, nlohmann::json(bet).dump());
}

void JsonlJournal::appendResolution(const domain::Resolution& resolution) {
  appendLine(kResolutions, resolution.resolved_at_ms,
             nlohmann::json(resolution).dump());
}

void JsonlJournal::appendEquitySample(const domain::EquitySample& sample) {
  appendLine(kEquity, sample.timestamp_ms, nlohmann::json(sample).dump());
}

std::vector<SignalRecord> JsonlJournal::loadSignals() const {
  return loadAll<SignalRecord>(kSignals);
}

std::vector<domain::Bet> JsonlJournal::loadBets() const {
  return loadAll<domain::Bet>(kBets);
}

std::vector<domain::Resolution> JsonlJournal::loadResolutions() const {
  return loadAll<domain::Resolution>(kResolutions);
}

std::vector<domain::EquitySample> JsonlJournal::loadEquitySamples() const {
  return loadAll<domain::EquitySample>(kEquity);
}

void JsonlJournal::appendLine(const char* kind, std::int64_t timestamp_ms,
                              const std::string& line) {
  const fs::path path =
      dir_ / kind / (time_utils::dayKey(timestamp_ms) + ".jsonl");
  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw PersistenceError("cannot open journal file " + path.string());
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    throw PersistenceError("write to journal file " + path.string() +
                           " failed");
  }
}

template <typename T>
std::vector<T> JsonlJournal::loadAll(const char* kind) const {
  std::vector<T> out;
  const fs::path folder = dir_ / kind;
  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    return out;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(folder, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".jsonl") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    throw PersistenceError("cannot list journal directory " + folder.string() +
                           ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  for (const auto& path : files) {
    std::ifstream in(path);
    if (!in) {
      throw PersistenceError("cannot read journal file " + path.string());
    }
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.empty()) {
        continue;
      }
      try {
        out.push_back(nlohmann::json::parse(line).get<T>());
      } catch (const nlohmann::json::exception& e) {
        std::cerr << "[JsonlJournal] WARNING: skipping " << path.string()
                  << ":" << line_no << " (" << e.what() << ")\n";
      } catch (const InvalidSignalError& e) {
        std::cerr << "[JsonlJournal] WARNING: skipping " << path.string()
                  << ":" << line_no << " (" << e.what() << ")\n";
      }
    }
  }
  return out;
}

}  // namespace predict
