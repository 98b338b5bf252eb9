#include "predict/storage/in_memory_journal.hpp"

namespace predict {

void InMemoryJournal::appendSignal(const SignalRecord& record) {
  std::lock_guard lock(mutex_);
  signals_.push_back(record);
}

void InMemoryJournal::appendBet(const domain::Bet& bet) {
  std::lock_guard lock(mutex_);
  bets_.push_back(bet);
}

void InMemoryJournal::appendResolution(const domain::Resolution& resolution) {
  std::lock_guard lock(mutex_);
  resolutions_.push_back(resolution);
}

void InMemoryJournal::appendEquitySample(const domain::EquitySample& sample) {
  std::lock_guard lock(mutex_);
  equity_.push_back(sample);
}

std::vector<SignalRecord> InMemoryJournal::loadSignals() const {
  std::lock_guard lock(mutex_);
  return signals_;
}

std::vector<domain::Bet> InMemoryJournal::loadBets() const {
  std::lock_guard lock(mutex_);
  return bets_;
}

std::vector<domain::Resolution> InMemoryJournal::loadResolutions() const {
  std::lock_guard lock(mutex_);
  return resolutions_;
}

std::vector<domain::EquitySample> InMemoryJournal::loadEquitySamples() const {
  std::lock_guard lock(mutex_);
  return equity_;
}

void InMemoryJournal::clear() {
  std::lock_guard lock(mutex_);
  signals_.clear();
  bets_.clear();
  resolutions_.clear();
  equity_.clear();
}

}  // namespace predict
