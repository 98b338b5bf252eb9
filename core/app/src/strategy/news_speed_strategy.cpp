#include "predict/strategy/news_speed_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace predict {

namespace {

const std::unordered_set<std::string>& stopWords() {
  static const std::unordered_set<std::string> kStop = {
      "a",   "an",   "and",  "are",  "as",   "at",   "be",  "by",  "for",
      "from", "has", "he",   "in",   "is",   "it",   "its", "of",  "on",
      "or",  "that", "the",  "to",   "was",  "were", "will", "with"};
  return kStop;
}

std::set<std::string> tokenSet(std::string_view text) {
  const auto words = tokenize(text);
  return std::set<std::string>(words.begin(), words.end());
}

}  // namespace

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> out;
  std::string word;
  auto flush = [&] {
    if (word.size() > 2 && stopWords().count(word) == 0) {
      out.push_back(word);
    }
    word.clear();
  };
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      word.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      flush();
    }
  }
  flush();
  return out;
}

std::vector<domain::MarketQuote> selectCandidateMarkets(
    const domain::Article& article,
    const std::vector<domain::MarketQuote>& markets, int max_markets) {
  const auto limit = static_cast<std::size_t>(std::max(1, max_markets));

  std::vector<const domain::MarketQuote*> open;
  for (const auto& m : markets) {
    if (!m.resolved) {
      open.push_back(&m);
    }
  }

  const auto query = tokenSet(article.headline + "\n" + article.summary);

  std::vector<std::pair<std::size_t, const domain::MarketQuote*>> scored;
  if (!query.empty()) {
    for (const auto* m : open) {
      if (m->question.empty()) {
        continue;
      }
      std::size_t score = 0;
      for (const auto& token : tokenSet(m->question)) {
        score += query.count(token);
      }
      if (score > 0) {
        scored.emplace_back(score, m);
      }
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });

  std::vector<domain::MarketQuote> out;
  if (scored.empty()) {
    for (std::size_t i = 0; i < open.size() && i < limit; ++i) {
      out.push_back(*open[i]);
    }
    return out;
  }
  for (std::size_t i = 0; i < scored.size() && i < limit; ++i) {
    out.push_back(*scored[i].second);
  }
  return out;
}

Strategy makeNewsSpeedStrategy(ISignalExtractor& extractor,
                               NewsSpeedOptions options) {
  Strategy s;
  s.name = "news_speed";
  s.generate_signals = [&extractor, options](
                           const std::vector<domain::Article>& articles,
                           const std::vector<domain::MarketQuote>& markets) {
    std::vector<domain::RawSignal> out;
    if (articles.empty() || markets.empty()) {
      return out;
    }
    for (const auto& article : articles) {
      const auto candidates =
          selectCandidateMarkets(article, markets, options.max_markets_per_cycle);
      if (candidates.empty()) {
        continue;
      }
      std::set<std::string> allowed;
      for (const auto& c : candidates) {
        allowed.insert(c.market_id);
      }

      for (auto raw : extractor.extract(article, candidates)) {
        if (allowed.count(raw.market_id) == 0) {
          continue;
        }
        raw.confidence = std::clamp(raw.confidence, 1.0, 10.0);
        raw.headline = article.headline;
        raw.strategy = "news_speed";
        out.push_back(std::move(raw));
      }
    }
    return out;
  };
  return s;
}

}  // namespace predict
