#include "agent/collaborators.hpp"

#include <cmath>

#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::agent {

std::optional<int> LoggingPromptPresenter::Show(const std::string& challenge_id) {
  if (prompt_url_.empty()) {
    util::LogInfo("challenge " + challenge_id + " awaits approval");
  } else {
    util::LogInfo("challenge " + challenge_id + " awaits approval at " + prompt_url_ +
                  "?challengeId=" + challenge_id);
  }
  return std::nullopt;
}

CachedPriceSource::CachedPriceSource(const util::Clock& clock, PriceSource* upstream)
    : clock_(clock), upstream_(upstream) {}

std::optional<double> CachedPriceSource::QuoteUsd(const std::string& raw_symbol,
                                                  std::string* error) {
  const std::string symbol = util::ToLower(util::Trim(raw_symbol));
  const std::int64_t now = clock_.NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it != quotes_.end() && now - it->second.fetched_at_ms < kPriceCacheTtlMs) {
    return it->second.usd;
  }
  std::optional<double> quote;
  if (upstream_) {
    std::string upstream_error;
    quote = upstream_->QuoteUsd(symbol, &upstream_error);
    if (!quote || !std::isfinite(*quote) || *quote < 0) {
      util::LogDebug("price quote for " + symbol + " unavailable: " + upstream_error);
      quote.reset();
    }
  }
  if (!quote && symbol == "usdc") {
    quote = 1.0;
  }
  if (!quote) {
    if (error) {
      *error = "no price for " + raw_symbol;
    }
    return std::nullopt;
  }
  quotes_[symbol] = Quote{*quote, now};
  return quote;
}

}  // namespace autopay::agent
