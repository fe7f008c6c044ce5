#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "util/clock.hpp"
#include "x402/network.hpp"

namespace autopay::agent {

// Shows the approval prompt for a pending challenge. Returns the window id
// when a window was opened.
class PromptPresenter {
 public:
  virtual ~PromptPresenter() = default;
  virtual std::optional<int> Show(const std::string& challenge_id) = 0;
  virtual void Close(int window_id) = 0;
};

struct TokenBalance {
  std::string raw_balance;  // atomic units, base 10
  int decimals{6};
};

// On-chain token balance lookup (a JSON-RPC provider in a full deployment).
class BalanceSource {
 public:
  virtual ~BalanceSource() = default;
  virtual bool FetchBalance(const x402::ChainInfo& chain, const std::string& token_address,
                            const std::string& owner, TokenBalance* out,
                            std::string* error) = 0;
};

class PriceSource {
 public:
  virtual ~PriceSource() = default;
  virtual std::optional<double> QuoteUsd(const std::string& symbol, std::string* error) = 0;
};

// Logs the prompt location instead of opening a window. Used by the daemon,
// where the approval UI polls for pending challenges itself.
class LoggingPromptPresenter final : public PromptPresenter {
 public:
  explicit LoggingPromptPresenter(std::string prompt_url) : prompt_url_(std::move(prompt_url)) {}
  std::optional<int> Show(const std::string& challenge_id) override;
  void Close(int) override {}

 private:
  std::string prompt_url_;
};

constexpr std::int64_t kPriceCacheTtlMs = 60 * util::kMillisPerSecond;

// Caches quotes per symbol for a minute. USDC quotes as 1.0 when the
// upstream source is missing or fails; other symbols report no quote.
class CachedPriceSource final : public PriceSource {
 public:
  CachedPriceSource(const util::Clock& clock, PriceSource* upstream);
  std::optional<double> QuoteUsd(const std::string& symbol, std::string* error) override;

 private:
  struct Quote {
    double usd{0.0};
    std::int64_t fetched_at_ms{0};
  };

  const util::Clock& clock_;
  PriceSource* upstream_;
  std::mutex mutex_;
  std::map<std::string, Quote> quotes_;
};

}  // namespace autopay::agent
