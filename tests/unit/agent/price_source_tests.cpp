#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "agent/collaborators.hpp"
#include "tests/unit/util/manual_clock.hpp"

namespace {

using namespace autopay;

class CountingPriceSource final : public agent::PriceSource {
 public:
  std::optional<double> QuoteUsd(const std::string& symbol, std::string* error) override {
    ++calls;
    if (fail) {
      if (error) {
        *error = "upstream down";
      }
      return std::nullopt;
    }
    return symbol == "pol" ? std::optional<double>(next_quote) : std::nullopt;
  }

  int calls{0};
  bool fail{false};
  double next_quote{0.5};
};

}  // namespace

int main() {
  try {
    test::ManualClock clock(test::kTestEpochMs);
    CountingPriceSource upstream;
    agent::CachedPriceSource prices(clock, &upstream);
    std::string error;

    auto quote = prices.QuoteUsd("POL", &error);
    if (!quote || *quote != 0.5 || upstream.calls != 1) {
      std::cerr << "First quote not fetched upstream\n";
      return EXIT_FAILURE;
    }

    upstream.next_quote = 0.75;
    clock.Advance(59 * 1000);
    quote = prices.QuoteUsd("pol", &error);
    if (!quote || *quote != 0.5 || upstream.calls != 1) {
      std::cerr << "Quote inside the cache window refetched\n";
      return EXIT_FAILURE;
    }

    clock.Advance(2 * 1000);
    quote = prices.QuoteUsd("pol", &error);
    if (!quote || *quote != 0.75 || upstream.calls != 2) {
      std::cerr << "Stale quote not refreshed\n";
      return EXIT_FAILURE;
    }

    upstream.fail = true;
    quote = prices.QuoteUsd("USDC", &error);
    if (!quote || *quote != 1.0) {
      std::cerr << "USDC did not fall back to 1.0\n";
      return EXIT_FAILURE;
    }

    error.clear();
    if (prices.QuoteUsd("WETH", &error) || error.empty()) {
      std::cerr << "Unknown symbol produced a quote\n";
      return EXIT_FAILURE;
    }

    agent::CachedPriceSource offline(clock, nullptr);
    quote = offline.QuoteUsd("usdc", &error);
    if (!quote || *quote != 1.0) {
      std::cerr << "USDC quote without upstream missing\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "price_source_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
