#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "util/clock.hpp"

namespace autopay::store {

constexpr std::int64_t kShortLivedTokenTtlMs = 5 * util::kMillisPerMinute;

struct CachedToken {
  std::string token;
  std::int64_t expires_at_ms{0};
};

// Settlement tokens by payment id. Expired entries are dropped lazily.
class TokenCache {
 public:
  void Put(const std::string& payment_id, const std::string& token, std::int64_t now_ms);
  std::optional<std::string> Get(const std::string& payment_id, std::int64_t now_ms);
  std::size_t Prune(std::int64_t now_ms);
  std::size_t size() const { return entries_.size(); }

  nlohmann::json ToJson() const;
  static TokenCache FromJson(const nlohmann::json& value);

 private:
  std::map<std::string, CachedToken> entries_;
};

}  // namespace autopay::store
