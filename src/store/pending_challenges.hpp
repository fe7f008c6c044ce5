#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "util/clock.hpp"
#include "x402/challenge.hpp"

namespace autopay::store {

constexpr std::int64_t kPendingChallengeTtlMs = 10 * util::kMillisPerMinute;

struct PendingChallenge {
  x402::ChallengeDetails challenge;
  std::optional<int> tab_id;
  std::optional<int> window_id;
  std::int64_t created_at_ms{0};
};

nlohmann::json PendingChallengeToJson(const PendingChallenge& entry);

// Challenge id -> pending context. Every read prunes first, so no caller sees
// an entry older than the TTL. At most one entry per id; a second Put for a
// live id replaces it.
class PendingChallengeStore {
 public:
  void Put(const x402::ChallengeDetails& challenge, std::optional<int> tab_id,
           std::optional<int> window_id, std::int64_t now_ms);
  std::optional<PendingChallenge> Get(const std::string& id, std::int64_t now_ms);
  bool SetWindowId(const std::string& id, int window_id, std::int64_t now_ms);
  bool Remove(const std::string& id);
  // Returns the number of entries dropped.
  std::size_t PruneExpired(std::int64_t now_ms);

  std::size_t size() const { return entries_.size(); }

  nlohmann::json ToJson() const;
  // Entries whose challenge fails revalidation are dropped.
  static PendingChallengeStore FromJson(const nlohmann::json& value);

 private:
  std::map<std::string, PendingChallenge> entries_;
};

}  // namespace autopay::store
