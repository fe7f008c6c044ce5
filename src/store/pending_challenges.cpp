#include "store/pending_challenges.hpp"

#include <utility>

#include "util/logging.hpp"

namespace autopay::store {

void PendingChallengeStore::Put(const x402::ChallengeDetails& challenge,
                                std::optional<int> tab_id, std::optional<int> window_id,
                                std::int64_t now_ms) {
  PruneExpired(now_ms);
  PendingChallenge entry;
  entry.challenge = challenge;
  entry.tab_id = tab_id;
  entry.window_id = window_id;
  entry.created_at_ms = now_ms;
  entries_[challenge.challenge_id] = std::move(entry);
}

std::optional<PendingChallenge> PendingChallengeStore::Get(const std::string& id,
                                                           std::int64_t now_ms) {
  PruneExpired(now_ms);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PendingChallengeStore::SetWindowId(const std::string& id, int window_id,
                                        std::int64_t now_ms) {
  PruneExpired(now_ms);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  it->second.window_id = window_id;
  return true;
}

bool PendingChallengeStore::Remove(const std::string& id) { return entries_.erase(id) > 0; }

std::size_t PendingChallengeStore::PruneExpired(std::int64_t now_ms) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now_ms - it->second.created_at_ms > kPendingChallengeTtlMs) {
      util::LogDebug("pending challenge " + it->first + " expired");
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

nlohmann::json PendingChallengeToJson(const PendingChallenge& entry) {
  nlohmann::json item = {
      {"challenge", x402::ChallengeToJson(entry.challenge)},
      {"created_at", entry.created_at_ms},
  };
  if (entry.tab_id) item["tab_id"] = *entry.tab_id;
  if (entry.window_id) item["window_id"] = *entry.window_id;
  return item;
}

nlohmann::json PendingChallengeStore::ToJson() const {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [id, entry] : entries_) {
    out[id] = PendingChallengeToJson(entry);
  }
  return out;
}

PendingChallengeStore PendingChallengeStore::FromJson(const nlohmann::json& value) {
  PendingChallengeStore store;
  if (!value.is_object()) {
    return store;
  }
  for (const auto& [id, item] : value.items()) {
    if (!item.is_object() || !item.contains("challenge")) {
      continue;
    }
    PendingChallenge entry;
    std::string error;
    if (!x402::ChallengeFromJson(item.at("challenge"), &entry.challenge, &error) ||
        entry.challenge.challenge_id != id) {
      util::LogWarn("dropping unreadable pending challenge " + id + ": " + error);
      continue;
    }
    auto created = item.find("created_at");
    if (created == item.end() || !created->is_number_integer()) {
      continue;
    }
    entry.created_at_ms = created->get<std::int64_t>();
    if (auto tab = item.find("tab_id"); tab != item.end() && tab->is_number_integer()) {
      entry.tab_id = tab->get<int>();
    }
    if (auto window = item.find("window_id"); window != item.end() && window->is_number_integer()) {
      entry.window_id = window->get<int>();
    }
    store.entries_.emplace(id, std::move(entry));
  }
  return store;
}

}  // namespace autopay::store
