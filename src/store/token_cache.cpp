#include "store/token_cache.hpp"

namespace autopay::store {

void TokenCache::Put(const std::string& payment_id, const std::string& token,
                     std::int64_t now_ms) {
  Prune(now_ms);
  entries_[payment_id] = CachedToken{token, now_ms + kShortLivedTokenTtlMs};
}

std::optional<std::string> TokenCache::Get(const std::string& payment_id, std::int64_t now_ms) {
  Prune(now_ms);
  auto it = entries_.find(payment_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.token;
}

std::size_t TokenCache::Prune(std::int64_t now_ms) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at_ms <= now_ms) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

nlohmann::json TokenCache::ToJson() const {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [id, entry] : entries_) {
    out[id] = {{"token", entry.token}, {"expires_at", entry.expires_at_ms}};
  }
  return out;
}

TokenCache TokenCache::FromJson(const nlohmann::json& value) {
  TokenCache cache;
  if (!value.is_object()) {
    return cache;
  }
  for (const auto& [id, item] : value.items()) {
    if (!item.is_object()) {
      continue;
    }
    auto token = item.find("token");
    auto expires = item.find("expires_at");
    if (token == item.end() || !token->is_string() || expires == item.end() ||
        !expires->is_number_integer()) {
      continue;
    }
    cache.entries_[id] = CachedToken{token->get<std::string>(), expires->get<std::int64_t>()};
  }
  return cache;
}

}  // namespace autopay::store
