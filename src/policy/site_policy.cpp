#include "policy/site_policy.hpp"

#include <cmath>
#include <utility>

namespace autopay::policy {

namespace {

const char* ModeName(PolicyMode mode) { return mode == PolicyMode::kDeny ? "deny" : "ask"; }

std::optional<PolicyMode> ParseMode(const std::string& name) {
  if (name == "ask") return PolicyMode::kAsk;
  if (name == "deny") return PolicyMode::kDeny;
  return std::nullopt;
}

}  // namespace

SitePolicy DefaultSitePolicy(const std::string& origin, const std::string& today) {
  SitePolicy policy;
  policy.origin = origin;
  policy.last_reset_date = today;
  return policy;
}

void ApplyDailyReset(SitePolicy* policy, const std::string& today) {
  if (policy->last_reset_date != today) {
    policy->daily_usd = 0.0;
    policy->last_reset_date = today;
  }
}

void RecordSpend(SitePolicy* policy, double amount_usd, const std::string& today) {
  ApplyDailyReset(policy, today);
  if (!std::isfinite(amount_usd) || amount_usd < 0) {
    return;
  }
  policy->daily_usd += amount_usd;
  policy->lifetime_usd += amount_usd;
}

bool ApplySitePolicyPatch(const SitePolicyPatch& patch, SitePolicy* policy, std::string* error) {
  if (patch.cap_usd && *patch.cap_usd &&
      (!std::isfinite(**patch.cap_usd) || **patch.cap_usd < 0)) {
    if (error) {
      *error = "cap must be a non-negative amount";
    }
    return false;
  }
  if (patch.mode) policy->mode = *patch.mode;
  if (patch.allow_under_threshold) policy->allow_under_threshold = *patch.allow_under_threshold;
  if (patch.cap_usd) policy->cap_usd = *patch.cap_usd;
  return true;
}

nlohmann::json SitePolicyToJson(const SitePolicy& policy) {
  nlohmann::json out = {
      {"origin", policy.origin},
      {"mode", ModeName(policy.mode)},
      {"allow_under_threshold", policy.allow_under_threshold},
      {"cap_usd", nullptr},
      {"lifetime_usd", policy.lifetime_usd},
      {"daily_usd", policy.daily_usd},
      {"last_reset_date", policy.last_reset_date},
  };
  if (policy.cap_usd) {
    out["cap_usd"] = *policy.cap_usd;
  }
  return out;
}

bool SitePolicyFromJson(const nlohmann::json& value, SitePolicy* out) {
  if (!out || !value.is_object()) {
    return false;
  }
  try {
    SitePolicy policy;
    policy.origin = value.at("origin").get<std::string>();
    auto mode = ParseMode(value.value("mode", std::string("ask")));
    if (!mode) {
      return false;
    }
    policy.mode = *mode;
    policy.allow_under_threshold = value.value("allow_under_threshold", false);
    if (auto it = value.find("cap_usd"); it != value.end() && it->is_number()) {
      policy.cap_usd = it->get<double>();
    }
    policy.lifetime_usd = value.value("lifetime_usd", 0.0);
    policy.daily_usd = value.value("daily_usd", 0.0);
    policy.last_reset_date = value.value("last_reset_date", std::string());
    *out = std::move(policy);
    return true;
  } catch (const nlohmann::json::exception&) {
    return false;
  }
}

bool SitePolicyPatchFromJson(const nlohmann::json& value, SitePolicyPatch* out,
                             std::string* error) {
  auto fail = [&](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out || !value.is_object()) {
    return fail("policy must be an object");
  }
  SitePolicyPatch patch;
  if (auto it = value.find("mode"); it != value.end()) {
    if (!it->is_string() || !(patch.mode = ParseMode(it->get<std::string>()))) {
      return fail("mode must be \"ask\" or \"deny\"");
    }
  }
  if (auto it = value.find("allow_under_threshold"); it != value.end()) {
    if (!it->is_boolean()) {
      return fail("allow_under_threshold must be a boolean");
    }
    patch.allow_under_threshold = it->get<bool>();
  }
  if (auto it = value.find("cap_usd"); it != value.end()) {
    if (it->is_null()) {
      patch.cap_usd.emplace(std::nullopt);
    } else if (it->is_number()) {
      patch.cap_usd.emplace(it->get<double>());
    } else {
      return fail("cap_usd must be a number or null");
    }
  }
  *out = std::move(patch);
  return true;
}

nlohmann::json PolicyMapToJson(const PolicyMap& policies) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [origin, policy] : policies) {
    out[origin] = SitePolicyToJson(policy);
  }
  return out;
}

PolicyMap PolicyMapFromJson(const nlohmann::json& value) {
  PolicyMap policies;
  if (!value.is_object()) {
    return policies;
  }
  for (const auto& [origin, entry] : value.items()) {
    SitePolicy policy;
    if (SitePolicyFromJson(entry, &policy) && policy.origin == origin) {
      policies.emplace(origin, std::move(policy));
    }
  }
  return policies;
}

}  // namespace autopay::policy
