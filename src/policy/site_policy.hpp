#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace autopay::policy {

enum class PolicyMode {
  kAsk,
  kDeny,
};

struct SitePolicy {
  std::string origin;
  PolicyMode mode{PolicyMode::kAsk};
  bool allow_under_threshold{false};
  std::optional<double> cap_usd;  // lifetime cap; null or <= 0 means none
  double lifetime_usd{0.0};
  double daily_usd{0.0};
  std::string last_reset_date;  // UTC YYYY-MM-DD
};

// Created lazily for an origin the first time it is paid or edited.
SitePolicy DefaultSitePolicy(const std::string& origin, const std::string& today);

// Zeroes the daily counter when the stored date is not `today`.
void ApplyDailyReset(SitePolicy* policy, const std::string& today);

// Adds a completed spend to both counters. Negative or non-finite amounts are
// ignored so the lifetime total never decreases.
void RecordSpend(SitePolicy* policy, double amount_usd, const std::string& today);

struct SitePolicyPatch {
  std::optional<PolicyMode> mode;
  std::optional<bool> allow_under_threshold;
  std::optional<std::optional<double>> cap_usd;  // set to nullopt clears the cap
};

bool ApplySitePolicyPatch(const SitePolicyPatch& patch, SitePolicy* policy,
                          std::string* error = nullptr);

using PolicyMap = std::map<std::string, SitePolicy>;

nlohmann::json SitePolicyToJson(const SitePolicy& policy);
bool SitePolicyFromJson(const nlohmann::json& value, SitePolicy* out);
bool SitePolicyPatchFromJson(const nlohmann::json& value, SitePolicyPatch* out,
                             std::string* error = nullptr);

nlohmann::json PolicyMapToJson(const PolicyMap& policies);
PolicyMap PolicyMapFromJson(const nlohmann::json& value);

}  // namespace autopay::policy
