#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "x402/network.hpp"

namespace autopay::policy {

struct Settings {
  double threshold_usd{0.05};
  double daily_auto_cap_usd{1.0};  // 0 disables the daily cap
  std::string preferred_token{"USDC"};
  x402::Chain chain{x402::Chain::kPolygonAmoy};
  bool prompt_required{false};
};

// Partial update; unset fields keep their value.
struct SettingsPatch {
  std::optional<double> threshold_usd;
  std::optional<double> daily_auto_cap_usd;
  std::optional<std::string> preferred_token;
  std::optional<x402::Chain> chain;
  std::optional<bool> prompt_required;
};

// Rejects negative or non-finite amounts and unknown chains; `settings` is
// left untouched on failure.
bool ApplySettingsPatch(const SettingsPatch& patch, Settings* settings,
                        std::string* error = nullptr);

nlohmann::json SettingsToJson(const Settings& settings);
// Missing or malformed keys take their defaults.
Settings SettingsFromJson(const nlohmann::json& value);
bool SettingsPatchFromJson(const nlohmann::json& value, SettingsPatch* out,
                           std::string* error = nullptr);

}  // namespace autopay::policy
