#include "policy/settings.hpp"

#include <cmath>
#include <utility>

#include "util/strings.hpp"

namespace autopay::policy {

namespace {

bool ValidAmount(double value) { return std::isfinite(value) && value >= 0; }

template <typename T>
bool ReadOptional(const nlohmann::json& object, const char* key, std::optional<T>* out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  try {
    *out = it->get<T>();
    return true;
  } catch (const nlohmann::json::exception&) {
    return false;
  }
}

}  // namespace

bool ApplySettingsPatch(const SettingsPatch& patch, Settings* settings, std::string* error) {
  auto fail = [&](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!settings) {
    return fail("no settings");
  }
  if (patch.threshold_usd && !ValidAmount(*patch.threshold_usd)) {
    return fail("threshold must be a non-negative amount");
  }
  if (patch.daily_auto_cap_usd && !ValidAmount(*patch.daily_auto_cap_usd)) {
    return fail("daily cap must be a non-negative amount");
  }
  if (patch.preferred_token && util::Trim(*patch.preferred_token).empty()) {
    return fail("preferred token must not be empty");
  }
  if (patch.threshold_usd) settings->threshold_usd = *patch.threshold_usd;
  if (patch.daily_auto_cap_usd) settings->daily_auto_cap_usd = *patch.daily_auto_cap_usd;
  if (patch.preferred_token) settings->preferred_token = util::Trim(*patch.preferred_token);
  if (patch.chain) settings->chain = *patch.chain;
  if (patch.prompt_required) settings->prompt_required = *patch.prompt_required;
  return true;
}

nlohmann::json SettingsToJson(const Settings& settings) {
  return {
      {"threshold_usd", settings.threshold_usd},
      {"daily_auto_cap_usd", settings.daily_auto_cap_usd},
      {"preferred_token", settings.preferred_token},
      {"chain", x402::ChainKey(settings.chain)},
      {"prompt_required", settings.prompt_required},
  };
}

Settings SettingsFromJson(const nlohmann::json& value) {
  Settings settings;
  if (!value.is_object()) {
    return settings;
  }
  SettingsPatch patch;
  std::string ignored;
  if (SettingsPatchFromJson(value, &patch, &ignored)) {
    ApplySettingsPatch(patch, &settings, &ignored);
  }
  return settings;
}

bool SettingsPatchFromJson(const nlohmann::json& value, SettingsPatch* out, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out || !value.is_object()) {
    return fail("settings must be an object");
  }
  SettingsPatch patch;
  if (!ReadOptional(value, "threshold_usd", &patch.threshold_usd)) {
    return fail("threshold_usd must be a number");
  }
  if (!ReadOptional(value, "daily_auto_cap_usd", &patch.daily_auto_cap_usd)) {
    return fail("daily_auto_cap_usd must be a number");
  }
  if (!ReadOptional(value, "preferred_token", &patch.preferred_token)) {
    return fail("preferred_token must be a string");
  }
  if (!ReadOptional(value, "prompt_required", &patch.prompt_required)) {
    return fail("prompt_required must be a boolean");
  }
  std::optional<std::string> chain;
  if (!ReadOptional(value, "chain", &chain)) {
    return fail("chain must be a string");
  }
  if (chain) {
    patch.chain = x402::ChainFromKey(*chain);
    if (!patch.chain) {
      return fail("unknown chain: " + *chain);
    }
  }
  *out = std::move(patch);
  return true;
}

}  // namespace autopay::policy
