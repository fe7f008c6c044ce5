#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "store/state_store.hpp"
#include "tests/unit/util/fast_kdf.hpp"
#include "tests/unit/util/manual_clock.hpp"
#include "util/atomic_file.hpp"
#include "wallet/wallet_manager.hpp"

namespace {

using namespace autopay;

constexpr const char* kSecret = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";

std::filesystem::path TempStatePath() {
  auto dir = std::filesystem::temp_directory_path() /
             ("autopay-state-test-" + std::to_string(test::kTestEpochMs) + "-" +
              std::to_string(std::rand()));
  std::filesystem::create_directories(dir);
  return dir / "state.json";
}

}  // namespace

int main() {
  try {
    test::ManualClock clock(test::kTestEpochMs);

    // Fresh store starts from defaults.
    {
      store::MemoryStateStore memory;
      std::string error;
      if (!memory.Open(&error)) {
        std::cerr << "Open of empty store failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      const auto state = memory.Snapshot();
      if (state.wallet || state.settings.threshold_usd != 0.05 ||
          state.settings.chain != x402::Chain::kPolygonAmoy || state.history.size() != 0) {
        std::cerr << "Fresh state should hold defaults\n";
        return EXIT_FAILURE;
      }
    }

    // A failed write leaves the in-memory state unchanged.
    {
      store::MemoryStateStore memory;
      memory.Open();
      memory.set_fail_writes(true);
      std::string error;
      if (memory.Update([](store::AppState& state) { state.settings.threshold_usd = 9.0; }, &error)) {
        std::cerr << "Update reported success on a failed write\n";
        return EXIT_FAILURE;
      }
      if (memory.Snapshot().settings.threshold_usd != 0.05) {
        std::cerr << "Failed update leaked into memory\n";
        return EXIT_FAILURE;
      }
    }

    // A plaintext key in the document is dropped and the document rewritten.
    {
      wallet::WalletManager manager(clock, test::FastKdfParams());
      manager.Configure(kSecret, "pw1234567", 15);
      store::AppState state;
      state.wallet = manager.PersistedRecord();
      auto document = store::AppStateToJson(state);
      document["wallet"]["private_key"] = kSecret;
      document["wallet"]["locked_until"] = test::kTestEpochMs + 60000;

      store::MemoryStateStore memory(document.dump());
      std::string error;
      if (!memory.Open(&error)) {
        std::cerr << "Open failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (memory.write_count() != 1 || !memory.document() ||
          memory.document()->find("private_key") != std::string::npos ||
          memory.document()->find(std::string(kSecret).substr(2)) != std::string::npos) {
        std::cerr << "Plaintext key not scrubbed from the document\n";
        return EXIT_FAILURE;
      }
      const auto loaded = memory.Snapshot();
      if (!loaded.wallet || loaded.wallet->locked_until_ms != 0 || !loaded.wallet->sealed) {
        std::cerr << "Sealed wallet should survive and load locked\n";
        return EXIT_FAILURE;
      }
    }

    // File store: durable across reopen, no plaintext ever on disk.
    {
      const auto path = TempStatePath();
      {
        store::FileStateStore file(path);
        std::string error;
        if (!file.Open(&error)) {
          std::cerr << "File store open failed: " << error << "\n";
          return EXIT_FAILURE;
        }
        wallet::WalletManager manager(clock, test::FastKdfParams());
        manager.Configure(kSecret, "pw1234567", 15);
        const bool ok = file.Update([&](store::AppState& state) {
          state.wallet = manager.PersistedRecord();
          state.settings.prompt_required = true;
          policy::SitePolicy site = policy::DefaultSitePolicy("https://a.example", "2025-06-01");
          site.allow_under_threshold = true;
          state.policies[site.origin] = site;
        }, &error);
        if (!ok) {
          std::cerr << "File store update failed: " << error << "\n";
          return EXIT_FAILURE;
        }
      }
      std::string contents;
      if (!util::ReadFileToString(path, &contents) ||
          contents.find(std::string(kSecret).substr(2)) != std::string::npos) {
        std::cerr << "Plaintext key reached the disk\n";
        return EXIT_FAILURE;
      }
      const auto document = nlohmann::json::parse(contents);
      for (const char* key : {"settings", "wallet", "balances", "policies", "history",
                              "token_cache", "pending_challenges", "status"}) {
        if (!document.contains(key)) {
          std::cerr << "Persisted document lacks " << key << "\n";
          return EXIT_FAILURE;
        }
      }
      if (document["wallet"]["locked_until"] != 0) {
        std::cerr << "Persisted wallet should carry locked_until 0\n";
        return EXIT_FAILURE;
      }
      store::FileStateStore reopened(path);
      std::string error;
      if (!reopened.Open(&error)) {
        std::cerr << "Reopen failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      const auto state = reopened.Snapshot();
      if (!state.wallet || !state.settings.prompt_required ||
          state.policies.count("https://a.example") != 1 ||
          !state.policies.at("https://a.example").allow_under_threshold) {
        std::cerr << "State did not survive a reopen\n";
        return EXIT_FAILURE;
      }
      wallet::WalletManager restarted(clock, test::FastKdfParams());
      restarted.Load(state.wallet);
      if (restarted.ActiveSession() != nullptr ||
          restarted.Unlock("pw1234567") != wallet::WalletError::kNone) {
        std::cerr << "Reloaded wallet should start locked and unlock\n";
        return EXIT_FAILURE;
      }
      std::filesystem::remove_all(path.parent_path());
    }

    // Corrupt documents are reported, not replaced.
    {
      store::MemoryStateStore memory("{not json");
      std::string error;
      if (memory.Open(&error) || memory.write_count() != 0) {
        std::cerr << "Corrupt document accepted\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "state_store_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
