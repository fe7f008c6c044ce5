#include "store/state_store.hpp"

#include <utility>

#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace autopay::store {

bool StateStore::Open(std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<std::string> contents;
  if (!ReadDocument(&contents, error)) {
    return false;
  }
  if (!contents) {
    state_ = AppState{};
    return true;
  }
  auto parsed = nlohmann::json::parse(*contents, nullptr, false);
  if (parsed.is_discarded()) {
    if (error) {
      *error = "state document is not valid JSON";
    }
    return false;
  }
  AppState loaded;
  bool dropped_plaintext = false;
  if (!AppStateFromJson(parsed, &loaded, &dropped_plaintext, error)) {
    return false;
  }
  if (dropped_plaintext) {
    util::LogWarn("state document held a plaintext wallet key; rewriting without it");
    if (!WriteLocked(loaded, error)) {
      return false;
    }
  }
  state_ = std::move(loaded);
  return true;
}

AppState StateStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool StateStore::Update(const Mutator& mutate, std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppState next = state_;
  mutate(next);
  if (!WriteLocked(next, error)) {
    return false;
  }
  state_ = std::move(next);
  return true;
}

bool StateStore::WriteLocked(const AppState& state, std::string* error) {
  const std::string document = AppStateToJson(state).dump(2);
  if (!WriteDocument(document, error)) {
    util::LogError("failed to persist state" + (error ? ": " + *error : std::string()));
    return false;
  }
  return true;
}

FileStateStore::FileStateStore(std::filesystem::path path) : path_(std::move(path)) {}

bool FileStateStore::ReadDocument(std::optional<std::string>* contents, std::string* error) {
  std::string data;
  bool exists = false;
  if (!util::ReadFileToString(path_, &data, &exists, error)) {
    return false;
  }
  if (exists) {
    *contents = std::move(data);
  } else {
    contents->reset();
  }
  return true;
}

bool FileStateStore::WriteDocument(const std::string& contents, std::string* error) {
  return util::AtomicWriteFile(path_, contents, error);
}

bool MemoryStateStore::ReadDocument(std::optional<std::string>* contents, std::string*) {
  *contents = document_;
  return true;
}

bool MemoryStateStore::WriteDocument(const std::string& contents, std::string* error) {
  if (fail_writes_) {
    if (error) {
      *error = "write refused";
    }
    return false;
  }
  document_ = contents;
  ++write_count_;
  return true;
}

}  // namespace autopay::store
