#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "store/app_state.hpp"

namespace autopay::store {

// Read-modify-write access to the persisted AppState. Every Update applies the
// mutation to a copy, writes the whole document and only then makes the copy
// current, so a failed write leaves both disk and memory on the old state.
class StateStore {
 public:
  using Mutator = std::function<void(AppState&)>;

  virtual ~StateStore() = default;

  // Reads the backing document. A missing document is a fresh default state.
  // A document holding a plaintext key is loaded without it and rewritten.
  bool Open(std::string* error = nullptr);

  AppState Snapshot() const;
  bool Update(const Mutator& mutate, std::string* error = nullptr);

 protected:
  virtual bool ReadDocument(std::optional<std::string>* contents, std::string* error) = 0;
  virtual bool WriteDocument(const std::string& contents, std::string* error) = 0;

 private:
  bool WriteLocked(const AppState& state, std::string* error);

  mutable std::mutex mutex_;
  AppState state_;
};

class FileStateStore final : public StateStore {
 public:
  explicit FileStateStore(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

 protected:
  bool ReadDocument(std::optional<std::string>* contents, std::string* error) override;
  bool WriteDocument(const std::string& contents, std::string* error) override;

 private:
  std::filesystem::path path_;
};

// Keeps the serialized document in memory. Used by tests and by callers that
// want no persistence.
class MemoryStateStore final : public StateStore {
 public:
  MemoryStateStore() = default;
  explicit MemoryStateStore(std::string document) : document_(std::move(document)) {}

  const std::optional<std::string>& document() const { return document_; }
  void set_fail_writes(bool fail) { fail_writes_ = fail; }
  int write_count() const { return write_count_; }

 protected:
  bool ReadDocument(std::optional<std::string>* contents, std::string* error) override;
  bool WriteDocument(const std::string& contents, std::string* error) override;

 private:
  std::optional<std::string> document_;
  bool fail_writes_{false};
  int write_count_{0};
};

}  // namespace autopay::store
