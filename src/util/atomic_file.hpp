#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace autopay::util {

// Atomically replace `path` with `contents`: the data is written to a temp
// file in the same directory, flushed to disk and renamed into place, so a
// reader sees either the old or the new document, never a prefix. The file is
// created owner read/write only because it may hold encrypted key material.
bool AtomicWriteFile(const std::filesystem::path& path, std::string_view contents,
                     std::string* error = nullptr);

// Reads the whole file. A missing file is reported through `exists` (when
// given) and is not an error.
bool ReadFileToString(const std::filesystem::path& path, std::string* contents,
                      bool* exists = nullptr, std::string* error = nullptr);

}  // namespace autopay::util
