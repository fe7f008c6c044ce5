#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace autopay::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() / (target.filename().string() + ".tmp." + std::to_string(now) +
                                 "." + std::to_string(nonce));
}

bool WriteAll(int fd, std::string_view data, std::string* error) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) {
        *error = std::string("write failed: ") + std::strerror(errno);
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path, std::string_view contents,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    if (error) {
      *error = std::string("failed to open temp file for write: ") + std::strerror(errno);
    }
    return false;
  }
  const bool ok = WriteAll(fd, contents, error) && ::fsync(fd) == 0;
  if (!ok && error && error->empty()) {
    *error = "fsync failed";
  }
  ::close(fd);
  if (!ok) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  return true;
}

bool ReadFileToString(const std::filesystem::path& path, std::string* contents, bool* exists,
                      std::string* error) {
  if (!contents) {
    return false;
  }
  contents->clear();
  std::error_code ec;
  const bool present = std::filesystem::exists(path, ec);
  if (exists) {
    *exists = present;
  }
  if (!present) {
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "unable to open " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    if (error) {
      *error = "read failed: " + path.string();
    }
    return false;
  }
  *contents = buffer.str();
  return true;
}

}  // namespace autopay::util
