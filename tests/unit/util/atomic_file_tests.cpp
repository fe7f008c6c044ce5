#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <sys/stat.h>

#include "util/atomic_file.hpp"
#include "util/logging.hpp"

int main() {
  try {
    using namespace autopay;
    const auto dir = std::filesystem::temp_directory_path() / "autopay_atomic_file_tests";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "state.json";

    {
      std::string contents = "stale";
      bool exists = true;
      if (!util::ReadFileToString(path, &contents, &exists) || exists || !contents.empty()) {
        std::cerr << "Missing file should read as absent\n";
        return EXIT_FAILURE;
      }
    }

    {
      std::string error;
      if (!util::AtomicWriteFile(path, "{\"a\":1}", &error)) {
        std::cerr << "AtomicWriteFile failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (!util::AtomicWriteFile(path, "{\"a\":2}", &error)) {
        std::cerr << "AtomicWriteFile overwrite failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      std::string contents;
      bool exists = false;
      if (!util::ReadFileToString(path, &contents, &exists, &error) || !exists ||
          contents != "{\"a\":2}") {
        std::cerr << "Read back mismatch\n";
        return EXIT_FAILURE;
      }
      struct stat st {};
      if (::stat(path.c_str(), &st) != 0 || (st.st_mode & 0077) != 0) {
        std::cerr << "State file is readable by group or others\n";
        return EXIT_FAILURE;
      }
      std::size_t entries = 0;
      for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
        (void)entry;
        ++entries;
      }
      if (entries != 1) {
        std::cerr << "Temporary files left behind\n";
        return EXIT_FAILURE;
      }
    }

    // Logger rotation keeps at most max_files generations.
    {
      const auto log_path = dir / "debug.log";
      util::DebugLogger logger;
      logger.Enable(log_path.string());
      logger.Configure(util::LogLevel::kInfo, 256, 2);
      for (int i = 0; i < 40; ++i) {
        logger.Log(util::LogLevel::kInfo, "challenge " + std::to_string(i) + " approved");
        logger.Log(util::LogLevel::kDebug, "suppressed below threshold");
      }
      if (!logger.Enabled() || !std::filesystem::exists(log_path) ||
          !std::filesystem::exists(log_path.string() + ".1")) {
        std::cerr << "Log rotation did not happen\n";
        return EXIT_FAILURE;
      }
      if (std::filesystem::exists(log_path.string() + ".3")) {
        std::cerr << "Too many rotated logs kept\n";
        return EXIT_FAILURE;
      }
      std::string contents;
      util::ReadFileToString(log_path, &contents);
      if (contents.find("suppressed") != std::string::npos) {
        std::cerr << "Debug line written above threshold\n";
        return EXIT_FAILURE;
      }
    }

    std::filesystem::remove_all(dir);
  } catch (const std::exception& ex) {
    std::cerr << "atomic_file_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
