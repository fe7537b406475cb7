/**
 * @file test_helpers.hpp
 * @brief Scratch directories and fake external tools for the test suite
 */

#ifndef VIDCUT_TEST_HELPERS_HPP
#define VIDCUT_TEST_HELPERS_HPP

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace vidcut {
namespace testing {

namespace fs = std::filesystem;

/// Unique directory under the system temp dir, removed on destruction
class ScratchDir {
public:
  ScratchDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "vidcut-test-XXXXXX").string();
    if (!mkdtemp(tmpl.data()))
      throw std::runtime_error("mkdtemp failed");
    path_ = tmpl;
  }

  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;

  const fs::path &path() const { return path_; }
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

private:
  fs::path path_;
};

inline void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

/**
 * @brief Write an executable /bin/sh script standing in for a tool.
 * @return Absolute path of the script
 */
inline std::string write_script(const ScratchDir &dir, const std::string &name,
                                const std::string &body) {
  std::string path = dir.file(name);
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "#!/bin/sh\n" << body;
  }
  fs::permissions(path,
                  fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read |
                      fs::perms::others_exec,
                  fs::perm_options::replace);
  return path;
}

/// Poll a condition until it holds or the timeout expires
inline bool eventually(const std::function<bool()> &cond,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return cond();
}

} // namespace testing
} // namespace vidcut

#endif // VIDCUT_TEST_HELPERS_HPP
