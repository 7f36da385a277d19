#ifndef REORG_TEST_SUPPORT_TEMPORARY_TREE_H
#define REORG_TEST_SUPPORT_TEMPORARY_TREE_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

namespace reorg {
namespace test {

class TemporaryTree {
public:
  TemporaryTree() {
    static std::atomic<unsigned> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("reorg-test-" + std::to_string(::getpid()) + "-" +
             std::to_string(timestamp) + "-" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryTree() {
    std::error_code ec;
    std::filesystem::permissions(root_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
    std::filesystem::remove_all(root_, ec);
  }

  TemporaryTree(const TemporaryTree &) = delete;
  TemporaryTree &operator=(const TemporaryTree &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path, std::ios::binary);
    stream << content;
    return full_path;
  }

  std::filesystem::path AddDirectory(const std::filesystem::path &relative) const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path);
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

inline std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

} // namespace test
} // namespace reorg

#endif // REORG_TEST_SUPPORT_TEMPORARY_TREE_H
