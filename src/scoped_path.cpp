#include <reorg/scoped_path.h>

#include <reorg/errors.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <vector>

#include <unistd.h>

namespace reorg {
namespace {

std::atomic<unsigned long long> staging_counter{0};

std::string UniqueSuffix() {
  return std::to_string(static_cast<long long>(::getpid())) + "-" +
         std::to_string(staging_counter.fetch_add(1));
}

} // namespace

ScopedStagingFile::ScopedStagingFile(std::filesystem::path target)
    : target_(std::move(target)) {
  path_ = target_;
  path_ += ".reorg-" + UniqueSuffix() + ".part";
}

ScopedStagingFile::~ScopedStagingFile() {
  if (committed_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

bool ScopedStagingFile::Commit(std::error_code &ec) {
  ec.clear();
  std::filesystem::rename(path_, target_, ec);
  if (ec) {
    return false;
  }
  committed_ = true;
  return true;
}

ScratchDirectory::ScratchDirectory(const std::string &prefix) {
  auto pattern =
      (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (::mkdtemp(buffer.data()) == nullptr) {
    throw SetupError("Failed to create scratch directory " + pattern + ": " +
                     std::strerror(errno));
  }
  path_ = buffer.data();
}

ScratchDirectory::~ScratchDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

} // namespace reorg
