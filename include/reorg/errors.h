#pragma once

#include <stdexcept>
#include <string>

namespace reorg {

// Metadata that cannot be read or whose header is structurally invalid.
class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string &message)
      : std::runtime_error(message) {}
};

// Source tree, output root or index problems that prevent any transfer.
class SetupError : public std::runtime_error {
public:
  explicit SetupError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace reorg
