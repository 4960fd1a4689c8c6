#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"

namespace bindbench {

// A fresh temporary file or directory, removed (recursively) on destruction.
class ScratchPath {
 public:
  static Expected<ScratchPath> create(Destination kind,
                                      const std::optional<std::filesystem::path>& root);

  ~ScratchPath();
  ScratchPath(ScratchPath&& other) noexcept;
  ScratchPath& operator=(ScratchPath&& other) noexcept;
  ScratchPath(const ScratchPath&) = delete;
  ScratchPath& operator=(const ScratchPath&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }
  Destination kind() const noexcept { return kind_; }

  // File size, or the summed size of regular files below a directory.
  Expected<uint64_t> measure_bytes() const;

 private:
  ScratchPath(std::filesystem::path p, Destination kind) : path_(std::move(p)), kind_(kind) {}

  void remove() noexcept;

  std::filesystem::path path_{};
  Destination kind_{Destination::File};
};

}  // namespace bindbench
