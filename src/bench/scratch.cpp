#include "bindbench/bench/scratch.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace bindbench {

Expected<ScratchPath> ScratchPath::create(Destination kind,
                                          const std::optional<std::filesystem::path>& root) {
  std::error_code ec;
  std::filesystem::path dir = root ? *root : std::filesystem::temp_directory_path(ec);
  if (ec) {
    return fail(ErrorCode::IoError, "cannot determine temp directory: " + ec.message());
  }

  std::string tmpl = (dir / "bindbench.XXXXXX").string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  if (kind == Destination::Directory) {
    if (::mkdtemp(buf.data()) == nullptr) {
      return fail(ErrorCode::IoError,
                  "cannot create scratch directory in " + dir.string() + ": " + std::strerror(errno));
    }
  } else {
    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
      return fail(ErrorCode::IoError,
                  "cannot create scratch file in " + dir.string() + ": " + std::strerror(errno));
    }
    ::close(fd);
  }
  return ScratchPath{std::filesystem::path(buf.data()), kind};
}

ScratchPath::~ScratchPath() { remove(); }

ScratchPath::ScratchPath(ScratchPath&& other) noexcept
    : path_(std::exchange(other.path_, {})), kind_(other.kind_) {}

ScratchPath& ScratchPath::operator=(ScratchPath&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::exchange(other.path_, {});
    kind_ = other.kind_;
  }
  return *this;
}

void ScratchPath::remove() noexcept {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

Expected<uint64_t> ScratchPath::measure_bytes() const {
  std::error_code ec;
  if (kind_ == Destination::File) {
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
      return fail(ErrorCode::IoError, "cannot stat " + path_.string() + ": " + ec.message());
    }
    return static_cast<uint64_t>(size);
  }

  uint64_t total = 0;
  std::filesystem::recursive_directory_iterator it(path_, ec);
  if (ec) {
    return fail(ErrorCode::IoError, "cannot walk " + path_.string() + ": " + ec.message());
  }
  const std::filesystem::recursive_directory_iterator end;
  while (it != end) {
    if (it->is_regular_file(ec) && !ec) {
      total += static_cast<uint64_t>(it->file_size(ec));
    }
    if (ec) {
      return fail(ErrorCode::IoError,
                  "cannot stat " + it->path().string() + ": " + ec.message());
    }
    it.increment(ec);
    if (ec) {
      return fail(ErrorCode::IoError, "cannot walk " + path_.string() + ": " + ec.message());
    }
  }
  return total;
}

}  // namespace bindbench
