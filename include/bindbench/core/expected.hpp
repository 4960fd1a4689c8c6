#pragma once

#include <expected>

#include "bindbench/core/error.hpp"

namespace bindbench {

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

// Shorthand for the common `return std::unexpected(Error{code, msg})`.
inline std::unexpected<Error> fail(ErrorCode code, std::string message) {
  return std::unexpected(Error{code, std::move(message)});
}

}  // namespace bindbench
