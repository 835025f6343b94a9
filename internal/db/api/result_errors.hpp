#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace rollout::db {

// Converts a backend Result into the util exception taxonomy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw util::Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace rollout::db
