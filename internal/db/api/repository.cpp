#include "internal/db/api/repository.hpp"

#include "internal/util/errors.hpp"

namespace stageflow::db {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace stageflow::db
