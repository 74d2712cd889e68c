#include "internal/core/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace piecework::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace piecework::core
