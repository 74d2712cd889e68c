#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace piecework::core {

// Translate a storage result into the core exception taxonomy.
//   NotFound -> util::NotFound
//   Conflict, AlreadyExists -> util::Conflict
//   anything else -> std::runtime_error
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace piecework::core
