#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace piecework::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so a column list built once serves both backends.
  Decimals and dates travel as their canonical text form.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, std::string>;

using Params = std::vector<Param>;

// "column = <param>" pairs for a parameterised UPDATE ... SET.
using Assignments = std::vector<std::pair<std::string, Param>>;

} // namespace piecework::db::sql
