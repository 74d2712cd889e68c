#pragma once

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace piecework::db::sql {

/*
  Map typed patches onto fixed column names.

  Only engaged fields appear. Column names come from this file, never from
  caller input.
*/

Assignments WorkerAssignments(const WorkerPatch& patch);

Assignments WorkTaskAssignments(const WorkTaskPatch& patch);

} // namespace piecework::db::sql
