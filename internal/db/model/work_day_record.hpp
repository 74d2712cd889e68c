#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/date.hpp"

namespace piecework::db::model {

/*
  One row per (worker_id, work_date).

  A closed day freezes every task that belongs to it: no creation, edit,
  deletion or decision change until an admin reopens it.
*/

struct WorkDayRecord {
  std::string id;
  std::string worker_id;
  util::Date  work_date{};

  // user who logged the day; supervisors may only decide tasks on their own days
  std::string logged_by;

  std::optional<std::string> note;

  bool                       closed = false;
  std::optional<std::string> closed_by;
  std::optional<uint64_t>    closed_at_ms;

  uint64_t created_at_ms = 0;
};

} // namespace piecework::db::model
