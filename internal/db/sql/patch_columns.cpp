#include "internal/db/sql/patch_columns.hpp"

#include <string>

namespace piecework::db::sql {

namespace {

Param Nullable(const std::optional<std::string>& value) {
  if (!value) return nullptr;
  return *value;
}

} // namespace

Assignments WorkerAssignments(const WorkerPatch& patch) {
  Assignments out;
  if (patch.worker_code) out.emplace_back("worker_code", Nullable(*patch.worker_code));
  if (patch.full_name) out.emplace_back("full_name", *patch.full_name);
  if (patch.factory_id) out.emplace_back("factory_id", Nullable(*patch.factory_id));
  if (patch.payout) out.emplace_back("payout", static_cast<int32_t>(*patch.payout));
  if (patch.anchor_date) out.emplace_back("anchor_date", util::FormatIsoDate(*patch.anchor_date));
  if (patch.active) out.emplace_back("active", static_cast<int32_t>(*patch.active ? 1 : 0));
  return out;
}

Assignments WorkTaskAssignments(const WorkTaskPatch& patch) {
  Assignments out;
  if (patch.quantity) out.emplace_back("quantity", patch.quantity->ToString());
  if (patch.task_type_id) out.emplace_back("task_type_id", *patch.task_type_id);
  if (patch.note) out.emplace_back("note", Nullable(*patch.note));
  return out;
}

} // namespace piecework::db::sql
