#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_recorder.hpp"
#include "internal/core/actor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/types.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::core {

struct NewWorker {
  std::optional<std::string> worker_code;
  std::string                full_name;
  std::optional<std::string> factory_id;
  model::PayoutFrequency     payout = model::PayoutFrequency::kWeekly;
  // defaults to today
  std::optional<util::Date> anchor_date;
};

struct NewTaskType {
  std::string           code;
  std::string           name;
  std::string           unit;
  util::Decimal         default_rate;
  model::RubricCategory category = model::RubricCategory::kNone;
};

/*
  RosterManager

  Reference data: workers, task types and per-worker rate overrides.
  Workers are never deleted, only deactivated.
*/
class RosterManager {
 public:
  RosterManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<audit::AuditRecorder> audit);

  std::string CreateWorker(const NewWorker& worker, const Actor& actor);
  // admin only
  void UpdateWorker(const std::string& worker_id, const db::WorkerPatch& patch, const Actor& actor);
  std::vector<db::model::WorkerRecord> ListWorkers(bool include_inactive);

  // Keyed by code: an existing code keeps its id and takes the new fields.
  std::string UpsertTaskType(const NewTaskType& task_type, const Actor& actor);
  std::vector<db::model::TaskTypeRecord> ListTaskTypes();

  // admin only
  void SetWorkerRate(const std::string& worker_id, const std::string& task_type_id, util::Decimal rate,
                     const Actor& actor);
  void DeleteWorkerRate(const std::string& worker_id, const std::string& task_type_id, const Actor& actor);
  std::vector<db::model::WorkerRateRecord> ListWorkerRates(const std::string& worker_id);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<audit::AuditRecorder> audit_;
};

} // namespace piecework::core
