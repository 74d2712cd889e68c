#include "internal/core/roster_manager.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace piecework::core {

using observability::StringField;

namespace {

void RequireRate(const util::Decimal& rate) {
  if (rate.IsNegative()) {
    throw util::Validation("rate cannot be negative");
  }
}

void RequireName(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::Validation(std::string(what) + " is required");
  }
}

// Unique-column clashes are caller mistakes, not storage faults.
void ThrowIfWriteFailed(const db::Result& result, const std::string& context) {
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw util::Conflict(context + ": " + result.message);
  }
  ThrowIfDbError(result, context);
}

} // namespace

RosterManager::RosterManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<audit::AuditRecorder> audit)
    : repository_(std::move(repository)), audit_(std::move(audit)) {
}

std::string RosterManager::CreateWorker(const NewWorker& input, const Actor& actor) {
  RequireName(input.full_name, "full_name");

  db::model::WorkerRecord worker;
  worker.id            = util::NewId();
  worker.worker_code   = input.worker_code;
  worker.full_name     = input.full_name;
  worker.factory_id    = input.factory_id;
  worker.payout        = input.payout;
  worker.anchor_date   = input.anchor_date.value_or(util::Today());
  worker.active        = true;
  worker.created_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  ThrowIfWriteFailed(repository_->InsertWorker(*tx, worker), "create worker");
  tx->Commit();

  PIECEWORK_LOG_INFO("worker created", {StringField("worker_id", worker.id), StringField("payout", model::ToString(worker.payout)),
                                        StringField("anchor_date", util::FormatIsoDate(worker.anchor_date))});

  auto event = audit::NewEvent(actor, "WORKER_CREATE", "worker", worker.id);
  audit::SetString(event, "full_name", worker.full_name);
  audit::SetString(event, "payout", std::string(model::ToString(worker.payout)));
  audit::SetString(event, "anchor_date", util::FormatIsoDate(worker.anchor_date));
  if (worker.worker_code) audit::SetString(event, "worker_code", *worker.worker_code);
  if (worker.factory_id) audit::SetString(event, "factory_id", *worker.factory_id);
  audit::Emit(audit_.get(), std::move(event));

  return worker.id;
}

void RosterManager::UpdateWorker(const std::string& worker_id, const db::WorkerPatch& patch, const Actor& actor) {
  RequireAdmin(actor, "updating a worker");
  if (patch.full_name) {
    RequireName(*patch.full_name, "full_name");
  }

  auto tx = repository_->Begin();
  if (!repository_->GetWorker(*tx, worker_id)) {
    throw util::NotFound("worker not found: " + worker_id);
  }
  if (patch.Empty()) {
    return;
  }
  ThrowIfWriteFailed(repository_->PatchWorker(*tx, worker_id, patch), "update worker");
  tx->Commit();

  PIECEWORK_LOG_INFO("worker updated", {StringField("worker_id", worker_id), StringField("actor", UserId(actor))});

  auto event = audit::NewEvent(actor, "WORKER_UPDATE", "worker", worker_id);
  if (patch.full_name) audit::SetString(event, "full_name", *patch.full_name);
  if (patch.worker_code) audit::SetString(event, "worker_code", patch.worker_code->value_or(""));
  if (patch.factory_id) audit::SetString(event, "factory_id", patch.factory_id->value_or(""));
  if (patch.payout) audit::SetString(event, "payout", std::string(model::ToString(*patch.payout)));
  if (patch.anchor_date) audit::SetString(event, "anchor_date", util::FormatIsoDate(*patch.anchor_date));
  if (patch.active) audit::SetBool(event, "active", *patch.active);
  audit::Emit(audit_.get(), std::move(event));
}

std::vector<db::model::WorkerRecord> RosterManager::ListWorkers(bool include_inactive) {
  db::WorkerFilter filter;
  filter.active_only = !include_inactive;

  auto tx      = repository_->Begin();
  auto workers = repository_->ListWorkers(*tx, filter);
  tx->Commit();
  return workers;
}

std::string RosterManager::UpsertTaskType(const NewTaskType& input, const Actor& actor) {
  RequireName(input.code, "code");
  RequireName(input.name, "name");
  RequireRate(input.default_rate);

  db::model::TaskTypeRecord task_type;
  task_type.code         = input.code;
  task_type.name         = input.name;
  task_type.unit         = input.unit;
  task_type.default_rate = input.default_rate;
  task_type.category     = input.category;

  auto tx = repository_->Begin();
  if (auto existing = repository_->GetTaskTypeByCode(*tx, input.code)) {
    task_type.id = existing->id;
  } else {
    task_type.id = util::NewId();
  }
  ThrowIfWriteFailed(repository_->UpsertTaskType(*tx, task_type), "upsert task type");
  tx->Commit();

  PIECEWORK_LOG_INFO("task type upserted", {StringField("task_type_id", task_type.id), StringField("code", task_type.code),
                                            StringField("default_rate", task_type.default_rate.ToString())});

  auto event = audit::NewEvent(actor, "TASK_TYPE_UPSERT", "task_type", task_type.id);
  audit::SetString(event, "code", task_type.code);
  audit::SetString(event, "default_rate", task_type.default_rate.ToString());
  audit::SetString(event, "category", std::string(model::ToString(task_type.category)));
  audit::Emit(audit_.get(), std::move(event));

  return task_type.id;
}

std::vector<db::model::TaskTypeRecord> RosterManager::ListTaskTypes() {
  auto tx    = repository_->Begin();
  auto types = repository_->ListTaskTypes(*tx);
  tx->Commit();
  return types;
}

void RosterManager::SetWorkerRate(const std::string& worker_id, const std::string& task_type_id, util::Decimal rate,
                                  const Actor& actor) {
  RequireAdmin(actor, "setting a worker rate");
  RequireRate(rate);

  auto tx = repository_->Begin();
  if (!repository_->GetWorker(*tx, worker_id)) {
    throw util::NotFound("worker not found: " + worker_id);
  }
  if (!repository_->GetTaskType(*tx, task_type_id)) {
    throw util::NotFound("task type not found: " + task_type_id);
  }
  ThrowIfDbError(repository_->UpsertWorkerRate(*tx, db::model::WorkerRateRecord{worker_id, task_type_id, rate}),
                 "set worker rate");
  tx->Commit();

  PIECEWORK_LOG_INFO("worker rate set", {StringField("worker_id", worker_id), StringField("task_type_id", task_type_id),
                                         StringField("rate", rate.ToString())});

  auto event = audit::NewEvent(actor, "WORKER_RATE_UPSERT", "worker_rate", worker_id + ":" + task_type_id);
  audit::SetString(event, "rate", rate.ToString());
  audit::Emit(audit_.get(), std::move(event));
}

void RosterManager::DeleteWorkerRate(const std::string& worker_id, const std::string& task_type_id, const Actor& actor) {
  RequireAdmin(actor, "deleting a worker rate");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteWorkerRate(*tx, worker_id, task_type_id), "delete worker rate");
  tx->Commit();

  PIECEWORK_LOG_INFO("worker rate deleted", {StringField("worker_id", worker_id), StringField("task_type_id", task_type_id)});
  audit::Emit(audit_.get(), audit::NewEvent(actor, "WORKER_RATE_DELETE", "worker_rate", worker_id + ":" + task_type_id));
}

std::vector<db::model::WorkerRateRecord> RosterManager::ListWorkerRates(const std::string& worker_id) {
  auto tx    = repository_->Begin();
  auto rates = repository_->ListWorkerRates(*tx, worker_id);
  tx->Commit();
  return rates;
}

} // namespace piecework::core
