#include "internal/core/approval_manager.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace piecework::core {

namespace {

void RequireDecision(model::TaskStatus status) {
  if (!model::IsDecision(status)) {
    throw util::Validation("decision must be approved or rejected, got " + std::string(model::ToString(status)));
  }
}

} // namespace

ApprovalManager::ApprovalManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<RateResolver> rates,
                                 std::shared_ptr<audit::AuditRecorder> audit, int currency_places)
    : repository_(std::move(repository)),
      rates_(std::move(rates)),
      audit_(std::move(audit)),
      currency_places_(currency_places) {
}

Decision ApprovalManager::Decide(const std::string& task_id, model::TaskStatus new_status,
                                 const std::optional<std::string>& reason, const Actor& actor) {
  auto tx = repository_->Begin();

  auto task = repository_->GetWorkTask(*tx, task_id);
  if (!task) {
    throw util::NotFound("task not found: " + task_id);
  }

  auto day = repository_->GetWorkDay(*tx, task->work_day_id);
  if (!day) {
    throw util::NotFound("work day not found for task: " + task_id);
  }
  if (day->closed) {
    throw util::Conflict("work day is closed: " + day->id);
  }
  if (task->IsPaid()) {
    throw util::Conflict("task already settled in run " + *task->paid_run_id);
  }

  std::visit(Overloaded{[](const AdminActor&) {},
                        [&](const SupervisorActor& supervisor) {
                          if (day->logged_by != supervisor.user_id) {
                            throw util::Forbidden("supervisors may only decide tasks on days they logged");
                          }
                        }},
             actor);

  RequireDecision(new_status);
  if (!model::CanTransition(task->status, new_status, task->IsPaid())) {
    throw util::Conflict("task cannot move to " + std::string(model::ToString(new_status)));
  }

  db::TaskDecision decision;
  decision.status        = new_status;
  decision.decided_by    = UserId(actor);
  decision.decided_at_ms = util::NowMillis();
  decision.reason        = reason;
  // pay below is priced from this read; the write fails if an edit slipped in
  decision.expected_quantity     = task->quantity;
  decision.expected_task_type_id = task->task_type_id;
  if (new_status == model::TaskStatus::kApproved) {
    const auto rate      = rates_->Resolve(*tx, day->worker_id, task->task_type_id);
    decision.settled_pay = util::Decimal::Multiply(task->quantity, rate, currency_places_);
  }

  ThrowIfDbError(repository_->RecordDecision(*tx, task_id, decision), "record decision");
  tx->Commit();

  PIECEWORK_LOG_INFO("task decided", {observability::StringField("task_id", task_id),
                                      observability::StringField("status", model::ToString(new_status)),
                                      observability::StringField("settled_pay", decision.settled_pay.ToString(currency_places_)),
                                      observability::StringField("actor", UserId(actor))});

  auto event = audit::NewEvent(actor, new_status == model::TaskStatus::kApproved ? "TASK_APPROVE" : "TASK_REJECT",
                               "work_task", task_id);
  audit::SetString(event, "settled_pay", decision.settled_pay.ToString(currency_places_));
  if (reason) {
    audit::SetString(event, "reason", *reason);
  }
  audit::Emit(audit_.get(), std::move(event));

  return Decision{task_id, new_status, decision.settled_pay};
}

BulkDecisionResult ApprovalManager::BulkDecide(const std::vector<std::string>& task_ids, model::TaskStatus new_status,
                                               const std::optional<std::string>& reason, const Actor& actor) {
  RequireDecision(new_status);

  BulkDecisionResult result;
  for (const auto& task_id : task_ids) {
    try {
      Decide(task_id, new_status, reason, actor);
      ++result.updated;
    } catch (const util::NotFound& e) {
      ++result.skipped;
      PIECEWORK_LOG_DEBUG("bulk decide skipped task", {observability::StringField("task_id", task_id),
                                                       observability::StringField("reason", e.what())});
    } catch (const util::Conflict& e) {
      ++result.skipped;
      PIECEWORK_LOG_DEBUG("bulk decide skipped task", {observability::StringField("task_id", task_id),
                                                       observability::StringField("reason", e.what())});
    } catch (const util::Forbidden& e) {
      ++result.skipped;
      PIECEWORK_LOG_DEBUG("bulk decide skipped task", {observability::StringField("task_id", task_id),
                                                       observability::StringField("reason", e.what())});
    }
  }

  PIECEWORK_LOG_INFO("bulk decide finished", {observability::StringField("status", model::ToString(new_status)),
                                              observability::IntField("updated", static_cast<int64_t>(result.updated)),
                                              observability::IntField("skipped", static_cast<int64_t>(result.skipped))});
  return result;
}

} // namespace piecework::core
