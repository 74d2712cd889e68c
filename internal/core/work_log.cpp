#include "internal/core/work_log.hpp"

#include <unordered_map>

#include "internal/core/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace piecework::core {

using observability::StringField;

namespace {

void RequireNonNegative(const util::Decimal& quantity) {
  if (quantity.IsNegative()) {
    throw util::Validation("quantity cannot be negative");
  }
}

void RequireOpen(const db::model::WorkDayRecord& day) {
  if (day.closed) {
    throw util::Conflict("work day is closed: " + day.id);
  }
}

} // namespace

WorkLog::WorkLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<RubricEvaluator> rubric,
                 std::shared_ptr<audit::AuditRecorder> audit)
    : repository_(std::move(repository)), rubric_(std::move(rubric)), audit_(std::move(audit)) {
}

std::string WorkLog::UpsertWorkDay(const std::string& worker_id, util::Date date, const std::optional<std::string>& note,
                                   const Actor& actor) {
  auto tx = repository_->Begin();

  if (!repository_->GetWorker(*tx, worker_id)) {
    throw util::NotFound("worker not found: " + worker_id);
  }

  db::model::WorkDayRecord day;
  day.id            = util::NewId();
  day.worker_id     = worker_id;
  day.work_date     = date;
  day.logged_by     = UserId(actor);
  day.note          = note;
  day.created_at_ms = util::NowMillis();

  const auto inserted = repository_->InsertWorkDayIfAbsent(*tx, day);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    // day now holds the stored row
    RequireOpen(day);
    ThrowIfDbError(repository_->UpdateWorkDayNote(*tx, day.id, note), "update work day note");
  } else {
    ThrowIfDbError(inserted, "insert work day");
  }
  tx->Commit();

  PIECEWORK_LOG_INFO("work day upserted", {StringField("work_day_id", day.id), StringField("worker_id", worker_id),
                                           StringField("work_date", util::FormatIsoDate(date))});

  auto event = audit::NewEvent(actor, "WORKDAY_UPSERT", "work_day", day.id);
  audit::SetString(event, "worker_id", worker_id);
  audit::SetString(event, "work_date", util::FormatIsoDate(date));
  if (note) audit::SetString(event, "note", *note);
  audit::Emit(audit_.get(), std::move(event));

  return day.id;
}

void WorkLog::CloseDay(const std::string& work_day_id, const Actor& actor) {
  auto tx  = repository_->Begin();
  auto day = repository_->GetWorkDay(*tx, work_day_id);
  if (!day) {
    throw util::NotFound("work day not found: " + work_day_id);
  }
  if (day->closed) {
    return;
  }

  ThrowIfDbError(repository_->SetWorkDayClosed(*tx, work_day_id, true, UserId(actor), util::NowMillis()), "close work day");
  tx->Commit();

  PIECEWORK_LOG_INFO("work day closed", {StringField("work_day_id", work_day_id), StringField("actor", UserId(actor))});
  audit::Emit(audit_.get(), audit::NewEvent(actor, "WORKDAY_CLOSE", "work_day", work_day_id));
}

void WorkLog::ReopenDay(const std::string& work_day_id, const Actor& actor) {
  RequireAdmin(actor, "reopening a work day");

  auto tx  = repository_->Begin();
  auto day = repository_->GetWorkDay(*tx, work_day_id);
  if (!day) {
    throw util::NotFound("work day not found: " + work_day_id);
  }
  if (!day->closed) {
    return;
  }

  ThrowIfDbError(repository_->SetWorkDayClosed(*tx, work_day_id, false, std::nullopt, std::nullopt), "reopen work day");
  tx->Commit();

  PIECEWORK_LOG_INFO("work day reopened", {StringField("work_day_id", work_day_id), StringField("actor", UserId(actor))});
  audit::Emit(audit_.get(), audit::NewEvent(actor, "WORKDAY_REOPEN", "work_day", work_day_id));
}

std::string WorkLog::AddTask(const NewTask& input, const Actor& actor) {
  RequireNonNegative(input.quantity);
  if (input.id && !util::IsUuidString(*input.id)) {
    throw util::Validation("task id must be a UUID: " + *input.id);
  }

  auto tx  = repository_->Begin();
  auto day = repository_->GetWorkDay(*tx, input.work_day_id);
  if (!day) {
    throw util::NotFound("work day not found: " + input.work_day_id);
  }
  RequireOpen(*day);
  if (!repository_->GetTaskType(*tx, input.task_type_id)) {
    throw util::NotFound("task type not found: " + input.task_type_id);
  }

  db::model::WorkTaskRecord task;
  task.id            = input.id.value_or(util::NewId());
  task.work_day_id   = input.work_day_id;
  task.task_type_id  = input.task_type_id;
  task.quantity      = input.quantity;
  task.note          = input.note;
  task.created_at_ms = util::NowMillis();

  const auto inserted = repository_->InsertWorkTaskIfAbsent(*tx, task);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    // replay of a task we already hold
    PIECEWORK_LOG_DEBUG("task replay ignored", {StringField("task_id", task.id)});
    return task.id;
  }
  ThrowIfDbError(inserted, "insert task");
  tx->Commit();

  PIECEWORK_LOG_INFO("task added", {StringField("task_id", task.id), StringField("work_day_id", task.work_day_id),
                                    StringField("quantity", task.quantity.ToString())});

  auto event = audit::NewEvent(actor, "TASK_CREATE", "work_task", task.id);
  audit::SetString(event, "work_day_id", task.work_day_id);
  audit::SetString(event, "task_type_id", task.task_type_id);
  audit::SetString(event, "quantity", task.quantity.ToString());
  if (task.note) audit::SetString(event, "note", *task.note);
  audit::Emit(audit_.get(), std::move(event));

  return task.id;
}

db::model::WorkTaskRecord WorkLog::EditableTask(db::Transaction& tx, const std::string& task_id, const Actor& actor) {
  auto task = repository_->GetWorkTask(tx, task_id);
  if (!task) {
    throw util::NotFound("task not found: " + task_id);
  }
  auto day = repository_->GetWorkDay(tx, task->work_day_id);
  if (!day) {
    throw util::NotFound("work day not found for task: " + task_id);
  }
  RequireOpen(*day);
  if (!model::IsEditable(task->status, task->IsPaid())) {
    throw util::Conflict("only pending tasks can be changed: " + task_id);
  }
  std::visit(Overloaded{[](const AdminActor&) {},
                        [&](const SupervisorActor& supervisor) {
                          if (day->logged_by != supervisor.user_id) {
                            throw util::Forbidden("supervisors may only change tasks they logged");
                          }
                        }},
             actor);
  return *task;
}

void WorkLog::EditTask(const std::string& task_id, const db::WorkTaskPatch& patch, const Actor& actor) {
  if (patch.quantity) {
    RequireNonNegative(*patch.quantity);
  }

  auto tx = repository_->Begin();
  EditableTask(*tx, task_id, actor);
  if (patch.Empty()) {
    return;
  }
  if (patch.task_type_id && !repository_->GetTaskType(*tx, *patch.task_type_id)) {
    throw util::NotFound("task type not found: " + *patch.task_type_id);
  }

  ThrowIfDbError(repository_->PatchWorkTask(*tx, task_id, patch, UserId(actor), util::NowMillis()), "edit task");
  tx->Commit();

  PIECEWORK_LOG_INFO("task edited", {StringField("task_id", task_id), StringField("actor", UserId(actor))});

  auto event = audit::NewEvent(actor, "TASK_EDIT", "work_task", task_id);
  if (patch.quantity) audit::SetString(event, "quantity", patch.quantity->ToString());
  if (patch.task_type_id) audit::SetString(event, "task_type_id", *patch.task_type_id);
  if (patch.note) audit::SetString(event, "note", patch.note->value_or(""));
  audit::Emit(audit_.get(), std::move(event));
}

void WorkLog::DeleteTask(const std::string& task_id, const Actor& actor) {
  auto tx = repository_->Begin();
  EditableTask(*tx, task_id, actor);

  ThrowIfDbError(repository_->DeleteWorkTask(*tx, task_id), "delete task");
  tx->Commit();

  PIECEWORK_LOG_INFO("task deleted", {StringField("task_id", task_id), StringField("actor", UserId(actor))});
  audit::Emit(audit_.get(), audit::NewEvent(actor, "TASK_DELETE", "work_task", task_id));
}

std::vector<db::PendingTaskRow> WorkLog::ListPendingTasks(db::PendingTaskFilter filter, const Actor& actor) {
  if (const auto* supervisor = std::get_if<SupervisorActor>(&actor)) {
    filter.logged_by = supervisor->user_id;
  }

  auto tx   = repository_->Begin();
  auto rows = repository_->ListPendingTasks(*tx, filter);
  tx->Commit();
  return rows;
}

std::vector<WorkDayView> WorkLog::ListWorkDays(const std::string& worker_id, std::optional<util::Date> start,
                                               std::optional<util::Date> end) {
  auto tx = repository_->Begin();
  if (!repository_->GetWorker(*tx, worker_id)) {
    throw util::NotFound("worker not found: " + worker_id);
  }

  std::unordered_map<std::string, db::model::TaskTypeRecord> task_types;
  for (auto& task_type : repository_->ListTaskTypes(*tx)) {
    task_types.emplace(task_type.id, std::move(task_type));
  }

  std::vector<WorkDayView> out;
  for (auto& day : repository_->ListWorkDays(*tx, worker_id, start, end)) {
    WorkDayView view;
    view.day = std::move(day);

    std::vector<RubricTask> rubric_tasks;
    for (auto& task : repository_->ListTasksForDay(*tx, view.day.id)) {
      TaskView task_view;
      auto     type = task_types.find(task.task_type_id);
      if (type != task_types.end()) {
        task_view.task_code = type->second.code;
        task_view.task_name = type->second.name;
        task_view.unit      = type->second.unit;
        rubric_tasks.push_back(RubricTask{type->second.category, task.status, task.quantity});
      }
      task_view.task = std::move(task);
      view.tasks.push_back(std::move(task_view));
    }
    view.rubric = rubric_->EvaluateDay(rubric_tasks);
    out.push_back(std::move(view));
  }
  tx->Commit();
  return out;
}

} // namespace piecework::core
