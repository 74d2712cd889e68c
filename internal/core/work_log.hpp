#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_recorder.hpp"
#include "internal/core/actor.hpp"
#include "internal/core/rubric_evaluator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::core {

struct NewTask {
  // client-supplied id makes offline replays idempotent
  std::optional<std::string> id;
  std::string                work_day_id;
  std::string                task_type_id;
  util::Decimal              quantity;
  std::optional<std::string> note;
};

struct TaskView {
  db::model::WorkTaskRecord task;
  std::string               task_code;
  std::string               task_name;
  std::string               unit;
};

struct WorkDayView {
  db::model::WorkDayRecord day;
  std::vector<TaskView>    tasks;
  DayRubric                rubric;
};

/*
  WorkLog

  Daily logging of piecework. A closed day is frozen: tasks on it cannot be
  added, edited, deleted or decided until an admin reopens it. Only pending
  tasks are editable, and a supervisor may only touch days they logged.
*/
class WorkLog {
 public:
  WorkLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<RubricEvaluator> rubric,
          std::shared_ptr<audit::AuditRecorder> audit);

  // One day per (worker, date); an existing open day keeps its logger and takes the new note.
  std::string UpsertWorkDay(const std::string& worker_id, util::Date date, const std::optional<std::string>& note,
                            const Actor& actor);

  void CloseDay(const std::string& work_day_id, const Actor& actor);
  // admin only
  void ReopenDay(const std::string& work_day_id, const Actor& actor);

  std::string AddTask(const NewTask& task, const Actor& actor);
  void        EditTask(const std::string& task_id, const db::WorkTaskPatch& patch, const Actor& actor);
  void        DeleteTask(const std::string& task_id, const Actor& actor);

  // Supervisors only see days they logged.
  std::vector<db::PendingTaskRow> ListPendingTasks(db::PendingTaskFilter filter, const Actor& actor);

  // Newest day first, each with its tasks and rubric.
  std::vector<WorkDayView> ListWorkDays(const std::string& worker_id, std::optional<util::Date> start,
                                        std::optional<util::Date> end);

 private:
  // Loads the task and its day and enforces the edit/delete preconditions.
  db::model::WorkTaskRecord EditableTask(db::Transaction& tx, const std::string& task_id, const Actor& actor);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<RubricEvaluator>      rubric_;
  std::shared_ptr<audit::AuditRecorder> audit_;
};

} // namespace piecework::core
