#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/actor.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/errors.hpp"

using piecework::core::Actor;
using piecework::factory::Application;
using piecework::util::Date;
using piecework::util::Decimal;

namespace model = piecework::model;

namespace {

void Usage() {
  std::cout << "Usage:\n"
            << "  pieceworkctl [--config <yaml>] --as admin:<id>|supervisor:<id>[:<factory>] <command> [args] [key=value]\n"
            << "\n"
            << "Roster:\n"
            << "  worker-add <full_name> [payout=weekly|biweekly|monthly] [anchor=YYYY-MM-DD] [code=] [factory=]\n"
            << "  worker-list [all=true]\n"
            << "  worker-deactivate <worker_id>\n"
            << "  task-type-add <code> <name> <unit> <default_rate> [category=primary|secondary|none]\n"
            << "  task-types\n"
            << "  rate-set <worker_id> <task_type_id> <rate>\n"
            << "  rate-delete <worker_id> <task_type_id>\n"
            << "  rates <worker_id>\n"
            << "\n"
            << "Work log:\n"
            << "  day-open <worker_id> <YYYY-MM-DD> [note=]\n"
            << "  day-close <work_day_id>\n"
            << "  day-reopen <work_day_id>\n"
            << "  days <worker_id> [start=] [end=]\n"
            << "  task-add <work_day_id> <task_type_id> <quantity> [id=] [note=]\n"
            << "  task-edit <task_id> [quantity=] [type=] [note=]\n"
            << "  task-delete <task_id>\n"
            << "  pending [worker=] [start=] [end=]\n"
            << "\n"
            << "Approval and settlement:\n"
            << "  decide <task_id> approved|rejected [reason=]\n"
            << "  bulk-decide approved|rejected <task_id>... [reason=]\n"
            << "  payroll <worker_id> [as_of=]\n"
            << "  payroll-due [as_of=]\n"
            << "  run-create [as_of=] [note=]\n"
            << "  runs [limit=]\n"
            << "  run-show <run_id>\n";
}

// Usage errors exit 1, before any domain error code.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct Invocation {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  const std::string& Arg(std::size_t index, const char* name) const {
    if (index >= positional.size()) {
      throw UsageError(std::string("missing argument <") + name + ">");
    }
    return positional[index];
  }

  std::optional<std::string> Option(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }

  std::optional<Date> DateOption(const std::string& key) const {
    auto value = Option(key);
    if (!value) return std::nullopt;
    return piecework::util::ParseIsoDate(*value);
  }
};

// key=value with a lowercase identifier key is an option; anything else is positional.
bool SplitOption(const std::string& arg, std::string* key, std::string* value) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  for (std::size_t i = 0; i < eq; ++i) {
    const char c = arg[i];
    if (!((c >= 'a' && c <= 'z') || c == '_')) return false;
  }
  *key   = arg.substr(0, eq);
  *value = arg.substr(eq + 1);
  return true;
}

model::TaskStatus ParseDecision(const std::string& text) {
  auto status = model::ParseTaskStatus(text);
  if (!status || *status == model::TaskStatus::kPending) {
    throw piecework::util::Validation("decision must be approved or rejected");
  }
  return *status;
}

model::RubricCategory ParseCategory(const std::string& text) {
  auto category = model::ParseRubricCategory(text);
  if (!category) {
    throw piecework::util::Validation("category must be primary, secondary or none");
  }
  return *category;
}

std::string OrDash(const std::optional<std::string>& value) {
  return value ? *value : "-";
}

void PrintLine(const piecework::core::PayrollLine& line, int places) {
  std::cout << line.worker_id << '\t' << line.worker_name << '\t' << model::ToString(line.payout) << '\t'
            << piecework::util::FormatIsoDate(line.period.start) << ".." << piecework::util::FormatIsoDate(line.period.end)
            << "\ttotal=" << line.total_pay.ToString(places) << " primary=" << line.primary_quantity.ToString()
            << " secondary=" << line.secondary_quantity.ToString() << " tasks=" << line.task_count << '\n';
}

void PrintRubric(const char* label, const piecework::core::RubricResult& r) {
  std::cout << "  " << label << ": progress=" << r.progress.ToString() << " target_met=" << (r.target_met ? "yes" : "no")
            << " remaining_secondary=" << r.remaining_secondary_to_equivalence.ToString()
            << " remaining_primary=" << r.remaining_primary_to_equivalence.ToString() << '\n';
}

using Handler = std::function<void(Application&, const Actor&, const Invocation&)>;

std::map<std::string, Handler> Commands() {
  std::map<std::string, Handler> commands;

  // ------------------------------------------------------------
  // Roster
  // ------------------------------------------------------------

  commands["worker-add"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::core::NewWorker worker;
    worker.full_name   = in.Arg(0, "full_name");
    worker.worker_code = in.Option("code");
    worker.factory_id  = in.Option("factory");
    worker.anchor_date = in.DateOption("anchor");
    if (auto payout = in.Option("payout")) {
      worker.payout = piecework::core::ParseFrequency(*payout);
    }
    std::cout << app.roster->CreateWorker(worker, actor) << '\n';
  };

  commands["worker-list"] = [](Application& app, const Actor&, const Invocation& in) {
    for (const auto& w : app.roster->ListWorkers(in.Option("all") == "true")) {
      std::cout << w.id << '\t' << OrDash(w.worker_code) << '\t' << w.full_name << '\t' << model::ToString(w.payout) << '\t'
                << piecework::util::FormatIsoDate(w.anchor_date) << '\t' << OrDash(w.factory_id) << '\t'
                << (w.active ? "active" : "inactive") << '\n';
    }
  };

  commands["worker-deactivate"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::db::WorkerPatch patch;
    patch.active = false;
    app.roster->UpdateWorker(in.Arg(0, "worker_id"), patch, actor);
    std::cout << "deactivated\n";
  };

  commands["task-type-add"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::core::NewTaskType task_type;
    task_type.code         = in.Arg(0, "code");
    task_type.name         = in.Arg(1, "name");
    task_type.unit         = in.Arg(2, "unit");
    task_type.default_rate = Decimal::Parse(in.Arg(3, "default_rate"));
    if (auto category = in.Option("category")) {
      task_type.category = ParseCategory(*category);
    }
    std::cout << app.roster->UpsertTaskType(task_type, actor) << '\n';
  };

  commands["task-types"] = [](Application& app, const Actor&, const Invocation&) {
    for (const auto& t : app.roster->ListTaskTypes()) {
      std::cout << t.id << '\t' << t.code << '\t' << t.name << '\t' << t.unit << '\t' << t.default_rate.ToString() << '\t'
                << model::ToString(t.category) << '\n';
    }
  };

  commands["rate-set"] = [](Application& app, const Actor& actor, const Invocation& in) {
    app.roster->SetWorkerRate(in.Arg(0, "worker_id"), in.Arg(1, "task_type_id"), Decimal::Parse(in.Arg(2, "rate")), actor);
    std::cout << "rate set\n";
  };

  commands["rate-delete"] = [](Application& app, const Actor& actor, const Invocation& in) {
    app.roster->DeleteWorkerRate(in.Arg(0, "worker_id"), in.Arg(1, "task_type_id"), actor);
    std::cout << "rate deleted\n";
  };

  commands["rates"] = [](Application& app, const Actor&, const Invocation& in) {
    for (const auto& r : app.roster->ListWorkerRates(in.Arg(0, "worker_id"))) {
      std::cout << r.task_type_id << '\t' << r.rate.ToString() << '\n';
    }
  };

  // ------------------------------------------------------------
  // Work log
  // ------------------------------------------------------------

  commands["day-open"] = [](Application& app, const Actor& actor, const Invocation& in) {
    const auto date = piecework::util::ParseIsoDate(in.Arg(1, "date"));
    std::cout << app.work_log->UpsertWorkDay(in.Arg(0, "worker_id"), date, in.Option("note"), actor) << '\n';
  };

  commands["day-close"] = [](Application& app, const Actor& actor, const Invocation& in) {
    app.work_log->CloseDay(in.Arg(0, "work_day_id"), actor);
    std::cout << "closed\n";
  };

  commands["day-reopen"] = [](Application& app, const Actor& actor, const Invocation& in) {
    app.work_log->ReopenDay(in.Arg(0, "work_day_id"), actor);
    std::cout << "reopened\n";
  };

  commands["days"] = [](Application& app, const Actor&, const Invocation& in) {
    const auto places = app.currency_places;
    for (const auto& view : app.work_log->ListWorkDays(in.Arg(0, "worker_id"), in.DateOption("start"), in.DateOption("end"))) {
      std::cout << view.day.id << '\t' << piecework::util::FormatIsoDate(view.day.work_date) << '\t'
                << (view.day.closed ? "closed" : "open") << '\t' << OrDash(view.day.note) << '\n';
      for (const auto& t : view.tasks) {
        std::cout << "  " << t.task.id << '\t' << t.task_code << '\t' << t.task.quantity.ToString() << ' ' << t.unit << '\t'
                  << model::ToString(t.task.status) << '\t' << t.task.settled_pay.ToString(places)
                  << (t.task.IsPaid() ? "\tpaid" : "") << '\n';
      }
      PrintRubric("logged", view.rubric.logged);
      PrintRubric("approved", view.rubric.approved);
    }
  };

  commands["task-add"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::core::NewTask task;
    task.id           = in.Option("id");
    task.work_day_id  = in.Arg(0, "work_day_id");
    task.task_type_id = in.Arg(1, "task_type_id");
    task.quantity     = Decimal::Parse(in.Arg(2, "quantity"));
    task.note         = in.Option("note");
    std::cout << app.work_log->AddTask(task, actor) << '\n';
  };

  commands["task-edit"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::db::WorkTaskPatch patch;
    if (auto quantity = in.Option("quantity")) patch.quantity = Decimal::Parse(*quantity);
    if (auto type = in.Option("type")) patch.task_type_id = *type;
    if (auto note = in.Option("note")) {
      patch.note = note->empty() ? std::nullopt : std::optional<std::string>(*note);
    }
    app.work_log->EditTask(in.Arg(0, "task_id"), patch, actor);
    std::cout << "edited\n";
  };

  commands["task-delete"] = [](Application& app, const Actor& actor, const Invocation& in) {
    app.work_log->DeleteTask(in.Arg(0, "task_id"), actor);
    std::cout << "deleted\n";
  };

  commands["pending"] = [](Application& app, const Actor& actor, const Invocation& in) {
    piecework::db::PendingTaskFilter filter;
    filter.worker_id = in.Option("worker");
    filter.start     = in.DateOption("start");
    filter.end       = in.DateOption("end");
    for (const auto& row : app.work_log->ListPendingTasks(filter, actor)) {
      std::cout << row.task.id << '\t' << piecework::util::FormatIsoDate(row.work_date) << '\t' << row.worker_name << '\t'
                << row.task_code << '\t' << row.task.quantity.ToString() << ' ' << row.unit << '\n';
    }
  };

  // ------------------------------------------------------------
  // Approval and settlement
  // ------------------------------------------------------------

  commands["decide"] = [](Application& app, const Actor& actor, const Invocation& in) {
    const auto decision =
        app.approvals->Decide(in.Arg(0, "task_id"), ParseDecision(in.Arg(1, "decision")), in.Option("reason"), actor);
    std::cout << model::ToString(decision.status) << " settled_pay=" << decision.settled_pay.ToString(app.currency_places)
              << '\n';
  };

  commands["bulk-decide"] = [](Application& app, const Actor& actor, const Invocation& in) {
    const auto status = ParseDecision(in.Arg(0, "decision"));
    std::vector<std::string> task_ids(in.positional.begin() + 1, in.positional.end());
    const auto result = app.approvals->BulkDecide(task_ids, status, in.Option("reason"), actor);
    std::cout << "updated=" << result.updated << " skipped=" << result.skipped << '\n';
  };

  commands["payroll"] = [](Application& app, const Actor&, const Invocation& in) {
    const auto as_of = in.DateOption("as_of").value_or(piecework::util::Today());
    PrintLine(app.settlement->WorkerPayroll(in.Arg(0, "worker_id"), as_of), app.currency_places);
  };

  commands["payroll-due"] = [](Application& app, const Actor& actor, const Invocation& in) {
    const auto as_of = in.DateOption("as_of").value_or(piecework::util::Today());
    for (const auto& line : app.settlement->PayrollDue(as_of, actor)) {
      PrintLine(line, app.currency_places);
    }
  };

  commands["run-create"] = [](Application& app, const Actor& actor, const Invocation& in) {
    const auto as_of   = in.DateOption("as_of").value_or(piecework::util::Today());
    const auto summary = app.settlement->CreateRun(as_of, in.Option("note"), actor);
    std::cout << summary.run_id << " items=" << summary.items.size() << " failed=" << summary.failed_workers.size() << '\n';
    for (const auto& worker_id : summary.failed_workers) {
      std::cout << "  failed\t" << worker_id << '\n';
    }
  };

  commands["runs"] = [](Application& app, const Actor&, const Invocation& in) {
    std::size_t limit = piecework::core::SettlementEngine::kDefaultRunLimit;
    if (auto value = in.Option("limit")) {
      try {
        limit = static_cast<std::size_t>(std::stoul(*value));
      } catch (const std::exception&) {
        throw UsageError("limit must be a positive number");
      }
    }
    for (const auto& run : app.settlement->ListRuns(limit)) {
      std::cout << run.id << '\t' << piecework::util::FormatIsoDate(run.as_of) << '\t' << run.created_by << '\t'
                << OrDash(run.note) << '\n';
    }
  };

  commands["run-show"] = [](Application& app, const Actor&, const Invocation& in) {
    const auto detail = app.settlement->GetRun(in.Arg(0, "run_id"));
    std::cout << detail.run.id << " as_of=" << piecework::util::FormatIsoDate(detail.run.as_of)
              << " created_by=" << detail.run.created_by << " note=" << OrDash(detail.run.note) << '\n';
    for (const auto& item : detail.items) {
      std::cout << "  " << item.worker_id << '\t' << item.worker_name << '\t' << model::ToString(item.payout) << '\t'
                << piecework::util::FormatIsoDate(item.period_start) << ".."
                << piecework::util::FormatIsoDate(item.period_end) << "\ttotal=" << item.total_pay.ToString(app.currency_places)
                << " tasks=" << item.task_count << '\n';
    }
  };

  return commands;
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> actor_text;
  std::string                command;
  Invocation                 invocation;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (command.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (command.empty() && arg == "--as" && i + 1 < argc) {
      actor_text = argv[++i];
    } else if (command.empty() && (arg == "-h" || arg == "--help")) {
      Usage();
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      std::string key;
      std::string value;
      if (SplitOption(arg, &key, &value)) {
        invocation.options[key] = value;
      } else {
        invocation.positional.push_back(arg);
      }
    }
  }

  const auto commands = Commands();
  auto       handler  = commands.find(command);
  if (command.empty() || handler == commands.end() || !actor_text) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    piecework::runtime::config::RuntimeConfig config;
    if (config_path) {
      config = piecework::config::ConfigLoader::LoadFromYaml(*config_path);
    }
    piecework::observability::InitializeLogging(config);

    const Actor actor = piecework::core::ParseActor(*actor_text);

    // ------------------------------------------------------------
    // Build application (dependency graph) and run the command
    // ------------------------------------------------------------
    auto app = piecework::factory::Build(config);
    handler->second(app, actor, invocation);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    piecework::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << piecework::util::ErrorKind(e) << ": " << e.what() << "\n";
    piecework::observability::ShutdownLogging();
    return piecework::util::ExitCode(e);
  }

  piecework::observability::ShutdownLogging();
  return 0;
}
