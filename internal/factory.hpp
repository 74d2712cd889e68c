#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/audit/audit_recorder.hpp"
#include "internal/core/approval_manager.hpp"
#include "internal/core/rubric_evaluator.hpp"
#include "internal/core/roster_manager.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/core/work_log.hpp"
#include "internal/db/api/repository.hpp"

namespace piecework::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the lifetime
  of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<audit::AuditRecorder> audit;

  std::shared_ptr<core::RubricEvaluator>  rubric;
  std::shared_ptr<core::RosterManager>    roster;
  std::shared_ptr<core::WorkLog>          work_log;
  std::shared_ptr<core::ApprovalManager>  approvals;
  std::shared_ptr<core::SettlementEngine> settlement;

  int currency_places = 2;
};

/*
  Build

  Constructs the whole backend from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const piecework::runtime::config::RuntimeConfig& config);

// Same graph over a caller-supplied repository and sink (tests).
Application Build(const piecework::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<audit::AuditRecorder> audit);

} // namespace piecework::factory
