#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/core/actor.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace piecework;

void TestParseActor() {
  auto admin = core::ParseActor("admin:alice");
  assert(core::IsAdmin(admin));
  assert(core::UserId(admin) == "alice");
  assert(core::RoleName(admin) == "admin");

  auto supervisor = core::ParseActor("supervisor:bob:factory-7");
  assert(!core::IsAdmin(supervisor));
  assert(core::RoleName(supervisor) == "supervisor");
  assert(std::get<core::SupervisorActor>(supervisor).factory_id == std::optional<std::string>("factory-7"));

  auto unscoped = core::ParseActor("supervisor:bob");
  assert(!std::get<core::SupervisorActor>(unscoped).factory_id.has_value());

  for (const char* bad : {"", "admin", "admin:", "worker:x", "supervisor::f", "admin:a:b", "supervisor:b:"}) {
    bool threw = false;
    try {
      (void)core::ParseActor(bad);
    } catch (const util::Validation&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestRequireAdmin() {
  core::RequireAdmin(core::AdminActor{"a"}, "test");

  bool threw = false;
  try {
    core::RequireAdmin(core::SupervisorActor{"s", std::nullopt}, "test");
  } catch (const util::Forbidden&) {
    threw = true;
  }
  assert(threw);
}

void TestErrorKindsAndExitCodes() {
  assert(std::string(util::ErrorKind(util::NotFound("x"))) == "not_found");
  assert(std::string(util::ErrorKind(util::Conflict("x"))) == "conflict");
  assert(std::string(util::ErrorKind(util::Validation("x"))) == "validation");
  assert(std::string(util::ErrorKind(util::Forbidden("x"))) == "forbidden");
  assert(std::string(util::ErrorKind(std::runtime_error("x"))) == "internal");

  assert(util::ExitCode(util::NotFound("x")) == 3);
  assert(util::ExitCode(util::Conflict("x")) == 4);
  assert(util::ExitCode(util::Validation("x")) == 5);
  assert(util::ExitCode(util::Forbidden("x")) == 6);
  assert(util::ExitCode(std::logic_error("x")) == 2);
}

void TestDbResultTranslation() {
  core::ThrowIfDbError(db::Result::Ok(), "ok");

  auto kind_of = [](db::ErrorCode code) -> std::string {
    try {
      core::ThrowIfDbError(db::Result::Err(code, "boom"), "ctx");
    } catch (const std::exception& e) {
      return util::ErrorKind(e);
    }
    return "none";
  };

  assert(kind_of(db::ErrorCode::NotFound) == "not_found");
  assert(kind_of(db::ErrorCode::Conflict) == "conflict");
  assert(kind_of(db::ErrorCode::AlreadyExists) == "conflict");
  assert(kind_of(db::ErrorCode::Busy) == "internal");
  assert(kind_of(db::ErrorCode::IOError) == "internal");
}

void TestStateMachine() {
  using model::CanTransition;
  using model::TaskStatus;

  assert(CanTransition(TaskStatus::kPending, TaskStatus::kApproved, false));
  assert(CanTransition(TaskStatus::kPending, TaskStatus::kRejected, false));
  assert(CanTransition(TaskStatus::kApproved, TaskStatus::kRejected, false));
  assert(CanTransition(TaskStatus::kRejected, TaskStatus::kApproved, false));
  assert(CanTransition(TaskStatus::kApproved, TaskStatus::kApproved, false));

  assert(!CanTransition(TaskStatus::kApproved, TaskStatus::kPending, false));
  assert(!CanTransition(TaskStatus::kApproved, TaskStatus::kRejected, true));

  assert(model::IsEditable(TaskStatus::kPending, false));
  assert(!model::IsEditable(TaskStatus::kApproved, false));
}

} // namespace

int main() {
  TestParseActor();
  TestRequireAdmin();
  TestErrorKindsAndExitCodes();
  TestDbResultTranslation();
  TestStateMachine();

  std::cout << "piecework_unit_actor_errors: pass\n";
  return 0;
}
