#include "internal/core/actor.hpp"

#include "internal/util/errors.hpp"

namespace piecework::core {

const std::string& UserId(const Actor& actor) {
  return std::visit([](const auto& a) -> const std::string& { return a.user_id; }, actor);
}

std::string_view RoleName(const Actor& actor) {
  return std::visit(Overloaded{[](const AdminActor&) { return std::string_view("admin"); },
                               [](const SupervisorActor&) { return std::string_view("supervisor"); }},
                    actor);
}

bool IsAdmin(const Actor& actor) {
  return std::holds_alternative<AdminActor>(actor);
}

void RequireAdmin(const Actor& actor, std::string_view action) {
  if (!IsAdmin(actor)) {
    throw util::Forbidden(std::string(action) + " requires admin");
  }
}

Actor ParseActor(std::string_view text) {
  const auto first = text.find(':');
  if (first == std::string_view::npos || first + 1 >= text.size()) {
    throw util::Validation("actor must be admin:<id> or supervisor:<id>[:<factory>]");
  }

  const auto role = text.substr(0, first);
  auto       rest = text.substr(first + 1);

  if (role == "admin") {
    if (rest.find(':') != std::string_view::npos) {
      throw util::Validation("admin actor takes no factory");
    }
    return AdminActor{std::string(rest)};
  }

  if (role == "supervisor") {
    SupervisorActor supervisor;
    const auto      second = rest.find(':');
    supervisor.user_id     = std::string(rest.substr(0, second));
    if (second != std::string_view::npos) {
      const auto factory = rest.substr(second + 1);
      if (factory.empty()) {
        throw util::Validation("empty factory id in actor");
      }
      supervisor.factory_id = std::string(factory);
    }
    if (supervisor.user_id.empty()) {
      throw util::Validation("empty user id in actor");
    }
    return supervisor;
  }

  throw util::Validation("unknown role '" + std::string(role) + "'");
}

} // namespace piecework::core
