#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace piecework::core {

/*
  Caller identity.

  Authentication happens upstream; the core only sees who is acting and in
  which role. Role checks are std::visit over the alternatives.
*/

struct AdminActor {
  std::string user_id;
};

struct SupervisorActor {
  std::string user_id;
  // restricts payroll-due listings when set
  std::optional<std::string> factory_id;
};

using Actor = std::variant<AdminActor, SupervisorActor>;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const std::string& UserId(const Actor& actor);

// "admin" | "supervisor"
std::string_view RoleName(const Actor& actor);

bool IsAdmin(const Actor& actor);

// Throws util::Forbidden unless the actor is an admin.
void RequireAdmin(const Actor& actor, std::string_view action);

// "admin:<id>" or "supervisor:<id>[:<factory_id>]". Throws util::Validation.
Actor ParseActor(std::string_view text);

} // namespace piecework::core
