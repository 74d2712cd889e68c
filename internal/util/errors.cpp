#include "internal/util/errors.hpp"

namespace piecework::util {

const char* ErrorKind(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) {
    return "not_found";
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return "conflict";
  }
  if (dynamic_cast<const Validation*>(&e)) {
    return "validation";
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return "forbidden";
  }
  return "internal";
}

int ExitCode(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) {
    return 3;
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return 4;
  }
  if (dynamic_cast<const Validation*>(&e)) {
    return 5;
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return 6;
  }
  return 2;
}

} // namespace piecework::util
