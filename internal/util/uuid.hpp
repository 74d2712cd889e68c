#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace piecework::util {

/*
  UUID helpers

  Every entity id (worker, day, task, run) is a random RFC4122 v4 UUID
  carried in its canonical lowercase string form.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered with ToString().
std::string NewId();

// True for the 8-4-4-4-12 hex form.
bool IsUuidString(const std::string& str);

} // namespace piecework::util
