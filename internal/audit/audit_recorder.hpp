#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/core/actor.hpp"
#include "piecework/v1/audit.pb.h"

namespace piecework::audit {

/*
  Audit sink.

  Events are emitted after the primary transaction commits. A failing sink
  never undoes or fails the operation that produced the event.
*/
class AuditRecorder {
 public:
  virtual ~AuditRecorder() = default;

  virtual void Record(const piecework::v1::AuditEvent& event) = 0;
};

// Writes each event as one JSON log line.
class LogAuditRecorder final : public AuditRecorder {
 public:
  void Record(const piecework::v1::AuditEvent& event) override;
};

piecework::v1::AuditEvent NewEvent(const core::Actor& actor, std::string_view action, std::string_view entity_type,
                                   const std::string& entity_id);

void SetString(piecework::v1::AuditEvent& event, const std::string& key, const std::string& value);
void SetNumber(piecework::v1::AuditEvent& event, const std::string& key, std::int64_t value);
void SetBool(piecework::v1::AuditEvent& event, const std::string& key, bool value);

// Best effort: stamps recorded_at_ms, logs and drops sink failures. A null
// recorder disables auditing.
void Emit(AuditRecorder* recorder, piecework::v1::AuditEvent event);

} // namespace piecework::audit
