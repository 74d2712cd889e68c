#include "internal/audit/audit_recorder.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace piecework::audit {

void LogAuditRecorder::Record(const piecework::v1::AuditEvent& event) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  const auto status = google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("audit event serialization failed: " + status.ToString());
  }
  PIECEWORK_LOG_INFO("audit", {observability::StringField("event", json)});
}

piecework::v1::AuditEvent NewEvent(const core::Actor& actor, std::string_view action, std::string_view entity_type,
                                   const std::string& entity_id) {
  piecework::v1::AuditEvent event;
  event.set_actor_id(core::UserId(actor));
  event.set_actor_role(std::string(core::RoleName(actor)));
  event.set_action(std::string(action));
  event.set_entity_type(std::string(entity_type));
  event.set_entity_id(entity_id);
  return event;
}

void SetString(piecework::v1::AuditEvent& event, const std::string& key, const std::string& value) {
  (*event.mutable_metadata()->mutable_fields())[key].set_string_value(value);
}

void SetNumber(piecework::v1::AuditEvent& event, const std::string& key, std::int64_t value) {
  (*event.mutable_metadata()->mutable_fields())[key].set_number_value(static_cast<double>(value));
}

void SetBool(piecework::v1::AuditEvent& event, const std::string& key, bool value) {
  (*event.mutable_metadata()->mutable_fields())[key].set_bool_value(value);
}

void Emit(AuditRecorder* recorder, piecework::v1::AuditEvent event) {
  if (recorder == nullptr) {
    return;
  }
  if (event.recorded_at_ms() == 0) {
    event.set_recorded_at_ms(util::NowMillis());
  }
  try {
    recorder->Record(event);
  } catch (const std::exception& e) {
    PIECEWORK_LOG_WARN("audit sink failed",
                       {observability::StringField("action", event.action()),
                        observability::StringField("entity_id", event.entity_id()),
                        observability::StringField("error", e.what())});
  }
}

} // namespace piecework::audit
