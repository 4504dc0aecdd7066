#include "event_dispatcher.hpp"

#include "internal/observability/logging.hpp"

namespace eventstore::core {

void LoggingDispatcher::Dispatch(const std::vector<model::NonPersistedEventEnvelope>& envelopes) {
  for (const auto& envelope : envelopes) {
    EVENTSTORE_LOG_INFO(*logger_, "event dispatched",
                        {observability::StringField("entity_type_name", envelope.entity_type_name),
                         observability::StringField("entity_id", envelope.entity_id),
                         observability::StringField("type_name", envelope.type_name),
                         observability::StringField("request_id", envelope.request_id),
                         observability::StringField("created_at", envelope.created_at)});
  }
}

} // namespace eventstore::core
