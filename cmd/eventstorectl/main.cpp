#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/event_dispatcher.hpp"
#include "internal/core/event_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using eventstore::model::EntitySnapshotEnvelope;
using eventstore::model::EventEnvelope;
using eventstore::model::NonPersistedEventEnvelope;

namespace {

enum ExitCode {
  kExitOk       = 0,
  kExitUsage    = 1,
  kExitConflict = 2,
  kExitRegistry = 3,
  kExitDispatch = 4,
  kExitOther    = 5,
};

void Usage() {
  std::cout << "Usage:\n"
            << "  eventstorectl --config <config.yaml> read <entity_type> <entity_id> [since]\n"
            << "  eventstorectl --config <config.yaml> latest-snapshot <entity_type> <entity_id>\n"
            << "  eventstorectl --config <config.yaml> append <entity_type> <entity_id> <event_type> <value_json> [version]\n"
            << "  eventstorectl --config <config.yaml> snapshot <entity_type> <entity_id> <entity_type_name> <value_json> [version]\n";
}

std::optional<uint64_t> ParseVersion(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string VersionText(const std::optional<uint64_t>& version) {
  return version ? std::to_string(*version) : "-";
}

void PrintEvent(const EventEnvelope& e) {
  std::cout << "kind=" << eventstore::model::ToString(EventEnvelope::kKind) << " entity_type_name=" << e.entity_type_name
            << " entity_id=" << e.entity_id << " version=" << VersionText(e.version) << " type_name=" << e.type_name
            << " super_kind=" << e.super_kind << " created_at=" << e.created_at << " persisted_at=" << e.persisted_at
            << " request_id=" << e.request_id << " value=" << e.value << "\n";
}

void PrintSnapshot(const EntitySnapshotEnvelope& s) {
  std::cout << "kind=" << eventstore::model::ToString(EntitySnapshotEnvelope::kKind) << " entity_type_name=" << s.entity_type_name
            << " entity_id=" << s.entity_id << " version=" << VersionText(s.version) << " type_name=" << s.type_name
            << " created_at=" << s.created_at << " snapshotted_event_created_at=" << s.snapshotted_event_created_at
            << " persisted_at=" << s.persisted_at << " request_id=" << s.request_id << " value=" << s.value << "\n";
}

int Run(eventstore::core::EventStore& store, eventstore::core::EventDispatcher& dispatcher, const std::vector<std::string>& args) {
  const std::string& cmd = args[0];

  if (cmd == "read") {
    if (args.size() < 3 || args.size() > 4) {
      Usage();
      return kExitUsage;
    }

    std::optional<std::string> since;
    if (args.size() == 4) {
      since = eventstore::util::Canonicalize(args[3]);
      if (!since) {
        std::cerr << "invalid timestamp: " << args[3] << "\n";
        return kExitUsage;
      }
    }

    for (const auto& e : store.ReadEntityEventsSince(args[1], args[2], since)) {
      PrintEvent(e);
    }
    return kExitOk;
  }

  if (cmd == "latest-snapshot") {
    if (args.size() != 3) {
      Usage();
      return kExitUsage;
    }

    auto snapshot = store.ReadEntityLatestSnapshot(args[1], args[2]);
    if (!snapshot) {
      std::cout << "no snapshot\n";
      return kExitOk;
    }
    PrintSnapshot(*snapshot);
    return kExitOk;
  }

  if (cmd == "append" || cmd == "snapshot") {
    if (args.size() < 5 || args.size() > 6) {
      Usage();
      return kExitUsage;
    }

    std::optional<uint64_t> version;
    if (args.size() == 6) {
      version = ParseVersion(args[5]);
      if (!version) {
        std::cerr << "invalid version: " << args[5] << "\n";
        return kExitUsage;
      }
    }

    if (cmd == "append") {
      NonPersistedEventEnvelope envelope;
      envelope.entity_type_name = args[1];
      envelope.entity_id        = args[2];
      envelope.type_name        = args[3];
      envelope.value            = args[4];
      envelope.request_id       = eventstore::util::GenerateRequestID();
      envelope.created_at       = eventstore::util::NowIso8601();
      envelope.version          = version;

      store.StoreEvents({envelope}, dispatcher);
      std::cout << "stored request_id=" << envelope.request_id << " created_at=" << envelope.created_at << "\n";
      return kExitOk;
    }

    // fold point: the newest event stored so far for this entity
    const auto events = store.ReadEntityEventsSince(args[1], args[2]);

    EntitySnapshotEnvelope snapshot;
    snapshot.entity_type_name = args[1];
    snapshot.entity_id        = args[2];
    snapshot.type_name        = args[3];
    snapshot.value            = args[4];
    snapshot.request_id       = eventstore::util::GenerateRequestID();
    snapshot.created_at       = eventstore::util::NowIso8601();
    snapshot.version          = version;
    snapshot.snapshotted_event_created_at =
        events.empty() ? std::string(eventstore::util::kOriginOfTime) : events.back().created_at;

    store.StoreSnapshot(snapshot);
    std::cout << "stored request_id=" << snapshot.request_id
              << " snapshotted_event_created_at=" << snapshot.snapshotted_event_created_at << "\n";
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  int code = kExitOther;
  try {
    auto config = eventstore::config::ConfigLoader::LoadFromYaml(config_path);
    auto logger = eventstore::observability::InitializeLogging(config);

    auto                                store = eventstore::factory::BuildEventStore(config, logger);
    eventstore::core::LoggingDispatcher dispatcher(logger);

    code = Run(*store, dispatcher, args);
  } catch (const eventstore::util::ConflictError& e) {
    std::cerr << "conflict: " << e.what() << "\n";
    code = kExitConflict;
  } catch (const eventstore::util::RegistryError& e) {
    std::cerr << "registry error (" << eventstore::db::ToString(e.Code()) << "): " << e.what() << "\n";
    code = kExitRegistry;
  } catch (const eventstore::util::DispatchError& e) {
    std::cerr << "dispatch error: " << e.what() << "\n";
    code = kExitDispatch;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = kExitOther;
  }

  eventstore::observability::ShutdownLogging();
  return code;
}
