#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/event_dispatcher.hpp"
#include "internal/core/event_store.hpp"
#include "internal/db/memory/memory_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using eventstore::core::CallbackDispatcher;
using eventstore::core::EventStore;
using eventstore::core::EventStoreContext;
using eventstore::db::ErrorCode;
using eventstore::db::EventFilter;
using eventstore::db::RegistryRecord;
using eventstore::db::Result;
using eventstore::db::SnapshotFilter;
using eventstore::db::memory::MemoryRegistry;
using eventstore::model::EntitySnapshotEnvelope;
using eventstore::model::EventEnvelope;
using eventstore::model::NonPersistedEventEnvelope;

/*
  Wraps a MemoryRegistry and lets a test script store failures.

  fail_plan[i] is the result handed back for the i-th Store call instead of
  delegating; calls past the end of the plan go to the real registry.
*/
class ScriptedRegistry final : public eventstore::db::EventRegistry {
 public:
  std::vector<EventEnvelope> Query(const EventFilter& filter) override {
    last_filter = filter;
    ++query_calls;
    return inner_.Query(filter);
  }

  std::optional<EntitySnapshotEnvelope> QueryLatestSnapshot(const SnapshotFilter& filter) override {
    ++snapshot_calls;
    return inner_.QueryLatestSnapshot(filter);
  }

  Result Store(const RegistryRecord& record) override {
    attempts.push_back(record);
    const auto call = attempts.size() - 1;
    if (call < fail_plan.size() && fail_plan[call].has_value()) {
      return *fail_plan[call];
    }
    return inner_.Store(record);
  }

  std::vector<std::optional<Result>> fail_plan;
  std::vector<RegistryRecord>        attempts;
  std::optional<EventFilter>         last_filter;
  int                                query_calls    = 0;
  int                                snapshot_calls = 0;

 private:
  MemoryRegistry inner_;
};

std::optional<Result> Conflict() {
  return Result::Err(ErrorCode::Conflict, "stream moved");
}

std::optional<Result> IoFailure() {
  return Result::Err(ErrorCode::IOError, "disk gone");
}

struct Fixture {
  std::shared_ptr<ScriptedRegistry>      registry = std::make_shared<ScriptedRegistry>();
  std::vector<std::chrono::milliseconds> sleeps;
  int                                    ticks = 0;
  std::unique_ptr<EventStore>            store;

  explicit Fixture(std::uint32_t max_attempts = 3) {
    EventStoreContext context;
    context.retry.max_attempts = max_attempts;
    context.sleep              = [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
    // distinct, increasing persisted_at per call
    context.clock = [this] {
      ++ticks;
      return "2030-01-01T00:00:" + std::string(ticks < 10 ? "0" : "") + std::to_string(ticks) + ".000Z";
    };
    store = std::make_unique<EventStore>(registry, std::move(context));
  }
};

NonPersistedEventEnvelope MakeEvent(const std::string& entity_id, const std::string& type_name, const std::string& created_at) {
  NonPersistedEventEnvelope e;
  e.entity_type_name = "Order";
  e.entity_id        = entity_id;
  e.type_name        = type_name;
  e.value            = R"({"n":1})";
  e.request_id       = "req-" + type_name;
  e.created_at       = created_at;
  return e;
}

EntitySnapshotEnvelope MakeSnapshot(const std::string& entity_id, const std::string& created_at, const std::string& snapshotted_at) {
  EntitySnapshotEnvelope s;
  s.entity_type_name             = "Order";
  s.entity_id                    = entity_id;
  s.type_name                    = "Order";
  s.value                        = R"({"total":3})";
  s.created_at                   = created_at;
  s.snapshotted_event_created_at = snapshotted_at;
  return s;
}

class RecordingDispatcher final : public eventstore::core::EventDispatcher {
 public:
  void Dispatch(const std::vector<NonPersistedEventEnvelope>& envelopes) override {
    batches.push_back(envelopes);
  }

  std::vector<std::vector<NonPersistedEventEnvelope>> batches;
};

void TestOrderScenario() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  assert(f.store->ReadEntityEventsSince("Order", "order-1").empty());

  const auto e1 = MakeEvent("order-1", "Created", "2024-01-01T00:00:01.000Z");
  const auto e2 = MakeEvent("order-1", "Placed", "2024-01-01T00:00:02.000Z");
  f.store->StoreEvents({e1, e2}, dispatcher);

  auto all = f.store->ReadEntityEventsSince("Order", "order-1");
  assert(all.size() == 2);
  assert(all[0].type_name == "Created");
  assert(all[1].type_name == "Placed");

  auto since = f.store->ReadEntityEventsSince("Order", "order-1", e1.created_at);
  assert(since.size() == 1);
  assert(since[0].type_name == "Placed");
}

void TestOutOfOrderCreatedAtRejected() {
  Fixture             f(5);
  RecordingDispatcher dispatcher;

  bool threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "Later", "2024-01-01T00:00:05.000Z"), MakeEvent("o", "Earlier", "2024-01-01T00:00:01.000Z")},
                         dispatcher);
  } catch (const eventstore::util::RegistryError& e) {
    threw = true;
    assert(e.Code() == ErrorCode::ConstraintViolation);
  }

  assert(threw && "an event older than the stream head must be refused");
  assert(f.registry->attempts.size() == 2);
  assert(f.sleeps.empty());
  assert(dispatcher.batches.empty());

  auto stored = f.store->ReadEntityEventsSince("Order", "o");
  assert(stored.size() == 1);
  assert(stored[0].type_name == "Later");

  // equal created_at is still an append
  f.store->StoreEvents({MakeEvent("o", "Same", "2024-01-01T00:00:05.000Z")}, dispatcher);
  stored = f.store->ReadEntityEventsSince("Order", "o");
  assert(stored.size() == 2);
  assert(stored[1].type_name == "Same");
  assert(stored[1].version == std::optional<uint64_t>(2));
}

void TestSinceIsExclusiveAndDefaultsToOrigin() {
  Fixture             f;
  RecordingDispatcher dispatcher;
  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);

  assert(f.store->ReadEntityEventsSince("Order", "o", std::string("2024-01-01T00:00:01.000Z")).empty());
  assert(f.store->ReadEntityEventsSince("Order", "o", std::string("2024-01-01T00:00:00.999Z")).size() == 1);

  // absent and empty both mean "from the beginning"
  f.store->ReadEntityEventsSince("Order", "o");
  assert(f.registry->last_filter->created_after == std::optional<std::string>("1970-01-01T00:00:00.000Z"));
  f.store->ReadEntityEventsSince("Order", "o", std::string());
  assert(f.registry->last_filter->created_after == std::optional<std::string>("1970-01-01T00:00:00.000Z"));
  assert(f.registry->last_filter->entity_type_name == "Order");
  assert(f.registry->last_filter->entity_id == "o");
}

void TestLatestSnapshotIsIdempotent() {
  Fixture f;

  assert(!f.store->ReadEntityLatestSnapshot("Order", "o").has_value());

  f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:05.000Z", "2024-01-01T00:00:04.000Z"));
  f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:09.000Z", "2024-01-01T00:00:08.000Z"));

  auto first  = f.store->ReadEntityLatestSnapshot("Order", "o");
  auto second = f.store->ReadEntityLatestSnapshot("Order", "o");
  assert(first.has_value() && second.has_value());
  assert(*first == *second);
  assert(first->created_at == "2024-01-01T00:00:09.000Z");
  assert(!first->persisted_at.empty());
}

void TestHistoryReplaysFromSnapshotPosition() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z"), MakeEvent("o", "B", "2024-01-01T00:00:02.000Z"),
                        MakeEvent("o", "C", "2024-01-01T00:00:03.000Z")},
                       dispatcher);

  auto full = f.store->ReadEntityHistory("Order", "o");
  assert(!full.snapshot.has_value());
  assert(full.events.size() == 3);

  f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:10.000Z", "2024-01-01T00:00:02.000Z"));

  auto history = f.store->ReadEntityHistory("Order", "o");
  assert(history.snapshot.has_value());
  assert(history.events.size() == 1);
  assert(history.events[0].type_name == "C");
}

void TestHistoryKeepsEventsTiedWithFoldedEvent() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);

  auto snapshot    = MakeSnapshot("o", "2024-01-01T00:00:01.000Z", "2024-01-01T00:00:01.000Z");
  snapshot.version = 1;
  f.store->StoreSnapshot(snapshot);

  f.store->StoreEvents({MakeEvent("o", "B", "2024-01-01T00:00:01.000Z")}, dispatcher);

  auto history = f.store->ReadEntityHistory("Order", "o");
  assert(history.snapshot.has_value());
  assert(history.events.size() == 1);
  assert(history.events[0].type_name == "B");
  assert(history.events[0].version == std::optional<uint64_t>(2));
}

void TestHistoryFromVersionedSnapshotAtOrigin() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  // folded nothing yet: marker at the origin, version 0
  auto snapshot    = MakeSnapshot("o", "2024-01-01T00:00:00.000Z", "1970-01-01T00:00:00.000Z");
  snapshot.version = 0;
  f.store->StoreSnapshot(snapshot);

  f.store->StoreEvents({MakeEvent("o", "A", "1970-01-01T00:00:00.000Z"), MakeEvent("o", "B", "2024-01-01T00:00:02.000Z")},
                       dispatcher);

  auto history = f.store->ReadEntityHistory("Order", "o");
  assert(history.events.size() == 2);
  assert(history.events[0].type_name == "A");
}

void TestTimestampsAreCanonicalized() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01Z"), MakeEvent("o", "B", "2024-01-01T02:00:01.500+02:00")},
                       dispatcher);

  auto events = f.store->ReadEntityEventsSince("Order", "o");
  assert(events.size() == 2);
  assert(events[0].created_at == "2024-01-01T00:00:01.000Z");
  assert(events[1].created_at == "2024-01-01T00:00:01.500Z");

  // a since without fractional seconds still bounds by time, not by text
  auto since = f.store->ReadEntityEventsSince("Order", "o", std::string("2024-01-01T00:00:01Z"));
  assert(since.size() == 1);
  assert(since[0].type_name == "B");

  f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:09Z", "2024-01-01T00:00:01.500000Z"));
  auto snapshot = f.store->ReadEntityLatestSnapshot("Order", "o");
  assert(snapshot->created_at == "2024-01-01T00:00:09.000Z");
  assert(snapshot->snapshotted_event_created_at == "2024-01-01T00:00:01.500Z");
}

void TestInvalidTimestampsRejected() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  bool threw = false;
  try {
    (void)f.store->ReadEntityEventsSince("Order", "o", std::string("last tuesday"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->query_calls == 0);

  threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z"), MakeEvent("o", "B", "not-a-time")}, dispatcher);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->attempts.empty() && "a bad batch must store nothing");
  assert(dispatcher.batches.empty());

  threw = false;
  try {
    f.store->StoreSnapshot(MakeSnapshot("o", "2024-13-01T00:00:00Z", "2024-01-01T00:00:01.000Z"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->attempts.empty());
}

void TestConflictRetrySucceedsBelowLimit() {
  // k = max_attempts - 1 conflicts, then success
  Fixture f(3);
  f.registry->fail_plan = {Conflict(), Conflict()};

  RecordingDispatcher dispatcher;
  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);

  assert(f.registry->attempts.size() == 3);
  assert(f.sleeps.size() == 2);
  assert(f.sleeps[0] < f.sleeps[1]);
  assert(dispatcher.batches.size() == 1);
  assert(f.store->ReadEntityEventsSince("Order", "o").size() == 1);
}

void TestConflictRetryGivesUpAtLimit() {
  Fixture f(3);
  f.registry->fail_plan = {Conflict(), Conflict(), Conflict()};

  RecordingDispatcher dispatcher;
  bool                threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);
  } catch (const eventstore::util::ConflictError& e) {
    threw = true;
    assert(e.Kind() == eventstore::util::ErrorKind::kConflict);
  }

  assert(threw && "exhausted retries must surface the conflict");
  assert(f.registry->attempts.size() == 3);
  assert(f.sleeps.size() == 2);
  assert(dispatcher.batches.empty());
  assert(f.store->ReadEntityEventsSince("Order", "o").empty());
}

void TestRegistryErrorIsNotRetried() {
  Fixture f(5);
  f.registry->fail_plan = {IoFailure()};

  RecordingDispatcher dispatcher;
  bool                threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);
  } catch (const eventstore::util::RegistryError& e) {
    threw = true;
    assert(e.Code() == ErrorCode::IOError);
    assert(e.Kind() == eventstore::util::ErrorKind::kRegistry);
  }

  assert(threw);
  assert(f.registry->attempts.size() == 1);
  assert(f.sleeps.empty());
  assert(dispatcher.batches.empty());
}

void TestPartialBatchStaysStored() {
  Fixture f(2);
  // e1 ok, e2 conflicts on both attempts, e3 never tried
  f.registry->fail_plan = {std::nullopt, Conflict(), Conflict()};

  RecordingDispatcher dispatcher;
  bool                threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z"), MakeEvent("o", "B", "2024-01-01T00:00:02.000Z"),
                          MakeEvent("o", "C", "2024-01-01T00:00:03.000Z")},
                         dispatcher);
  } catch (const eventstore::util::ConflictError&) {
    threw = true;
  }

  assert(threw);
  assert(f.registry->attempts.size() == 3);
  for (const auto& attempt : f.registry->attempts) {
    assert(std::get<EventEnvelope>(attempt).type_name != "C");
  }

  auto stored = f.store->ReadEntityEventsSince("Order", "o");
  assert(stored.size() == 1);
  assert(stored[0].type_name == "A");
  assert(dispatcher.batches.empty());
}

void TestDispatchOnceWithOriginalBatch() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  std::vector<NonPersistedEventEnvelope> batch = {MakeEvent("o", "A", "2024-01-01T00:00:01.000Z"),
                                                  MakeEvent("o", "B", "2024-01-01T00:00:02.000Z")};
  batch[1].current_user                        = R"({"id":"u-7"})";

  f.store->StoreEvents(batch, dispatcher);

  assert(dispatcher.batches.size() == 1);
  assert(dispatcher.batches[0] == batch);
}

void TestEmptyBatchStillDispatches() {
  Fixture             f;
  RecordingDispatcher dispatcher;

  f.store->StoreEvents({}, dispatcher);

  assert(f.registry->attempts.empty());
  assert(dispatcher.batches.size() == 1);
  assert(dispatcher.batches[0].empty());
}

void TestDispatchFailureAfterPersist() {
  Fixture            f;
  CallbackDispatcher failing([](const std::vector<NonPersistedEventEnvelope>&) { throw std::runtime_error("bus down"); });

  bool threw = false;
  try {
    f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, failing);
  } catch (const eventstore::util::DispatchError& e) {
    threw = true;
    assert(std::string(e.what()).find("bus down") != std::string::npos);
  }

  assert(threw);
  assert(f.store->ReadEntityEventsSince("Order", "o").size() == 1);
}

void TestPersistedAtStampedPerAttempt() {
  Fixture f(3);
  f.registry->fail_plan = {Conflict()};

  RecordingDispatcher dispatcher;
  f.store->StoreEvents({MakeEvent("o", "A", "2024-01-01T00:00:01.000Z")}, dispatcher);

  assert(f.registry->attempts.size() == 2);
  const auto& first  = std::get<EventEnvelope>(f.registry->attempts[0]);
  const auto& second = std::get<EventEnvelope>(f.registry->attempts[1]);
  assert(first.persisted_at != second.persisted_at);

  auto stored = f.store->ReadEntityEventsSince("Order", "o");
  assert(stored[0].persisted_at == second.persisted_at);
}

void TestSnapshotConflictRetried() {
  Fixture f(3);
  f.registry->fail_plan = {Conflict()};

  f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:05.000Z", "2024-01-01T00:00:04.000Z"));

  assert(f.registry->attempts.size() == 2);
  assert(f.store->ReadEntityLatestSnapshot("Order", "o").has_value());
}

void TestSnapshotConflictExhaustsRetries() {
  Fixture f(3);
  f.registry->fail_plan = {Conflict(), Conflict(), Conflict()};

  bool threw = false;
  try {
    f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:05.000Z", "2024-01-01T00:00:04.000Z"));
  } catch (const eventstore::util::ConflictError&) {
    threw = true;
  }

  assert(threw);
  assert(f.registry->attempts.size() == 3);
  assert(f.sleeps.size() == 2);
  assert(!f.store->ReadEntityLatestSnapshot("Order", "o").has_value());
}

void TestSnapshotRegistryErrorIsNotRetried() {
  Fixture f(3);
  f.registry->fail_plan = {IoFailure()};

  bool threw = false;
  try {
    f.store->StoreSnapshot(MakeSnapshot("o", "2024-01-01T00:00:05.000Z", "2024-01-01T00:00:04.000Z"));
  } catch (const eventstore::util::RegistryError& e) {
    threw = true;
    assert(e.Code() == ErrorCode::IOError);
  }

  assert(threw);
  assert(f.registry->attempts.size() == 1);
  assert(f.sleeps.empty());
}

void TestRejectsMissingRegistry() {
  bool threw = false;
  try {
    EventStore store(nullptr, EventStoreContext{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOrderScenario();
  TestOutOfOrderCreatedAtRejected();
  TestSinceIsExclusiveAndDefaultsToOrigin();
  TestLatestSnapshotIsIdempotent();
  TestHistoryReplaysFromSnapshotPosition();
  TestHistoryKeepsEventsTiedWithFoldedEvent();
  TestHistoryFromVersionedSnapshotAtOrigin();
  TestTimestampsAreCanonicalized();
  TestInvalidTimestampsRejected();
  TestConflictRetrySucceedsBelowLimit();
  TestConflictRetryGivesUpAtLimit();
  TestRegistryErrorIsNotRetried();
  TestPartialBatchStaysStored();
  TestDispatchOnceWithOriginalBatch();
  TestEmptyBatchStillDispatches();
  TestDispatchFailureAfterPersist();
  TestPersistedAtStampedPerAttempt();
  TestSnapshotConflictRetried();
  TestSnapshotConflictExhaustsRetries();
  TestSnapshotRegistryErrorIsNotRetried();
  TestRejectsMissingRegistry();

  std::cout << "eventstore_unit_event_store: pass\n";
  return 0;
}
