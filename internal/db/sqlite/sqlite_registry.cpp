#include "sqlite_registry.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace eventstore::db::sqlite {

using eventstore::db::ErrorCode;
using eventstore::db::Result;

namespace {

constexpr const char* kEventColumns =
    "entity_type_name,entity_id,version,type_name,super_kind,value,request_id,current_user_json,created_at,persisted_at";

constexpr const char* kSnapshotColumns =
    "entity_type_name,entity_id,version,type_name,value,request_id,created_at,snapshotted_event_created_at,persisted_at";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v.has_value()) {
        BindU64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<uint64_t> ColOptionalU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::EventEnvelope ReadEvent(sqlite3_stmt* st) {
    model::EventEnvelope e;
    e.entity_type_name = ColText(st, 0);
    e.entity_id = ColText(st, 1);
    e.version = ColOptionalU64(st, 2);
    e.type_name = ColText(st, 3);
    e.super_kind = ColText(st, 4);
    e.value = ColText(st, 5);
    e.request_id = ColText(st, 6);
    e.current_user = ColText(st, 7);
    e.created_at = ColText(st, 8);
    e.persisted_at = ColText(st, 9);
    return e;
}

model::EntitySnapshotEnvelope ReadSnapshot(sqlite3_stmt* st) {
    model::EntitySnapshotEnvelope s;
    s.entity_type_name = ColText(st, 0);
    s.entity_id = ColText(st, 1);
    s.version = ColOptionalU64(st, 2);
    s.type_name = ColText(st, 3);
    s.value = ColText(st, 4);
    s.request_id = ColText(st, 5);
    s.created_at = ColText(st, 6);
    s.snapshotted_event_created_at = ColText(st, 7);
    s.persisted_at = ColText(st, 8);
    return s;
}

} // namespace

SqliteRegistry::SqliteRegistry(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    BootstrapSchema(*db_);
}

void SqliteRegistry::BootstrapSchema(SqliteDB& db) {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS events ("
        "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
        "entity_type_name TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER NOT NULL, "
        "type_name TEXT NOT NULL, super_kind TEXT NOT NULL, value TEXT NOT NULL, "
        "request_id TEXT, current_user_json TEXT, "
        "created_at TEXT NOT NULL, persisted_at TEXT NOT NULL, "
        "UNIQUE(entity_type_name, entity_id, version));");
    db.Exec("CREATE INDEX IF NOT EXISTS events_by_entity_time ON events(entity_type_name, entity_id, created_at);");

    db.Exec(
        "CREATE TABLE IF NOT EXISTS snapshots ("
        "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
        "entity_type_name TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER, "
        "type_name TEXT NOT NULL, value TEXT NOT NULL, request_id TEXT, "
        "created_at TEXT NOT NULL, snapshotted_event_created_at TEXT, persisted_at TEXT NOT NULL);");
    db.Exec("CREATE INDEX IF NOT EXISTS snapshots_by_entity_time ON snapshots(entity_type_name, entity_id, created_at);");
}

Result SqliteRegistry::Translate(int code, const std::string& message) {
    if (code == SQLITE_OK || code == SQLITE_DONE || code == SQLITE_ROW)
        return Result::Ok();

    // a concurrent writer took the same (entity, version) slot
    if (code == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::Conflict, message);

    switch (code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, message);
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, message);
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, message);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, message);
        default:
            return Result::Err(ErrorCode::InternalError, message);
    }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::vector<model::EventEnvelope> SqliteRegistry::Query(const EventFilter& filter) {
    std::string sql = std::string("SELECT ") + kEventColumns +
                      " FROM events WHERE entity_type_name=? AND entity_id=?";
    if (filter.created_after.has_value()) {
        sql += " AND created_at>?";
    }
    sql += " ORDER BY created_at ASC, version ASC;";

    std::vector<model::EventEnvelope> out;
    std::lock_guard lock(mutex_);
    try {
        auto st = db_->Prepare(sql);
        BindText(st.get(), 1, filter.entity_type_name);
        BindText(st.get(), 2, filter.entity_id);
        if (filter.created_after.has_value()) {
            BindText(st.get(), 3, *filter.created_after);
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            out.push_back(ReadEvent(st.get()));
        }
        if (rc != SQLITE_DONE) {
            util::ThrowIfRegistryError(Translate(sqlite3_extended_errcode(db_->Handle()), sqlite3_errmsg(db_->Handle())),
                                       "sqlite query events");
        }
    } catch (const SqliteError& e) {
        util::ThrowIfRegistryError(Translate(e.Code(), e.what()), "sqlite query events");
    }
    return out;
}

std::optional<model::EntitySnapshotEnvelope> SqliteRegistry::QueryLatestSnapshot(const SnapshotFilter& filter) {
    const std::string sql = std::string("SELECT ") + kSnapshotColumns +
                            " FROM snapshots WHERE entity_type_name=? AND entity_id=? "
                            "ORDER BY created_at DESC, seq DESC LIMIT 1;";

    std::lock_guard lock(mutex_);
    try {
        auto st = db_->Prepare(sql);
        BindText(st.get(), 1, filter.entity_type_name);
        BindText(st.get(), 2, filter.entity_id);

        const int rc = sqlite3_step(st.get());
        if (rc == SQLITE_ROW) {
            return ReadSnapshot(st.get());
        }
        if (rc != SQLITE_DONE) {
            util::ThrowIfRegistryError(Translate(sqlite3_extended_errcode(db_->Handle()), sqlite3_errmsg(db_->Handle())),
                                       "sqlite query latest snapshot");
        }
    } catch (const SqliteError& e) {
        util::ThrowIfRegistryError(Translate(e.Code(), e.what()), "sqlite query latest snapshot");
    }
    return std::nullopt;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRegistry::Store(const RegistryRecord& record) {
    std::lock_guard lock(mutex_);
    try {
        if (const auto* event = std::get_if<model::EventEnvelope>(&record)) {
            return StoreEvent(*event);
        }
        return StoreSnapshot(std::get<model::EntitySnapshotEnvelope>(record));
    } catch (const SqliteError& e) {
        return Translate(e.Code(), e.what());
    }
}

Result SqliteRegistry::StoreEvent(const model::EventEnvelope& event) {
    auto* db = db_->Handle();
    SqliteTransaction tx(db_);

    uint64_t last_version = 0;
    std::string last_created_at;
    {
        auto st = db_->Prepare(
            "SELECT version, created_at FROM events WHERE entity_type_name=? AND entity_id=? "
            "ORDER BY version DESC LIMIT 1;");
        BindText(st.get(), 1, event.entity_type_name);
        BindText(st.get(), 2, event.entity_id);

        const int rc = sqlite3_step(st.get());
        if (rc == SQLITE_ROW) {
            last_version = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
            last_created_at = ColText(st.get(), 1);
        } else if (rc != SQLITE_DONE) {
            return Translate(sqlite3_extended_errcode(db), sqlite3_errmsg(db));
        }
    }

    const uint64_t expected = last_version + 1;
    if (event.version.has_value() && *event.version != expected) {
        return Result::Err(ErrorCode::Conflict,
                           "expected version " + std::to_string(expected) + ", got " + std::to_string(*event.version));
    }

    if (last_version > 0 && event.created_at < last_created_at) {
        return Result::Err(ErrorCode::ConstraintViolation,
                           "created_at " + event.created_at + " precedes last stored event at " + last_created_at);
    }

    auto st = db_->Prepare(std::string("INSERT INTO events(") + kEventColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, event.entity_type_name);
    BindText(st.get(), 2, event.entity_id);
    BindU64(st.get(), 3, expected);
    BindText(st.get(), 4, event.type_name);
    BindText(st.get(), 5, event.super_kind);
    BindText(st.get(), 6, event.value);
    BindText(st.get(), 7, event.request_id);
    BindText(st.get(), 8, event.current_user);
    BindText(st.get(), 9, event.created_at);
    BindText(st.get(), 10, event.persisted_at);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(sqlite3_extended_errcode(db), sqlite3_errmsg(db));
    }

    tx.Commit();
    return Result::Ok();
}

Result SqliteRegistry::StoreSnapshot(const model::EntitySnapshotEnvelope& snapshot) {
    auto* db = db_->Handle();
    SqliteTransaction tx(db_);

    if (snapshot.version.has_value()) {
        auto st = db_->Prepare(
            "SELECT COALESCE(MAX(version),0) FROM snapshots WHERE entity_type_name=? AND entity_id=?;");
        BindText(st.get(), 1, snapshot.entity_type_name);
        BindText(st.get(), 2, snapshot.entity_id);

        if (sqlite3_step(st.get()) != SQLITE_ROW) {
            return Translate(sqlite3_extended_errcode(db), sqlite3_errmsg(db));
        }
        const auto last_version = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
        if (last_version > *snapshot.version) {
            return Result::Err(ErrorCode::Conflict, "snapshot at version " + std::to_string(last_version) +
                                                        " already stored, got " + std::to_string(*snapshot.version));
        }
    }

    auto st = db_->Prepare(std::string("INSERT INTO snapshots(") + kSnapshotColumns + ") VALUES(?,?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, snapshot.entity_type_name);
    BindText(st.get(), 2, snapshot.entity_id);
    BindOptionalU64(st.get(), 3, snapshot.version);
    BindText(st.get(), 4, snapshot.type_name);
    BindText(st.get(), 5, snapshot.value);
    BindText(st.get(), 6, snapshot.request_id);
    BindText(st.get(), 7, snapshot.created_at);
    BindText(st.get(), 8, snapshot.snapshotted_event_created_at);
    BindText(st.get(), 9, snapshot.persisted_at);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(sqlite3_extended_errcode(db), sqlite3_errmsg(db));
    }

    tx.Commit();
    return Result::Ok();
}

}
