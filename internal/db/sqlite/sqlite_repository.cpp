#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace mountsync::db::sqlite {

using mountsync::db::ErrorCode;
using mountsync::db::Result;
using mountsync::model::ItemStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order of SELECT_ITEM / SELECT_ITEMS.
static model::ItemRecord ReadItem(sqlite3_stmt* st) {
    model::ItemRecord r;
    r.id = ColText(st, 0);
    r.name = ColText(st, 1);
    r.status = static_cast<ItemStatus>(ColI32(st, 2));
    r.missing_streak = static_cast<uint32_t>(ColI32(st, 3));
    r.source_path = ColText(st, 4);
    r.metadata_hash = ColText(st, 5);
    r.needs_inspection = ColI32(st, 6) != 0;
    r.inspection_note = ColText(st, 7);
    r.created_at_ms = ColU64(st, 8);
    r.last_seen_at_ms = ColU64(st, 9);
    r.last_checked_at_ms = ColU64(st, 10);
    r.status_changed_at_ms = ColU64(st, 11);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.name);
    BindI32(st, 3, static_cast<int>(r.status));
    BindI32(st, 4, static_cast<int>(r.missing_streak));
    BindText(st, 5, r.source_path);
    BindText(st, 6, r.metadata_hash);
    BindI32(st, 7, r.needs_inspection ? 1 : 0);
    BindText(st, 8, r.inspection_note);
    BindU64(st, 9, r.created_at_ms);
    BindU64(st, 10, r.last_seen_at_ms);
    BindU64(st, 11, r.last_checked_at_ms);
    BindU64(st, 12, r.status_changed_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "item already exists: " + r.id);

    return Translate(db, rc);
}

std::optional<model::ItemRecord>
SqliteRepository::GetItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadItem(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::ItemRecord>
SqliteRepository::ListItems(Transaction& t, const ItemFilter& filter) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_ITEMS, -1, &st, nullptr) != SQLITE_OK)
        return {};

    if (filter.status)
        BindI32(st, 1, static_cast<int>(*filter.status));
    else
        sqlite3_bind_null(st, 1);

    if (filter.needs_inspection)
        BindI32(st, 2, *filter.needs_inspection ? 1 : 0);
    else
        sqlite3_bind_null(st, 2);

    std::vector<model::ItemRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadItem(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.name);
    BindI32(st, 2, static_cast<int>(r.status));
    BindI32(st, 3, static_cast<int>(r.missing_streak));
    BindText(st, 4, r.source_path);
    BindText(st, 5, r.metadata_hash);
    BindI32(st, 6, r.needs_inspection ? 1 : 0);
    BindText(st, 7, r.inspection_note);
    BindU64(st, 8, r.created_at_ms);
    BindU64(st, 9, r.last_seen_at_ms);
    BindU64(st, 10, r.last_checked_at_ms);
    BindU64(st, 11, r.status_changed_at_ms);
    BindText(st, 12, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "item not found: " + r.id);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::PurgeRemoved(Transaction& t, uint64_t status_changed_before_ms, uint64_t* purged) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::PURGE_REMOVED, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(ItemStatus::kRemoved));
    BindU64(st, 2, status_changed_before_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (purged)
        *purged = rc == SQLITE_DONE ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;

    return Translate(db, rc);
}

std::map<ItemStatus, uint64_t> SqliteRepository::CountByStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    std::map<ItemStatus, uint64_t> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::COUNT_BY_STATUS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out[static_cast<ItemStatus>(ColI32(st, 0))] = ColU64(st, 1);
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceFiles(Transaction& t, const std::string& id,
                                      const std::vector<model::FileRecord>& files) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* del = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_FILES, -1, &del, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(del, 1, id);
    int rc = sqlite3_step(del);
    sqlite3_finalize(del);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    sqlite3_stmt* ins = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FILE, -1, &ins, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (size_t i = 0; i < files.size(); ++i) {
        sqlite3_reset(ins);
        sqlite3_clear_bindings(ins);

        BindText(ins, 1, id);
        BindU64(ins, 2, i);
        BindText(ins, 3, files[i].path);
        BindU64(ins, 4, files[i].size_bytes);

        rc = sqlite3_step(ins);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(ins);
            return result;
        }
    }

    sqlite3_finalize(ins);
    return Result::Ok();
}

std::vector<model::FileRecord>
SqliteRepository::GetFiles(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_FILES, -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, id);

    std::vector<model::FileRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::FileRecord f;
        f.path = ColText(st, 0);
        f.size_bytes = ColU64(st, 1);
        out.push_back(std::move(f));
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace mountsync::db::sqlite
