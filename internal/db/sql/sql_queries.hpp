#pragma once

namespace mountsync::db::sql {

/*
  Canonical SQL for the sqlite backend.
*/

static constexpr const char* INSERT_ITEM =
    "INSERT INTO items(id,name,status,missing_streak,source_path,metadata_hash,"
    "needs_inspection,inspection_note,created_at_ms,last_seen_at_ms,last_checked_at_ms,status_changed_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ITEM =
    "SELECT id,name,status,missing_streak,source_path,metadata_hash,"
    "needs_inspection,inspection_note,created_at_ms,last_seen_at_ms,last_checked_at_ms,status_changed_at_ms"
    " FROM items WHERE id=?;";

static constexpr const char* SELECT_ITEMS =
    "SELECT id,name,status,missing_streak,source_path,metadata_hash,"
    "needs_inspection,inspection_note,created_at_ms,last_seen_at_ms,last_checked_at_ms,status_changed_at_ms"
    " FROM items"
    " WHERE (?1 IS NULL OR status=?1) AND (?2 IS NULL OR needs_inspection=?2)"
    " ORDER BY id;";

static constexpr const char* UPDATE_ITEM =
    "UPDATE items SET name=?,status=?,missing_streak=?,source_path=?,metadata_hash=?,"
    "needs_inspection=?,inspection_note=?,created_at_ms=?,last_seen_at_ms=?,last_checked_at_ms=?,status_changed_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_ITEM =
    "DELETE FROM items WHERE id=?;";

static constexpr const char* PURGE_REMOVED =
    "DELETE FROM items WHERE status=? AND status_changed_at_ms<?;";

static constexpr const char* COUNT_BY_STATUS =
    "SELECT status,COUNT(*) FROM items GROUP BY status;";

// files

static constexpr const char* DELETE_FILES =
    "DELETE FROM item_files WHERE item_id=?;";

static constexpr const char* INSERT_FILE =
    "INSERT INTO item_files(item_id,position,path,size_bytes) VALUES(?,?,?,?);";

static constexpr const char* SELECT_FILES =
    "SELECT path,size_bytes FROM item_files WHERE item_id=? ORDER BY position;";

}
