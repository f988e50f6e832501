#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "media_core/errors.hpp"

namespace media_core {

// What went wrong inside SQLite, coarse enough to log and to test against.
enum class DbErrorKind {
  BusyOrLocked,
  DuplicateKey,
  CheckViolation,
  Constraint,
  Readonly,
  StorageFull,
  Io,
  Schema,
  Generic
};

// Uses the extended code to tell a duplicate id apart from a row the schema rejects.
inline DbErrorKind classify_sqlite_error(int code, int extended_code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      if (extended_code == SQLITE_CONSTRAINT_UNIQUE || extended_code == SQLITE_CONSTRAINT_PRIMARYKEY)
        return DbErrorKind::DuplicateKey;
      if (extended_code == SQLITE_CONSTRAINT_CHECK || extended_code == SQLITE_CONSTRAINT_NOTNULL)
        return DbErrorKind::CheckViolation;
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_FULL:
      return DbErrorKind::StorageFull;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return DbErrorKind::Io;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy";
    case DbErrorKind::DuplicateKey: return "duplicate";
    case DbErrorKind::CheckViolation: return "check";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::StorageFull: return "full";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::Schema: return "schema";
    default: return "generic";
  }
}

/**
 * A failed statement against the store. Callers only see an IO failure; the SQLite detail
 * stays in the message and in db_kind() for logs and tests.
 *
 *   "insert_asset: duplicate (UNIQUE constraint failed: assets.id) [19/2067]"
 */
class MetadataStoreError : public StorageIOError {
 public:
  MetadataStoreError(const std::string& operation, const sqlite::sqlite_exception& e)
      : StorageIOError(describe(operation, e)),
        db_kind_(classify_sqlite_error(e.get_code(), e.get_extended_code())) {}

  DbErrorKind db_kind() const noexcept {
    return db_kind_;
  }

 private:
  DbErrorKind db_kind_;

  static std::string describe(const std::string& operation, const sqlite::sqlite_exception& e) {
    const DbErrorKind kind = classify_sqlite_error(e.get_code(), e.get_extended_code());
    return operation + ": " + to_string(kind) + " (" + e.errstr() + ") [" +
           std::to_string(e.get_code()) + "/" + std::to_string(e.get_extended_code()) + "]";
  }
};

}  // namespace media_core
