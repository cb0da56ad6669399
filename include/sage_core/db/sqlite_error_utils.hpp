#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace sage_core {

enum class DbErrorKind { Busy, Constraint, Readonly, Io, CantOpen, Full, Corrupt, Schema, Generic };

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char* describe(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy: return "database is busy";
    case DbErrorKind::Constraint: return "constraint violated";
    case DbErrorKind::Readonly: return "database is read-only";
    case DbErrorKind::Io: return "disk I/O error";
    case DbErrorKind::CantOpen: return "cannot open database file";
    case DbErrorKind::Full: return "disk is full";
    case DbErrorKind::Corrupt: return "database file is corrupt";
    case DbErrorKind::Schema: return "SQL or schema error";
    default: return "database error";
  }
}

inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  std::string msg = operation + " failed: " + describe(classify_sqlite_code(e.get_code()));
  msg += " (" + std::string(e.what()) + ")";
  const std::string sql = e.get_sql();
  if (!sql.empty()) {
    msg += " while running: " + sql;
  }
  return msg;
}

}  // namespace sage_core
