#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace sage_core {

// Immediate transactions take the write lock up front, so two writers on the
// same database wait on busy_timeout instead of failing halfway through.
enum class TransactionMode { Deferred, Immediate };

// Rolls back on destruction unless commit() was reached
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  bool is_open() const {
    return open_;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace sage_core
