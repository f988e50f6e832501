#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace media_core {

enum class TransactionMode {
  Deferred,
  // Write lock taken at BEGIN; for read-modify-write sequences
  Immediate
};

// BEGIN on construction; ROLLBACK on scope exit unless commit() ran.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "[Store] ROLLBACK failed: " << e.errstr() << std::endl;
    }
  }

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace media_core
