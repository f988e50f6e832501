#pragma once

#include <filesystem>

#include "media_core/db/database_manager.hpp"

namespace media_core {

// Mirrors the canonical store directory to a secondary location. The secondary is only ever
// written here, as a whole-directory copy, never opened as a live database.
class BackupService {
 public:
  explicit BackupService(DatabaseManager &db_manager);

  // Replaces `dest` with a full copy of the store. Blocking and non-incremental.
  // NotFoundError if the store directory is missing, InvalidArgumentError if `dest` overlaps the
  // store, StorageIOError on copy failures.
  void backup_to(const std::filesystem::path &dest);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace media_core
