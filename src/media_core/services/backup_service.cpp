#include "media_core/services/backup_service.hpp"

#include <iostream>

#include "media_core/errors.hpp"

namespace media_core {

namespace {

// True if `inner` equals `outer` or lies beneath it. Both must be normalised.
bool is_within(const std::filesystem::path &inner, const std::filesystem::path &outer) {
  auto inner_it = inner.begin();
  for (const auto &part : outer) {
    if (inner_it == inner.end() || *inner_it != part) {
      return false;
    }
    ++inner_it;
  }
  return true;
}

}  // namespace

BackupService::BackupService(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void BackupService::backup_to(const std::filesystem::path &dest) {
  namespace fs = std::filesystem;

  const fs::path store = db_manager_.store_dir();
  std::error_code ec;
  if (store.empty() || !fs::is_directory(store, ec)) {
    throw NotFoundError("Store directory not found: " + store.string());
  }
  if (dest.empty()) {
    throw InvalidArgumentError("Backup destination must not be empty");
  }

  fs::path store_abs;
  fs::path dest_abs;
  try {
    store_abs = fs::weakly_canonical(store);
    dest_abs = fs::weakly_canonical(dest);
  } catch (const fs::filesystem_error &e) {
    throw StorageIOError("Cannot resolve backup paths: " + std::string(e.what()));
  }
  // "backup/" and "backup" name the same directory
  if (dest_abs.filename().empty()) {
    dest_abs = dest_abs.parent_path();
  }
  if (is_within(dest_abs, store_abs) || is_within(store_abs, dest_abs)) {
    throw InvalidArgumentError("Backup destination " + dest_abs.string() +
                               " overlaps the store directory " + store_abs.string());
  }

  if (db_manager_.is_initialized()) {
    db_manager_.checkpoint();
  }

  try {
    fs::remove_all(dest_abs);
    if (dest_abs.has_parent_path()) {
      fs::create_directories(dest_abs.parent_path());
    }
    fs::copy(store_abs, dest_abs, fs::copy_options::recursive);
  } catch (const fs::filesystem_error &e) {
    throw StorageIOError("Backup to " + dest_abs.string() + " failed: " + e.what());
  }

  std::cout << "[Backup] Copied " << store_abs << " to " << dest_abs << std::endl;
}

}  // namespace media_core
