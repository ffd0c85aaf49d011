#pragma once

#include <filesystem>
#include <string>
#include "store/store_error.hpp"

namespace dr {
namespace store {

// Moves filesystem entries (files, symlinks, directory trees) between the
// working tree and the store. The destination must not exist.
class Transfer {
public:
  virtual ~Transfer() = default;


  // ---- TRANSFER OPERATIONS ----
  // Renames from -> to; across filesystems falls back to copy, verify and
  // only then removal of the source. Throws StoreError.
  void move(const std::filesystem::path& from, const std::filesystem::path& to);


  // ---- FILESYSTEM PRIMITIVES ----
  // Overridable so tests can force the cross-device path or damage a copy.
  // Primitives throw std::filesystem::filesystem_error or StoreError.
  virtual void rename_entry(const std::filesystem::path& from, const std::filesystem::path& to);
  virtual void copy_entry(const std::filesystem::path& from, const std::filesystem::path& to);
  // Called only after the copy has been verified
  virtual void remove_source(const std::filesystem::path& from);
  // Compares structure, sizes, SHA-256 digests and symlink targets.
  // Throws StoreError (IOError) on the first mismatch.
  virtual void verify(const std::filesystem::path& from, const std::filesystem::path& to) const;

private:
  // ---- CROSS-DEVICE FALLBACK ----
  void copy_verify_and_remove(const std::filesystem::path& from, const std::filesystem::path& to);
  // Removes a partial or rejected copy
  void discard_copy(const std::filesystem::path& to) const;
  void compare_entry(const std::filesystem::path& from, const std::filesystem::path& to) const;
};

} // namespace store
} // namespace dr
