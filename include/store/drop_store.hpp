#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "store/entry_codec.hpp"
#include "store/store_error.hpp"
#include "store/transfer.hpp"

namespace dr {
namespace store {

// Store directory used when none is configured: <temp>/dr
std::filesystem::path default_store_root();
// Current time in Unix epoch seconds
std::int64_t current_timestamp();

struct StoreConfig {
  // Empty selects default_store_root()
  std::filesystem::path root;
};

// How to resolve an identifier that matches more than one entry
enum class Selection {
  Unique,  // report Ambiguous
  Latest,  // greatest (timestamp, sequence)
  All      // every match (delete only)
};

// A store entry as read back from its filename
struct DroppedEntry {
  std::string store_name;
  std::filesystem::path store_path;
  // false for names that do not decode; the fields below stay empty
  bool recognized = false;
  std::int64_t timestamp = 0;
  std::uint32_t sequence = 0;
  std::filesystem::path original_path;
  bool is_directory = false;
  std::uintmax_t size = 0;
};

class AmbiguousMatchError : public StoreError {
public:
  AmbiguousMatchError(const std::string& identifier, std::vector<DroppedEntry> candidates);

  const std::vector<DroppedEntry>& candidates() const { return candidates_; }

private:
  std::vector<DroppedEntry> candidates_;
};

class DropStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the store directory (owner-only) when absent. A null transfer
  // uses the plain filesystem one.
  explicit DropStore(const StoreConfig& config, std::unique_ptr<Transfer> transfer = nullptr);


  // ---- CORE STORAGE OPERATIONS ----
  // Moves a file, link or directory tree into the store
  DroppedEntry drop_file(const std::filesystem::path& path);
  DroppedEntry drop_file(const std::filesystem::path& path, std::int64_t timestamp);
  // Moves the selected entry back to its original path, never overwriting.
  // Selection::All is rejected with std::invalid_argument.
  DroppedEntry recover_file(const std::string& identifier, Selection selection = Selection::Unique);
  // Permanently removes the selected entries and returns them
  std::vector<DroppedEntry> delete_file(const std::string& identifier,
                                        Selection selection = Selection::Unique);


  // ---- QUERY OPERATIONS ----
  // Every entry, ordered by (timestamp, sequence, name); unrecognized names last
  std::vector<DroppedEntry> list_entries() const;
  // Exact store name, then original path, then name or path fragment
  std::vector<DroppedEntry> find_matches(const std::string& identifier) const;

  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::unique_ptr<Transfer> transfer_;


  // ---- ENTRY SUPPORT ----
  DroppedEntry describe_entry(const std::filesystem::directory_entry& entry) const;
  // Picks the first free name, bumping the sequence on collisions
  std::filesystem::path reserve_store_path(EncodedName& name) const;
  std::vector<DroppedEntry> select(const std::string& identifier,
                                   std::vector<DroppedEntry> matches,
                                   Selection selection) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Refuses a store owned by another user; warns if others can access it
  void check_store_ownership(const std::filesystem::path& path) const;
  // Rejects paths that are the store, lie inside it, or contain it
  void check_outside_store(const std::filesystem::path& path) const;
};

// Absolute, lexically normal path with symlinks resolved in the parent only,
// so the entry itself is never dereferenced
std::filesystem::path resolve_original_path(const std::filesystem::path& path);

} // namespace store
} // namespace dr
