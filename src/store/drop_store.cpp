#include "store/drop_store.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <tuple>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace dr {
namespace store {

namespace fs = std::filesystem;

namespace {

// child == parent counts as inside
bool is_within(const fs::path& child, const fs::path& parent) {
  const fs::path relative = child.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}

fs::path strip_trailing_separator(const fs::path& path) {
  if (!path.has_filename() && path.has_relative_path()) {
    return path.parent_path();
  }
  return path;
}

std::uintmax_t tree_size(const fs::path& path) {
  std::uintmax_t total = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (fs::is_regular_file(it->symlink_status(entry_ec))) {
      const std::uintmax_t size = it->file_size(entry_ec);
      if (!entry_ec) {
        total += size;
      }
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Size of " << path.string()
                               << " is incomplete: " << ec.message();
  }
  return total;
}

} // namespace

fs::path default_store_root() {
  return fs::temp_directory_path() / "dr";
}

std::int64_t current_timestamp() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

fs::path resolve_original_path(const fs::path& path) {
  const fs::path absolute_path = strip_trailing_separator(fs::absolute(path).lexically_normal());
  if (!absolute_path.has_filename()) {
    return absolute_path;
  }

  std::error_code ec;
  const fs::path parent = fs::weakly_canonical(absolute_path.parent_path(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Keeping lexical path for " << absolute_path.string()
                             << ": " << ec.message();
    return absolute_path;
  }
  return parent / absolute_path.filename();
}

AmbiguousMatchError::AmbiguousMatchError(const std::string& identifier,
                                         std::vector<DroppedEntry> candidates)
  : StoreError(ErrorKind::Ambiguous, "'" + identifier + "' matches "
               + std::to_string(candidates.size()) + " dropped entries")
  , candidates_(std::move(candidates)) {}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DropStore::DropStore(const StoreConfig& config, std::unique_ptr<Transfer> transfer)
  : root_(config.root.empty() ? default_store_root() : config.root)
  , transfer_(transfer ? std::move(transfer) : std::make_unique<Transfer>()) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing drop store at: " << root_.string();

  try {
    root_ = strip_trailing_separator(fs::absolute(root_).lexically_normal());
  } catch (const fs::filesystem_error& e) {
    throw make_store_error("Failed to resolve store path " + root_.string(), e);
  }

  check_directory_exists(root_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << root_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

DroppedEntry DropStore::drop_file(const fs::path& path) {
  return drop_file(path, current_timestamp());
}

DroppedEntry DropStore::drop_file(const fs::path& path, std::int64_t timestamp) {
  BOOST_LOG_TRIVIAL(info) << "Store: Dropping " << path.string();

  fs::path original;
  try {
    original = resolve_original_path(path);
  } catch (const fs::filesystem_error& e) {
    throw make_store_error("Failed to resolve " + path.string(), e);
  }

  std::error_code ec;
  const fs::file_status status = fs::symlink_status(original, ec);
  if (status.type() == fs::file_type::not_found) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << original.string();
    throw StoreError(ErrorKind::NotFound, "No such file or directory: " + original.string());
  }
  if (ec) {
    throw make_store_error("Cannot access " + original.string(), ec);
  }

  check_outside_store(original);

  EncodedName name;
  name.timestamp = timestamp;
  name.original_path = original;
  const fs::path store_path = reserve_store_path(name);
  BOOST_LOG_TRIVIAL(debug) << "Store: Encoded " << original.string()
                           << " as " << store_path.filename().string();

  transfer_->move(original, store_path);

  fs::directory_entry stored(store_path, ec);
  if (ec) {
    throw make_store_error("Dropped entry is not readable " + store_path.string(), ec);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Dropped " << original.string();
  return describe_entry(stored);
}

DroppedEntry DropStore::recover_file(const std::string& identifier, Selection selection) {
  BOOST_LOG_TRIVIAL(info) << "Store: Recovering " << identifier;

  if (selection == Selection::All) {
    throw std::invalid_argument("Store: Recover restores a single entry");
  }

  const DroppedEntry entry = select(identifier, find_matches(identifier), selection).front();
  if (!entry.recognized) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Cannot recover unrecognized entry: " << entry.store_name;
    throw StoreError(ErrorKind::Unrecognized, "Entry " + entry.store_name
                     + " was not dropped by dr; its original path is unknown");
  }

  // Never overwrite whatever now occupies the original path
  std::error_code ec;
  const fs::file_status destination = fs::symlink_status(entry.original_path, ec);
  if (fs::exists(destination)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Destination already exists: " << entry.original_path.string();
    throw StoreError(ErrorKind::Conflict, "Destination already exists: " + entry.original_path.string());
  }
  if (ec && destination.type() != fs::file_type::not_found) {
    throw make_store_error("Cannot access " + entry.original_path.string(), ec);
  }

  fs::create_directories(entry.original_path.parent_path(), ec);
  if (ec) {
    throw make_store_error("Failed to create " + entry.original_path.parent_path().string(), ec);
  }

  transfer_->move(entry.store_path, entry.original_path);
  BOOST_LOG_TRIVIAL(info) << "Store: Recovered " << entry.original_path.string();
  return entry;
}

std::vector<DroppedEntry> DropStore::delete_file(const std::string& identifier, Selection selection) {
  BOOST_LOG_TRIVIAL(info) << "Store: Deleting " << identifier;

  const std::vector<DroppedEntry> selected = select(identifier, find_matches(identifier), selection);
  for (const auto& entry : selected) {
    std::error_code ec;
    const std::uintmax_t removed = fs::remove_all(entry.store_path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to delete " << entry.store_name << ": " << ec.message();
      throw make_store_error("Failed to delete " + entry.store_name, ec);
    }
    if (removed == 0) {
      throw StoreError(ErrorKind::NotFound, "Entry disappeared before deletion: " + entry.store_name);
    }
    BOOST_LOG_TRIVIAL(info) << "Store: Permanently deleted " << entry.store_name;
  }
  return selected;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<DroppedEntry> DropStore::list_entries() const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Listing " << root_.string();

  std::vector<DroppedEntry> entries;
  try {
    for (const auto& entry : fs::directory_iterator(root_)) {
      entries.push_back(describe_entry(entry));
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to read store directory: " << e.what();
    throw make_store_error("Failed to read store directory " + root_.string(), e);
  }

  std::sort(entries.begin(), entries.end(), [](const DroppedEntry& a, const DroppedEntry& b) {
    if (a.recognized != b.recognized) {
      return a.recognized;
    }
    return std::tie(a.timestamp, a.sequence, a.store_name)
         < std::tie(b.timestamp, b.sequence, b.store_name);
  });

  const auto unrecognized = std::count_if(entries.begin(), entries.end(),
                                          [](const DroppedEntry& e) { return !e.recognized; });
  if (unrecognized > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Store: " << unrecognized << " unrecognized entries in "
                               << root_.string();
  }
  return entries;
}

std::vector<DroppedEntry> DropStore::find_matches(const std::string& identifier) const {
  if (identifier.empty()) {
    return {};
  }

  const std::vector<DroppedEntry> entries = list_entries();
  std::vector<DroppedEntry> matches;

  // Exact store name
  for (const auto& entry : entries) {
    if (entry.store_name == identifier) {
      BOOST_LOG_TRIVIAL(debug) << "Store: '" << identifier << "' is a store name";
      return {entry};
    }
  }

  // Original path
  fs::path wanted;
  try {
    wanted = resolve_original_path(identifier);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Store: '" << identifier << "' is not a resolvable path: " << e.what();
  }
  if (!wanted.empty()) {
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(matches),
                 [&wanted](const DroppedEntry& e) { return e.recognized && e.original_path == wanted; });
  }
  if (!matches.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Store: " << matches.size() << " entries dropped from " << wanted.string();
    return matches;
  }

  // Fragment of the store name or the original path
  std::copy_if(entries.begin(), entries.end(), std::back_inserter(matches),
               [&identifier](const DroppedEntry& e) {
                 return e.store_name.find(identifier) != std::string::npos
                     || (e.recognized && e.original_path.string().find(identifier) != std::string::npos);
               });
  BOOST_LOG_TRIVIAL(debug) << "Store: Fragment '" << identifier << "' matches " << matches.size() << " entries";
  return matches;
}


//==============================================
// ENTRY SUPPORT
//==============================================

DroppedEntry DropStore::describe_entry(const fs::directory_entry& entry) const {
  DroppedEntry dropped;
  dropped.store_name = entry.path().filename().string();
  dropped.store_path = entry.path();

  if (auto name = decode_entry_name(dropped.store_name)) {
    dropped.recognized = true;
    dropped.timestamp = name->timestamp;
    dropped.sequence = name->sequence;
    dropped.original_path = std::move(name->original_path);
  }

  std::error_code ec;
  const fs::file_status status = entry.symlink_status(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Cannot stat " << dropped.store_name << ": " << ec.message();
    return dropped;
  }

  if (fs::is_directory(status)) {
    dropped.is_directory = true;
    dropped.size = tree_size(entry.path());
  } else if (fs::is_regular_file(status)) {
    const std::uintmax_t size = entry.file_size(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Cannot size " << dropped.store_name << ": " << ec.message();
    } else {
      dropped.size = size;
    }
  }
  return dropped;
}

fs::path DropStore::reserve_store_path(EncodedName& name) const {
  for (std::uint32_t sequence = 0; sequence < std::numeric_limits<std::uint32_t>::max(); ++sequence) {
    name.sequence = sequence;
    fs::path candidate = root_ / encode_entry_name(name);

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(candidate, ec))) {
      return candidate;
    }
    BOOST_LOG_TRIVIAL(debug) << "Store: Name taken, trying next sequence: " << candidate.filename().string();
  }
  throw StoreError(ErrorKind::IOError, "No free store name for " + name.original_path.string());
}

std::vector<DroppedEntry> DropStore::select(const std::string& identifier,
                                            std::vector<DroppedEntry> matches,
                                            Selection selection) const {
  if (matches.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Store: No dropped entry matches: " << identifier;
    throw StoreError(ErrorKind::NotFound, "No dropped entry matches: " + identifier);
  }

  if (matches.size() == 1 || selection == Selection::All) {
    return matches;
  }

  if (selection == Selection::Latest) {
    auto latest = std::max_element(matches.begin(), matches.end(),
                                   [](const DroppedEntry& a, const DroppedEntry& b) {
                                     return std::tie(a.recognized, a.timestamp, a.sequence, a.store_name)
                                          < std::tie(b.recognized, b.timestamp, b.sequence, b.store_name);
                                   });
    BOOST_LOG_TRIVIAL(debug) << "Store: Latest of " << matches.size() << " matches is " << latest->store_name;
    return {*latest};
  }

  BOOST_LOG_TRIVIAL(warning) << "Store: '" << identifier << "' is ambiguous (" << matches.size() << " matches)";
  throw AmbiguousMatchError(identifier, std::move(matches));
}


//==============================================
// UTILITY METHODS
//==============================================

void DropStore::check_directory_exists(const fs::path& path) const {
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (fs::is_directory(status)) {
    check_store_ownership(path);
    return;
  }
  if (fs::exists(status)) {
    throw StoreError(ErrorKind::IOError, "Store path is not a directory: " + path.string());
  }
  if (ec && status.type() != fs::file_type::not_found) {
    throw make_store_error("Cannot access store directory " + path.string(), ec);
  }

  ec.clear();
  fs::create_directories(path, ec);
  if (ec) {
    throw make_store_error("Failed to create store directory " + path.string(), ec);
  }

  // Only the owner may read or enter the store
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
  if (ec) {
    throw make_store_error("Failed to restrict store directory " + path.string(), ec);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Created store directory " << path.string();
}

void DropStore::check_store_ownership(const fs::path& path) const {
  struct stat info;
  if (::stat(path.c_str(), &info) != 0) {
    throw make_store_error("Cannot access store directory " + path.string(),
                           std::error_code(errno, std::generic_category()));
  }

  if (info.st_uid != ::geteuid()) {
    BOOST_LOG_TRIVIAL(error) << "Store: " << path.string() << " belongs to uid " << info.st_uid;
    throw StoreError(ErrorKind::PermissionDenied, "Store directory " + path.string()
                     + " is owned by another user");
  }

  if ((info.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Store: " << path.string()
                               << " is accessible to other users; dropped files may be exposed";
  }
}

void DropStore::check_outside_store(const fs::path& path) const {
  std::error_code ec;
  const fs::path store = fs::weakly_canonical(root_, ec);
  if (ec) {
    throw make_store_error("Cannot resolve store directory " + root_.string(), ec);
  }

  if (is_within(path, store) || is_within(store, path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Refusing to drop " << path.string() << " (overlaps the store)";
    throw StoreError(ErrorKind::PermissionDenied, "Refusing to drop " + path.string()
                     + ": it overlaps the store directory " + store.string());
  }
}

} // namespace store
} // namespace dr
