#include "store/transfer.hpp"
#include "store/file_digest.hpp"
#include <iterator>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace dr {
namespace store {

namespace fs = std::filesystem;

//==============================================
// TRANSFER OPERATIONS
//==============================================

void Transfer::move(const fs::path& from, const fs::path& to) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer: Moving " << from.string() << " -> " << to.string();

  try {
    rename_entry(from, to);
    BOOST_LOG_TRIVIAL(debug) << "Transfer: Renamed " << from.string();
    return;
  } catch (const fs::filesystem_error& e) {
    if (e.code() != std::errc::cross_device_link) {
      BOOST_LOG_TRIVIAL(error) << "Transfer: Rename failed: " << e.what();
      throw make_store_error("Failed to move " + from.string(), e);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer: " << from.string()
                          << " is on another filesystem, falling back to copy";
  copy_verify_and_remove(from, to);
}


//==============================================
// FILESYSTEM PRIMITIVES
//==============================================

void Transfer::rename_entry(const fs::path& from, const fs::path& to) {
  fs::rename(from, to);
}

void Transfer::copy_entry(const fs::path& from, const fs::path& to) {
  // Symlinks are copied as links, never followed
  fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
}

void Transfer::remove_source(const fs::path& from) {
  fs::remove_all(from);
}

void Transfer::verify(const fs::path& from, const fs::path& to) const {
  BOOST_LOG_TRIVIAL(debug) << "Transfer: Verifying copy " << to.string();

  compare_entry(from, to);
  if (!fs::is_directory(fs::symlink_status(from))) {
    return;
  }

  std::size_t source_entries = 0;
  for (const auto& entry : fs::recursive_directory_iterator(from)) {
    ++source_entries;
    compare_entry(entry.path(), to / entry.path().lexically_relative(from));
  }

  auto copied_entries = static_cast<std::size_t>(
    std::distance(fs::recursive_directory_iterator(to), fs::recursive_directory_iterator()));
  if (copied_entries != source_entries) {
    throw StoreError(ErrorKind::IOError, "Copy of " + from.string() + " has "
                     + std::to_string(copied_entries) + " entries, expected "
                     + std::to_string(source_entries));
  }
}


//==============================================
// CROSS-DEVICE FALLBACK
//==============================================

void Transfer::copy_verify_and_remove(const fs::path& from, const fs::path& to) {
  // A copy into an existing directory would merge, so the destination must be free
  std::error_code ec;
  const fs::file_status destination = fs::symlink_status(to, ec);
  if (fs::exists(destination)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Destination appeared before copy: " << to.string();
    throw StoreError(ErrorKind::Conflict, "Destination already exists: " + to.string());
  }
  if (ec && destination.type() != fs::file_type::not_found) {
    throw make_store_error("Cannot access " + to.string(), ec);
  }

  try {
    copy_entry(from, to);
    verify(from, to);
  } catch (const fs::filesystem_error& e) {
    if (e.code() == std::errc::file_exists) {
      // Whatever sits at the destination was not written by this copy
      BOOST_LOG_TRIVIAL(error) << "Transfer: Destination appeared during copy: " << to.string();
      throw StoreError(ErrorKind::Conflict, "Destination already exists: " + to.string());
    }
    BOOST_LOG_TRIVIAL(error) << "Transfer: Copy failed, source left in place: " << e.what();
    discard_copy(to);
    throw make_store_error("Failed to copy " + from.string(), e);
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Copy rejected, source left in place: " << e.what();
    discard_copy(to);
    throw;
  }

  // The copy is confirmed; only now is the source removed
  const bool source_is_directory = fs::is_directory(fs::symlink_status(from));
  try {
    remove_source(from);
    BOOST_LOG_TRIVIAL(info) << "Transfer: Copied and removed " << from.string();
    return;
  } catch (const fs::filesystem_error& e) {
    ec = e.code();
  }

  BOOST_LOG_TRIVIAL(error) << "Transfer: Failed to remove source " << from.string()
                           << ": " << ec.message();
  if (!source_is_directory) {
    // Unlink is all-or-nothing: the source is intact, so drop the duplicate
    discard_copy(to);
    throw make_store_error("Failed to remove " + from.string(), ec);
  }

  // A directory may be partially removed; the verified copy must survive
  throw StoreError(ErrorKind::IOError, "Copied " + from.string() + " to " + to.string()
                   + " but could not remove the source: " + ec.message());
}

void Transfer::discard_copy(const fs::path& to) const {
  std::error_code ec;
  fs::remove_all(to, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Failed to discard copy " << to.string()
                             << ": " << ec.message();
  }
}

void Transfer::compare_entry(const fs::path& from, const fs::path& to) const {
  const fs::file_status source = fs::symlink_status(from);
  const fs::file_status copy = fs::symlink_status(to);

  if (source.type() != copy.type()) {
    throw StoreError(ErrorKind::IOError, "Copy of " + from.string() + " has a different file type");
  }

  if (fs::is_symlink(source)) {
    if (fs::read_symlink(from) != fs::read_symlink(to)) {
      throw StoreError(ErrorKind::IOError, "Copy of link " + from.string() + " has a different target");
    }
  } else if (fs::is_regular_file(source)) {
    if (fs::file_size(from) != fs::file_size(to)) {
      throw StoreError(ErrorKind::IOError, "Copy of " + from.string() + " has a different size");
    }
    if (sha256_file(from) != sha256_file(to)) {
      throw StoreError(ErrorKind::IOError, "Copy of " + from.string() + " has different contents");
    }
  }
}

} // namespace store
} // namespace dr
