#include "store/store_error.hpp"

namespace dr::store {

ErrorKind error_kind_from_code(const std::error_code& ec) {
  if (ec == std::errc::no_such_file_or_directory) {
    return ErrorKind::NotFound;
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return ErrorKind::PermissionDenied;
  }
  return ErrorKind::IOError;
}

StoreError make_store_error(const std::string& context, const std::error_code& ec) {
  return StoreError(error_kind_from_code(ec), context + ": " + ec.message());
}

StoreError make_store_error(const std::string& context,
                            const std::filesystem::filesystem_error& error) {
  return make_store_error(context, error.code());
}

} // namespace dr::store
