#include "store/file_digest.hpp"
#include "store/store_error.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace dr::store {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError(ErrorKind::IOError, "File digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// FILE HASHING
//==============================================

std::string sha256_file(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(debug) << "File digest: Hashing " << file_path.string();

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError(ErrorKind::IOError, "File digest: Failed to open file: " + file_path.string());
  }

  DigestContext context;
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw StoreError(ErrorKind::IOError, "File digest: Failed to initialize hash context");
  }

  // Feed the file through the digest in fixed-size chunks
  std::vector<char> buffer(DIGEST_BUFFER_SIZE);
  std::uintmax_t total_bytes = 0;
  while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
    if (!EVP_DigestUpdate(context.get(), buffer.data(), static_cast<size_t>(file.gcount()))) {
      throw StoreError(ErrorKind::IOError, "File digest: Failed to update hash");
    }
    total_bytes += static_cast<std::uintmax_t>(file.gcount());
  }

  if (file.bad()) {
    throw StoreError(ErrorKind::IOError, "File digest: Failed to read file: " + file_path.string());
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw StoreError(ErrorKind::IOError, "File digest: Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }

  BOOST_LOG_TRIVIAL(debug) << "File digest: " << total_bytes << " bytes hashed from "
                           << file_path.string();
  return ss.str();
}

} // namespace dr::store
