#ifndef DR_STORE_FILE_DIGEST_HPP
#define DR_STORE_FILE_DIGEST_HPP

#include <filesystem>
#include <string>

namespace dr::store {

static constexpr size_t DIGEST_BUFFER_SIZE = 8192;

// Hex-encoded SHA-256 of a regular file's contents, streamed through OpenSSL EVP.
// Throws StoreError (IOError) when the file cannot be read.
std::string sha256_file(const std::filesystem::path& file_path);

} // namespace dr::store

#endif // DR_STORE_FILE_DIGEST_HPP
