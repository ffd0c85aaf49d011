#ifndef DR_STORE_ENTRY_CODEC_HPP
#define DR_STORE_ENTRY_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dr::store {

// Store filename layout:
//   <timestamp>[-<sequence>]_<escaped absolute path>
// Only '%' and '/' are escaped in the path, as %25 and %2F. The header
// never contains '_', so the first '_' always ends it.

static constexpr char HEADER_SEPARATOR = '_';
static constexpr char SEQUENCE_SEPARATOR = '-';
static constexpr char ESCAPE_CHAR = '%';

struct EncodedName {
    std::int64_t timestamp = 0;
    // 0 when the plain name was free at drop time
    std::uint32_t sequence = 0;
    std::filesystem::path original_path;
};

bool operator==(const EncodedName& lhs, const EncodedName& rhs);
bool operator!=(const EncodedName& lhs, const EncodedName& rhs);

// ---- PATH ESCAPING ----
std::string escape_path(const std::string& path);
// Returns std::nullopt on a '%' not followed by 25 or 2F
std::optional<std::string> unescape_path(const std::string& escaped);


// ---- ENTRY NAMES ----
// Throws std::invalid_argument when original_path is not absolute
std::string encode_entry_name(const EncodedName& name);
// Returns std::nullopt for names that were not produced by encode_entry_name
std::optional<EncodedName> decode_entry_name(const std::string& store_name);

} // namespace dr::store

#endif // DR_STORE_ENTRY_CODEC_HPP
