#include "store/entry_codec.hpp"
#include <charconv>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace dr::store {

namespace {

// Canonical decimal: non-empty, digits only, no leading zeros except "0"
bool is_canonical_decimal(const std::string& digits) {
  if (digits.empty()) {
    return false;
  }
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return digits.size() == 1 || digits.front() != '0';
}

template <typename Int>
bool parse_integer(const std::string& text, Int& value) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc() && ptr == last;
}

bool parse_header(const std::string& header, EncodedName& name) {
  size_t digits_start = (!header.empty() && header.front() == '-') ? 1 : 0;
  size_t sequence_pos = header.find(SEQUENCE_SEPARATOR, digits_start);

  std::string timestamp_text = header.substr(0, sequence_pos);
  std::string timestamp_digits = timestamp_text.substr(digits_start);
  if (!is_canonical_decimal(timestamp_digits)) {
    return false;
  }
  if (digits_start == 1 && timestamp_digits == "0") {
    return false;
  }
  if (!parse_integer(timestamp_text, name.timestamp)) {
    return false;
  }

  name.sequence = 0;
  if (sequence_pos == std::string::npos) {
    return true;
  }

  std::string sequence_text = header.substr(sequence_pos + 1);
  if (!is_canonical_decimal(sequence_text) || sequence_text == "0") {
    return false;
  }
  return parse_integer(sequence_text, name.sequence);
}

} // namespace

bool operator==(const EncodedName& lhs, const EncodedName& rhs) {
  return lhs.timestamp == rhs.timestamp
      && lhs.sequence == rhs.sequence
      && lhs.original_path == rhs.original_path;
}

bool operator!=(const EncodedName& lhs, const EncodedName& rhs) {
  return !(lhs == rhs);
}

//==============================================
// PATH ESCAPING
//==============================================

std::string escape_path(const std::string& path) {
  std::string escaped;
  escaped.reserve(path.size() + path.size() / 4);

  for (char c : path) {
    if (c == ESCAPE_CHAR) {
      escaped += "%25";
    } else if (c == '/') {
      escaped += "%2F";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

std::optional<std::string> unescape_path(const std::string& escaped) {
  std::string path;
  path.reserve(escaped.size());

  for (size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] != ESCAPE_CHAR) {
      path += escaped[i];
      continue;
    }

    if (i + 2 >= escaped.size()) {
      return std::nullopt;
    }

    const char high = escaped[i + 1];
    const char low = escaped[i + 2];
    if (high == '2' && low == '5') {
      path += ESCAPE_CHAR;
    } else if (high == '2' && low == 'F') {
      path += '/';
    } else {
      return std::nullopt;
    }
    i += 2;
  }
  return path;
}


//==============================================
// ENTRY NAMES
//==============================================

std::string encode_entry_name(const EncodedName& name) {
  if (!name.original_path.is_absolute()) {
    throw std::invalid_argument("Entry codec: Original path is not absolute: "
                                + name.original_path.string());
  }

  std::string encoded = std::to_string(name.timestamp);
  if (name.sequence != 0) {
    encoded += SEQUENCE_SEPARATOR;
    encoded += std::to_string(name.sequence);
  }
  encoded += HEADER_SEPARATOR;
  encoded += escape_path(name.original_path.string());
  return encoded;
}

std::optional<EncodedName> decode_entry_name(const std::string& store_name) {
  size_t separator = store_name.find(HEADER_SEPARATOR);
  if (separator == std::string::npos) {
    BOOST_LOG_TRIVIAL(debug) << "Entry codec: No header separator in: " << store_name;
    return std::nullopt;
  }

  EncodedName name;
  if (!parse_header(store_name.substr(0, separator), name)) {
    BOOST_LOG_TRIVIAL(debug) << "Entry codec: Malformed header in: " << store_name;
    return std::nullopt;
  }

  auto path = unescape_path(store_name.substr(separator + 1));
  if (!path) {
    BOOST_LOG_TRIVIAL(debug) << "Entry codec: Invalid escape sequence in: " << store_name;
    return std::nullopt;
  }

  name.original_path = *path;
  if (!name.original_path.is_absolute()) {
    BOOST_LOG_TRIVIAL(debug) << "Entry codec: Decoded path is not absolute in: " << store_name;
    return std::nullopt;
  }
  return name;
}

} // namespace dr::store
