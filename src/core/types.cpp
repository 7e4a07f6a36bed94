#include "core/types.hpp"
#include <iomanip>
#include <sstream>
#include <boost/locale/utf.hpp>

namespace oracle {

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

bool from_hex(const std::string& hex, Bytes& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }

  Bytes result;
  result.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    result.push_back(static_cast<uint8_t>((high << 4) | low));
  }

  out = std::move(result);
  return true;
}

bool is_valid_utf8(const char* data, std::size_t size) {
  using traits = boost::locale::utf::utf_traits<char>;

  const char* current = data;
  const char* end = data + size;
  while (current != end) {
    const boost::locale::utf::code_point cp = traits::decode(current, end);
    if (cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete) {
      return false;
    }
  }
  return true;
}

} // namespace oracle
