#include "ledger/address.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cstring>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace oracle {
namespace ledger {

Address derive_address(const Namespace& namespace_tag, const std::string& content) {
  // Length prefix keeps ("ab", "c") and ("a", "bc") apart
  uint32_t tag_length = boost::endian::native_to_little(static_cast<uint32_t>(namespace_tag.size()));

  crypto::Sha256 sha;
  sha.update(ADDRESS_DOMAIN, std::strlen(ADDRESS_DOMAIN))
     .update(&tag_length, sizeof(tag_length))
     .update(namespace_tag)
     .update(content);

  Address address = sha.finalize();
  BOOST_LOG_TRIVIAL(trace) << "Address: Derived " << address_to_hex(address)
                           << " for " << content.size() << " content bytes";
  return address;
}

std::string address_to_hex(const Address& address) {
  return to_hex(address.data(), address.size());
}

std::optional<Address> address_from_hex(const std::string& hex) {
  Bytes raw;
  if (!from_hex(hex, raw) || raw.size() != ADDRESS_SIZE) {
    return std::nullopt;
  }
  Address address;
  std::copy(raw.begin(), raw.end(), address.begin());
  return address;
}

} // namespace ledger
} // namespace oracle
