#ifndef ORACLE_RECORD_CODEC_HPP
#define ORACLE_RECORD_CODEC_HPP

#include <array>
#include <cstdint>
#include <boost/endian/conversion.hpp>
#include "core/types.hpp"
#include "record/record.hpp"
#include "record/codec_error.hpp"

namespace oracle {
namespace record {

// Little-endian layout, no padding between fields:
// discriminator(8) | string_length(4) | string(N) | fingerprint(16)
// | created_at(8) | owner(32) | cost(8)
class RecordCodec {
public:
  static constexpr std::size_t DISCRIMINATOR_SIZE = 8;
  static constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
  // Every field except the string body
  static constexpr std::size_t FIXED_SIZE = DISCRIMINATOR_SIZE + LENGTH_PREFIX_SIZE
      + fingerprint::FINGERPRINT_SIZE + sizeof(int64_t) + OWNER_SIZE + sizeof(uint64_t);
  // Space the ledger reserves per record, whatever the string length
  static constexpr std::size_t ACCOUNT_SPACE = FIXED_SIZE + MAX_STRING_LENGTH;

  using Discriminator = std::array<uint8_t, DISCRIMINATOR_SIZE>;

  // First 8 bytes of SHA-256("account:StringRecord")
  static const Discriminator& discriminator();


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Throws InvalidRecordError for an empty or oversized string, or a
  // fingerprint that does not belong to the string
  Bytes encode(const Record& record) const;
  // Throws CorruptRecordError; never returns a partially populated Record
  Record decode(const Bytes& data) const;

  // True when the buffer starts with this record kind's discriminator
  static bool has_record_discriminator(const Bytes& data);

private:
  // ---- BUFFER OPERATIONS ----
  static void write_bytes(Bytes& output, const void* data, std::size_t size);
  static void read_bytes(const Bytes& input, std::size_t& offset, void* data, std::size_t size);

  template<typename T>
  static void write_le(Bytes& output, T value) {
    T little = boost::endian::native_to_little(value);
    write_bytes(output, &little, sizeof(little));
  }

  template<typename T>
  static T read_le(const Bytes& input, std::size_t& offset) {
    T little;
    read_bytes(input, offset, &little, sizeof(little));
    return boost::endian::little_to_native(little);
  }
};

} // namespace record
} // namespace oracle

#endif // ORACLE_RECORD_CODEC_HPP
