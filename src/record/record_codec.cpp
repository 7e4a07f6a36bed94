#include "record/record_codec.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace oracle {
namespace record {

const RecordCodec::Discriminator& RecordCodec::discriminator() {
  static const Discriminator value = [] {
    auto digest = crypto::Sha256::hash("account:StringRecord");
    Discriminator prefix;
    std::copy(digest.begin(), digest.begin() + DISCRIMINATOR_SIZE, prefix.begin());
    return prefix;
  }();
  return value;
}


//==============================================
// SERIALIZATION
//==============================================

Bytes RecordCodec::encode(const Record& record) const {
  const std::size_t length = record.original_string.size();

  if (length == 0) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to encode record with empty string";
    throw InvalidRecordError("empty string");
  }
  if (length > MAX_STRING_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to encode string of " << length << " bytes";
    throw InvalidRecordError("string longer than " + std::to_string(MAX_STRING_LENGTH) + " bytes");
  }
  if (!is_valid_utf8(record.original_string.data(), length)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to encode string that is not valid UTF-8";
    throw InvalidRecordError("string is not valid UTF-8");
  }
  if (fingerprint::compute(record.original_string) != record.fingerprint) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Fingerprint does not match string";
    throw InvalidRecordError("fingerprint does not match string");
  }

  Bytes output;
  output.reserve(FIXED_SIZE + length);

  write_bytes(output, discriminator().data(), DISCRIMINATOR_SIZE);
  write_le<uint32_t>(output, static_cast<uint32_t>(length));
  write_bytes(output, record.original_string.data(), length);
  write_bytes(output, record.fingerprint.data(), record.fingerprint.size());
  write_le<int64_t>(output, record.created_at);
  write_bytes(output, record.owner.data(), record.owner.size());
  write_le<uint64_t>(output, record.cost);

  BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded record of " << output.size() << " bytes";
  return output;
}


//==============================================
// DESERIALIZATION
//==============================================

Record RecordCodec::decode(const Bytes& data) const {
  if (data.size() < FIXED_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Buffer of " << data.size()
                               << " bytes is shorter than minimum " << FIXED_SIZE;
    throw CorruptRecordError("buffer shorter than " + std::to_string(FIXED_SIZE) + " bytes");
  }

  std::size_t offset = DISCRIMINATOR_SIZE;
  const uint32_t length = read_le<uint32_t>(data, offset);

  if (length > MAX_STRING_LENGTH) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Declared string length " << length << " exceeds limit";
    throw CorruptRecordError("string length " + std::to_string(length) + " exceeds limit");
  }
  if (FIXED_SIZE + length > data.size()) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Declared string length " << length
                               << " overruns buffer of " << data.size() << " bytes";
    throw CorruptRecordError("string length overruns buffer");
  }
  if (!has_record_discriminator(data)) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Discriminator mismatch";
    throw CorruptRecordError("discriminator mismatch");
  }

  // All reads below are in bounds; fill a local and hand it out whole
  Record record;
  const char* text = reinterpret_cast<const char*>(data.data() + offset);
  if (!is_valid_utf8(text, length)) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Stored string is not valid UTF-8";
    throw CorruptRecordError("string is not valid UTF-8");
  }
  record.original_string.assign(text, length);
  offset += length;
  read_bytes(data, offset, record.fingerprint.data(), record.fingerprint.size());
  record.created_at = read_le<int64_t>(data, offset);
  read_bytes(data, offset, record.owner.data(), record.owner.size());
  record.cost = read_le<uint64_t>(data, offset);

  BOOST_LOG_TRIVIAL(debug) << "Codec: Decoded record with " << length << " string bytes";
  return record;
}

bool RecordCodec::has_record_discriminator(const Bytes& data) {
  const auto& expected = discriminator();
  return data.size() >= DISCRIMINATOR_SIZE
      && std::equal(expected.begin(), expected.end(), data.begin());
}


//==============================================
// UTILITY METHODS
//==============================================

void RecordCodec::write_bytes(Bytes& output, const void* data, std::size_t size) {
  const auto* begin = static_cast<const uint8_t*>(data);
  output.insert(output.end(), begin, begin + size);
}

void RecordCodec::read_bytes(const Bytes& input, std::size_t& offset, void* data, std::size_t size) {
  if (offset + size > input.size()) {
    throw CorruptRecordError("read past end of buffer");
  }
  std::memcpy(data, input.data() + offset, size);
  offset += size;
}

} // namespace record
} // namespace oracle
