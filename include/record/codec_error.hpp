#ifndef ORACLE_RECORD_CODEC_ERROR_HPP
#define ORACLE_RECORD_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace oracle {
namespace record {

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Stored bytes violate the record layout
class CorruptRecordError : public CodecError {
public:
    explicit CorruptRecordError(const std::string& message) 
        : CodecError("Corrupt record: " + message) {}
};

// In-memory record cannot be encoded
class InvalidRecordError : public CodecError {
public:
    explicit InvalidRecordError(const std::string& message) 
        : CodecError("Invalid record: " + message) {}
};

} // namespace record
} // namespace oracle

#endif // ORACLE_RECORD_CODEC_ERROR_HPP
