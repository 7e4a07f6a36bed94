#ifndef ORACLE_CORE_ERROR_KIND_HPP
#define ORACLE_CORE_ERROR_KIND_HPP

#include <ostream>

namespace oracle {

// Outcome tag shared by the ledger contract and the resolver
enum class ErrorKind {
    SUCCESS = 0,
    EMPTY_STRING,
    STRING_TOO_LONG,
    INVALID_UTF8,
    ALREADY_EXISTS,
    CORRUPT_RECORD,
    ADDRESS_NOT_FOUND,
    LEDGER_UNAVAILABLE,
    SCAN_BUDGET_EXHAUSTED
};

inline const char* error_kind_to_string(ErrorKind error) {
    switch (error) {
        case ErrorKind::SUCCESS: return "Success";
        case ErrorKind::EMPTY_STRING: return "Empty string";
        case ErrorKind::STRING_TOO_LONG: return "String too long";
        case ErrorKind::INVALID_UTF8: return "Invalid UTF-8";
        case ErrorKind::ALREADY_EXISTS: return "Already exists";
        case ErrorKind::CORRUPT_RECORD: return "Corrupt record";
        case ErrorKind::ADDRESS_NOT_FOUND: return "Address not found";
        case ErrorKind::LEDGER_UNAVAILABLE: return "Ledger unavailable";
        case ErrorKind::SCAN_BUDGET_EXHAUSTED: return "Scan budget exhausted";
        default: return "Undefined error";
    }
}

inline std::ostream& operator<<(std::ostream& strm, ErrorKind error) {
    return strm << error_kind_to_string(error);
}

} // namespace oracle

#endif // ORACLE_CORE_ERROR_KIND_HPP
