#include "ledger/file_ledger.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace oracle {
namespace ledger {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileLedger::FileLedger(const std::string& base_path, FeeSchedule fees, TransactionIdSource tx_ids)
  : base_path_(base_path)
  , fees_(fees)
  , tx_ids_(std::move(tx_ids)) {
  BOOST_LOG_TRIVIAL(info) << "FileLedger: Initializing ledger with base path: " << base_path;
  check_directory_exists(base_path_ / "objects");
  check_directory_exists(base_path_ / "index");
  BOOST_LOG_TRIVIAL(debug) << "FileLedger: Ledger directories created/verified at: " << base_path;
}


//==============================================
// LEDGER CONTRACT
//==============================================

uint64_t FileLedger::quote_fee(std::size_t account_space) const {
  return fees_.quote(account_space);
}

CreateOutcome FileLedger::create_if_absent(const Namespace& owner_ns, const Address& address,
                                           const Bytes& data, Deadline deadline) {
  const std::string key = address_to_hex(address);
  BOOST_LOG_TRIVIAL(info) << "FileLedger: Creating entry at: " << key;

  CreateOutcome outcome;
  if (deadline_passed(deadline)) {
    BOOST_LOG_TRIVIAL(warning) << "FileLedger: Deadline passed before create at: " << key;
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  const fs::path file_path = get_path_for_address(address);
  std::string tx_id;
  try {
    tx_id = tx_ids_();
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "FileLedger: " << e.what();
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }
  const fs::path temp_path = file_path.parent_path() / (".pending-" + tx_id);

  try {
    check_directory_exists(file_path.parent_path());

    // Listing first: a listing without an object is skipped by scans, an
    // object without a listing would be invisible to them
    const fs::path index_dir = get_index_dir(owner_ns);
    check_directory_exists(index_dir);
    if (!fs::exists(index_dir / key)) {
      write_file(index_dir / key, Bytes{});
    }

    write_file(temp_path, data);

    std::error_code link_error;
    fs::create_hard_link(temp_path, file_path, link_error);
    std::error_code remove_error;
    fs::remove(temp_path, remove_error);
    if (remove_error) {
      BOOST_LOG_TRIVIAL(warning) << "FileLedger: Failed to remove temporary file: " << temp_path.string();
    }

    if (link_error == std::errc::file_exists) {
      BOOST_LOG_TRIVIAL(info) << "FileLedger: Address already occupied: " << key;
      outcome.error = ErrorKind::ALREADY_EXISTS;
      return outcome;
    }
    if (link_error) {
      BOOST_LOG_TRIVIAL(error) << "FileLedger: Failed to publish entry " << key << ": " << link_error.message();
      outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
      return outcome;
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileLedger: Filesystem failure while creating " << key << ": " << e.what();
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  outcome.tx_id = tx_id;
  outcome.fee_paid = fees_.quote(data.size());
  BOOST_LOG_TRIVIAL(info) << "FileLedger: Successfully stored " << data.size() << " bytes at: " << key;
  return outcome;
}

GetOutcome FileLedger::get(const Address& address, Deadline deadline) const {
  const std::string key = address_to_hex(address);
  BOOST_LOG_TRIVIAL(debug) << "FileLedger: Retrieving entry at: " << key;

  GetOutcome outcome;
  if (deadline_passed(deadline)) {
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  const fs::path file_path = get_path_for_address(address);
  try {
    if (!fs::exists(file_path)) {
      BOOST_LOG_TRIVIAL(debug) << "FileLedger: Entry not found: " << key;
      outcome.error = ErrorKind::ADDRESS_NOT_FOUND;
      return outcome;
    }
    outcome.data = read_file(file_path);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileLedger: Filesystem failure while reading " << key << ": " << e.what();
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  BOOST_LOG_TRIVIAL(debug) << "FileLedger: Read " << outcome.data->size() << " bytes at: " << key;
  return outcome;
}

ErrorKind FileLedger::scan(const Namespace& namespace_tag, const ScanVisitor& visitor,
                           Deadline deadline) const {
  if (deadline_passed(deadline)) {
    return ErrorKind::LEDGER_UNAVAILABLE;
  }

  try {
    const std::vector<std::string> keys = list_index(get_index_dir(namespace_tag));
    BOOST_LOG_TRIVIAL(debug) << "FileLedger: Scanning " << keys.size() << " listed entries";

    for (const auto& key : keys) {
      auto address = address_from_hex(key);
      if (!address) {
        BOOST_LOG_TRIVIAL(warning) << "FileLedger: Ignoring malformed listing: " << key;
        continue;
      }

      const fs::path file_path = get_path_for_address(*address);
      if (!fs::exists(file_path)) {
        // Listed by a writer that has not published (or lost the race)
        continue;
      }
      if (!visitor(*address, read_file(file_path))) {
        break;
      }
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileLedger: Filesystem failure during scan: " << e.what();
    return ErrorKind::LEDGER_UNAVAILABLE;
  }
  return ErrorKind::SUCCESS;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

fs::path FileLedger::get_path_for_address(const Address& address) const {
  const std::string hex = address_to_hex(address);
  fs::path path = base_path_ / "objects";

  for (size_t i = 0; i < 6; i += 2) {
    path /= hex.substr(i, 2);
  }

  path /= hex.substr(6);
  return path;
}

fs::path FileLedger::get_index_dir(const Namespace& namespace_tag) const {
  auto digest = crypto::Sha256::hash(namespace_tag);
  return base_path_ / "index" / to_hex(digest.data(), digest.size());
}


//==============================================
// UTILITY METHODS
//==============================================

void FileLedger::check_directory_exists(const fs::path& path) const {
  if (!fs::exists(path)) {
    fs::create_directories(path);
  }
}

void FileLedger::write_file(const fs::path& path, const Bytes& data) const {
  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw fs::filesystem_error("Failed to create file", path,
                               std::make_error_code(std::errc::io_error));
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file) {
    throw fs::filesystem_error("Failed to write file", path,
                               std::make_error_code(std::errc::io_error));
  }
}

Bytes FileLedger::read_file(const fs::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw fs::filesystem_error("Failed to open file", path,
                               std::make_error_code(std::errc::io_error));
  }

  Bytes data;
  char buffer[4096];

  // Read file in chunks
  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    throw fs::filesystem_error("Failed to read file", path,
                               std::make_error_code(std::errc::io_error));
  }
  return data;
}

std::vector<std::string> FileLedger::list_index(const fs::path& index_dir) const {
  std::vector<std::string> keys;
  if (!fs::exists(index_dir)) {
    return keys;
  }

  for (const auto& entry : fs::directory_iterator(index_dir)) {
    if (entry.is_regular_file()) {
      keys.push_back(entry.path().filename().string());
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace ledger
} // namespace oracle
