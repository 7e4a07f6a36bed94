#ifndef ORACLE_LEDGER_FILE_LEDGER_HPP
#define ORACLE_LEDGER_FILE_LEDGER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "ledger/fee_schedule.hpp"
#include "ledger/ledger_store.hpp"

namespace oracle {
namespace ledger {

// Ledger kept in a directory tree:
//   {base}/objects/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{hex[6:]}   entry bytes
//   {base}/index/{sha256(namespace)}/{hex}                     scan listing
// Creation is atomic through hard links: bytes go to a temporary file which
// is then linked under the final name, and the link fails if the name exists.
class FileLedger : public LedgerStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileLedger(const std::string& base_path, FeeSchedule fees = FeeSchedule{},
                      TransactionIdSource tx_ids = make_transaction_id);
  ~FileLedger() override = default;


  // ---- LEDGER CONTRACT ----
  uint64_t quote_fee(std::size_t account_space) const override;
  CreateOutcome create_if_absent(const Namespace& owner_ns, const Address& address,
                                 const Bytes& data, Deadline deadline) override;
  GetOutcome get(const Address& address, Deadline deadline) const override;
  ErrorKind scan(const Namespace& namespace_tag, const ScanVisitor& visitor,
                 Deadline deadline) const override;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  FeeSchedule fees_;
  TransactionIdSource tx_ids_;


  // ---- CAS STORAGE SUPPORT ----
  // {base}/objects/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{remaining_hex}
  std::filesystem::path get_path_for_address(const Address& address) const;
  // {base}/index/{sha256(namespace) hex}
  std::filesystem::path get_index_dir(const Namespace& namespace_tag) const;


  // ---- FILE OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Writes bytes to a fresh file; throws filesystem_error on failure
  void write_file(const std::filesystem::path& path, const Bytes& data) const;
  // Reads the whole file; throws filesystem_error on failure
  Bytes read_file(const std::filesystem::path& path) const;
  // Sorted entry names of the namespace listing at call time
  std::vector<std::string> list_index(const std::filesystem::path& index_dir) const;
};

} // namespace ledger
} // namespace oracle

#endif // ORACLE_LEDGER_FILE_LEDGER_HPP
