#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "oracle/query_resolver.hpp"
#include "ledger/memory_ledger.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace oracle;
using namespace oracle::ledger;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

constexpr int64_t FIXED_TIME = 1700000000;

record::Owner make_owner(uint8_t seed) {
  record::Owner owner;
  for (size_t i = 0; i < owner.size(); ++i) {
    owner[i] = static_cast<uint8_t>(seed + i);
  }
  return owner;
}

OracleConfig make_config(uint8_t owner_seed = 1) {
  OracleConfig config;
  config.owner = make_owner(owner_seed);
  config.ledger_timeout = std::chrono::milliseconds(1000);
  config.read_retries = 2;
  return config;
}

// Ledger that forwards to a MemoryLedger unless a test overrides a call
class MockLedger : public LedgerStore {
public:
  MockLedger() {
    ON_CALL(*this, quote_fee(_)).WillByDefault(Invoke(&real_, &MemoryLedger::quote_fee));
    ON_CALL(*this, create_if_absent(_, _, _, _)).WillByDefault(Invoke(&real_, &MemoryLedger::create_if_absent));
    ON_CALL(*this, get(_, _)).WillByDefault(Invoke(&real_, &MemoryLedger::get));
    ON_CALL(*this, scan(_, _, _)).WillByDefault(Invoke(&real_, &MemoryLedger::scan));
  }

  MOCK_METHOD(uint64_t, quote_fee, (std::size_t), (const, override));
  MOCK_METHOD(CreateOutcome, create_if_absent, (const Namespace&, const Address&, const Bytes&, Deadline), (override));
  MOCK_METHOD(GetOutcome, get, (const Address&, Deadline), (const, override));
  MOCK_METHOD(ErrorKind, scan, (const Namespace&, const ScanVisitor&, Deadline), (const, override));

  MemoryLedger& real() { return real_; }

private:
  MemoryLedger real_;
};

} // namespace

class QueryResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    quiet_logging();
    resolver = std::make_unique<QueryResolver>(ledger, cache, make_config(), [] { return FIXED_TIME; });
  }

  // Writes raw bytes into the namespace at the address derived for content
  Address plant(const std::string& content, const Bytes& data) {
    return plant_at(ledger.derive_address(make_config().namespace_tag, content), data);
  }

  Address plant_at(const Address& address, const Bytes& data) {
    EXPECT_EQ(ledger.create_if_absent(make_config().namespace_tag, address, data,
                                      deadline_after(std::chrono::seconds(1))).error,
              ErrorKind::SUCCESS);
    return address;
  }

  static Address filled_address(uint8_t value) {
    Address address;
    address.fill(value);
    return address;
  }

  static record::Record make_record(const std::string& text, uint8_t owner_seed = 1) {
    record::Record record;
    record.original_string = text;
    record.fingerprint = fingerprint::compute(text);
    record.created_at = FIXED_TIME;
    record.owner = make_owner(owner_seed);
    record.cost = 2816840;
    return record;
  }

  MemoryLedger ledger;
  LookupCache cache;
  record::RecordCodec codec;
  std::unique_ptr<QueryResolver> resolver;
};

TEST_F(QueryResolverTest, StoreThenQueryBothWays) {
  StoreResult stored = resolver->store("Hello Solana!");
  ASSERT_TRUE(stored.ok()) << stored.error;
  EXPECT_FALSE(stored.recovered);
  EXPECT_FALSE(stored.tx_id.empty());
  EXPECT_GT(stored.fee, 0u);
  EXPECT_EQ(stored.fee, stored.record.cost);
  EXPECT_EQ(stored.record.fingerprint, fingerprint::compute("Hello Solana!"));
  EXPECT_EQ(stored.record.created_at, FIXED_TIME);
  EXPECT_EQ(stored.record.owner, make_owner(1));
  EXPECT_EQ(stored.address, derive_address("string-oracle", "Hello Solana!"));
  EXPECT_TRUE(cache.contains(stored.record.fingerprint));

  QueryResult by_address = resolver->query_by_address(stored.address);
  ASSERT_EQ(by_address.error, ErrorKind::SUCCESS);
  ASSERT_TRUE(by_address.exists);
  EXPECT_EQ(*by_address.record, stored.record);

  QueryResult by_string = resolver->query_by_string("Hello Solana!");
  ASSERT_EQ(by_string.error, ErrorKind::SUCCESS);
  ASSERT_TRUE(by_string.exists);
  EXPECT_FALSE(by_string.via_scan);
  EXPECT_EQ(by_string.address, stored.address);
  EXPECT_EQ(by_string.record->fingerprint, stored.record.fingerprint);
  EXPECT_EQ(by_string.record->original_string, "Hello Solana!");
}

TEST_F(QueryResolverTest, DuplicateStoreIsRejected) {
  ASSERT_TRUE(resolver->store("once").ok());
  StoreResult second = resolver->store("once");
  EXPECT_EQ(second.error, ErrorKind::ALREADY_EXISTS);
  EXPECT_FALSE(second.ok());
  EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(QueryResolverTest, LengthBoundaries) {
  EXPECT_EQ(resolver->store("").error, ErrorKind::EMPTY_STRING);
  EXPECT_TRUE(resolver->store(std::string(200, 'b')).ok());
  EXPECT_EQ(resolver->store(std::string(201, 'b')).error, ErrorKind::STRING_TOO_LONG);

  EXPECT_EQ(resolver->query_by_string("").error, ErrorKind::EMPTY_STRING);
  EXPECT_EQ(resolver->query_by_string(std::string(201, 'b')).error, ErrorKind::STRING_TOO_LONG);
  EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(QueryResolverTest, InvalidInputNeverTouchesLedger) {
  ::testing::StrictMock<MockLedger> strict;
  QueryResolver guarded(strict, cache, make_config());

  EXPECT_EQ(guarded.store("").error, ErrorKind::EMPTY_STRING);
  EXPECT_EQ(guarded.store(std::string(300, 'x')).error, ErrorKind::STRING_TOO_LONG);
  EXPECT_EQ(guarded.query_by_string("").error, ErrorKind::EMPTY_STRING);
  EXPECT_EQ(guarded.preview_address(std::string(201, 'x')).error, ErrorKind::STRING_TOO_LONG);
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(QueryResolverTest, NonUtf8InputIsRejectedBeforeLedger) {
  ::testing::StrictMock<MockLedger> strict;
  QueryResolver guarded(strict, cache, make_config());
  const std::string binary("\xff\xfe\xc3", 3);

  StoreResult stored = guarded.store(binary);
  EXPECT_EQ(stored.error, ErrorKind::INVALID_UTF8);
  EXPECT_FALSE(stored.ok());
  EXPECT_EQ(guarded.query_by_string(binary).error, ErrorKind::INVALID_UTF8);
  EXPECT_EQ(guarded.preview_address(binary).error, ErrorKind::INVALID_UTF8);
  EXPECT_EQ(strict.real().size(), 0u);
}

TEST_F(QueryResolverTest, NonUtf8EntryAtDerivedAddressIsCorrupt) {
  Bytes data = codec.encode(make_record("text"));
  data[record::RecordCodec::DISCRIMINATOR_SIZE + record::RecordCodec::LENGTH_PREFIX_SIZE] = 0xFF;
  Address address = plant("text", data);

  EXPECT_EQ(resolver->query_by_string("text").error, ErrorKind::CORRUPT_RECORD);
  EXPECT_EQ(resolver->query_by_address(address).error, ErrorKind::CORRUPT_RECORD);
}

TEST_F(QueryResolverTest, PreviewMatchesStoredAddress) {
  AddressPreview preview = resolver->preview_address("preview me");
  ASSERT_EQ(preview.error, ErrorKind::SUCCESS);
  EXPECT_EQ(ledger.size(), 0u);

  StoreResult stored = resolver->store("preview me");
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(preview.address, stored.address);
  EXPECT_EQ(preview.fingerprint, stored.record.fingerprint);
}

TEST_F(QueryResolverTest, UnknownStringIsNotFoundWithoutScan) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver gated(mock, cache, make_config());

  EXPECT_CALL(mock, scan(_, _, _)).Times(0);
  QueryResult result = gated.query_by_string("never stored");
  EXPECT_EQ(result.error, ErrorKind::ADDRESS_NOT_FOUND);
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.exists);
}

TEST_F(QueryResolverTest, UnknownAddressIsNotFound) {
  QueryResult result = resolver->query_by_address(derive_address("string-oracle", "nope"));
  EXPECT_EQ(result.error, ErrorKind::ADDRESS_NOT_FOUND);
  EXPECT_FALSE(result.exists);
  EXPECT_FALSE(result.record.has_value());
}

TEST_F(QueryResolverTest, RecordFromEarlierSessionFoundByPointLookup) {
  ASSERT_TRUE(resolver->store("anchored earlier").ok());

  // A restarted process shares the ledger but not the cache
  LookupCache fresh_cache;
  QueryResolver restarted(ledger, fresh_cache, make_config());
  QueryResult result = restarted.query_by_string("anchored earlier");
  EXPECT_TRUE(result.exists);
  EXPECT_FALSE(result.via_scan);
}

TEST_F(QueryResolverTest, CachedFingerprintFallsBackToScan) {
  // Record listed in the namespace at an address that is not the derived one
  record::Record record = make_record("moved");
  Bytes data = codec.encode(record);
  Address elsewhere = derive_address("string-oracle", "some other key");
  ASSERT_EQ(ledger.create_if_absent("string-oracle", elsewhere, data,
                                    deadline_after(std::chrono::seconds(1))).error, ErrorKind::SUCCESS);

  QueryResult gated = resolver->query_by_string("moved");
  EXPECT_EQ(gated.error, ErrorKind::ADDRESS_NOT_FOUND);

  cache.insert(record.fingerprint);
  QueryResult scanned = resolver->query_by_string("moved");
  ASSERT_TRUE(scanned.exists);
  EXPECT_TRUE(scanned.via_scan);
  EXPECT_EQ(scanned.address, elsewhere);
  EXPECT_EQ(*scanned.record, record);
}

TEST_F(QueryResolverTest, UngatedResolverAlwaysScansOnPointMiss) {
  OracleConfig config = make_config();
  config.cache_gates_scan = false;
  QueryResolver ungated(ledger, cache, config);

  record::Record record = make_record("stray");
  Address elsewhere = derive_address("string-oracle", "stray-key");
  ASSERT_EQ(ledger.create_if_absent("string-oracle", elsewhere, codec.encode(record),
                                    deadline_after(std::chrono::seconds(1))).error, ErrorKind::SUCCESS);

  QueryResult result = ungated.query_by_string("stray");
  ASSERT_TRUE(result.exists);
  EXPECT_TRUE(result.via_scan);
  EXPECT_EQ(result.address, elsewhere);
}

TEST_F(QueryResolverTest, FingerprintMismatchAtDerivedAddressIsCorrupt) {
  record::Record imposter = make_record("imposter");
  plant("victim", codec.encode(imposter));

  QueryResult result = resolver->query_by_string("victim");
  EXPECT_EQ(result.error, ErrorKind::CORRUPT_RECORD);
  EXPECT_FALSE(result.exists);
}

TEST_F(QueryResolverTest, UndecodableEntryIsCorrupt) {
  Address address = plant("garbage", Bytes(10, 0xEE));

  EXPECT_EQ(resolver->query_by_string("garbage").error, ErrorKind::CORRUPT_RECORD);
  QueryResult by_address = resolver->query_by_address(address);
  EXPECT_EQ(by_address.error, ErrorKind::CORRUPT_RECORD);
  EXPECT_FALSE(by_address.record.has_value());
}

TEST_F(QueryResolverTest, ScanSkipsCorruptEntriesAndKeepsGoing) {
  // Corrupt entry of our record kind: valid discriminator, impossible length.
  // Addresses are chosen so the walk meets corrupt, foreign, then wanted.
  Bytes corrupt = codec.encode(make_record("broken"));
  corrupt[8] = 0xFF;
  Address corrupt_address = plant_at(filled_address(0x00), corrupt);
  plant_at(filled_address(0x80), Bytes{0x01, 0x02});   // foreign kind, skipped silently

  record::Record wanted = make_record("wanted");
  Address wanted_address = plant_at(filled_address(0xFF), codec.encode(wanted));

  ScanReport report = resolver->find_by_fingerprint(wanted.fingerprint);
  EXPECT_EQ(report.error, ErrorKind::SUCCESS);
  ASSERT_TRUE(report.match.has_value());
  EXPECT_EQ(report.match->address, wanted_address);
  EXPECT_EQ(report.match->record, wanted);
  EXPECT_EQ(report.visited, 3u);
  ASSERT_EQ(report.corrupt.size(), 1u);
  EXPECT_EQ(report.corrupt.front(), corrupt_address);

  ScanReport full = resolver->find_by_fingerprint(fingerprint::compute("absent"));
  EXPECT_EQ(full.error, ErrorKind::SUCCESS);
  EXPECT_FALSE(full.match.has_value());
  EXPECT_EQ(full.visited, 3u);
  ASSERT_EQ(full.corrupt.size(), 1u);
  EXPECT_EQ(full.corrupt.front(), corrupt_address);
}

TEST_F(QueryResolverTest, ScanBudgetStopsLongScans) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(resolver->store("bulk-" + std::to_string(i)).ok());
  }

  ScanBudget budget;
  budget.max_entries = 3;
  ScanReport report = resolver->find_by_fingerprint(fingerprint::compute("not there"), budget);
  EXPECT_EQ(report.error, ErrorKind::SCAN_BUDGET_EXHAUSTED);
  EXPECT_EQ(report.visited, 3u);
  EXPECT_FALSE(report.match.has_value());
}

TEST_F(QueryResolverTest, ReadsAreRetriedWhenLedgerIsUnavailable) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver flaky(mock, cache, make_config());
  ASSERT_TRUE(flaky.store("retry me").ok());

  GetOutcome unavailable;
  unavailable.error = ErrorKind::LEDGER_UNAVAILABLE;
  EXPECT_CALL(mock, get(_, _))
      .WillOnce(Return(unavailable))
      .WillOnce(Return(unavailable))
      .WillRepeatedly(Invoke(&mock.real(), &MemoryLedger::get));

  QueryResult result = flaky.query_by_string("retry me");
  EXPECT_EQ(result.error, ErrorKind::SUCCESS);
  EXPECT_TRUE(result.exists);
}

TEST_F(QueryResolverTest, ReadsGiveUpAfterRetryLimit) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver flaky(mock, cache, make_config());

  GetOutcome unavailable;
  unavailable.error = ErrorKind::LEDGER_UNAVAILABLE;
  EXPECT_CALL(mock, get(_, _)).Times(3).WillRepeatedly(Return(unavailable));

  QueryResult result = flaky.query_by_address(derive_address("string-oracle", "x"));
  EXPECT_EQ(result.error, ErrorKind::LEDGER_UNAVAILABLE);
  EXPECT_FALSE(result.ok());
}

TEST_F(QueryResolverTest, TimedOutWriteThatLandedIsRecovered) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver writer(mock, cache, make_config());

  // The write reaches the ledger but the caller only sees a timeout
  EXPECT_CALL(mock, create_if_absent(_, _, _, _))
      .Times(1)
      .WillOnce(Invoke([&mock](const Namespace& ns, const Address& address, const Bytes& data, Deadline deadline) {
        mock.real().create_if_absent(ns, address, data, deadline);
        CreateOutcome timed_out;
        timed_out.error = ErrorKind::LEDGER_UNAVAILABLE;
        return timed_out;
      }));

  StoreResult result = writer.store("ambiguous");
  ASSERT_TRUE(result.ok()) << result.error;
  EXPECT_TRUE(result.recovered);
  EXPECT_TRUE(result.tx_id.empty());
  EXPECT_EQ(result.fee, 2816840u);
  EXPECT_EQ(result.record.original_string, "ambiguous");
  EXPECT_TRUE(cache.contains(fingerprint::compute("ambiguous")));
}

TEST_F(QueryResolverTest, TimedOutWriteThatDidNotLandIsUnavailable) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver writer(mock, cache, make_config());

  CreateOutcome timed_out;
  timed_out.error = ErrorKind::LEDGER_UNAVAILABLE;
  EXPECT_CALL(mock, create_if_absent(_, _, _, _)).Times(1).WillOnce(Return(timed_out));

  StoreResult result = writer.store("lost");
  EXPECT_EQ(result.error, ErrorKind::LEDGER_UNAVAILABLE);
  EXPECT_FALSE(result.recovered);
  EXPECT_FALSE(cache.contains(fingerprint::compute("lost")));
  EXPECT_EQ(mock.real().size(), 0u);
}

TEST_F(QueryResolverTest, TimedOutDuplicateOfOwnEarlierStoreIsNotSuccess) {
  ::testing::NiceMock<MockLedger> mock;
  int64_t now = 1000;
  QueryResolver writer(mock, cache, make_config(), [&now] { return now; });

  StoreResult first = writer.store("dup");
  ASSERT_TRUE(first.ok());

  // Same owner, same string, later clock; the create never reaches the ledger
  now = 5000;
  CreateOutcome timed_out;
  timed_out.error = ErrorKind::LEDGER_UNAVAILABLE;
  EXPECT_CALL(mock, create_if_absent(_, _, _, _)).Times(1).WillOnce(Return(timed_out));

  StoreResult second = writer.store("dup");
  EXPECT_EQ(second.error, ErrorKind::ALREADY_EXISTS);
  EXPECT_FALSE(second.recovered);
  EXPECT_EQ(mock.real().size(), 1u);
}

TEST_F(QueryResolverTest, TransactionIdFailureIsUnavailableAndWritesNothing) {
  MemoryLedger failing(FeeSchedule{}, []() -> std::string {
    throw crypto::CryptoError("Failed to generate transaction id");
  });
  QueryResolver writer(failing, cache, make_config());

  StoreResult result = writer.store("no id");
  EXPECT_EQ(result.error, ErrorKind::LEDGER_UNAVAILABLE);
  EXPECT_FALSE(result.recovered);
  EXPECT_EQ(failing.size(), 0u);
  EXPECT_FALSE(cache.contains(fingerprint::compute("no id")));
}

TEST_F(QueryResolverTest, TimedOutWriteBeatenByAnotherOwnerIsDuplicate) {
  ::testing::NiceMock<MockLedger> mock;
  QueryResolver writer(mock, cache, make_config(1));

  // Another owner anchored the same string first
  LookupCache other_cache;
  QueryResolver rival(mock.real(), other_cache, make_config(9));
  ASSERT_TRUE(rival.store("contested").ok());

  CreateOutcome timed_out;
  timed_out.error = ErrorKind::LEDGER_UNAVAILABLE;
  EXPECT_CALL(mock, create_if_absent(_, _, _, _)).Times(1).WillOnce(Return(timed_out));

  StoreResult result = writer.store("contested");
  EXPECT_EQ(result.error, ErrorKind::ALREADY_EXISTS);
  EXPECT_FALSE(cache.contains(fingerprint::compute("contested")));
}

TEST_F(QueryResolverTest, ConcurrentStoresOfOneStringSucceedOnce) {
  const size_t num_threads = 8;
  std::atomic<size_t> successes{0};
  std::atomic<size_t> duplicates{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, &successes, &duplicates]() {
      StoreResult result = resolver->store("race");
      if (result.ok()) {
        successes++;
      } else if (result.error == ErrorKind::ALREADY_EXISTS) {
        duplicates++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 1u);
  EXPECT_EQ(duplicates.load(), num_threads - 1);
  EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(QueryResolverTest, StatusReflectsConfigAndCache) {
  ASSERT_TRUE(resolver->store("status").ok());
  ResolverStatus status = resolver->status();
  EXPECT_EQ(status.namespace_tag, "string-oracle");
  EXPECT_EQ(status.owner, to_hex(make_owner(1).data(), 32));
  EXPECT_EQ(status.cache_size, 1u);
  EXPECT_EQ(status.fee_quote, 2816840u);
}
