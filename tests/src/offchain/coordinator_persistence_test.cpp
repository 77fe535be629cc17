#include <quorum/crypto/verify.hpp>
#include <quorum/offchain/coordinator.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/key/coordinator_keys.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/testing/common.hpp>
#include <quorum/testing/coordinator_fixture.hpp>
#include <quorum/testing/fake_network.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using coordinator_t =
    quorum::offchain::coordinator<quorum::storage::rocksdb_storage_tag>;
using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

class persistence_fixture final {
 public:
  persistence_fixture() : db_path_{quorum::testing::make_db_path("quorum_coordinator")} {
    network_.permission = quorum::schema::custodian_roster_t{
        .version = 1,
        .custodians = {quorum::testing::make_signing_key(1).address(),
                       quorum::testing::make_signing_key(2).address()},
        .threshold = 2};
  }

  persistence_fixture(const persistence_fixture&) = delete;
  persistence_fixture& operator=(const persistence_fixture&) = delete;
  persistence_fixture(persistence_fixture&&) = delete;
  persistence_fixture& operator=(persistence_fixture&&) = delete;

  ~persistence_fixture() { quorum::testing::remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  quorum::testing::fake_network& network() { return network_; }

 private:
  std::string db_path_;
  quorum::testing::fake_network network_;
};

quorum::offchain::coordinator_options make_options() {
  return quorum::offchain::coordinator_options{
      .account = quorum::testing::account_address()};
}

}  // namespace

TEST(coordinator_persistence, records_survive_restart) {
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "secp256k1 unavailable in this OpenSSL build";
  }
  auto fixture = persistence_fixture{};
  auto id = quorum::schema::hash32_t{};
  {
    auto storage = quorum::storage::make_storage<
        quorum::storage::rocksdb_storage_tag>(fixture.db_path());
    auto coordinator =
        coordinator_t{storage, quorum::testing::make_signing_key(1),
                      fixture.network().network(), make_options()};
    auto created = coordinator.create(
        quorum::testing::payee_address(), 900,
        quorum::schema::asset_ref_native_t{.version = 1}, "rent");
    ASSERT_EQ(created.code, 0u) << created.log;
    id = created.record->id;
  }
  {
    auto storage = quorum::storage::make_storage<
        quorum::storage::rocksdb_storage_tag>(fixture.db_path());
    auto coordinator =
        coordinator_t{storage, quorum::testing::make_signing_key(1),
                      fixture.network().network(), make_options()};
    auto record = coordinator.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->amount, 900);
    EXPECT_EQ(record->description, "rent");
    EXPECT_TRUE(coordinator.has_signed(id));

    ASSERT_EQ(coordinator.remove(id).code, 0u);
  }
  {
    auto storage = quorum::storage::make_storage<
        quorum::storage::rocksdb_storage_tag>(fixture.db_path());
    auto coordinator =
        coordinator_t{storage, quorum::testing::make_signing_key(1),
                      fixture.network().network(), make_options()};
    EXPECT_TRUE(coordinator.list().empty());
  }
}

TEST(coordinator_persistence, unreadable_records_are_skipped) {
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "secp256k1 unavailable in this OpenSSL build";
  }
  auto fixture = persistence_fixture{};
  auto storage = quorum::storage::make_storage<
      quorum::storage::rocksdb_storage_tag>(fixture.db_path());
  auto encoder = encoder_t{};
  auto batch = quorum::storage::write_batch{};
  batch.puts.emplace_back(
      quorum::schema::key::make_pending_key(encoder,
                                            quorum::testing::make_hash(3)),
      quorum::schema::bytes_t{0x01, 0x00, 0xFF});
  storage.commit(batch);

  auto coordinator =
      coordinator_t{storage, quorum::testing::make_signing_key(1),
                    fixture.network().network(), make_options()};
  EXPECT_TRUE(coordinator.list().empty());
}
