#include <catch2/catch_test_macros.hpp>
#include "repository/transfer_repository.hpp"
#include "mocks/fake_database.hpp"

using namespace paydb;
using namespace paydb::testing;

namespace {

struct TransferFixture {
    FakeHandle maindb;
    TransferRepository repo;

    TransferFixture() : maindb(make()), repo(*maindb.handle) {}

    static FakeHandle make() {
        auto master = std::make_shared<FakeDatabase>();
        auto replica = std::make_shared<FakeDatabase>();
        define_maindb_tables(*master);
        define_maindb_tables(*replica);
        return connect_fake_handle("payout_maindb", master, replica);
    }

    // Copy a transfer onto the replica store as replication would
    void replicate(const TransferCreate& data) {
        const auto rs = maindb.replica->execute(statements::insert_returning(
            Transfer::kTable, data.to_columns(utils::now_utc()), Transfer::kColumns));
        REQUIRE(rs.success);
    }
};

utils::Timestamp at(std::string_view text) {
    return *utils::parse_timestamp(text);
}

TransferCreate sample_transfer(int64_t amount, std::string method = "stripe") {
    TransferCreate data;
    data.subtotal = amount;
    data.adjustments = 0;
    data.amount = amount;
    data.method = std::move(method);
    data.currency = "usd";
    data.status = "new";
    data.payment_account_id = 99;
    return data;
}

} // namespace

TEST_CASE("TransferRepository: create stamps created_at and assigns an id", "[repository][transfer]") {
    TransferFixture f;

    const auto before = utils::now_utc();
    const auto transfer = f.repo.create_transfer(sample_transfer(1500));
    const auto after = utils::now_utc();

    CHECK(transfer.id > 0);
    CHECK(transfer.amount == 1500);
    CHECK(transfer.method == "stripe");
    CHECK(transfer.payment_account_id == std::optional<int64_t>(99));
    CHECK_FALSE(transfer.submitted_at.has_value());
    CHECK(transfer.created_at >= before);
    CHECK(transfer.created_at <= after);
}

TEST_CASE("TransferRepository: get by id reads the replica", "[repository][transfer]") {
    TransferFixture f;
    const auto created = f.repo.create_transfer(sample_transfer(100));

    // Replica has not caught up yet
    CHECK_FALSE(f.repo.get_transfer_by_id(created.id).has_value());

    f.replicate(sample_transfer(100));
    const auto replicated = f.repo.get_transfer_by_id(created.id);
    REQUIRE(replicated.has_value());
    CHECK(replicated->amount == 100);
}

TEST_CASE("TransferRepository: get by ids reads master in id order", "[repository][transfer]") {
    TransferFixture f;
    const auto t1 = f.repo.create_transfer(sample_transfer(1));
    const auto t2 = f.repo.create_transfer(sample_transfer(2));
    const auto t3 = f.repo.create_transfer(sample_transfer(3));

    const auto found = f.repo.get_transfers_by_ids({t3.id, t1.id, 12345});
    REQUIRE(found.size() == 2);
    CHECK(found[0] == t1);
    CHECK(found[1] == t3);
    (void)t2;
}

TEST_CASE("TransferRepository: empty id list makes no round trip", "[repository][transfer]") {
    TransferFixture f;
    const auto before = f.maindb.master->statement_count();

    CHECK(f.repo.get_transfers_by_ids({}).empty());
    CHECK(f.maindb.master->statement_count() == before);
    CHECK(f.maindb.replica->statement_count() == 0);
}

TEST_CASE("TransferRepository: submitted_at and method filter", "[repository][transfer]") {
    TransferFixture f;

    auto early = sample_transfer(10);
    early.submitted_at = at("2026-05-01 09:59:59+00");
    auto boundary = sample_transfer(20);
    boundary.submitted_at = at("2026-05-01 10:00:00+00");
    auto later = sample_transfer(30);
    later.submitted_at = at("2026-05-02 00:00:00+00");
    auto manual = sample_transfer(40, "manual");
    manual.submitted_at = at("2026-05-03 00:00:00+00");
    auto unsubmitted = sample_transfer(50);

    for (const auto* t : {&early, &boundary, &later, &manual, &unsubmitted}) {
        f.replicate(*t);
    }

    const auto start = at("2026-05-01 10:00:00+00");

    // Replica ids follow insertion order: early=1, boundary=2, later=3, manual=4, unsubmitted=5
    CHECK(f.repo.get_transfers_by_submitted_at_and_method(start) == std::vector<int64_t>{2, 3});
    CHECK(f.repo.get_transfers_by_submitted_at_and_method(start, "manual") == std::vector<int64_t>{4});
    CHECK(f.repo.get_transfers_by_submitted_at_and_method(at("2027-01-01 00:00:00+00")).empty());

    // Master is never consulted
    CHECK(f.maindb.master->statement_count() == 0);
}

TEST_CASE("TransferRepository: update writes only supplied fields", "[repository][transfer]") {
    TransferFixture f;
    const auto created = f.repo.create_transfer(sample_transfer(700));

    TransferUpdate update;
    update.status = std::string("paid");
    update.submitted_at = at("2026-06-01 00:00:00+00");
    update.stripe_transfer_id = std::string("tr_123");

    const auto updated = f.repo.update_transfer_by_id(created.id, update);
    REQUIRE(updated.has_value());
    CHECK(updated->status == std::optional<std::string>("paid"));
    CHECK(updated->stripe_transfer_id == std::optional<std::string>("tr_123"));
    CHECK(updated->amount == 700);
    CHECK(updated->created_at == created.created_at);

    CHECK_FALSE(f.repo.update_transfer_by_id(created.id + 1, update).has_value());
}

TEST_CASE("TransferRepository: empty update returns the current row", "[repository][transfer]") {
    TransferFixture f;
    const auto created = f.repo.create_transfer(sample_transfer(5));

    CHECK(f.repo.update_transfer_by_id(created.id, TransferUpdate{}) == created);
    CHECK_FALSE(f.repo.update_transfer_by_id(created.id + 1, TransferUpdate{}).has_value());
}
