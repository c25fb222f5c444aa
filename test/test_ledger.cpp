// cpamm - AssetLedger Tests

#include <catch2/catch_test_macros.hpp>
#include <cpamm/ledger.hpp>
#include "test_helpers.hpp"

using namespace cpamm;
using namespace cpamm::test;

TEST_CASE("Unseen accounts read as zero", "[ledger]") {
    AssetLedger ledger;

    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(0));
    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN2) == B(0));
    REQUIRE(ledger.balance_of(ALICE, AssetKind::SHARE) == B(0));
    REQUIRE(ledger.account(ALICE) == AccountState{});
    REQUIRE_FALSE(ledger.find(ALICE).has_value());
    REQUIRE(ledger.account_count() == 0);
}

TEST_CASE("Credit and debit", "[ledger]") {
    AssetLedger ledger;

    REQUIRE(ledger.credit(ALICE, AssetKind::TOKEN1, B(500)) == errors::OK);
    REQUIRE(ledger.credit(ALICE, AssetKind::TOKEN1, B(250)) == errors::OK);
    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(750));
    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN2) == B(0));
    REQUIRE(ledger.account_count() == 1);

    SECTION("Debit within balance") {
        REQUIRE(ledger.debit(ALICE, AssetKind::TOKEN1, B(750)) == errors::OK);
        REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(0));
    }

    SECTION("Debit beyond balance leaves it untouched") {
        REQUIRE(ledger.debit(ALICE, AssetKind::TOKEN1, B(751)) == errors::INSUFFICIENT_AMOUNT);
        REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(750));
    }

    SECTION("Credit that would wrap is rejected") {
        REQUIRE(ledger.credit(ALICE, AssetKind::TOKEN1, U128_MAX) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(750));
    }

    SECTION("Accounts are independent") {
        REQUIRE(ledger.balance_of(BOB, AssetKind::TOKEN1) == B(0));
        REQUIRE(ledger.debit(BOB, AssetKind::TOKEN1, B(1)) == errors::INSUFFICIENT_AMOUNT);
        REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN1) == B(750));
    }
}

TEST_CASE("check_amount", "[ledger]") {
    AssetLedger ledger;
    REQUIRE(ledger.credit(ALICE, AssetKind::SHARE, B(10)) == errors::OK);

    REQUIRE(ledger.check_amount(ALICE, AssetKind::SHARE, B(0)) == errors::ZERO_AMOUNT);
    REQUIRE(ledger.check_amount(ALICE, AssetKind::SHARE, B(10)) == errors::OK);
    REQUIRE(ledger.check_amount(ALICE, AssetKind::SHARE, B(11)) == errors::INSUFFICIENT_AMOUNT);

    // Zero is reported before the balance check
    REQUIRE(ledger.check_amount(BOB, AssetKind::TOKEN1, B(0)) == errors::ZERO_AMOUNT);
    REQUIRE(ledger.check_amount(BOB, AssetKind::TOKEN1, B(1)) == errors::INSUFFICIENT_AMOUNT);
}

TEST_CASE("Staged updates", "[ledger]") {
    AssetLedger ledger;
    REQUIRE(ledger.credit(ALICE, AssetKind::TOKEN2, B(40)) == errors::OK);

    AccountState staged = ledger.account(ALICE);
    REQUIRE(AssetLedger::sub_from(staged, AssetKind::TOKEN2, B(15)) == errors::OK);
    REQUIRE(AssetLedger::add_to(staged, AssetKind::SHARE, B(3)) == errors::OK);
    REQUIRE(AssetLedger::sub_from(staged, AssetKind::TOKEN1, B(1)) == errors::INSUFFICIENT_AMOUNT);

    // Nothing visible until upsert
    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN2) == B(40));

    ledger.upsert(ALICE, staged);
    REQUIRE(ledger.balance_of(ALICE, AssetKind::TOKEN2) == B(25));
    REQUIRE(ledger.balance_of(ALICE, AssetKind::SHARE) == B(3));
}

TEST_CASE("total_of sums across accounts", "[ledger]") {
    AssetLedger ledger;
    REQUIRE(ledger.credit(ALICE, AssetKind::SHARE, B(7)) == errors::OK);
    REQUIRE(ledger.credit(BOB, AssetKind::SHARE, B(5)) == errors::OK);
    REQUIRE(ledger.credit(CAROL, AssetKind::TOKEN1, B(100)) == errors::OK);

    REQUIRE(ledger.total_of(AssetKind::SHARE) == B(12));
    REQUIRE(ledger.total_of(AssetKind::TOKEN1) == B(100));
    REQUIRE(ledger.account_count() == 3);
}
