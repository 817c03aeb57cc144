#pragma once

#include <doctest/doctest.h>

#include <devledger/common/error.hpp>
#include <devledger/ledger/key_value_ledger.hpp>

// Behaviour every KeyValueLedger backend must share. Expects an empty ledger.
inline void checkLedgerConformance(devledger::ledger::KeyValueLedger &ledger) {
    using devledger::ledger::Bytes;

    SUBCASE("Absent key reads as nullopt") {
        auto state = ledger.getState("missing");
        REQUIRE(state.is_ok());
        CHECK_FALSE(state.value().has_value());
    }

    SUBCASE("Put then get") {
        REQUIRE(ledger.putState("k1", {1, 2, 3}).is_ok());
        auto state = ledger.getState("k1");
        REQUIRE(state.is_ok());
        REQUIRE(state.value().has_value());
        CHECK(*state.value() == Bytes{1, 2, 3});
    }

    SUBCASE("Put replaces prior value") {
        REQUIRE(ledger.putState("k1", {1}).is_ok());
        REQUIRE(ledger.putState("k1", {9, 9}).is_ok());
        auto state = ledger.getState("k1");
        REQUIRE(state.is_ok());
        CHECK(*state.value() == Bytes{9, 9});
    }

    SUBCASE("Empty value is kept as empty") {
        REQUIRE(ledger.putState("k-empty", {}).is_ok());
        auto state = ledger.getState("k-empty");
        REQUIRE(state.is_ok());
        REQUIRE(state.value().has_value());
        CHECK(state.value()->empty());
    }

    SUBCASE("Empty key is rejected") {
        auto put = ledger.putState("", {1});
        REQUIRE(put.is_err());
        CHECK(put.error().code == devledger::ERR_INVALID_KEY);
    }

    SUBCASE("Composite keys with embedded separators round trip") {
        auto key = ledger.createCompositeKey("DataRecord", {"dev-1", "t1"});
        REQUIRE(key.is_ok());
        REQUIRE(ledger.putState(key.value(), {7}).is_ok());

        auto state = ledger.getState(key.value());
        REQUIRE(state.is_ok());
        REQUIRE(state.value().has_value());
        CHECK(*state.value() == Bytes{7});

        // A shorter key sharing the prefix is a different key
        auto shorter = ledger.createCompositeKey("DataRecord", {"dev-1"});
        REQUIRE(shorter.is_ok());
        auto other = ledger.getState(shorter.value());
        REQUIRE(other.is_ok());
        CHECK_FALSE(other.value().has_value());
    }

    SUBCASE("Range scan is ordered and half open") {
        REQUIRE(ledger.putState("b", {2}).is_ok());
        REQUIRE(ledger.putState("a", {1}).is_ok());
        REQUIRE(ledger.putState("d", {4}).is_ok());
        REQUIRE(ledger.putState("c", {3}).is_ok());

        auto range = ledger.getStateByRange("b", "d");
        REQUIRE(range.is_ok());
        REQUIRE(range.value().size() == 2);
        CHECK(range.value()[0].key == "b");
        CHECK(range.value()[1].key == "c");
        CHECK(range.value()[1].value == Bytes{3});

        auto open_ended = ledger.getStateByRange("c", "");
        REQUIRE(open_ended.is_ok());
        CHECK(open_ended.value().size() == 2);
    }

    SUBCASE("Partial composite key scan") {
        for (const auto &ts : {"t3", "t1", "t2"}) {
            auto key = ledger.createCompositeKey("DataRecord", {"dev-1", ts});
            REQUIRE(key.is_ok());
            REQUIRE(ledger.putState(key.value(), {1}).is_ok());
        }
        auto other = ledger.createCompositeKey("DataRecord", {"dev-2", "t1"});
        REQUIRE(other.is_ok());
        REQUIRE(ledger.putState(other.value(), {2}).is_ok());
        REQUIRE(ledger.putState("dev-1", {3}).is_ok());

        auto entries = ledger.getStateByPartialCompositeKey("DataRecord", {"dev-1"});
        REQUIRE(entries.is_ok());
        REQUIRE(entries.value().size() == 3);

        auto first = ledger.splitCompositeKey(entries.value()[0].key);
        REQUIRE(first.is_ok());
        CHECK(first.value().second == std::vector<std::string>{"dev-1", "t1"});
        auto last = ledger.splitCompositeKey(entries.value()[2].key);
        REQUIRE(last.is_ok());
        CHECK(last.value().second == std::vector<std::string>{"dev-1", "t3"});
    }
}
