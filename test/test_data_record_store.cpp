#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fault_ledger.hpp"
#include <devledger/iot/data_record_store.hpp>
#include <devledger/ledger/memory_ledger.hpp>

using namespace devledger;
using devledger::ledger::MemoryLedger;

struct StoreFixture {
    MemoryLedger ledger;
    DeviceRegistry devices;
    DataRecordStore records{devices};

    StoreFixture() { REQUIRE(devices.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok()); }
};

TEST_SUITE("Data Record Store Tests") {

    TEST_CASE_FIXTURE(StoreFixture, "Submit then get record") {
        REQUIRE(records.submitData(ledger, "dev-1", "2024-01-01T00:00:00Z", "temp=21.5").is_ok());

        auto record = records.getDataRecord(ledger, "dev-1", "2024-01-01T00:00:00Z");
        REQUIRE(record.is_ok());
        CHECK(record.value().getDeviceId() == "dev-1");
        CHECK(record.value().getTimestamp() == "2024-01-01T00:00:00Z");
        CHECK(record.value().getData() == "temp=21.5");
        CHECK(record.value().getStatus() == DataRecordStatus::Pending);
        CHECK(record.value().getVerifierId().empty());
    }

    TEST_CASE_FIXTURE(StoreFixture, "Record is stored under its composite key") {
        REQUIRE(records.submitData(ledger, "dev-1", "t1", "x").is_ok());

        auto key = ledger.createCompositeKey("DataRecord", {"dev-1", "t1"});
        REQUIRE(key.is_ok());
        auto raw = ledger.getState(key.value());
        REQUIRE(raw.is_ok());
        CHECK(raw.value().has_value());

        auto derived = records.dataRecordKey(ledger, "dev-1", "t1");
        REQUIRE(derived.is_ok());
        CHECK(derived.value() == key.value());
    }

    TEST_CASE_FIXTURE(StoreFixture, "Submit for unregistered device") {
        auto result = records.submitData(ledger, "dev-9", "t1", "x");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DEVICE_NOT_REGISTERED);

        auto record = records.getDataRecord(ledger, "dev-9", "t1");
        REQUIRE(record.is_err());
        CHECK(record.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE_FIXTURE(StoreFixture, "Data with embedded NUL is rejected, not truncated") {
        auto writes_before = ledger.writeCount();
        auto result = records.submitData(ledger, "dev-1", "t1", std::string("a\0b", 3));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_FIELD);
        CHECK(ledger.writeCount() == writes_before);

        auto record = records.getDataRecord(ledger, "dev-1", "t1");
        REQUIRE(record.is_err());
        CHECK(record.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE_FIXTURE(StoreFixture, "Resubmission overwrites the earlier record") {
        REQUIRE(records.submitData(ledger, "dev-1", "t1", "first").is_ok());
        REQUIRE(records.submitData(ledger, "dev-1", "t1", "second").is_ok());

        auto record = records.getDataRecord(ledger, "dev-1", "t1");
        REQUIRE(record.is_ok());
        CHECK(record.value().getData() == "second");
        CHECK(record.value().isPending());
    }

    TEST_CASE_FIXTURE(StoreFixture, "Get unknown record") {
        auto record = records.getDataRecord(ledger, "dev-1", "never");
        REQUIRE(record.is_err());
        CHECK(record.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE_FIXTURE(StoreFixture, "Get record with corrupt payload") {
        auto key = ledger.createCompositeKey("DataRecord", {"dev-1", "t1"});
        REQUIRE(key.is_ok());
        REQUIRE(ledger.putState(key.value(), {0x42}).is_ok());

        auto record = records.getDataRecord(ledger, "dev-1", "t1");
        REQUIRE(record.is_err());
        CHECK(record.error().code == ERR_DESERIALIZATION_FAILED);
    }

    TEST_CASE_FIXTURE(StoreFixture, "Timestamp that cannot be keyed") {
        auto result = records.submitData(ledger, "dev-1", std::string("t\0" "1", 3), "x");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_KEY);
    }

    TEST_CASE_FIXTURE(StoreFixture, "List records of a device") {
        REQUIRE(devices.registerDevice(ledger, "dev-10", "bob", "lab-B").is_ok());
        REQUIRE(records.submitData(ledger, "dev-1", "t2", "b").is_ok());
        REQUIRE(records.submitData(ledger, "dev-1", "t1", "a").is_ok());
        REQUIRE(records.submitData(ledger, "dev-10", "t1", "other").is_ok());

        auto listed = records.listDataRecords(ledger, "dev-1");
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].getTimestamp() == "t1");
        CHECK(listed.value()[1].getTimestamp() == "t2");

        auto none = records.listDataRecords(ledger, "dev-unknown");
        REQUIRE(none.is_ok());
        CHECK(none.value().empty());
    }

    TEST_CASE("Submit when the existence check cannot read") {
        FaultLedger ledger;
        DeviceRegistry devices;
        DataRecordStore records(devices);
        REQUIRE(devices.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());

        ledger.fail_reads = true;
        auto result = records.submitData(ledger, "dev-1", "t1", "x");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_LEDGER_IO);
        CHECK(ledger.size() == 1);
    }

    TEST_CASE("Submit when the write fails") {
        FaultLedger ledger;
        DeviceRegistry devices;
        DataRecordStore records(devices);
        REQUIRE(devices.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());

        ledger.fail_writes = true;
        auto result = records.submitData(ledger, "dev-1", "t1", "x");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_LEDGER_IO);

        ledger.fail_writes = false;
        CHECK(records.getDataRecord(ledger, "dev-1", "t1").error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("List when the range scan fails") {
        FaultLedger ledger;
        DeviceRegistry devices;
        DataRecordStore records(devices);
        ledger.fail_ranges = true;

        auto listed = records.listDataRecords(ledger, "dev-1");
        REQUIRE(listed.is_err());
        CHECK(listed.error().code == ERR_LEDGER_IO);
    }
}
