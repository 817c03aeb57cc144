#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fault_ledger.hpp"
#include <devledger/iot/device_registry.hpp>
#include <devledger/ledger/memory_ledger.hpp>

using namespace devledger;
using devledger::ledger::MemoryLedger;

TEST_SUITE("Device Registry Tests") {

    TEST_CASE("Register then get device") {
        MemoryLedger ledger;
        DeviceRegistry registry;

        auto result = registry.registerDevice(ledger, "dev-1", "alice", "lab-A");
        REQUIRE(result.is_ok());

        auto device = registry.getDevice(ledger, "dev-1");
        REQUIRE(device.is_ok());
        CHECK(device.value() == Device("dev-1", "alice", "lab-A", DeviceStatus::Active));
        CHECK(ledger.writeCount() == 1);
    }

    TEST_CASE("Device is stored under its id verbatim") {
        MemoryLedger ledger;
        DeviceRegistry registry;
        REQUIRE(registry.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());

        auto raw = ledger.getState("dev-1");
        REQUIRE(raw.is_ok());
        REQUIRE(raw.value().has_value());

        auto decoded = Device::fromBytes(*raw.value());
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().getOwner() == "alice");
    }

    TEST_CASE("Duplicate registration fails and keeps the first device") {
        MemoryLedger ledger;
        DeviceRegistry registry;
        REQUIRE(registry.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());

        auto second = registry.registerDevice(ledger, "dev-1", "mallory", "lab-B");
        REQUIRE(second.is_err());
        CHECK(second.error().code == ERR_ALREADY_EXISTS);

        auto device = registry.getDevice(ledger, "dev-1");
        REQUIRE(device.is_ok());
        CHECK(device.value().getOwner() == "alice");
        CHECK(device.value().getLocation() == "lab-A");
        CHECK(ledger.writeCount() == 1);
    }

    TEST_CASE("Device exists") {
        MemoryLedger ledger;
        DeviceRegistry registry;

        auto before = registry.deviceExists(ledger, "dev-1");
        REQUIRE(before.is_ok());
        CHECK_FALSE(before.value());

        REQUIRE(registry.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());

        auto after = registry.deviceExists(ledger, "dev-1");
        REQUIRE(after.is_ok());
        CHECK(after.value());
    }

    TEST_CASE("Empty stored value counts as absent") {
        MemoryLedger ledger;
        DeviceRegistry registry;
        REQUIRE(ledger.putState("dev-1", {}).is_ok());

        auto exists = registry.deviceExists(ledger, "dev-1");
        REQUIRE(exists.is_ok());
        CHECK_FALSE(exists.value());

        auto device = registry.getDevice(ledger, "dev-1");
        REQUIRE(device.is_err());
        CHECK(device.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Get unknown device") {
        MemoryLedger ledger;
        DeviceRegistry registry;

        auto device = registry.getDevice(ledger, "ghost");
        REQUIRE(device.is_err());
        CHECK(device.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Get device with corrupt payload") {
        MemoryLedger ledger;
        DeviceRegistry registry;
        REQUIRE(ledger.putState("dev-1", {0x00, 0x01, 0x02}).is_ok());

        auto device = registry.getDevice(ledger, "dev-1");
        REQUIRE(device.is_err());
        CHECK(device.error().code == ERR_DESERIALIZATION_FAILED);
    }

    TEST_CASE("Read failure is an error, not absence") {
        FaultLedger ledger;
        DeviceRegistry registry;
        ledger.fail_reads = true;

        auto exists = registry.deviceExists(ledger, "dev-1");
        REQUIRE(exists.is_err());
        CHECK(exists.error().code == ERR_LEDGER_IO);

        auto registered = registry.registerDevice(ledger, "dev-1", "alice", "lab-A");
        REQUIRE(registered.is_err());
        CHECK(registered.error().code == ERR_LEDGER_IO);
        CHECK(ledger.size() == 0);

        auto device = registry.getDevice(ledger, "dev-1");
        REQUIRE(device.is_err());
        CHECK(device.error().code == ERR_LEDGER_IO);
    }

    TEST_CASE("Write failure surfaces and leaves nothing behind") {
        FaultLedger ledger;
        DeviceRegistry registry;
        ledger.fail_writes = true;

        auto registered = registry.registerDevice(ledger, "dev-1", "alice", "lab-A");
        REQUIRE(registered.is_err());
        CHECK(registered.error().code == ERR_LEDGER_IO);

        ledger.fail_writes = false;
        auto exists = registry.deviceExists(ledger, "dev-1");
        REQUIRE(exists.is_ok());
        CHECK_FALSE(exists.value());
    }

    TEST_CASE("Invalid device ids are rejected before any write") {
        MemoryLedger ledger;
        DeviceRegistry registry;

        auto empty = registry.registerDevice(ledger, "", "alice", "lab-A");
        REQUIRE(empty.is_err());
        CHECK(empty.error().code == ERR_INVALID_KEY);

        // Would alias the composite key namespace
        auto namespaced = registry.registerDevice(ledger, std::string("\0DataRecord", 11), "alice", "lab-A");
        REQUIRE(namespaced.is_err());
        CHECK(namespaced.error().code == ERR_INVALID_KEY);

        auto bad_utf8 = registry.registerDevice(ledger, "dev-\xFF", "alice", "lab-A");
        CHECK(bad_utf8.is_err());

        CHECK(ledger.writeCount() == 0);
    }

    TEST_CASE("Owner and location with embedded NUL are rejected") {
        MemoryLedger ledger;
        DeviceRegistry registry;

        auto owner = registry.registerDevice(ledger, "dev-1", std::string("ali\0ce", 6), "lab-A");
        REQUIRE(owner.is_err());
        CHECK(owner.error().code == ERR_INVALID_FIELD);

        auto location = registry.registerDevice(ledger, "dev-1", "alice", std::string("lab\0A", 5));
        REQUIRE(location.is_err());
        CHECK(location.error().code == ERR_INVALID_FIELD);

        CHECK(ledger.writeCount() == 0);
        auto exists = registry.deviceExists(ledger, "dev-1");
        REQUIRE(exists.is_ok());
        CHECK_FALSE(exists.value());
    }

    TEST_CASE("Registrations of distinct devices are independent") {
        MemoryLedger ledger;
        DeviceRegistry registry;
        REQUIRE(registry.registerDevice(ledger, "dev-1", "alice", "lab-A").is_ok());
        REQUIRE(registry.registerDevice(ledger, "dev-2", "bob", "lab-B").is_ok());

        CHECK(registry.getDevice(ledger, "dev-1").value().getOwner() == "alice");
        CHECK(registry.getDevice(ledger, "dev-2").value().getOwner() == "bob");
        CHECK(ledger.size() == 2);
    }
}
