/**
 * Example: Persisting the IoT world state in SQLite
 *
 * This demo shows how to:
 * 1. Open a SqliteStore with explicit OpenOptions
 * 2. Register a device and submit readings through IoTContract
 * 3. Close and reopen the store, then verify a reading recovered from disk
 */

#include "devledger.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace devledger;
using namespace devledger::storage;

int main() {
    const std::string db_path = "iot_demo.db";
    std::filesystem::remove(db_path);

    OpenOptions opts;
    opts.enable_wal = true;
    opts.sync_mode = OpenOptions::Synchronous::FULL;

    IoTContract contract;

    // ===========================================
    // Step 1: First session writes the state
    // ===========================================
    {
        SqliteStore store;
        auto opened = store.open(db_path, opts);
        if (opened.is_err()) {
            std::cerr << "open failed: " << errorMessage(opened.error()) << std::endl;
            return 1;
        }

        auto registered = contract.registerDevice(store, "sensor-7", "greenhouse-co", "bay-3");
        if (registered.is_err()) {
            std::cerr << "register failed: " << errorMessage(registered.error()) << std::endl;
            return 1;
        }

        for (const auto &[ts, data] : {std::pair<std::string, std::string>{"2024-03-01T08:00:00Z", "humidity=61"},
                                       {"2024-03-01T09:00:00Z", "humidity=64"}}) {
            auto submitted = contract.submitData(store, "sensor-7", ts, data);
            if (submitted.is_err()) {
                std::cerr << "submit failed: " << errorMessage(submitted.error()) << std::endl;
                return 1;
            }
        }

        std::cout << "Session 1 stored " << store.getKeyCount() << " keys (schema v" << store.getSchemaVersion()
                  << ")" << std::endl;
        store.close();
    }

    // ===========================================
    // Step 2: Second session reads it back
    // ===========================================
    SqliteStore store;
    auto reopened = store.open(db_path, opts);
    if (reopened.is_err()) {
        std::cerr << "reopen failed: " << errorMessage(reopened.error()) << std::endl;
        return 1;
    }

    auto verified = contract.verifyData(store, "sensor-7", "2024-03-01T08:00:00Z", "auditor-1", true);
    if (verified.is_err()) {
        std::cerr << "verify failed: " << errorMessage(verified.error()) << std::endl;
        return 1;
    }

    auto listed = contract.listDataRecords(store, "sensor-7");
    if (listed.is_err()) {
        std::cerr << "list failed: " << errorMessage(listed.error()) << std::endl;
        return 1;
    }
    std::cout << "Session 2 recovered " << listed.value().size() << " readings:" << std::endl;
    for (const auto &record : listed.value()) {
        std::cout << "  " << record.toJson() << std::endl;
    }

    store.close();
    std::filesystem::remove(db_path);
    return 0;
}
