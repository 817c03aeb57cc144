#include "devledger.hpp"
#include <iostream>
#include <string>

using namespace devledger;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void printError(const std::string &what, const dp::Error &error) {
    std::cout << "   " << what << " failed (code " << error.code << "): " << errorMessage(error) << std::endl;
}

int main() {
    ledger::MemoryLedger ledger;
    IoTContract contract;

    const std::string ts = "2024-01-01T00:00:00Z";

    printSeparator("DEVICE REGISTRATION");
    auto registered = contract.registerDevice(ledger, "dev-1", "alice", "lab-A");
    if (registered.is_err()) {
        printError("register", registered.error());
        return 1;
    }

    auto duplicate = contract.registerDevice(ledger, "dev-1", "mallory", "lab-B");
    if (duplicate.is_err()) {
        printError("second register", duplicate.error());
    }

    auto device = contract.getDevice(ledger, "dev-1");
    if (device.is_ok()) {
        std::cout << "   " << device.value().toJson() << std::endl;
    }

    printSeparator("DATA SUBMISSION");
    auto submitted = contract.submitData(ledger, "dev-1", ts, "temp=21.5");
    if (submitted.is_err()) {
        printError("submit", submitted.error());
        return 1;
    }
    auto second = contract.submitData(ledger, "dev-1", "2024-01-01T00:05:00Z", "temp=21.7");
    if (second.is_err()) {
        printError("second submit", second.error());
        return 1;
    }

    auto orphan = contract.submitData(ledger, "dev-404", ts, "temp=99");
    if (orphan.is_err()) {
        printError("submit from unknown device", orphan.error());
    }

    printSeparator("VERIFICATION");
    auto verified = contract.verifyData(ledger, "dev-1", ts, "ver-1", true);
    if (verified.is_err()) {
        printError("verify", verified.error());
        return 1;
    }
    auto rejected = contract.verifyData(ledger, "dev-1", "2024-01-01T00:05:00Z", "ver-1", false);
    if (rejected.is_err()) {
        printError("reject", rejected.error());
        return 1;
    }

    auto record = contract.getDataRecord(ledger, "dev-1", ts);
    if (record.is_ok()) {
        std::cout << "   " << record.value().toJson() << std::endl;
    }

    printSeparator("DEVICE HISTORY");
    auto listed = contract.listDataRecords(ledger, "dev-1");
    if (listed.is_err()) {
        printError("list", listed.error());
        return 1;
    }
    for (const auto &r : listed.value()) {
        std::cout << "   " << r.toJson() << std::endl;
    }

    std::cout << "\nWorld state holds " << ledger.size() << " keys after " << ledger.writeCount() << " writes"
              << std::endl;
    return 0;
}
