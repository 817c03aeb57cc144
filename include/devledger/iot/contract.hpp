#pragma once

#include "data_record_store.hpp"
#include "device_registry.hpp"
#include "verification_workflow.hpp"

#include <string>
#include <vector>

namespace devledger {

    /// Public transaction surface of the IoT device ledger.
    /// Each call is one self-contained operation against the ledger passed in.
    class IoTContract {
      public:
        IoTContract() : records_(devices_), workflow_(records_) {}

        // Members reference each other
        IoTContract(const IoTContract &) = delete;
        IoTContract &operator=(const IoTContract &) = delete;

        // === Devices ===

        inline dp::Result<void, dp::Error> registerDevice(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                          const std::string &owner, const std::string &location) const {
            return devices_.registerDevice(ledger, device_id, owner, location);
        }

        inline dp::Result<bool, dp::Error> deviceExists(ledger::KeyValueLedger &ledger,
                                                        const std::string &device_id) const {
            return devices_.deviceExists(ledger, device_id);
        }

        inline dp::Result<Device, dp::Error> getDevice(ledger::KeyValueLedger &ledger,
                                                       const std::string &device_id) const {
            return devices_.getDevice(ledger, device_id);
        }

        // === Data records ===

        inline dp::Result<void, dp::Error> submitData(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                      const std::string &timestamp, const std::string &data) const {
            return records_.submitData(ledger, device_id, timestamp, data);
        }

        inline dp::Result<DataRecord, dp::Error> getDataRecord(ledger::KeyValueLedger &ledger,
                                                               const std::string &device_id,
                                                               const std::string &timestamp) const {
            return records_.getDataRecord(ledger, device_id, timestamp);
        }

        inline dp::Result<std::vector<DataRecord>, dp::Error> listDataRecords(ledger::KeyValueLedger &ledger,
                                                                              const std::string &device_id) const {
            return records_.listDataRecords(ledger, device_id);
        }

        // === Verification ===

        inline dp::Result<void, dp::Error> verifyData(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                      const std::string &timestamp, const std::string &verifier_id,
                                                      bool is_valid) const {
            return workflow_.verifyData(ledger, device_id, timestamp, verifier_id, is_valid);
        }

        inline const DeviceRegistry &devices() const { return devices_; }
        inline const DataRecordStore &records() const { return records_; }
        inline const VerificationWorkflow &workflow() const { return workflow_; }

      private:
        DeviceRegistry devices_;
        DataRecordStore records_;
        VerificationWorkflow workflow_;
    };

} // namespace devledger
