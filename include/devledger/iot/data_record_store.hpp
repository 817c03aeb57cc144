#pragma once

#include "data_record.hpp"
#include "device_registry.hpp"
#include <devledger/common/error.hpp>
#include <devledger/common/text.hpp>
#include <devledger/ledger/key_value_ledger.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace devledger {

    /// Stores data records under the composite key ("DataRecord", [device_id, timestamp]).
    /// A record is only written for a device the registry knows about.
    class DataRecordStore {
      public:
        explicit DataRecordStore(const DeviceRegistry &devices) : devices_(devices) {}

        /// Key of the record for (device_id, timestamp)
        inline dp::Result<std::string, dp::Error> dataRecordKey(const ledger::KeyValueLedger &ledger,
                                                                const std::string &device_id,
                                                                const std::string &timestamp) const {
            auto key = ledger.createCompositeKey(DATA_RECORD_CATEGORY, {device_id, timestamp});
            if (key.is_err()) {
                return dp::Result<std::string, dp::Error>::err(
                    withContext(key.error(), "failed to create composite key"));
            }
            return key;
        }

        /// Store a pending record. A record with the same (device_id, timestamp) is overwritten.
        inline dp::Result<void, dp::Error> submitData(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                      const std::string &timestamp, const std::string &data) const {
            auto text = validateTextField("data", data);
            if (text.is_err()) {
                return text;
            }

            auto exists = devices_.deviceExists(ledger, device_id);
            if (exists.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    withContext(exists.error(), "failed to check device existence"));
            }
            if (!exists.value()) {
                std::cout << "Rejected data from unregistered device " << device_id << std::endl;
                return dp::Result<void, dp::Error>::err(device_not_registered("device " + device_id + " not registered"));
            }

            DataRecord record(device_id, timestamp, data, DataRecordStatus::Pending);
            auto written = writeDataRecord(ledger, device_id, timestamp, record);
            if (written.is_err()) {
                return written;
            }

            std::cout << "Data submitted by " << device_id << " at " << timestamp << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Load and decode the record for (device_id, timestamp)
        inline dp::Result<DataRecord, dp::Error> getDataRecord(ledger::KeyValueLedger &ledger,
                                                               const std::string &device_id,
                                                               const std::string &timestamp) const {
            auto key = dataRecordKey(ledger, device_id, timestamp);
            if (key.is_err()) {
                return dp::Result<DataRecord, dp::Error>::err(key.error());
            }

            auto state = ledger.getState(key.value());
            if (state.is_err()) {
                return dp::Result<DataRecord, dp::Error>::err(withContext(state.error(), "failed to get data record"));
            }
            const auto &value = state.value();
            if (!value.has_value() || value->empty()) {
                return dp::Result<DataRecord, dp::Error>::err(
                    not_found("data record for device " + device_id + " at " + timestamp + " does not exist"));
            }

            auto record = DataRecord::fromBytes(*value);
            if (record.is_err()) {
                return dp::Result<DataRecord, dp::Error>::err(
                    withContext(record.error(), "data record for device " + device_id + " at " + timestamp));
            }
            return record;
        }

        /// Serialize `record` and write it under the key of (device_id, timestamp)
        inline dp::Result<void, dp::Error> writeDataRecord(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                           const std::string &timestamp,
                                                           const DataRecord &record) const {
            auto key = dataRecordKey(ledger, device_id, timestamp);
            if (key.is_err()) {
                return dp::Result<void, dp::Error>::err(key.error());
            }

            auto put = ledger.putState(key.value(), record.toBytes());
            if (put.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    withContext(put.error(), "failed to write data record for device " + device_id));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// All records of a device in key order (timestamp byte order).
        /// A device without records, registered or not, yields an empty list.
        inline dp::Result<std::vector<DataRecord>, dp::Error> listDataRecords(ledger::KeyValueLedger &ledger,
                                                                              const std::string &device_id) const {
            auto entries = ledger.getStateByPartialCompositeKey(DATA_RECORD_CATEGORY, {device_id});
            if (entries.is_err()) {
                return dp::Result<std::vector<DataRecord>, dp::Error>::err(
                    withContext(entries.error(), "failed to list data records of device " + device_id));
            }

            std::vector<DataRecord> records;
            for (const auto &entry : entries.value()) {
                // The prefix scan also matches longer attribute lists; keep exact (device, timestamp) keys
                auto parts = ledger.splitCompositeKey(entry.key);
                if (parts.is_err() || parts.value().second.size() != 2) {
                    continue;
                }

                auto record = DataRecord::fromBytes(entry.value);
                if (record.is_err()) {
                    return dp::Result<std::vector<DataRecord>, dp::Error>::err(withContext(
                        record.error(), "data record " + ledger::composite::toDisplay(entry.key)));
                }
                records.push_back(std::move(record.value()));
            }
            return dp::Result<std::vector<DataRecord>, dp::Error>::ok(std::move(records));
        }

        inline const DeviceRegistry &devices() const { return devices_; }

      private:
        const DeviceRegistry &devices_;
    };

} // namespace devledger
