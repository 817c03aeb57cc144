#pragma once

#include "data_record.hpp"
#include "data_record_store.hpp"
#include <devledger/common/error.hpp>
#include <devledger/common/text.hpp>
#include <devledger/ledger/key_value_ledger.hpp>

#include <iostream>
#include <string>

namespace devledger {

    /// Moves a stored data record from pending to verified or rejected.
    ///
    /// pending --verify(valid)--> verified
    /// pending --verify(!valid)-> rejected
    ///
    /// A record that was already verified or rejected is transitioned again on request:
    /// the new outcome and verifier replace the previous ones.
    class VerificationWorkflow {
      public:
        explicit VerificationWorkflow(const DataRecordStore &records) : records_(records) {}

        /// Apply a verification outcome to a record in memory
        inline static void transition(DataRecord &record, const std::string &verifier_id, bool is_valid) {
            record.setStatus(is_valid ? DataRecordStatus::Verified : DataRecordStatus::Rejected);
            record.setVerifierId(verifier_id);
        }

        /// Load the record, apply the outcome and write it back under the same key.
        /// If the write fails the stored record keeps its previous state.
        inline dp::Result<void, dp::Error> verifyData(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                      const std::string &timestamp, const std::string &verifier_id,
                                                      bool is_valid) const {
            auto text = validateTextField("verifier id", verifier_id);
            if (text.is_err()) {
                return text;
            }

            auto loaded = records_.getDataRecord(ledger, device_id, timestamp);
            if (loaded.is_err()) {
                return dp::Result<void, dp::Error>::err(loaded.error());
            }

            DataRecord record = loaded.value();
            auto previous = record.getStatusString();
            transition(record, verifier_id, is_valid);

            auto written = records_.writeDataRecord(ledger, device_id, timestamp, record);
            if (written.is_err()) {
                return written;
            }

            std::cout << "Data record " << device_id << "@" << timestamp << " " << previous << " -> "
                      << record.getStatusString() << " by " << verifier_id << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        const DataRecordStore &records_;
    };

} // namespace devledger
