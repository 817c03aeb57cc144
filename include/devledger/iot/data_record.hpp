#pragma once

#include <devledger/common/error.hpp>
#include <devledger/common/json.hpp>

#include <datapod/datapod.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace devledger {

    /// Composite key category of data records
    inline constexpr const char *DATA_RECORD_CATEGORY = "DataRecord";

    /// Verification status of a data record
    enum class DataRecordStatus : dp::u8 {
        Pending = 0,
        Verified = 1,
        Rejected = 2,
    };

    /// Get string name for data record status
    inline std::string dataRecordStatusToString(DataRecordStatus status) {
        switch (status) {
        case DataRecordStatus::Pending:
            return "pending";
        case DataRecordStatus::Verified:
            return "verified";
        case DataRecordStatus::Rejected:
            return "rejected";
        default:
            return "unknown";
        }
    }

    /// Parse a data record status name
    inline dp::Result<DataRecordStatus, dp::Error> dataRecordStatusFromString(const std::string &name) {
        if (name == "pending")
            return dp::Result<DataRecordStatus, dp::Error>::ok(DataRecordStatus::Pending);
        if (name == "verified")
            return dp::Result<DataRecordStatus, dp::Error>::ok(DataRecordStatus::Verified);
        if (name == "rejected")
            return dp::Result<DataRecordStatus, dp::Error>::ok(DataRecordStatus::Rejected);
        return dp::Result<DataRecordStatus, dp::Error>::err(
            deserialization_failed("unknown data record status: " + name));
    }

    /// Data submitted by a device, addressed by (device_id, timestamp)
    struct DataRecord {
        dp::String device_id;
        dp::String timestamp; // caller supplied, opaque
        dp::String data;      // opaque payload
        dp::String status;    // DataRecordStatus name
        dp::String verifier_id;

        DataRecord() = default;

        DataRecord(const std::string &device, const std::string &ts, const std::string &payload,
                   DataRecordStatus record_status = DataRecordStatus::Pending, const std::string &verifier = "")
            : device_id(dp::String(device.c_str())), timestamp(dp::String(ts.c_str())),
              data(dp::String(payload.c_str())), status(dp::String(dataRecordStatusToString(record_status).c_str())),
              verifier_id(dp::String(verifier.c_str())) {}

        inline std::string getDeviceId() const { return std::string(device_id.c_str()); }
        inline std::string getTimestamp() const { return std::string(timestamp.c_str()); }
        inline std::string getData() const { return std::string(data.c_str()); }
        inline std::string getStatusString() const { return std::string(status.c_str()); }
        inline std::string getVerifierId() const { return std::string(verifier_id.c_str()); }

        inline DataRecordStatus getStatus() const {
            auto parsed = dataRecordStatusFromString(getStatusString());
            return parsed.is_ok() ? parsed.value() : DataRecordStatus::Pending;
        }

        inline void setStatus(DataRecordStatus new_status) {
            status = dp::String(dataRecordStatusToString(new_status).c_str());
        }

        inline void setVerifierId(const std::string &verifier) { verifier_id = dp::String(verifier.c_str()); }

        inline bool isPending() const { return getStatus() == DataRecordStatus::Pending; }

        /// Verified and rejected records have been through verification
        inline bool isTerminal() const { return !isPending(); }

        inline bool operator==(const DataRecord &other) const {
            return getDeviceId() == other.getDeviceId() && getTimestamp() == other.getTimestamp() &&
                   getData() == other.getData() && getStatusString() == other.getStatusString() &&
                   getVerifierId() == other.getVerifierId();
        }
        inline bool operator!=(const DataRecord &other) const { return !(*this == other); }

        /// Serialize to ledger payload bytes
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<DataRecord &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from ledger payload bytes
        inline static dp::Result<DataRecord, dp::Error> fromBytes(const std::vector<uint8_t> &bytes) {
            DataRecord record;
            try {
                dp::ByteBuf buf(bytes.begin(), bytes.end());
                record = dp::deserialize<dp::Mode::WITH_VERSION, DataRecord>(buf);
            } catch (const std::exception &e) {
                return dp::Result<DataRecord, dp::Error>::err(
                    deserialization_failed(std::string("data record: ") + e.what()));
            }

            auto status_check = dataRecordStatusFromString(record.getStatusString());
            if (status_check.is_err()) {
                return dp::Result<DataRecord, dp::Error>::err(status_check.error());
            }
            return dp::Result<DataRecord, dp::Error>::ok(std::move(record));
        }

        /// verifierID is omitted until the record has been verified
        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"deviceID\":" << jsonString(getDeviceId()) << ",\"timestamp\":" << jsonString(getTimestamp())
                << ",\"data\":" << jsonString(getData()) << ",\"status\":" << jsonString(getStatusString());
            if (!getVerifierId().empty()) {
                oss << ",\"verifierID\":" << jsonString(getVerifierId());
            }
            oss << "}";
            return oss.str();
        }

        /// Serialization
        auto members() { return std::tie(device_id, timestamp, data, status, verifier_id); }
        auto members() const { return std::tie(device_id, timestamp, data, status, verifier_id); }
    };

} // namespace devledger
