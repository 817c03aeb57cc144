#pragma once

#include <devledger/common/error.hpp>
#include <devledger/common/json.hpp>

#include <datapod/datapod.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace devledger {

    /// Device lifecycle status
    enum class DeviceStatus : dp::u8 {
        Active = 0,
        Inactive = 1,
    };

    /// Get string name for device status
    inline std::string deviceStatusToString(DeviceStatus status) {
        switch (status) {
        case DeviceStatus::Active:
            return "active";
        case DeviceStatus::Inactive:
            return "inactive";
        default:
            return "unknown";
        }
    }

    /// Parse a device status name
    inline dp::Result<DeviceStatus, dp::Error> deviceStatusFromString(const std::string &name) {
        if (name == "active")
            return dp::Result<DeviceStatus, dp::Error>::ok(DeviceStatus::Active);
        if (name == "inactive")
            return dp::Result<DeviceStatus, dp::Error>::ok(DeviceStatus::Inactive);
        return dp::Result<DeviceStatus, dp::Error>::err(deserialization_failed("unknown device status: " + name));
    }

    /// An IoT device as stored in the world state under its id
    struct Device {
        dp::String id;
        dp::String owner;
        dp::String location;
        dp::String status; // DeviceStatus name

        Device() = default;

        Device(const std::string &device_id, const std::string &owner_id, const std::string &location_desc,
               DeviceStatus device_status = DeviceStatus::Active)
            : id(dp::String(device_id.c_str())), owner(dp::String(owner_id.c_str())),
              location(dp::String(location_desc.c_str())),
              status(dp::String(deviceStatusToString(device_status).c_str())) {}

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getOwner() const { return std::string(owner.c_str()); }
        inline std::string getLocation() const { return std::string(location.c_str()); }
        inline std::string getStatusString() const { return std::string(status.c_str()); }

        /// Status as enum; the stored name is validated on deserialization
        inline DeviceStatus getStatus() const {
            auto parsed = deviceStatusFromString(getStatusString());
            return parsed.is_ok() ? parsed.value() : DeviceStatus::Inactive;
        }

        inline bool isActive() const { return getStatus() == DeviceStatus::Active; }

        inline bool operator==(const Device &other) const {
            return getId() == other.getId() && getOwner() == other.getOwner() &&
                   getLocation() == other.getLocation() && getStatusString() == other.getStatusString();
        }
        inline bool operator!=(const Device &other) const { return !(*this == other); }

        /// Serialize to ledger payload bytes
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<Device &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from ledger payload bytes
        inline static dp::Result<Device, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            Device device;
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                device = dp::deserialize<dp::Mode::WITH_VERSION, Device>(buf);
            } catch (const std::exception &e) {
                return dp::Result<Device, dp::Error>::err(deserialization_failed(std::string("device: ") + e.what()));
            }

            auto status_check = deviceStatusFromString(device.getStatusString());
            if (status_check.is_err()) {
                return dp::Result<Device, dp::Error>::err(status_check.error());
            }
            return dp::Result<Device, dp::Error>::ok(std::move(device));
        }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"id\":" << jsonString(getId()) << ",\"owner\":" << jsonString(getOwner())
                << ",\"location\":" << jsonString(getLocation()) << ",\"status\":" << jsonString(getStatusString())
                << "}";
            return oss.str();
        }

        /// Serialization
        auto members() { return std::tie(id, owner, location, status); }
        auto members() const { return std::tie(id, owner, location, status); }
    };

} // namespace devledger
