#pragma once

#include "device.hpp"
#include <devledger/common/error.hpp>
#include <devledger/common/text.hpp>
#include <devledger/ledger/key_value_ledger.hpp>

#include <iostream>
#include <string>

namespace devledger {

    /// Registers devices in the world state, keyed directly by device id.
    /// Holds no state of its own: every call works against the ledger it is given.
    class DeviceRegistry {
      public:
        DeviceRegistry() = default;

        /// Register a new device with status active.
        /// Fails with ERR_ALREADY_EXISTS if the id already maps to a value.
        inline dp::Result<void, dp::Error> registerDevice(ledger::KeyValueLedger &ledger, const std::string &device_id,
                                                          const std::string &owner,
                                                          const std::string &location) const {
            auto valid = validateDeviceId(device_id);
            if (valid.is_err()) {
                return valid;
            }
            auto owner_text = validateTextField("owner", owner);
            if (owner_text.is_err()) {
                return owner_text;
            }
            auto location_text = validateTextField("location", location);
            if (location_text.is_err()) {
                return location_text;
            }

            auto exists = deviceExists(ledger, device_id);
            if (exists.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    withContext(exists.error(), "failed to check device existence"));
            }
            if (exists.value()) {
                std::cout << "Device " << device_id << " already registered" << std::endl;
                return dp::Result<void, dp::Error>::err(already_exists("device " + device_id + " already registered"));
            }

            Device device(device_id, owner, location, DeviceStatus::Active);
            auto put = ledger.putState(device_id, device.toBytes());
            if (put.is_err()) {
                return put;
            }

            std::cout << "Device " << device_id << " registered by " << owner << " at " << location << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }

        /// True if a non-empty value is stored under the device id.
        /// Absence is a normal false result; only a failed read is an error.
        inline dp::Result<bool, dp::Error> deviceExists(ledger::KeyValueLedger &ledger,
                                                        const std::string &device_id) const {
            auto state = ledger.getState(device_id);
            if (state.is_err()) {
                return dp::Result<bool, dp::Error>::err(
                    withContext(state.error(), "failed to read device " + device_id + " from world state"));
            }
            const auto &value = state.value();
            return dp::Result<bool, dp::Error>::ok(value.has_value() && !value->empty());
        }

        /// Load and decode a device
        inline dp::Result<Device, dp::Error> getDevice(ledger::KeyValueLedger &ledger,
                                                       const std::string &device_id) const {
            auto state = ledger.getState(device_id);
            if (state.is_err()) {
                return dp::Result<Device, dp::Error>::err(
                    withContext(state.error(), "failed to read device " + device_id));
            }
            const auto &value = state.value();
            if (!value.has_value() || value->empty()) {
                return dp::Result<Device, dp::Error>::err(not_found("device " + device_id + " does not exist"));
            }

            auto device = Device::fromBytes(*value);
            if (device.is_err()) {
                return dp::Result<Device, dp::Error>::err(withContext(device.error(), "device " + device_id));
            }
            return device;
        }

        /// Device ids are used verbatim as keys and as composite key attributes
        inline static dp::Result<void, dp::Error> validateDeviceId(const std::string &device_id) {
            if (device_id.empty()) {
                return dp::Result<void, dp::Error>::err(invalid_key("device id must not be empty"));
            }
            auto valid = ledger::composite::validateAttribute(device_id);
            if (valid.is_err()) {
                return dp::Result<void, dp::Error>::err(withContext(valid.error(), "device id"));
            }
            return dp::Result<void, dp::Error>::ok();
        }
    };

} // namespace devledger
