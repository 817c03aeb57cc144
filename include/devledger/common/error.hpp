#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace devledger {

    // ===========================================
    // devledger-specific error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_ALREADY_EXISTS = 200;
    constexpr dp::u32 ERR_NOT_FOUND = 201;
    constexpr dp::u32 ERR_DEVICE_NOT_REGISTERED = 202;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 203;
    constexpr dp::u32 ERR_LEDGER_IO = 204;
    constexpr dp::u32 ERR_INVALID_KEY = 205;
    constexpr dp::u32 ERR_INVALID_FIELD = 206;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error already_exists(const std::string &msg = "Entity already exists") {
        return dp::Error{ERR_ALREADY_EXISTS, dp::String(msg.c_str())};
    }

    inline dp::Error not_found(const std::string &msg = "Entity not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error device_not_registered(const std::string &msg = "Device not registered") {
        return dp::Error{ERR_DEVICE_NOT_REGISTERED, dp::String(msg.c_str())};
    }

    inline dp::Error deserialization_failed(const std::string &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error ledger_io(const std::string &msg = "Ledger I/O failed") {
        return dp::Error{ERR_LEDGER_IO, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_key(const std::string &msg = "Invalid key") {
        return dp::Error{ERR_INVALID_KEY, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_field(const std::string &msg = "Invalid field") {
        return dp::Error{ERR_INVALID_FIELD, dp::String(msg.c_str())};
    }

    /// A backend used before open() or after close() fails like any other ledger I/O
    inline dp::Error store_not_open(const std::string &msg = "store not open") { return ledger_io(msg); }

    /// Message of an error as std::string
    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

    /// Prefix an error message with context, keeping its code
    inline dp::Error withContext(const dp::Error &error, const std::string &context) {
        return dp::Error{error.code, dp::String((context + ": " + errorMessage(error)).c_str())};
    }

} // namespace devledger
