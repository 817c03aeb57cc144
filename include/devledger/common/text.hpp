#pragma once

#include <devledger/common/error.hpp>

#include <datapod/datapod.hpp>
#include <string>

namespace devledger {

    /// Entity text fields are stored as NUL-terminated dp::String, so an embedded
    /// NUL would cut the value short. Such values are refused before any write.
    inline dp::Result<void, dp::Error> validateTextField(const std::string &field, const std::string &value) {
        if (value.find('\0') != std::string::npos) {
            return dp::Result<void, dp::Error>::err(invalid_field(field + " must not contain NUL characters"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace devledger
