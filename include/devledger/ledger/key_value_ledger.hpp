#pragma once

#include "composite_key.hpp"
#include <devledger/common/error.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace devledger::ledger {

    using Bytes = std::vector<uint8_t>;

    /// One key/value pair returned by a range scan
    struct StateEntry {
        std::string key;
        Bytes value;
    };

    /// Keys handed to putState must not be empty
    inline dp::Result<void, dp::Error> validateKey(const std::string &key) {
        if (key.empty()) {
            return dp::Result<void, dp::Error>::err(invalid_key("key must not be an empty string"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    /// World state the IoT components read and write.
    /// Implementations must report an I/O failure as an error, never as an absent value.
    class KeyValueLedger {
      public:
        virtual ~KeyValueLedger() = default;

        /// Most recently written payload for `key`, or std::nullopt if never written
        virtual dp::Result<std::optional<Bytes>, dp::Error> getState(const std::string &key) = 0;

        /// Associate `key` with `value`, replacing any prior value
        virtual dp::Result<void, dp::Error> putState(const std::string &key, const Bytes &value) = 0;

        /// All entries with start_key <= key < end_key, in byte order of the key.
        /// An empty end_key leaves the range open above.
        virtual dp::Result<std::vector<StateEntry>, dp::Error> getStateByRange(const std::string &start_key,
                                                                                const std::string &end_key) = 0;

        // === Composite keys ===

        inline dp::Result<std::string, dp::Error> createCompositeKey(const std::string &category,
                                                                     const std::vector<std::string> &attributes) const {
            return composite::create(category, attributes);
        }

        inline dp::Result<std::pair<std::string, std::vector<std::string>>, dp::Error>
        splitCompositeKey(const std::string &key) const {
            return composite::split(key);
        }

        /// Entries whose composite key starts with (category, attributes)
        inline dp::Result<std::vector<StateEntry>, dp::Error>
        getStateByPartialCompositeKey(const std::string &category, const std::vector<std::string> &attributes) {
            auto partial = composite::createPartial(category, attributes);
            if (partial.is_err()) {
                return dp::Result<std::vector<StateEntry>, dp::Error>::err(partial.error());
            }
            return getStateByRange(partial.value(), composite::rangeEnd(partial.value()));
        }
    };

} // namespace devledger::ledger
