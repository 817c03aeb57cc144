#pragma once

#include "key_value_ledger.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>

namespace devledger::ledger {

    /// In-memory world state. Nothing survives the process.
    class MemoryLedger : public KeyValueLedger {
      public:
        MemoryLedger() = default;

        inline dp::Result<std::optional<Bytes>, dp::Error> getState(const std::string &key) override {
            std::shared_lock lock(mutex_);
            auto it = state_.find(key);
            if (it == state_.end()) {
                return dp::Result<std::optional<Bytes>, dp::Error>::ok(std::nullopt);
            }
            return dp::Result<std::optional<Bytes>, dp::Error>::ok(it->second);
        }

        inline dp::Result<void, dp::Error> putState(const std::string &key, const Bytes &value) override {
            auto valid = validateKey(key);
            if (valid.is_err()) {
                return valid;
            }

            std::unique_lock lock(mutex_);
            state_[key] = value;
            ++writes_;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<std::vector<StateEntry>, dp::Error> getStateByRange(const std::string &start_key,
                                                                               const std::string &end_key) override {
            std::shared_lock lock(mutex_);
            std::vector<StateEntry> entries;
            auto it = state_.lower_bound(start_key);
            auto end = end_key.empty() ? state_.end() : state_.lower_bound(end_key);
            for (; it != end; ++it) {
                entries.push_back(StateEntry{it->first, it->second});
            }
            return dp::Result<std::vector<StateEntry>, dp::Error>::ok(std::move(entries));
        }

        /// Number of keys currently holding a value
        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return state_.size();
        }

        /// Number of successful putState calls
        inline size_t writeCount() const {
            std::shared_lock lock(mutex_);
            return writes_;
        }

        /// Clear the state (for testing)
        inline void clear() {
            std::unique_lock lock(mutex_);
            state_.clear();
            writes_ = 0;
        }

      private:
        std::map<std::string, Bytes> state_;
        size_t writes_ = 0;
        mutable std::shared_mutex mutex_;
    };

} // namespace devledger::ledger
