#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <tuple>

namespace devledger::storage {

    /// Storage configuration options
    struct OpenOptions {
        bool enable_wal = true;         // SQLite only
        dp::i32 busy_timeout_ms = 5000; // SQLite only
        dp::i32 cache_size_kb = 20000;  // SQLite only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        auto members() { return std::tie(enable_wal, busy_timeout_ms, cache_size_kb, sync_mode); }
        auto members() const { return std::tie(enable_wal, busy_timeout_ms, cache_size_kb, sync_mode); }
    };

    /// Parse "off" / "normal" / "full"
    inline bool parseSynchronous(const std::string &name, OpenOptions::Synchronous &out) {
        if (name == "off") {
            out = OpenOptions::Synchronous::OFF;
        } else if (name == "normal") {
            out = OpenOptions::Synchronous::NORMAL;
        } else if (name == "full") {
            out = OpenOptions::Synchronous::FULL;
        } else {
            return false;
        }
        return true;
    }

} // namespace devledger::storage
