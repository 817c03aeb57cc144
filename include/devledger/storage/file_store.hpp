#pragma once

#include "open_options.hpp"
#include <devledger/common/error.hpp>
#include <devledger/ledger/key_value_ledger.hpp>

#include <datapod/datapod.hpp>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <keylock/keylock.hpp>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unistd.h>

namespace devledger::storage {

    using namespace datapod;
    using ledger::Bytes;
    using ledger::StateEntry;

    // ===========================================
    // Utility functions
    // ===========================================

    inline i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline Vector<u8> computeSHA256(const Vector<u8> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(data.begin(), data.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return Vector<u8>{};
        }
        return Vector<u8>(result.data.begin(), result.data.end());
    }

    // ===========================================
    // On-disk record
    // ===========================================

    /// One world-state write. The log keeps every write; the latest one per key wins.
    struct StateRecord {
        Vector<u8> key; // raw bytes, composite keys embed 0x00
        Vector<u8> value;
        Vector<u8> checksum; // SHA256(key || value)
        i64 written_at = 0;

        auto members() { return std::tie(key, value, checksum, written_at); }
        auto members() const { return std::tie(key, value, checksum, written_at); }

        inline std::string keyString() const { return std::string(key.begin(), key.end()); }

        inline static Vector<u8> digest(const Vector<u8> &key, const Vector<u8> &value) {
            Vector<u8> input(key.begin(), key.end());
            for (auto b : value) {
                input.push_back(b);
            }
            return computeSHA256(input);
        }

        inline bool checksumMatches() const {
            auto expected = digest(key, value);
            if (expected.size() != checksum.size() || expected.empty())
                return false;
            for (usize i = 0; i < expected.size(); ++i) {
                if (expected[i] != checksum[i])
                    return false;
            }
            return true;
        }
    };

    // ===========================================
    // FileStore - append-only world state on disk
    // ===========================================

    class FileStore : public ledger::KeyValueLedger {
      public:
        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() override { close(); }

        // Non-copyable, non-movable (the mutex pins it)
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{}) {
            std::unique_lock lock(mutex_);
            try {
                base_path_ = path;
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                if (!std::filesystem::exists(logPath())) {
                    std::ofstream(logPath(), std::ios::binary).close();
                }
                loadIndex();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(ledger_io("cannot open " + path + ": " + e.what()));
            }
        }

        /// Close storage
        inline void close() {
            std::unique_lock lock(mutex_);
            is_open_ = false;
            index_.clear();
        }

        /// Check if storage is open
        inline bool isOpen() const {
            std::shared_lock lock(mutex_);
            return is_open_;
        }

        // ===========================================
        // KeyValueLedger
        // ===========================================

        inline Result<std::optional<Bytes>, Error> getState(const std::string &key) override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<std::optional<Bytes>, Error>::err(store_not_open());

            auto it = index_.find(key);
            if (it == index_.end())
                return Result<std::optional<Bytes>, Error>::ok(std::nullopt);

            auto record = readVerifiedAt(it->second);
            if (record.is_err())
                return Result<std::optional<Bytes>, Error>::err(record.error());

            const auto &value = record.value().value;
            return Result<std::optional<Bytes>, Error>::ok(Bytes(value.begin(), value.end()));
        }

        inline Result<void, Error> putState(const std::string &key, const Bytes &value) override {
            auto valid = ledger::validateKey(key);
            if (valid.is_err())
                return valid;

            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());

            StateRecord record;
            record.key = Vector<u8>(key.begin(), key.end());
            record.value = Vector<u8>(value.begin(), value.end());
            record.checksum = StateRecord::digest(record.key, record.value);
            record.written_at = currentTimestamp();
            if (record.checksum.empty())
                return Result<void, Error>::err(ledger_io("checksum computation failed"));

            try {
                u64 offset = 0;
                appendRecord(logPath(), record, offset);
                index_[key] = offset;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(ledger_io(std::string("write failed: ") + e.what()));
            }
        }

        inline Result<std::vector<StateEntry>, Error> getStateByRange(const std::string &start_key,
                                                                      const std::string &end_key) override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<std::vector<StateEntry>, Error>::err(store_not_open());

            std::vector<StateEntry> entries;
            auto it = index_.lower_bound(start_key);
            auto end = end_key.empty() ? index_.end() : index_.lower_bound(end_key);
            for (; it != end; ++it) {
                auto record = readVerifiedAt(it->second);
                if (record.is_err())
                    return Result<std::vector<StateEntry>, Error>::err(record.error());
                const auto &value = record.value().value;
                entries.push_back(StateEntry{it->first, Bytes(value.begin(), value.end())});
            }
            return Result<std::vector<StateEntry>, Error>::ok(std::move(entries));
        }

        // ===========================================
        // Maintenance
        // ===========================================

        /// Rewrite the log keeping only the latest record of each key
        inline Result<void, Error> compact() {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());

            try {
                auto tmp_path = base_path_ / "state.dat.compact";
                std::filesystem::remove(tmp_path);

                std::map<std::string, u64> new_index;
                for (const auto &[key, offset] : index_) {
                    auto record = readRecordAt<StateRecord>(logPath(), offset);
                    if (!record.has_value())
                        return Result<void, Error>::err(ledger_io("unreadable record during compaction"));
                    u64 new_offset = 0;
                    appendRecord(tmp_path, *record, new_offset);
                    new_index[key] = new_offset;
                }
                if (!std::filesystem::exists(tmp_path)) {
                    std::ofstream(tmp_path, std::ios::binary).close();
                }

                std::filesystem::rename(tmp_path, logPath());
                index_ = std::move(new_index);
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(ledger_io(std::string("compaction failed: ") + e.what()));
            }
        }

        /// Verify every live record against its checksum
        inline Result<bool, Error> quickCheck() {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<bool, Error>::err(store_not_open());

            for (const auto &[key, offset] : index_) {
                if (readVerifiedAt(offset).is_err())
                    return Result<bool, Error>::ok(false);
            }
            return Result<bool, Error>::ok(true);
        }

        // ===========================================
        // Statistics
        // ===========================================

        inline i64 getKeyCount() const {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return 0;
            return static_cast<i64>(index_.size());
        }

        inline i64 getLogSize() const {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return 0;
            std::error_code ec;
            auto size = std::filesystem::file_size(logPath(), ec);
            return ec ? 0 : static_cast<i64>(size);
        }

      private:
        inline std::filesystem::path logPath() const { return base_path_ / "state.dat"; }

        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        template <typename T>
        inline void appendRecord(const std::filesystem::path &file, const T &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open file for writing");

            out.seekp(0, std::ios::end);
            offset = out.tellp();

            // Serialize using datapod (need mutable copy)
            T mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
            out.flush();
            if (!out) {
                out.close();
                rollbackTo(file, offset);
                throw std::runtime_error("Failed to append record");
            }
            out.close();

            if (sync_mode_ == OpenOptions::Synchronous::FULL && !syncFile(file)) {
                rollbackTo(file, offset);
                throw std::runtime_error("Failed to sync appended record");
            }
        }

        /// Cut a partially written record off the end of the log
        inline void rollbackTo(const std::filesystem::path &file, u64 offset) {
            std::error_code ec;
            auto size = std::filesystem::file_size(file, ec);
            if (ec || size <= offset)
                return;
            std::filesystem::resize_file(file, offset, ec);
            if (ec)
                throw std::runtime_error("Failed to append record and to roll back: " + ec.message());
        }

        inline bool syncFile(const std::filesystem::path &file) {
            int fd = ::open(file.c_str(), O_WRONLY);
            if (fd < 0)
                return false;
            int rc = ::fsync(fd);
            ::close(fd);
            return rc == 0;
        }

        template <typename T> inline Optional<T> readRecordAt(const std::filesystem::path &file, u64 offset) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Optional<T>();

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<T>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<T>();

            try {
                return Optional<T>(datapod::deserialize<Mode::NONE, T>(data));
            } catch (const std::exception &) {
                return Optional<T>();
            }
        }

        inline Result<StateRecord, Error> readVerifiedAt(u64 offset) {
            auto record = readRecordAt<StateRecord>(logPath(), offset);
            if (!record.has_value())
                return Result<StateRecord, Error>::err(ledger_io("unreadable record at offset " + std::to_string(offset)));
            if (!record->checksumMatches())
                return Result<StateRecord, Error>::err(
                    ledger_io("checksum mismatch at offset " + std::to_string(offset)));
            return Result<StateRecord, Error>::ok(std::move(*record));
        }

        // ===========================================
        // Index management
        // ===========================================

        inline void loadIndex() {
            index_.clear();

            u64 valid_end = 0;
            bool torn = false;
            {
                std::ifstream in(logPath(), std::ios::binary);
                if (!in)
                    return;

                while (in) {
                    u64 record_offset = in.tellg();

                    u32 len;
                    in.read(reinterpret_cast<char *>(&len), sizeof(len));
                    if (!in) {
                        torn = in.gcount() > 0;
                        break;
                    }

                    ByteBuf data(len);
                    in.read(reinterpret_cast<char *>(data.data()), len);
                    if (!in) {
                        torn = true;
                        break;
                    }

                    auto record = datapod::deserialize<Mode::NONE, StateRecord>(data);
                    index_[record.keyString()] = record_offset;
                    valid_end = record_offset + sizeof(len) + len;
                }
            }

            // Drop the tail of an interrupted append so later appends stay reachable
            if (torn) {
                std::filesystem::resize_file(logPath(), valid_end);
            }
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        // key -> offset of its latest record
        std::map<std::string, u64> index_;

        mutable std::shared_mutex mutex_;
    };

} // namespace devledger::storage
