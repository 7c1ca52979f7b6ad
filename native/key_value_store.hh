#pragma once

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "store_config.hh"

class MappedFile;

// A durable string to string mapping backed by a single file.
//
// The file is written once per session: values are concatenated, followed by
// a table of (value size, key size, key) records and a trailing uint64 with
// the offset of that table. Acquiring maps the file and reads only the table.
// Values stay in the mapping and are copied out and checked for valid UTF-8
// when they are read, so a single corrupt value only fails reads of its own
// key. The file is rewritten on the final release if anything was set.
//
// Opening is reference counted. Nested acquire() calls share the mapping and
// only the matching outermost release() flushes and closes it. There is no
// cross-process locking, so concurrent writers to the same file are
// unsupported.
class KeyValueStore {
   public:
    // importing: start from an empty mapping and create the root if needed.
    // Otherwise the root must already exist.
    KeyValueStore(const StoreConfig& config, const std::string& identity,
                  bool importing = false);

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    ~KeyValueStore();

    void acquire();

    // commit = false drops any pending writes once the last user is gone.
    void release(bool commit = true);

    bool is_open() const;

    std::string get(const std::string& key) const;
    std::string get(const std::string& key,
                    const std::string& default_value) const;
    boost::optional<std::string> find(const std::string& key) const;

    // Throws DecodeError if either argument is not valid UTF-8.
    void set(std::string key, std::string value);

    // Keys in unspecified order. Values are not touched.
    std::vector<std::string> keys() const;

    std::vector<std::pair<std::string, std::string>> items() const;

    // Number of stored keys, acquires the store itself
    size_t size();

    const boost::filesystem::path& path() const;

   private:
    void load();
    void flush();
    void close();
    void check_open() const;

    boost::filesystem::path path_;
    bool importing_;

    size_t num_users_;
    bool dirty_;
    bool discard_;

    std::unique_ptr<MappedFile> file_;
    absl::flat_hash_map<std::string, std::pair<const char*, size_t>> stored_;
    absl::flat_hash_map<std::string, std::string> pending_;
};

// Acquires a store for the lifetime of the guard. When the guard is destroyed
// by an exception, pending writes are discarded instead of flushed.
class StoreGuard {
   public:
    explicit StoreGuard(KeyValueStore& store);
    ~StoreGuard() noexcept(false);

    StoreGuard(const StoreGuard&) = delete;
    StoreGuard& operator=(const StoreGuard&) = delete;

    KeyValueStore* operator->() { return &store_; }
    KeyValueStore& operator*() { return store_; }

   private:
    KeyValueStore& store_;
    int exceptions_on_entry_;
};
