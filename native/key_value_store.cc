#include "key_value_store.hh"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "errors.hh"
#include "utf8.hh"

class MappedFile {
   public:
    MappedFile(const boost::filesystem::path& path, size_t length)
        : length_(length) {
        fd_ = open(path.c_str(), O_RDONLY);
        if (fd_ < 0) {
            throw std::runtime_error(absl::StrCat("Got error trying to open ",
                                                  path.string(), " ",
                                                  std::strerror(errno)));
        }

        data_ = static_cast<char*>(
            mmap(nullptr, length_, PROT_READ, MAP_SHARED, fd_, 0));
        if (data_ == static_cast<char*>(MAP_FAILED)) {
            data_ = nullptr;
            int saved_errno = errno;
            close(fd_);
            throw std::runtime_error(absl::StrCat("Got error trying to mmap ",
                                                  path.string(), " ",
                                                  std::strerror(saved_errno)));
        }
    }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    ~MappedFile() {
        if (data_ != nullptr) {
            munmap(data_, length_);
        }
        close(fd_);
    }

    const char* data() const { return data_; }

   private:
    int fd_;
    char* data_;
    size_t length_;
};

namespace {

template <typename T>
T read_value(const char* data) {
    T result;
    std::memcpy(&result, data, sizeof(T));
    return result;
}

void check_utf8(absl::string_view text, const boost::filesystem::path& path) {
    if (!is_valid_utf8(text)) {
        throw DecodeError(absl::StrCat("Data for ", path.string(),
                                       " is not valid UTF-8 near \"",
                                       text.substr(0, 40), "\""));
    }
}

std::string checked_string(const std::pair<const char*, size_t>& location,
                           const boost::filesystem::path& path) {
    std::string result(location.first, location.second);
    check_utf8(result, path);
    return result;
}

}  // namespace

KeyValueStore::KeyValueStore(const StoreConfig& config,
                             const std::string& identity, bool importing)
    : path_(config.store_path(identity)),
      importing_(importing),
      num_users_(0),
      dirty_(false),
      discard_(false) {
    if (!boost::filesystem::exists(config.root)) {
        if (!importing_) {
            throw StoreMissingError(absl::StrCat(
                "There is no \"", config.root.string(), "\" directory!\n",
                "You have to import a dict.cc database file first.\n",
                "See --help for information."));
        }
        boost::filesystem::create_directories(config.root);
    } else if (importing_ && boost::filesystem::exists(path_)) {
        std::cout << "Will overwrite \"" << path_.string() << "\""
                  << std::endl;
    }
}

KeyValueStore::~KeyValueStore() {}

void KeyValueStore::acquire() {
    if (num_users_ == 0) {
        load();
    }
    num_users_++;
}

void KeyValueStore::release(bool commit) {
    if (num_users_ == 0) {
        throw std::runtime_error(
            absl::StrCat("Released ", path_.string(), " more often than acquired"));
    }

    if (!commit) {
        discard_ = true;
    }

    num_users_--;
    if (num_users_ == 0) {
        bool should_flush = dirty_ && !discard_;
        dirty_ = false;
        discard_ = false;

        if (should_flush) {
            flush();
        }
        close();
    }
}

bool KeyValueStore::is_open() const { return num_users_ > 0; }

void KeyValueStore::check_open() const {
    if (num_users_ == 0) {
        throw std::runtime_error(
            absl::StrCat("Store ", path_.string(), " is not open"));
    }
}

std::string KeyValueStore::get(const std::string& key) const {
    boost::optional<std::string> value = find(key);
    if (!value) {
        throw NotFoundError(absl::StrCat("Could not find key \"", key,
                                         "\" in ", path_.string()));
    }
    return *value;
}

std::string KeyValueStore::get(const std::string& key,
                               const std::string& default_value) const {
    boost::optional<std::string> value = find(key);
    if (!value) {
        return default_value;
    }
    return *value;
}

boost::optional<std::string> KeyValueStore::find(const std::string& key) const {
    check_open();

    auto pending = pending_.find(key);
    if (pending != std::end(pending_)) {
        return pending->second;
    }

    auto stored = stored_.find(key);
    if (stored != std::end(stored_)) {
        return checked_string(stored->second, path_);
    }

    return boost::none;
}

void KeyValueStore::set(std::string key, std::string value) {
    check_open();
    check_utf8(key, path_);
    check_utf8(value, path_);
    pending_.insert_or_assign(std::move(key), std::move(value));
    dirty_ = true;
}

std::vector<std::string> KeyValueStore::keys() const {
    check_open();

    std::vector<std::string> result;
    result.reserve(pending_.size() + stored_.size());
    for (const auto& entry : pending_) {
        result.push_back(entry.first);
    }
    for (const auto& entry : stored_) {
        if (pending_.count(entry.first) == 0) {
            check_utf8(entry.first, path_);
            result.push_back(entry.first);
        }
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> KeyValueStore::items()
    const {
    std::vector<std::pair<std::string, std::string>> result;
    for (std::string& key : keys()) {
        std::string value = get(key);
        result.emplace_back(std::move(key), std::move(value));
    }
    return result;
}

size_t KeyValueStore::size() {
    StoreGuard guard(*this);
    return keys().size();
}

const boost::filesystem::path& KeyValueStore::path() const { return path_; }

void KeyValueStore::close() {
    pending_.clear();
    stored_.clear();
    file_.reset();
}

void KeyValueStore::load() {
    close();

    if (importing_) {
        return;
    }

    if (!boost::filesystem::exists(path_)) {
        std::cout << "Path \"" << path_.string()
                  << "\" does not exist, treating it as empty." << std::endl;
        return;
    }

    uintmax_t length = boost::filesystem::file_size(path_);
    if (length == 0) {
        return;
    }
    if (length < sizeof(uint64_t)) {
        throw DecodeError(
            absl::StrCat(path_.string(), " is too short to be a store"));
    }

    auto file = std::make_unique<MappedFile>(path_, length);
    const char* mmap_data = file->data();

    uint64_t table_end = length - sizeof(uint64_t);
    uint64_t table_offset = read_value<uint64_t>(mmap_data + table_end);
    if (table_offset > table_end) {
        throw DecodeError(absl::StrCat("Invalid table offset ", table_offset,
                                       " in ", path_.string()));
    }

    absl::flat_hash_map<std::string, std::pair<const char*, size_t>> stored;

    uint64_t current_offset = 0;
    uint64_t current_location = table_offset;

    while (current_location < table_end) {
        if (table_end - current_location < 2 * sizeof(int32_t)) {
            throw DecodeError(
                absl::StrCat("Truncated table record in ", path_.string()));
        }
        int32_t value_size = read_value<int32_t>(mmap_data + current_location);
        current_location += sizeof(int32_t);
        int32_t key_size = read_value<int32_t>(mmap_data + current_location);
        current_location += sizeof(int32_t);

        if (value_size < 0 || key_size < 0 ||
            current_offset + value_size > table_offset ||
            current_location + key_size > table_end) {
            throw DecodeError(
                absl::StrCat("Corrupt table record in ", path_.string()));
        }

        std::string key(mmap_data + current_location, key_size);
        current_location += key_size;

        stored.insert_or_assign(
            std::move(key),
            std::make_pair(mmap_data + current_offset,
                           static_cast<size_t>(value_size)));
        current_offset += value_size;
    }

    stored_ = std::move(stored);
    file_ = std::move(file);
}

void KeyValueStore::flush() {
    boost::filesystem::path temp_path = path_;
    temp_path += ".tmp";

    std::vector<std::pair<const std::string*, absl::string_view>> entries;
    entries.reserve(pending_.size() + stored_.size());
    for (const auto& entry : pending_) {
        entries.emplace_back(&entry.first, entry.second);
    }
    for (const auto& entry : stored_) {
        if (pending_.count(entry.first) == 0) {
            entries.emplace_back(
                &entry.first,
                absl::string_view(entry.second.first, entry.second.second));
        }
    }

    {
        std::ofstream writer(temp_path.string(),
                             std::ios_base::out | std::ios_base::binary |
                                 std::ios_base::trunc);
        if (!writer) {
            throw std::runtime_error(absl::StrCat("Could not open ",
                                                  temp_path.string(),
                                                  " for writing"));
        }

        for (const auto& entry : entries) {
            if (entry.first->size() >
                    static_cast<size_t>(std::numeric_limits<int32_t>::max()) ||
                entry.second.size() >
                    static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
                throw std::runtime_error(absl::StrCat(
                    "Cannot store keys or values larger than int32_t::max in ",
                    path_.string()));
            }
            writer.write(entry.second.data(), entry.second.size());
        }

        uint64_t table_offset = writer.tellp();

        for (const auto& entry : entries) {
            int32_t value_size = entry.second.size();
            int32_t key_size = entry.first->size();
            writer.write(reinterpret_cast<const char*>(&value_size),
                         sizeof(value_size));
            writer.write(reinterpret_cast<const char*>(&key_size),
                         sizeof(key_size));
            writer.write(entry.first->data(), entry.first->size());
        }

        writer.write(reinterpret_cast<const char*>(&table_offset),
                     sizeof(table_offset));

        writer.close();
        if (!writer) {
            throw std::runtime_error(
                absl::StrCat("Got error trying to write ", temp_path.string()));
        }
    }

    boost::filesystem::rename(temp_path, path_);
}

StoreGuard::StoreGuard(KeyValueStore& store)
    : store_(store), exceptions_on_entry_(std::uncaught_exceptions()) {
    store_.acquire();
}

StoreGuard::~StoreGuard() noexcept(false) {
    bool unwinding = std::uncaught_exceptions() > exceptions_on_entry_;
    if (unwinding) {
        // Never throw while another exception is in flight.
        store_.release(false);
    } else {
        store_.release(true);
    }
}
