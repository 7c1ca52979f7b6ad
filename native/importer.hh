#pragma once

#include <boost/filesystem.hpp>
#include <istream>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "entry.hh"
#include "store_config.hh"

struct ImportCounts {
    // Distinct keys written per direction, the language header included
    size_t a;
    size_t b;
};

// One direction of a parsed dump, headword -> Entry
struct HeadwordIndex {
    std::string lang_dir;
    absl::flat_hash_map<std::string, Entry> entries;

    void add(const std::string& phrase, const std::string& translation);
};

struct ParsedDump {
    HeadwordIndex forward;
    HeadwordIndex reverse;
    size_t num_records = 0;
};

// Parses a dict.cc vocabulary dump. The whole input is consumed before
// anything is returned, so errors never leave a half built result behind.
//
// Throws FormatError when the "# XX-YY vocabulary database" header is missing,
// MalformedLineError for body lines without exactly three tab separated fields
// and DecodeError for lines that are not valid UTF-8.
ParsedDump parse_dictcc(std::istream& input);

class Importer {
   public:
    explicit Importer(const StoreConfig& config);

    ImportCounts import_file(const boost::filesystem::path& path);
    ImportCounts import_stream(std::istream& input);

   private:
    size_t write_store(const Direction& direction, const HeadwordIndex& index);

    StoreConfig config_;
};
