#include "importer.hh"

#include <boost/regex.hpp>
#include <fstream>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "errors.hh"
#include "extract_key.hh"
#include "key_value_store.hh"
#include "utf8.hh"

namespace {

const char UTF8_BOM[] = "\xEF\xBB\xBF";

bool is_blank(const std::string& line) {
    return absl::StripAsciiWhitespace(line).empty();
}

}  // namespace

void HeadwordIndex::add(const std::string& phrase,
                        const std::string& translation) {
    std::string key = extract_key(phrase);
    if (key.empty() || key == LANG_DIR_KEY) {
        return;
    }
    entries[key].add(phrase, translation);
}

ParsedDump parse_dictcc(std::istream& input) {
    static const boost::regex header_regex(
        "# ([A-Z]{2})-([A-Z]{2}) vocabulary database");

    ParsedDump result;
    bool seen_header = false;
    size_t line_number = 0;
    std::string line;

    while (std::getline(input, line)) {
        line_number++;

        if (line_number == 1 && line.compare(0, 3, UTF8_BOM) == 0) {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!is_valid_utf8(line)) {
            throw DecodeError(
                absl::StrCat("Line ", line_number, " is not valid UTF-8"));
        }

        if (!seen_header) {
            if (is_blank(line)) {
                continue;
            }
            boost::smatch match;
            if (!boost::regex_search(line, match, header_regex,
                                     boost::match_continuous)) {
                throw FormatError(absl::StrCat(
                    "Input is not a dict.cc database, expected a \"# XX-YY "
                    "vocabulary database\" header but got \"",
                    line.substr(0, 80), "\""));
            }
            result.forward.lang_dir = absl::StrCat(match[1].str(), " => ",
                                                   match[2].str());
            result.reverse.lang_dir = absl::StrCat(match[2].str(), " => ",
                                                   match[1].str());
            seen_header = true;
            continue;
        }

        if (is_blank(line) || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields = absl::StrSplit(line, '\t');
        if (fields.size() != 3) {
            throw MalformedLineError(
                absl::StrCat("Line ", line_number, " has ", fields.size(),
                             " tab separated fields, expected 3"),
                line_number);
        }

        const std::string& phrase = fields[0];
        const std::string& translation = fields[1];

        result.forward.add(phrase, translation);
        result.reverse.add(translation, phrase);
        result.num_records++;
    }

    if (input.bad()) {
        throw std::runtime_error(
            absl::StrCat("Got error reading input after line ", line_number));
    }

    if (!seen_header) {
        throw FormatError(
            "Input is not a dict.cc database, it has no \"# XX-YY vocabulary "
            "database\" header");
    }

    return result;
}

Importer::Importer(const StoreConfig& config) : config_(config) {
    if (config_.directions.size() != 2) {
        throw std::runtime_error(
            absl::StrCat("Importing needs exactly two directions, got ",
                         config_.directions.size()));
    }
}

ImportCounts Importer::import_file(const boost::filesystem::path& path) {
    if (!boost::filesystem::is_regular_file(path)) {
        throw std::runtime_error(
            absl::StrCat(path.string(), " is not a regular file"));
    }

    std::ifstream input(path.string(), std::ios_base::in | std::ios_base::binary);
    if (!input) {
        throw std::runtime_error(
            absl::StrCat("Could not open ", path.string()));
    }

    return import_stream(input);
}

ImportCounts Importer::import_stream(std::istream& input) {
    ParsedDump dump = parse_dictcc(input);

    ImportCounts counts;
    counts.a = write_store(config_.directions[0], dump.forward);
    counts.b = write_store(config_.directions[1], dump.reverse);
    return counts;
}

size_t Importer::write_store(const Direction& direction,
                             const HeadwordIndex& index) {
    KeyValueStore store(config_, direction.identity, true);
    StoreGuard guard(store);

    // The header is a plain label, not a serialized Entry
    guard->set(LANG_DIR_KEY, index.lang_dir);
    for (const auto& entry : index.entries) {
        guard->set(entry.first, entry.second.serialize());
    }

    // Matches the number of keys in the store, the header included
    return index.entries.size() + 1;
}
