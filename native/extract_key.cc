#include "extract_key.hh"

#include <boost/regex.hpp>
#include <vector>

#include "absl/strings/str_split.h"
#include "utf8.hh"

namespace {
const boost::regex& bracket_regex() {
    static const boost::regex regex(R"((\([^(]*\)|\{[^{]*\}|\[[^\[]*\]))");
    return regex;
}
}  // namespace

std::string extract_key(const std::string& phrase) {
    std::string key =
        boost::regex_replace(to_lower(phrase), bracket_regex(), "");

    for (char& c : key) {
        if (c == '.' || c == ',' || c == '<' || c == '>') {
            c = ' ';
        }
    }

    std::vector<absl::string_view> tokens =
        absl::StrSplit(key, absl::ByAnyChar(" \t\n\v\f\r"), absl::SkipEmpty());

    absl::string_view longest;
    size_t longest_length = 0;
    for (absl::string_view token : tokens) {
        size_t length = code_point_length(token);
        if (length > longest_length) {
            longest = token;
            longest_length = length;
        }
    }

    return std::string(longest);
}
