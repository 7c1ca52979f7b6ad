#include "entry.hh"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "errors.hh"

namespace {
const char GROUP_DELIMITER[] = "#<>#";
const char PHRASE_DELIMITER[] = "=<>";
const char TRANSLATION_DELIMITER[] = ":<>:";
}  // namespace

Entry Entry::deserialize(const std::string& serialized) {
    Entry entry;
    if (serialized.empty()) {
        return entry;
    }

    for (absl::string_view group :
         absl::StrSplit(serialized, GROUP_DELIMITER)) {
        std::vector<absl::string_view> parts =
            absl::StrSplit(group, PHRASE_DELIMITER);
        if (parts.size() != 2) {
            throw DecodeError(absl::StrCat("Invalid phrase group \"", group,
                                           "\", expected one \"",
                                           PHRASE_DELIMITER, "\""));
        }

        std::vector<std::string> translations =
            absl::StrSplit(parts[1], TRANSLATION_DELIMITER);
        entry.group_for(std::string(parts[0])) = std::move(translations);
    }

    return entry;
}

void Entry::add(const std::string& phrase, const std::string& translation) {
    group_for(std::string(absl::StripAsciiWhitespace(phrase)))
        .push_back(std::string(absl::StripAsciiWhitespace(translation)));
}

std::string Entry::serialize() const {
    return absl::StrJoin(
        groups_, GROUP_DELIMITER, [](std::string* out, const Group& group) {
            absl::StrAppend(out, group.first, PHRASE_DELIMITER,
                            absl::StrJoin(group.second, TRANSLATION_DELIMITER));
        });
}

std::string Entry::format(bool compact) const {
    return absl::StrJoin(
        groups_, "\n", [compact](std::string* out, const Group& group) {
            if (compact) {
                absl::StrAppend(out, "- ", group.first, ": ",
                                absl::StrJoin(group.second, " / "));
            } else {
                absl::StrAppend(out, group.first, ":\n    - ",
                                absl::StrJoin(group.second, "\n    - "));
            }
        });
}

const std::vector<Entry::Group>& Entry::groups() const { return groups_; }

const std::vector<std::string>* Entry::translations(
    const std::string& phrase) const {
    auto iter = index_.find(phrase);
    if (iter == std::end(index_)) {
        return nullptr;
    }
    return &groups_[iter->second].second;
}

size_t Entry::size() const { return groups_.size(); }

bool Entry::empty() const { return groups_.empty(); }

bool Entry::operator==(const Entry& other) const {
    return groups_ == other.groups_;
}

std::vector<std::string>& Entry::group_for(std::string phrase) {
    auto iter = index_.find(phrase);
    if (iter != std::end(index_)) {
        return groups_[iter->second].second;
    }
    index_.emplace(phrase, groups_.size());
    groups_.emplace_back(std::move(phrase), std::vector<std::string>());
    return groups_.back().second;
}
