#pragma once

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

// All phrases and their translations that share one headword.
//
// Stored as "phrase=<>t1:<>:t2#<>#phrase2=<>t3". None of the three delimiters
// is escaped, so phrases and translations must not contain them.
class Entry {
   public:
    using Group = std::pair<std::string, std::vector<std::string>>;

    static Entry deserialize(const std::string& serialized);

    // Both sides are stripped of surrounding whitespace.
    void add(const std::string& phrase, const std::string& translation);

    std::string serialize() const;
    std::string format(bool compact = false) const;

    // Groups in first-insertion order
    const std::vector<Group>& groups() const;
    const std::vector<std::string>* translations(const std::string& phrase) const;

    size_t size() const;
    bool empty() const;

    bool operator==(const Entry& other) const;

   private:
    std::vector<std::string>& group_for(std::string phrase);

    std::vector<Group> groups_;
    absl::flat_hash_map<std::string, size_t> index_;
};
