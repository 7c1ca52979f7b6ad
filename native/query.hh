#pragma once

#include <boost/optional.hpp>
#include <boost/regex/icu.hpp>
#include <string>
#include <vector>

#include "entry.hh"
#include "key_value_store.hh"
#include "store_config.hh"

enum class QueryMode {
    SIMPLE,    // exact headword lookup, O(1)
    REGEX,     // ":r:", pattern anchored at the start of each key, O(n)
    FULLTEXT,  // ":f:", case insensitive search in each value, O(n)
};

struct CompiledQuery {
    QueryMode mode;

    // Prefix removed and lowercased
    std::string text;

    // Empty for SIMPLE queries. Matches code points, not bytes.
    boost::u32regex regex;
};

// Throws PatternError when a REGEX or FULLTEXT pattern does not compile.
CompiledQuery compile_query(const std::string& raw_query);

class QueryEngine {
   public:
    explicit QueryEngine(const StoreConfig& config);

    // Runs the query against every direction and returns the formatted
    // result, or "No results." when nothing matched anywhere. Directions
    // without results are left out entirely.
    //
    // A failing direction does not stop the others. Once all of them ran the
    // first error is rethrown if none succeeded, otherwise a QueryError
    // carrying the partial output is thrown.
    std::string execute(const std::string& raw_query, bool compact = false);

    // The language header is never part of the result.
    std::vector<Entry> lookup(KeyValueStore& store, const CompiledQuery& query);

    // Both count and read through a store of their own
    size_t size(const std::string& identity);
    boost::optional<std::string> header(const std::string& identity);

    const StoreConfig& config() const;

   private:
    std::string format_direction(const Direction& direction,
                                 const CompiledQuery& query, bool compact);

    StoreConfig config_;
};
