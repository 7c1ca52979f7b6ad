#include "query.hh"

#include <exception>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "errors.hh"
#include "utf8.hh"

namespace {

const char NO_RESULTS[] = "No results.";

boost::optional<std::string> read_header(KeyValueStore& store) {
    StoreGuard guard(store);
    return guard->find(LANG_DIR_KEY);
}

std::string section_header(const std::string& label) {
    std::string rule(15, '=');
    return absl::StrCat(rule, " [ ", label, " ] ", rule);
}

}  // namespace

CompiledQuery compile_query(const std::string& raw_query) {
    CompiledQuery query;
    std::string prefix = raw_query.substr(0, 3);

    if (prefix == ":r:") {
        query.mode = QueryMode::REGEX;
    } else if (prefix == ":f:") {
        query.mode = QueryMode::FULLTEXT;
    } else {
        query.mode = QueryMode::SIMPLE;
    }

    if (query.mode == QueryMode::SIMPLE) {
        query.text = to_lower(raw_query);
    } else {
        query.text = to_lower(raw_query.substr(3));
    }

    try {
        switch (query.mode) {
            case QueryMode::SIMPLE:
                break;

            case QueryMode::REGEX:
                query.regex =
                    boost::make_u32regex(query.text, boost::regex::perl);
                break;

            case QueryMode::FULLTEXT:
                query.regex = boost::make_u32regex(
                    query.text, boost::regex::perl | boost::regex::icase);
                break;
        }
    } catch (const boost::regex_error& e) {
        throw PatternError(absl::StrCat("Invalid pattern \"", query.text,
                                        "\": ", e.what()));
    }

    return query;
}

QueryEngine::QueryEngine(const StoreConfig& config) : config_(config) {}

std::string QueryEngine::execute(const std::string& raw_query, bool compact) {
    CompiledQuery query = compile_query(raw_query);

    std::vector<std::string> sections;
    std::vector<std::exception_ptr> errors;
    std::vector<std::string> messages;

    for (const Direction& direction : config_.directions) {
        try {
            std::string section = format_direction(direction, query, compact);
            if (!section.empty()) {
                sections.push_back(std::move(section));
            }
        } catch (const std::exception& e) {
            errors.push_back(std::current_exception());
            messages.push_back(absl::StrCat(direction.identity, ": ", e.what()));
        }
    }

    std::string output =
        sections.empty() ? NO_RESULTS : absl::StrJoin(sections, "\n");

    if (!errors.empty()) {
        if (errors.size() == config_.directions.size()) {
            std::rethrow_exception(errors.front());
        }
        throw QueryError(absl::StrCat("Query failed for some directions\n",
                                      absl::StrJoin(messages, "\n")),
                         output);
    }

    return output;
}

std::string QueryEngine::format_direction(const Direction& direction,
                                          const CompiledQuery& query,
                                          bool compact) {
    KeyValueStore store(config_, direction.identity);
    StoreGuard guard(store);

    std::vector<std::string> formatted;
    for (const Entry& entry : lookup(store, query)) {
        std::string text = entry.format(compact);
        if (!text.empty()) {
            formatted.push_back(std::move(text));
        }
    }

    if (formatted.empty()) {
        return "";
    }

    boost::optional<std::string> label = read_header(store);
    return absl::StrCat(section_header(label ? *label : direction.default_label),
                        "\n", absl::StrJoin(formatted, "\n"));
}

std::vector<Entry> QueryEngine::lookup(KeyValueStore& store,
                                       const CompiledQuery& query) {
    StoreGuard guard(store);
    std::vector<Entry> result;

    switch (query.mode) {
        case QueryMode::SIMPLE:
            if (query.text != LANG_DIR_KEY) {
                result.push_back(
                    Entry::deserialize(guard->get(query.text, "")));
            }
            break;

        case QueryMode::REGEX:
            for (const std::string& key : guard->keys()) {
                if (key != LANG_DIR_KEY &&
                    boost::u32regex_search(key, query.regex,
                                           boost::match_continuous)) {
                    result.push_back(Entry::deserialize(guard->get(key)));
                }
            }
            break;

        case QueryMode::FULLTEXT:
            for (const std::string& key : guard->keys()) {
                if (key == LANG_DIR_KEY) {
                    continue;
                }
                std::string value = guard->get(key);
                if (boost::u32regex_search(value, query.regex)) {
                    result.push_back(Entry::deserialize(value));
                }
            }
            break;
    }

    return result;
}

size_t QueryEngine::size(const std::string& identity) {
    KeyValueStore store(config_, identity);
    return store.size();
}

boost::optional<std::string> QueryEngine::header(const std::string& identity) {
    KeyValueStore store(config_, identity);
    return read_header(store);
}

const StoreConfig& QueryEngine::config() const { return config_; }
