#pragma once

#include <boost/filesystem.hpp>
#include <string>
#include <vector>

struct Direction {
    // Used to name the backing file, dict_<identity>.db
    std::string identity;

    // Shown when the store carries no language header of its own
    std::string default_label;
};

struct StoreConfig {
    explicit StoreConfig(boost::filesystem::path _root = default_root());

    boost::filesystem::path root;
    std::vector<Direction> directions;

    boost::filesystem::path store_path(const std::string& identity) const;

    // $HOME/.dictstore
    static boost::filesystem::path default_root();

    // Expands a leading "~" to $HOME
    static boost::filesystem::path expand_user(const std::string& path);
};

// Reserved key holding the "SRC => DST" label of a store
extern const char* const LANG_DIR_KEY;
