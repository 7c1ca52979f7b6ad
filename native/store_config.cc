#include "store_config.hh"

#include <cstdlib>
#include <utility>

#include "absl/strings/str_cat.h"

const char* const LANG_DIR_KEY = "__dictcc_lang_dir";

StoreConfig::StoreConfig(boost::filesystem::path _root)
    : root(std::move(_root)),
      directions({{"a", "A => B"}, {"b", "B => A"}}) {}

boost::filesystem::path StoreConfig::store_path(
    const std::string& identity) const {
    return root / absl::StrCat("dict_", identity, ".db");
}

boost::filesystem::path StoreConfig::default_root() {
    return expand_user("~/.dictstore");
}

boost::filesystem::path StoreConfig::expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        throw std::runtime_error(
            absl::StrCat("Cannot expand ", path, ", HOME is not set"));
    }
    std::string rest = path.substr(1);
    while (!rest.empty() && rest[0] == '/') {
        rest.erase(0, 1);
    }
    return boost::filesystem::path(home) / rest;
}
