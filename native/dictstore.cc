#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "errors.hh"
#include "importer.hh"
#include "query.hh"
#include "store_config.hh"

namespace po = boost::program_options;

const char* VERSION = "0.2";

void interactive_mode(QueryEngine& engine, bool compact) {
    std::cout << "Welcome to the interactive mode: You can type queries here.\n"
              << "Prefix your query with `:r:` to issue a regular expression "
                 "query and with `:f:` for a fulltext query.\n"
              << "Enter C-d (Ctrl + d) to exit." << std::endl;

    std::string line;
    while (true) {
        std::cout << "=> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::string query(absl::StripAsciiWhitespace(line));
        if (query.empty()) {
            continue;
        }
        try {
            std::cout << engine.execute(query, compact) << std::endl;
        } catch (const QueryError& e) {
            std::cout << e.partial_result() << "\n" << e.what() << std::endl;
        } catch (const PatternError& e) {
            std::cout << e.what() << std::endl;
        }
    }
    std::cout << std::endl;
}

int run(int argc, char** argv) {
    po::options_description build("Database building options");
    build.add_options()("import,i", po::value<std::string>(),
                        "Import dict files from dict.cc");

    po::options_description format("Format options");
    format.add_options()("compact,c", "Use compact output format");

    po::options_description misc("Misc options");
    misc.add_options()("version,v", "Show version")(
        "size,S", "Show the number of entries in the databases")(
        "directory,d", po::value<std::string>(),
        "Use PATH instead of ~/.dictstore")("help,h",
                                            "Show this help message and exit");

    po::options_description query("Query options");
    query.add_options()("simple,s",
                        "Translate the word given as QUERY (default)")(
        "regexp,r", "Translate all the words matching the regexp QUERY")(
        "fulltext,f", "Translate all sentences matching the regexp QUERY");

    po::options_description hidden;
    hidden.add_options()("query", po::value<std::vector<std::string>>(),
                         "the query to search");

    po::options_description visible;
    visible.add(build).add(format).add(misc).add(query);

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("query", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << "Usage: " << argv[0] << " [-d PATH] [-i DICTCC_FILE]\n"
                  << "       " << argv[0] << " [-d PATH] [-v] [-S] [-h]\n"
                  << "       " << argv[0]
                  << " [-d PATH] [-c] [-s | -r | -f] QUERY\n\n"
                  << visible << std::endl;
        return 0;
    }

    if (vm.count("version")) {
        std::cout << argv[0] << " " << VERSION << std::endl;
        return 0;
    }

    if (vm.count("simple") + vm.count("regexp") + vm.count("fulltext") > 1) {
        std::cout << "Only one of -s, -r and -f may be given" << std::endl;
        return 1;
    }

    StoreConfig config;
    if (vm.count("directory")) {
        config.root =
            StoreConfig::expand_user(vm["directory"].as<std::string>());
    }

    bool compact = vm.count("compact") > 0;

    if (vm.count("size")) {
        QueryEngine engine(config);
        for (const Direction& direction : config.directions) {
            auto label = engine.header(direction.identity);
            std::cout << (label ? *label : direction.default_label) << ": "
                      << engine.size(direction.identity) << " entries"
                      << std::endl;
        }
    } else if (vm.count("import")) {
        std::string path = vm["import"].as<std::string>();
        std::cout << "Importing from \"" << path << "\"" << std::endl;
        Importer importer(config);
        ImportCounts counts = importer.import_file(path);
        std::cout << "Imported " << counts.a << " (A => B) and " << counts.b
                  << " (B => A) entries" << std::endl;
    } else if (vm.count("query")) {
        QueryEngine engine(config);
        for (const std::string& q :
             vm["query"].as<std::vector<std::string>>()) {
            std::string full_query = q;
            if (vm.count("regexp")) {
                full_query = ":r:" + q;
            } else if (vm.count("fulltext")) {
                full_query = ":f:" + q;
            }
            std::cout << engine.execute(full_query, compact) << std::endl;
        }
    } else {
        QueryEngine engine(config);
        interactive_mode(engine, compact);
    }

    return 0;
}

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const QueryError& e) {
        std::cout << e.partial_result() << "\n" << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cout << e.what() << std::endl;
        return 1;
    }
}
