// demo_identifiers.cpp
//
// Validates database object names and prints their canonical form. Run it with:
//
//     ./demo_identifiers Users "Order Items" 1st_table
//     ./demo_identifiers -c names.toml extra_name
//
// Names from the config's [names] check list are checked first, then the
// command-line names. Accepted names are printed in canonical form on
// stdout, one per line; errors go to stderr.

#include <sqlid/config.hpp>
#include <sqlid/identifier_set.hpp>
#include <sqlid/log.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace sqlid;

struct Args {
    std::string config_path;
    std::vector<std::string> names;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-c" || a == "--config") {
            if (i + 1 >= argc) {
                return SqlidError{SqlidError::Config,
                    "missing value for " + a,
                    "usage: demo_identifiers [-c config.toml] [name...]"};
            }
            args.config_path = argv[++i];
        } else {
            args.names.push_back(std::move(a));
        }
    }
    return Result<Args>::ok(std::move(args));
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    Config cfg;
    if (!args.value().config_path.empty()) {
        auto loaded = Config::load(args.value().config_path);
        if (loaded.is_err()) {
            std::cerr << loaded.error().format() << "\n";
            return 2;
        }
        cfg = std::move(loaded).value();
    }
    cfg.apply_logging();

    std::vector<std::string> names = cfg.names;
    names.insert(names.end(), args.value().names.begin(), args.value().names.end());
    log::info("checking %zu name(s)", names.size());

    IdentifierSet seen;
    auto errors = check_names(names, seen);

    for (const auto& id : seen) {
        std::cout << id << "\n";
    }
    for (const auto& e : errors) {
        std::cerr << e.format() << "\n";
    }

    if (!errors.empty()) {
        log::warn("%zu of %zu name(s) rejected", errors.size(), names.size());
        return 1;
    }
    return 0;
}
