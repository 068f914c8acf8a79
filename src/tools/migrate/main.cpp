/// @file main.cpp
/// @brief quarry_migrate entry point.
///
/// Applies SQL file migrations from the configured directory.
///
///   quarry_migrate [--config <file>] <migrate|rollback|reset|fresh|status>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/foundation/config_manager.hpp"
#include "quarry/orm/database.hpp"
#include "quarry/schema/migration_runner.hpp"
#include "quarry/version.hpp"

namespace {

constexpr const char* kDefaultConfig = "config/database.yaml";

struct Arguments {
    std::string configPath = kDefaultConfig;
    std::string verb;
    bool help = false;
    bool version = false;
};

void printUsage(std::ostream& out) {
    out << "usage: quarry_migrate [--config <file>] [--version] <command>\n\n"
        << "commands:\n"
        << "  migrate   apply pending migrations\n"
        << "  rollback  revert the latest batch\n"
        << "  reset     revert every migration\n"
        << "  fresh     drop all tables and migrate again\n"
        << "  status    list migrations with their batch\n";
}

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            args.configPath = std::string(arg.substr(9));
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version") {
            args.version = true;
        } else if (args.verb.empty()) {
            args.verb = std::string(arg);
        }
    }
    return args;
}

void printNames(std::string_view heading, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        std::cout << heading << ": " << name << "\n";
    }
}

void printStatus(const std::vector<quarry::schema::MigrationStatus>& lines) {
    std::size_t width = std::string_view("Migration").size();
    for (const auto& line : lines) {
        width = std::max(width, line.name.size());
    }
    std::cout << std::left << std::setw(5) << "Ran" << "  " << std::setw(6) << "Batch" << "  "
              << "Migration\n";
    std::cout << std::string(5 + 2 + 6 + 2 + width, '-') << "\n";
    for (const auto& line : lines) {
        std::cout << std::left << std::setw(5) << (line.ran ? "Yes" : "No") << "  "
                  << std::setw(6) << (line.batch ? std::to_string(*line.batch) : "") << "  "
                  << line.name << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parseArguments(argc, argv);
    if (args.help) {
        printUsage(std::cout);
        return EXIT_SUCCESS;
    }
    if (args.version) {
        std::cout << "quarry_migrate " << quarry::Version::string << "\n";
        return EXIT_SUCCESS;
    }
    if (args.verb.empty()) {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    quarry::foundation::ConfigManager config;
    auto loaded = config.load(args.configPath);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto migratorConfig = quarry::schema::MigratorConfig::load(config);
    if (!migratorConfig) {
        std::cerr << "Invalid migrations config: " << migratorConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto db = quarry::orm::Database::open(config);
    if (!db) {
        std::cerr << "Failed to connect: " << db.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    quarry::schema::MigrationRunner runner(*db.value(), std::move(migratorConfig).value());
    auto discovered = runner.discover();
    if (!discovered) {
        std::cerr << discovered.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    const auto& verb = args.verb;
    if (verb == "status") {
        auto lines = runner.status();
        if (!lines) {
            std::cerr << lines.error().describe() << "\n";
            return EXIT_FAILURE;
        }
        printStatus(lines.value());
        return EXIT_SUCCESS;
    }

    quarry::foundation::OrmResult<std::vector<std::string>> result =
        quarry::foundation::OrmResult<std::vector<std::string>>::ok({});
    std::string_view heading;
    if (verb == "migrate") {
        result = runner.migrate();
        heading = "Migrated";
    } else if (verb == "rollback") {
        result = runner.rollback();
        heading = "Rolled back";
    } else if (verb == "reset") {
        result = runner.reset();
        heading = "Rolled back";
    } else if (verb == "fresh") {
        result = runner.fresh();
        heading = "Migrated";
    } else {
        std::cerr << "Unknown command: " << verb << "\n";
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    if (!result) {
        std::cerr << "Migration failed: " << result.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    if (result.value().empty()) {
        std::cout << (verb == "rollback" || verb == "reset" ? "Nothing to roll back.\n"
                                                            : "Nothing to migrate.\n");
    } else {
        printNames(heading, result.value());
    }
    return EXIT_SUCCESS;
}
