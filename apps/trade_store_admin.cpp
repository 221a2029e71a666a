#include <iostream>
#include <string>
#include <vector>
#include "trade_store/core/env_loader.hpp"
#include "trade_store/core/logger.hpp"
#include "trade_store/core/time_utils.hpp"
#include "trade_store/data/price_collection.hpp"
#include "trade_store/data/store_factory.hpp"
#include "trade_store/schema/schema_definition.hpp"

using namespace trade_store;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--env <file>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  schema [postgres|sqlite]    Print the DDL of the trading schema\n"
              << "  init                        Create missing tables\n"
              << "  migrate                     Create missing tables and add missing columns\n"
              << "  next-fetch SYMBOL INTERVAL  Print the open time of the next bar to fetch\n";
}

int report(const StoreError* error) {
    std::cerr << "ERROR: " << error->to_string() << std::endl;
    return 1;
}

int run_schema(const std::vector<std::string>& args) {
    SqlDialect dialect = SqlDialect::POSTGRES;
    if (!args.empty()) {
        auto parsed = dialect_from_string(args[0]);
        if (parsed.is_error()) {
            return report(parsed.error());
        }
        dialect = parsed.value();
    }
    std::cout << render_schema_sql(dialect);
    return 0;
}

int run_store_command(const std::string& command, const std::vector<std::string>& args,
                      const StoreConfig& config) {
    if (command == "next-fetch" && args.size() != 2) {
        std::cerr << "next-fetch expects SYMBOL INTERVAL" << std::endl;
        return 2;
    }

    auto opened = open_store(config);
    if (opened.is_error()) {
        return report(opened.error());
    }
    auto store = opened.value();

    if (command == "init") {
        auto result = store->initialize_schema();
        if (result.is_error()) {
            return report(result.error());
        }
        std::cout << "Schema initialized" << std::endl;
    } else if (command == "migrate") {
        auto result = store->migrate_schema();
        if (result.is_error()) {
            return report(result.error());
        }
        if (result.value().empty()) {
            std::cout << "Schema is up to date" << std::endl;
        }
        for (const auto& step : result.value()) {
            std::cout << step.describe() << std::endl;
        }
    } else {
        auto cursor = next_fetch_start(*store, args[0], args[1]);
        if (cursor.is_error()) {
            return report(cursor.error());
        }
        std::cout << core::format_timestamp(cursor.value().start)
                  << (cursor.value().has_history ? "" : " (no stored bars)") << std::endl;
    }

    auto persisted = persist_store(*store, config);
    if (persisted.is_error()) {
        return report(persisted.error());
    }
    store->disconnect();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string env_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--env") && i + 1 < argc) {
            (arg == "--config" ? config_path : env_path) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "schema") {
        return run_schema(args);
    }
    if (command != "init" && command != "migrate" && command != "next-fetch") {
        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try {
        if (env_path.empty()) {
            auto found = EnvLoader::find(".");
            if (found.is_ok()) {
                env_path = found.value();
            }
        }
        if (!env_path.empty()) {
            auto loaded = EnvLoader::load(env_path);
            if (loaded.is_error()) {
                return report(loaded.error());
            }
        }

        StoreConfig config;
        if (!config_path.empty()) {
            auto loaded = config.load_from_file(config_path);
            if (loaded.is_error()) {
                return report(loaded.error());
            }
        }

        Logger::instance().initialize(config.logging);
        Logger::register_component("trade_store_admin");

        int status = run_store_command(command, args, config);
        return status;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
